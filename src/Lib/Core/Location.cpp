#include "Nimbus/Core/Location.hpp"

#include <cmath>     // std::isfinite
#include <format>    // std::format
#include <matchit.hpp>
#include <stdexcept> // std::{out_of_range, invalid_argument}

namespace nimbus::core::location {
  namespace {
    using namespace matchit;

    using utils::types::None;
  } // namespace

  fn Coordinates::IsValid(const f64 lat, const f64 lon) -> bool {
    if (!std::isfinite(lat) || !std::isfinite(lon))
      return false;

    return lat >= -90.0 && lat <= 90.0 && lon >= -180.0 && lon <= 180.0;
  }

  fn Coordinates::Make(const f64 lat, const f64 lon) -> Coordinates {
    if (!IsValid(lat, lon))
      throw std::out_of_range(std::format("Coordinates out of range: {}, {}", lat, lon));

    return { .latitude = lat, .longitude = lon };
  }

  fn City::Make(String name) -> City {
    if (name.empty())
      throw std::invalid_argument("City name must not be empty");

    return { .name = std::move(name) };
  }

  Location::Location(City city)
    : m_value(std::move(city)) {}

  Location::Location(Coordinates coords)
    : m_value(coords) {}

  fn Location::FromCity(String name) -> Location {
    return Location(City::Make(std::move(name)));
  }

  fn Location::FromCoordinates(const f64 lat, const f64 lon) -> Location {
    return Location(Coordinates::Make(lat, lon));
  }

  fn Location::isCity() const -> bool {
    return std::holds_alternative<City>(m_value);
  }

  fn Location::isCoordinates() const -> bool {
    return std::holds_alternative<Coordinates>(m_value);
  }

  fn Location::city() const -> Option<City> {
    if (const City* city = std::get_if<City>(&m_value))
      return *city;

    return None;
  }

  fn Location::coordinates() const -> Option<Coordinates> {
    if (const Coordinates* coords = std::get_if<Coordinates>(&m_value))
      return *coords;

    return None;
  }

  fn Location::description() const -> String {
    return match(m_value)(
      is | as<City>(_)        = [&] { return std::format("city {}", std::get<City>(m_value).name); },
      is | as<Coordinates>(_) = [&] {
        const Coordinates& coords = std::get<Coordinates>(m_value);
        return std::format("coordinates {:.2f}, {:.2f}", coords.latitude, coords.longitude);
      }
    );
  }

  fn IsAvailable(const AcquisitionResult& result) -> bool {
    return std::holds_alternative<Coordinates>(result);
  }

  fn GetCoordinates(const AcquisitionResult& result) -> Option<Coordinates> {
    if (const Coordinates* coords = std::get_if<Coordinates>(&result))
      return *coords;

    return None;
  }
} // namespace nimbus::core::location
