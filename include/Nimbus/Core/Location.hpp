/**
 * @file Location.hpp
 * @brief The location data model: coordinates, city names and acquisition outcomes.
 */

#pragma once

#include <format>  // std::formatter
#include <variant> // std::variant

#include "../Utils/Definitions.hpp"
#include "../Utils/Types.hpp"

namespace nimbus::core::location {
  namespace {
    using utils::types::f64;
    using utils::types::Option;
    using utils::types::String;
  } // namespace

  /**
   * @struct Coordinates
   * @brief A geographic position in decimal degrees.
   *
   * Latitude is within [-90, 90] and longitude within [-180, 180]; both are finite.
   */
  struct Coordinates {
    f64 latitude;  ///< Degrees north (negative is south).
    f64 longitude; ///< Degrees east (negative is west).

    /**
     * @brief Checks whether a latitude/longitude pair satisfies the range invariant.
     */
    [[nodiscard]] static fn IsValid(f64 lat, f64 lon) -> bool;

    /**
     * @brief Builds coordinates, throwing std::out_of_range if the pair is not valid.
     */
    static fn Make(f64 lat, f64 lon) -> Coordinates;

    fn operator==(const Coordinates&) const -> bool = default;
  };

  /**
   * @struct City
   * @brief A free-form, non-empty city name as typed by the user or configured.
   */
  struct City {
    String name;

    /**
     * @brief Builds a city, throwing std::invalid_argument if the name is empty.
     */
    static fn Make(String name) -> City;

    fn operator==(const City&) const -> bool = default;
  };

  /**
   * @class Location
   * @brief Exactly one of a City or a set of Coordinates.
   */
  class Location {
   public:
    explicit Location(City city);
    explicit Location(Coordinates coords);

    static fn FromCity(String name) -> Location;
    static fn FromCoordinates(f64 lat, f64 lon) -> Location;

    [[nodiscard]] fn isCity() const -> bool;
    [[nodiscard]] fn isCoordinates() const -> bool;

    [[nodiscard]] fn city() const -> Option<City>;
    [[nodiscard]] fn coordinates() const -> Option<Coordinates>;

    /**
     * @brief Human-readable form, "city {name}" or "coordinates {lat:.2f}, {lon:.2f}".
     */
    [[nodiscard]] fn description() const -> String;

    fn operator==(const Location&) const -> bool = default;

   private:
    std::variant<City, Coordinates> m_value;
  };

  /**
   * @struct Unavailable
   * @brief A source produced no usable position. This is an expected outcome, not an error.
   */
  struct Unavailable {
    String reason; ///< Diagnostic only; never shown to the user.
  };

  /**
   * @brief The outcome of a single coordinate acquisition attempt.
   */
  using AcquisitionResult = std::variant<Coordinates, Unavailable>;

  [[nodiscard]] fn IsAvailable(const AcquisitionResult& result) -> bool;

  [[nodiscard]] fn GetCoordinates(const AcquisitionResult& result) -> Option<Coordinates>;
} // namespace nimbus::core::location

template <>
struct std::formatter<nimbus::core::location::Location> : std::formatter<std::string_view> {
  fn format(const nimbus::core::location::Location& loc, std::format_context& ctx) const {
    return std::formatter<std::string_view>::format(loc.description(), ctx);
  }
};

template <>
struct std::formatter<nimbus::core::location::Coordinates> : std::formatter<std::string_view> {
  fn format(const nimbus::core::location::Coordinates& coords, std::format_context& ctx) const {
    return std::format_to(ctx.out(), "{:.4f}, {:.4f}", coords.latitude, coords.longitude);
  }
};
