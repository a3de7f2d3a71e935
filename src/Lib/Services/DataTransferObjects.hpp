#pragma once

// clang-format off
// we need glaze.hpp include before any other includes that might use it
// because core/meta.hpp complains about not having uint8_t defined otherwise
#include <glaze/glaze.hpp>
#include <glaze/core/meta.hpp>
#include <glaze/json/read.hpp>
#include <variant>

#include "Nimbus/Utils/Types.hpp"
// clang-format on

namespace nimbus::services::dto {
  // ipapi.co Data Transfer Objects
  namespace ipapi {
    /// Coordinates arrive either as JSON numbers or as numeric strings.
    using Degrees = std::variant<nimbus::utils::types::f64, nimbus::utils::types::String>;

    struct Response {
      nimbus::utils::types::Option<bool>                         error;
      nimbus::utils::types::Option<nimbus::utils::types::String> reason;
      nimbus::utils::types::Option<Degrees>                      latitude;
      nimbus::utils::types::Option<Degrees>                      longitude;
      nimbus::utils::types::Option<nimbus::utils::types::String> city;
      nimbus::utils::types::Option<nimbus::utils::types::String> region;
      nimbus::utils::types::Option<nimbus::utils::types::String> countryName;
      nimbus::utils::types::Option<nimbus::utils::types::String> country;
      nimbus::utils::types::Option<nimbus::utils::types::String> timezone;
    };
  } // namespace ipapi

  // OpenWeatherMap Data Transfer Objects
  namespace owm {
    struct OWMResponse {
      struct Main {
        nimbus::utils::types::f64 temp;
        nimbus::utils::types::f64 feelsLike;
        nimbus::utils::types::i64 humidity;
      };

      struct Sys {
        nimbus::utils::types::Option<nimbus::utils::types::String> country;
      };

      struct Weather {
        nimbus::utils::types::String description;
        nimbus::utils::types::String icon;
      };

      Main                               main;
      Sys                                sys;
      nimbus::utils::types::Vec<Weather> weather;
      nimbus::utils::types::String       name;
    };
  } // namespace owm
} // namespace nimbus::services::dto

namespace glz {
  // ipapi.co Glaze meta definitions
  template <>
  struct meta<nimbus::services::dto::ipapi::Response> {
    using T = nimbus::services::dto::ipapi::Response;

    // clang-format off
    static constexpr detail::Object value = object(
      "error",        &T::error,
      "reason",       &T::reason,
      "latitude",     &T::latitude,
      "longitude",    &T::longitude,
      "city",         &T::city,
      "region",       &T::region,
      "country_name", &T::countryName,
      "country",      &T::country,
      "timezone",     &T::timezone
    );
    // clang-format on
  };

  // OpenWeatherMap Glaze meta definitions
  template <>
  struct meta<nimbus::services::dto::owm::OWMResponse::Main> {
    using T = nimbus::services::dto::owm::OWMResponse::Main;

    static constexpr detail::Object value = object("temp", &T::temp, "feels_like", &T::feelsLike, "humidity", &T::humidity);
  };

  template <>
  struct meta<nimbus::services::dto::owm::OWMResponse::Sys> {
    static constexpr detail::Object value = object("country", &nimbus::services::dto::owm::OWMResponse::Sys::country);
  };

  template <>
  struct meta<nimbus::services::dto::owm::OWMResponse::Weather> {
    using T = nimbus::services::dto::owm::OWMResponse::Weather;

    static constexpr detail::Object value = object("description", &T::description, "icon", &T::icon);
  };

  template <>
  struct meta<nimbus::services::dto::owm::OWMResponse> {
    using T = nimbus::services::dto::owm::OWMResponse;

    static constexpr detail::Object value = object("main", &T::main, "sys", &T::sys, "weather", &T::weather, "name", &T::name);
  };
} // namespace glz
