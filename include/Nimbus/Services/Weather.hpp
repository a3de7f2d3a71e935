#pragma once

#include "../Core/Location.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"
#include "Http.hpp"

namespace nimbus::services::weather {
  namespace {
    using core::location::Location;

    using http::IHttpClient;

    using utils::types::f64;
    using utils::types::i64;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::StringView;
  } // namespace

  inline constexpr StringView OPENWEATHER_ENDPOINT = "https://api.openweathermap.org/data/2.5/weather";

  /**
   * @struct WeatherReport
   * @brief Current conditions at a location, in metric units.
   */
  struct WeatherReport {
    String name;        ///< Place name as reported by the API.
    String country;     ///< ISO country code.
    f64    temperature; ///< Degrees Celsius.
    f64    feelsLike;   ///< Apparent temperature, degrees Celsius.
    i64    humidity;    ///< Relative humidity, percent.
    String description; ///< e.g. "light rain".
    String icon;        ///< OpenWeatherMap icon code, e.g. "10d".
  };

  class IWeatherService {
   public:
    IWeatherService(const IWeatherService&) = delete;
    IWeatherService(IWeatherService&&)      = delete;

    fn operator=(const IWeatherService&)->IWeatherService& = delete;
    fn operator=(IWeatherService&&)->IWeatherService&      = delete;

    virtual ~IWeatherService() = default;

    [[nodiscard]] virtual fn fetch(const Location& location) const -> Result<WeatherReport> = 0;

   protected:
    IWeatherService() = default;
  };

  /**
   * @class OpenWeatherMapService
   * @brief Current weather from the OpenWeatherMap API.
   *
   * Error codes: ConfigurationError (no API key), NotFound (404), PermissionDenied (401),
   * ApiUnavailable (other non-2xx), ParseError (bad payload), NetworkError/Timeout (transport).
   */
  class OpenWeatherMapService final : public IWeatherService {
   public:
    OpenWeatherMapService(const IHttpClient& http, String apiKey, String endpoint = String(OPENWEATHER_ENDPOINT));

    [[nodiscard]] fn fetch(const Location& location) const -> Result<WeatherReport> override;

   private:
    const IHttpClient& m_http;
    String             m_apiKey;
    String             m_endpoint;
  };
} // namespace nimbus::services::weather
