#include <format> // std::format
#include <matchit.hpp>

#include "Nimbus/Services/Weather.hpp"
#include "Nimbus/Utils/Error.hpp"
#include "Nimbus/Utils/Logging.hpp"
#include "Nimbus/Utils/Types.hpp"

#include "DataTransferObjects.hpp"

using namespace nimbus::utils::types;
using nimbus::utils::error::NimbusError;
using enum nimbus::utils::error::NimbusErrorCode;

using nimbus::core::location::City;
using nimbus::core::location::Coordinates;
using nimbus::core::location::Location;
using nimbus::services::http::HttpRequest;
using nimbus::services::http::HttpResponse;
using nimbus::services::http::IHttpClient;
using nimbus::services::weather::OpenWeatherMapService;
using nimbus::services::weather::WeatherReport;

namespace {
  fn ParseReport(const String& body) -> Result<WeatherReport> {
    using glz::error_ctx, glz::read, glz::error_code;

    nimbus::services::dto::owm::OWMResponse owmResponse {};

    if (const error_ctx errc = read<glz::opts { .error_on_unknown_keys = false }>(owmResponse, body); errc.ec != error_code::none)
      return Err(NimbusError(ParseError, std::format("Failed to parse JSON response: {}", glz::format_error(errc, body))));

    if (owmResponse.weather.empty())
      return Err(NimbusError(ParseError, "Weather response has no conditions"));

    return WeatherReport {
      .name        = owmResponse.name,
      .country     = owmResponse.sys.country.value_or(""),
      .temperature = owmResponse.main.temp,
      .feelsLike   = owmResponse.main.feelsLike,
      .humidity    = owmResponse.main.humidity,
      .description = owmResponse.weather.front().description,
      .icon        = owmResponse.weather.front().icon,
    };
  }
} // namespace

OpenWeatherMapService::OpenWeatherMapService(const IHttpClient& http, String apiKey, String endpoint)
  : m_http(http), m_apiKey(std::move(apiKey)), m_endpoint(std::move(endpoint)) {}

fn OpenWeatherMapService::fetch(const Location& location) const -> Result<WeatherReport> {
  using matchit::match, matchit::is, matchit::_;

  if (m_apiKey.empty())
    return Err(NimbusError(ConfigurationError, "An OpenWeatherMap API key is required"));

  HttpRequest request { .url = m_endpoint, .query = {}, .headers = {}, .timeoutSecs = 10 };

  if (const Option<Coordinates> coords = location.coordinates()) {
    request.query.emplace_back("lat", std::format("{}", coords->latitude));
    request.query.emplace_back("lon", std::format("{}", coords->longitude));
  } else if (const Option<City> city = location.city()) {
    request.query.emplace_back("q", city->name);
  }

  request.query.emplace_back("appid", m_apiKey);
  request.query.emplace_back("units", "metric");

  Result<HttpResponse> response = m_http.get(request);

  if (!response)
    return Err(response.error());

  if (!response->isSuccess()) {
    const i64 status = response->statusCode;

    return Err(NimbusError(
      match(status)(is | 404 = NotFound, is | 401 = PermissionDenied, is | _ = ApiUnavailable),
      std::format("API request failed with status {}", status)
    ));
  }

  return ParseReport(response->body);
}
