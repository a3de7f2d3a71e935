#include "Nimbus/Services/IpGeolocation.hpp"

#include <cctype>   // std::isspace
#include <charconv> // std::from_chars
#include <format>   // std::format
#include <matchit.hpp>

#include "Nimbus/Utils/Error.hpp"
#include "Nimbus/Utils/Logging.hpp"

#include "DataTransferObjects.hpp"

namespace nimbus::services::ipgeo {
  namespace {
    using core::location::Coordinates;
    using core::location::Unavailable;

    using http::HttpRequest;
    using http::HttpResponse;

    using utils::error::NimbusError;
    using enum utils::error::NimbusErrorCode;

    using utils::types::Err;
    using utils::types::f64;
    using utils::types::None;
    using utils::types::Result;

    using dto::ipapi::Degrees;
    using dto::ipapi::Response;

    constexpr StringView UNKNOWN = "Unknown";

    fn Fetch(const IHttpClient& http, const String& endpoint) -> Result<Response> {
      using glz::error_ctx, glz::read, glz::error_code;

      const HttpRequest request {
        .url         = endpoint,
        .query       = {},
        .headers     = { { "User-Agent", String(USER_AGENT) } },
        .timeoutSecs = 10,
      };

      Result<HttpResponse> response = http.get(request);

      if (!response)
        return Err(response.error());

      if (!response->isSuccess())
        ERR_FMT(ApiUnavailable, "IP geolocation request failed with status {}", response->statusCode);

      Response payload {};

      if (const error_ctx errc = read<glz::opts { .error_on_unknown_keys = false }>(payload, response->body); errc.ec != error_code::none)
        ERR_FMT(ParseError, "Failed to parse IP geolocation response: {}", glz::format_error(errc, response->body));

      return payload;
    }

    /**
     * @brief Reads a coordinate that may be a number or a numeric string.
     */
    fn ToDegrees(const Degrees& value) -> Option<f64> {
      using namespace matchit;

      return match(value)(
        is | as<f64>(_)    = [&] { return Option<f64>(std::get<f64>(value)); },
        is | as<String>(_) = [&]() -> Option<f64> {
          StringView text = std::get<String>(value);

          while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
            text.remove_prefix(1);

          while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
            text.remove_suffix(1);

          if (text.starts_with('+'))
            text.remove_prefix(1);

          f64 parsed = 0.0;

          const auto [ptr, errc] = std::from_chars(text.data(), text.data() + text.size(), parsed);

          if (text.empty() || errc != std::errc() || ptr != text.data() + text.size())
            return None;

          return parsed;
        }
      );
    }

    fn OrUnknown(const Option<String>& value) -> String {
      return value.value_or(String(UNKNOWN));
    }
  } // namespace

  IPGeolocationClient::IPGeolocationClient(const IHttpClient& http, String endpoint)
    : m_http(http), m_endpoint(std::move(endpoint)) {}

  fn IPGeolocationClient::locate() const -> AcquisitionResult {
    Result<Response> payload = Fetch(m_http, m_endpoint);

    if (!payload) {
      debug_log("IP geolocation failed: {}", payload.error().message);
      return Unavailable { payload.error().message };
    }

    if (payload->error.value_or(false)) {
      const String reason = payload->reason.value_or("Unknown error");
      warn_log("IP location service error: {}", reason);
      return Unavailable { reason };
    }

    if (!payload->latitude || !payload->longitude)
      return Unavailable { "IP geolocation response has no coordinates" };

    const Option<f64> latitude  = ToDegrees(*payload->latitude);
    const Option<f64> longitude = ToDegrees(*payload->longitude);

    if (!latitude || !longitude) {
      debug_log("IP geolocation returned unparsable coordinates");
      return Unavailable { "IP geolocation coordinates are not numeric" };
    }

    if (!Coordinates::IsValid(*latitude, *longitude)) {
      debug_log("IP geolocation returned out-of-range coordinates {}, {}", *latitude, *longitude);
      return Unavailable { "IP geolocation coordinates are out of range" };
    }

    return Coordinates { .latitude = *latitude, .longitude = *longitude };
  }

  fn IPGeolocationClient::detailedInfo() const -> Option<LocationDetails> {
    Result<Response> payload = Fetch(m_http, m_endpoint);

    if (!payload) {
      debug_at(payload.error());
      return None;
    }

    if (payload->error.value_or(false)) {
      debug_log("IP location service error: {}", payload->reason.value_or("Unknown error"));
      return None;
    }

    return LocationDetails {
      .city        = OrUnknown(payload->city),
      .region      = OrUnknown(payload->region),
      .country     = OrUnknown(payload->countryName),
      .countryCode = OrUnknown(payload->country),
      .timezone    = OrUnknown(payload->timezone),
    };
  }
} // namespace nimbus::services::ipgeo
