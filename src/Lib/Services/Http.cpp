#include "Nimbus/Services/Http.hpp"

#include <format> // std::format

#include "Nimbus/Utils/Logging.hpp"

#include "Wrappers/Curl.hpp"

namespace nimbus::services::http {
  namespace {
    using utils::error::NimbusError;
    using enum utils::error::NimbusErrorCode;

    using utils::types::Err;

    fn BuildUrl(const HttpRequest& request) -> Result<String> {
      String url = request.url;

      for (bool first = true; const auto& [key, value] : request.query) {
        Result<String> escaped = Curl::Easy::escape(value);

        if (!escaped)
          return Err(escaped.error());

        url += std::format("{}{}={}", first ? '?' : '&', key, *escaped);
        first = false;
      }

      return url;
    }
  } // namespace

  fn CurlHttpClient::get(const HttpRequest& request) const -> Result<HttpResponse> {
    Result<String> url = BuildUrl(request);

    if (!url)
      return Err(url.error());

    HttpResponse response;

    Curl::Easy easy({
      .url                = *url,
      .writeBuffer        = &response.body,
      .timeoutSecs        = request.timeoutSecs,
      .connectTimeoutSecs = request.timeoutSecs,
    });

    if (!easy) {
      if (const auto& initErr = easy.getInitializationError())
        return Err(*initErr);

      ERR(InternalError, "Failed to initialize cURL handle");
    }

    Curl::SList headers;

    for (const auto& [name, value] : request.headers)
      if (Result res = headers.append(std::format("{}: {}", name, value)); !res)
        return Err(res.error());

    if (headers.get())
      if (Result res = easy.setHeaders(headers); !res)
        return Err(res.error());

    debug_log("GET {}", request.url);

    if (Result res = easy.perform(); !res)
      return Err(res.error());

    Result<i64> status = easy.responseCode();

    if (!status)
      return Err(status.error());

    response.statusCode = *status;

    debug_log("GET {} -> {} ({} bytes)", request.url, response.statusCode, response.body.size());

    return response;
  }

  fn GlobalInit() -> Result<> {
    return Curl::GlobalInit();
  }

  fn GlobalCleanup() -> Unit {
    Curl::GlobalCleanup();
  }
} // namespace nimbus::services::http
