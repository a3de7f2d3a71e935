#pragma once

#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace nimbus::services::http {
  namespace {
    using utils::types::i64;
    using utils::types::Pair;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::Unit;
    using utils::types::Vec;
  } // namespace

  /**
   * @struct HttpRequest
   * @brief A single GET request.
   */
  struct HttpRequest {
    String                    url;              ///< Base URL without a query string.
    Vec<Pair<String, String>> query;            ///< Query parameters; values are URL-escaped on send.
    Vec<Pair<String, String>> headers;          ///< Extra request headers.
    i64                       timeoutSecs = 10; ///< Whole-request timeout.
  };

  /**
   * @struct HttpResponse
   * @brief Status and body of a completed transfer.
   */
  struct HttpResponse {
    i64    statusCode = 0;
    String body;

    [[nodiscard]] fn isSuccess() const -> bool {
      return statusCode >= 200 && statusCode < 300;
    }
  };

  /**
   * @class IHttpClient
   * @brief Minimal blocking HTTP client.
   *
   * Transport failures are returned as errors (NetworkError, or Timeout). Any HTTP status,
   * including 4xx/5xx, is a completed response.
   */
  class IHttpClient {
   public:
    IHttpClient(const IHttpClient&) = delete;
    IHttpClient(IHttpClient&&)      = delete;

    fn operator=(const IHttpClient&)->IHttpClient& = delete;
    fn operator=(IHttpClient&&)->IHttpClient&      = delete;

    virtual ~IHttpClient() = default;

    [[nodiscard]] virtual fn get(const HttpRequest& request) const -> Result<HttpResponse> = 0;

   protected:
    IHttpClient() = default;
  };

  /**
   * @class CurlHttpClient
   * @brief IHttpClient backed by libcurl.
   */
  class CurlHttpClient final : public IHttpClient {
   public:
    CurlHttpClient() = default;

    [[nodiscard]] fn get(const HttpRequest& request) const -> Result<HttpResponse> override;
  };

  /**
   * @brief Process-wide HTTP library setup. Must run before any request is made.
   */
  fn GlobalInit() -> Result<>;

  /**
   * @brief Process-wide HTTP library teardown.
   */
  fn GlobalCleanup() -> Unit;
} // namespace nimbus::services::http
