#pragma once

#include <curl/curl.h>
#include <utility> // std::{exchange, move}

#include <Nimbus/Utils/Error.hpp>
#include <Nimbus/Utils/Types.hpp>

namespace Curl {
  namespace {
    using nimbus::utils::error::NimbusError;
    using enum nimbus::utils::error::NimbusErrorCode;

    using nimbus::utils::types::Err;
    using nimbus::utils::types::i32;
    using nimbus::utils::types::i64;
    using nimbus::utils::types::None;
    using nimbus::utils::types::Option;
    using nimbus::utils::types::RawPointer;
    using nimbus::utils::types::Result;
    using nimbus::utils::types::String;
    using nimbus::utils::types::Unit;
    using nimbus::utils::types::usize;
  } // namespace

  /**
   * @brief RAII wrapper for a curl_slist, used for request headers.
   */
  class SList {
    curl_slist* m_list = nullptr;

   public:
    SList() = default;

    ~SList() {
      if (m_list)
        curl_slist_free_all(m_list);
    }

    SList(const SList&)                = delete;
    fn operator=(const SList&)->SList& = delete;

    SList(SList&& other) noexcept
      : m_list(std::exchange(other.m_list, nullptr)) {}

    fn operator=(SList&& other) noexcept -> SList& {
      if (this != &other) {
        if (m_list)
          curl_slist_free_all(m_list);

        m_list = std::exchange(other.m_list, nullptr);
      }

      return *this;
    }

    /**
     * @brief Appends a "Name: value" line.
     */
    fn append(const String& line) -> Result<> {
      curl_slist* next = curl_slist_append(m_list, line.c_str());

      if (!next)
        ERR(OutOfMemory, "curl_slist_append failed");

      m_list = next;
      return {};
    }

    [[nodiscard]] fn get() const -> curl_slist* {
      return m_list;
    }
  };

  /**
   * @brief Options for initializing a Curl::Easy handle.
   */
  struct EasyOptions {
    Option<String> url                = None;    ///< URL to set for the transfer
    String*        writeBuffer        = nullptr; ///< Receives the response body
    Option<i64>    timeoutSecs        = None;    ///< Timeout for the entire request in seconds
    Option<i64>    connectTimeoutSecs = None;    ///< Timeout for the connection phase in seconds
  };

  /**
   * @brief RAII wrapper for a CURL easy handle.
   *
   * Errors from option setup in the options constructor are kept and reported by perform().
   */
  class Easy {
    CURL*               m_curl      = nullptr;
    Option<NimbusError> m_initError = None;

    static fn writeCallback(RawPointer contents, const usize size, const usize nmemb, String* str) -> usize {
      const usize totalSize = size * nmemb;
      str->append(static_cast<char*>(contents), totalSize);
      return totalSize;
    }

    fn keepFirstError(Result<> res) -> bool {
      if (res)
        return true;

      m_initError = std::move(res.error());
      return false;
    }

   public:
    Easy()
      : m_curl(curl_easy_init()) {
      if (!m_curl)
        m_initError = NimbusError(InternalError, "curl_easy_init() failed");
    }

    explicit Easy(const EasyOptions& options)
      : Easy() {
      if (m_initError)
        return;

      if (options.url && !keepFirstError(setUrl(*options.url)))
        return;

      if (options.writeBuffer && !keepFirstError(setWriteFunction(options.writeBuffer)))
        return;

      if (options.timeoutSecs && !keepFirstError(setTimeout(*options.timeoutSecs)))
        return;

      if (options.connectTimeoutSecs)
        keepFirstError(setConnectTimeout(*options.connectTimeoutSecs));
    }

    ~Easy() {
      if (m_curl)
        curl_easy_cleanup(m_curl);
    }

    Easy(const Easy&)                = delete;
    fn operator=(const Easy&)->Easy& = delete;

    Easy(Easy&& other) noexcept
      : m_curl(std::exchange(other.m_curl, nullptr)), m_initError(std::move(other.m_initError)) {}

    fn operator=(Easy&& other) noexcept -> Easy& {
      if (this != &other) {
        if (m_curl)
          curl_easy_cleanup(m_curl);

        m_curl      = std::exchange(other.m_curl, nullptr);
        m_initError = std::move(other.m_initError);
      }

      return *this;
    }

    [[nodiscard]] explicit operator bool() const {
      return m_curl != nullptr && !m_initError;
    }

    [[nodiscard]] fn getInitializationError() const -> const Option<NimbusError>& {
      return m_initError;
    }

    [[nodiscard]] fn get() const -> CURL* {
      return m_curl;
    }

    template <typename T>
    fn setOpt(const CURLoption option, T value) -> Result<> {
      if (!m_curl)
        ERR(InternalError, "CURL handle is not initialized");

      if (const CURLcode res = curl_easy_setopt(m_curl, option, value); res != CURLE_OK)
        ERR_FMT(PlatformSpecific, "curl_easy_setopt failed: {}", curl_easy_strerror(res));

      return {};
    }

    /**
     * @brief Performs a blocking transfer.
     * @return Timeout if the transfer timed out, NetworkError for any other transport failure.
     */
    fn perform() -> Result<> {
      if (!m_curl)
        ERR(InternalError, "CURL handle is not initialized");

      if (m_initError)
        ERR_FMT(InternalError, "Cannot perform request, CURL handle setup failed: {}", m_initError->message);

      if (const CURLcode res = curl_easy_perform(m_curl); res != CURLE_OK) {
        if (res == CURLE_OPERATION_TIMEDOUT)
          ERR_FMT(Timeout, "Request timed out: {}", curl_easy_strerror(res));

        ERR_FMT(NetworkError, "{}", curl_easy_strerror(res));
      }

      return {};
    }

    template <typename T>
    fn getInfo(const CURLINFO info, T* value) -> Result<> {
      if (!m_curl)
        ERR(InternalError, "CURL handle is not initialized");

      if (const CURLcode res = curl_easy_getinfo(m_curl, info, value); res != CURLE_OK)
        ERR_FMT(PlatformSpecific, "curl_easy_getinfo failed: {}", curl_easy_strerror(res));

      return {};
    }

    /**
     * @brief HTTP status code of the last completed transfer.
     */
    fn responseCode() -> Result<i64> {
      long code = 0;

      if (Result res = getInfo(CURLINFO_RESPONSE_CODE, &code); !res)
        return Err(res.error());

      return static_cast<i64>(code);
    }

    /**
     * @brief URL-escapes a string for use as a query value.
     */
    static fn escape(const String& value) -> Result<String> {
      char* escaped = curl_easy_escape(nullptr, value.c_str(), static_cast<int>(value.length()));

      if (!escaped)
        ERR(OutOfMemory, "curl_easy_escape failed");

      String result(escaped);

      curl_free(escaped);

      return result;
    }

    fn setUrl(const String& url) -> Result<> {
      return setOpt(CURLOPT_URL, url.c_str());
    }

    fn setWriteFunction(String* buffer) -> Result<> {
      if (!buffer)
        ERR(InvalidArgument, "Write buffer cannot be null");

      if (Result res = setOpt(CURLOPT_WRITEFUNCTION, writeCallback); !res)
        return res;

      return setOpt(CURLOPT_WRITEDATA, buffer);
    }

    fn setTimeout(const i64 timeout) -> Result<> {
      return setOpt(CURLOPT_TIMEOUT, static_cast<long>(timeout));
    }

    fn setConnectTimeout(const i64 timeout) -> Result<> {
      return setOpt(CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout));
    }

    /**
     * @brief Attaches a header list. The list must outlive the transfer.
     */
    fn setHeaders(const SList& headers) -> Result<> {
      return setOpt(CURLOPT_HTTPHEADER, headers.get());
    }
  };

  /**
   * @brief Initializes CURL globally. Call once before any handle is created.
   */
  inline fn GlobalInit(const i32 flags = CURL_GLOBAL_ALL) -> Result<> {
    if (const CURLcode res = curl_global_init(flags); res != CURLE_OK)
      ERR_FMT(PlatformSpecific, "curl_global_init failed: {}", curl_easy_strerror(res));

    return {};
  }

  inline fn GlobalCleanup() -> Unit {
    curl_global_cleanup();
  }
} // namespace Curl
