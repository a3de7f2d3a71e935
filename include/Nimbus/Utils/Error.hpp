#pragma once

#include <expected>        // std::{unexpected, expected}
#include <format>          // std::{format, formatter}
#include <matchit.hpp>     // matchit::{match, is, or_, _}
#include <source_location> // std::source_location
#include <system_error>    // std::error_code

#ifdef _WIN32
  #include <winerror.h>   // error values
  #include <winrt/base.h> // winrt::hresult_error
#endif

#include "Definitions.hpp"
#include "Types.hpp"

namespace nimbus::utils {
  namespace error {
    namespace {
      using types::Exception;
      using types::String;
      using types::u8;
    } // namespace

    /**
     * @enum NimbusErrorCode
     * @brief Error categories shared by every Nimbus layer.
     */
    enum class NimbusErrorCode : u8 {
      ApiUnavailable,     ///< A remote API or OS service is unavailable or answered with a failure status.
      ConfigurationError, ///< Configuration or environment issue (missing API key, unreadable config file).
      InternalError,      ///< An error occurred within Nimbus' own logic.
      InvalidArgument,    ///< An invalid argument was passed to a function or on the command line.
      IoError,            ///< General I/O error (filesystem, pipes, etc.).
      NetworkError,       ///< A transport-level failure (DNS resolution, connection refused, TLS).
      NotFound,           ///< A required resource (file, D-Bus service, city) was not found.
      NotSupported,       ///< The requested operation is not supported on this platform.
      Other,              ///< A generic or unclassified error.
      OutOfMemory,        ///< The system ran out of memory while completing the operation.
      ParseError,         ///< Failed to parse data (JSON payload, TOML file, D-Bus reply).
      PermissionDenied,   ///< Insufficient permissions, or the API rejected our credentials.
      PlatformSpecific,   ///< An unmapped error specific to the underlying OS platform occurred (check message).
      Timeout,            ///< An operation timed out.
      Unresolved,         ///< No location could be determined from any source.
    };

    /**
     * @struct NimbusError
     * @brief Holds structured information about an error.
     *
     * Used as the error type in Result throughout Nimbus.
     */
    struct NimbusError {
      String               message;  ///< A descriptive error message, potentially including platform details.
      std::source_location location; ///< The source location where the error occurred (file, line, function).
      NimbusErrorCode      code;     ///< The general category of the error.

      NimbusError(const NimbusErrorCode errc, String msg, const std::source_location& loc = std::source_location::current())
        : message(std::move(msg)), location(loc), code(errc) {}

      explicit NimbusError(const Exception& exc, const std::source_location& loc = std::source_location::current())
        : message(exc.what()), location(loc), code(NimbusErrorCode::InternalError) {}

      explicit NimbusError(const std::error_code& errc, const std::source_location& loc = std::source_location::current())
        : message(errc.message()), location(loc) {
        using matchit::match, matchit::is, matchit::or_, matchit::_;
        using enum NimbusErrorCode;
        using enum std::errc;

        code = match(errc)(
          is | or_(file_too_large, io_error)                                                = IoError,
          is | invalid_argument                                                             = InvalidArgument,
          is | not_enough_memory                                                            = OutOfMemory,
          is | or_(address_family_not_supported, operation_not_supported, not_supported)    = NotSupported,
          is | or_(network_unreachable, network_down, connection_refused)                   = NetworkError,
          is | or_(no_such_file_or_directory, not_a_directory, is_a_directory, file_exists) = NotFound,
          is | permission_denied                                                            = PermissionDenied,
          is | timed_out                                                                    = Timeout,
          is | _                                                                            = errc.category() == std::generic_category() ? InternalError : PlatformSpecific
        );
      }

#ifdef _WIN32
      explicit NimbusError(const winrt::hresult_error& err, const std::source_location& loc = std::source_location::current())
        : message(winrt::to_string(err.message())), location(loc) {
        switch (err.code()) {
          case E_ACCESSDENIED:                              code = NimbusErrorCode::PermissionDenied; break;
          case HRESULT_FROM_WIN32(ERROR_FILE_NOT_FOUND):
          case HRESULT_FROM_WIN32(ERROR_PATH_NOT_FOUND):
          case HRESULT_FROM_WIN32(ERROR_SERVICE_NOT_FOUND): code = NimbusErrorCode::NotFound; break;
          case HRESULT_FROM_WIN32(ERROR_TIMEOUT):
          case HRESULT_FROM_WIN32(ERROR_SEM_TIMEOUT):       code = NimbusErrorCode::Timeout; break;
          case HRESULT_FROM_WIN32(ERROR_NOT_SUPPORTED):     code = NimbusErrorCode::NotSupported; break;
          default:                                          code = NimbusErrorCode::PlatformSpecific; break;
        }
      }
#endif
    };
  } // namespace error

  namespace types {
    /**
     * @typedef Result
     * @brief Alias for std::expected<Tp, Er>. Represents a value that can either be
     * a success value of type Tp or an error value of type Er.
     * @tparam Tp The type of the success value.
     * @tparam Er The type of the error value.
     */
    template <typename Tp = void, typename Er = error::NimbusError>
    using Result = std::expected<Tp, Er>;

    /**
     * @typedef Err
     * @brief Alias for std::unexpected<Er>. Used to construct a Result in an error state.
     * @tparam Er The type of the error value.
     */
    template <typename Er = error::NimbusError>
    using Err = std::unexpected<Er>;
  } // namespace types
} // namespace nimbus::utils

namespace std {
  template <>
  struct formatter<::nimbus::utils::error::NimbusErrorCode> : formatter<::nimbus::utils::types::StringView> {
    template <typename FormatContext>
    fn format(::nimbus::utils::error::NimbusErrorCode code, FormatContext& ctx) const {
      using enum ::nimbus::utils::error::NimbusErrorCode;
      using matchit::match, matchit::is, matchit::_;

      ::nimbus::utils::types::StringView name = match(code)(
        is | ApiUnavailable     = "ApiUnavailable",
        is | ConfigurationError = "ConfigurationError",
        is | InternalError      = "InternalError",
        is | InvalidArgument    = "InvalidArgument",
        is | IoError            = "IoError",
        is | NetworkError       = "NetworkError",
        is | NotFound           = "NotFound",
        is | NotSupported       = "NotSupported",
        is | Other              = "Other",
        is | OutOfMemory        = "OutOfMemory",
        is | ParseError         = "ParseError",
        is | PermissionDenied   = "PermissionDenied",
        is | PlatformSpecific   = "PlatformSpecific",
        is | Timeout            = "Timeout",
        is | Unresolved         = "Unresolved",
        is | _                  = "Unknown"
      );

      return formatter<::nimbus::utils::types::StringView>::format(name, ctx);
    }
  };
} // namespace std

#define ERR(errc, msg)          return ::nimbus::utils::types::Err(::nimbus::utils::error::NimbusError(errc, msg))
#define ERR_FROM(err)           return ::nimbus::utils::types::Err(::nimbus::utils::error::NimbusError(err))
#define ERR_FMT(errc, fmt, ...) return ::nimbus::utils::types::Err(::nimbus::utils::error::NimbusError(errc, std::format(fmt, __VA_ARGS__)))
