#pragma once

#ifdef _WIN32
  #include <stdlib.h> // NOLINT(*-deprecated-headers)
#endif

#include <cstdlib> // std::getenv

#include "Definitions.hpp"
#include "Error.hpp"
#include "Types.hpp"

namespace nimbus::utils::env {
  namespace {
    using types::Err;
    using types::i32;
    using types::PCStr;
    using types::Result;
    using types::String;
    using types::UniquePointer;
    using types::usize;

    using error::NimbusError;
    using enum error::NimbusErrorCode;
  } // namespace

  /**
   * @brief Safely retrieves an environment variable.
   * @param name The name of the environment variable to retrieve.
   * @return A Result containing a copy of the value, or NotFound if it is unset or empty.
   */
  [[nodiscard]] inline fn GetEnv(const PCStr name) -> Result<String> {
#ifdef _WIN32
    char* rawPtr     = nullptr;
    usize bufferSize = 0;

    const i32 err = _dupenv_s(&rawPtr, &bufferSize, name);

    const UniquePointer<char, decltype(&free)> ptrManager(rawPtr, free);

    if (err != 0)
      return Err(NimbusError(PermissionDenied, "Failed to retrieve environment variable"));

    if (!ptrManager || *ptrManager == '\0')
      return Err(NimbusError(NotFound, "Environment variable not found"));

    return String(ptrManager.get());
#else
    const PCStr value = std::getenv(name);

    if (!value || *value == '\0')
      return Err(NimbusError(NotFound, "Environment variable not found"));

    return String(value);
#endif
  }

  /**
   * @brief Safely sets an environment variable.
   */
  inline fn SetEnv(const PCStr name, const PCStr value) -> void {
#ifdef _WIN32
    _putenv_s(name, value);
#else
    setenv(name, value, 1);
#endif
  }

  /**
   * @brief Safely unsets an environment variable.
   */
  inline fn UnsetEnv(const PCStr name) -> void {
#ifdef _WIN32
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
  }
} // namespace nimbus::utils::env
