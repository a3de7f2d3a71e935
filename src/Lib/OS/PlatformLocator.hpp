#pragma once

#include <Nimbus/Services/Positioning.hpp>
#include <Nimbus/Utils/Error.hpp>
#include <Nimbus/Utils/Types.hpp>

namespace nimbus::os {
  /**
   * @brief Creates the native locator backend for the host OS.
   *
   * Defined once per supported platform (Linux.cpp, macOS.cpp, Windows.cpp).
   */
  fn CreatePlatformLocator() -> utils::types::Result<utils::types::UniquePointer<services::positioning::IPlatformLocator>>;
} // namespace nimbus::os
