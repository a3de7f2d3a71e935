#pragma once

#ifdef __APPLE__

  #include <Nimbus/Core/Location.hpp>
  #include <Nimbus/Utils/Definitions.hpp>
  #include <Nimbus/Utils/Error.hpp>
  #include <Nimbus/Utils/Types.hpp>

namespace nimbus::os::macOS::bridge {
  namespace {
    using nimbus::core::location::Coordinates;
    using nimbus::utils::types::Option;
    using nimbus::utils::types::Result;
  } // namespace

  fn LocationServicesEnabled() -> Result<bool>;
  fn LocationAuthorized() -> Result<bool>;
  fn RequestLocationAuthorization() -> Result<>;
  fn CachedLocation() -> Result<Option<Coordinates>>;
  fn StartLocationUpdates() -> Result<>;
} // namespace nimbus::os::macOS::bridge

#endif
