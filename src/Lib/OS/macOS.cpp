#ifdef __APPLE__

  #include <Nimbus/Services/Positioning.hpp>
  #include <Nimbus/Utils/Error.hpp>
  #include <Nimbus/Utils/Types.hpp>

  #include "OS/PlatformLocator.hpp"
  #include "OS/macOS/Bridge.hpp"

using namespace nimbus::utils::types;

using nimbus::core::location::Coordinates;
using nimbus::services::positioning::IPlatformLocator;

namespace {
  namespace bridge = nimbus::os::macOS::bridge;

  /**
   * @brief Native positioning through CoreLocation.
   */
  class CoreLocationLocator final : public IPlatformLocator {
   public:
    CoreLocationLocator() = default;

    fn servicesEnabled() -> Result<bool> override {
      return bridge::LocationServicesEnabled();
    }

    fn authorizationGranted() -> Result<bool> override {
      return bridge::LocationAuthorized();
    }

    fn requestAuthorization() -> Result<> override {
      return bridge::RequestLocationAuthorization();
    }

    fn lastKnownFix() -> Result<Option<Coordinates>> override {
      return bridge::CachedLocation();
    }

    fn requestFreshFix() -> Result<> override {
      return bridge::StartLocationUpdates();
    }
  };
} // namespace

namespace nimbus::os {
  fn CreatePlatformLocator() -> Result<UniquePointer<IPlatformLocator>> {
    return std::make_unique<CoreLocationLocator>();
  }
} // namespace nimbus::os

#endif
