#include "Nimbus/Services/Positioning.hpp"

#include <format> // std::format
#include <thread> // std::this_thread::sleep_for

#include "Nimbus/Utils/Logging.hpp"

#include "OS/PlatformLocator.hpp"

namespace nimbus::services::positioning {
  namespace {
    using core::location::Unavailable;

    using utils::types::Err;
    using utils::types::Exception;

    fn IsUsableFix(const Coordinates& coords) -> bool {
      // Zero in either axis is treated as "no position yet".
      return Coordinates::IsValid(coords.latitude, coords.longitude) && coords.latitude != 0.0 && coords.longitude != 0.0;
    }
  } // namespace

  fn ThreadSleeper() -> Sleeper {
    return [](const Milliseconds duration) { std::this_thread::sleep_for(duration); };
  }

  NativeCoordinateProvider::NativeCoordinateProvider(UniquePointer<IPlatformLocator> locator, const PositioningTimings timings, Sleeper sleeper)
    : m_locator(std::move(locator)), m_timings(timings), m_sleeper(std::move(sleeper)) {}

  fn NativeCoordinateProvider::locate() const -> AcquisitionResult {
    if (!m_locator)
      return Unavailable { "no native locator" };

    try {
      Result<AcquisitionResult> result = locateImpl();

      if (!result) {
        debug_at(result.error());
        return Unavailable { result.error().message };
      }

      return *result;
    } catch (const Exception& exc) {
      debug_log("Native location failed: {}", exc.what());
      return Unavailable { exc.what() };
    }
  }

  fn NativeCoordinateProvider::locateImpl() const -> Result<AcquisitionResult> {
    Result<bool> enabled = m_locator->servicesEnabled();

    if (!enabled)
      return Err(enabled.error());

    if (!*enabled)
      return Unavailable { "location services are disabled" };

    Result<bool> authorized = m_locator->authorizationGranted();

    if (!authorized)
      return Err(authorized.error());

    if (!*authorized) {
      debug_log("Location permission not granted, requesting it");

      if (Result res = m_locator->requestAuthorization(); !res)
        return Err(res.error());

      m_sleeper(m_timings.permissionWait);

      authorized = m_locator->authorizationGranted();

      if (!authorized)
        return Err(authorized.error());

      if (!*authorized)
        return Unavailable { "location permission denied" };
    }

    Result<Option<Coordinates>> fix = m_locator->lastKnownFix();

    if (!fix)
      return Err(fix.error());

    if (!*fix) {
      debug_log("No cached fix, requesting a fresh one");

      if (Result res = m_locator->requestFreshFix(); !res)
        return Err(res.error());

      m_sleeper(m_timings.fixWait);

      fix = m_locator->lastKnownFix();

      if (!fix)
        return Err(fix.error());

      if (!*fix)
        return Unavailable { "no location fix available" };
    }

    if (!IsUsableFix(**fix))
      return Unavailable { std::format("unusable fix {}, {}", (*fix)->latitude, (*fix)->longitude) };

    return **fix;
  }

  UnavailableCoordinateProvider::UnavailableCoordinateProvider(String reason)
    : m_reason(std::move(reason)) {}

  fn UnavailableCoordinateProvider::locate() const -> AcquisitionResult {
    return Unavailable { m_reason };
  }

  fn CreateNativeCoordinateProvider(const Platform platform) -> UniquePointer<ICoordinateProvider> {
    if (platform == Platform::Unsupported || platform != GetHostPlatform())
      return std::make_unique<UnavailableCoordinateProvider>("native location is not supported on this platform");

#if NIMBUS_PLATFORM_LINUX || NIMBUS_PLATFORM_MACOS || NIMBUS_PLATFORM_WINDOWS
    Result<UniquePointer<IPlatformLocator>> locator = os::CreatePlatformLocator();

    if (!locator) {
      debug_at(locator.error());
      return std::make_unique<UnavailableCoordinateProvider>(locator.error().message);
    }

    return std::make_unique<NativeCoordinateProvider>(std::move(*locator));
#else
    return std::make_unique<UnavailableCoordinateProvider>("native location is not supported on this platform");
#endif
  }
} // namespace nimbus::services::positioning
