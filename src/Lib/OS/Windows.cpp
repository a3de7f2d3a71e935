/**
 * @file   Windows.cpp
 * @brief  Native positioning on Windows through the WinRT Windows.Devices.Geolocation API.
 */

#ifdef _WIN32

// clang-format off
  #include <chrono>                              // std::chrono::{minutes, seconds}
  #include <winrt/Windows.Devices.Geolocation.h> // winrt::Windows::Devices::Geolocation::{Geolocator, Geoposition}
  #include <winrt/Windows.Foundation.h>          // winrt::Windows::Foundation::{IAsyncOperation, AsyncStatus, TimeSpan}
  #include <winrt/Windows.Security.Authorization.AppCapabilityAccess.h> // winrt::Windows::Security::Authorization::AppCapabilityAccess::AppCapability

  #include "Nimbus/Services/Positioning.hpp"
  #include "Nimbus/Utils/Error.hpp"
  #include "Nimbus/Utils/Logging.hpp"
  #include "Nimbus/Utils/Types.hpp"

  #include "OS/PlatformLocator.hpp"
// clang-format on

using namespace nimbus::utils::types;

using nimbus::core::location::Coordinates;
using nimbus::services::positioning::IPlatformLocator;
using nimbus::utils::error::NimbusError;

namespace {
  // WinRT names are long; alias the ones used here.
  using winrt::Windows::Devices::Geolocation::GeolocationAccessStatus;
  using winrt::Windows::Devices::Geolocation::Geolocator;
  using winrt::Windows::Devices::Geolocation::Geoposition;
  using winrt::Windows::Devices::Geolocation::PositionStatus;
  using winrt::Windows::Foundation::AsyncStatus;
  using winrt::Windows::Foundation::IAsyncOperation;
  using winrt::Windows::Security::Authorization::AppCapabilityAccess::AppCapability;
  using winrt::Windows::Security::Authorization::AppCapabilityAccess::AppCapabilityAccessStatus;

  constexpr std::chrono::minutes MAX_FIX_AGE { 10 };
  constexpr std::chrono::seconds FIX_TIMEOUT { 10 };
  constexpr std::chrono::seconds PROMPT_TIMEOUT { 2 };

  /**
   * @brief Native positioning through Windows.Devices.Geolocation.
   *
   * A fresh fix is requested asynchronously; lastKnownFix() picks it up once the operation completes.
   */
  class GeolocatorLocator final : public IPlatformLocator {
   public:
    GeolocatorLocator() {
      m_geolocator.DesiredAccuracy(winrt::Windows::Devices::Geolocation::PositionAccuracy::Default);
    }

    ~GeolocatorLocator() override {
      if (m_pending && m_pending.Status() == AsyncStatus::Started)
        m_pending.Cancel();
    }

    GeolocatorLocator(const GeolocatorLocator&)                = delete;
    GeolocatorLocator(GeolocatorLocator&&)                     = delete;
    fn operator=(const GeolocatorLocator&)->GeolocatorLocator& = delete;
    fn operator=(GeolocatorLocator&&)->GeolocatorLocator&      = delete;

    fn servicesEnabled() -> Result<bool> override {
      try {
        const PositionStatus status = m_geolocator.LocationStatus();
        return status != PositionStatus::Disabled && status != PositionStatus::NotAvailable;
      } catch (const winrt::hresult_error& e) {
        return Err(NimbusError(e));
      }
    }

    fn authorizationGranted() -> Result<bool> override {
      try {
        // CheckAccess only reads the current setting and never shows the consent prompt.
        return AppCapability::Create(L"location").CheckAccess() == AppCapabilityAccessStatus::Allowed;
      } catch (const winrt::hresult_error& e) {
        return Err(NimbusError(e));
      }
    }

    fn requestAuthorization() -> Result<> override {
      try {
        IAsyncOperation<GeolocationAccessStatus> request = Geolocator::RequestAccessAsync();

        if (request.wait_for(PROMPT_TIMEOUT) != AsyncStatus::Completed) {
          request.Cancel();
          debug_log("Location access request did not complete within {}s", PROMPT_TIMEOUT.count());
          return {};
        }

        if (request.GetResults() == GeolocationAccessStatus::Denied)
          debug_log("Location access denied in Windows privacy settings");

        return {};
      } catch (const winrt::hresult_error& e) {
        return Err(NimbusError(e));
      }
    }

    fn lastKnownFix() -> Result<Option<Coordinates>> override {
      if (m_fix)
        return m_fix;

      if (!m_pending || m_pending.Status() != AsyncStatus::Completed)
        return None;

      try {
        const Geoposition position = m_pending.GetResults();
        const auto        point    = position.Coordinate().Point().Position();

        m_fix = Coordinates { .latitude = point.Latitude, .longitude = point.Longitude };

        return m_fix;
      } catch (const winrt::hresult_error& e) {
        return Err(NimbusError(e));
      }
    }

    fn requestFreshFix() -> Result<> override {
      if (m_pending)
        return {};

      try {
        m_pending = m_geolocator.GetGeopositionAsync(MAX_FIX_AGE, FIX_TIMEOUT);
        return {};
      } catch (const winrt::hresult_error& e) {
        return Err(NimbusError(e));
      }
    }

   private:
    Geolocator                   m_geolocator;
    IAsyncOperation<Geoposition> m_pending { nullptr };
    Option<Coordinates>          m_fix;
  };
} // namespace

namespace nimbus::os {
  fn CreatePlatformLocator() -> Result<UniquePointer<IPlatformLocator>> {
    try {
      return std::make_unique<GeolocatorLocator>();
    } catch (const winrt::hresult_error& e) {
      return Err(NimbusError(e));
    }
  }
} // namespace nimbus::os

#endif // _WIN32
