#pragma once

#include "../Core/Location.hpp"
#include "../Utils/Definitions.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace nimbus::services::positioning {
  namespace {
    using core::location::AcquisitionResult;
    using core::location::Coordinates;

    using utils::types::Fn;
    using utils::types::Milliseconds;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::u8;
    using utils::types::UniquePointer;
    using utils::types::Unit;
  } // namespace

  /**
   * @brief Operating system family, used to pick a native positioning strategy.
   */
  enum class Platform : u8 {
    Linux,
    MacOS,
    Windows,
    Unsupported,
  };

  /**
   * @brief The platform this binary was compiled for.
   */
  constexpr fn GetHostPlatform() -> Platform {
    if constexpr (NIMBUS_PLATFORM_LINUX)
      return Platform::Linux;
    else if constexpr (NIMBUS_PLATFORM_MACOS)
      return Platform::MacOS;
    else if constexpr (NIMBUS_PLATFORM_WINDOWS)
      return Platform::Windows;
    else
      return Platform::Unsupported;
  }

  /**
   * @class ICoordinateProvider
   * @brief A source of the device's current coordinates.
   *
   * locate() never throws; every failure is reported as Unavailable.
   */
  class ICoordinateProvider {
   public:
    ICoordinateProvider(const ICoordinateProvider&) = delete;
    ICoordinateProvider(ICoordinateProvider&&)      = delete;

    fn operator=(const ICoordinateProvider&)->ICoordinateProvider& = delete;
    fn operator=(ICoordinateProvider&&)->ICoordinateProvider&      = delete;

    virtual ~ICoordinateProvider() = default;

    [[nodiscard]] virtual fn locate() const -> AcquisitionResult = 0;

   protected:
    ICoordinateProvider() = default;
  };

  /**
   * @class IPlatformLocator
   * @brief The OS-level primitives of one native positioning backend.
   *
   * NativeCoordinateProvider drives these; implementations should not wait or retry on their own.
   */
  class IPlatformLocator {
   public:
    IPlatformLocator(const IPlatformLocator&) = delete;
    IPlatformLocator(IPlatformLocator&&)      = delete;

    fn operator=(const IPlatformLocator&)->IPlatformLocator& = delete;
    fn operator=(IPlatformLocator&&)->IPlatformLocator&      = delete;

    virtual ~IPlatformLocator() = default;

    /// Whether location services are switched on system-wide.
    virtual fn servicesEnabled() -> Result<bool> = 0;

    /// Whether this process may read the location.
    virtual fn authorizationGranted() -> Result<bool> = 0;

    /// Asks the OS for permission. May show a prompt; the answer arrives asynchronously.
    virtual fn requestAuthorization() -> Result<> = 0;

    /// The most recent fix the OS has cached, if any.
    virtual fn lastKnownFix() -> Result<Option<Coordinates>> = 0;

    /// Asks the OS to produce a new fix. The result is read back through lastKnownFix().
    virtual fn requestFreshFix() -> Result<> = 0;

   protected:
    IPlatformLocator() = default;
  };

  /**
   * @brief How long NativeCoordinateProvider waits after each request it makes.
   */
  struct PositioningTimings {
    Milliseconds permissionWait { 2000 }; ///< After requesting authorization.
    Milliseconds fixWait { 1000 };        ///< After requesting a fresh fix.
  };

  using Sleeper = Fn<Unit(Milliseconds)>;

  /**
   * @brief A Sleeper that blocks the calling thread.
   */
  fn ThreadSleeper() -> Sleeper;

  /**
   * @class NativeCoordinateProvider
   * @brief Reads a fix through an IPlatformLocator with a fixed, bounded number of waits.
   *
   * Sequence:
   *  1. services disabled -> Unavailable
   *  2. not authorized -> request once, wait permissionWait, recheck once
   *  3. no cached fix -> request a fresh one, wait fixWait, read once more
   *  4. out-of-range or zero coordinates -> Unavailable
   *
   * Errors and exceptions from the locator are logged at debug level and reported as Unavailable.
   */
  class NativeCoordinateProvider final : public ICoordinateProvider {
   public:
    explicit NativeCoordinateProvider(UniquePointer<IPlatformLocator> locator, PositioningTimings timings = {}, Sleeper sleeper = ThreadSleeper());

    [[nodiscard]] fn locate() const -> AcquisitionResult override;

   private:
    fn locateImpl() const -> Result<AcquisitionResult>;

    UniquePointer<IPlatformLocator> m_locator;
    PositioningTimings              m_timings;
    Sleeper                         m_sleeper;
  };

  /**
   * @class UnavailableCoordinateProvider
   * @brief Stand-in used where no native backend exists.
   */
  class UnavailableCoordinateProvider final : public ICoordinateProvider {
   public:
    explicit UnavailableCoordinateProvider(String reason);

    [[nodiscard]] fn locate() const -> AcquisitionResult override;

   private:
    String m_reason;
  };

  /**
   * @brief Creates the native provider for a platform.
   *
   * Falls back to an UnavailableCoordinateProvider if the platform is unsupported, is not
   * the host platform, or its backend fails to initialize.
   */
  fn CreateNativeCoordinateProvider(Platform platform = GetHostPlatform()) -> UniquePointer<ICoordinateProvider>;
} // namespace nimbus::services::positioning
