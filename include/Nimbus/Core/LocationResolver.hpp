#pragma once

#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"
#include "Location.hpp"
#include "LocationAcquirer.hpp"

namespace nimbus::core::resolver {
  namespace {
    using acquirer::ILocationAcquirer;
    using location::Location;

    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::u8;
  } // namespace

  /**
   * @class ILocationDefaults
   * @brief Read-only access to the user's configured fallback city.
   */
  class ILocationDefaults {
   public:
    ILocationDefaults(const ILocationDefaults&) = delete;
    ILocationDefaults(ILocationDefaults&&)      = delete;

    fn operator=(const ILocationDefaults&)->ILocationDefaults& = delete;
    fn operator=(ILocationDefaults&&)->ILocationDefaults&      = delete;

    virtual ~ILocationDefaults() = default;

    /**
     * @brief The configured default city. An empty string counts as not configured.
     */
    [[nodiscard]] virtual fn defaultCity() const -> Option<String> = 0;

   protected:
    ILocationDefaults() = default;
  };

  /**
   * @brief Which rule produced a resolved location.
   */
  enum class ResolutionSource : u8 {
    CurrentLocation, ///< --here; acquired coordinates.
    CityArgument,    ///< --city NAME.
    DefaultCity,     ///< [defaults] city from the config file.
    Automatic,       ///< Nothing requested or configured; acquired coordinates.
  };

  struct ResolvedLocation {
    Location         location;
    ResolutionSource source;
  };

  /**
   * @class LocationResolver
   * @brief Turns the user's request into exactly one Location.
   *
   * Rules, first match wins:
   *  1. here        -> acquire; failure is final (no fallback to city or default)
   *  2. city        -> that city; the acquirer is not used
   *  3. default     -> the configured city
   *  4. otherwise   -> acquire
   *
   * Failure is reported with NimbusErrorCode::Unresolved.
   */
  class LocationResolver {
   public:
    LocationResolver(const ILocationAcquirer& acquirer, const ILocationDefaults& defaults);

    [[nodiscard]] fn resolve(bool here, const Option<String>& city) const -> Result<Location>;

    [[nodiscard]] fn resolveWithSource(bool here, const Option<String>& city) const -> Result<ResolvedLocation>;

   private:
    fn acquireLocation(ResolutionSource source) const -> Result<ResolvedLocation>;

    const ILocationAcquirer& m_acquirer;
    const ILocationDefaults& m_defaults;
  };
} // namespace nimbus::core::resolver
