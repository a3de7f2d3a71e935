#include "Nimbus/Core/LocationResolver.hpp"

#include <format> // std::format

#include "Nimbus/Utils/Logging.hpp"

namespace nimbus::core::resolver {
  namespace {
    using location::AcquisitionResult;
    using location::Coordinates;
    using location::Unavailable;

    using utils::error::NimbusError;
    using enum utils::error::NimbusErrorCode;

    using utils::types::Err;
  } // namespace

  LocationResolver::LocationResolver(const ILocationAcquirer& acquirer, const ILocationDefaults& defaults)
    : m_acquirer(acquirer), m_defaults(defaults) {}

  fn LocationResolver::resolve(const bool here, const Option<String>& city) const -> Result<Location> {
    Result<ResolvedLocation> resolved = resolveWithSource(here, city);

    if (!resolved)
      return Err(resolved.error());

    return std::move(resolved->location);
  }

  fn LocationResolver::resolveWithSource(const bool here, const Option<String>& city) const -> Result<ResolvedLocation> {
    if (here)
      return acquireLocation(ResolutionSource::CurrentLocation);

    if (city && !city->empty()) {
      debug_log("Using city from command line: {}", *city);
      return ResolvedLocation { .location = Location::FromCity(*city), .source = ResolutionSource::CityArgument };
    }

    if (const Option<String> defaultCity = m_defaults.defaultCity(); defaultCity && !defaultCity->empty()) {
      debug_log("Using default city from config: {}", *defaultCity);
      return ResolvedLocation { .location = Location::FromCity(*defaultCity), .source = ResolutionSource::DefaultCity };
    }

    debug_log("No city given or configured, detecting location automatically");

    return acquireLocation(ResolutionSource::Automatic);
  }

  fn LocationResolver::acquireLocation(const ResolutionSource source) const -> Result<ResolvedLocation> {
    const AcquisitionResult result = m_acquirer.acquire();

    if (const Coordinates* coords = std::get_if<Coordinates>(&result))
      return ResolvedLocation { .location = Location::FromCoordinates(coords->latitude, coords->longitude), .source = source };

    return Err(NimbusError(Unresolved, std::format("Could not determine location: {}", std::get<Unavailable>(result).reason)));
  }
} // namespace nimbus::core::resolver
