#include "Nimbus/Core/LocationAcquirer.hpp"

#include "Nimbus/Utils/Logging.hpp"

namespace nimbus::core::acquirer {
  namespace {
    using location::Coordinates;
    using location::GetCoordinates;
    using location::Unavailable;

    using utils::types::Option;
  } // namespace

  LocationAcquirer::LocationAcquirer(const ICoordinateProvider& native, const ICoordinateProvider& network)
    : m_native(native), m_network(network) {}

  fn LocationAcquirer::acquire() const -> AcquisitionResult {
    debug_log("Attempting native system location...");

    const AcquisitionResult native = m_native.locate();

    if (const Option<Coordinates> coords = GetCoordinates(native)) {
      info_log("Using native location: {}", *coords);
      return native;
    }

    debug_log("Native location unavailable: {}", std::get<Unavailable>(native).reason);
    debug_log("Falling back to IP geolocation...");

    const AcquisitionResult network = m_network.locate();

    if (const Option<Coordinates> coords = GetCoordinates(network)) {
      info_log("Using IP geolocation: {}", *coords);
      return network;
    }

    debug_log("IP geolocation unavailable: {}", std::get<Unavailable>(network).reason);
    warn_log("All location methods failed");

    return Unavailable { "all location methods failed" };
  }
} // namespace nimbus::core::acquirer
