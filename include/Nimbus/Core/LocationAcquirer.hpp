#pragma once

#include "../Services/Positioning.hpp"
#include "Location.hpp"

namespace nimbus::core::acquirer {
  namespace {
    using location::AcquisitionResult;

    using services::positioning::ICoordinateProvider;
  } // namespace

  /**
   * @class ILocationAcquirer
   * @brief Produces the device's coordinates from whatever sources are available.
   */
  class ILocationAcquirer {
   public:
    ILocationAcquirer(const ILocationAcquirer&) = delete;
    ILocationAcquirer(ILocationAcquirer&&)      = delete;

    fn operator=(const ILocationAcquirer&)->ILocationAcquirer& = delete;
    fn operator=(ILocationAcquirer&&)->ILocationAcquirer&      = delete;

    virtual ~ILocationAcquirer() = default;

    [[nodiscard]] virtual fn acquire() const -> AcquisitionResult = 0;

   protected:
    ILocationAcquirer() = default;
  };

  /**
   * @class LocationAcquirer
   * @brief Tries the native provider, then the network provider, one after the other.
   *
   * The network provider is only consulted when the native one reports Unavailable.
   */
  class LocationAcquirer final : public ILocationAcquirer {
   public:
    LocationAcquirer(const ICoordinateProvider& native, const ICoordinateProvider& network);

    [[nodiscard]] fn acquire() const -> AcquisitionResult override;

   private:
    const ICoordinateProvider& m_native;
    const ICoordinateProvider& m_network;
  };
} // namespace nimbus::core::acquirer
