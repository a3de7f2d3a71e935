#pragma once

#include "../Core/Location.hpp"
#include "../Utils/Types.hpp"
#include "Http.hpp"
#include "Positioning.hpp"

namespace nimbus::services::ipgeo {
  namespace {
    using core::location::AcquisitionResult;

    using http::IHttpClient;
    using positioning::ICoordinateProvider;

    using utils::types::Option;
    using utils::types::String;
    using utils::types::StringView;
  } // namespace

  inline constexpr StringView DEFAULT_ENDPOINT = "https://ipapi.co/json/";
  inline constexpr StringView USER_AGENT       = "nimbus-cli/1.0";

  /**
   * @struct LocationDetails
   * @brief Descriptive place information for the caller's public IP address.
   *
   * Fields the provider did not report are the literal "Unknown".
   */
  struct LocationDetails {
    String city;
    String region;
    String country;     ///< Full country name.
    String countryCode; ///< ISO 3166-1 alpha-2 code.
    String timezone;

    fn operator==(const LocationDetails&) const -> bool = default;
  };

  /**
   * @class IPGeolocationClient
   * @brief Approximates the device position from its public IP address (ipapi.co).
   *
   * Every failure, including a provider-reported error, is reported as Unavailable.
   */
  class IPGeolocationClient final : public ICoordinateProvider {
   public:
    explicit IPGeolocationClient(const IHttpClient& http, String endpoint = String(DEFAULT_ENDPOINT));

    [[nodiscard]] fn locate() const -> AcquisitionResult override;

    /**
     * @brief Looks up city, region, country and timezone for the caller's IP.
     * @return None on any failure.
     */
    [[nodiscard]] fn detailedInfo() const -> Option<LocationDetails>;

   private:
    const IHttpClient& m_http;
    String             m_endpoint;
  };
} // namespace nimbus::services::ipgeo
