#include <Nimbus/Core/Location.hpp>
#include <Nimbus/Services/Http.hpp>
#include <Nimbus/Services/IpGeolocation.hpp>
#include <Nimbus/Utils/Error.hpp>
#include <Nimbus/Utils/Types.hpp>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

using namespace testing;
using namespace nimbus::utils::types;
using namespace nimbus::core::location;
using nimbus::services::http::HttpRequest;
using nimbus::services::http::HttpResponse;
using nimbus::services::http::IHttpClient;
using nimbus::services::ipgeo::DEFAULT_ENDPOINT;
using nimbus::services::ipgeo::IPGeolocationClient;
using nimbus::services::ipgeo::LocationDetails;
using nimbus::services::ipgeo::USER_AGENT;
using nimbus::utils::error::NimbusError;
using enum nimbus::utils::error::NimbusErrorCode;

// NOLINTBEGIN(readability-identifier-naming)
class MockHttpClient : public IHttpClient {
 public:
  MOCK_METHOD(Result<HttpResponse>, get, (const HttpRequest&), (const, override));
};
// NOLINTEND(readability-identifier-naming)

class IpGeolocationTest : public Test {
 protected:
  NiceMock<MockHttpClient> m_http;
  IPGeolocationClient      m_client { m_http };

  fn respond(const i64 status, String body) -> Unit {
    ON_CALL(m_http, get(_)).WillByDefault(Return(Result<HttpResponse>(HttpResponse { .statusCode = status, .body = std::move(body) })));
  }

  fn fail(const NimbusError& error) -> Unit {
    ON_CALL(m_http, get(_)).WillByDefault(Return(Result<HttpResponse>(Err(error))));
  }
};

TEST_F(IpGeolocationTest, NumericCoordinates) {
  respond(200, R"({"latitude": 51.5074, "longitude": -0.1278, "city": "London"})");

  const AcquisitionResult result = m_client.locate();

  ASSERT_TRUE(GetCoordinates(result));
  EXPECT_DOUBLE_EQ(GetCoordinates(result)->latitude, 51.5074);
  EXPECT_DOUBLE_EQ(GetCoordinates(result)->longitude, -0.1278);
}

TEST_F(IpGeolocationTest, StringCoordinatesAreCoerced) {
  respond(200, R"({"latitude": " 40.7128", "longitude": "-74.0060 "})");

  const AcquisitionResult result = m_client.locate();

  ASSERT_TRUE(GetCoordinates(result));
  EXPECT_DOUBLE_EQ(GetCoordinates(result)->latitude, 40.7128);
  EXPECT_DOUBLE_EQ(GetCoordinates(result)->longitude, -74.006);
}

TEST_F(IpGeolocationTest, NonNumericStringIsUnavailable) {
  respond(200, R"({"latitude": "north", "longitude": "-74.0"})");

  EXPECT_FALSE(IsAvailable(m_client.locate()));
}

TEST_F(IpGeolocationTest, MissingCoordinateIsUnavailable) {
  respond(200, R"({"latitude": 12.0, "city": "Somewhere"})");

  EXPECT_FALSE(IsAvailable(m_client.locate()));
}

TEST_F(IpGeolocationTest, NullCoordinateIsUnavailable) {
  respond(200, R"({"latitude": null, "longitude": null})");

  EXPECT_FALSE(IsAvailable(m_client.locate()));
}

TEST_F(IpGeolocationTest, OutOfRangeCoordinatesAreUnavailable) {
  respond(200, R"({"latitude": 91.0, "longitude": 10.0})");

  EXPECT_FALSE(IsAvailable(m_client.locate()));
}

TEST_F(IpGeolocationTest, ProviderReportedErrorIsUnavailable) {
  respond(200, R"({"error": true, "reason": "RateLimited", "latitude": 1.0, "longitude": 1.0})");

  const AcquisitionResult result = m_client.locate();

  ASSERT_FALSE(IsAvailable(result));
  EXPECT_EQ(std::get<Unavailable>(result).reason, "RateLimited");
}

TEST_F(IpGeolocationTest, HttpErrorStatusIsUnavailable) {
  respond(429, R"({"error": true})");

  EXPECT_FALSE(IsAvailable(m_client.locate()));
}

TEST_F(IpGeolocationTest, MalformedBodyIsUnavailable) {
  respond(200, "<html>not json</html>");

  EXPECT_FALSE(IsAvailable(m_client.locate()));
}

TEST_F(IpGeolocationTest, TransportFailureIsUnavailable) {
  fail(NimbusError(Timeout, "Operation timed out after 10000 milliseconds"));

  EXPECT_FALSE(IsAvailable(m_client.locate()));
}

TEST_F(IpGeolocationTest, SendsUserAgentAndTimeout) {
  EXPECT_CALL(m_http, get(_)).WillOnce(Invoke([](const HttpRequest& request) -> Result<HttpResponse> {
    EXPECT_EQ(request.url, DEFAULT_ENDPOINT);
    EXPECT_EQ(request.timeoutSecs, 10);
    EXPECT_THAT(request.headers, Contains(testing::Pair(String("User-Agent"), String(USER_AGENT))));
    return HttpResponse { .statusCode = 200, .body = R"({"latitude": 1.5, "longitude": 2.5})" };
  }));

  EXPECT_TRUE(IsAvailable(m_client.locate()));
}

TEST_F(IpGeolocationTest, DetailedInfo_FillsMissingFieldsWithUnknown) {
  respond(200, R"({"city": "Lyon", "country_name": "France", "country": "FR"})");

  const Option<LocationDetails> details = m_client.detailedInfo();

  ASSERT_TRUE(details);
  EXPECT_EQ(details->city, "Lyon");
  EXPECT_EQ(details->region, "Unknown");
  EXPECT_EQ(details->country, "France");
  EXPECT_EQ(details->countryCode, "FR");
  EXPECT_EQ(details->timezone, "Unknown");
}

TEST_F(IpGeolocationTest, DetailedInfo_IsIdempotent) {
  respond(200, R"({"city": "Kyoto", "region": "Kyoto", "country_name": "Japan", "country": "JP", "timezone": "Asia/Tokyo"})");

  const Option<LocationDetails> first  = m_client.detailedInfo();
  const Option<LocationDetails> second = m_client.detailedInfo();

  ASSERT_TRUE(first);
  EXPECT_EQ(first, second);
}

TEST_F(IpGeolocationTest, DetailedInfo_NoneOnFailure) {
  fail(NimbusError(NetworkError, "Could not resolve host"));

  EXPECT_FALSE(m_client.detailedInfo());
}

TEST_F(IpGeolocationTest, DetailedInfo_NoneOnProviderError) {
  respond(200, R"({"error": true, "reason": "Reserved IP Address"})");

  EXPECT_FALSE(m_client.detailedInfo());
}
