#include <stdexcept> // std::runtime_error

#include <Nimbus/Core/Location.hpp>
#include <Nimbus/Services/Positioning.hpp>
#include <Nimbus/Utils/Error.hpp>
#include <Nimbus/Utils/Types.hpp>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

using namespace testing;
using namespace nimbus::utils::types;
using namespace nimbus::core::location;
using namespace nimbus::services::positioning;
using nimbus::utils::error::NimbusError;
using enum nimbus::utils::error::NimbusErrorCode;

// NOLINTBEGIN(readability-identifier-naming)
class MockLocator : public IPlatformLocator {
 public:
  MOCK_METHOD(Result<bool>, servicesEnabled, (), (override));
  MOCK_METHOD(Result<bool>, authorizationGranted, (), (override));
  MOCK_METHOD(Result<>, requestAuthorization, (), (override));
  MOCK_METHOD(Result<Option<Coordinates>>, lastKnownFix, (), (override));
  MOCK_METHOD(Result<>, requestFreshFix, (), (override));
};
// NOLINTEND(readability-identifier-naming)

class NativeCoordinateProviderTest : public Test {
 protected:
  static constexpr Coordinates FIX = { .latitude = 37.7749, .longitude = -122.4194 };

  static constexpr PositioningTimings TIMINGS = { .permissionWait = Milliseconds(2000), .fixWait = Milliseconds(1000) };

  Vec<Milliseconds> m_sleeps;
  MockLocator*      m_locator = nullptr;

  fn makeProvider() -> NativeCoordinateProvider {
    auto locator = std::make_unique<StrictMock<MockLocator>>();
    m_locator    = locator.get();

    return NativeCoordinateProvider(std::move(locator), TIMINGS, [this](const Milliseconds duration) { m_sleeps.push_back(duration); });
  }

  static fn Reason(const AcquisitionResult& result) -> String {
    return std::get<Unavailable>(result).reason;
  }
};

TEST_F(NativeCoordinateProviderTest, CachedFixReturnedWithoutWaiting) {
  const NativeCoordinateProvider provider = makeProvider();

  EXPECT_CALL(*m_locator, servicesEnabled()).WillOnce(Return(Result<bool>(true)));
  EXPECT_CALL(*m_locator, authorizationGranted()).WillOnce(Return(Result<bool>(true)));
  EXPECT_CALL(*m_locator, lastKnownFix()).WillOnce(Return(Result<Option<Coordinates>>(FIX)));

  const AcquisitionResult result = provider.locate();

  ASSERT_TRUE(GetCoordinates(result));
  EXPECT_EQ(*GetCoordinates(result), FIX);
  EXPECT_TRUE(m_sleeps.empty());
}

TEST_F(NativeCoordinateProviderTest, ServicesDisabledStopsImmediately) {
  const NativeCoordinateProvider provider = makeProvider();

  EXPECT_CALL(*m_locator, servicesEnabled()).WillOnce(Return(Result<bool>(false)));

  const AcquisitionResult result = provider.locate();

  ASSERT_FALSE(IsAvailable(result));
  EXPECT_EQ(Reason(result), "location services are disabled");
  EXPECT_TRUE(m_sleeps.empty());
}

TEST_F(NativeCoordinateProviderTest, RequestsAuthorizationOnceThenWaits) {
  const NativeCoordinateProvider provider = makeProvider();

  {
    InSequence seq;

    EXPECT_CALL(*m_locator, servicesEnabled()).WillOnce(Return(Result<bool>(true)));
    EXPECT_CALL(*m_locator, authorizationGranted()).WillOnce(Return(Result<bool>(false)));
    EXPECT_CALL(*m_locator, requestAuthorization()).WillOnce(Return(Result<>()));
    EXPECT_CALL(*m_locator, authorizationGranted()).WillOnce(Return(Result<bool>(true)));
    EXPECT_CALL(*m_locator, lastKnownFix()).WillOnce(Return(Result<Option<Coordinates>>(FIX)));
  }

  EXPECT_TRUE(IsAvailable(provider.locate()));
  EXPECT_THAT(m_sleeps, ElementsAre(TIMINGS.permissionWait));
}

TEST_F(NativeCoordinateProviderTest, DeniedAfterRequestIsUnavailable) {
  const NativeCoordinateProvider provider = makeProvider();

  EXPECT_CALL(*m_locator, servicesEnabled()).WillOnce(Return(Result<bool>(true)));
  EXPECT_CALL(*m_locator, authorizationGranted()).Times(2).WillRepeatedly(Return(Result<bool>(false)));
  EXPECT_CALL(*m_locator, requestAuthorization()).Times(1).WillOnce(Return(Result<>()));

  const AcquisitionResult result = provider.locate();

  ASSERT_FALSE(IsAvailable(result));
  EXPECT_EQ(Reason(result), "location permission denied");
  EXPECT_THAT(m_sleeps, ElementsAre(TIMINGS.permissionWait));
}

TEST_F(NativeCoordinateProviderTest, RequestsFreshFixOnceWhenNoneCached) {
  const NativeCoordinateProvider provider = makeProvider();

  {
    InSequence seq;

    EXPECT_CALL(*m_locator, servicesEnabled()).WillOnce(Return(Result<bool>(true)));
    EXPECT_CALL(*m_locator, authorizationGranted()).WillOnce(Return(Result<bool>(true)));
    EXPECT_CALL(*m_locator, lastKnownFix()).WillOnce(Return(Result<Option<Coordinates>>(None)));
    EXPECT_CALL(*m_locator, requestFreshFix()).WillOnce(Return(Result<>()));
    EXPECT_CALL(*m_locator, lastKnownFix()).WillOnce(Return(Result<Option<Coordinates>>(FIX)));
  }

  const AcquisitionResult result = provider.locate();

  ASSERT_TRUE(GetCoordinates(result));
  EXPECT_EQ(*GetCoordinates(result), FIX);
  EXPECT_THAT(m_sleeps, ElementsAre(TIMINGS.fixWait));
}

TEST_F(NativeCoordinateProviderTest, NoFixAfterWaitIsUnavailable) {
  const NativeCoordinateProvider provider = makeProvider();

  EXPECT_CALL(*m_locator, servicesEnabled()).WillOnce(Return(Result<bool>(true)));
  EXPECT_CALL(*m_locator, authorizationGranted()).WillOnce(Return(Result<bool>(true)));
  EXPECT_CALL(*m_locator, lastKnownFix()).Times(2).WillRepeatedly(Return(Result<Option<Coordinates>>(None)));
  EXPECT_CALL(*m_locator, requestFreshFix()).Times(1).WillOnce(Return(Result<>()));

  const AcquisitionResult result = provider.locate();

  ASSERT_FALSE(IsAvailable(result));
  EXPECT_EQ(Reason(result), "no location fix available");
  EXPECT_EQ(m_sleeps.size(), 1U);
}

TEST_F(NativeCoordinateProviderTest, WorstCaseWaitsAreBounded) {
  const NativeCoordinateProvider provider = makeProvider();

  EXPECT_CALL(*m_locator, servicesEnabled()).WillOnce(Return(Result<bool>(true)));
  EXPECT_CALL(*m_locator, authorizationGranted())
    .WillOnce(Return(Result<bool>(false)))
    .WillOnce(Return(Result<bool>(true)));
  EXPECT_CALL(*m_locator, requestAuthorization()).WillOnce(Return(Result<>()));
  EXPECT_CALL(*m_locator, lastKnownFix()).Times(2).WillRepeatedly(Return(Result<Option<Coordinates>>(None)));
  EXPECT_CALL(*m_locator, requestFreshFix()).WillOnce(Return(Result<>()));

  EXPECT_FALSE(IsAvailable(provider.locate()));
  EXPECT_THAT(m_sleeps, ElementsAre(TIMINGS.permissionWait, TIMINGS.fixWait));
}

TEST_F(NativeCoordinateProviderTest, ZeroCoordinatesAreNotAFix) {
  const NativeCoordinateProvider provider = makeProvider();

  EXPECT_CALL(*m_locator, servicesEnabled()).WillOnce(Return(Result<bool>(true)));
  EXPECT_CALL(*m_locator, authorizationGranted()).WillOnce(Return(Result<bool>(true)));
  EXPECT_CALL(*m_locator, lastKnownFix())
    .WillOnce(Return(Result<Option<Coordinates>>(Coordinates { .latitude = 0.0, .longitude = 12.0 })));

  EXPECT_FALSE(IsAvailable(provider.locate()));
}

TEST_F(NativeCoordinateProviderTest, OutOfRangeFixIsUnavailable) {
  const NativeCoordinateProvider provider = makeProvider();

  EXPECT_CALL(*m_locator, servicesEnabled()).WillOnce(Return(Result<bool>(true)));
  EXPECT_CALL(*m_locator, authorizationGranted()).WillOnce(Return(Result<bool>(true)));
  EXPECT_CALL(*m_locator, lastKnownFix())
    .WillOnce(Return(Result<Option<Coordinates>>(Coordinates { .latitude = 120.0, .longitude = 12.0 })));

  EXPECT_FALSE(IsAvailable(provider.locate()));
}

TEST_F(NativeCoordinateProviderTest, LocatorErrorBecomesUnavailable) {
  const NativeCoordinateProvider provider = makeProvider();

  EXPECT_CALL(*m_locator, servicesEnabled())
    .WillOnce(Return(Result<bool>(Err(NimbusError(NotFound, "GeoClue is not running")))));

  const AcquisitionResult result = provider.locate();

  ASSERT_FALSE(IsAvailable(result));
  EXPECT_EQ(Reason(result), "GeoClue is not running");
}

TEST_F(NativeCoordinateProviderTest, LocatorExceptionBecomesUnavailable) {
  const NativeCoordinateProvider provider = makeProvider();

  EXPECT_CALL(*m_locator, servicesEnabled()).WillOnce(Throw(std::runtime_error("bus exploded")));

  const AcquisitionResult result = provider.locate();

  ASSERT_FALSE(IsAvailable(result));
  EXPECT_EQ(Reason(result), "bus exploded");
}

TEST_F(NativeCoordinateProviderTest, MissingLocatorIsUnavailable) {
  const NativeCoordinateProvider provider(nullptr, TIMINGS, [](Milliseconds) {});

  EXPECT_FALSE(IsAvailable(provider.locate()));
}

TEST_F(NativeCoordinateProviderTest, UnsupportedPlatformYieldsUnavailableProvider) {
  const UniquePointer<ICoordinateProvider> provider = CreateNativeCoordinateProvider(Platform::Unsupported);

  ASSERT_NE(provider, nullptr);
  EXPECT_FALSE(IsAvailable(provider->locate()));
}
