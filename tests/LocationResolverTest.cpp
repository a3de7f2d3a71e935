#include <Nimbus/Core/Location.hpp>
#include <Nimbus/Core/LocationAcquirer.hpp>
#include <Nimbus/Core/LocationResolver.hpp>
#include <Nimbus/Utils/Error.hpp>
#include <Nimbus/Utils/Types.hpp>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

using namespace testing;
using namespace nimbus::utils::types;
using namespace nimbus::core::location;
using nimbus::core::acquirer::ILocationAcquirer;
using nimbus::core::resolver::ILocationDefaults;
using nimbus::core::resolver::LocationResolver;
using nimbus::core::resolver::ResolutionSource;
using nimbus::core::resolver::ResolvedLocation;
using enum nimbus::utils::error::NimbusErrorCode;

// NOLINTBEGIN(readability-identifier-naming)
class MockAcquirer : public ILocationAcquirer {
 public:
  MOCK_METHOD(AcquisitionResult, acquire, (), (const, override));
};

class MockDefaults : public ILocationDefaults {
 public:
  MOCK_METHOD(Option<String>, defaultCity, (), (const, override));
};
// NOLINTEND(readability-identifier-naming)

class LocationResolverTest : public Test {
 protected:
  NiceMock<MockAcquirer> m_acquirer;
  NiceMock<MockDefaults> m_defaults;
  LocationResolver       m_resolver { m_acquirer, m_defaults };

  static fn Found(const f64 lat, const f64 lon) -> AcquisitionResult {
    return Coordinates { .latitude = lat, .longitude = lon };
  }
};

TEST_F(LocationResolverTest, HereUsesAcquiredCoordinates) {
  EXPECT_CALL(m_acquirer, acquire()).WillOnce(Return(Found(51.5, -0.12)));

  const Result<ResolvedLocation> resolved = m_resolver.resolveWithSource(true, None);

  ASSERT_TRUE(resolved);
  EXPECT_EQ(resolved->location, Location::FromCoordinates(51.5, -0.12));
  EXPECT_EQ(resolved->source, ResolutionSource::CurrentLocation);
}

TEST_F(LocationResolverTest, HereWinsOverCityAndDefault) {
  EXPECT_CALL(m_acquirer, acquire()).WillOnce(Return(Found(40.0, -70.0)));
  EXPECT_CALL(m_defaults, defaultCity()).Times(0);

  const Result<Location> location = m_resolver.resolve(true, String("Paris"));

  ASSERT_TRUE(location);
  EXPECT_EQ(*location, Location::FromCoordinates(40.0, -70.0));
}

TEST_F(LocationResolverTest, HereFailureDoesNotFallBackToCity) {
  EXPECT_CALL(m_acquirer, acquire()).WillOnce(Return(Unavailable { "nothing" }));
  EXPECT_CALL(m_defaults, defaultCity()).Times(0);

  const Result<Location> location = m_resolver.resolve(true, String("Paris"));

  ASSERT_FALSE(location);
  EXPECT_EQ(location.error().code, Unresolved);
}

TEST_F(LocationResolverTest, CityArgumentSkipsAcquirer) {
  EXPECT_CALL(m_acquirer, acquire()).Times(0);
  EXPECT_CALL(m_defaults, defaultCity()).Times(0);

  const Result<ResolvedLocation> resolved = m_resolver.resolveWithSource(false, String("Tokyo"));

  ASSERT_TRUE(resolved);
  EXPECT_EQ(resolved->location, Location::FromCity("Tokyo"));
  EXPECT_EQ(resolved->source, ResolutionSource::CityArgument);
}

TEST_F(LocationResolverTest, DefaultCityUsedWhenNoArgument) {
  EXPECT_CALL(m_acquirer, acquire()).Times(0);
  EXPECT_CALL(m_defaults, defaultCity()).WillOnce(Return(Option<String>("Berlin")));

  const Result<ResolvedLocation> resolved = m_resolver.resolveWithSource(false, None);

  ASSERT_TRUE(resolved);
  EXPECT_EQ(resolved->location, Location::FromCity("Berlin"));
  EXPECT_EQ(resolved->source, ResolutionSource::DefaultCity);
}

TEST_F(LocationResolverTest, EmptyCityArgumentCountsAsAbsent) {
  EXPECT_CALL(m_defaults, defaultCity()).WillOnce(Return(Option<String>("Madrid")));

  const Result<Location> location = m_resolver.resolve(false, String(""));

  ASSERT_TRUE(location);
  EXPECT_EQ(*location, Location::FromCity("Madrid"));
}

TEST_F(LocationResolverTest, EmptyDefaultCityFallsThroughToAcquirer) {
  EXPECT_CALL(m_defaults, defaultCity()).WillOnce(Return(Option<String>("")));
  EXPECT_CALL(m_acquirer, acquire()).WillOnce(Return(Found(-33.87, 151.21)));

  const Result<ResolvedLocation> resolved = m_resolver.resolveWithSource(false, None);

  ASSERT_TRUE(resolved);
  EXPECT_EQ(resolved->source, ResolutionSource::Automatic);
  EXPECT_TRUE(resolved->location.isCoordinates());
}

TEST_F(LocationResolverTest, NothingConfiguredAcquiresAutomatically) {
  EXPECT_CALL(m_defaults, defaultCity()).WillOnce(Return(None));
  EXPECT_CALL(m_acquirer, acquire()).WillOnce(Return(Found(1.5, 2.5)));

  const Result<Location> location = m_resolver.resolve(false, None);

  ASSERT_TRUE(location);
  EXPECT_EQ(*location, Location::FromCoordinates(1.5, 2.5));
}

TEST_F(LocationResolverTest, NothingAvailableIsUnresolved) {
  EXPECT_CALL(m_defaults, defaultCity()).WillOnce(Return(None));
  EXPECT_CALL(m_acquirer, acquire()).WillOnce(Return(Unavailable { "all location methods failed" }));

  const Result<Location> location = m_resolver.resolve(false, None);

  ASSERT_FALSE(location);
  EXPECT_EQ(location.error().code, Unresolved);
  EXPECT_THAT(location.error().message, HasSubstr("Could not determine location"));
}

TEST_F(LocationResolverTest, AcquirerCalledAtMostOncePerResolution) {
  EXPECT_CALL(m_defaults, defaultCity()).WillRepeatedly(Return(None));
  EXPECT_CALL(m_acquirer, acquire()).Times(1).WillOnce(Return(Unavailable { "none" }));

  EXPECT_FALSE(m_resolver.resolve(false, None));
}
