#include <Nimbus/Utils/ArgumentParser.hpp>
#include <Nimbus/Utils/Error.hpp>
#include <Nimbus/Utils/Logging.hpp>
#include <Nimbus/Utils/Types.hpp>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

using namespace testing;
using namespace nimbus::utils::types;
using nimbus::utils::argparse::ArgumentParser;
using nimbus::utils::argparse::ParseOutcome;
using nimbus::utils::logging::LogLevel;
using enum nimbus::utils::error::NimbusErrorCode;

class ArgumentParserTest : public Test {
 protected:
  ArgumentParser m_parser { "nimbus", "1.2.3" };

  fn SetUp() -> void override {
    m_parser.addArguments("--city").help("City name");
    m_parser.addArguments("--here").help("Use the current location").flag();
    m_parser.addArguments("--log-level").help("Minimum log level").defaultValue(LogLevel::Off);
  }
};

TEST_F(ArgumentParserTest, NoArgumentsRunsWithDefaults) {
  const Result<ParseOutcome> outcome = m_parser.parseArgs(Vec<String> { "nimbus" });

  ASSERT_TRUE(outcome);
  EXPECT_EQ(*outcome, ParseOutcome::Run);
  EXPECT_FALSE(m_parser.get<bool>("--here"));
  EXPECT_FALSE(m_parser.getOptional("--city"));
  EXPECT_EQ(m_parser.getEnum<LogLevel>("--log-level"), LogLevel::Off);
}

TEST_F(ArgumentParserTest, ValueAndFlag) {
  ASSERT_TRUE(m_parser.parseArgs(Vec<String> { "nimbus", "--city", "New York", "--here" }));

  EXPECT_EQ(m_parser.getOptional("--city"), "New York");
  EXPECT_TRUE(m_parser.get<bool>("--here"));
  EXPECT_TRUE(m_parser.isUsed("--here"));
}

TEST_F(ArgumentParserTest, InlineValue) {
  ASSERT_TRUE(m_parser.parseArgs(Vec<String> { "nimbus", "--city=Sao Paulo" }));

  EXPECT_EQ(m_parser.get("--city"), "Sao Paulo");
}

TEST_F(ArgumentParserTest, EnumValueIsCaseInsensitive) {
  ASSERT_TRUE(m_parser.parseArgs(Vec<String> { "nimbus", "--log-level", "warn" }));

  EXPECT_EQ(m_parser.getEnum<LogLevel>("--log-level"), LogLevel::Warn);
}

TEST_F(ArgumentParserTest, InvalidEnumValue) {
  const Result<ParseOutcome> outcome = m_parser.parseArgs(Vec<String> { "nimbus", "--log-level", "loud" });

  ASSERT_FALSE(outcome);
  EXPECT_EQ(outcome.error().code, InvalidArgument);
  EXPECT_THAT(outcome.error().message, HasSubstr("Allowed values"));
}

TEST_F(ArgumentParserTest, UnknownArgument) {
  const Result<ParseOutcome> outcome = m_parser.parseArgs(Vec<String> { "nimbus", "--town", "Paris" });

  ASSERT_FALSE(outcome);
  EXPECT_EQ(outcome.error().code, InvalidArgument);
  EXPECT_EQ(outcome.error().message, "Unknown argument: --town");
}

TEST_F(ArgumentParserTest, MissingValue) {
  const Result<ParseOutcome> outcome = m_parser.parseArgs(Vec<String> { "nimbus", "--city" });

  ASSERT_FALSE(outcome);
  EXPECT_EQ(outcome.error().message, "Argument --city requires a value");
}

TEST_F(ArgumentParserTest, FlagRejectsInlineValue) {
  EXPECT_FALSE(m_parser.parseArgs(Vec<String> { "nimbus", "--here=yes" }));
}

TEST_F(ArgumentParserTest, HelpAndVersion) {
  EXPECT_EQ(m_parser.parseArgs(Vec<String> { "nimbus", "--help" }), ParseOutcome::ShowHelp);
  EXPECT_EQ(m_parser.parseArgs(Vec<String> { "nimbus", "-v" }), ParseOutcome::ShowVersion);
  EXPECT_EQ(m_parser.version(), "1.2.3");
}

TEST_F(ArgumentParserTest, HelpTextListsArguments) {
  const String help = m_parser.helpText();

  EXPECT_THAT(help, StartsWith("Usage: nimbus"));
  EXPECT_THAT(help, HasSubstr("--city VALUE"));
  EXPECT_THAT(help, HasSubstr("Use the current location"));
  EXPECT_THAT(help, HasSubstr("--log-level"));
}
