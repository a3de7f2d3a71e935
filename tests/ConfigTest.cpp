#include <filesystem>      // std::filesystem::{path, temp_directory_path, remove}
#include <fstream>         // std::ofstream
#include <toml++/toml.hpp> // toml::{parse_result, parse}

#include <Nimbus/Utils/Env.hpp>
#include <Nimbus/Utils/Error.hpp>
#include <Nimbus/Utils/Types.hpp>

#include "Config/Config.hpp"

#include "gtest/gtest.h"

using namespace nimbus::config;
using namespace nimbus::utils::types;
using nimbus::utils::env::SetEnv;
using nimbus::utils::env::UnsetEnv;
using enum nimbus::utils::error::NimbusErrorCode;

namespace fs = std::filesystem;

class ConfigTest : public testing::Test {
 protected:
  fs::path m_file = fs::temp_directory_path() / "nimbus_config_test.toml";

  fn SetUp() -> void override {
    UnsetEnv(API_KEY_ENV);
  }

  fn TearDown() -> void override {
    UnsetEnv(API_KEY_ENV);

    std::error_code errc;
    fs::remove(m_file, errc);
  }

  fn writeFile(const StringView contents) const -> Unit {
    std::ofstream out(m_file, std::ios::trunc);
    out << contents;
  }
};

TEST_F(ConfigTest, DefaultsFromToml_WithCity) {
  toml::parse_result tbl = toml::parse(R"(
    city = "London"
  )");

  ASSERT_TRUE(tbl.is_table());
  EXPECT_EQ(Defaults::fromToml(*tbl.as_table()).city, "London");
}

TEST_F(ConfigTest, DefaultsFromToml_EmptyCityIsUnset) {
  toml::parse_result tbl = toml::parse(R"(
    city = ""
  )");

  ASSERT_TRUE(tbl.is_table());
  EXPECT_FALSE(Defaults::fromToml(*tbl.as_table()).city);
}

TEST_F(ConfigTest, DefaultsFromToml_WrongTypeIsUnset) {
  toml::parse_result tbl = toml::parse(R"(
    city = 42
  )");

  ASSERT_TRUE(tbl.is_table());
  EXPECT_FALSE(Defaults::fromToml(*tbl.as_table()).city);
}

TEST_F(ConfigTest, FromToml_ReadsBothSections) {
  toml::parse_result tbl = toml::parse(R"(
    [defaults]
    city = "Paris"

    [api.openweather]
    key = "file-key"
  )");

  ASSERT_TRUE(tbl.is_table());

  const Config config = Config::FromToml(*tbl.as_table());

  EXPECT_EQ(config.defaultCity(), "Paris");
  EXPECT_EQ(config.apiKey(), "file-key");
}

TEST_F(ConfigTest, FromToml_EmptyDocument) {
  toml::parse_result tbl = toml::parse("");

  ASSERT_TRUE(tbl.is_table());

  const Config config = Config::FromToml(*tbl.as_table());

  EXPECT_FALSE(config.defaultCity());
  EXPECT_FALSE(config.apiKey());
}

TEST_F(ConfigTest, ApiKey_EnvironmentTakesPrecedence) {
  toml::parse_result tbl = toml::parse(R"(
    [api.openweather]
    key = "file-key"
  )");

  ASSERT_TRUE(tbl.is_table());

  const Config config = Config::FromToml(*tbl.as_table());

  SetEnv(API_KEY_ENV, "env-key");
  EXPECT_EQ(config.apiKey(), "env-key");

  UnsetEnv(API_KEY_ENV);
  EXPECT_EQ(config.apiKey(), "file-key");
}

TEST_F(ConfigTest, ApiKey_EmptyEnvironmentFallsBackToFile) {
  toml::parse_result tbl = toml::parse(R"(
    [api.openweather]
    key = "file-key"
  )");

  ASSERT_TRUE(tbl.is_table());

  SetEnv(API_KEY_ENV, "");
  EXPECT_EQ(Config::FromToml(*tbl.as_table()).apiKey(), "file-key");
}

TEST_F(ConfigTest, Load_MissingFileIsEmptyConfig) {
  const Result<Config> config = Config::Load(m_file);

  ASSERT_TRUE(config);
  EXPECT_FALSE(config->hasConfigFile());
  EXPECT_FALSE(config->defaultCity());
  EXPECT_EQ(config->path(), m_file);
}

TEST_F(ConfigTest, Load_ReadsFile) {
  writeFile("[defaults]\ncity = \"Berlin\"\n");

  const Result<Config> config = Config::Load(m_file);

  ASSERT_TRUE(config);
  EXPECT_TRUE(config->hasConfigFile());
  EXPECT_EQ(config->defaultCity(), "Berlin");
}

TEST_F(ConfigTest, Load_MalformedFileIsConfigurationError) {
  writeFile("[defaults\ncity = ");

  const Result<Config> config = Config::Load(m_file);

  ASSERT_FALSE(config);
  EXPECT_EQ(config.error().code, ConfigurationError);
}

TEST_F(ConfigTest, LocationDefaultsAdapter) {
  toml::parse_result tbl = toml::parse(R"(
    [defaults]
    city = "Rome"
  )");

  ASSERT_TRUE(tbl.is_table());

  const Config                 config = Config::FromToml(*tbl.as_table());
  const ConfigLocationDefaults defaults(config);

  EXPECT_EQ(defaults.defaultCity(), "Rome");
}
