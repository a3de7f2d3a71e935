#pragma once

#include <filesystem>            // std::filesystem::path
#include <toml++/impl/table.hpp> // toml::table

#include <Nimbus/Core/LocationResolver.hpp>
#include <Nimbus/Utils/Definitions.hpp>
#include <Nimbus/Utils/Error.hpp>
#include <Nimbus/Utils/Types.hpp>

namespace nimbus::config {
  namespace {
    using core::resolver::ILocationDefaults;

    using utils::types::Option;
    using utils::types::PCStr;
    using utils::types::Result;
    using utils::types::String;

    namespace fs = std::filesystem;
  } // namespace

  inline constexpr PCStr API_KEY_ENV = "OPENWEATHER_API_KEY";

  /**
   * @struct Defaults
   * @brief The [defaults] table.
   */
  struct Defaults {
    Option<String> city; ///< City used when neither --here nor --city is given.

    static fn fromToml(const toml::table& tbl) -> Defaults;
  };

  /**
   * @struct OpenWeather
   * @brief The [api.openweather] table.
   */
  struct OpenWeather {
    Option<String> key; ///< API key; OPENWEATHER_API_KEY takes precedence over this.

    static fn fromToml(const toml::table& tbl) -> OpenWeather;
  };

  /**
   * @class Config
   * @brief User configuration loaded from a TOML file (./config.toml by default).
   *
   * A missing file is not an error; every setting is then unset.
   */
  class Config {
   public:
    Config() = default;

    /**
     * @brief Builds a Config from an already-parsed TOML document.
     */
    static fn FromToml(const toml::table& tbl, fs::path path = DefaultPath(), bool hasFile = true) -> Config;

    /**
     * @brief Reads and parses the file at `path`.
     * @return ConfigurationError if the file exists but cannot be read or parsed.
     */
    static fn Load(const fs::path& path = DefaultPath()) -> Result<Config>;

    static fn DefaultPath() -> fs::path;

    /**
     * @brief The [defaults] city, or None if it is missing or empty.
     */
    [[nodiscard]] fn defaultCity() const -> Option<String>;

    /**
     * @brief The OpenWeatherMap API key from the environment, else from the file.
     */
    [[nodiscard]] fn apiKey() const -> Option<String>;

    [[nodiscard]] fn hasConfigFile() const -> bool {
      return m_hasFile;
    }

    [[nodiscard]] fn path() const -> const fs::path& {
      return m_path;
    }

   private:
    Defaults    m_defaults;
    OpenWeather m_openWeather;
    fs::path    m_path    = DefaultPath();
    bool        m_hasFile = false;
  };

  /**
   * @class ConfigLocationDefaults
   * @brief Exposes a Config's default city to the location resolver.
   */
  class ConfigLocationDefaults final : public ILocationDefaults {
   public:
    explicit ConfigLocationDefaults(const Config& config)
      : m_config(config) {}

    [[nodiscard]] fn defaultCity() const -> Option<String> override {
      return m_config.defaultCity();
    }

   private:
    const Config& m_config;
  };
} // namespace nimbus::config
