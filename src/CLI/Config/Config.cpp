#include "Config.hpp"

#include <format>          // std::format
#include <system_error>    // std::error_code
#include <toml++/toml.hpp> // toml::{parse_file, parse_error, node_view}

#include <Nimbus/Utils/Env.hpp>
#include <Nimbus/Utils/Logging.hpp>

namespace nimbus::config {
  namespace {
    using utils::error::NimbusError;
    using enum utils::error::NimbusErrorCode;

    using utils::types::Err;
    using utils::types::None;

    /**
     * @brief Reads a string value, treating an empty string as unset.
     */
    fn NonEmptyString(const toml::node_view<const toml::node> node) -> Option<String> {
      if (Option<String> value = node.value<String>(); value && !value->empty())
        return value;

      return None;
    }
  } // namespace

  fn Defaults::fromToml(const toml::table& tbl) -> Defaults {
    return { .city = NonEmptyString(tbl["city"]) };
  }

  fn OpenWeather::fromToml(const toml::table& tbl) -> OpenWeather {
    return { .key = NonEmptyString(tbl["key"]) };
  }

  fn Config::DefaultPath() -> fs::path {
    return fs::path(".") / "config.toml";
  }

  fn Config::FromToml(const toml::table& tbl, fs::path path, const bool hasFile) -> Config {
    Config config;

    config.m_path    = std::move(path);
    config.m_hasFile = hasFile;

    if (const toml::table* defaults = tbl["defaults"].as_table())
      config.m_defaults = Defaults::fromToml(*defaults);

    if (const toml::table* openWeather = tbl["api"]["openweather"].as_table())
      config.m_openWeather = OpenWeather::fromToml(*openWeather);

    return config;
  }

  fn Config::Load(const fs::path& path) -> Result<Config> {
    if (std::error_code errc; !fs::exists(path, errc) || errc) {
      debug_log("No config file at {}, using built-in defaults", path.string());
      return FromToml(toml::table {}, path, false);
    }

    try {
      const toml::table tbl = toml::parse_file(path.string());

      debug_log("Loaded config from {}", path.string());

      return FromToml(tbl, path, true);
    } catch (const toml::parse_error& err) {
      return Err(NimbusError(ConfigurationError, std::format("Error loading config from {}: {}", path.string(), err.description())));
    }
  }

  fn Config::defaultCity() const -> Option<String> {
    return m_defaults.city;
  }

  fn Config::apiKey() const -> Option<String> {
    if (utils::types::Result<String> env = utils::env::GetEnv(API_KEY_ENV))
      return *env;

    return m_openWeather.key;
  }
} // namespace nimbus::config
