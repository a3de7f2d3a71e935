#pragma once

#include <Nimbus/Core/Location.hpp>
#include <Nimbus/Core/LocationResolver.hpp>
#include <Nimbus/Services/IpGeolocation.hpp>
#include <Nimbus/Services/Weather.hpp>
#include <Nimbus/Utils/Error.hpp>
#include <Nimbus/Utils/Types.hpp>

namespace nimbus::ui {
  namespace {
    using core::location::Location;
    using core::resolver::ResolutionSource;

    using services::ipgeo::LocationDetails;
    using services::weather::WeatherReport;

    using utils::error::NimbusError;
    using utils::types::Span;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::usize;
  } // namespace

  /**
   * @brief Number of terminal columns `str` occupies. ANSI color sequences count as zero.
   */
  [[nodiscard]] fn GetVisualWidth(StringView str) -> usize;

  /**
   * @brief Capitalizes the first letter of every word and lowercases the rest ("light rain" -> "Light Rain").
   */
  [[nodiscard]] fn TitleCase(StringView text) -> String;

  /**
   * @brief The five-line picture for an OpenWeatherMap icon code. Unknown codes get a row of question marks.
   */
  [[nodiscard]] fn GetWeatherArt(StringView icon) -> Span<const StringView>;

  /**
   * @brief Places `text` on the left and the picture for `icon` on the right, separated by " │ ".
   *
   * Text lines are padded to the widest one so the separator lines up.
   */
  [[nodiscard]] fn CombineWithArt(StringView icon, StringView text) -> String;

  /**
   * @brief The four-line summary of a report, without art.
   */
  [[nodiscard]] fn FormatWeatherText(const WeatherReport& report) -> String;

  /**
   * @brief The full rendering printed on success.
   */
  [[nodiscard]] fn RenderWeather(const WeatherReport& report) -> String;

  [[nodiscard]] fn RenderLocationDetails(const LocationDetails& details) -> String;

  [[nodiscard]] fn MissingApiKeyMessage() -> String;

  /**
   * @brief What to tell the user when no location could be resolved.
   *
   * --here gets a one-liner pointing at --city; the automatic path also suggests a default city.
   */
  [[nodiscard]] fn LocationFailureMessage(ResolutionSource source) -> String;

  /**
   * @brief What to tell the user when the weather lookup for `location` failed.
   */
  [[nodiscard]] fn WeatherErrorMessage(const NimbusError& error, const Location& location) -> String;
} // namespace nimbus::ui
