#include "UI.hpp"

#include <algorithm>   // std::{max, ranges::max}
#include <cctype>      // std::{isalpha, tolower, toupper}
#include <format>      // std::format
#include <matchit.hpp> // matchit::{match, is, or_, _}

namespace nimbus::ui {
  namespace {
    using namespace matchit;
    using enum utils::error::NimbusErrorCode;

    using core::location::City;
    using core::location::Coordinates;

    using utils::types::Array;
    using utils::types::Option;
    using utils::types::u8;
    using utils::types::Vec;

    using Art = Array<StringView, 5>;

    // clang-format off
    constexpr Art CLEAR_DAY        = { "    \\   |   /    ", "     .-.-.-.     ", "  .- (  ☀️  ) -. ", "     '-'-'-'     ", "    /   |   \\    " };
    constexpr Art CLEAR_NIGHT      = { "     *   *       ", "   *             ", "       🌙        ", "   *        *    ", "     *   *       " };
    constexpr Art FEW_CLOUDS_DAY   = { "    \\  |  /      ", " .-.  ☀️  .-.    ", "(   ☁️☁️☁️   )   ", " '-'     '-'     ", "                 " };
    constexpr Art FEW_CLOUDS_NIGHT = { "  *   🌙    *   ", " .-.      .-.   ", "(   ☁️☁️☁️   )  ", " '-'     '-'    ", "   *        *   " };
    constexpr Art SCATTERED_CLOUDS = { "     .-.-.       ", "   ☁️(     )☁️  ", "  ( ☁️☁️☁️☁️ )  ", "   '-☁️☁️☁️-'   ", "     '-'-'       " };
    constexpr Art BROKEN_CLOUDS    = { "   ☁️☁️☁️☁️☁️    ", " ☁️☁️☁️☁️☁️☁️☁️  ", "☁️☁️☁️☁️☁️☁️☁️☁️ ", " ☁️☁️☁️☁️☁️☁️☁️  ", "   ☁️☁️☁️☁️☁️    " };
    constexpr Art SHOWER_RAIN      = { "     .-.-.       ", "   ☁️(     )☁️  ", "  ( ☁️☁️☁️☁️ )  ", "   '☔☔☔☔☔'  ", "    💧💧💧💧     " };
    constexpr Art RAIN_DAY         = { "    \\  |  /      ", " .-.  ☀️  .-.    ", "(   ☁️☁️☁️   )   ", "  '🌧️🌧️🌧️🌧️'  ", "   💧💧💧💧      " };
    constexpr Art RAIN_NIGHT       = { "     .-.-.       ", "   ☁️(     )☁️  ", "  ( ☁️☁️☁️☁️ )  ", "  '🌧️🌧️🌧️🌧️'  ", "   💧💧💧💧      " };
    constexpr Art THUNDERSTORM     = { "   ☁️☁️☁️☁️☁️    ", " ☁️☁️⛈️⛈️☁️☁️   ", "☁️⚡☁️☁️⚡☁️☁️   ", " '🌧️⚡🌧️⚡🌧️'  ", "   💧⚡💧⚡💧    " };
    constexpr Art SNOW             = { "     .-.-.       ", "   ☁️(     )☁️  ", "  ( ☁️☁️☁️☁️ )  ", "   '❄️❄️❄️❄️'   ", "    ❄️❄️❄️❄️     " };
    constexpr Art MIST             = { "  ≋≋≋≋≋≋≋≋≋≋≋≋   ", " ≋≋≋≋≋≋≋≋≋≋≋≋≋≋  ", "≋≋≋≋≋≋≋≋≋≋≋≋≋≋≋≋ ", " ≋≋≋≋≋≋≋≋≋≋≋≋≋≋  ", "  ≋≋≋≋≋≋≋≋≋≋≋≋   " };
    constexpr Art UNKNOWN          = { "     ????        ", "   ????????      ", " ????????????    ", "   ????????      ", "     ????        " };
    // clang-format on

    constexpr StringView SEPARATOR = " │ ";

    constexpr fn IsWideCharacter(char32_t codepoint) -> bool {
      return (codepoint >= 0x1100 && codepoint <= 0x115F) || // Hangul Jamo
        (codepoint >= 0x2E80 && codepoint <= 0x303E) ||      // CJK Radicals through CJK Symbols and Punctuation
        (codepoint >= 0x3041 && codepoint <= 0x33FF) ||      // Hiragana through CJK Compatibility
        (codepoint >= 0x3400 && codepoint <= 0x4DBF) ||      // CJK Unified Ideographs Extension A
        (codepoint >= 0x4E00 && codepoint <= 0x9FFF) ||      // CJK Unified Ideographs
        (codepoint >= 0xA000 && codepoint <= 0xA4CF) ||      // Yi
        (codepoint >= 0xAC00 && codepoint <= 0xD7A3) ||      // Hangul Syllables
        (codepoint >= 0xF900 && codepoint <= 0xFAFF) ||      // CJK Compatibility Ideographs
        (codepoint >= 0xFE30 && codepoint <= 0xFE6F) ||      // CJK Compatibility Forms
        (codepoint >= 0xFF00 && codepoint <= 0xFF60) ||      // Fullwidth Forms
        (codepoint >= 0xFFE0 && codepoint <= 0xFFE6) ||      // Fullwidth Forms
        (codepoint >= 0x1F300 && codepoint <= 0x1F64F) ||    // Misc Symbols and Pictographs, Emoticons
        (codepoint >= 0x1F900 && codepoint <= 0x1F9FF) ||    // Supplemental Symbols and Pictographs
        (codepoint >= 0x20000 && codepoint <= 0x3FFFD);      // CJK Unified Ideographs Extension B onwards
    }

    constexpr fn DecodeUTF8(const StringView str, usize& pos) -> char32_t {
      if (pos >= str.length())
        return 0;

      const fn getByte = [&](usize index) -> u8 {
        return static_cast<u8>(str[index]);
      };

      const u8 first = getByte(pos++);

      if ((first & 0x80) == 0) // 0xxxxxxx
        return first;

      if ((first & 0xE0) == 0xC0) {
        // 110xxxxx 10xxxxxx
        if (pos >= str.length())
          return 0;

        const u8 second = getByte(pos++);

        return ((first & 0x1F) << 6) | (second & 0x3F);
      }

      if ((first & 0xF0) == 0xE0) {
        // 1110xxxx 10xxxxxx 10xxxxxx
        if (pos + 1 >= str.length())
          return 0;

        const u8 second = getByte(pos++);
        const u8 third  = getByte(pos++);

        return ((first & 0x0F) << 12) | ((second & 0x3F) << 6) | (third & 0x3F);
      }

      if ((first & 0xF8) == 0xF0) {
        // 11110xxx 10xxxxxx 10xxxxxx 10xxxxxx
        if (pos + 2 >= str.length())
          return 0;

        const u8 second = getByte(pos++);
        const u8 third  = getByte(pos++);
        const u8 fourth = getByte(pos++);

        return ((first & 0x07) << 18) | ((second & 0x3F) << 12) | ((third & 0x3F) << 6) | (fourth & 0x3F);
      }

      return 0;
    }

    fn SplitLines(StringView text) -> Vec<StringView> {
      constexpr StringView WHITESPACE = " \t\r\n";

      const usize begin = text.find_first_not_of(WHITESPACE);

      if (begin == StringView::npos)
        return { StringView {} };

      text = text.substr(begin, text.find_last_not_of(WHITESPACE) - begin + 1);

      Vec<StringView> lines;

      for (usize start = 0;;) {
        const usize end = text.find('\n', start);

        lines.emplace_back(text.substr(start, end == StringView::npos ? StringView::npos : end - start));

        if (end == StringView::npos)
          break;

        start = end + 1;
      }

      return lines;
    }

    fn PlaceName(const Location& location) -> String {
      if (const Option<Coordinates> coords = location.coordinates())
        return std::format("coordinates {:.2f}, {:.2f}", coords->latitude, coords->longitude);

      const Option<City> city = location.city();

      return city ? city->name : String {};
    }
  } // namespace

  fn GetVisualWidth(const StringView str) -> usize {
    usize width    = 0;
    bool  inEscape = false;
    usize pos      = 0;

    while (pos < str.length()) {
      const char current = str[pos];

      if (inEscape) {
        inEscape = (current != 'm');
        pos++;
      } else if (current == '\033') {
        inEscape = true;
        pos++;
      } else {
        const char32_t codepoint = DecodeUTF8(str, pos);

        // Variation selectors and joiners take no column of their own.
        if (codepoint == 0 || codepoint == 0x200D || (codepoint >= 0xFE00 && codepoint <= 0xFE0F))
          continue;

        width += IsWideCharacter(codepoint) ? 2 : 1;
      }
    }

    return width;
  }

  fn TitleCase(const StringView text) -> String {
    String result;
    result.reserve(text.size());

    bool startOfWord = true;

    for (const char chr : text) {
      const auto byte = static_cast<unsigned char>(chr);

      if (std::isalpha(byte)) {
        result.push_back(static_cast<char>(startOfWord ? std::toupper(byte) : std::tolower(byte)));
        startOfWord = false;
      } else {
        result.push_back(chr);
        startOfWord = true;
      }
    }

    return result;
  }

  fn GetWeatherArt(const StringView icon) -> Span<const StringView> {
    const Art* art = match(icon)(
      is | "01d"                = &CLEAR_DAY,
      is | "01n"                = &CLEAR_NIGHT,
      is | "02d"                = &FEW_CLOUDS_DAY,
      is | "02n"                = &FEW_CLOUDS_NIGHT,
      is | or_("03d", "03n")    = &SCATTERED_CLOUDS,
      is | or_("04d", "04n")    = &BROKEN_CLOUDS,
      is | or_("09d", "09n")    = &SHOWER_RAIN,
      is | "10d"                = &RAIN_DAY,
      is | "10n"                = &RAIN_NIGHT,
      is | or_("11d", "11n")    = &THUNDERSTORM,
      is | or_("13d", "13n")    = &SNOW,
      is | or_("50d", "50n")    = &MIST,
      is | _                    = &UNKNOWN
    );

    return *art;
  }

  fn CombineWithArt(const StringView icon, const StringView text) -> String {
    const Span<const StringView> art       = GetWeatherArt(icon);
    const Vec<StringView>        textLines = SplitLines(text);
    const usize                  lineCount = std::max(art.size(), textLines.size());

    usize textWidth = 0;

    for (const StringView line : textLines)
      textWidth = std::max(textWidth, GetVisualWidth(line));

    String result;

    for (usize i = 0; i < lineCount; ++i) {
      const StringView textLine = i < textLines.size() ? textLines[i] : StringView {};
      const StringView artLine  = i < art.size() ? art[i] : StringView {};

      if (i > 0)
        result += '\n';

      result += textLine;
      result.append(textWidth - GetVisualWidth(textLine), ' ');
      result += SEPARATOR;
      result += artLine;
    }

    return result;
  }

  fn FormatWeatherText(const WeatherReport& report) -> String {
    return std::format(
      "Weather in {}, {}:\n"
      "Temperature: {}°C (feels like {}°C)\n"
      "Humidity: {}%\n"
      "Conditions: {}",
      report.name,
      report.country,
      report.temperature,
      report.feelsLike,
      report.humidity,
      TitleCase(report.description)
    );
  }

  fn RenderWeather(const WeatherReport& report) -> String {
    return CombineWithArt(report.icon, FormatWeatherText(report));
  }

  fn RenderLocationDetails(const LocationDetails& details) -> String {
    return std::format(
      "City: {}\n"
      "Region: {}\n"
      "Country: {} ({})\n"
      "Timezone: {}",
      details.city,
      details.region,
      details.country,
      details.countryCode,
      details.timezone
    );
  }

  fn MissingApiKeyMessage() -> String {
    return "Error: OpenWeather API key not found.\n"
           "Please set it in one of these ways:\n"
           "1. Environment variable: export OPENWEATHER_API_KEY=your_key\n"
           "2. Config file (config.toml):\n"
           "   [api.openweather]\n"
           "   key = \"your_api_key_here\"\n"
           "\n"
           "Get your free API key from: https://openweathermap.org/api";
  }

  fn LocationFailureMessage(const ResolutionSource source) -> String {
    if (source == ResolutionSource::CurrentLocation)
      return "Error: Could not determine current location. Try specifying a city with --city instead.";

    return "Error: Could not determine location.\n"
           "Either:\n"
           "1. Use --city 'City Name' to specify a city\n"
           "2. Configure a default city in config.toml:\n"
           "   [defaults]\n"
           "   city = \"Your City\"";
  }

  fn WeatherErrorMessage(const NimbusError& error, const Location& location) -> String {
    return match(error.code)(
      is | NotFound = [&]() -> String {
        if (const Option<Coordinates> coords = location.coordinates())
          return std::format("Error: No weather data found for coordinates {:.2f}, {:.2f}.", coords->latitude, coords->longitude);

        return std::format("Error: City '{}' not found.", PlaceName(location));
      },
      is | PermissionDenied                 = []() -> String { return "Error: Invalid API key."; },
      is | or_(NetworkError, Timeout)       = [&] { return std::format("Error: Network request failed for {} - {}", PlaceName(location), error.message); },
      is | _                                = [&] { return std::format("Error: {}", error.message); }
    );
  }
} // namespace nimbus::ui
