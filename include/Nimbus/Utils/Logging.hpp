#pragma once

#include <chrono>                 // std::chrono::{steady_clock, system_clock, duration}
#include <cstdio>                 // stderr
#include <ctime>                  // localtime_r/s, strftime, time_t, tm
#include <filesystem>             // std::filesystem::path
#include <format>                 // std::format
#include <fstream>                // std::ofstream
#include <ftxui/screen/color.hpp> // ftxui::Color
#include <utility>                // std::forward

#ifdef __cpp_lib_print
  #include <print> // std::print
#else
  #include <iostream> // std::cout, std::cerr
#endif

#include <source_location> // std::source_location

#include "Error.hpp"
#include "Types.hpp"

namespace nimbus::utils::logging {
  namespace {
    using types::Array;
    using types::Err;
    using types::Exception;
    using types::LockGuard;
    using types::Mutex;
    using types::Option;
    using types::PCStr;
    using types::Result;
    using types::String;
    using types::StringView;
    using types::u8;
    using types::Unit;
    using types::usize;
  } // namespace

  inline fn GetLogMutex() -> Mutex& {
    static Mutex LogMutexInstance;
    return LogMutexInstance;
  }

  struct LogLevelConst {
    // clang-format off
    static constexpr Array<StringView, 16> COLOR_CODE_LITERALS = {
      "\033[38;5;0m",  "\033[38;5;1m",  "\033[38;5;2m",  "\033[38;5;3m",
      "\033[38;5;4m",  "\033[38;5;5m",  "\033[38;5;6m",  "\033[38;5;7m",
      "\033[38;5;8m",  "\033[38;5;9m",  "\033[38;5;10m", "\033[38;5;11m",
      "\033[38;5;12m", "\033[38;5;13m", "\033[38;5;14m", "\033[38;5;15m",
    };
    // clang-format on

    static constexpr PCStr RESET_CODE   = "\033[0m";
    static constexpr PCStr BOLD_START   = "\033[1m";
    static constexpr PCStr BOLD_END     = "\033[22m";
    static constexpr PCStr ITALIC_START = "\033[3m";
    static constexpr PCStr ITALIC_END   = "\033[23m";

    static constexpr StringView DEBUG_STR = "DEBUG";
    static constexpr StringView INFO_STR  = "INFO ";
    static constexpr StringView WARN_STR  = "WARN ";
    static constexpr StringView ERROR_STR = "ERROR";

    static constexpr ftxui::Color::Palette16 DEBUG_COLOR      = ftxui::Color::Palette16::Cyan;
    static constexpr ftxui::Color::Palette16 INFO_COLOR       = ftxui::Color::Palette16::Green;
    static constexpr ftxui::Color::Palette16 WARN_COLOR       = ftxui::Color::Palette16::Yellow;
    static constexpr ftxui::Color::Palette16 ERROR_COLOR      = ftxui::Color::Palette16::Red;
    static constexpr ftxui::Color::Palette16 DEBUG_INFO_COLOR = ftxui::Color::Palette16::GrayLight;

    static constexpr PCStr TIMESTAMP_FORMAT = "%X";
    static constexpr PCStr LOG_FORMAT       = "{} {} {}";

#ifndef NDEBUG
    static constexpr PCStr FILE_LINE_FORMAT  = "{}:{}";
    static constexpr PCStr DEBUG_LINE_PREFIX = "           ╰──── ";
#endif
  };

  /**
   * @enum LogLevel
   * @brief Represents different log levels.
   *
   * `Off` is only ever used as a threshold; nothing is logged at that level.
   */
  enum class LogLevel : u8 {
    Debug,
    Info,
    Warn,
    Error,
    Off,
  };

  inline fn GetRuntimeLogLevel() -> LogLevel& {
    static LogLevel RuntimeLogLevel = LogLevel::Off;
    return RuntimeLogLevel;
  }

  inline fn SetRuntimeLogLevel(const LogLevel level) -> Unit {
    GetRuntimeLogLevel() = level;
  }

  inline fn GetLogFile() -> Option<std::ofstream>& {
    static Option<std::ofstream> LogFile;
    return LogFile;
  }

  /**
   * @brief Mirrors every log line (without ANSI styling) into a file.
   * @param path The file to append to. It is created if it does not exist.
   * @return An error if the file could not be opened.
   */
  inline fn SetLogFile(const std::filesystem::path& path) -> Result<> {
    const LockGuard lock(GetLogMutex());

    std::ofstream file(path, std::ios::app);

    if (!file)
      ERR_FMT(error::NimbusErrorCode::IoError, "Failed to open log file '{}'", path.string());

    GetLogFile() = std::move(file);

    return {};
  }

  inline fn CloseLogFile() -> Unit {
    const LockGuard lock(GetLogMutex());
    GetLogFile().reset();
  }

  /**
   * @brief Directly applies ANSI color codes to text
   * @param text The text to colorize
   * @param color The FTXUI color
   * @return Styled string with ANSI codes
   */
  inline fn Colorize(const StringView text, const ftxui::Color::Palette16& color) -> String {
    return std::format("{}{}{}", LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<usize>(color)), text, LogLevelConst::RESET_CODE);
  }

  /**
   * @brief Make text bold with ANSI codes
   * @param text The text to make bold
   * @return Bold text
   */
  inline fn Bold(const StringView text) -> String {
    return std::format("{}{}{}", LogLevelConst::BOLD_START, text, LogLevelConst::BOLD_END);
  }

  /**
   * @brief Make text italic with ANSI codes
   * @param text The text to make italic
   * @return Italic text
   */
  inline fn Italic(const StringView text) -> String {
    return std::format("{}{}{}", LogLevelConst::ITALIC_START, text, LogLevelConst::ITALIC_END);
  }

  /**
   * @brief Returns the pre-formatted and styled log level strings.
   * @note Uses function-local static for lazy initialization to avoid
   * static initialization order issues.
   */
  inline fn GetLevelInfo() -> const Array<String, 4>& {
    static const Array<String, 4> LEVEL_INFO_INSTANCE = {
      Bold(Colorize(LogLevelConst::DEBUG_STR, LogLevelConst::DEBUG_COLOR)),
      Bold(Colorize(LogLevelConst::INFO_STR, LogLevelConst::INFO_COLOR)),
      Bold(Colorize(LogLevelConst::WARN_STR, LogLevelConst::WARN_COLOR)),
      Bold(Colorize(LogLevelConst::ERROR_STR, LogLevelConst::ERROR_COLOR)),
    };
    return LEVEL_INFO_INSTANCE;
  }

  /**
   * @brief Returns string representation of a log level
   * @param level The log level
   * @return String representation
   */
  constexpr fn GetLevelString(const LogLevel level) -> StringView {
    using namespace matchit;
    using enum LogLevel;

    return match(level)(
      is | Debug = LogLevelConst::DEBUG_STR,
      is | Info  = LogLevelConst::INFO_STR,
      is | Warn  = LogLevelConst::WARN_STR,
      is | Error = LogLevelConst::ERROR_STR,
      is | _     = StringView("OFF  ")
    );
  }

  /**
   * @brief Helper function to print formatted text to stdout.
   * @tparam Args Parameter pack for format arguments
   * @param fmt The format string
   * @param args The arguments for the format string
   */
  template <typename... Args>
  inline fn Print(std::format_string<Args...> fmt, Args&&... args) -> Unit {
#ifdef __cpp_lib_print
    std::print(fmt, std::forward<Args>(args)...);
#else
    std::cout << std::format(fmt, std::forward<Args>(args)...);
#endif
  }

  inline fn Print(const StringView text) -> Unit {
#ifdef __cpp_lib_print
    std::print("{}", text);
#else
    std::cout << text;
#endif
  }

  template <typename... Args>
  inline fn Println(std::format_string<Args...> fmt, Args&&... args) -> Unit {
#ifdef __cpp_lib_print
    std::println(fmt, std::forward<Args>(args)...);
#else
    std::cout << std::format(fmt, std::forward<Args>(args)...) << '\n';
#endif
  }

  inline fn Println(const StringView text) -> Unit {
#ifdef __cpp_lib_print
    std::println("{}", text);
#else
    std::cout << text << '\n';
#endif
  }

  inline fn Println() -> Unit {
#ifdef __cpp_lib_print
    std::println();
#else
    std::cout << '\n';
#endif
  }

  /**
   * @brief Writes pre-formatted text to stderr. Log output never goes to stdout,
   * which is reserved for the weather report.
   */
  inline fn PrintErr(const StringView text) -> Unit {
#ifdef __cpp_lib_print
    std::print(stderr, "{}", text);
#else
    std::cerr << text;
#endif
  }

  inline fn FormatTimestamp() -> String {
    using namespace std::chrono;

    const auto        nowTp = system_clock::now();
    const std::time_t nowTt = system_clock::to_time_t(nowTp);
    std::tm           localTm {};

#ifdef _WIN32
    if (localtime_s(&localTm, &nowTt) != 0)
#else
    if (localtime_r(&nowTt, &localTm) == nullptr)
#endif
      return "??:??:??";

    Array<char, 64> timeBuffer {};

    if (std::strftime(timeBuffer.data(), timeBuffer.size(), LogLevelConst::TIMESTAMP_FORMAT, &localTm) == 0)
      return "??:??:??";

    return timeBuffer.data();
  }

  /**
   * @brief Logs a message with the specified log level, source location, and format string.
   * @tparam Args Parameter pack for format arguments.
   * @param level The log level (DEBUG, INFO, WARN, ERROR).
   * @param loc The source location of the log message.
   * @param fmt The format string.
   * @param args The arguments for the format string.
   */
  template <typename... Args>
  fn LogImpl(const LogLevel level, [[maybe_unused]] const std::source_location& loc, std::format_string<Args...> fmt, Args&&... args) -> Unit {
    using std::filesystem::path;

    if (level < GetRuntimeLogLevel() || level == LogLevel::Off)
      return;

    const LockGuard lock(GetLogMutex());

    const String timestamp = FormatTimestamp();
    const String message   = std::format(fmt, std::forward<Args>(args)...);

    String consoleLine = std::format(
      LogLevelConst::LOG_FORMAT,
      Colorize(std::format("[{}]", timestamp), LogLevelConst::DEBUG_INFO_COLOR),
      GetLevelInfo().at(static_cast<usize>(level)),
      message
    );

#ifndef NDEBUG
    const String fileLine = std::format(LogLevelConst::FILE_LINE_FORMAT, path(loc.file_name()).lexically_normal().string(), loc.line());

    consoleLine += '\n';
    consoleLine += Italic(Colorize(std::format("{}{}", LogLevelConst::DEBUG_LINE_PREFIX, fileLine), LogLevelConst::DEBUG_INFO_COLOR));
#endif

    consoleLine += LogLevelConst::RESET_CODE;
    consoleLine += '\n';

    PrintErr(consoleLine);

    if (Option<std::ofstream>& file = GetLogFile(); file && *file)
      *file << std::format("[{}] {} {}\n", timestamp, GetLevelString(level), message) << std::flush;
  }

  template <typename ErrorType>
  fn LogError(const LogLevel level, const ErrorType& error_obj) -> Unit {
    using DecayedErrorType = std::decay_t<ErrorType>;

    std::source_location logLocation;
    String               errorMessagePart;

    if constexpr (std::is_same_v<DecayedErrorType, error::NimbusError>) {
      logLocation      = error_obj.location;
      errorMessagePart = std::format("{} ({})", error_obj.message, error_obj.code);
    } else {
      logLocation = std::source_location::current();

      if constexpr (std::is_base_of_v<std::exception, DecayedErrorType>)
        errorMessagePart = error_obj.what();
      else if constexpr (requires { error_obj.message; })
        errorMessagePart = error_obj.message;
      else
        errorMessagePart = "Unknown error type logged";
    }

    LogImpl(level, logLocation, "{}", errorMessagePart);
  }

  /**
   * @class ScopedTimer
   * @brief Logs the start of an operation and, on destruction, how long it took.
   */
  class ScopedTimer {
   public:
    explicit ScopedTimer(String operation, const std::source_location& loc = std::source_location::current())
      : m_operation(std::move(operation)), m_location(loc), m_start(std::chrono::steady_clock::now()) {
      LogImpl(LogLevel::Debug, m_location, "Starting {}", m_operation);
    }

    ~ScopedTimer() {
      const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - m_start;

      // A throw escaping a destructor terminates; fall back to the raw stream.
      try {
        LogImpl(LogLevel::Debug, m_location, "Completed {} in {:.3f}s", m_operation, elapsed.count());
      } catch (const Exception& e) {
        std::fputs("ScopedTimer: failed to log completion: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputc('\n', stderr);
      }
    }

    ScopedTimer(const ScopedTimer&)                = delete;
    ScopedTimer(ScopedTimer&&)                     = delete;
    fn operator=(const ScopedTimer&)->ScopedTimer& = delete;
    fn operator=(ScopedTimer&&)->ScopedTimer&      = delete;

   private:
    String                                m_operation;
    std::source_location                  m_location;
    std::chrono::steady_clock::time_point m_start;
  };

#define debug_at(error_obj) ::nimbus::utils::logging::LogError(::nimbus::utils::logging::LogLevel::Debug, error_obj)
#define info_at(error_obj)  ::nimbus::utils::logging::LogError(::nimbus::utils::logging::LogLevel::Info, error_obj)
#define warn_at(error_obj)  ::nimbus::utils::logging::LogError(::nimbus::utils::logging::LogLevel::Warn, error_obj)
#define error_at(error_obj) ::nimbus::utils::logging::LogError(::nimbus::utils::logging::LogLevel::Error, error_obj)

#define debug_log(fmt, ...) \
  ::nimbus::utils::logging::LogImpl(::nimbus::utils::logging::LogLevel::Debug, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
#define info_log(fmt, ...) \
  ::nimbus::utils::logging::LogImpl(::nimbus::utils::logging::LogLevel::Info, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
#define warn_log(fmt, ...) \
  ::nimbus::utils::logging::LogImpl(::nimbus::utils::logging::LogLevel::Warn, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
#define error_log(fmt, ...) \
  ::nimbus::utils::logging::LogImpl(::nimbus::utils::logging::LogLevel::Error, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
} // namespace nimbus::utils::logging
