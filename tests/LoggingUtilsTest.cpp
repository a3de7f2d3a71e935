#include <filesystem> // std::filesystem::{path, temp_directory_path, remove}
#include <fstream>    // std::ifstream
#include <ios>        // std::ios
#include <sstream>    // std::stringstream

#include <Nimbus/Utils/Error.hpp>
#include <Nimbus/Utils/Logging.hpp>
#include <Nimbus/Utils/Types.hpp>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

using namespace testing;
using namespace nimbus::utils::logging;
using nimbus::utils::error::NimbusError;
using nimbus::utils::types::Result;
using nimbus::utils::types::String;
using nimbus::utils::types::StringView;
using enum nimbus::utils::error::NimbusErrorCode;

namespace fs = std::filesystem;

class LoggingUtilsTest : public Test {
 protected:
  fs::path m_logFile = fs::temp_directory_path() / "nimbus_logging_test.log";

  fn SetUp() -> void override {
    std::error_code errc;
    fs::remove(m_logFile, errc);
  }

  fn TearDown() -> void override {
    CloseLogFile();
    SetRuntimeLogLevel(LogLevel::Off);

    std::error_code errc;
    fs::remove(m_logFile, errc);
  }

  [[nodiscard]] fn readLog() const -> String {
    std::ifstream     file(m_logFile);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
  }
};

TEST_F(LoggingUtilsTest, Colorize_WrapsWithPaletteCode) {
  const StringView              text  = "Hello, Red World!";
  const ftxui::Color::Palette16 color = ftxui::Color::Palette16::Red;

  EXPECT_EQ(Colorize(text, color), String(LogLevelConst::COLOR_CODE_LITERALS.at(color)) + String(text) + LogLevelConst::RESET_CODE);
}

TEST_F(LoggingUtilsTest, Colorize_EmptyText) {
  const ftxui::Color::Palette16 color = ftxui::Color::Palette16::Green;

  EXPECT_EQ(Colorize("", color), String(LogLevelConst::COLOR_CODE_LITERALS.at(color)) + LogLevelConst::RESET_CODE);
}

TEST_F(LoggingUtilsTest, Bold_And_Italic) {
  EXPECT_EQ(Bold("x"), String(LogLevelConst::BOLD_START) + "x" + LogLevelConst::BOLD_END);
  EXPECT_EQ(Italic("y"), String(LogLevelConst::ITALIC_START) + "y" + LogLevelConst::ITALIC_END);
}

TEST_F(LoggingUtilsTest, Combined_BoldItalicColor) {
  const ftxui::Color::Palette16 color = ftxui::Color::Palette16::Magenta;

  const String inner    = String(LogLevelConst::ITALIC_START) + "Styled" + LogLevelConst::ITALIC_END;
  const String bold     = String(LogLevelConst::BOLD_START) + inner + LogLevelConst::BOLD_END;
  const String expected = String(LogLevelConst::COLOR_CODE_LITERALS.at(color)) + bold + LogLevelConst::RESET_CODE;

  EXPECT_EQ(Colorize(Bold(Italic("Styled")), color), expected);
}

TEST_F(LoggingUtilsTest, LevelStrings) {
  EXPECT_EQ(GetLevelString(LogLevel::Debug), "DEBUG");
  EXPECT_EQ(GetLevelString(LogLevel::Warn), "WARN ");
  EXPECT_EQ(GetLevelString(LogLevel::Error), "ERROR");
}

TEST_F(LoggingUtilsTest, FileMirrorRespectsRuntimeLevel) {
  ASSERT_TRUE(SetLogFile(m_logFile));
  SetRuntimeLogLevel(LogLevel::Warn);

  debug_log("hidden debug line");
  info_log("hidden info line");
  warn_log("visible warning {}", 42);
  error_at(NimbusError(NetworkError, "visible error"));

  CloseLogFile();

  const String contents = readLog();

  EXPECT_THAT(contents, Not(HasSubstr("hidden")));
  EXPECT_THAT(contents, HasSubstr("WARN  visible warning 42"));
  EXPECT_THAT(contents, HasSubstr("ERROR visible error (NetworkError)"));
  EXPECT_THAT(contents, Not(HasSubstr("\033[")));
}

TEST_F(LoggingUtilsTest, OffSilencesEverything) {
  ASSERT_TRUE(SetLogFile(m_logFile));
  SetRuntimeLogLevel(LogLevel::Off);

  error_log("should not appear");

  CloseLogFile();

  EXPECT_TRUE(readLog().empty());
}

TEST_F(LoggingUtilsTest, ScopedTimerLogsStartAndCompletion) {
  ASSERT_TRUE(SetLogFile(m_logFile));
  SetRuntimeLogLevel(LogLevel::Debug);

  {
    const ScopedTimer timer("weather lookup for city Paris");
  }

  CloseLogFile();

  const String contents = readLog();

  EXPECT_THAT(contents, HasSubstr("Starting weather lookup for city Paris"));
  EXPECT_THAT(contents, HasSubstr("Completed weather lookup for city Paris in "));
}

TEST_F(LoggingUtilsTest, SetLogFileFailsForUnwritablePath) {
  const Result<> result = SetLogFile(m_logFile / "no" / "such" / "dir.log");

  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code, IoError);
}

#ifdef __linux__
TEST_F(LoggingUtilsTest, ScopedTimerSurvivesFailingLogWrite) {
  // Every write to /dev/full fails with ENOSPC.
  ASSERT_TRUE(SetLogFile("/dev/full"));
  SetRuntimeLogLevel(LogLevel::Debug);

  {
    const ScopedTimer timer("write to a full device");

    GetLogFile()->clear();
    GetLogFile()->exceptions(std::ios::badbit);
  }

  // Reaching this point means the completion write threw and was contained.
  ASSERT_TRUE(GetLogFile().has_value());
  EXPECT_TRUE(GetLogFile()->bad());
}
#endif
