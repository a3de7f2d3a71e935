/**
 * @file ArgumentParser.hpp
 * @brief Small command-line argument parser for Nimbus.
 *
 * Supports flags, single-value options and enum-valued options (via magic_enum).
 * Help and version requests are reported back to the caller instead of exiting.
 */

#pragma once

#include <algorithm>                 // std::ranges::{equal, transform}
#include <cctype>                    // std::tolower
#include <concepts>                  // std::convertible_to
#include <format>                    // std::format
#include <magic_enum/magic_enum.hpp> // magic_enum::{enum_name, enum_cast, enum_values}
#include <variant>                   // std::variant

#include "Error.hpp"
#include "Types.hpp"

namespace nimbus::utils::argparse {
  namespace {
    using error::NimbusError;
    using error::NimbusErrorCode;

    using types::Err;
    using types::Map;
    using types::Option;
    using types::Result;
    using types::Span;
    using types::String;
    using types::StringView;
    using types::u8;
    using types::UniquePointer;
    using types::usize;
    using types::Vec;
  } // namespace

  using ArgValue   = std::variant<bool, String>;
  using ArgChoices = Vec<String>;

  /**
   * @brief What the caller should do after a successful parse.
   */
  enum class ParseOutcome : u8 {
    Run,         ///< Proceed normally.
    ShowHelp,    ///< -h/--help was given; print helpText() and exit.
    ShowVersion, ///< -v/--version was given; print version() and exit.
  };

  inline fn EqualsIgnoreCase(const StringView lhs, const StringView rhs) -> bool {
    return std::ranges::equal(lhs, rhs, [](const char charA, const char charB) {
      return std::tolower(static_cast<unsigned char>(charA)) == std::tolower(static_cast<unsigned char>(charB));
    });
  }

  inline fn ToLower(String value) -> String {
    std::ranges::transform(value, value.begin(), [](const char character) {
      return static_cast<char>(std::tolower(static_cast<unsigned char>(character)));
    });
    return value;
  }

  /**
   * @brief String conversion for scoped enums, backed by magic_enum.
   */
  template <typename EnumType>
  struct EnumTraits {
    static constexpr bool has_string_conversion = magic_enum::is_scoped_enum_v<EnumType>;

    static fn getChoices() -> ArgChoices {
      ArgChoices choices;

      for (const EnumType value : magic_enum::enum_values<EnumType>())
        choices.emplace_back(magic_enum::enum_name(value));

      return choices;
    }

    static fn stringToEnum(const StringView str) -> Option<EnumType> {
      for (const EnumType value : magic_enum::enum_values<EnumType>())
        if (EqualsIgnoreCase(str, magic_enum::enum_name(value)))
          return value;

      return types::None;
    }
  };

  /**
   * @brief A command-line argument with its metadata and value.
   */
  class Argument {
   public:
    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, String> && ...))
    explicit Argument(NameTs&&... names)
      : m_names { String(std::forward<NameTs>(names))... } {}

    fn help(String helpText) -> Argument& {
      m_helpText = std::move(helpText);
      return *this;
    }

    fn flag() -> Argument& {
      m_isFlag       = true;
      m_defaultValue = false;
      return *this;
    }

    fn defaultValue(String value) -> Argument& {
      m_defaultValue = std::move(value);
      return *this;
    }

    /**
     * @brief Sets an enum default; the enum's names also become the allowed choices.
     */
    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    fn defaultValue(const EnumType value) -> Argument& {
      m_defaultValue = String(magic_enum::enum_name(value));
      m_choices      = EnumTraits<EnumType>::getChoices();
      return *this;
    }

    template <typename T>
    [[nodiscard]] fn get() const -> T {
      if (m_value && std::holds_alternative<T>(*m_value))
        return std::get<T>(*m_value);

      if (m_defaultValue && std::holds_alternative<T>(*m_defaultValue))
        return std::get<T>(*m_defaultValue);

      return T {};
    }

    [[nodiscard]] fn isUsed() const -> bool {
      return m_value.has_value();
    }

    [[nodiscard]] fn isFlag() const -> bool {
      return m_isFlag;
    }

    [[nodiscard]] fn getNames() const -> const Vec<String>& {
      return m_names;
    }

    [[nodiscard]] fn getPrimaryName() const -> const String& {
      return m_names.front();
    }

    [[nodiscard]] fn getHelpText() const -> const String& {
      return m_helpText;
    }

    [[nodiscard]] fn getChoices() const -> const Option<ArgChoices>& {
      return m_choices;
    }

    fn setValue(ArgValue value) -> Result<> {
      if (m_choices && std::holds_alternative<String>(value)) {
        const String& strValue = std::get<String>(value);

        if (std::ranges::none_of(*m_choices, [&](const String& choice) { return EqualsIgnoreCase(strValue, choice); })) {
          String allowed;

          for (usize i = 0; i < m_choices->size(); ++i)
            allowed += std::format("{}{}", i > 0 ? ", " : "", ToLower((*m_choices)[i]));

          ERR_FMT(NimbusErrorCode::InvalidArgument, "Invalid value '{}' for argument '{}'. Allowed values: {}", strValue, getPrimaryName(), allowed);
        }
      }

      m_value = std::move(value);
      return {};
    }

   private:
    Vec<String>        m_names;
    String             m_helpText;
    Option<ArgValue>   m_value;
    Option<ArgValue>   m_defaultValue;
    Option<ArgChoices> m_choices;
    bool               m_isFlag = false;
  };

  /**
   * @brief Main argument parser class.
   */
  class ArgumentParser {
   public:
    explicit ArgumentParser(String programName, String version)
      : m_programName(std::move(programName)), m_version(std::move(version)) {
      addArguments("-h", "--help").help("Show this help message and exit").flag();
      addArguments("-v", "--version").help("Show version information and exit").flag();
    }

    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, String> && ...))
    fn addArguments(NameTs&&... names) -> Argument& {
      m_arguments.emplace_back(std::make_unique<Argument>(std::forward<NameTs>(names)...));
      Argument& arg = *m_arguments.back();

      for (const String& name : arg.getNames())
        m_argumentMap[name] = &arg;

      return arg;
    }

    /**
     * @brief Parses argv-style arguments. The first element is the program name.
     * @return What to do next, or InvalidArgument for unknown options and missing values.
     */
    fn parseArgs(const Span<const char* const> args) -> Result<ParseOutcome> {
      Vec<String> stringArgs(args.begin(), args.end());
      return parseArgs(stringArgs);
    }

    fn parseArgs(const Vec<String>& args) -> Result<ParseOutcome> {
      for (usize i = 1; i < args.size(); ++i) {
        const String& arg = args[i];

        if (arg == "-h" || arg == "--help")
          return ParseOutcome::ShowHelp;

        if (arg == "-v" || arg == "--version")
          return ParseOutcome::ShowVersion;

        // Accept --name=value as well as --name value.
        String         name = arg;
        Option<String> inlineValue;

        if (const usize eq = arg.find('='); arg.starts_with("--") && eq != String::npos) {
          name        = arg.substr(0, eq);
          inlineValue = arg.substr(eq + 1);
        }

        const auto iter = m_argumentMap.find(name);

        if (iter == m_argumentMap.end())
          ERR_FMT(NimbusErrorCode::InvalidArgument, "Unknown argument: {}", arg);

        Argument* argument = iter->second;

        if (argument->isFlag()) {
          if (inlineValue)
            ERR_FMT(NimbusErrorCode::InvalidArgument, "Flag {} does not take a value", name);

          if (Result res = argument->setValue(true); !res)
            return Err(res.error());

          continue;
        }

        if (!inlineValue) {
          if (i + 1 >= args.size())
            ERR_FMT(NimbusErrorCode::InvalidArgument, "Argument {} requires a value", name);

          inlineValue = args[++i];
        }

        if (Result res = argument->setValue(std::move(*inlineValue)); !res)
          return Err(res.error());
      }

      return ParseOutcome::Run;
    }

    template <typename T = String>
    [[nodiscard]] fn get(const StringView name) const -> T {
      if (const auto iter = m_argumentMap.find(name); iter != m_argumentMap.end())
        return iter->second->get<T>();

      return T {};
    }

    /**
     * @brief Gets an enum-valued argument. Falls back to the first enumerator if the stored
     * string somehow does not name one.
     */
    template <typename EnumType>
    [[nodiscard]] fn getEnum(const StringView name) const -> EnumType {
      return EnumTraits<EnumType>::stringToEnum(get<String>(name)).value_or(magic_enum::enum_values<EnumType>().front());
    }

    /**
     * @brief Gets a value-taking argument only if it was given on the command line.
     */
    [[nodiscard]] fn getOptional(const StringView name) const -> Option<String> {
      if (!isUsed(name))
        return types::None;

      return get<String>(name);
    }

    [[nodiscard]] fn isUsed(const StringView name) const -> bool {
      if (const auto iter = m_argumentMap.find(name); iter != m_argumentMap.end())
        return iter->second->isUsed();

      return false;
    }

    [[nodiscard]] fn version() const -> const String& {
      return m_version;
    }

    [[nodiscard]] fn helpText() const -> String {
      String out = std::format("Usage: {}", m_programName);

      for (const UniquePointer<Argument>& arg : m_arguments)
        out += std::format(" [{}{}]", arg->getPrimaryName(), arg->isFlag() ? "" : " VALUE");

      out += "\n\nArguments:\n";

      for (const UniquePointer<Argument>& arg : m_arguments) {
        String names;

        for (usize i = 0; i < arg->getNames().size(); ++i)
          names += std::format("{}{}", i > 0 ? ", " : "", arg->getNames()[i]);

        out += std::format("  {}{}\n", names, arg->isFlag() ? "" : " VALUE");

        if (!arg->getHelpText().empty())
          out += std::format("    {}\n", arg->getHelpText());

        if (const Option<ArgChoices>& choices = arg->getChoices()) {
          String allowed;

          for (usize i = 0; i < choices->size(); ++i)
            allowed += std::format("{}{}", i > 0 ? ", " : "", ToLower((*choices)[i]));

          out += std::format("    Available values: {}\n", allowed);
        }
      }

      return out;
    }

   private:
    String                       m_programName;
    String                       m_version;
    Vec<UniquePointer<Argument>> m_arguments;
    Map<String, Argument*>       m_argumentMap;
  };
} // namespace nimbus::utils::argparse
