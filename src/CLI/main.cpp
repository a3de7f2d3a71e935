#ifdef _WIN32
  #include <windows.h>
  #include <winrt/base.h>
#endif

#include <cstdlib> // EXIT_FAILURE, EXIT_SUCCESS
#include <format>  // std::format

#include <Nimbus/Core/LocationAcquirer.hpp>
#include <Nimbus/Core/LocationResolver.hpp>
#include <Nimbus/Services/Http.hpp>
#include <Nimbus/Services/IpGeolocation.hpp>
#include <Nimbus/Services/Positioning.hpp>
#include <Nimbus/Services/Weather.hpp>
#include <Nimbus/Utils/ArgumentParser.hpp>
#include <Nimbus/Utils/Definitions.hpp>
#include <Nimbus/Utils/Error.hpp>
#include <Nimbus/Utils/Logging.hpp>
#include <Nimbus/Utils/Types.hpp>

#include "Config/Config.hpp"
#include "UI/UI.hpp"

using namespace nimbus::utils::types;
using namespace nimbus::utils::logging;
using namespace nimbus::config;
using namespace nimbus::ui;

namespace {
  namespace http = nimbus::services::http;

  using nimbus::core::acquirer::LocationAcquirer;
  using nimbus::core::location::Location;
  using nimbus::core::resolver::LocationResolver;
  using nimbus::core::resolver::ResolutionSource;
  using nimbus::core::resolver::ResolvedLocation;
  using nimbus::services::ipgeo::IPGeolocationClient;
  using nimbus::services::ipgeo::LocationDetails;
  using nimbus::services::positioning::CreateNativeCoordinateProvider;
  using nimbus::services::positioning::ICoordinateProvider;
  using nimbus::services::weather::OpenWeatherMapService;
  using nimbus::services::weather::WeatherReport;

  constexpr PCStr DEBUG_LOG_FILE = "nimbus_debug.log";

  /**
   * @brief Keeps the HTTP library initialized for the lifetime of the process.
   */
  class HttpSession {
   public:
    HttpSession() = default;

    HttpSession(const HttpSession&)                = delete;
    HttpSession(HttpSession&&)                     = delete;
    fn operator=(const HttpSession&)->HttpSession& = delete;
    fn operator=(HttpSession&&)->HttpSession&      = delete;

    ~HttpSession() {
      if (m_initialized)
        http::GlobalCleanup();
    }

    fn init() -> Result<> {
      if (Result<> result = http::GlobalInit(); !result)
        return result;

      m_initialized = true;
      return {};
    }

   private:
    bool m_initialized = false;
  };

  struct Options {
    bool           here         = false;
    bool           debug        = false;
    bool           locationInfo = false;
    LogLevel       logLevel     = LogLevel::Off;
    Option<String> city;
    Option<String> logFile;
    Option<String> configPath;
  };

  fn ConfigureLogging(const Options& options) -> Unit {
    SetRuntimeLogLevel(options.debug ? LogLevel::Debug : options.logLevel);

    if (!options.debug && !options.logFile)
      return;

    const String path = options.logFile.value_or(DEBUG_LOG_FILE);

    if (Result<> result = SetLogFile(path); !result)
      warn_at(result.error());
    else
      debug_log("Mirroring log output to {}", path);
  }

  fn PrintLocationInfo(const IPGeolocationClient& client) -> int {
    const Option<LocationDetails> details = client.detailedInfo();

    if (!details) {
      Println("Error: Could not retrieve location details.");
      return EXIT_FAILURE;
    }

    Println(RenderLocationDetails(*details));
    return EXIT_SUCCESS;
  }
} // namespace

fn main(const int argc, char* argv[]) -> int try {
#ifdef _WIN32
  winrt::init_apartment();
  SetConsoleOutputCP(CP_UTF8);
#endif

  Options options;

  {
    using nimbus::utils::argparse::ArgumentParser;
    using nimbus::utils::argparse::ParseOutcome;

    ArgumentParser parser("nimbus", NIMBUS_VERSION);

    parser
      .addArguments("--city")
      .help("City name to get weather for (uses config default if not provided)");

    parser
      .addArguments("--here")
      .help("Use the current location (system positioning, then IP geolocation)")
      .flag();

    parser
      .addArguments("--debug")
      .help("Enable debug mode with verbose logging. Overrides --log-level.")
      .flag();

    parser
      .addArguments("--log-level")
      .help("Set the minimum log level.")
      .defaultValue(LogLevel::Off);

    parser
      .addArguments("--log-file")
      .help("Also write log output to this file (defaults to nimbus_debug.log with --debug).");

    parser
      .addArguments("--config")
      .help("Path to the TOML config file (defaults to ./config.toml).");

    parser
      .addArguments("--location-info")
      .help("Print what IP geolocation knows about the current location and exit.")
      .flag();

    const Vec<String> args(argv, argv + argc);

    const Result<ParseOutcome> outcome = parser.parseArgs(args);

    if (!outcome) {
      PrintErr(std::format("Error: {}\n", outcome.error().message));
      return EXIT_FAILURE;
    }

    if (*outcome == ParseOutcome::ShowHelp) {
      Print(parser.helpText());
      return EXIT_SUCCESS;
    }

    if (*outcome == ParseOutcome::ShowVersion) {
      Println(parser.version());
      return EXIT_SUCCESS;
    }

    options.here         = parser.get<bool>("--here");
    options.debug        = parser.get<bool>("--debug");
    options.locationInfo = parser.get<bool>("--location-info");
    options.logLevel     = parser.getEnum<LogLevel>("--log-level");
    options.city         = parser.getOptional("--city");
    options.logFile      = parser.getOptional("--log-file");
    options.configPath   = parser.getOptional("--config");
  }

  ConfigureLogging(options);

  debug_log("Debug mode: {}", options.debug);

  HttpSession session;

  if (Result<> result = session.init(); !result) {
    error_at(result.error());
    Println(std::format("Error: {}", result.error().message));
    return EXIT_FAILURE;
  }

  const Result<Config> config = [&]() -> Result<Config> {
    const ScopedTimer timer("configuration initialization");

    return options.configPath ? Config::Load(*options.configPath) : Config::Load();
  }();

  if (!config) {
    error_at(config.error());
    Println(std::format("Error: {}", config.error().message));
    return EXIT_FAILURE;
  }

  const Option<String> apiKey = config->apiKey();

  debug_log("API key configured: {}", apiKey ? "Yes" : "No");

  http::CurlHttpClient httpClient;

  const IPGeolocationClient ipClient(httpClient);

  if (options.locationInfo)
    return PrintLocationInfo(ipClient);

  const UniquePointer<ICoordinateProvider> nativeProvider = CreateNativeCoordinateProvider();

  const LocationAcquirer       acquirer(*nativeProvider, ipClient);
  const ConfigLocationDefaults defaults(*config);
  const LocationResolver       resolver(acquirer, defaults);

  const Result<ResolvedLocation> resolved = [&]() -> Result<ResolvedLocation> {
    const ScopedTimer timer("location resolution");

    return resolver.resolveWithSource(options.here, options.city);
  }();

  if (!resolved) {
    debug_at(resolved.error());
    Println(LocationFailureMessage(options.here ? ResolutionSource::CurrentLocation : ResolutionSource::Automatic));
    return EXIT_FAILURE;
  }

  const Location& location = resolved->location;

  debug_log("Resolved {}", location.description());

  if (!apiKey) {
    Println(MissingApiKeyMessage());
    return EXIT_FAILURE;
  }

  const OpenWeatherMapService weatherService(httpClient, *apiKey);

  const Result<WeatherReport> report = [&]() -> Result<WeatherReport> {
    const ScopedTimer timer(std::format("weather lookup for {}", location.description()));

    return weatherService.fetch(location);
  }();

  if (!report) {
    debug_at(report.error());
    Println(WeatherErrorMessage(report.error(), location));
    return EXIT_FAILURE;
  }

  Println(RenderWeather(*report));

  CloseLogFile();

  return EXIT_SUCCESS;
} catch (const Exception& e) {
  error_at(e);
  Println(std::format("Unexpected error: {}", e.what()));
  return EXIT_FAILURE;
}
