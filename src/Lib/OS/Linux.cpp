#ifdef __linux__

// clang-format off
#include <format>  // std::format
#include <utility> // std::move

#include "Nimbus/Services/Positioning.hpp"
#include "Nimbus/Utils/Error.hpp"
#include "Nimbus/Utils/Logging.hpp"
#include "Nimbus/Utils/Types.hpp"

#include "OS/PlatformLocator.hpp"
#include "Wrappers/DBus.hpp"
// clang-format on

namespace {
  using nimbus::core::location::Coordinates;
  using nimbus::services::positioning::IPlatformLocator;

  using nimbus::utils::error::NimbusError;
  using enum nimbus::utils::error::NimbusErrorCode;

  using nimbus::utils::types::Err;
  using nimbus::utils::types::f64;
  using nimbus::utils::types::i32;
  using nimbus::utils::types::None;
  using nimbus::utils::types::Option;
  using nimbus::utils::types::PCStr;
  using nimbus::utils::types::Result;
  using nimbus::utils::types::String;
  using nimbus::utils::types::u32;
  using nimbus::utils::types::UniquePointer;

  constexpr PCStr GEOCLUE_SERVICE        = "org.freedesktop.GeoClue2";
  constexpr PCStr GEOCLUE_MANAGER_PATH   = "/org/freedesktop/GeoClue2/Manager";
  constexpr PCStr GEOCLUE_MANAGER_IFACE  = "org.freedesktop.GeoClue2.Manager";
  constexpr PCStr GEOCLUE_CLIENT_IFACE   = "org.freedesktop.GeoClue2.Client";
  constexpr PCStr GEOCLUE_LOCATION_IFACE = "org.freedesktop.GeoClue2.Location";
  constexpr PCStr PROPERTIES_IFACE       = "org.freedesktop.DBus.Properties";

  constexpr PCStr DESKTOP_ID = "nimbus";

  constexpr i32 CALL_TIMEOUT_MS = 1000;

  // GClueAccuracyLevel
  constexpr u32 ACCURACY_NONE = 0;
  constexpr u32 ACCURACY_CITY = 4;

  /**
   * @brief Native positioning through GeoClue2 on the system bus.
   *
   * GeoClue grants access per client when the client starts, so authorization is
   * known only after Start() has been attempted.
   */
  class GeoClueLocator final : public IPlatformLocator {
   public:
    explicit GeoClueLocator(DBus::Connection connection)
      : m_connection(std::move(connection)) {}

    ~GeoClueLocator() override {
      if (!m_clientPath || !m_started)
        return;

      if (Result<DBus::Message> reply = call(m_clientPath->c_str(), GEOCLUE_CLIENT_IFACE, "Stop"); !reply)
        debug_at(reply.error());
    }

    GeoClueLocator(const GeoClueLocator&)                = delete;
    GeoClueLocator(GeoClueLocator&&)                     = delete;
    fn operator=(const GeoClueLocator&)->GeoClueLocator& = delete;
    fn operator=(GeoClueLocator&&)->GeoClueLocator&      = delete;

    fn servicesEnabled() -> Result<bool> override {
      Result<DBus::Message> reply = getProperty(GEOCLUE_MANAGER_PATH, GEOCLUE_MANAGER_IFACE, "AvailableAccuracyLevel");

      if (!reply) {
        // Not installed or not activatable: treat as switched off.
        if (reply.error().code == NotFound)
          return false;

        return Err(reply.error());
      }

      DBus::MessageIter iter = reply->iterInit();

      if (iter.getArgType() != DBUS_TYPE_VARIANT)
        ERR(ParseError, "AvailableAccuracyLevel reply is not a variant");

      DBus::MessageIter value = iter.recurse();

      const Option<u32> level = value.getUint32();

      if (!level)
        ERR(ParseError, "AvailableAccuracyLevel is not a uint32");

      debug_log("GeoClue available accuracy level: {}", *level);

      return *level > ACCURACY_NONE;
    }

    fn authorizationGranted() -> Result<bool> override {
      if (m_denied)
        return false;

      if (Result res = ensureClient(); !res) {
        if (res.error().code == PermissionDenied)
          return false;

        return Err(res.error());
      }

      return true;
    }

    fn requestAuthorization() -> Result<> override {
      m_denied = false;

      if (Result res = ensureClient(); !res) {
        if (res.error().code != PermissionDenied)
          return Err(res.error());

        m_denied = true;
        return {};
      }

      // Starting the client is what makes the GeoClue agent ask the user.
      if (Result res = start(); !res) {
        if (res.error().code != PermissionDenied)
          return Err(res.error());

        m_denied = true;
      }

      return {};
    }

    fn lastKnownFix() -> Result<Option<Coordinates>> override {
      if (!m_clientPath || !m_started)
        return None;

      Result<DBus::Message> reply = getProperty(m_clientPath->c_str(), GEOCLUE_CLIENT_IFACE, "Location");

      if (!reply)
        return Err(reply.error());

      DBus::MessageIter iter = reply->iterInit();

      if (iter.getArgType() != DBUS_TYPE_VARIANT)
        ERR(ParseError, "Client.Location reply is not a variant");

      DBus::MessageIter value = iter.recurse();

      const Option<String> locationPath = value.getObjectPath();

      if (!locationPath)
        ERR(ParseError, "Client.Location is not an object path");

      // "/" means no location has been computed yet.
      if (*locationPath == "/")
        return None;

      Result<f64> latitude = getDoubleProperty(locationPath->c_str(), "Latitude");

      if (!latitude)
        return Err(latitude.error());

      Result<f64> longitude = getDoubleProperty(locationPath->c_str(), "Longitude");

      if (!longitude)
        return Err(longitude.error());

      return Coordinates { .latitude = *latitude, .longitude = *longitude };
    }

    fn requestFreshFix() -> Result<> override {
      if (Result res = ensureClient(); !res)
        return res;

      return start();
    }

   private:
    fn call(const PCStr path, const PCStr iface, const PCStr method) const -> Result<DBus::Message> {
      Result<DBus::Message> msg = DBus::Message::newMethodCall(GEOCLUE_SERVICE, path, iface, method);

      if (!msg)
        return Err(msg.error());

      return m_connection.sendWithReplyAndBlock(*msg, CALL_TIMEOUT_MS);
    }

    fn getProperty(const PCStr path, const PCStr iface, const PCStr property) const -> Result<DBus::Message> {
      Result<DBus::Message> msg = DBus::Message::newMethodCall(GEOCLUE_SERVICE, path, PROPERTIES_IFACE, "Get");

      if (!msg)
        return Err(msg.error());

      if (!msg->appendArgs(iface, property))
        ERR(OutOfMemory, "Failed to append arguments to Properties.Get message");

      return m_connection.sendWithReplyAndBlock(*msg, CALL_TIMEOUT_MS);
    }

    template <typename T>
    fn setProperty(const PCStr path, const PCStr iface, const PCStr property, const T value) const -> Result<> {
      Result<DBus::Message> msg = DBus::Message::newMethodCall(GEOCLUE_SERVICE, path, PROPERTIES_IFACE, "Set");

      if (!msg)
        return Err(msg.error());

      if (!msg->appendArgs(iface, property, DBus::Variant<T> { value }))
        ERR(OutOfMemory, "Failed to append arguments to Properties.Set message");

      if (Result<DBus::Message> reply = m_connection.sendWithReplyAndBlock(*msg, CALL_TIMEOUT_MS); !reply)
        return Err(reply.error());

      return {};
    }

    fn getDoubleProperty(const PCStr locationPath, const PCStr property) const -> Result<f64> {
      Result<DBus::Message> reply = getProperty(locationPath, GEOCLUE_LOCATION_IFACE, property);

      if (!reply)
        return Err(reply.error());

      DBus::MessageIter iter = reply->iterInit();

      if (iter.getArgType() != DBUS_TYPE_VARIANT)
        ERR_FMT(ParseError, "Location.{} reply is not a variant", property);

      DBus::MessageIter value = iter.recurse();

      if (const Option<f64> number = value.getDouble())
        return *number;

      ERR_FMT(ParseError, "Location.{} is not a double", property);
    }

    fn ensureClient() -> Result<> {
      if (m_clientPath)
        return {};

      Result<DBus::Message> reply = call(GEOCLUE_MANAGER_PATH, GEOCLUE_MANAGER_IFACE, "GetClient");

      if (!reply)
        return Err(reply.error());

      DBus::MessageIter iter = reply->iterInit();

      Option<String> path = iter.getObjectPath();

      if (!path)
        ERR(ParseError, "GeoClue GetClient reply is not an object path");

      debug_log("GeoClue client: {}", *path);

      if (Result res = setProperty(path->c_str(), GEOCLUE_CLIENT_IFACE, "DesktopId", DESKTOP_ID); !res)
        return res;

      if (Result res = setProperty(path->c_str(), GEOCLUE_CLIENT_IFACE, "RequestedAccuracyLevel", ACCURACY_CITY); !res)
        return res;

      m_clientPath = std::move(path);
      return {};
    }

    fn start() -> Result<> {
      if (m_started)
        return {};

      if (!m_clientPath)
        ERR(InternalError, "GeoClue client has not been created");

      if (Result<DBus::Message> reply = call(m_clientPath->c_str(), GEOCLUE_CLIENT_IFACE, "Start"); !reply)
        return Err(reply.error());

      m_started = true;
      return {};
    }

    DBus::Connection m_connection;
    Option<String>   m_clientPath;
    bool             m_started = false;
    bool             m_denied  = false;
  };
} // namespace

namespace nimbus::os {
  fn CreatePlatformLocator() -> Result<UniquePointer<IPlatformLocator>> {
    Result<DBus::Connection> connection = DBus::Connection::busGet(DBUS_BUS_SYSTEM);

    if (!connection)
      ERR_FMT(ApiUnavailable, "Failed to connect to the system D-Bus: {}", connection.error().message);

    return std::make_unique<GeoClueLocator>(std::move(*connection));
  }
} // namespace nimbus::os

#endif // __linux__
