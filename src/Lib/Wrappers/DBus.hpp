#pragma once

#ifdef __linux__

// clang-format off
#include <cstring>     // std::strcmp
#include <dbus/dbus.h> // DBus Library
#include <format>      // std::format
#include <type_traits> // std::is_convertible_v
#include <utility>     // std::exchange, std::forward

#include <Nimbus/Utils/Definitions.hpp>
#include <Nimbus/Utils/Error.hpp>
#include <Nimbus/Utils/Types.hpp>
// clang-format on

namespace DBus {
  namespace {
    using nimbus::utils::error::NimbusError;
    using nimbus::utils::error::NimbusErrorCode;

    using nimbus::utils::types::Err;
    using nimbus::utils::types::f64;
    using nimbus::utils::types::i32;
    using nimbus::utils::types::None;
    using nimbus::utils::types::Option;
    using nimbus::utils::types::PCStr;
    using nimbus::utils::types::Result;
    using nimbus::utils::types::String;
    using nimbus::utils::types::u32;
  } // namespace

  /**
   * @brief A value to be appended wrapped in a D-Bus variant ("v"), as Properties.Set expects.
   */
  template <typename T>
  struct Variant {
    T value;
  };

  /**
   * @brief RAII wrapper for DBusError.
   */
  class Error {
    DBusError m_err {};
    bool      m_isInitialized = false;

   public:
    Error()
      : m_isInitialized(true) {
      dbus_error_init(&m_err);
    }

    ~Error() {
      if (m_isInitialized)
        dbus_error_free(&m_err);
    }

    Error(const Error&)                = delete;
    fn operator=(const Error&)->Error& = delete;
    Error(Error&&)                     = delete;
    fn operator=(Error&&)->Error&      = delete;

    [[nodiscard]] fn isSet() const -> bool {
      return m_isInitialized && dbus_error_is_set(&m_err);
    }

    [[nodiscard]] fn message() const -> PCStr {
      return isSet() ? m_err.message : "";
    }

    /**
     * @brief The error name, e.g. "org.freedesktop.DBus.Error.AccessDenied", or "" if unset.
     */
    [[nodiscard]] fn name() const -> PCStr {
      return isSet() ? m_err.name : "";
    }

    [[nodiscard]] fn get() -> DBusError* {
      return &m_err;
    }

    /**
     * @brief Converts the D-Bus error into a NimbusError with the given code.
     */
    [[nodiscard]] fn toNimbusError(const NimbusErrorCode code = NimbusErrorCode::PlatformSpecific) const -> NimbusError {
      if (isSet())
        return { code, std::format("D-Bus Error: {} ({})", message(), name()) };

      return { NimbusErrorCode::InternalError, "Attempted to convert an unset D-Bus error" };
    }
  };

  /**
   * @brief Iterator over the arguments of a Message.
   *
   * Does not own the message; it must not outlive the Message it came from.
   */
  class MessageIter {
    DBusMessageIter m_iter {};
    bool            m_isValid = false;

    explicit MessageIter(const DBusMessageIter& iter, const bool isValid)
      : m_iter(iter), m_isValid(isValid) {}

    friend class Message;

    fn getBasic(void* value) -> void {
      if (m_isValid)
        dbus_message_iter_get_basic(&m_iter, value);
    }

   public:
    MessageIter(const MessageIter&)                = delete;
    fn operator=(const MessageIter&)->MessageIter& = delete;
    MessageIter(MessageIter&&)                     = delete;
    fn operator=(MessageIter&&)->MessageIter&      = delete;
    ~MessageIter()                                 = default;

    [[nodiscard]] fn getArgType() -> int {
      return m_isValid ? dbus_message_iter_get_arg_type(&m_iter) : DBUS_TYPE_INVALID;
    }

    /**
     * @brief Recurses into a container (array, struct, variant). The result is invalid if there is no container here.
     */
    [[nodiscard]] fn recurse() -> MessageIter {
      if (!m_isValid)
        return MessageIter({}, false);

      DBusMessageIter subIter;
      dbus_message_iter_recurse(&m_iter, &subIter);

      return MessageIter(subIter, true);
    }

    [[nodiscard]] fn getObjectPath() -> Option<String> {
      if (getArgType() != DBUS_TYPE_OBJECT_PATH)
        return None;

      PCStr strPtr = nullptr;
      getBasic(static_cast<void*>(&strPtr));

      return strPtr ? Option<String>(strPtr) : None;
    }

    [[nodiscard]] fn getDouble() -> Option<f64> {
      if (getArgType() != DBUS_TYPE_DOUBLE)
        return None;

      f64 value = 0.0;
      getBasic(static_cast<void*>(&value));

      return value;
    }

    [[nodiscard]] fn getUint32() -> Option<u32> {
      if (getArgType() != DBUS_TYPE_UINT32)
        return None;

      dbus_uint32_t value = 0;
      getBasic(static_cast<void*>(&value));

      return static_cast<u32>(value);
    }
  };

  /**
   * @brief RAII wrapper for DBusMessage. Automatically unrefs.
   */
  class Message {
    DBusMessage* m_msg = nullptr;

    static fn appendArgInternal(DBusMessageIter& iter, const PCStr value) -> bool {
      return dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, static_cast<const void*>(&value));
    }

    static fn appendArgInternal(DBusMessageIter& iter, const u32 value) -> bool {
      const dbus_uint32_t raw = value;
      return dbus_message_iter_append_basic(&iter, DBUS_TYPE_UINT32, &raw);
    }

    template <typename T>
    static fn appendArgInternal(DBusMessageIter& iter, const Variant<T>& variant) -> bool {
      PCStr signature = nullptr;

      if constexpr (std::is_convertible_v<T, PCStr>)
        signature = DBUS_TYPE_STRING_AS_STRING;
      else if constexpr (std::is_same_v<T, u32>)
        signature = DBUS_TYPE_UINT32_AS_STRING;
      else
        static_assert(!sizeof(T*), "Unsupported variant type passed to appendArgs");

      DBusMessageIter sub;

      if (!dbus_message_iter_open_container(&iter, DBUS_TYPE_VARIANT, signature, &sub))
        return false;

      if (!appendArgInternal(sub, variant.value)) {
        dbus_message_iter_abandon_container(&iter, &sub);
        return false;
      }

      return dbus_message_iter_close_container(&iter, &sub);
    }

   public:
    explicit Message(DBusMessage* msg = nullptr)
      : m_msg(msg) {}

    ~Message() {
      if (m_msg)
        dbus_message_unref(m_msg);
    }

    Message(const Message&)                = delete;
    fn operator=(const Message&)->Message& = delete;

    Message(Message&& other) noexcept
      : m_msg(std::exchange(other.m_msg, nullptr)) {}

    fn operator=(Message&& other) noexcept -> Message& {
      if (this != &other) {
        if (m_msg)
          dbus_message_unref(m_msg);

        m_msg = std::exchange(other.m_msg, nullptr);
      }

      return *this;
    }

    [[nodiscard]] fn get() const -> DBusMessage* {
      return m_msg;
    }

    [[nodiscard]] fn iterInit() const -> MessageIter {
      if (!m_msg)
        return MessageIter({}, false);

      DBusMessageIter iter;
      const bool      isValid = dbus_message_iter_init(m_msg, &iter);

      return MessageIter(iter, isValid);
    }

    /**
     * @brief Appends string, uint32 and Variant<...> arguments in order.
     * @return False if any argument could not be appended (allocation failure).
     */
    template <typename... Args>
    [[nodiscard]] fn appendArgs(Args&&... args) -> bool {
      if (!m_msg)
        return false;

      DBusMessageIter iter;
      dbus_message_iter_init_append(m_msg, &iter);

      bool success = true;
      ((success = success && appendArgInternal(iter, std::forward<Args>(args))), ...); // NOLINT
      return success;
    }

    static fn newMethodCall(const PCStr destination, const PCStr path, const PCStr interface, const PCStr method) -> Result<Message> {
      DBusMessage* rawMsg = dbus_message_new_method_call(destination, path, interface, method);

      if (!rawMsg)
        return Err(NimbusError(NimbusErrorCode::OutOfMemory, "dbus_message_new_method_call failed"));

      return Message(rawMsg);
    }
  };

  /**
   * @brief RAII wrapper for DBusConnection. Automatically unrefs.
   */
  class Connection {
    DBusConnection* m_conn = nullptr;

   public:
    explicit Connection(DBusConnection* conn = nullptr)
      : m_conn(conn) {}

    ~Connection() {
      if (m_conn)
        dbus_connection_unref(m_conn);
    }

    Connection(const Connection&)                = delete;
    fn operator=(const Connection&)->Connection& = delete;

    Connection(Connection&& other) noexcept
      : m_conn(std::exchange(other.m_conn, nullptr)) {}

    fn operator=(Connection&& other) noexcept -> Connection& {
      if (this != &other) {
        if (m_conn)
          dbus_connection_unref(m_conn);

        m_conn = std::exchange(other.m_conn, nullptr);
      }

      return *this;
    }

    [[nodiscard]] fn get() const -> DBusConnection* {
      return m_conn;
    }

    /**
     * @brief Sends a message and blocks until the reply arrives or the timeout elapses.
     *
     * D-Bus timeouts map to Timeout, unknown services to NotFound and access denials to PermissionDenied.
     */
    [[nodiscard]] fn sendWithReplyAndBlock(const Message& message, const i32 timeoutMs = 1000) const -> Result<Message> {
      if (!m_conn || !message.get())
        return Err(NimbusError(NimbusErrorCode::InvalidArgument, "Invalid connection or message provided to sendWithReplyAndBlock"));

      Error        err;
      DBusMessage* rawReply = dbus_connection_send_with_reply_and_block(m_conn, message.get(), timeoutMs, err.get());

      if (err.isSet()) {
        const PCStr errName = err.name();

        if (std::strcmp(errName, DBUS_ERROR_TIMEOUT) == 0 || std::strcmp(errName, DBUS_ERROR_NO_REPLY) == 0)
          return Err(err.toNimbusError(NimbusErrorCode::Timeout));

        if (std::strcmp(errName, DBUS_ERROR_SERVICE_UNKNOWN) == 0)
          return Err(err.toNimbusError(NimbusErrorCode::NotFound));

        if (std::strcmp(errName, DBUS_ERROR_ACCESS_DENIED) == 0)
          return Err(err.toNimbusError(NimbusErrorCode::PermissionDenied));

        return Err(err.toNimbusError(NimbusErrorCode::PlatformSpecific));
      }

      if (!rawReply)
        return Err(NimbusError(NimbusErrorCode::ApiUnavailable, "dbus_connection_send_with_reply_and_block returned null without setting an error"));

      return Message(rawReply);
    }

    static fn busGet(const DBusBusType busType) -> Result<Connection> {
      Error           err;
      DBusConnection* rawConn = dbus_bus_get(busType, err.get());

      if (err.isSet())
        return Err(err.toNimbusError(NimbusErrorCode::ApiUnavailable));

      if (!rawConn)
        return Err(NimbusError(NimbusErrorCode::ApiUnavailable, "dbus_bus_get returned null without setting an error"));

      return Connection(rawConn);
    }
  };
} // namespace DBus

#endif // __linux__
