/**
 * @file Types.hpp
 * @brief Defines various type aliases for commonly used types.
 *
 * This header provides a collection of type aliases for commonly used types
 * in the Nimbus project. These aliases are defined using the standard library
 * types and are provided as convenient shorthand notations.
 */

#pragma once

#include <array>       // std::array (Array)
#include <chrono>      // std::chrono::milliseconds (Milliseconds)
#include <cstdint>     // std::{uint8_t, uint16_t, ...}
#include <functional>  // std::function (Fn)
#include <map>         // std::map (Map)
#include <memory>      // std::unique_ptr (UniquePointer)
#include <mutex>       // std::mutex and std::lock_guard (Mutex, LockGuard)
#include <optional>    // std::optional (Option)
#include <span>        // std::span (Span)
#include <string>      // std::string (String)
#include <string_view> // std::string_view (StringView)
#include <utility>     // std::pair (Pair)
#include <vector>      // std::vector (Vec)

namespace nimbus::utils::types {
  /**
   * @brief Alias for std::uint8_t.
   *
   * 8-bit unsigned integer.
   */
  using u8 = std::uint8_t;

  /**
   * @brief Alias for std::uint32_t.
   *
   * 32-bit unsigned integer.
   */
  using u32 = std::uint32_t;

  /**
   * @brief Alias for std::int32_t.
   *
   * 32-bit signed integer.
   */
  using i32 = std::int32_t;

  /**
   * @brief Alias for std::int64_t.
   *
   * 64-bit signed integer.
   */
  using i64 = std::int64_t;

  /**
   * @brief Alias for double.
   *
   * 64-bit floating-point number.
   */
  using f64 = double;

  /**
   * @brief Alias for std::size_t.
   *
   * Unsigned size type (result of sizeof).
   */
  using usize = std::size_t;

  /**
   * @brief Alias for void, used as the "nothing" return type.
   */
  using Unit = void;

  /**
   * @brief Alias for std::string.
   *
   * Owning, mutable string.
   */
  using String = std::string;

  /**
   * @brief Alias for std::string_view.
   *
   * Non-owning view of a string.
   */
  using StringView = std::string_view;

  /**
   * @brief Alias for const char*.
   *
   * Pointer to a null-terminated C-style string.
   */
  using PCStr = const char*;

  /**
   * @brief Alias for void*.
   *
   * A type-erased pointer.
   */
  using RawPointer = void*;

  /**
   * @brief Alias for std::exception.
   *
   * Standard exception type.
   */
  using Exception = std::exception;

  /**
   * @brief Alias for std::mutex.
   */
  using Mutex = std::mutex;

  /**
   * @brief Alias for std::lock_guard<Mutex>.
   */
  using LockGuard = std::lock_guard<Mutex>;

  /**
   * @brief Alias for std::chrono::milliseconds.
   */
  using Milliseconds = std::chrono::milliseconds;

  /**
   * @brief Alias for std::nullopt_t.
   *
   * Represents an empty optional value.
   */
  inline constexpr std::nullopt_t None = std::nullopt;

  /**
   * @brief Alias for std::optional<Tp>.
   *
   * Represents a value that may or may not be present.
   * @tparam Tp The type of the potential value.
   */
  template <typename Tp>
  using Option = std::optional<Tp>;

  /**
   * @brief Alias for std::array<Tp, sz>.
   *
   * @tparam Tp The element type.
   * @tparam sz The size of the array.
   */
  template <typename Tp, usize sz>
  using Array = std::array<Tp, sz>;

  /**
   * @brief Alias for std::vector<Tp>.
   *
   * @tparam Tp The element type.
   */
  template <typename Tp>
  using Vec = std::vector<Tp>;

  /**
   * @brief Alias for std::span<Tp, sz>.
   *
   * Represents a non-owning view of a contiguous sequence of elements.
   * @tparam Tp The element type.
   * @tparam sz (Optional) The size of the span.
   */
  template <typename Tp, usize sz = std::dynamic_extent>
  using Span = std::span<Tp, sz>;

  /**
   * @brief Alias for std::pair<T1, T2>.
   */
  template <typename T1, typename T2>
  using Pair = std::pair<T1, T2>;

  /**
   * @brief Alias for std::map<Key, Val, std::less<>>.
   *
   * Uses a transparent comparator so lookups accept StringView keys.
   */
  template <typename Key, typename Val>
  using Map = std::map<Key, Val, std::less<>>;

  /**
   * @brief Alias for std::unique_ptr<Tp, Dp>.
   *
   * @tparam Tp The type of the managed object.
   * @tparam Dp The deleter type (defaults to std::default_delete<Tp>).
   */
  template <typename Tp, typename Dp = std::default_delete<Tp>>
  using UniquePointer = std::unique_ptr<Tp, Dp>;

  /**
   * @brief Alias for std::function<Sig>.
   */
  template <typename Sig>
  using Fn = std::function<Sig>;
} // namespace nimbus::utils::types
