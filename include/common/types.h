#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

namespace hacluster {
namespace common {

/**
 * @file types.h
 * @brief Fundamental types and utilities shared by every hacluster module
 */

/// @brief Wall-clock timestamp used for persisted records and wire messages
using Timestamp = std::chrono::system_clock::time_point;

/// @brief Monotonic time point used for outage and timeout arithmetic
using MonotonicTime = std::chrono::steady_clock::time_point;

/**
 * @brief Type-safe result wrapper for operations that can fail
 *
 * Holds either a success value or an error message. Used for every fallible
 * operation in the controller instead of exceptions, so a failed promotion or
 * an unreachable peer is an ordinary value the caller has to look at.
 *
 * @tparam T The type of the success value (must be default constructible)
 *
 * @note Thread safety: not thread-safe; each instance belongs to one thread.
 *
 * Example usage:
 * @code
 * auto config = store->load_config();
 * if (!config.is_ok()) {
 *     LOG_WARN("controller", "cannot start: ", config.error());
 *     return;
 * }
 * @endcode
 */
template <typename T>
class Result {
private:
  bool success_;
  T value_;
  std::string error_;

public:
  /**
   * @brief Construct a successful result with a value
   * @param value The success value to store
   */
  explicit Result(T value) : success_(true), value_(std::move(value)) {}

  /**
   * @brief Construct a failed result with an error message
   * @param error C-string describing the error
   */
  explicit Result(const char *error) : success_(false), value_(), error_(error) {}

  /**
   * @brief Construct a failed result with an error message
   * @param error String describing the error
   */
  explicit Result(const std::string &error)
      : success_(false), value_(), error_(error) {}

  Result(const Result &other) = default;
  Result(Result &&other) noexcept = default;
  Result &operator=(const Result &other) = default;
  Result &operator=(Result &&other) noexcept = default;

  /// @return true if the operation succeeded
  bool is_ok() const noexcept { return success_; }

  /// @return true if the operation failed
  bool is_err() const noexcept { return !success_; }

  /**
   * @brief Get the success value
   * @warning Only call this if is_ok() returns true
   */
  const T &value() const & { return value_; }

  /// Rvalue overload for move-out of the stored value
  T &&value() && { return std::move(value_); }

  /**
   * @brief Get the error message
   * @warning Only meaningful if is_err() returns true
   */
  const std::string &error() const noexcept { return error_; }

  explicit operator bool() const noexcept { return success_; }

  /// Get value or return default on error
  T value_or(const T &default_value) const {
    return success_ ? value_ : default_value;
  }
};

/// Milliseconds since the Unix epoch for a wall-clock timestamp
int64_t to_unix_millis(const Timestamp &ts);

/// Inverse of to_unix_millis()
Timestamp from_unix_millis(int64_t millis);

/// ISO 8601 UTC rendering with millisecond precision, e.g. 2026-01-02T03:04:05.678Z
std::string format_iso8601(const Timestamp &ts);

} // namespace common
} // namespace hacluster
