#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace autoscale {
namespace common {

/**
 * @file types.h
 * @brief Fundamental types shared by the autoscaler modules
 */

/// @brief Identifier of a profile (a named class of workload)
using ProfileId = std::string;

/// @brief Identifier of a running workload instance
using InstanceId = std::string;

/**
 * @brief Type-safe result wrapper for operations that can fail
 *
 * Holds either a success value or an error message. Used for expected
 * failures such as malformed configuration; unexpected collaborator failures
 * are reported with exceptions instead.
 *
 * @tparam T The type of the success value
 *
 * @note Thread safety: not thread-safe; each instance belongs to one thread.
 *
 * Example usage:
 * @code
 * auto result = load_config_file(path);
 * if (result.is_ok()) {
 *     apply(result.value());
 * } else {
 *     LOG_ERROR("config: ", result.error());
 * }
 * @endcode
 */
template <typename T> class Result {
private:
  bool success_;
  T value_;
  std::string error_;

public:
  /// Construct a successful result with a value
  explicit Result(T value) : success_(true), value_(std::move(value)) {}

  /// Construct a failed result with an error message
  explicit Result(const char *error) : success_(false), value_(), error_(error) {}

  /// Construct a failed result with an error message
  explicit Result(const std::string &error)
      : success_(false), value_(), error_(error) {}

  Result(const Result &other) = default;
  Result(Result &&other) = default;
  Result &operator=(const Result &other) = default;
  Result &operator=(Result &&other) = default;

  bool is_ok() const noexcept { return success_; }
  bool is_err() const noexcept { return !success_; }

  /**
   * @brief Get the success value
   * @warning Only call this if is_ok() returns true
   */
  const T &value() const & { return value_; }

  /// Rvalue access for move semantics
  T &&value() && { return std::move(value_); }

  /// Error message; empty on success
  const std::string &error() const noexcept { return error_; }

  explicit operator bool() const noexcept { return success_; }

  T value_or(const T &default_value) const {
    return success_ ? value_ : default_value;
  }
};

} // namespace common
} // namespace autoscale
