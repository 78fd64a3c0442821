#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace clique {
namespace common {

/**
 * @file types.h
 * @brief Fundamental types and utilities shared by the engine and the harness
 *
 * Byte-level aliases, the Result<T> error wrapper and hex helpers used by
 * every other module.
 */

/// @brief Cryptographic hash representation (SHA-256, 32 bytes)
using Hash = std::vector<uint8_t>;

/// @brief Ed25519 public key representation (32 bytes)
using PublicKey = std::vector<uint8_t>;

/// @brief Ed25519 private key seed (32 bytes)
using PrivateKey = std::vector<uint8_t>;

/// @brief Ed25519 signature representation (64 bytes)
using Signature = std::vector<uint8_t>;

/// @brief Token amount in smallest unit
using Amount = uint64_t;

/**
 * @brief Type-safe result wrapper for operations that can fail
 *
 * Provides a way to report recoverable failures without exceptions. Fatal
 * harness conditions are reported with exceptions instead (see
 * testing/harness_error.h).
 *
 * @tparam T The type of the success value
 *
 * @note Thread safety: not thread-safe, one owner at a time.
 *
 * Example usage:
 * @code
 * auto keys = load_initial_staking_keys(path, password);
 * if (keys.is_err()) {
 *     LOG_ERROR("staking", "could not load keys: ", keys.error());
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

  /// Move the success value out
  T &&value() && { return std::move(value_); }

  /// @warning Only meaningful if is_err() returns true
  const std::string &error() const noexcept { return error_; }

  explicit operator bool() const noexcept { return success_; }

  T value_or(const T &default_value) const {
    return success_ ? value_ : default_value;
  }
};

/**
 * @brief Lowercase hex encoding of a byte vector
 */
std::string to_hex(const std::vector<uint8_t> &bytes);

/**
 * @brief Decode a hex string (upper or lower case, even length)
 * @return Decoded bytes or an error describing the first bad character
 */
Result<std::vector<uint8_t>> from_hex(const std::string &hex);

} // namespace common
} // namespace clique

namespace std {
template <>
struct hash<std::vector<uint8_t>> {
  /**
   * @brief Hash a byte vector (boost::hash_combine style)
   *
   * Lets Hash, PublicKey and Signature key unordered containers.
   */
  std::size_t operator()(const std::vector<uint8_t> &v) const noexcept {
    std::size_t seed = v.size();
    for (const auto &byte : v) {
      seed ^= byte + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    }
    return seed;
  }
};
} // namespace std
