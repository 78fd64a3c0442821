#pragma once

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace clique {
namespace common {

/**
 * @brief Logging levels for conditional debug output
 *
 * Harness tests run at WARN by default so that worker chatter does not drown
 * GoogleTest output. Set CLIQUE_LOG_LEVEL to raise verbosity.
 */
enum class LogLevel {
  TRACE = 0,
  DEBUG = 1,
  INFO = 2,
  WARN = 3,
  ERROR = 4,
  CRITICAL = 5 // Failures that abort the current test or worker
};

/// Environment variable holding the initial log level
constexpr const char *LOG_LEVEL_ENV = "CLIQUE_LOG_LEVEL";

struct LogEntry {
  std::chrono::system_clock::time_point timestamp;
  LogLevel level;
  std::string module;
  std::string thread_id;
  std::string message;
  std::string error_code;
};

/**
 * @brief Process-wide logger
 *
 * Several harness threads (worker, drains, sinks) log concurrently. Lines are
 * written whole under a mutex so they never interleave.
 */
class Logger {
public:
  static Logger &instance() {
    static Logger logger;
    return logger;
  }

  void set_level(LogLevel level) noexcept {
    current_level_.store(static_cast<int>(level), std::memory_order_relaxed);
  }

  LogLevel level() const noexcept {
    return static_cast<LogLevel>(
        current_level_.load(std::memory_order_relaxed));
  }

  /// One JSON object per line instead of bracketed text
  void set_json_format(bool enabled) noexcept {
    json_format_.store(enabled, std::memory_order_relaxed);
  }

  /// Redirect regular output; nullptr restores std::cout
  void set_output(std::ostream *out);

  bool is_enabled(LogLevel level) const noexcept {
    return static_cast<int>(level) >=
           current_level_.load(std::memory_order_relaxed);
  }

  /**
   * @brief Read the level from an environment variable
   *
   * Accepts trace/debug/info/warn/error/critical in any case. Unset or
   * unknown values leave the current level untouched.
   */
  void configure_from_env(const char *variable);

  template <typename... Args>
  void log(LogLevel level, const std::string &module, Args &&...args) {
    if (!is_enabled(level))
      return;

    std::ostringstream oss;
    (oss << ... << args);
    write(make_entry(level, module, oss.str(), ""));
  }

  /**
   * @brief Log a critical failure
   *
   * Always emitted regardless of level, and mirrored to stderr so it is
   * visible even when stdout is captured by the test runner.
   */
  void log_critical_failure(const std::string &module,
                            const std::string &message,
                            const std::string &error_code = "");

  static std::string level_to_string(LogLevel level);
  static bool parse_level(const std::string &text, LogLevel &out);

  static std::string format_text(const LogEntry &entry);
  static std::string format_json(const LogEntry &entry);

private:
  Logger();

  LogEntry make_entry(LogLevel level, const std::string &module,
                      std::string message, std::string error_code) const;
  void write(const LogEntry &entry);

  std::atomic<int> current_level_;
  std::atomic<bool> json_format_;

  std::mutex output_mutex_;
  std::ostream *out_;
};

} // namespace common
} // namespace clique

/**
 * @brief Logging macros
 *
 * The first argument is always the module name. Disabled levels skip message
 * formatting entirely.
 */
#define CLIQUE_LOG_AT(level, ...)                                              \
  do {                                                                         \
    if (clique::common::Logger::instance().is_enabled(level)) {                \
      clique::common::Logger::instance().log(level, __VA_ARGS__);              \
    }                                                                          \
  } while (0)

#define LOG_TRACE(...) CLIQUE_LOG_AT(clique::common::LogLevel::TRACE, __VA_ARGS__)
#define LOG_DEBUG(...) CLIQUE_LOG_AT(clique::common::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...) CLIQUE_LOG_AT(clique::common::LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...) CLIQUE_LOG_AT(clique::common::LogLevel::WARN, __VA_ARGS__)
#define LOG_ERROR(...) CLIQUE_LOG_AT(clique::common::LogLevel::ERROR, __VA_ARGS__)

#define LOG_CRITICAL_FAILURE(module, message, ...)                             \
  clique::common::Logger::instance().log_critical_failure(module, message,     \
                                                          ##__VA_ARGS__)

#define LOG_CONSENSUS_ERROR(message, ...)                                      \
  LOG_CRITICAL_FAILURE("consensus", message, ##__VA_ARGS__)

#define LOG_HARNESS_ERROR(message, ...)                                        \
  LOG_CRITICAL_FAILURE("harness", message, ##__VA_ARGS__)
