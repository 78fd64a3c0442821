#include "common/logging.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <thread>

namespace clique {
namespace common {

namespace {

// HH:MM:SS.mmm in local time, or the full UTC date for JSON
std::string format_timestamp(std::chrono::system_clock::time_point tp,
                             bool utc) {
  auto time = std::chrono::system_clock::to_time_t(tp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch())
                .count() %
            1000;

  std::tm parts{};
  if (utc) {
    gmtime_r(&time, &parts);
  } else {
    localtime_r(&time, &parts);
  }

  std::ostringstream oss;
  oss << std::put_time(&parts, utc ? "%Y-%m-%dT%H:%M:%S" : "%H:%M:%S") << '.'
      << std::setfill('0') << std::setw(3) << ms;
  if (utc) {
    oss << 'Z';
  }
  return oss.str();
}

} // namespace

Logger::Logger()
    : current_level_(static_cast<int>(LogLevel::WARN)), json_format_(false),
      out_(&std::cout) {
  configure_from_env(LOG_LEVEL_ENV);
}

void Logger::set_output(std::ostream *out) {
  std::lock_guard<std::mutex> lock(output_mutex_);
  out_ = out ? out : &std::cout;
}

std::string Logger::level_to_string(LogLevel level) {
  static const char *const names[] = {"TRACE", "DEBUG", "INFO",
                                      "WARN",  "ERROR", "CRITICAL"};
  auto index = static_cast<int>(level);
  if (index < 0 || index > static_cast<int>(LogLevel::CRITICAL)) {
    return "UNKNOWN";
  }
  return names[index];
}

bool Logger::parse_level(const std::string &text, LogLevel &out) {
  std::string upper = text;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });

  for (int i = 0; i <= static_cast<int>(LogLevel::CRITICAL); ++i) {
    auto candidate = static_cast<LogLevel>(i);
    if (level_to_string(candidate) == upper) {
      out = candidate;
      return true;
    }
  }
  return false;
}

void Logger::configure_from_env(const char *variable) {
  const char *value = std::getenv(variable);
  if (!value) {
    return;
  }
  LogLevel level;
  if (parse_level(value, level)) {
    set_level(level);
  } else {
    log(LogLevel::WARN, "logging", "Ignoring unknown log level '", value,
        "' in ", variable);
  }
}

LogEntry Logger::make_entry(LogLevel level, const std::string &module,
                            std::string message,
                            std::string error_code) const {
  std::ostringstream thread_id;
  thread_id << std::this_thread::get_id();
  return LogEntry{std::chrono::system_clock::now(),
                  level,
                  module,
                  thread_id.str(),
                  std::move(message),
                  std::move(error_code)};
}

void Logger::write(const LogEntry &entry) {
  auto line = json_format_.load(std::memory_order_relaxed) ? format_json(entry)
                                                          : format_text(entry);
  std::lock_guard<std::mutex> lock(output_mutex_);
  *out_ << line << std::endl;
}

void Logger::log_critical_failure(const std::string &module,
                                  const std::string &message,
                                  const std::string &error_code) {
  auto entry = make_entry(LogLevel::CRITICAL, module, message, error_code);
  write(entry);

  std::lock_guard<std::mutex> lock(output_mutex_);
  if (out_ != &std::cerr) {
    std::cerr << format_text(entry) << std::endl;
  }
}

std::string Logger::format_text(const LogEntry &entry) {
  std::ostringstream text;
  text << '[' << format_timestamp(entry.timestamp, false) << "] ["
       << level_to_string(entry.level) << "] [" << entry.module << "] "
       << entry.message;
  if (!entry.error_code.empty()) {
    text << " (error: " << entry.error_code << ')';
  }
  return text.str();
}

std::string Logger::format_json(const LogEntry &entry) {
  nlohmann::json line = {{"timestamp", format_timestamp(entry.timestamp, true)},
                         {"level", level_to_string(entry.level)},
                         {"module", entry.module},
                         {"thread_id", entry.thread_id},
                         {"message", entry.message}};
  if (!entry.error_code.empty()) {
    line["error_code"] = entry.error_code;
  }
  return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace common
} // namespace clique
