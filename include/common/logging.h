#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <queue>
#include <sstream>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_map>

namespace autoscale {
namespace common {

/**
 * @brief Logging levels for conditional debug output
 *
 * Debug and trace output is skipped entirely (no formatting) unless the
 * current level enables it.
 */
enum class LogLevel {
  TRACE = 0,
  DEBUG = 1,
  INFO = 2,
  WARN = 3,
  ERROR = 4,
  CRITICAL = 5
};

/**
 * @brief Structured log entry
 */
struct LogEntry {
  std::chrono::system_clock::time_point timestamp;
  LogLevel level;
  std::string module;
  std::string thread_id;
  std::string message;
  std::unordered_map<std::string, std::string> context;
};

/**
 * @brief Destination for formatted log entries
 *
 * The default sink writes to stdout. Tests install a capturing sink.
 */
class ILogSink {
public:
  virtual ~ILogSink() = default;
  virtual void write(const LogEntry &entry, const std::string &line) = 0;
};

/**
 * @brief Process-wide logger
 *
 * Thread-safe; level, format and sink can be changed at runtime. With async
 * logging enabled entries are handed to a worker thread through a bounded
 * queue.
 */
class Logger {
public:
  /// Get the singleton logger instance
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

  /// Enable/disable JSON line output
  void set_json_format(bool enabled) noexcept {
    json_format_.store(enabled, std::memory_order_relaxed);
  }

  /// Enable/disable async logging
  void set_async_logging(bool enabled) {
    if (enabled && !async_enabled_.load()) {
      start_async_worker();
    } else if (!enabled && async_enabled_.load()) {
      stop_async_worker();
    }
  }

  /// Replace the output sink; nullptr restores stdout
  void set_sink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
  }

  bool is_debug_enabled() const noexcept {
    return current_level_.load(std::memory_order_relaxed) <=
           static_cast<int>(LogLevel::DEBUG);
  }

  bool is_enabled(LogLevel level) const noexcept {
    return static_cast<int>(level) >=
           current_level_.load(std::memory_order_relaxed);
  }

  /// Log a message under the "general" module. A leading std::string of any
  /// value category is always taken as the module.
  template <typename First, typename... Args,
            typename = std::enable_if_t<
                !std::is_same<std::decay_t<First>, std::string>::value>>
  void log(LogLevel level, First &&first, Args &&...args) {
    if (!is_enabled(level))
      return;

    std::ostringstream oss;
    oss << first;
    (oss << ... << args);

    process_log_entry(LogEntry{std::chrono::system_clock::now(), level,
                               "general", get_thread_id(), oss.str(), {}});
  }

  /// Log with explicit module (preferred)
  template <typename... Args>
  void log(LogLevel level, const std::string &module, Args &&...args) {
    if (!is_enabled(level))
      return;

    std::ostringstream oss;
    (oss << ... << args);

    process_log_entry(LogEntry{std::chrono::system_clock::now(), level,
                               module, get_thread_id(), oss.str(), {}});
  }

  /// Log a structured message with key/value context
  void log_structured(
      LogLevel level, const std::string &module, const std::string &message,
      const std::unordered_map<std::string, std::string> &context = {}) {
    if (!is_enabled(level))
      return;

    process_log_entry(LogEntry{std::chrono::system_clock::now(), level,
                               module, get_thread_id(), message, context});
  }

  std::string format_json(const LogEntry &entry) const;
  std::string format_text(const LogEntry &entry) const;

private:
  Logger()
      : current_level_(static_cast<int>(LogLevel::INFO)), json_format_(false),
        async_enabled_(false), worker_shutdown_(false) {}

  ~Logger() { stop_async_worker(); }

  std::atomic<int> current_level_;
  std::atomic<bool> json_format_;
  std::atomic<bool> async_enabled_;
  std::atomic<bool> worker_shutdown_;

  // Async logging support with bounded queue
  static const size_t MAX_QUEUE_SIZE = 10000;
  std::queue<LogEntry> log_queue_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::thread worker_thread_;

  std::shared_ptr<ILogSink> sink_;
  std::mutex sink_mutex_;

  void process_log_entry(const LogEntry &entry) {
    if (async_enabled_.load()) {
      {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        // Drop oldest entries if queue is full
        if (log_queue_.size() >= MAX_QUEUE_SIZE) {
          log_queue_.pop();
        }
        log_queue_.push(entry);
      }
      queue_cv_.notify_one();
    } else {
      output_log_entry(entry);
    }
  }

  void output_log_entry(const LogEntry &entry);

  std::string get_thread_id() const;
  std::string level_to_string(LogLevel level) const;
  std::string escape_json_string(const std::string &input) const;

  void start_async_worker();
  void stop_async_worker();
  void worker_loop();
};

/// Parse "trace|debug|info|warn|error|critical" (case-insensitive)
bool parse_log_level(const std::string &text, LogLevel &level);

} // namespace common
} // namespace autoscale

/**
 * @brief Logging macros
 *
 * These avoid string formatting overhead when the level is disabled. The
 * first argument may be a module name given as std::string.
 */
#define LOG_TRACE(...)                                                         \
  do {                                                                         \
    if (autoscale::common::Logger::instance().is_enabled(                      \
            autoscale::common::LogLevel::TRACE)) {                             \
      autoscale::common::Logger::instance().log(                               \
          autoscale::common::LogLevel::TRACE, __VA_ARGS__);                    \
    }                                                                          \
  } while (0)

#define LOG_DEBUG(...)                                                         \
  do {                                                                         \
    if (autoscale::common::Logger::instance().is_debug_enabled()) {            \
      autoscale::common::Logger::instance().log(                               \
          autoscale::common::LogLevel::DEBUG, __VA_ARGS__);                    \
    }                                                                          \
  } while (0)

#define LOG_INFO(...)                                                          \
  autoscale::common::Logger::instance().log(autoscale::common::LogLevel::INFO, \
                                            __VA_ARGS__)

#define LOG_WARN(...)                                                          \
  autoscale::common::Logger::instance().log(autoscale::common::LogLevel::WARN, \
                                            __VA_ARGS__)

#define LOG_ERROR(...)                                                         \
  autoscale::common::Logger::instance().log(                                   \
      autoscale::common::LogLevel::ERROR, __VA_ARGS__)

#define LOG_CRITICAL(...)                                                      \
  autoscale::common::Logger::instance().log(                                   \
      autoscale::common::LogLevel::CRITICAL, __VA_ARGS__)

#define LOG_STRUCTURED(level, module, message, ...)                            \
  autoscale::common::Logger::instance().log_structured(level, module, message, \
                                                       ##__VA_ARGS__)
