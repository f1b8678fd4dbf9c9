#include "common/logging.h"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace autoscale {
namespace common {

std::string Logger::get_thread_id() const {
  std::ostringstream oss;
  oss << std::this_thread::get_id();
  return oss.str();
}

std::string Logger::level_to_string(LogLevel level) const {
  switch (level) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::CRITICAL:
    return "CRITICAL";
  default:
    return "UNKNOWN";
  }
}

std::string Logger::escape_json_string(const std::string &input) const {
  std::ostringstream escaped;
  for (char c : input) {
    switch (c) {
    case '"':
      escaped << "\\\"";
      break;
    case '\\':
      escaped << "\\\\";
      break;
    case '\n':
      escaped << "\\n";
      break;
    case '\r':
      escaped << "\\r";
      break;
    case '\t':
      escaped << "\\t";
      break;
    default:
      if (c >= 0 && c < 32) {
        escaped << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                << static_cast<int>(c);
      } else {
        escaped << c;
      }
      break;
    }
  }
  return escaped.str();
}

std::string Logger::format_json(const LogEntry &entry) const {
  std::ostringstream json;

  auto time_t = std::chrono::system_clock::to_time_t(entry.timestamp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                entry.timestamp.time_since_epoch()) %
            1000;
  std::tm utc{};
  gmtime_r(&time_t, &utc);

  json << "{" << "\"timestamp\":\""
       << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << "."
       << std::setfill('0') << std::setw(3) << ms.count() << "Z\","
       << "\"level\":\"" << level_to_string(entry.level) << "\","
       << "\"module\":\"" << escape_json_string(entry.module) << "\","
       << "\"thread_id\":\"" << escape_json_string(entry.thread_id) << "\","
       << "\"message\":\"" << escape_json_string(entry.message) << "\"";

  if (!entry.context.empty()) {
    json << ",\"context\":{";
    bool first = true;
    for (const auto &[key, value] : entry.context) {
      if (!first)
        json << ",";
      json << "\"" << escape_json_string(key) << "\":\""
           << escape_json_string(value) << "\"";
      first = false;
    }
    json << "}";
  }

  json << "}";
  return json.str();
}

std::string Logger::format_text(const LogEntry &entry) const {
  std::ostringstream text;

  auto time_t = std::chrono::system_clock::to_time_t(entry.timestamp);
  // std::localtime shares one static buffer across threads
  std::tm local{};
  localtime_r(&time_t, &local);

  text << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
       << "] " << "[" << level_to_string(entry.level) << "] " << "["
       << entry.module << "] " << entry.message;

  if (!entry.context.empty()) {
    text << " {";
    bool first = true;
    for (const auto &[key, value] : entry.context) {
      if (!first)
        text << ", ";
      text << key << "=" << value;
      first = false;
    }
    text << "}";
  }

  return text.str();
}

void Logger::output_log_entry(const LogEntry &entry) {
  std::string line =
      json_format_.load() ? format_json(entry) : format_text(entry);

  std::shared_ptr<ILogSink> sink;
  {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink = sink_;
  }

  if (sink) {
    sink->write(entry, line);
  } else {
    std::cout << line << std::endl;
  }
}

void Logger::start_async_worker() {
  if (async_enabled_.load())
    return;

  worker_shutdown_.store(false);
  async_enabled_.store(true);
  worker_thread_ = std::thread(&Logger::worker_loop, this);
}

void Logger::stop_async_worker() {
  if (!async_enabled_.load())
    return;

  worker_shutdown_.store(true);
  queue_cv_.notify_all();

  if (worker_thread_.joinable()) {
    worker_thread_.join();
  }

  async_enabled_.store(false);

  // Flush whatever the worker left behind
  std::lock_guard<std::mutex> lock(queue_mutex_);
  while (!log_queue_.empty()) {
    output_log_entry(log_queue_.front());
    log_queue_.pop();
  }
}

void Logger::worker_loop() {
  while (!worker_shutdown_.load()) {
    std::unique_lock<std::mutex> lock(queue_mutex_);

    queue_cv_.wait(lock, [this] {
      return !log_queue_.empty() || worker_shutdown_.load();
    });

    while (!log_queue_.empty()) {
      auto entry = log_queue_.front();
      log_queue_.pop();
      lock.unlock();

      output_log_entry(entry);

      lock.lock();
    }
  }
}

bool parse_log_level(const std::string &text, LogLevel &level) {
  std::string lowered = text;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lowered == "trace") {
    level = LogLevel::TRACE;
  } else if (lowered == "debug") {
    level = LogLevel::DEBUG;
  } else if (lowered == "info") {
    level = LogLevel::INFO;
  } else if (lowered == "warn" || lowered == "warning") {
    level = LogLevel::WARN;
  } else if (lowered == "error") {
    level = LogLevel::ERROR;
  } else if (lowered == "critical") {
    level = LogLevel::CRITICAL;
  } else {
    return false;
  }
  return true;
}

} // namespace common
} // namespace autoscale
