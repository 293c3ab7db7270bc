#include "common/logging.h"
#include "common/types.h"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>

namespace hacluster {
namespace common {

std::string Logger::get_thread_id() const {
  std::ostringstream oss;
  oss << std::this_thread::get_id();
  return oss.str();
}

std::string Logger::level_to_string(LogLevel level) {
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

LogLevel Logger::parse_level(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lower == "trace")
    return LogLevel::TRACE;
  if (lower == "debug")
    return LogLevel::DEBUG;
  if (lower == "warn" || lower == "warning")
    return LogLevel::WARN;
  if (lower == "error")
    return LogLevel::ERROR;
  if (lower == "critical")
    return LogLevel::CRITICAL;
  return LogLevel::INFO;
}

std::string Logger::format_json(const LogEntry &entry) const {
  nlohmann::json j;
  j["timestamp"] = format_iso8601(entry.timestamp);
  j["level"] = level_to_string(entry.level);
  j["module"] = entry.module;
  j["thread_id"] = entry.thread_id;
  j["message"] = entry.message;

  if (!entry.error_code.empty()) {
    j["error_code"] = entry.error_code;
  }
  if (!entry.context.empty()) {
    j["context"] = entry.context;
  }

  // Command output may carry bytes that are not valid UTF-8
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string Logger::format_text(const LogEntry &entry) const {
  std::ostringstream text;

  auto time_t = std::chrono::system_clock::to_time_t(entry.timestamp);
  std::tm local{};
  localtime_r(&time_t, &local);

  text << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "] " << "["
       << level_to_string(entry.level) << "] " << "[" << entry.module << "] "
       << entry.message;

  if (!entry.error_code.empty()) {
    text << " (error: " << entry.error_code << ")";
  }

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

  std::lock_guard<std::mutex> lock(output_mutex_);
  if (sink_) {
    sink_(entry, line);
    return;
  }
  if (entry.level >= LogLevel::ERROR) {
    std::cerr << line << std::endl;
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

  // Flush whatever the worker did not get to
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

} // namespace common
} // namespace hacluster
