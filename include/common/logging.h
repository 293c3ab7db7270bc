#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <mutex>
#include <queue>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>

namespace hacluster {
namespace common {

/**
 * @brief Logging levels
 *
 * CRITICAL is reserved for conditions an operator has to act on: a failed
 * promotion, a suspected split brain, a switchover stranded half-way.
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
  std::string error_code;
  std::unordered_map<std::string, std::string> context;
};

/**
 * @brief Process-wide logger
 *
 * Thread-safe; level, format and async mode can be changed at runtime.
 * Entries at ERROR and above go to stderr, everything else to stdout, unless
 * a sink has been installed (tests use this to capture output).
 */
class Logger {
public:
  using Sink = std::function<void(const LogEntry &, const std::string &)>;

  static Logger &instance() {
    static Logger logger;
    return logger;
  }

  void set_level(LogLevel level) noexcept {
    current_level_.store(static_cast<int>(level), std::memory_order_relaxed);
  }

  LogLevel get_level() const noexcept {
    return static_cast<LogLevel>(current_level_.load(std::memory_order_relaxed));
  }

  /// Enable/disable one-JSON-object-per-line output
  void set_json_format(bool enabled) noexcept {
    json_format_.store(enabled, std::memory_order_relaxed);
  }

  /// Enable/disable the background writer thread
  void set_async_logging(bool enabled) {
    if (enabled && !async_enabled_.load()) {
      start_async_worker();
    } else if (!enabled && async_enabled_.load()) {
      stop_async_worker();
    }
  }

  /// Replace the output destination; pass nullptr to restore stdout/stderr
  void set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    sink_ = std::move(sink);
  }

  bool is_debug_enabled() const noexcept {
    return is_enabled(LogLevel::DEBUG);
  }

  bool is_enabled(LogLevel level) const noexcept {
    return static_cast<int>(level) >=
           current_level_.load(std::memory_order_relaxed);
  }

  template <typename... Args>
  void log(LogLevel level, const std::string &module, Args &&...args) {
    if (!is_enabled(level))
      return;

    std::ostringstream oss;
    (oss << ... << args);

    LogEntry entry{std::chrono::system_clock::now(),
                   level,
                   module,
                   get_thread_id(),
                   oss.str(),
                   "",
                   {}};

    process_log_entry(entry);
  }

  /// Log a message with an error code and key/value context
  void log_structured(
      LogLevel level, const std::string &module, const std::string &message,
      const std::string &error_code = "",
      const std::unordered_map<std::string, std::string> &context = {}) {
    if (!is_enabled(level))
      return;

    LogEntry entry{std::chrono::system_clock::now(),
                   level,
                   module,
                   get_thread_id(),
                   message,
                   error_code,
                   context};

    process_log_entry(entry);
  }

  /// Always emitted regardless of the configured level
  void log_critical_failure(
      const std::string &module, const std::string &message,
      const std::string &error_code = "",
      const std::unordered_map<std::string, std::string> &context = {}) {
    LogEntry entry{std::chrono::system_clock::now(),
                   LogLevel::CRITICAL,
                   module,
                   get_thread_id(),
                   message,
                   error_code,
                   context};

    process_log_entry(entry);
  }

  std::string format_json(const LogEntry &entry) const;
  std::string format_text(const LogEntry &entry) const;

  static std::string level_to_string(LogLevel level);

  /// Parses trace/debug/info/warn/error/critical; unknown names map to INFO
  static LogLevel parse_level(const std::string &name);

private:
  Logger()
      : current_level_(static_cast<int>(LogLevel::INFO)), json_format_(false),
        async_enabled_(false), worker_shutdown_(false) {}

  ~Logger() { stop_async_worker(); }

  std::atomic<int> current_level_;
  std::atomic<bool> json_format_;
  std::atomic<bool> async_enabled_;
  std::atomic<bool> worker_shutdown_;

  static const size_t MAX_QUEUE_SIZE = 10000;
  std::queue<LogEntry> log_queue_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::thread worker_thread_;

  std::mutex output_mutex_;
  Sink sink_;

  void process_log_entry(const LogEntry &entry) {
    if (async_enabled_.load()) {
      {
        std::lock_guard<std::mutex> lock(queue_mutex_);
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

  void start_async_worker();
  void stop_async_worker();
  void worker_loop();
};

} // namespace common
} // namespace hacluster

/**
 * @brief Leveled logging macros; the first argument is the module tag
 *
 * LOG_DEBUG and LOG_TRACE skip argument formatting when the level is off.
 */
#define LOG_TRACE(...)                                                         \
  do {                                                                         \
    if (hacluster::common::Logger::instance().is_enabled(                      \
            hacluster::common::LogLevel::TRACE)) {                             \
      hacluster::common::Logger::instance().log(                               \
          hacluster::common::LogLevel::TRACE, __VA_ARGS__);                    \
    }                                                                          \
  } while (0)

#define LOG_DEBUG(...)                                                         \
  do {                                                                         \
    if (hacluster::common::Logger::instance().is_debug_enabled()) {            \
      hacluster::common::Logger::instance().log(                               \
          hacluster::common::LogLevel::DEBUG, __VA_ARGS__);                    \
    }                                                                          \
  } while (0)

#define LOG_INFO(...)                                                          \
  hacluster::common::Logger::instance().log(hacluster::common::LogLevel::INFO, \
                                            __VA_ARGS__)

#define LOG_WARN(...)                                                          \
  hacluster::common::Logger::instance().log(hacluster::common::LogLevel::WARN, \
                                            __VA_ARGS__)

#define LOG_ERROR(...)                                                         \
  hacluster::common::Logger::instance().log(                                   \
      hacluster::common::LogLevel::ERROR, __VA_ARGS__)

#define LOG_STRUCTURED(level, module, message, ...)                            \
  hacluster::common::Logger::instance().log_structured(level, module, message, \
                                                       ##__VA_ARGS__)

#define LOG_CRITICAL_FAILURE(module, message, ...)                             \
  hacluster::common::Logger::instance().log_critical_failure(module, message,  \
                                                             ##__VA_ARGS__)

/**
 * @brief Module-specific critical failure macros
 */
#define LOG_FAILOVER_ERROR(message, ...)                                       \
  LOG_CRITICAL_FAILURE("failover", message, ##__VA_ARGS__)

#define LOG_SWITCHOVER_ERROR(message, ...)                                     \
  LOG_CRITICAL_FAILURE("switchover", message, ##__VA_ARGS__)

#define LOG_CLUSTER_ERROR(message, ...)                                        \
  LOG_CRITICAL_FAILURE("cluster", message, ##__VA_ARGS__)
