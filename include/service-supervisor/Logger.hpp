#pragma once
#include "service-supervisor/export.h"
#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>

namespace svcsup {

/// Centralized logging with component and operation context
class SERVICE_SUPERVISOR_API SupervisorLogger {
public:
  static SupervisorLogger &instance();

  // Initialize with file and console sinks
  void init(const std::string &log_file = "service_supervisor.log",
            spdlog::level::level_enum level = spdlog::level::info) {
    std::lock_guard<std::mutex> lock(mutex_);

    // If already initialized, just update level
    if (logger_) {
      logger_->set_level(level);
      logger_->flush_on(level);
      return;
    }

    try {
      auto console_sink =
          std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
      console_sink->set_level(spdlog::level::info);

      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          log_file, 1024 * 1024 * 10, 3); // 10MB, 3 files
      file_sink->set_level(spdlog::level::trace);

      std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
      logger_ = std::make_shared<spdlog::logger>("supervisor", sinks.begin(),
                                                 sinks.end());
      logger_->set_level(level);
      logger_->flush_on(level);

      if (!spdlog::get("supervisor")) {
        spdlog::register_logger(logger_);
      }
    } catch (const spdlog::spdlog_ex &ex) {
      fmt::print(stderr, "Log initialization failed: {}\n", ex.what());
    }
  }

  // Drop the logger so a later init() recreates the sinks (used by tests)
  void shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::drop("supervisor");
    logger_.reset();
  }

  bool is_initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logger_ != nullptr;
  }

  template <typename... Args>
  void trace(const std::string &component, const std::string &op,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::trace, component, op, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(const std::string &component, const std::string &op,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::debug, component, op, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const std::string &component, const std::string &op,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::info, component, op, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(const std::string &component, const std::string &op,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::warn, component, op, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const std::string &component, const std::string &op,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::err, component, op, fmt_str,
        std::forward<Args>(args)...);
  }

private:
  SupervisorLogger() = default;

  template <typename... Args>
  void log(spdlog::level::level_enum level, const std::string &component,
           const std::string &op, const std::string &fmt_str,
           Args &&...args) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_)
      return;

    // Format:  [component] [operation] message
    std::string prefix = fmt::format("[{}] [{}] ", component, op);
    std::string full_msg = prefix + fmt::format(fmt::runtime(fmt_str),
                                                std::forward<Args>(args)...);
    logger_->log(level, full_msg);
  }

  std::shared_ptr<spdlog::logger> logger_;
  mutable std::mutex mutex_;
};

/// Parse "trace", "debug", "info", "warn", "error" (anything else is info)
SERVICE_SUPERVISOR_API spdlog::level::level_enum
parse_log_level(const std::string &level);

// Convenience macros
#define LOG_TRACE(component, op, ...)                                          \
  svcsup::SupervisorLogger::instance().trace(component, op, __VA_ARGS__)
#define LOG_DEBUG(component, op, ...)                                          \
  svcsup::SupervisorLogger::instance().debug(component, op, __VA_ARGS__)
#define LOG_INFO(component, op, ...)                                           \
  svcsup::SupervisorLogger::instance().info(component, op, __VA_ARGS__)
#define LOG_WARN(component, op, ...)                                           \
  svcsup::SupervisorLogger::instance().warn(component, op, __VA_ARGS__)
#define LOG_ERROR(component, op, ...)                                          \
  svcsup::SupervisorLogger::instance().error(component, op, __VA_ARGS__)

} // namespace svcsup
