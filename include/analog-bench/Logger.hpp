#pragma once
#include "analog-bench/export.h"

#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include <string>

namespace analogbench {

/// Process-wide bench log. Every line is tagged "[device] [operation]".
/// Nothing is written until init() is called.
class ANALOG_BENCH_API BenchLogger {
public:
  static BenchLogger &instance();

  /// Console sink at info and above, rotating log_file at every level.
  /// Later calls only change the level.
  void init(const std::string &log_file, spdlog::level::level_enum level);

  template <typename... Args>
  void log(spdlog::level::level_enum level, const std::string &device,
           const std::string &operation, const std::string &fmt_str,
           Args &&...args) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_) {
      return;
    }
    logger_->log(level, "[{}] [{}] {}", device, operation,
                 fmt::format(fmt::runtime(fmt_str),
                             std::forward<Args>(args)...));
  }

private:
  BenchLogger() = default;

  std::shared_ptr<spdlog::logger> logger_;
  std::mutex mutex_;
};

#define LOG_DEBUG(device, op, ...)                                             \
  analogbench::BenchLogger::instance().log(spdlog::level::debug, device, op,   \
                                           __VA_ARGS__)
#define LOG_INFO(device, op, ...)                                              \
  analogbench::BenchLogger::instance().log(spdlog::level::info, device, op,    \
                                           __VA_ARGS__)
#define LOG_WARN(device, op, ...)                                              \
  analogbench::BenchLogger::instance().log(spdlog::level::warn, device, op,    \
                                           __VA_ARGS__)
#define LOG_ERROR(device, op, ...)                                             \
  analogbench::BenchLogger::instance().log(spdlog::level::err, device, op,     \
                                           __VA_ARGS__)

} // namespace analogbench
