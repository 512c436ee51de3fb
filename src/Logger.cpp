#include "analog-bench/Logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace analogbench {

namespace {
constexpr std::size_t kMaxLogBytes = 10 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;
} // namespace

// Defined here so shared library builds hold a single instance
BenchLogger &BenchLogger::instance() {
  static BenchLogger logger;
  return logger;
}

void BenchLogger::init(const std::string &log_file,
                       spdlog::level::level_enum level) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (logger_) {
    logger_->set_level(level);
    logger_->flush_on(level);
    return;
  }

  try {
    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_level(spdlog::level::info);
    auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file, kMaxLogBytes, kMaxLogFiles);
    file->set_level(spdlog::level::trace);

    std::vector<spdlog::sink_ptr> sinks{console, file};
    logger_ = std::make_shared<spdlog::logger>("analog_bench", sinks.begin(),
                                               sinks.end());
    logger_->set_level(level);
    logger_->flush_on(level);
  } catch (const spdlog::spdlog_ex &ex) {
    fmt::print(stderr, "Log initialization failed: {}\n", ex.what());
  }
}

} // namespace analogbench
