/*
  Logging setup for the "edgetrp" spdlog logger.
*/
#include "edgetrp/core/logging.hpp"

#include <mutex>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace edgetrp::core {

namespace {
std::mutex& logger_mutex() {
  static std::mutex m;
  return m;
}

std::shared_ptr<spdlog::logger>& logger_slot() {
  static std::shared_ptr<spdlog::logger> lg;
  return lg;
}

std::shared_ptr<spdlog::logger> make_default_logger() {
  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto lg = std::make_shared<spdlog::logger>(kLoggerName, sink);
  lg->set_pattern(kLogPattern);
  lg->set_level(spdlog::level::info);
  return lg;
}
} // namespace

std::shared_ptr<spdlog::logger> logger() {
  std::lock_guard<std::mutex> lock(logger_mutex());
  auto& lg = logger_slot();
  if (!lg) lg = make_default_logger();
  return lg;
}

void set_logger(std::shared_ptr<spdlog::logger> lg) {
  std::lock_guard<std::mutex> lock(logger_mutex());
  logger_slot() = lg ? std::move(lg) : make_default_logger();
}

std::shared_ptr<spdlog::logger> init_logging(spdlog::level::level_enum level,
                                             const std::string& log_file) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!log_file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, /*truncate=*/true));
  }
  auto lg = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  lg->set_pattern(kLogPattern);
  lg->set_level(level);
  lg->flush_on(spdlog::level::warn);
  set_logger(lg);
  return lg;
}

} // namespace edgetrp::core
