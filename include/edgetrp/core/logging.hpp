/*
  Logging macros over spdlog.

  All core modules log through one named logger ("edgetrp"). The macros
  record the source file and line so the pattern can print them. The
  compile-time threshold is EDGETRP_LOG_LEVEL (spdlog numbering, default
  info = 2); the runtime threshold is set with init_logging().
*/
#pragma once

#if defined(EDGETRP_LOG_LEVEL)
#define SPDLOG_ACTIVE_LEVEL EDGETRP_LOG_LEVEL
#elif !defined(SPDLOG_ACTIVE_LEVEL)
#define SPDLOG_ACTIVE_LEVEL 2
#endif

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#define EDGETRP_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::edgetrp::core::logger(), __VA_ARGS__)
#define EDGETRP_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::edgetrp::core::logger(), __VA_ARGS__)
#define EDGETRP_LOG_INFO(...) SPDLOG_LOGGER_INFO(::edgetrp::core::logger(), __VA_ARGS__)
#define EDGETRP_LOG_WARN(...) SPDLOG_LOGGER_WARN(::edgetrp::core::logger(), __VA_ARGS__)
#define EDGETRP_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::edgetrp::core::logger(), __VA_ARGS__)
#define EDGETRP_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::edgetrp::core::logger(), __VA_ARGS__)

namespace edgetrp::core {

inline constexpr const char* kLoggerName = "edgetrp";
inline constexpr const char* kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [%s:%#] %v";

// Returns the library logger, creating a colored stderr logger on first use.
// The returned handle stays valid while another thread replaces the logger.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

// Replace the library logger, e.g. with one that writes to a test sink.
void set_logger(std::shared_ptr<spdlog::logger> lg);

// Route library output to stderr and, when log_file is non-empty, to a file
// (truncated). Returns the configured logger.
std::shared_ptr<spdlog::logger> init_logging(spdlog::level::level_enum level,
                                             const std::string& log_file = {});

} // namespace edgetrp::core
