#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>

struct LogSettings;

/// Configure console (and optional rotating file) output for every named
/// logger. Loggers created before this call are updated in place.
void init_logging(const LogSettings& settings);

/// Get or create a named logger sharing the configured sinks
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

std::shared_ptr<spdlog::logger> supervisor_logger();
std::shared_ptr<spdlog::logger> worker_logger();
std::shared_ptr<spdlog::logger> daemon_logger();

/// "trace" | "debug" | "info" | "warn" | "error" | "critical" | "off"
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);
