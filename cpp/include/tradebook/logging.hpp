#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace tradebook {

// Returns the registered logger with this name, creating a colored stderr logger if needed.
// Logs go to stderr; stdout carries the trades JSON
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

// True for the level names spdlog understands ("trace", "debug", "info", "warn",
// "warning", "error", "err", "critical", "off")
bool is_log_level(const std::string& level);

// Applies a level name to every logger.
// Throws std::runtime_error for a name that is not a log level.
void set_log_level(const std::string& level);

} // namespace tradebook
