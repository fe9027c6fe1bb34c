#include "tradebook/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <stdexcept>

namespace tradebook {

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        try {
            logger = spdlog::stderr_color_mt(name);
        } catch (const spdlog::spdlog_ex&) {
            // Registered concurrently by another thread
            logger = spdlog::get(name);
        }
    }
    return logger;
}

bool is_log_level(const std::string& level) {
    // from_str maps unknown names to off, so "off" itself is checked by name
    return level == "off" || spdlog::level::from_str(level) != spdlog::level::off;
}

void set_log_level(const std::string& level) {
    if (!is_log_level(level)) {
        throw std::runtime_error("Unknown log level: " + level);
    }
    spdlog::set_level(spdlog::level::from_str(level));
}

} // namespace tradebook
