#include "tradebook/config.hpp"
#include "tradebook/logging.hpp"
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace tradebook {

Config load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    nlohmann::json json;
    try {
        in >> json;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    }
    if (!json.is_object()) {
        throw std::runtime_error("Config file " + path + " must contain a JSON object");
    }

    Config config;
    config.api_url = json.value("api_url", config.api_url);
    config.engine_workers = json.value("engine_workers", config.engine_workers);
    config.enrich_workers = json.value("enrich_workers", config.enrich_workers);
    config.http_timeout_sec = json.value("http_timeout_sec", config.http_timeout_sec);
    config.log_level = json.value("log_level", config.log_level);
    if (!is_log_level(config.log_level)) {
        throw std::runtime_error("Invalid config file " + path + ": unknown log_level '" + config.log_level + "'");
    }
    return config;
}

} // namespace tradebook
