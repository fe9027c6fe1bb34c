#pragma once

#include <cstddef>
#include <string>

namespace tradebook {

struct Config {
    std::string api_url = "https://api.hyperliquid.xyz/info";
    std::size_t engine_workers = 1;
    std::size_t enrich_workers = 4;
    int http_timeout_sec = 30;
    std::string log_level = "info";
};

// Reads a JSON config file; absent keys keep their defaults.
// Throws std::runtime_error if the file cannot be read or parsed.
Config load_config(const std::string& path);

} // namespace tradebook
