#include "tradebook/candle_source.hpp"
#include "tradebook/logging.hpp"
#include <httplib.h>
#include <stdexcept>

namespace tradebook {

HttpCandleSource::HttpCandleSource(const std::string& api_url, int timeout_sec)
    : timeout_sec_(timeout_sec) {
    // Split "https://host[:port]/path" into the client base and the request path
    auto scheme_end = api_url.find("://");
    auto path_start = api_url.find('/', scheme_end == std::string::npos ? 0 : scheme_end + 3);
    host_ = api_url.substr(0, path_start);
    path_ = path_start == std::string::npos ? "/" : api_url.substr(path_start);

    logger_ = get_logger("candle_source");
}

nlohmann::json HttpCandleSource::fetch(const std::string& coin, const std::string& interval,
                                       std::int64_t start_ms, std::int64_t end_ms) {
    nlohmann::json payload = {
        {"type", "candleSnapshot"},
        {"req", {
            {"coin", coin},
            {"interval", interval},
            {"startTime", start_ms},
            {"endTime", end_ms}
        }}
    };

    // One client per call so concurrent fetches share no connection state
    httplib::Client client(host_);
    client.set_connection_timeout(timeout_sec_, 0);
    client.set_read_timeout(timeout_sec_, 0);

    logger_->debug("POST {}{} candleSnapshot {} {} [{}, {}]", host_, path_, coin, interval, start_ms, end_ms);
    auto res = client.Post(path_, payload.dump(), "application/json");
    if (!res) {
        throw std::runtime_error("candle request for " + coin + " failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw std::runtime_error("candle request for " + coin + " returned HTTP " + std::to_string(res->status));
    }

    return nlohmann::json::parse(res->body);
}

CachedCandleSource::CachedCandleSource(CandleSource& inner)
    : inner_(inner) {}

nlohmann::json CachedCandleSource::fetch(const std::string& coin, const std::string& interval,
                                         std::int64_t start_ms, std::int64_t end_ms) {
    Key key{coin, interval, start_ms, end_ms};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            return it->second;
        }
    }

    nlohmann::json result = inner_.fetch(coin, interval, start_ms, end_ms);

    std::lock_guard<std::mutex> lock(mutex_);
    cache_.emplace(key, result);
    return result;
}

std::size_t CachedCandleSource::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

} // namespace tradebook
