#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace tradebook {

// Capability to fetch raw candle snapshots for one instrument.
// Implementations throw on failure; the result is the venue's untyped array.
class CandleSource {
public:
    virtual ~CandleSource() = default;

    virtual nlohmann::json fetch(const std::string& coin, const std::string& interval,
                                 std::int64_t start_ms, std::int64_t end_ms) = 0;
};

// Fetches candleSnapshot data from the venue's info endpoint
class HttpCandleSource : public CandleSource {
public:
    explicit HttpCandleSource(const std::string& api_url, int timeout_sec = 30);

    nlohmann::json fetch(const std::string& coin, const std::string& interval,
                         std::int64_t start_ms, std::int64_t end_ms) override;

    const std::string& host() const { return host_; }
    const std::string& path() const { return path_; }

private:
    std::string host_;
    std::string path_;
    int timeout_sec_;
    std::shared_ptr<spdlog::logger> logger_;
};

// Memoizes successful fetches of another source. Failures are not cached.
// A single enrich() pass requests each window once, so this only pays off for
// callers that enrich the same trade set repeatedly (e.g. re-syncing a wallet).
class CachedCandleSource : public CandleSource {
public:
    explicit CachedCandleSource(CandleSource& inner);

    nlohmann::json fetch(const std::string& coin, const std::string& interval,
                         std::int64_t start_ms, std::int64_t end_ms) override;

    std::size_t size() const;

private:
    using Key = std::tuple<std::string, std::string, std::int64_t, std::int64_t>;

    CandleSource& inner_;
    mutable std::mutex mutex_;
    std::map<Key, nlohmann::json> cache_;
};

} // namespace tradebook
