#pragma once

#include <cstdint>
#include <string>
#include <vector>
// spdlog included only in implementation files
// nlohmann/json included only in implementation files

namespace tradebook {

// Net position below this magnitude counts as flat
constexpr double kFlatEpsilon = 1e-9;

// Width of a one-minute candle in milliseconds
constexpr std::int64_t kCandleSpanMs = 60000;

enum class Side {
    Buy,
    Sell
};

// Venue direction tag, classified once at ingestion
enum class Direction {
    Open,
    Close,
    Flip,
    Unknown
};

inline Direction classify_direction(const std::string& dir) {
    if (dir.rfind("Open", 0) == 0) {
        return Direction::Open;
    }
    if (dir.rfind("Close", 0) == 0) {
        return Direction::Close;
    }
    if (dir == "Long > Short" || dir == "Short > Long") {
        return Direction::Flip;
    }
    return Direction::Unknown;
}

struct Fill {
    std::int64_t id = 0;
    std::string coin;
    double price = 0.0;
    double size = 0.0;
    Side side = Side::Buy;
    std::string dir;
    Direction direction = Direction::Unknown;
    std::int64_t time = 0;
    double start_position = 0.0;  // Venue snapshot before this fill, authoritative
    double closed_pnl = 0.0;
    double fee = 0.0;
    std::int64_t order_id = 0;
    std::string hash;
    bool crossed = false;
    std::string account;

    double signed_size() const {
        return side == Side::Buy ? size : -size;
    }

    double end_position() const {
        return start_position + signed_size();
    }
};

struct TradeRecord {
    std::string coin;
    Side side = Side::Buy;
    double entry_price = 0.0;
    double exit_price = 0.0;
    double size = 0.0;
    double pnl = 0.0;
    double fees = 0.0;
    std::int64_t open_time = 0;
    std::int64_t close_time = 0;
    std::int64_t hold_ms = 0;
    double mae = 0.0;
    double mfe = 0.0;
    std::vector<std::int64_t> fill_ids;
    bool orphan = false;

    bool is_long() const {
        return side == Side::Buy;
    }
};

struct Candle {
    std::int64_t start_time = 0;
    double high = 0.0;
    double low = 0.0;

    std::int64_t end_time() const {
        return start_time + kCandleSpanMs;
    }
};

// JSON serialization - see tradebook/json.hpp

} // namespace tradebook
