#pragma once

#include "types.hpp"
#include <string>
#include <vector>

namespace tradebook {

// In-progress round trip for one instrument
struct TradeAccumulator {
    std::string coin;
    Side side = Side::Buy;
    double entry_value = 0.0;
    double entry_size = 0.0;
    double exit_value = 0.0;
    double exit_size = 0.0;
    double realized_pnl = 0.0;
    double fees = 0.0;
    std::int64_t open_time = 0;
    std::int64_t last_time = 0;
    double last_price = 0.0;
    double max_price = 0.0;
    double min_price = 0.0;
    std::vector<std::int64_t> fill_ids;
    bool orphan = false;

    // Seed a new round trip as if the fill were opening
    static TradeAccumulator open_from(const Fill& fill);

    void scale_in(const Fill& fill);
    void close_with(const Fill& fill);
    void absorb_unknown(const Fill& fill);

private:
    void touch_price(double price);
};

} // namespace tradebook
