#include "tradebook/accumulator.hpp"
#include <algorithm>

namespace tradebook {

TradeAccumulator TradeAccumulator::open_from(const Fill& fill) {
    TradeAccumulator acc;
    acc.coin = fill.coin;
    acc.side = fill.side;
    acc.entry_value = fill.price * fill.size;
    acc.entry_size = fill.size;
    acc.fees = fill.fee;
    acc.open_time = fill.time;
    acc.last_time = fill.time;
    acc.last_price = fill.price;
    acc.max_price = fill.price;
    acc.min_price = fill.price;
    acc.fill_ids.push_back(fill.id);
    return acc;
}

void TradeAccumulator::scale_in(const Fill& fill) {
    entry_value += fill.price * fill.size;
    entry_size += fill.size;
    fees += fill.fee;
    fill_ids.push_back(fill.id);
    touch_price(fill.price);
}

void TradeAccumulator::close_with(const Fill& fill) {
    realized_pnl += fill.closed_pnl;
    fees += fill.fee;
    fill_ids.push_back(fill.id);
    touch_price(fill.price);
    exit_value += fill.price * fill.size;
    exit_size += fill.size;
    last_price = fill.price;
    last_time = fill.time;
}

void TradeAccumulator::absorb_unknown(const Fill& fill) {
    fees += fill.fee;
    fill_ids.push_back(fill.id);
    // Only a fill that realized pnl is counted as reducing the position
    if (fill.closed_pnl != 0.0) {
        realized_pnl += fill.closed_pnl;
        exit_value += fill.price * fill.size;
        exit_size += fill.size;
    }
    touch_price(fill.price);
    last_price = fill.price;
    last_time = fill.time;
}

void TradeAccumulator::touch_price(double price) {
    max_price = std::max(max_price, price);
    min_price = std::min(min_price, price);
}

} // namespace tradebook
