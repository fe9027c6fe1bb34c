#include "tradebook/finalizer.hpp"
#include <cmath>

namespace tradebook {

Excursion compute_excursion(Side side, double entry_price, double low, double high) {
    Excursion result;
    if (entry_price <= 0) {
        return result;
    }

    bool is_long = side == Side::Buy;
    double adverse_price = is_long ? low : high;
    double favorable_price = is_long ? high : low;

    result.mae = std::abs(adverse_price - entry_price) / entry_price;
    result.mfe = std::abs(favorable_price - entry_price) / entry_price;
    return result;
}

double round_to(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

std::optional<TradeRecord> finalize_trade(const TradeAccumulator& acc) {
    // Orphans have no visible entry; fall back to the last traded price
    double entry_price = acc.entry_size > 0 ? acc.entry_value / acc.entry_size : acc.last_price;
    double exit_price = acc.exit_size > 0 ? acc.exit_value / acc.exit_size : acc.last_price;

    if (std::abs(acc.realized_pnl) < kFlatEpsilon && std::abs(acc.fees) < kFlatEpsilon && !acc.orphan) {
        return std::nullopt;
    }

    Excursion excursion = compute_excursion(acc.side, entry_price, acc.min_price, acc.max_price);

    TradeRecord trade;
    trade.coin = acc.coin;
    trade.side = acc.side;
    trade.entry_price = round_to(entry_price, 8);
    trade.exit_price = round_to(exit_price, 8);
    trade.size = round_to(acc.entry_size, 8);
    trade.pnl = round_to(acc.realized_pnl, 6);
    trade.fees = round_to(acc.fees, 6);
    trade.open_time = acc.open_time;
    trade.close_time = acc.last_time;
    trade.hold_ms = acc.last_time - acc.open_time;
    trade.mae = round_to(excursion.mae, 6);
    trade.mfe = round_to(excursion.mfe, 6);
    trade.fill_ids = acc.fill_ids;
    trade.orphan = acc.orphan;
    return trade;
}

} // namespace tradebook
