#pragma once

#include "accumulator.hpp"
#include "types.hpp"
#include <optional>

namespace tradebook {

struct Excursion {
    double mae = 0.0;
    double mfe = 0.0;
};

// Adverse/favorable excursion of [low, high] relative to entry, as fractions.
// Longs suffer at the low and profit at the high; shorts the reverse.
Excursion compute_excursion(Side side, double entry_price, double low, double high);

double round_to(double value, int decimals);

// Converts a completed accumulator into a trade record.
// Returns std::nullopt for zero-pnl, zero-fee, non-orphan bookkeeping artifacts.
std::optional<TradeRecord> finalize_trade(const TradeAccumulator& acc);

} // namespace tradebook
