#pragma once

#include "candle_source.hpp"
#include "types.hpp"
#include <cstddef>
#include <memory>
#include <vector>
#include <spdlog/spdlog.h>

namespace tradebook {

struct EnrichmentReport {
    std::size_t instruments = 0;
    std::size_t enriched_instruments = 0;
    std::size_t failed_instruments = 0;
    std::size_t enriched_trades = 0;
    std::size_t skipped_candles = 0;
};

// Refines trade mae/mfe from one-minute market candles. One fetch per
// instrument covers all of its trades. Best effort: an instrument whose fetch
// fails or returns nothing usable keeps its fill-based excursions.
class CandleEnricher {
public:
    explicit CandleEnricher(CandleSource& source, std::size_t workers = 1);

    EnrichmentReport enrich(std::vector<TradeRecord>& trades);

private:
    CandleSource& source_;
    std::size_t workers_;
    std::shared_ptr<spdlog::logger> logger_;
};

// Replaces the trade's excursions with those implied by the overlapping candles.
// Returns false (trade untouched) when no candle overlaps the holding period.
bool apply_candles(TradeRecord& trade, const std::vector<Candle>& sorted_candles);

} // namespace tradebook
