#include "tradebook/enricher.hpp"
#include "tradebook/finalizer.hpp"
#include "tradebook/json.hpp"
#include "tradebook/logging.hpp"
#include "tradebook/worker_pool.hpp"
#include <algorithm>
#include <limits>
#include <map>
#include <string>

namespace tradebook {

namespace {

struct InstrumentJob {
    std::string coin;
    std::vector<std::size_t> trade_indices;
    std::int64_t start_ms = std::numeric_limits<std::int64_t>::max();
    std::int64_t end_ms = std::numeric_limits<std::int64_t>::min();
};

struct InstrumentOutcome {
    bool failed = false;
    std::size_t enriched_trades = 0;
    std::size_t skipped_candles = 0;
};

} // namespace

bool apply_candles(TradeRecord& trade, const std::vector<Candle>& sorted_candles) {
    double low = std::numeric_limits<double>::max();
    double high = std::numeric_limits<double>::lowest();
    bool overlapped = false;

    for (const auto& candle : sorted_candles) {
        if (candle.start_time > trade.close_time) {
            break;
        }
        if (candle.end_time() <= trade.open_time) {
            continue;
        }
        low = std::min(low, candle.low);
        high = std::max(high, candle.high);
        overlapped = true;
    }

    if (!overlapped) {
        return false;
    }

    Excursion excursion = compute_excursion(trade.side, trade.entry_price, low, high);
    trade.mae = round_to(excursion.mae, 6);
    trade.mfe = round_to(excursion.mfe, 6);
    return true;
}

CandleEnricher::CandleEnricher(CandleSource& source, std::size_t workers)
    : source_(source), workers_(workers == 0 ? 1 : workers) {
    logger_ = get_logger("candle_enricher");
}

EnrichmentReport CandleEnricher::enrich(std::vector<TradeRecord>& trades) {
    std::map<std::string, InstrumentJob> by_coin;
    for (std::size_t i = 0; i < trades.size(); i++) {
        const auto& trade = trades[i];
        auto& job = by_coin[trade.coin];
        job.coin = trade.coin;
        job.trade_indices.push_back(i);
        job.start_ms = std::min(job.start_ms, trade.open_time);
        job.end_ms = std::max(job.end_ms, trade.close_time);
    }

    std::vector<InstrumentJob*> jobs;
    for (auto& [coin, job] : by_coin) {
        jobs.push_back(&job);
    }

    // Each job touches only its own instrument's trades and outcome slot
    std::vector<InstrumentOutcome> outcomes(jobs.size());
    run_parallel(jobs.size(), workers_, [&](std::size_t j) {
        const InstrumentJob& job = *jobs[j];
        InstrumentOutcome& outcome = outcomes[j];

        nlohmann::json raw;
        try {
            raw = source_.fetch(job.coin, "1m", job.start_ms, job.end_ms);
        } catch (const std::exception& e) {
            logger_->warn("Candle fetch failed for {}, keeping fill-based excursions: {}", job.coin, e.what());
            outcome.failed = true;
            return;
        }

        std::vector<Candle> candles = parse_candles(raw, &outcome.skipped_candles);
        if (outcome.skipped_candles > 0) {
            logger_->debug("Skipped {} malformed candles for {}", outcome.skipped_candles, job.coin);
        }
        if (candles.empty()) {
            logger_->warn("No usable candles for {} in [{}, {}]", job.coin, job.start_ms, job.end_ms);
            return;
        }

        for (std::size_t index : job.trade_indices) {
            if (apply_candles(trades[index], candles)) {
                outcome.enriched_trades++;
            }
        }
    });

    EnrichmentReport report;
    report.instruments = jobs.size();
    for (const auto& outcome : outcomes) {
        if (outcome.failed) {
            report.failed_instruments++;
        } else if (outcome.enriched_trades > 0) {
            report.enriched_instruments++;
        }
        report.enriched_trades += outcome.enriched_trades;
        report.skipped_candles += outcome.skipped_candles;
    }

    logger_->info("Enriched {} trades across {}/{} instruments ({} fetches failed)",
                  report.enriched_trades, report.enriched_instruments, report.instruments,
                  report.failed_instruments);
    return report;
}

} // namespace tradebook
