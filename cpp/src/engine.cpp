#include "tradebook/engine.hpp"
#include "tradebook/logging.hpp"
#include "tradebook/normalizer.hpp"
#include "tradebook/position_machine.hpp"
#include "tradebook/worker_pool.hpp"
#include <algorithm>
#include <string>

namespace tradebook {

TradeEngine::TradeEngine(std::size_t workers)
    : workers_(workers == 0 ? 1 : workers) {
    logger_ = get_logger("trade_engine");
}

std::vector<TradeRecord> TradeEngine::process(const std::vector<Fill>& fills) const {
    FillsByCoin by_coin = normalize_fills(fills);

    std::vector<const std::vector<Fill>*> sequences;
    sequences.reserve(by_coin.size());
    for (const auto& [coin, coin_fills] : by_coin) {
        sequences.push_back(&coin_fills);
    }

    // One result slot per instrument; each worker owns its slot exclusively
    std::vector<std::vector<TradeRecord>> per_coin(sequences.size());
    run_parallel(sequences.size(), workers_, [&](std::size_t i) {
        per_coin[i] = process_instrument(*sequences[i]);
    });

    std::vector<TradeRecord> trades;
    for (auto& coin_trades : per_coin) {
        for (auto& trade : coin_trades) {
            trades.push_back(std::move(trade));
        }
    }

    std::stable_sort(trades.begin(), trades.end(), [](const TradeRecord& a, const TradeRecord& b) {
        return a.open_time < b.open_time;
    });

    logger_->info("Processed {} fills across {} instruments into {} trades",
                  fills.size(), by_coin.size(), trades.size());
    return trades;
}

} // namespace tradebook
