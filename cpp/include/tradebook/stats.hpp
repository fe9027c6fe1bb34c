#pragma once

#include "types.hpp"
#include <cstddef>
#include <ostream>
#include <vector>

namespace tradebook {

struct TradeStats {
    double net_pnl = 0.0;        // Realized pnl minus fees
    double realized_pnl = 0.0;
    double total_fees = 0.0;
    double win_rate = 0.0;       // Percent
    std::size_t wins = 0;
    std::size_t losses = 0;
    double avg_win = 0.0;
    double avg_loss = 0.0;       // Magnitude
    double profit_factor = 0.0;
    double avg_reward_risk = 0.0;
    double expectancy = 0.0;
    double sharpe = 0.0;         // Daily pnl, annualized
    double sortino = 0.0;
    double max_drawdown = 0.0;
    double avg_hold_ms = 0.0;
    std::size_t long_count = 0;
    std::size_t short_count = 0;
    double long_pnl = 0.0;
    double short_pnl = 0.0;
    double best_trade = 0.0;
    double worst_trade = 0.0;
    std::size_t longest_win_streak = 0;
    std::size_t longest_loss_streak = 0;
    double avg_mae = 0.0;
    double avg_mfe = 0.0;
};

TradeStats compute_stats(const std::vector<TradeRecord>& trades);

void print_stats(const TradeStats& stats, std::ostream& out);

} // namespace tradebook
