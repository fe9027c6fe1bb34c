#include "tradebook/stats.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <map>

namespace tradebook {

namespace {

constexpr double kTradingDaysPerYear = 252.0;
constexpr std::int64_t kMsPerDay = 86400000;

std::int64_t utc_day(std::int64_t time_ms) {
    // Floor division so pre-epoch timestamps land on the right day
    std::int64_t day = time_ms / kMsPerDay;
    if (time_ms % kMsPerDay < 0) day--;
    return day;
}

} // namespace

TradeStats compute_stats(const std::vector<TradeRecord>& trades) {
    TradeStats stats;
    if (trades.empty()) {
        return stats;
    }

    double total_win = 0.0;
    double total_loss = 0.0;
    double hold_sum = 0.0;
    std::size_t hold_count = 0;
    double mae_sum = 0.0;
    std::size_t mae_count = 0;
    double mfe_sum = 0.0;
    std::size_t mfe_count = 0;
    std::map<std::int64_t, double> daily_pnl;

    for (const auto& trade : trades) {
        stats.realized_pnl += trade.pnl;
        stats.total_fees += trade.fees;

        if (trade.pnl > 0) {
            stats.wins++;
            total_win += trade.pnl;
            stats.best_trade = std::max(stats.best_trade, trade.pnl);
        } else if (trade.pnl < 0) {
            stats.losses++;
            total_loss += -trade.pnl;
            stats.worst_trade = std::min(stats.worst_trade, trade.pnl);
        }

        if (trade.is_long()) {
            stats.long_count++;
            stats.long_pnl += trade.pnl;
        } else {
            stats.short_count++;
            stats.short_pnl += trade.pnl;
        }

        if (trade.hold_ms > 0) {
            hold_sum += static_cast<double>(trade.hold_ms);
            hold_count++;
        }
        if (trade.mae > 0) {
            mae_sum += trade.mae;
            mae_count++;
        }
        if (trade.mfe > 0) {
            mfe_sum += trade.mfe;
            mfe_count++;
        }

        daily_pnl[utc_day(trade.open_time)] += trade.pnl;
    }

    double n = static_cast<double>(trades.size());
    stats.net_pnl = stats.realized_pnl - stats.total_fees;
    stats.win_rate = static_cast<double>(stats.wins) / n * 100.0;
    stats.avg_win = stats.wins ? total_win / static_cast<double>(stats.wins) : 0.0;
    stats.avg_loss = stats.losses ? total_loss / static_cast<double>(stats.losses) : 0.0;
    stats.profit_factor = total_loss > 0 ? total_win / total_loss : 0.0;
    stats.avg_reward_risk = stats.avg_loss > 0 ? stats.avg_win / stats.avg_loss : 0.0;
    double p_win = stats.win_rate / 100.0;
    stats.expectancy = p_win * stats.avg_win - (1.0 - p_win) * stats.avg_loss;
    stats.avg_hold_ms = hold_count ? hold_sum / static_cast<double>(hold_count) : 0.0;
    stats.avg_mae = mae_count ? mae_sum / static_cast<double>(mae_count) : 0.0;
    stats.avg_mfe = mfe_count ? mfe_sum / static_cast<double>(mfe_count) : 0.0;

    // Sharpe & Sortino over daily pnl; a zero deviation is treated as 1
    double days = static_cast<double>(daily_pnl.size());
    double mean = 0.0;
    for (const auto& [day, pnl] : daily_pnl) mean += pnl;
    mean /= days;
    double var = 0.0;
    double down_var = 0.0;
    for (const auto& [day, pnl] : daily_pnl) {
        var += (pnl - mean) * (pnl - mean);
        if (pnl < 0) down_var += pnl * pnl;
    }
    double stddev = std::sqrt(var / days);
    double down_dev = std::sqrt(down_var / days);
    if (stddev == 0.0) stddev = 1.0;
    if (down_dev == 0.0) down_dev = 1.0;
    stats.sharpe = mean / stddev * std::sqrt(kTradingDaysPerYear);
    stats.sortino = mean / down_dev * std::sqrt(kTradingDaysPerYear);

    // Drawdown and streaks walk the trades in open-time order
    std::vector<const TradeRecord*> ordered;
    ordered.reserve(trades.size());
    for (const auto& trade : trades) ordered.push_back(&trade);
    std::stable_sort(ordered.begin(), ordered.end(), [](const TradeRecord* a, const TradeRecord* b) {
        return a->open_time < b->open_time;
    });

    double peak = 0.0;
    double running = 0.0;
    std::size_t win_streak = 0;
    std::size_t loss_streak = 0;
    for (const auto* trade : ordered) {
        running += trade->pnl - trade->fees;
        peak = std::max(peak, running);
        stats.max_drawdown = std::max(stats.max_drawdown, peak - running);

        // Breakeven trades count toward the loss streak
        if (trade->pnl > 0) {
            win_streak++;
            loss_streak = 0;
        } else {
            loss_streak++;
            win_streak = 0;
        }
        stats.longest_win_streak = std::max(stats.longest_win_streak, win_streak);
        stats.longest_loss_streak = std::max(stats.longest_loss_streak, loss_streak);
    }

    return stats;
}

void print_stats(const TradeStats& stats, std::ostream& out) {
    out << "\n=== Trade Summary ===" << std::endl;
    out << std::fixed << std::setprecision(2);
    out << "Net P&L: $" << stats.net_pnl << std::endl;
    out << "Realized P&L: $" << stats.realized_pnl << std::endl;
    out << "Fees: $" << stats.total_fees << std::endl;
    out << "Win rate: " << stats.win_rate << "% (" << stats.wins << "W / " << stats.losses << "L)" << std::endl;
    out << "Avg win / loss: $" << stats.avg_win << " / $" << stats.avg_loss << std::endl;
    out << "Profit factor: " << stats.profit_factor << std::endl;
    out << "Expectancy: $" << stats.expectancy << std::endl;
    out << "Sharpe / Sortino: " << stats.sharpe << " / " << stats.sortino << std::endl;
    out << "Max drawdown: $" << stats.max_drawdown << std::endl;
    out << "Avg hold: " << stats.avg_hold_ms / 60000.0 << " min" << std::endl;
    out << "Long: " << stats.long_count << " ($" << stats.long_pnl << ")  "
        << "Short: " << stats.short_count << " ($" << stats.short_pnl << ")" << std::endl;
    out << "Best / worst: $" << stats.best_trade << " / $" << stats.worst_trade << std::endl;
    out << "Streaks: " << stats.longest_win_streak << "W / " << stats.longest_loss_streak << "L" << std::endl;
    out << std::setprecision(4);
    out << "Avg MAE / MFE: " << stats.avg_mae * 100.0 << "% / " << stats.avg_mfe * 100.0 << "%" << std::endl;
    out << "=====================" << std::endl;
}

} // namespace tradebook
