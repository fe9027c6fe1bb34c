#include <gtest/gtest.h>
#include "tradebook/stats.hpp"
#include <sstream>

using tradebook::Side;
using tradebook::TradeRecord;

namespace {

TradeRecord make_trade(Side side, double pnl, std::int64_t open_time, std::int64_t hold_ms,
                       double mae = 0.0, double mfe = 0.0) {
    TradeRecord trade;
    trade.coin = "BTC";
    trade.side = side;
    trade.pnl = pnl;
    trade.fees = 1.0;
    trade.open_time = open_time;
    trade.close_time = open_time + hold_ms;
    trade.hold_ms = hold_ms;
    trade.mae = mae;
    trade.mfe = mfe;
    return trade;
}

constexpr std::int64_t kDay = 86400000;

} // namespace

class TradeStatsTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Deliberately out of open-time order
        trades_ = {
            make_trade(Side::Buy, 60, 2 * kDay, 3000),
            make_trade(Side::Buy, 100, 0, 1000, 0.01, 0.05),
            make_trade(Side::Buy, -30, kDay, 0),
            make_trade(Side::Sell, -50, 3600000, 2000, 0.02, 0.0),
        };
    }

    std::vector<TradeRecord> trades_;
};

TEST_F(TradeStatsTest, EmptyTradeSet) {
    auto stats = tradebook::compute_stats({});
    EXPECT_EQ(stats.wins, 0u);
    EXPECT_DOUBLE_EQ(stats.net_pnl, 0.0);
    EXPECT_DOUBLE_EQ(stats.sharpe, 0.0);
}

TEST_F(TradeStatsTest, PnlAndWinLoss) {
    auto stats = tradebook::compute_stats(trades_);
    EXPECT_DOUBLE_EQ(stats.realized_pnl, 80.0);
    EXPECT_DOUBLE_EQ(stats.total_fees, 4.0);
    EXPECT_DOUBLE_EQ(stats.net_pnl, 76.0);
    EXPECT_EQ(stats.wins, 2u);
    EXPECT_EQ(stats.losses, 2u);
    EXPECT_DOUBLE_EQ(stats.win_rate, 50.0);
    EXPECT_DOUBLE_EQ(stats.avg_win, 80.0);
    EXPECT_DOUBLE_EQ(stats.avg_loss, 40.0);
    EXPECT_DOUBLE_EQ(stats.profit_factor, 2.0);
    EXPECT_DOUBLE_EQ(stats.avg_reward_risk, 2.0);
    EXPECT_DOUBLE_EQ(stats.expectancy, 20.0);
    EXPECT_DOUBLE_EQ(stats.best_trade, 100.0);
    EXPECT_DOUBLE_EQ(stats.worst_trade, -50.0);
}

TEST_F(TradeStatsTest, SidesHoldAndExcursions) {
    auto stats = tradebook::compute_stats(trades_);
    EXPECT_EQ(stats.long_count, 3u);
    EXPECT_EQ(stats.short_count, 1u);
    EXPECT_DOUBLE_EQ(stats.long_pnl, 130.0);
    EXPECT_DOUBLE_EQ(stats.short_pnl, -50.0);
    // The zero-hold trade is excluded
    EXPECT_DOUBLE_EQ(stats.avg_hold_ms, 2000.0);
    EXPECT_DOUBLE_EQ(stats.avg_mae, 0.015);
    EXPECT_DOUBLE_EQ(stats.avg_mfe, 0.05);
}

TEST_F(TradeStatsTest, DrawdownAndStreaksFollowOpenTime) {
    auto stats = tradebook::compute_stats(trades_);
    // Equity after fees: 99, 48, 17, 76
    EXPECT_DOUBLE_EQ(stats.max_drawdown, 82.0);
    EXPECT_EQ(stats.longest_win_streak, 1u);
    EXPECT_EQ(stats.longest_loss_streak, 2u);
}

TEST_F(TradeStatsTest, DailySharpeAndSortino) {
    auto stats = tradebook::compute_stats(trades_);
    // Daily pnl: 50, -30, 60
    EXPECT_NEAR(stats.sharpe, 10.510269, 1e-5);
    EXPECT_NEAR(stats.sortino, 24.440404, 1e-5);
}

TEST_F(TradeStatsTest, PrintsSummary) {
    std::ostringstream out;
    tradebook::print_stats(tradebook::compute_stats(trades_), out);
    EXPECT_NE(out.str().find("Net P&L: $76.00"), std::string::npos);
    EXPECT_NE(out.str().find("Win rate: 50.00% (2W / 2L)"), std::string::npos);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
