#include <gtest/gtest.h>
#include "tradebook/normalizer.hpp"
#include "fill_builder.hpp"

using tradebook::Side;
using tradebook::testing::make_fill;

TEST(NormalizerTest, EmptyInput) {
    EXPECT_TRUE(tradebook::normalize_fills({}).empty());
}

TEST(NormalizerTest, PartitionsByCoinInTimeOrder) {
    std::vector<tradebook::Fill> fills = {
        make_fill(1, "ETH", "Open Long", Side::Buy, 1, 2000, 300, 0),
        make_fill(2, "BTC", "Open Long", Side::Buy, 1, 50000, 200, 0),
        make_fill(3, "ETH", "Close Long", Side::Sell, 1, 2100, 100, 1),
        make_fill(4, "BTC", "Close Long", Side::Sell, 1, 51000, 400, 1),
    };

    auto by_coin = tradebook::normalize_fills(fills);
    ASSERT_EQ(by_coin.size(), 2u);

    const auto& eth = by_coin.at("ETH");
    ASSERT_EQ(eth.size(), 2u);
    EXPECT_EQ(eth[0].id, 3);
    EXPECT_EQ(eth[1].id, 1);

    const auto& btc = by_coin.at("BTC");
    ASSERT_EQ(btc.size(), 2u);
    EXPECT_EQ(btc[0].id, 2);
    EXPECT_EQ(btc[1].id, 4);
}

TEST(NormalizerTest, EqualTimestampsKeepInputOrder) {
    std::vector<tradebook::Fill> fills = {
        make_fill(7, "SOL", "Open Long", Side::Buy, 1, 100, 50, 0),
        make_fill(5, "SOL", "Open Long", Side::Buy, 1, 101, 50, 1),
        make_fill(6, "SOL", "Open Long", Side::Buy, 1, 102, 10, 2),
        make_fill(4, "SOL", "Open Long", Side::Buy, 1, 103, 50, 3),
    };

    const auto sol = tradebook::normalize_fills(fills).at("SOL");
    ASSERT_EQ(sol.size(), 4u);
    EXPECT_EQ(sol[0].id, 6);
    EXPECT_EQ(sol[1].id, 7);
    EXPECT_EQ(sol[2].id, 5);
    EXPECT_EQ(sol[3].id, 4);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
