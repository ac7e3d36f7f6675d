#include <gtest/gtest.h>
#include <algorithm>
#include <vector>
#include "../src/core/candle_aggregator.hpp"

using namespace exchange_sim;

namespace {
constexpr int64_t kMinute = 60'000;
// 2024-01-15T10:00:00Z, aligned to every interval up to 1h
constexpr int64_t kT0 = 1705312800000;
}

TEST(CandleAggregatorTest, IntervalNames) {
    EXPECT_EQ(*candle_interval_ms("1m"), kMinute);
    EXPECT_EQ(*candle_interval_ms("4h"), 240 * kMinute);
    EXPECT_EQ(*candle_interval_ms("1D"), 1440 * kMinute);
    EXPECT_FALSE(candle_interval_ms("2m").has_value());
}

TEST(CandleAggregatorTest, TicksFoldIntoOpenBar) {
    CandleAggregator agg;
    agg.seed("AAPL", 100.0, kT0);
    std::vector<Candle> done;
    agg.on_tick("AAPL", 101.0, 10, kT0 + 1000, done);
    agg.on_tick("AAPL", 99.5, 5, kT0 + 2000, done);
    agg.on_tick("AAPL", 100.5, 7, kT0 + 3000, done);
    EXPECT_TRUE(done.empty());

    auto bar = agg.current("AAPL", "1m");
    ASSERT_TRUE(bar.has_value());
    EXPECT_EQ(bar->open_time_ms, kT0);
    EXPECT_DOUBLE_EQ(bar->open, 100.0);
    EXPECT_DOUBLE_EQ(bar->high, 101.0);
    EXPECT_DOUBLE_EQ(bar->low, 99.5);
    EXPECT_DOUBLE_EQ(bar->close, 100.5);
    EXPECT_DOUBLE_EQ(bar->volume, 22.0);
}

TEST(CandleAggregatorTest, BucketRolloverCompletesBar) {
    CandleAggregator agg;
    agg.seed("AAPL", 100.0, kT0);
    std::vector<Candle> done;
    agg.on_tick("AAPL", 102.0, 3, kT0 + 30'000, done);
    agg.on_tick("AAPL", 103.0, 4, kT0 + kMinute + 1, done);

    ASSERT_EQ(done.size(), 1u);
    EXPECT_EQ(done[0].interval, "1m");
    EXPECT_EQ(done[0].open_time_ms, kT0);
    EXPECT_DOUBLE_EQ(done[0].close, 102.0);

    auto bar = agg.current("AAPL", "1m");
    EXPECT_EQ(bar->open_time_ms, kT0 + kMinute);
    EXPECT_DOUBLE_EQ(bar->open, 103.0);
    EXPECT_DOUBLE_EQ(bar->volume, 4.0);

    auto five = agg.current("AAPL", "5m");
    EXPECT_DOUBLE_EQ(five->volume, 7.0);
    EXPECT_DOUBLE_EQ(five->high, 103.0);
}

TEST(CandleAggregatorTest, GapCompletesEveryShorterInterval) {
    CandleAggregator agg;
    agg.seed("AAPL", 100.0, kT0);
    std::vector<Candle> done;
    agg.on_tick("AAPL", 100.0, 1, kT0 + 60 * kMinute, done);
    // 1m, 5m, 15m and 1h all roll; 4h and 1D stay open
    ASSERT_EQ(done.size(), 4u);
    for (const auto& c : done) EXPECT_EQ(c.open_time_ms, kT0);
}

TEST(CandleAggregatorTest, CompletedBarsAreConsistent) {
    CandleAggregator agg;
    agg.seed("MOON", 42.0, kT0);
    std::vector<Candle> done;
    double price = 42.0;
    for (int i = 1; i <= 600; ++i) {
        price += (i % 7 < 3 ? 0.11 : -0.07);
        agg.on_tick("MOON", price, i % 5, kT0 + i * 1000, done);
    }
    ASSERT_FALSE(done.empty());
    for (const auto& c : done) {
        EXPECT_GE(c.high, std::max(c.open, c.close));
        EXPECT_LE(c.low, std::min(c.open, c.close));
        EXPECT_GE(c.volume, 0.0);
    }
}

TEST(CandleAggregatorTest, UnknownTickerOrInterval) {
    CandleAggregator agg;
    EXPECT_FALSE(agg.current("NONE", "1m").has_value());
    agg.seed("AAPL", 100.0, kT0);
    EXPECT_FALSE(agg.current("AAPL", "7m").has_value());

    std::vector<Candle> done;
    agg.on_tick("NEW", 5.0, -3, kT0, done);
    auto bar = agg.current("NEW", "1m");
    ASSERT_TRUE(bar.has_value());
    EXPECT_DOUBLE_EQ(bar->volume, 0.0);
}
