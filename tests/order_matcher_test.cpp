#include <gtest/gtest.h>
#include "../src/core/memory_store.hpp"
#include "../src/core/order_matcher.hpp"
#include "test_support.hpp"

using namespace exchange_sim;
using exchange_sim::testing_support::FakeMarket;
using exchange_sim::testing_support::make_order;
using exchange_sim::testing_support::stock;

namespace {

struct Harness {
    Harness()
        : model(false),
          executor(store, market, model, bus, config),
          matcher(store, market, executor) {
        market.add_instrument(stock("AAPL"));
        store.create_account("u1", 100000.0);
        Position p;
        p.user_id = "u1";
        p.ticker = "AAPL";
        p.qty = 100;
        p.avg_cost = 100.0;
        store.put_position(p);
    }

    MemoryStore store;
    FakeMarket market;
    ExecutionModel model;
    EventBus bus;
    ExecutionConfig config;
    FillExecutor executor;
    OrderMatcher matcher;
};

PriceState quote(double price, double bid, double ask) {
    PriceState s;
    s.ticker = "AAPL";
    s.price = price;
    s.bid = bid;
    s.ask = ask;
    return s;
}

} // namespace

TEST(OrderMatcherTest, MarketOrderFillsAtAsk) {
    Harness h;
    h.market.set_quote("AAPL", 100.0, 99.9, 100.1);
    h.store.insert_order(make_order("o1", "u1", "AAPL", OrderType::MARKET, OrderSide::BUY, 5));

    auto stats = h.matcher.match_all(1000);
    EXPECT_EQ(stats.scanned, 1u);
    EXPECT_EQ(stats.fills, 1u);
    auto trades = h.store.load_trades("u1");
    ASSERT_EQ(trades.size(), 1u);
    EXPECT_DOUBLE_EQ(trades[0].price, 100.1);
}

TEST(OrderMatcherTest, MarketableLimitChecksSideQuote) {
    auto buy = make_order("b", "u1", "AAPL", OrderType::LIMIT, OrderSide::BUY, 1);
    buy.limit_price = 100.0;
    EXPECT_TRUE(OrderMatcher::is_marketable_limit(buy, quote(100.2, 99.9, 100.0)));
    EXPECT_FALSE(OrderMatcher::is_marketable_limit(buy, quote(99.9, 99.8, 100.01)));

    auto sell = make_order("s", "u1", "AAPL", OrderType::LIMIT, OrderSide::SELL, 1);
    sell.limit_price = 100.0;
    EXPECT_TRUE(OrderMatcher::is_marketable_limit(sell, quote(99.8, 100.0, 100.1)));
    EXPECT_FALSE(OrderMatcher::is_marketable_limit(sell, quote(100.1, 99.99, 100.2)));
}

TEST(OrderMatcherTest, LimitReferenceIsBetterOfQuoteAndLimit) {
    Harness h;
    auto buy = make_order("b", "u1", "AAPL", OrderType::LIMIT, OrderSide::BUY, 3);
    buy.limit_price = 101.0;
    auto req = h.matcher.evaluate(buy, quote(100.0, 99.9, 100.1));
    ASSERT_TRUE(req.has_value());
    EXPECT_DOUBLE_EQ(req->reference_price, 100.1);
    ASSERT_TRUE(req->limit_price.has_value());
    EXPECT_DOUBLE_EQ(*req->limit_price, 101.0);
    EXPECT_DOUBLE_EQ(req->qty, 3);

    auto resting = make_order("r", "u1", "AAPL", OrderType::LIMIT, OrderSide::BUY, 3);
    resting.limit_price = 99.0;
    EXPECT_FALSE(h.matcher.evaluate(resting, quote(100.0, 99.9, 100.1)).has_value());
}

TEST(OrderMatcherTest, SellStopTriggersOnLastPrice) {
    Harness h;
    auto stop = make_order("s1", "u1", "AAPL", OrderType::STOP, OrderSide::SELL, 10);
    stop.stop_price = 95.0;
    h.store.insert_order(stop);

    h.market.set_price("AAPL", 97.0);
    EXPECT_EQ(h.matcher.match_all(1000).fills, 0u);
    h.market.set_price("AAPL", 96.0);
    EXPECT_EQ(h.matcher.match_all(2000).fills, 0u);
    h.market.set_price("AAPL", 94.0);
    EXPECT_EQ(h.matcher.match_all(3000).fills, 1u);

    auto trades = h.store.load_trades("u1");
    ASSERT_EQ(trades.size(), 1u);
    EXPECT_DOUBLE_EQ(trades[0].price, 93.95);
    EXPECT_EQ(h.store.get_order("s1")->status, OrderStatus::FILLED);
}

TEST(OrderMatcherTest, BuyStopTriggersAbove) {
    auto stop = make_order("s", "u1", "AAPL", OrderType::STOP_LOSS, OrderSide::BUY, 1);
    stop.stop_price = 105.0;
    EXPECT_FALSE(OrderMatcher::is_stop_triggered(stop, quote(104.99, 104.9, 105.1)));
    EXPECT_TRUE(OrderMatcher::is_stop_triggered(stop, quote(105.0, 104.9, 105.1)));
}

TEST(OrderMatcherTest, TakeProfitTriggersOnFavorableMove) {
    auto sell = make_order("tp", "u1", "AAPL", OrderType::TAKE_PROFIT, OrderSide::SELL, 1);
    sell.stop_price = 110.0;
    EXPECT_FALSE(OrderMatcher::is_take_profit_triggered(sell, quote(109.0, 108.9, 109.1)));
    EXPECT_TRUE(OrderMatcher::is_take_profit_triggered(sell, quote(110.5, 110.4, 110.6)));

    auto buy = make_order("tp2", "u1", "AAPL", OrderType::TAKE_PROFIT, OrderSide::BUY, 1);
    buy.stop_price = 90.0;
    EXPECT_TRUE(OrderMatcher::is_take_profit_triggered(buy, quote(89.0, 88.9, 89.1)));
    EXPECT_FALSE(OrderMatcher::is_take_profit_triggered(buy, quote(91.0, 90.9, 91.1)));
}

TEST(OrderMatcherTest, TrailingStopFollowsHighAndFires) {
    Harness h;
    auto trail = make_order("t1", "u1", "AAPL", OrderType::TRAILING_STOP, OrderSide::SELL, 10);
    trail.trail_pct = 5.0;
    h.store.insert_order(trail);

    h.market.set_price("AAPL", 100.0);
    EXPECT_EQ(h.matcher.match_all(1000).fills, 0u);
    EXPECT_DOUBLE_EQ(*h.store.get_order("t1")->trail_high, 100.0);

    h.market.set_price("AAPL", 110.0);
    EXPECT_EQ(h.matcher.match_all(2000).fills, 0u);
    EXPECT_DOUBLE_EQ(*h.store.get_order("t1")->trail_high, 110.0);

    // 110 * 0.95 = 104.5
    h.market.set_price("AAPL", 105.0);
    EXPECT_EQ(h.matcher.match_all(3000).fills, 0u);
    EXPECT_DOUBLE_EQ(*h.store.get_order("t1")->trail_high, 110.0);

    h.market.set_price("AAPL", 104.0);
    EXPECT_EQ(h.matcher.match_all(4000).fills, 1u);
    EXPECT_EQ(h.store.get_order("t1")->status, OrderStatus::FILLED);
}

TEST(OrderMatcherTest, BuyTrailingTracksLow) {
    auto trail = make_order("t", "u1", "AAPL", OrderType::TRAILING_STOP, OrderSide::BUY, 1);
    trail.trail_pct = 10.0;
    EXPECT_TRUE(OrderMatcher::update_trailing_extreme(trail, quote(50.0, 49.9, 50.1)));
    EXPECT_TRUE(OrderMatcher::update_trailing_extreme(trail, quote(40.0, 39.9, 40.1)));
    EXPECT_FALSE(OrderMatcher::update_trailing_extreme(trail, quote(43.0, 42.9, 43.1)));
    EXPECT_DOUBLE_EQ(*trail.trail_high, 40.0);
    EXPECT_FALSE(OrderMatcher::is_trailing_stop_triggered(trail, quote(43.0, 42.9, 43.1)));
    EXPECT_TRUE(OrderMatcher::is_trailing_stop_triggered(trail, quote(44.0, 43.9, 44.1)));
}

TEST(OrderMatcherTest, StopLimitWaitsForLimitAfterTrigger) {
    Harness h;
    auto order = make_order("sl", "u1", "AAPL", OrderType::STOP_LIMIT, OrderSide::BUY, 2);
    order.stop_price = 105.0;
    order.limit_price = 106.0;
    h.store.insert_order(order);

    h.market.set_quote("AAPL", 104.0, 103.9, 104.1);
    EXPECT_EQ(h.matcher.match_all(1000).fills, 0u);
    EXPECT_FALSE(h.store.get_order("sl")->stop_triggered);

    // Triggered but the ask is above the limit
    h.market.set_quote("AAPL", 105.2, 105.1, 106.5);
    EXPECT_EQ(h.matcher.match_all(2000).fills, 0u);
    EXPECT_TRUE(h.store.get_order("sl")->stop_triggered);

    // Price falls back below the stop; the trigger is sticky
    h.market.set_quote("AAPL", 104.0, 103.9, 104.1);
    EXPECT_EQ(h.matcher.match_all(3000).fills, 1u);
    auto trades = h.store.load_trades("u1");
    ASSERT_EQ(trades.size(), 1u);
    EXPECT_DOUBLE_EQ(trades[0].price, 104.1);
}

TEST(OrderMatcherTest, OcoSiblingSkippedInSameSweep) {
    Harness h;
    auto take = make_order("tp", "u1", "AAPL", OrderType::TAKE_PROFIT, OrderSide::SELL, 10);
    take.stop_price = 110.0;
    auto stop = make_order("st", "u1", "AAPL", OrderType::STOP, OrderSide::SELL, 10);
    stop.stop_price = 120.0;   // also triggered at 111
    take.oco_id = stop.oco_id = std::string("bracket");
    h.store.insert_order(take);
    h.store.insert_order(stop);

    h.market.set_price("AAPL", 111.0);
    auto stats = h.matcher.match_all(1000);
    EXPECT_EQ(stats.fills, 1u);
    EXPECT_EQ(stats.skipped, 1u);
    EXPECT_EQ(h.store.get_order("tp")->status, OrderStatus::FILLED);
    EXPECT_EQ(h.store.get_order("st")->status, OrderStatus::CANCELLED);
    EXPECT_EQ(h.store.load_trades("u1").size(), 1u);
}

TEST(OrderMatcherTest, UnpricedTickerIsSkipped) {
    Harness h;
    h.store.insert_order(make_order("o1", "u1", "MSFT", OrderType::MARKET, OrderSide::BUY, 1));
    auto stats = h.matcher.match_all(1000);
    EXPECT_EQ(stats.skipped, 1u);
    EXPECT_EQ(h.store.get_order("o1")->status, OrderStatus::OPEN);
}

TEST(OrderMatcherTest, OutageCountsErrorAndLeavesOrders) {
    Harness h;
    h.market.set_price("AAPL", 100.0);
    h.store.insert_order(make_order("o1", "u1", "AAPL", OrderType::MARKET, OrderSide::BUY, 1));
    h.store.set_available(false);
    EXPECT_EQ(h.matcher.match_all(1000).errors, 1u);
    h.store.set_available(true);
    EXPECT_EQ(h.matcher.match_all(2000).fills, 1u);
}
