#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>
#include "../src/core/exchange.hpp"
#include "../src/core/memory_store.hpp"
#include "test_support.hpp"

using namespace exchange_sim;
using exchange_sim::testing_support::make_order;

namespace {

constexpr int64_t kT0 = 1705312800000;   // 2024-01-15T10:00:00Z

struct Fixture {
    explicit Fixture(Config cfg = Config{})
        : store(std::make_shared<MemoryStore>()),
          exchange(cfg, store, InstrumentCatalog::defaults(), 42) {
        exchange.init(kT0);
    }

    std::shared_ptr<MemoryStore> store;
    Exchange exchange;
};

} // namespace

TEST(ExchangeTest, TickRunsWholePipeline) {
    Fixture f;
    f.store->create_account("u1", 100000.0);
    f.store->insert_order(make_order("o1", "u1", "AAPL", OrderType::MARKET, OrderSide::BUY, 10));

    std::vector<FillEvent> fills;
    f.exchange.bus().add_fill_listener([&](const FillEvent& ev) { fills.push_back(ev); });

    EXPECT_TRUE(f.exchange.tick_once(kT0 + 1000));
    EXPECT_EQ(f.exchange.ticks_run(), 1u);
    EXPECT_EQ(f.exchange.last_match_stats().fills, 1u);
    EXPECT_EQ(f.store->get_order("o1")->status, OrderStatus::FILLED);
    ASSERT_EQ(fills.size(), 1u);

    auto quote = f.exchange.market().price("AAPL");
    ASSERT_TRUE(quote.has_value());
    EXPECT_GT(fills[0].price, quote->ask);
    EXPECT_GT(f.exchange.market().order_flow("AAPL"), 0.0);
    EXPECT_EQ(f.exchange.execution_model().recent_metrics(60000, kT0 + 1000).count, 1u);
}

TEST(ExchangeTest, PausedTicksAreSkipped) {
    Fixture f;
    f.exchange.pause("maintenance");
    EXPECT_TRUE(f.exchange.paused());
    EXPECT_FALSE(f.exchange.tick_once(kT0 + 1000));
    EXPECT_EQ(f.exchange.skipped_ticks(), 1u);
    EXPECT_EQ(f.exchange.market().tick_count(), 0u);

    f.exchange.resume();
    EXPECT_TRUE(f.exchange.tick_once(kT0 + 2000));
    EXPECT_EQ(f.exchange.market().tick_count(), 1u);
}

TEST(ExchangeTest, OverlappingTickIsSkipped) {
    Fixture f;
    std::vector<bool> nested;
    f.exchange.bus().add_tick_listener([&](const std::vector<TickEvent>&) {
        nested.push_back(f.exchange.tick_once(kT0 + 1500));
    });

    EXPECT_TRUE(f.exchange.tick_once(kT0 + 1000));
    ASSERT_EQ(nested.size(), 1u);
    EXPECT_FALSE(nested[0]);
    EXPECT_EQ(f.exchange.skipped_ticks(), 1u);
    EXPECT_EQ(f.exchange.ticks_run(), 1u);
}

TEST(ExchangeTest, StorageOutageDoesNotStopTicks) {
    Fixture f;
    f.store->create_account("u1", 100000.0);
    f.store->insert_order(make_order("o1", "u1", "AAPL", OrderType::MARKET, OrderSide::BUY, 1));
    f.store->set_available(false);
    EXPECT_TRUE(f.exchange.tick_once(kT0 + 1000));
    EXPECT_EQ(f.exchange.last_match_stats().errors, 1u);

    f.store->set_available(true);
    EXPECT_TRUE(f.exchange.tick_once(kT0 + 2000));
    EXPECT_EQ(f.store->get_order("o1")->status, OrderStatus::FILLED);
}

TEST(ExchangeTest, ShortUnderMarginIsLiquidated) {
    Fixture f;
    double price = f.exchange.market().price("AAPL")->price;
    f.store->create_account("u1", price * 10 * 0.5);
    Position p;
    p.user_id = "u1";
    p.ticker = "AAPL";
    p.qty = -10;
    p.avg_cost = price;
    p.opened_at_ms = kT0;
    p.last_borrow_accrual_ms = kT0;
    f.store->put_position(p);

    EXPECT_TRUE(f.exchange.tick_once(kT0 + 1000));
    EXPECT_TRUE(f.store->load_positions("u1").empty());
    auto trades = f.store->load_trades("u1");
    ASSERT_EQ(trades.size(), 1u);
    EXPECT_EQ(trades[0].order_id, kMarginCallOrderId);
}

TEST(ExchangeTest, EstimateChargesBorrowOnlyForNewShort) {
    Fixture f;
    auto buy = f.exchange.estimate_order("", "AAPL", OrderSide::BUY, 10);
    ASSERT_TRUE(buy.has_value());
    EXPECT_GT(buy->est_fill_price, f.exchange.market().price("AAPL")->ask);
    EXPECT_DOUBLE_EQ(buy->est_borrow_day, 0.0);
    EXPECT_EQ(buy->regime, "normal");

    auto naked = f.exchange.estimate_order("u1", "AAPL", OrderSide::SELL, 10);
    ASSERT_TRUE(naked.has_value());
    EXPECT_GT(naked->est_borrow_day, 0.0);

    Position p;
    p.user_id = "u1";
    p.ticker = "AAPL";
    p.qty = 20;
    p.avg_cost = 100.0;
    f.store->put_position(p);
    auto covered = f.exchange.estimate_order("u1", "AAPL", OrderSide::SELL, 10);
    ASSERT_TRUE(covered.has_value());
    EXPECT_DOUBLE_EQ(covered->est_borrow_day, 0.0);

    EXPECT_FALSE(f.exchange.estimate_order("u1", "NOPE", OrderSide::BUY, 1).has_value());
    EXPECT_FALSE(f.exchange.estimate_order("u1", "AAPL", OrderSide::BUY, 0).has_value());
}

TEST(ExchangeTest, SchedulerTicksUntilStopped) {
    Config cfg;
    cfg.engine.tick_interval_ms = 10;
    auto store = std::make_shared<MemoryStore>();
    Exchange exchange(cfg, store, InstrumentCatalog::defaults(), 1);
    exchange.start();
    EXPECT_TRUE(exchange.running());
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    exchange.stop();
    EXPECT_FALSE(exchange.running());
    EXPECT_GT(exchange.ticks_run(), 0u);
    EXPECT_EQ(store->load_price_states().size(), exchange.market().catalog().size());
}

TEST(ExchangeTest, OrderBookAroundLastPrice) {
    Fixture f;
    auto quote = f.exchange.market().price("AAPL");
    ASSERT_TRUE(quote.has_value());

    auto book = f.exchange.order_book("AAPL");
    ASSERT_TRUE(book.has_value());
    EXPECT_EQ(book->bids.size(), kBookDepth);
    EXPECT_EQ(book->asks.size(), kBookDepth);
    EXPECT_DOUBLE_EQ(book->mid, quote->price);
    EXPECT_LT(book->bids[0].price, quote->price);
    EXPECT_GT(book->asks[0].price, quote->price);
    EXPECT_FALSE(f.exchange.order_book("NOPE").has_value());

    // Without the order table the synthetic depth is still served
    f.store->set_available(false);
    EXPECT_TRUE(f.exchange.order_book("AAPL").has_value());
}
