#include <gtest/gtest.h>
#include "../src/core/errors.hpp"
#include "../src/core/memory_store.hpp"
#include "test_support.hpp"

using namespace exchange_sim;
using exchange_sim::testing_support::make_order;

static Position position_row(const std::string& user, const std::string& ticker, double qty) {
    Position p;
    p.user_id = user;
    p.ticker = ticker;
    p.qty = qty;
    p.avg_cost = 100.0;
    return p;
}

TEST(MemoryStoreTest, CommitPublishesStagedWrites) {
    MemoryStore store;
    store.create_account("u1", 1000.0);
    store.insert_order(make_order("o1", "u1", "AAPL", OrderType::MARKET, OrderSide::BUY, 10));

    {
        auto txn = store.begin("u1");
        auto cash = txn->lock_cash();
        ASSERT_TRUE(cash.has_value());
        txn->set_cash(*cash - 250.0);

        // Staged values are visible inside the transaction only
        EXPECT_DOUBLE_EQ(*txn->lock_cash(), 750.0);

        Position p = position_row("u1", "AAPL", 10);
        txn->upsert_position(p);
        auto order = txn->lock_order("o1");
        ASSERT_TRUE(order.has_value());
        order->status = OrderStatus::FILLED;
        order->filled_qty = 10;
        txn->update_order(*order);
        EXPECT_EQ(txn->lock_positions().size(), 1u);
        txn->commit();
    }

    EXPECT_DOUBLE_EQ(*store.get_cash("u1"), 750.0);
    EXPECT_EQ(store.load_positions("u1").size(), 1u);
    EXPECT_EQ(store.get_order("o1")->status, OrderStatus::FILLED);
    EXPECT_TRUE(store.load_open_orders().empty());
}

TEST(MemoryStoreTest, DestroyingTransactionRollsBack) {
    MemoryStore store;
    store.create_account("u1", 1000.0);
    {
        auto txn = store.begin("u1");
        txn->set_cash(1.0);
        txn->upsert_position(position_row("u1", "AAPL", -3));
        Trade t;
        t.id = "t1";
        t.user_id = "u1";
        txn->append_trade(t);
    }
    EXPECT_DOUBLE_EQ(*store.get_cash("u1"), 1000.0);
    EXPECT_TRUE(store.load_positions("u1").empty());
    EXPECT_TRUE(store.load_trades("u1").empty());
}

TEST(MemoryStoreTest, DeletePositionIsStaged) {
    MemoryStore store;
    store.put_position(position_row("u1", "AAPL", -3));
    store.put_position(position_row("u1", "MSFT", 2));
    {
        auto txn = store.begin("u1");
        txn->delete_position("AAPL");
        EXPECT_FALSE(txn->lock_position("AAPL").has_value());
        EXPECT_EQ(txn->lock_positions().size(), 1u);
        EXPECT_EQ(store.load_positions("u1").size(), 2u);
        txn->commit();
    }
    auto positions = store.load_positions("u1");
    ASSERT_EQ(positions.size(), 1u);
    EXPECT_EQ(positions[0].ticker, "MSFT");
}

TEST(MemoryStoreTest, LockOrderIsScopedToUser) {
    MemoryStore store;
    store.insert_order(make_order("o1", "u1", "AAPL", OrderType::MARKET, OrderSide::BUY, 1));
    auto txn = store.begin("u2");
    EXPECT_FALSE(txn->lock_order("o1").has_value());
}

TEST(MemoryStoreTest, CancelOcoSiblings) {
    MemoryStore store;
    auto a = make_order("a", "u1", "AAPL", OrderType::LIMIT, OrderSide::SELL, 5);
    auto b = make_order("b", "u1", "AAPL", OrderType::STOP, OrderSide::SELL, 5);
    auto c = make_order("c", "u1", "AAPL", OrderType::STOP, OrderSide::SELL, 5);
    auto other = make_order("d", "u2", "AAPL", OrderType::STOP, OrderSide::SELL, 5);
    a.oco_id = b.oco_id = other.oco_id = std::string("grp");
    store.insert_order(a);
    store.insert_order(b);
    store.insert_order(c);
    store.insert_order(other);

    {
        auto txn = store.begin("u1");
        EXPECT_EQ(txn->cancel_oco_siblings("grp", "a", 777), 1);
        // Staged cancellation is not counted twice
        EXPECT_EQ(txn->cancel_oco_siblings("grp", "a", 777), 0);
        txn->commit();
    }
    EXPECT_EQ(store.get_order("b")->status, OrderStatus::CANCELLED);
    EXPECT_EQ(store.get_order("b")->cancelled_at_ms, 777);
    EXPECT_EQ(store.get_order("c")->status, OrderStatus::OPEN);
    EXPECT_EQ(store.get_order("d")->status, OrderStatus::OPEN);
}

TEST(MemoryStoreTest, CancelOrder) {
    MemoryStore store;
    store.insert_order(make_order("o1", "u1", "AAPL", OrderType::LIMIT, OrderSide::BUY, 1));
    EXPECT_TRUE(store.cancel_order("o1", 10));
    EXPECT_FALSE(store.cancel_order("o1", 11));
    EXPECT_FALSE(store.cancel_order("missing", 11));
    EXPECT_EQ(store.get_order("o1")->cancelled_at_ms, 10);
}

TEST(MemoryStoreTest, UnavailableStoreThrows) {
    MemoryStore store;
    store.create_account("u1", 10.0);
    store.set_available(false);
    EXPECT_THROW(store.get_cash("u1"), StorageUnavailable);
    EXPECT_THROW(store.begin("u1"), StorageUnavailable);
    EXPECT_THROW(store.load_open_orders(), StorageError);
    store.set_available(true);
    EXPECT_DOUBLE_EQ(*store.get_cash("u1"), 10.0);
}

TEST(MemoryStoreTest, CandleUpsertMergesBar) {
    MemoryStore store;
    Candle c;
    c.ticker = "AAPL";
    c.interval = "1m";
    c.open_time_ms = 60000;
    c.open = 100;
    c.high = 101;
    c.low = 99;
    c.close = 100.5;
    c.volume = 10;
    store.upsert_candles({c});

    Candle update = c;
    update.open = 999;   // open of an existing bar is kept
    update.high = 103;
    update.low = 99.5;
    update.close = 102;
    update.volume = 5;
    store.upsert_candles({update});

    Candle next = c;
    next.open_time_ms = 120000;
    store.upsert_candles({next});

    auto bars = store.load_candles("AAPL", "1m", 10);
    ASSERT_EQ(bars.size(), 2u);
    EXPECT_DOUBLE_EQ(bars[0].open, 100);
    EXPECT_DOUBLE_EQ(bars[0].high, 103);
    EXPECT_DOUBLE_EQ(bars[0].low, 99);
    EXPECT_DOUBLE_EQ(bars[0].close, 102);
    EXPECT_DOUBLE_EQ(bars[0].volume, 15);

    auto last = store.load_candles("AAPL", "1m", 1);
    ASSERT_EQ(last.size(), 1u);
    EXPECT_EQ(last[0].open_time_ms, 120000);
    EXPECT_TRUE(store.load_candles("AAPL", "5m", 10).empty());
}

TEST(MemoryStoreTest, ActiveRegimeIsLatestOpenRow) {
    MemoryStore store;
    RegimeRecord r1;
    r1.id = "r1";
    r1.started_at_ms = 1;
    store.save_regime(r1);
    r1.ended_at_ms = 5;
    store.save_regime(r1);
    EXPECT_FALSE(store.load_active_regime().has_value());

    RegimeRecord r2;
    r2.id = "r2";
    r2.kind = RegimeKind::HIGH_VOLATILITY;
    r2.started_at_ms = 5;
    store.save_regime(r2);
    auto active = store.load_active_regime();
    ASSERT_TRUE(active.has_value());
    EXPECT_EQ(active->id, "r2");
    EXPECT_EQ(store.regimes().size(), 2u);
}

TEST(MemoryStoreTest, ShortPositionsAcrossUsers) {
    MemoryStore store;
    store.put_position(position_row("u1", "AAPL", -3));
    store.put_position(position_row("u2", "MSFT", -1));
    store.put_position(position_row("u2", "TSLA", 4));
    EXPECT_EQ(store.load_short_positions().size(), 2u);
}
