#include <gtest/gtest.h>
#include <cmath>
#include <optional>
#include <string>
#include <vector>
#include "../src/core/borrow_accrual.hpp"
#include "../src/core/errors.hpp"
#include "../src/core/fill_executor.hpp"
#include "../src/core/memory_store.hpp"
#include "../src/core/position_accounting.hpp"
#include "../src/core/utils.hpp"
#include "test_support.hpp"

using namespace exchange_sim;
using exchange_sim::testing_support::FakeMarket;
using exchange_sim::testing_support::make_order;
using exchange_sim::testing_support::stock;

namespace {

struct Harness {
    explicit Harness(bool realism = true) : model(realism), executor(store, market, model, bus, config) {
        market.add_instrument(stock("AAPL"));
        market.set_quote("AAPL", 100.0, 99.95, 100.05);
        bus.add_fill_listener([this](const FillEvent& ev) { fills.push_back(ev); });
    }

    // Request against a quote with a 0.05 half spread around `price`.
    FillRequest request_at(const Order& o, double price) {
        market.set_price(o.ticker, price);
        FillRequest req = request(o);
        req.reference_price = is_buy(o.side) ? price + 0.05 : price - 0.05;
        return req;
    }

    FillRequest request(const Order& o) {
        FillRequest req;
        req.order_id = o.id;
        req.user_id = o.user_id;
        req.ticker = o.ticker;
        req.qty = o.remaining();
        req.reference_price = is_buy(o.side) ? 100.05 : 99.95;
        return req;
    }

    MemoryStore store;
    FakeMarket market;
    ExecutionModel model;
    EventBus bus;
    ExecutionConfig config;
    FillExecutor executor;
    std::vector<FillEvent> fills;
};

// Net position rebuilt from the trade tape by weighted average cost.
struct Book {
    double qty{0.0};
    double avg_cost{0.0};
};

Book replay(const std::vector<Trade>& trades) {
    Book b;
    for (const auto& t : trades) {
        double signed_qty = is_buy(t.side) ? t.qty : -t.qty;
        double held = std::abs(b.qty);
        bool same_way = held <= kQtyEpsilon || (b.qty > 0.0) == (signed_qty > 0.0);
        if (same_way) {
            b.avg_cost = (held * b.avg_cost + t.qty * t.price) / (held + t.qty);
        } else if (t.qty > held + kQtyEpsilon) {
            b.avg_cost = t.price;
        }
        b.qty += signed_qty;
        if (std::abs(b.qty) <= kQtyEpsilon) b = Book{};
    }
    return b;
}

} // namespace

TEST(FillExecutorTest, MarketBuyOpensPosition) {
    Harness h;
    h.store.create_account("u1", 100000.0);
    auto order = make_order("o1", "u1", "AAPL", OrderType::MARKET, OrderSide::BUY, 10);
    h.store.insert_order(order);

    auto res = h.executor.execute(h.request(order), 5000);
    ASSERT_EQ(res.outcome, FillOutcome::FILLED);
    ASSERT_TRUE(res.trade.has_value());
    EXPECT_GT(res.trade->price, 100.05);
    EXPECT_LT(res.trade->price, 100.2);
    EXPECT_GT(res.trade->slippage_bps, 0.0);
    EXPECT_EQ(res.trade->regime, "normal");

    auto positions = h.store.load_positions("u1");
    ASSERT_EQ(positions.size(), 1u);
    EXPECT_DOUBLE_EQ(positions[0].qty, 10);
    EXPECT_DOUBLE_EQ(positions[0].avg_cost, res.trade->price);

    EXPECT_NEAR(*h.store.get_cash("u1"),
                100000.0 - res.trade->notional - res.trade->commission, 1e-9);
    auto stored = h.store.get_order("o1");
    EXPECT_EQ(stored->status, OrderStatus::FILLED);
    EXPECT_DOUBLE_EQ(stored->filled_qty, 10);
    EXPECT_EQ(stored->filled_at_ms, 5000);
    EXPECT_EQ(h.store.load_trades("u1").size(), 1u);

    ASSERT_EQ(h.fills.size(), 1u);
    EXPECT_EQ(h.fills[0].kind, FillKind::FILL);
    EXPECT_EQ(h.fills[0].order_id, "o1");
    EXPECT_EQ(h.market.flow_calls, 1);
    EXPECT_GT(h.market.flow["AAPL"], 0.0);
    EXPECT_EQ(h.model.recent_metrics(60000, 5000).count, 1u);
}

TEST(FillExecutorTest, CoveringShortRealizesPnlAndDeletesPosition) {
    Harness h;
    h.store.create_account("u1", 10000.0);
    Position p;
    p.user_id = "u1";
    p.ticker = "AAPL";
    p.qty = -5;
    p.avg_cost = 100.0;
    h.store.put_position(p);
    h.market.set_quote("AAPL", 90.0, 89.95, 90.05);

    auto order = make_order("o1", "u1", "AAPL", OrderType::MARKET, OrderSide::BUY, 5);
    h.store.insert_order(order);
    FillRequest req = h.request(order);
    req.reference_price = 90.05;

    auto res = h.executor.execute(req, 5000);
    ASSERT_EQ(res.outcome, FillOutcome::FILLED);
    EXPECT_TRUE(h.store.load_positions("u1").empty());
    double expected = 5 * (100.0 - res.trade->price) - res.trade->commission;
    EXPECT_NEAR(res.trade->pnl, expected, 1e-4);
    EXPECT_DOUBLE_EQ(res.trade->borrow_cost, 0.0);
    EXPECT_GT(h.market.flow["AAPL"], 0.0);
}

TEST(FillExecutorTest, ShortSaleCreditsCash) {
    Harness h(false);
    h.store.create_account("u1", 1000.0);
    auto order = make_order("o1", "u1", "AAPL", OrderType::MARKET, OrderSide::SELL, 4);
    h.store.insert_order(order);

    auto res = h.executor.execute(h.request(order), 5000);
    ASSERT_EQ(res.outcome, FillOutcome::FILLED);
    EXPECT_DOUBLE_EQ(res.trade->price, 99.95);
    EXPECT_NEAR(*h.store.get_cash("u1"), 1000.0 + 399.8, 1e-9);
    auto positions = h.store.load_positions("u1");
    ASSERT_EQ(positions.size(), 1u);
    EXPECT_DOUBLE_EQ(positions[0].qty, -4);
    EXPECT_EQ(positions[0].last_borrow_accrual_ms, 5000);
    EXPECT_LT(h.market.flow["AAPL"], 0.0);
}

TEST(FillExecutorTest, UnaffordableBuyIsReduced) {
    Harness h;
    h.store.create_account("u1", 500.0);
    auto order = make_order("o1", "u1", "AAPL", OrderType::MARKET, OrderSide::BUY, 10);
    h.store.insert_order(order);

    auto res = h.executor.execute(h.request(order), 5000);
    ASSERT_EQ(res.outcome, FillOutcome::PARTIAL);
    EXPECT_DOUBLE_EQ(res.trade->qty, 4);
    EXPECT_GE(*h.store.get_cash("u1"), 0.0);
    auto stored = h.store.get_order("o1");
    EXPECT_EQ(stored->status, OrderStatus::PARTIAL);
    EXPECT_DOUBLE_EQ(stored->remaining(), 6);
}

TEST(FillExecutorTest, BuyWithNoAffordableQtyIsCancelled) {
    Harness h;
    h.store.create_account("u1", 50.0);
    auto order = make_order("o1", "u1", "AAPL", OrderType::MARKET, OrderSide::BUY, 10);
    h.store.insert_order(order);

    auto res = h.executor.execute(h.request(order), 5000);
    EXPECT_EQ(res.outcome, FillOutcome::CANCELLED);
    EXPECT_FALSE(res.trade.has_value());
    auto stored = h.store.get_order("o1");
    EXPECT_EQ(stored->status, OrderStatus::CANCELLED);
    EXPECT_EQ(stored->cancelled_at_ms, 5000);
    EXPECT_DOUBLE_EQ(*h.store.get_cash("u1"), 50.0);
    EXPECT_TRUE(h.fills.empty());
    EXPECT_EQ(h.market.flow_calls, 0);
}

TEST(FillExecutorTest, LimitCapsFillPrice) {
    Harness h;
    h.store.create_account("u1", 100000.0);
    auto order = make_order("o1", "u1", "AAPL", OrderType::LIMIT, OrderSide::BUY, 10);
    order.limit_price = 100.06;
    h.store.insert_order(order);

    FillRequest req = h.request(order);
    req.limit_price = order.limit_price;
    auto res = h.executor.execute(req, 5000);
    ASSERT_EQ(res.outcome, FillOutcome::FILLED);
    EXPECT_DOUBLE_EQ(res.trade->price, 100.06);
}

TEST(FillExecutorTest, FillCancelsOcoSibling) {
    Harness h(false);
    h.store.create_account("u1", 1000.0);
    auto take = make_order("tp", "u1", "AAPL", OrderType::LIMIT, OrderSide::SELL, 2);
    auto stop = make_order("sl", "u1", "AAPL", OrderType::STOP, OrderSide::SELL, 2);
    take.oco_id = stop.oco_id = std::string("bracket");
    h.store.insert_order(take);
    h.store.insert_order(stop);

    auto res = h.executor.execute(h.request(take), 5000);
    ASSERT_EQ(res.outcome, FillOutcome::FILLED);
    EXPECT_EQ(res.oco_cancelled, 1);
    EXPECT_EQ(h.store.get_order("sl")->status, OrderStatus::CANCELLED);

    // The cancelled sibling is skipped if it reaches the executor later
    auto again = h.executor.execute(h.request(stop), 6000);
    EXPECT_EQ(again.outcome, FillOutcome::SKIPPED);
    EXPECT_EQ(h.store.load_trades("u1").size(), 1u);
}

TEST(FillExecutorTest, SkipsWithoutMarketOrAccount) {
    Harness h;
    auto order = make_order("o1", "u1", "AAPL", OrderType::MARKET, OrderSide::BUY, 1);
    h.store.insert_order(order);
    EXPECT_EQ(h.executor.execute(h.request(order), 5000).outcome, FillOutcome::SKIPPED);

    auto unknown = make_order("o2", "u1", "ZZZZ", OrderType::MARKET, OrderSide::BUY, 1);
    h.store.insert_order(unknown);
    h.store.create_account("u1", 1000.0);
    EXPECT_EQ(h.executor.execute(h.request(unknown), 5000).outcome, FillOutcome::SKIPPED);
    EXPECT_EQ(h.store.get_order("o1")->status, OrderStatus::OPEN);
}

TEST(FillExecutorTest, StorageOutageLeavesLedgerUntouched) {
    Harness h;
    h.store.create_account("u1", 1000.0);
    auto order = make_order("o1", "u1", "AAPL", OrderType::MARKET, OrderSide::BUY, 1);
    h.store.insert_order(order);
    h.store.set_available(false);
    EXPECT_THROW(h.executor.execute(h.request(order), 5000), StorageError);
    h.store.set_available(true);
    EXPECT_EQ(h.store.get_order("o1")->status, OrderStatus::OPEN);
    EXPECT_DOUBLE_EQ(*h.store.get_cash("u1"), 1000.0);
    EXPECT_TRUE(h.fills.empty());
}

TEST(FillExecutorTest, FillListenerCanOpenLedgerTransaction) {
    Harness h;
    h.store.create_account("u1", 100000.0);
    std::optional<double> cash_seen;
    h.bus.add_fill_listener([&](const FillEvent& ev) {
        auto txn = h.store.begin(ev.user_id);
        cash_seen = txn->lock_cash();
    });
    auto order = make_order("o1", "u1", "AAPL", OrderType::MARKET, OrderSide::BUY, 2);
    h.store.insert_order(order);

    ASSERT_EQ(h.executor.execute(h.request(order), 5000).outcome, FillOutcome::FILLED);
    ASSERT_TRUE(cash_seen.has_value());
    EXPECT_DOUBLE_EQ(*cash_seen, *h.store.get_cash("u1"));
}

TEST(FillExecutorTest, FillSequenceKeepsLedgerConsistent) {
    Harness h;
    h.store.create_account("u1", 1000.0);

    auto check_ledger = [&]() {
        Book expected = replay(h.store.load_trades("u1"));
        auto positions = h.store.load_positions("u1");
        if (std::abs(expected.qty) <= kQtyEpsilon) {
            EXPECT_TRUE(positions.empty());
            return;
        }
        ASSERT_EQ(positions.size(), 1u);
        EXPECT_NEAR(positions[0].qty, expected.qty, 1e-9);
        EXPECT_NEAR(positions[0].avg_cost, expected.avg_cost, 1e-9);
    };

    // Cash covers only part of the first buy; the rest fills after a top-up
    auto first = make_order("o1", "u1", "AAPL", OrderType::MARKET, OrderSide::BUY, 10);
    h.store.insert_order(first);
    ASSERT_EQ(h.executor.execute(h.request_at(first, 100.0), 1000).outcome, FillOutcome::PARTIAL);
    auto partial = h.store.get_order("o1");
    EXPECT_EQ(partial->status, OrderStatus::PARTIAL);
    EXPECT_GT(partial->filled_qty, 0.0);
    EXPECT_LT(partial->filled_qty, 10.0);
    check_ledger();

    h.store.create_account("u1", 100000.0);
    ASSERT_EQ(h.executor.execute(h.request_at(*partial, 101.0), 2000).outcome, FillOutcome::FILLED);
    auto done = h.store.get_order("o1");
    EXPECT_EQ(done->status, OrderStatus::FILLED);
    EXPECT_GE(done->filled_qty, partial->filled_qty);
    EXPECT_DOUBLE_EQ(done->filled_qty, 10.0);
    check_ledger();

    struct Step {
        OrderSide side;
        double qty;
        double price;
    };
    const std::vector<Step> steps = {
        {OrderSide::SELL, 4, 105.0},    // reduce long
        {OrderSide::BUY, 3, 95.0},      // add to long
        {OrderSide::SELL, 12, 98.0},    // reverse into a short
        {OrderSide::SELL, 2, 97.0},     // add to short
        {OrderSide::BUY, 5, 99.0},      // cover to flat
    };
    int64_t now = 3000;
    int n = 2;
    for (const auto& step : steps) {
        auto order = make_order("o" + std::to_string(n++), "u1", "AAPL", OrderType::MARKET,
                                step.side, step.qty);
        h.store.insert_order(order);
        ASSERT_EQ(h.executor.execute(h.request_at(order, step.price), now).outcome, FillOutcome::FILLED);
        EXPECT_DOUBLE_EQ(h.store.get_order(order.id)->filled_qty, step.qty);
        check_ledger();
        now += 1000;
    }
    EXPECT_TRUE(h.store.load_positions("u1").empty());
    EXPECT_EQ(h.store.load_trades("u1").size(), 7u);
}

TEST(FillExecutorTest, AddingToShortSettlesPendingBorrow) {
    Harness h;
    h.store.create_account("u1", 10000.0);
    Position p;
    p.user_id = "u1";
    p.ticker = "AAPL";
    p.qty = -10;
    p.avg_cost = 100.0;
    p.opened_at_ms = 1000;
    p.last_borrow_accrual_ms = 1000;
    h.store.put_position(p);

    auto order = make_order("o1", "u1", "AAPL", OrderType::MARKET, OrderSide::SELL, 5);
    h.store.insert_order(order);
    auto res = h.executor.execute(h.request(order), 21000);
    ASSERT_EQ(res.outcome, FillOutcome::FILLED);

    // 10 shares at 100 carried for 20 s at 3% APR
    double settled = 1000.0 * 0.03 * 20000.0 / static_cast<double>(utils::kYearMs);
    auto positions = h.store.load_positions("u1");
    ASSERT_EQ(positions.size(), 1u);
    EXPECT_DOUBLE_EQ(positions[0].qty, -15);
    EXPECT_EQ(positions[0].last_borrow_accrual_ms, 21000);
    EXPECT_NEAR(positions[0].accrued_borrow, settled, 1e-8);
    EXPECT_NEAR(*h.store.get_cash("u1"),
                10000.0 + res.trade->notional - res.trade->commission - settled, 1e-8);

    // The next periodic charge covers all 15 shares from the settlement only
    BorrowAccrual accrual(h.store, h.market, h.model, h.config);
    auto stats = accrual.run(21000 + 30000);
    EXPECT_EQ(stats.charged, 1u);
    EXPECT_NEAR(stats.total, 1500.0 * 0.03 * 30000.0 / static_cast<double>(utils::kYearMs), 1e-8);
}
