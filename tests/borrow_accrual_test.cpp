#include <gtest/gtest.h>
#include "../src/core/borrow_accrual.hpp"
#include "../src/core/memory_store.hpp"
#include "../src/core/utils.hpp"
#include "test_support.hpp"

using namespace exchange_sim;
using exchange_sim::testing_support::FakeMarket;
using exchange_sim::testing_support::stock;

namespace {

struct Harness {
    Harness() : accrual(store, market, model, config) {
        market.add_instrument(stock("AAPL"));
        market.set_price("AAPL", 100.0);
        store.create_account("u1", 10000.0);
    }

    void put_short(double qty, int64_t last_accrual_ms) {
        Position p;
        p.user_id = "u1";
        p.ticker = "AAPL";
        p.qty = qty;
        p.avg_cost = 100.0;
        p.opened_at_ms = last_accrual_ms;
        p.last_borrow_accrual_ms = last_accrual_ms;
        store.put_position(p);
    }

    MemoryStore store;
    FakeMarket market;
    ExecutionModel model;
    ExecutionConfig config;
    BorrowAccrual accrual;
};

} // namespace

TEST(BorrowAccrualTest, ChargesAfterInterval) {
    Harness h;
    h.put_short(-10, 1000);

    auto early = h.accrual.run(1000 + 29999);
    EXPECT_EQ(early.charged, 0u);
    EXPECT_DOUBLE_EQ(*h.store.get_cash("u1"), 10000.0);

    auto stats = h.accrual.run(1000 + 30000);
    EXPECT_EQ(stats.charged, 1u);
    double expected = 1000.0 * 0.03 * 30000.0 / static_cast<double>(utils::kYearMs);
    EXPECT_NEAR(stats.total, expected, 1e-8);
    EXPECT_NEAR(*h.store.get_cash("u1"), 10000.0 - expected, 1e-8);

    auto positions = h.store.load_positions("u1");
    ASSERT_EQ(positions.size(), 1u);
    EXPECT_NEAR(positions[0].accrued_borrow, expected, 1e-8);
    EXPECT_EQ(positions[0].last_borrow_accrual_ms, 31000);

    // Not charged again until another interval passes
    EXPECT_EQ(h.accrual.run(31000 + 1000).charged, 0u);
}

TEST(BorrowAccrualTest, RegimeScalesBorrow) {
    Harness h;
    h.put_short(-10, 1000);
    h.market.set_regime(RegimeKind::EVENT_SHOCK);
    auto stats = h.accrual.run(61000);
    double expected = 1000.0 * 0.03 * 1.5 * 60000.0 / static_cast<double>(utils::kYearMs);
    EXPECT_NEAR(stats.total, expected, 1e-8);
}

TEST(BorrowAccrualTest, LongPositionsAreNotCharged) {
    Harness h;
    h.put_short(10, 1000);
    EXPECT_EQ(h.accrual.run(1000000).charged, 0u);
    EXPECT_DOUBLE_EQ(*h.store.get_cash("u1"), 10000.0);
}

TEST(BorrowAccrualTest, UnpricedShortIsLeftAlone) {
    Harness h;
    Position p;
    p.user_id = "u1";
    p.ticker = "MSFT";
    p.qty = -5;
    p.avg_cost = 50.0;
    p.last_borrow_accrual_ms = 1000;
    h.store.put_position(p);
    EXPECT_EQ(h.accrual.run(1000000).charged, 0u);
    EXPECT_DOUBLE_EQ(*h.store.get_cash("u1"), 10000.0);
}

TEST(BorrowAccrualTest, OutageIsCountedNotThrown) {
    Harness h;
    h.put_short(-10, 1000);
    h.store.set_available(false);
    AccrualStats stats;
    EXPECT_NO_THROW(stats = h.accrual.run(100000));
    EXPECT_EQ(stats.errors, 1u);
    h.store.set_available(true);
    EXPECT_EQ(h.accrual.run(100000).charged, 1u);
}
