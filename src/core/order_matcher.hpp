#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include "fill_executor.hpp"
#include "log_throttle.hpp"
#include "market_view.hpp"
#include "store.hpp"

namespace exchange_sim {

struct MatchStats {
    size_t scanned{0};
    size_t fills{0};
    size_t cancelled{0};
    size_t skipped{0};
    size_t errors{0};
};

/**
 * Scans every open order once per tick and hands triggered ones to the
 * FillExecutor. Trigger checks use the last price; fills are referenced to
 * the ask for buys and the bid for sells.
 *
 * Trailing extremes and stop-limit triggers are persisted so they survive a
 * restart. A failing order is logged (throttled) and retried next tick.
 */
class OrderMatcher {
public:
    OrderMatcher(Store& store, MarketView& market, FillExecutor& executor);

    MatchStats match_all(int64_t now_ms);

    // Returns the fill request for `order` at `quote`, or nullopt when the
    // order does not trigger. May persist trailing / stop-limit state.
    std::optional<FillRequest> evaluate(Order& order, const PriceState& quote);

    static bool is_marketable_limit(const Order& order, const PriceState& quote);
    static bool is_stop_triggered(const Order& order, const PriceState& quote);
    static bool is_take_profit_triggered(const Order& order, const PriceState& quote);
    static bool is_trailing_stop_triggered(const Order& order, const PriceState& quote);

    // Moves the trailing extreme favorably; returns true when it changed.
    static bool update_trailing_extreme(Order& order, const PriceState& quote);

private:
    static double side_reference_price(const Order& order, const PriceState& quote);
    static FillRequest market_request(const Order& order, const PriceState& quote);
    static FillRequest limit_request(const Order& order, const PriceState& quote);

    Store& store_;
    MarketView& market_;
    FillExecutor& executor_;
    LogThrottle throttle_;
};

} // namespace exchange_sim
