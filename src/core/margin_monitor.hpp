#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "config.hpp"
#include "event_bus.hpp"
#include "execution_model.hpp"
#include "log_throttle.hpp"
#include "market_view.hpp"
#include "store.hpp"

namespace exchange_sim {

// order_id carried by trades that close shorts on a margin call
constexpr const char* kMarginCallOrderId = "margin-call";

struct MarginStats {
    size_t users_checked{0};
    size_t margin_calls{0};
    size_t positions_closed{0};
    size_t errors{0};
};

/**
 * Per-user margin check run after matching:
 *   short_exposure = sum(|short qty| * price)
 *   equity         = cash + sum(signed qty * price)
 * When equity < margin_requirement * short_exposure every short is bought
 * back at the ask through the execution model, in one transaction.
 */
class MarginMonitor {
public:
    MarginMonitor(Store& store, MarketView& market, ExecutionModel& model, EventBus& bus,
                  const ExecutionConfig& config);

    MarginStats run(int64_t now_ms);

    // Checks one user; returns the number of shorts liquidated.
    size_t check_user(const std::string& user_id, int64_t now_ms);

private:
    Store& store_;
    MarketView& market_;
    ExecutionModel& model_;
    EventBus& bus_;
    ExecutionConfig config_;
    LogThrottle throttle_;
};

} // namespace exchange_sim
