#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "config.hpp"
#include "event_bus.hpp"
#include "execution_model.hpp"
#include "market_view.hpp"
#include "store.hpp"

namespace exchange_sim {

/**
 * A candidate fill produced by the matcher.
 */
struct FillRequest {
    std::string order_id;
    std::string user_id;
    std::string ticker;
    double qty{0.0};
    double reference_price{0.0};
    std::optional<double> limit_price;   // caps the fill price when set
};

enum class FillOutcome {
    FILLED,       // order fully filled
    PARTIAL,      // filled less than the remaining qty
    CANCELLED,    // unaffordable at any qty
    SKIPPED       // order no longer live, unknown instrument or account
};

const char* to_string(FillOutcome outcome);

struct FillResult {
    FillOutcome outcome{FillOutcome::SKIPPED};
    std::optional<Trade> trade;
    int oco_cancelled{0};
};

/**
 * Executes one fill as a single ledger transaction:
 *   lock order, cash and position -> price via ExecutionModel ->
 *   shrink buys until affordable -> cash, position, trade, order, OCO
 *   siblings -> commit.
 * Selling into an existing short first settles its pending borrow.
 * After commit the transaction is released, then the fill feeds order flow
 * back into the price process and is published on the bus.
 *
 * StorageError propagates with the transaction rolled back.
 */
class FillExecutor {
public:
    FillExecutor(Store& store, MarketView& market, ExecutionModel& model, EventBus& bus,
                 const ExecutionConfig& config);

    FillResult execute(const FillRequest& req, int64_t now_ms);

private:
    Store& store_;
    MarketView& market_;
    ExecutionModel& model_;
    EventBus& bus_;
    ExecutionConfig config_;
};

} // namespace exchange_sim
