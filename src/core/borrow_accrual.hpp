#pragma once

#include <cstddef>
#include <cstdint>
#include "config.hpp"
#include "execution_model.hpp"
#include "instruments.hpp"
#include "log_throttle.hpp"
#include "market_view.hpp"
#include "store.hpp"

namespace exchange_sim {

struct AccrualStats {
    size_t charged{0};
    double total{0.0};
    size_t errors{0};
};

/**
 * Brings the borrow on short `pos` up to `now_ms` at price `mark`: the
 * amount since its last accrual is added to accrued_borrow, the accrual
 * timestamp moves to now_ms and the amount is returned for the caller to
 * debit from cash.
 */
double settle_borrow(Position& pos, const InstrumentDef& def, double mark,
                     const ExecutionModel& model, const RegimeMultipliers& mult, int64_t now_ms);

/**
 * Charges short-borrow cost on every short position once its accrual
 * interval has elapsed. Each charge is one ledger transaction that re-reads
 * the position under lock, so a fill that closes or resets the short in the
 * meantime is never charged twice.
 */
class BorrowAccrual {
public:
    BorrowAccrual(Store& store, MarketView& market, ExecutionModel& model,
                  const ExecutionConfig& config);

    AccrualStats run(int64_t now_ms);

private:
    // Returns the amount charged (0 when nothing was due).
    double accrue(const Position& snapshot, int64_t now_ms);

    Store& store_;
    MarketView& market_;
    ExecutionModel& model_;
    ExecutionConfig config_;
    LogThrottle throttle_;
};

} // namespace exchange_sim
