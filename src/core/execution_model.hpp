#pragma once

#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include "instruments.hpp"
#include "types.hpp"

namespace exchange_sim {

struct ExecutionInputs {
    Microstructure micro;
    OrderSide side{OrderSide::BUY};
    double qty{0.0};
    double reference_price{0.0};
    double mid_price{0.0};
    double volatility{0.0};
    RegimeKind regime{RegimeKind::NORMAL};
    RegimeMultipliers regime_mult;
    double opens_short_qty{0.0};   // newly opened short quantity charged one day of borrow
};

struct ExecutionEstimate {
    double fill_price{0.0};
    double mid_price{0.0};
    double slippage_bps{0.0};
    double slippage_cost{0.0};
    double commission{0.0};
    double borrow_cost{0.0};
    double notional{0.0};
    double total_cost{0.0};
    double execution_quality_score{100.0};
    double volatility_multiplier{1.0};
    bool limit_capped{false};
    std::string regime;
};

/**
 * Pre-trade estimate returned to order placement.
 */
struct OrderEstimate {
    double est_fill_price{0.0};
    double est_slippage_bps{0.0};
    double est_slippage_cost{0.0};
    double est_commission{0.0};
    double est_borrow_day{0.0};
    double est_total_cost{0.0};
    double est_execution_quality_score{100.0};
    std::string regime;
};

struct FillMetricsSummary {
    size_t count{0};
    double avg_slippage_bps{0.0};
    double avg_execution_quality{0.0};
};

/**
 * Execution cost model.
 *
 * impact_bps = base_spread_bps
 *            + impact_coeff * (notional / ADV)^0.6 * regime.liquidity * vol_mult
 * vol_mult   = clamp(1 + 25 * vol, 0.85, 4)
 * fill       = reference * (1 +/- impact_bps / 1e4)
 * commission = max(commission_min_usd, notional * commission_bps / 1e4)
 * borrow     = opens_short_qty * fill * apr * regime.borrow / 365
 * quality    = clamp(100 - (0.6 impact_bps + 0.3 commission_bps + 0.1 borrow_bps), 0, 100)
 *
 * With realism disabled fills pass through at the reference price with no
 * costs. Also keeps a short ring of recent fills for monitoring.
 */
class ExecutionModel {
public:
    static constexpr size_t kMaxFillMetrics = 5000;
    static constexpr int64_t kFillMetricMemoryMs = 15 * 60 * 1000;

    explicit ExecutionModel(bool realism_enabled = true) : realism_enabled_(realism_enabled) {}

    bool realism_enabled() const { return realism_enabled_; }

    ExecutionEstimate estimate(const ExecutionInputs& in) const;

    // Re-price an estimate whose fill crosses `limit_price`: the fill is
    // capped at the limit and slippage, commission and quality recomputed.
    ExecutionEstimate cap_to_limit(const ExecutionEstimate& est, const ExecutionInputs& in,
                                   double limit_price) const;

    OrderEstimate estimate_order(const ExecutionInputs& in) const;

    double estimate_borrow_accrual(double notional, double borrow_apr, int64_t elapsed_ms,
                                   const RegimeMultipliers& regime) const;

    void record_fill(int64_t timestamp_ms, double slippage_bps, double quality_score);
    FillMetricsSummary recent_metrics(int64_t window_ms, int64_t now_ms) const;

    static double volatility_multiplier(double volatility);

private:
    struct FillPoint {
        int64_t timestamp_ms;
        double slippage_bps;
        double quality;
    };

    bool realism_enabled_;
    mutable std::mutex metrics_mu_;
    std::deque<FillPoint> metrics_;
};

} // namespace exchange_sim
