#include "execution_model.hpp"
#include <algorithm>
#include <cmath>
#include "utils.hpp"

namespace exchange_sim {

namespace {

constexpr double kMinRegimeMult = 0.25;

RegimeMultipliers floor_multipliers(const RegimeMultipliers& m) {
    return {std::max(kMinRegimeMult, m.liquidity), std::max(kMinRegimeMult, m.volatility),
            std::max(kMinRegimeMult, m.news), std::max(kMinRegimeMult, m.borrow)};
}

double finite_or(double v, double fallback) {
    return std::isfinite(v) ? v : fallback;
}

double quality(double impact_bps, double commission_bps, double borrow_bps) {
    return utils::clamp(100.0 - (impact_bps * 0.6 + commission_bps * 0.3 + borrow_bps * 0.1),
                        0.0, 100.0);
}

// Slippage cost, commission, borrow, total and quality for a fixed fill price.
void price_costs(ExecutionEstimate& est, const ExecutionInputs& in, double qty, double impact_bps,
                 const RegimeMultipliers& regime) {
    double direction = is_buy(in.side) ? 1.0 : -1.0;
    est.notional = qty * est.fill_price;
    est.slippage_cost = std::max(0.0, direction * (est.fill_price - est.mid_price) * qty);
    est.commission = std::max(in.micro.commission_min_usd,
                              est.notional * in.micro.commission_bps / 10000.0);
    double opens_short = std::max(0.0, finite_or(in.opens_short_qty, 0.0));
    est.borrow_cost = opens_short > 0.0
        ? opens_short * est.fill_price * (in.micro.borrow_apr_short * regime.borrow / 365.0)
        : 0.0;
    est.total_cost = est.slippage_cost + est.commission + est.borrow_cost;
    double commission_bps = est.notional > 0.0 ? est.commission / est.notional * 10000.0 : 0.0;
    double borrow_bps = est.notional > 0.0 ? est.borrow_cost / est.notional * 10000.0 : 0.0;
    est.execution_quality_score = quality(impact_bps, commission_bps, borrow_bps);
}

void round_estimate(ExecutionEstimate& est) {
    est.fill_price = utils::round_to(est.fill_price, 8);
    est.mid_price = utils::round_to(est.mid_price, 8);
    est.slippage_bps = utils::round_to(est.slippage_bps, 4);
    est.slippage_cost = utils::round_to(est.slippage_cost, 4);
    est.commission = utils::round_to(est.commission, 4);
    est.borrow_cost = utils::round_to(est.borrow_cost, 4);
    est.notional = utils::round_to(est.notional, 4);
    est.total_cost = utils::round_to(est.total_cost, 4);
    est.execution_quality_score = utils::round_to(est.execution_quality_score, 4);
    est.volatility_multiplier = utils::round_to(est.volatility_multiplier, 4);
}

} // namespace

double ExecutionModel::volatility_multiplier(double volatility) {
    double vol = std::max(0.0, finite_or(volatility, 0.0));
    return utils::clamp(1.0 + vol * 25.0, 0.85, 4.0);
}

ExecutionEstimate ExecutionModel::estimate(const ExecutionInputs& in) const {
    double qty = std::max(0.0, finite_or(in.qty, 0.0));
    double reference = std::max(0.0, finite_or(in.reference_price, 0.0));
    double mid = std::max(1e-7, finite_or(in.mid_price > 0.0 ? in.mid_price : reference, reference));

    ExecutionEstimate est;
    est.mid_price = mid;
    if (!realism_enabled_) {
        est.fill_price = utils::round_to(reference, 8);
        est.mid_price = utils::round_to(mid, 8);
        est.notional = utils::round_to(reference * qty, 2);
        est.regime = "legacy";
        return est;
    }

    RegimeMultipliers regime = floor_multipliers(in.regime_mult);
    double adv = std::max(1.0, in.micro.avg_daily_dollar_volume);
    double impact_ratio = reference * qty / adv;
    est.volatility_multiplier = volatility_multiplier(in.volatility);
    double impact_bps = in.micro.base_spread_bps
        + in.micro.impact_coeff * std::pow(impact_ratio, 0.6) * regime.liquidity
          * est.volatility_multiplier;

    double direction = is_buy(in.side) ? 1.0 : -1.0;
    est.fill_price = reference * (1.0 + direction * impact_bps / 10000.0);
    est.slippage_bps = impact_bps;
    est.regime = to_string(in.regime);
    price_costs(est, in, qty, impact_bps, regime);
    round_estimate(est);
    return est;
}

ExecutionEstimate ExecutionModel::cap_to_limit(const ExecutionEstimate& est,
                                               const ExecutionInputs& in,
                                               double limit_price) const {
    bool buy = is_buy(in.side);
    bool crosses = buy ? est.fill_price > limit_price : est.fill_price < limit_price;
    if (!crosses || !(limit_price > 0.0)) return est;

    ExecutionEstimate capped = est;
    capped.fill_price = limit_price;
    capped.limit_capped = true;
    double qty = std::max(0.0, finite_or(in.qty, 0.0));
    if (!realism_enabled_) {
        capped.notional = utils::round_to(limit_price * qty, 2);
        return capped;
    }
    double reference = in.reference_price > 0.0 ? in.reference_price : limit_price;
    double direction = buy ? 1.0 : -1.0;
    double effective_bps = std::max(0.0, direction * (limit_price / reference - 1.0) * 10000.0);
    capped.slippage_bps = effective_bps;
    price_costs(capped, in, qty, effective_bps, floor_multipliers(in.regime_mult));
    round_estimate(capped);
    return capped;
}

OrderEstimate ExecutionModel::estimate_order(const ExecutionInputs& in) const {
    ExecutionEstimate b = estimate(in);
    OrderEstimate out;
    out.est_fill_price = b.fill_price;
    out.est_slippage_bps = utils::round_to(b.slippage_bps, 4);
    out.est_slippage_cost = utils::round_to(b.slippage_cost, 4);
    out.est_commission = utils::round_to(b.commission, 4);
    out.est_borrow_day = utils::round_to(b.borrow_cost, 4);
    out.est_total_cost = utils::round_to(b.slippage_cost + b.commission + b.borrow_cost, 4);
    out.est_execution_quality_score = utils::round_to(b.execution_quality_score, 2);
    out.regime = b.regime;
    return out;
}

double ExecutionModel::estimate_borrow_accrual(double notional, double borrow_apr,
                                               int64_t elapsed_ms,
                                               const RegimeMultipliers& regime) const {
    if (!realism_enabled_) return 0.0;
    double apr = std::max(0.0, finite_or(borrow_apr, 0.0));
    double elapsed = static_cast<double>(std::max<int64_t>(0, elapsed_ms));
    double adjusted = apr * floor_multipliers(regime).borrow;
    double accrual = std::max(0.0, finite_or(notional, 0.0)) * adjusted
                   * (elapsed / static_cast<double>(utils::kYearMs));
    return utils::round_to(accrual, 8);
}

void ExecutionModel::record_fill(int64_t timestamp_ms, double slippage_bps, double quality_score) {
    std::lock_guard<std::mutex> lock(metrics_mu_);
    metrics_.push_back({timestamp_ms, finite_or(slippage_bps, 0.0), finite_or(quality_score, 100.0)});
    while (metrics_.size() > kMaxFillMetrics) metrics_.pop_front();
    int64_t cutoff = timestamp_ms - kFillMetricMemoryMs;
    while (!metrics_.empty() && metrics_.front().timestamp_ms < cutoff) metrics_.pop_front();
}

FillMetricsSummary ExecutionModel::recent_metrics(int64_t window_ms, int64_t now_ms) const {
    int64_t cutoff = now_ms - std::max<int64_t>(1000, window_ms);
    FillMetricsSummary out;
    double slippage_sum = 0.0;
    double quality_sum = 0.0;
    std::lock_guard<std::mutex> lock(metrics_mu_);
    for (auto it = metrics_.rbegin(); it != metrics_.rend(); ++it) {
        if (it->timestamp_ms < cutoff) break;
        ++out.count;
        slippage_sum += it->slippage_bps;
        quality_sum += it->quality;
    }
    if (out.count > 0) {
        out.avg_slippage_bps = utils::round_to(slippage_sum / out.count, 4);
        out.avg_execution_quality = utils::round_to(quality_sum / out.count, 4);
    }
    return out;
}

} // namespace exchange_sim
