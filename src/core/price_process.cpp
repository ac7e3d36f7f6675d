#include "price_process.hpp"
#include <cmath>
#include "utils.hpp"

namespace exchange_sim {

namespace {

// Round to the instrument's tick size without leaving [lo, hi]. `fallback`
// must already lie in the range and is used when no tick multiple fits.
double round_within(double value, double lo, double hi, int decimals, double fallback) {
    double r = utils::round_to(value, decimals);
    if (r > hi) r = utils::floor_to(hi, decimals);
    if (r < lo) r = utils::ceil_to(lo, decimals);
    if (r < lo || r > hi || !std::isfinite(r)) return fallback;
    return r;
}

} // namespace

double PriceProcess::vol_floor(const InstrumentDef& def) const {
    return def.base_volatility * config_.min_vol_factor;
}

double PriceProcess::vol_ceiling(const InstrumentDef& def) const {
    return def.base_volatility * config_.max_vol_factor * def.risk.risk_multiplier;
}

double PriceProcess::session_multiplier(AssetClass cls, const SessionFlags& session) {
    switch (cls) {
        case AssetClass::STOCK:
        case AssetClass::ETF:
        case AssetClass::FUTURE:
            return session.us_hours ? 1.1 : 0.75;
        case AssetClass::COMMODITY:
            return session.us_hours ? 1.05 : 0.85;
        case AssetClass::FOREX:
            return session.london_overlap ? 1.15 : 1.0;
        case AssetClass::CRYPTO:
            return 1.0;
    }
    return 1.0;
}

double PriceProcess::step(const InstrumentDef& def, PriceState& state, double& order_flow,
                          const FactorVector& factors, const RegimeMultipliers& regime,
                          const SessionFlags& session, int64_t now_ms,
                          std::mt19937_64& rng) const {
    std::normal_distribution<double> normal(0.0, 1.0);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    const auto& style = def.style;
    const double min_price = def.min_price();
    const double max_price = def.max_price();
    const double old_price = utils::clamp(std::isfinite(state.price) ? state.price : def.base_price,
                                          min_price, max_price);
    const double prior_return = std::isfinite(state.last_log_return) ? state.last_log_return : 0.0;
    const double session_mult = session_multiplier(def.asset_class, session);

    // GARCH(1,1)
    const double factor_shock = MacroFactorProcess::dot(style.loadings, factors);
    double vol = std::isfinite(state.volatility) && state.volatility > 0.0
                     ? state.volatility : def.base_volatility;
    double omega = def.base_volatility * def.base_volatility * 0.03;
    double variance = omega
                    + config_.garch_alpha * prior_return * prior_return
                    + config_.garch_beta * vol * vol
                    + std::abs(factor_shock) * vol * config_.vol_of_vol * 0.05;
    vol = std::sqrt(std::max(variance, 0.0));
    vol = utils::clamp(vol, vol_floor(def), vol_ceiling(def));
    state.volatility = vol;
    const double effective_vol = vol * session_mult * regime.volatility;

    // Log-return
    double trend = prior_return * style.trend_persistence;
    double idio = normal(rng) * effective_vol * config_.shock_multiplier * style.idio_mult;
    double jump = 0.0;
    if (unit(rng) < style.jump_prob) {
        jump = normal(rng) * style.jump_scale * config_.jump_scale_mult * effective_vol;
    }
    const double max_move = def.risk.max_tick_move_pct;
    double log_return = utils::clamp(def.drift + factor_shock + trend + idio + jump,
                                     -max_move, max_move);
    double new_price = old_price * std::exp(log_return);

    // Mean reversion toward a blend of the dynamic anchor and base price
    double anchor = state.anchor > 0.0 && std::isfinite(state.anchor) ? state.anchor : old_price;
    anchor += (old_price - anchor) * style.anchor_follow_rate;
    state.anchor = anchor;
    double w = config_.dynamic_anchor_weight;
    double target = w * anchor + (1.0 - w) * def.base_price;
    double deviation = (new_price - target) / target;
    new_price -= deviation * def.mean_rev_rate * style.mean_rev_mult * old_price;

    // Order-flow impact
    if (order_flow != 0.0) {
        double cap = config_.max_order_flow_pct * old_price;
        new_price += utils::clamp(order_flow, -cap, cap);
        order_flow *= config_.order_flow_decay;
        if (std::abs(order_flow) < config_.order_flow_noise_floor) order_flow = 0.0;
    }

    // Hard bounds
    if (!std::isfinite(new_price)) new_price = old_price;
    double lo = std::max(old_price * (1.0 - max_move), min_price);
    double hi = std::min(old_price * (1.0 + max_move), max_price);
    new_price = utils::clamp(new_price, lo, hi);
    new_price = round_within(new_price, lo, hi, def.decimals(), old_price);

    state.price = new_price;
    state.last_log_return = std::log(new_price / old_price);
    requote(def, state, regime, effective_vol);
    state.high = std::max(state.high, new_price);
    state.low = state.low > 0.0 ? std::min(state.low, new_price) : new_price;

    // Volume
    double move_pct = std::abs(new_price - old_price) / old_price * 100.0;
    double tick_volume = std::floor(config_.volume_base + unit(rng) * config_.volume_jitter)
                       * (1.0 + move_pct * config_.volume_move_mult)
                       * (1.0 + effective_vol * config_.volume_vol_mult)
                       * session_mult * style.volume_mult;
    tick_volume = std::max(0.0, std::floor(tick_volume));
    state.volume += tick_volume;
    state.updated_at_ms = now_ms;
    return tick_volume;
}

void PriceProcess::requote(const InstrumentDef& def, PriceState& state,
                           const RegimeMultipliers& regime, double effective_vol) const {
    int d = def.decimals();
    double tick = std::pow(10.0, -d);
    double spread = state.price * effective_vol * 0.05 * regime.liquidity * def.style.spread_mult;
    double half = std::max(spread / 2.0, tick);
    state.bid = utils::floor_to(state.price - half, d);
    state.ask = utils::ceil_to(state.price + half, d);
    if (state.bid <= 0.0) state.bid = utils::floor_to(state.price - tick, d);
}

double PriceProcess::apply_news_shock(const InstrumentDef& def, PriceState& state,
                                      double impact_pct, const RegimeMultipliers& regime,
                                      int64_t now_ms) const {
    if (!std::isfinite(impact_pct)) return 0.0;
    double bound = def.risk.max_news_impact_pct;
    double applied = utils::clamp(impact_pct * regime.news, -bound, bound);

    double old_price = state.price;
    double moved = utils::clamp(old_price * (1.0 + applied), def.min_price(), def.max_price());
    state.price = round_within(moved, def.min_price(), def.max_price(), def.decimals(), old_price);
    state.volatility = std::min(state.volatility * 2.5, vol_ceiling(def));
    state.high = std::max(state.high, state.price);
    state.low = std::min(state.low, state.price);
    state.updated_at_ms = now_ms;
    requote(def, state, regime, state.volatility * regime.volatility);
    return old_price > 0.0 ? (state.price - old_price) / old_price : 0.0;
}

PriceState PriceProcess::initial_state(const InstrumentDef& def, int64_t now_ms,
                                       std::mt19937_64& rng) const {
    std::uniform_real_distribution<double> offset(-0.01, 0.01);
    PriceState s;
    s.ticker = def.ticker;
    s.price = utils::round_to(def.base_price * (1.0 + offset(rng)), def.decimals());
    s.open = s.high = s.low = s.prev_close = s.anchor = s.price;
    s.volatility = def.base_volatility;
    s.updated_at_ms = now_ms;
    requote(def, s, RegimeMultipliers{}, def.base_volatility);
    return s;
}

} // namespace exchange_sim
