#pragma once

#include <random>
#include "config.hpp"
#include "instruments.hpp"
#include "macro_factors.hpp"
#include "market_clock.hpp"
#include "types.hpp"

namespace exchange_sim {

/**
 * Per-instrument tick update: GARCH(1,1) volatility, factor-driven
 * log-return with trend carry and jumps, anchored mean reversion,
 * order-flow impact, hard price bounds, spread and volume.
 *
 * Stateless apart from its configuration; all mutable state lives in the
 * PriceState and order-flow accumulator passed in.
 */
class PriceProcess {
public:
    explicit PriceProcess(const PriceModelConfig& config) : config_(config) {}

    /**
     * Advance `state` by one tick. `order_flow` is the instrument's signed
     * impact accumulator; it is consumed and decayed.
     *
     * Guarantees on return:
     *   min_price <= price <= max_price
     *   |price - old| <= old * max_tick_move_pct
     *   bid < price < ask
     *
     * @return simulated tick volume
     */
    double step(const InstrumentDef& def, PriceState& state, double& order_flow,
                const FactorVector& factors, const RegimeMultipliers& regime,
                const SessionFlags& session, int64_t now_ms, std::mt19937_64& rng) const;

    /**
     * Move price by a news impact, bounded to the class maximum and scaled by
     * the regime news multiplier. Spikes volatility 2.5x up to its ceiling.
     *
     * @return the impact actually applied (fraction of price)
     */
    double apply_news_shock(const InstrumentDef& def, PriceState& state, double impact_pct,
                            const RegimeMultipliers& regime, int64_t now_ms) const;

    // Fresh state at base price +/- 1%.
    PriceState initial_state(const InstrumentDef& def, int64_t now_ms, std::mt19937_64& rng) const;

    // Recompute bid/ask around state.price.
    void requote(const InstrumentDef& def, PriceState& state, const RegimeMultipliers& regime,
                 double effective_vol) const;

    double vol_floor(const InstrumentDef& def) const;
    double vol_ceiling(const InstrumentDef& def) const;

    // Session-hour multiplier for volatility and volume.
    static double session_multiplier(AssetClass cls, const SessionFlags& session);

private:
    PriceModelConfig config_;
};

} // namespace exchange_sim
