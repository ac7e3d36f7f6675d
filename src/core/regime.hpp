#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include "config.hpp"
#include "types.hpp"

namespace exchange_sim {

/**
 * A regime change: the record that was closed (absent on first start) and
 * the record that became active. Both need to be persisted.
 */
struct RegimeTransition {
    std::optional<RegimeRecord> closed;
    RegimeRecord opened;
};

/**
 * Global market regime state machine.
 *
 * States: normal, tight_liquidity, high_volatility, event_shock.
 * - Scheduled review every review_interval_ms (+/- jitter_pct) picks the
 *   next regime by weight.
 * - force_event_shock() switches to event_shock immediately and holds it
 *   for event_shock_hold_ms; scheduled reviews are suspended meanwhile.
 *   When the hold expires the schedule picks again.
 *
 * Not thread-safe; the owning MarketEngine serializes access.
 */
class RegimeController {
public:
    explicit RegimeController(const RegimeConfig& config);

    static RegimeMultipliers multipliers_for(RegimeKind kind);

    // First regime of the process. Resumes `restored` when given, otherwise
    // opens a normal regime.
    std::optional<RegimeTransition> start(int64_t now_ms, std::mt19937_64& rng,
                                          const std::optional<RegimeRecord>& restored);

    // Scheduled step, once per tick.
    std::optional<RegimeTransition> update(int64_t now_ms, std::mt19937_64& rng);

    // Returns nullopt when already in event_shock (the hold is extended).
    std::optional<RegimeTransition> force_event_shock(int64_t now_ms, const std::string& reason);

    const RegimeRecord& current() const { return current_; }
    RegimeKind kind() const { return current_.kind; }
    const RegimeMultipliers& multipliers() const { return current_.mult; }
    int64_t next_review_ms() const { return next_review_ms_; }
    std::optional<int64_t> shock_until_ms() const { return shock_until_ms_; }

private:
    RegimeKind pick(std::mt19937_64& rng) const;
    void schedule_review(int64_t now_ms, std::mt19937_64& rng);
    RegimeTransition transition(RegimeKind next, int64_t now_ms, const std::string& reason);

    RegimeConfig config_;
    RegimeRecord current_;
    int64_t next_review_ms_{0};
    std::optional<int64_t> shock_until_ms_;
};

} // namespace exchange_sim
