#include "regime.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include "utils.hpp"

namespace exchange_sim {

RegimeController::RegimeController(const RegimeConfig& config) : config_(config) {
    current_.kind = RegimeKind::NORMAL;
    current_.mult = multipliers_for(RegimeKind::NORMAL);
}

RegimeMultipliers RegimeController::multipliers_for(RegimeKind kind) {
    switch (kind) {
        case RegimeKind::NORMAL:          return {1.0, 1.0, 1.0, 1.0};
        case RegimeKind::TIGHT_LIQUIDITY: return {1.8, 1.15, 1.1, 1.25};
        case RegimeKind::HIGH_VOLATILITY: return {1.35, 1.7, 1.4, 1.15};
        case RegimeKind::EVENT_SHOCK:     return {2.4, 2.2, 1.9, 1.5};
    }
    return RegimeMultipliers{};
}

std::optional<RegimeTransition> RegimeController::start(int64_t now_ms, std::mt19937_64& rng,
                                                        const std::optional<RegimeRecord>& restored) {
    schedule_review(now_ms, rng);
    if (restored && !restored->ended_at_ms) {
        current_ = *restored;
        current_.mult = multipliers_for(current_.kind);
        if (current_.kind == RegimeKind::EVENT_SHOCK) {
            int64_t until = current_.started_at_ms + config_.event_shock_hold_ms;
            shock_until_ms_ = std::max(until, now_ms);
        }
        spdlog::info("Restored regime {} (started {})", to_string(current_.kind),
                     utils::ms_to_iso(current_.started_at_ms));
        return std::nullopt;
    }
    RegimeRecord rec;
    rec.id = utils::generate_id();
    rec.kind = RegimeKind::NORMAL;
    rec.mult = multipliers_for(rec.kind);
    rec.reason = "startup";
    rec.started_at_ms = now_ms;
    current_ = rec;
    return RegimeTransition{std::nullopt, rec};
}

std::optional<RegimeTransition> RegimeController::update(int64_t now_ms, std::mt19937_64& rng) {
    if (shock_until_ms_) {
        if (now_ms < *shock_until_ms_) return std::nullopt;
        shock_until_ms_.reset();
        schedule_review(now_ms, rng);
        RegimeKind next = pick(rng);
        if (next == RegimeKind::EVENT_SHOCK) next = RegimeKind::NORMAL;
        return transition(next, now_ms, "shock_expired");
    }
    if (now_ms < next_review_ms_) return std::nullopt;

    schedule_review(now_ms, rng);
    RegimeKind next = pick(rng);
    if (next == current_.kind) return std::nullopt;
    return transition(next, now_ms, "scheduled");
}

std::optional<RegimeTransition> RegimeController::force_event_shock(int64_t now_ms,
                                                                    const std::string& reason) {
    int64_t until = now_ms + config_.event_shock_hold_ms;
    if (current_.kind == RegimeKind::EVENT_SHOCK) {
        shock_until_ms_ = std::max(shock_until_ms_.value_or(0), until);
        return std::nullopt;
    }
    shock_until_ms_ = until;
    return transition(RegimeKind::EVENT_SHOCK, now_ms, reason);
}

RegimeKind RegimeController::pick(std::mt19937_64& rng) const {
    const auto& w = config_.weights;
    std::uniform_real_distribution<double> dist(0.0, w.total());
    double roll = dist(rng);
    if ((roll -= w.normal) < 0.0) return RegimeKind::NORMAL;
    if ((roll -= w.tight_liquidity) < 0.0) return RegimeKind::TIGHT_LIQUIDITY;
    if ((roll -= w.high_volatility) < 0.0) return RegimeKind::HIGH_VOLATILITY;
    return w.event_shock > 0.0 ? RegimeKind::EVENT_SHOCK : RegimeKind::NORMAL;
}

void RegimeController::schedule_review(int64_t now_ms, std::mt19937_64& rng) {
    std::uniform_real_distribution<double> jitter(-config_.jitter_pct, config_.jitter_pct);
    double interval = static_cast<double>(config_.review_interval_ms) * (1.0 + jitter(rng));
    next_review_ms_ = now_ms + std::max<int64_t>(1, static_cast<int64_t>(interval));
}

RegimeTransition RegimeController::transition(RegimeKind next, int64_t now_ms,
                                              const std::string& reason) {
    RegimeRecord closed = current_;
    closed.ended_at_ms = now_ms;

    RegimeRecord opened;
    opened.id = utils::generate_id();
    opened.kind = next;
    opened.mult = multipliers_for(next);
    opened.reason = reason;
    opened.started_at_ms = now_ms;
    current_ = opened;

    spdlog::info("Regime {} -> {} ({})", to_string(closed.kind), to_string(next), reason);
    RegimeTransition t;
    if (!closed.id.empty()) t.closed = closed;
    t.opened = opened;
    return t;
}

} // namespace exchange_sim
