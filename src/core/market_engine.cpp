#include "market_engine.hpp"
#include <cmath>
#include <cstddef>
#include <unordered_map>
#include <spdlog/spdlog.h>
#include "errors.hpp"
#include "market_clock.hpp"
#include "utils.hpp"

namespace exchange_sim {

namespace {

// Signed price impact of one fill's notional on the next tick.
constexpr double kOrderFlowImpactPerNotional = 1e-7;

} // namespace

MarketEngine::MarketEngine(const Config& config, const InstrumentCatalog& catalog, Store& store,
                           EventBus& bus, uint64_t seed)
    : config_(config),
      catalog_(catalog),
      store_(store),
      bus_(bus),
      process_(config.price_model),
      rng_(seed),
      regime_(config.regime) {}

void MarketEngine::init(int64_t now_ms) {
    std::vector<PriceState> saved;
    std::optional<RegimeRecord> saved_regime;
    if (config_.engine.restore_state) {
        try {
            saved = store_.load_price_states();
            saved_regime = store_.load_active_regime();
        } catch (const StorageError& e) {
            spdlog::warn("Price state restore failed, starting fresh: {}", e.what());
            saved.clear();
            saved_regime.reset();
        }
    }
    std::unordered_map<std::string, PriceState> by_ticker;
    for (auto& s : saved) by_ticker[s.ticker] = s;

    std::optional<RegimeTransition> transition;
    {
        std::lock_guard<std::mutex> lock(mu_);
        std::vector<PriceState> states;
        size_t restored = 0;
        for (const auto& def : catalog_.all()) {
            auto it = by_ticker.find(def.ticker);
            if (it != by_ticker.end()) {
                states.push_back(sanitize(def, it->second, now_ms));
                ++restored;
            } else {
                states.push_back(process_.initial_state(def, now_ms, rng_));
            }
            candles_.seed(def.ticker, states.back().price, now_ms);
        }
        prices_.reset(states);
        day_ = now_ms / utils::kDayMs;
        transition = regime_.start(now_ms, rng_, saved_regime);
        if (transition) queue_transition_locked(*transition);
        spdlog::info("Initialized {} instruments ({} restored), regime {}",
                     catalog_.size(), restored, to_string(regime_.kind()));
    }
    if (transition) bus_.publish_regime(transition->opened);
}

PriceState MarketEngine::sanitize(const InstrumentDef& def, PriceState s, int64_t now_ms) {
    s.ticker = def.ticker;
    double price = std::isfinite(s.price) ? s.price : def.base_price;
    s.price = utils::round_to(utils::clamp(price, def.min_price(), def.max_price()), def.decimals());
    if (!std::isfinite(s.volatility) || s.volatility <= 0.0) s.volatility = def.base_volatility;
    s.volatility = utils::clamp(s.volatility, process_.vol_floor(def), process_.vol_ceiling(def));
    if (!std::isfinite(s.anchor) || s.anchor <= 0.0) s.anchor = s.price;
    if (!std::isfinite(s.last_log_return)) s.last_log_return = 0.0;
    if (!(s.prev_close > 0.0)) s.prev_close = s.price;
    if (!(s.open > 0.0)) s.open = s.price;
    if (!(s.high >= s.price)) s.high = s.price;
    if (!(s.low > 0.0) || s.low > s.price) s.low = s.price;
    if (!(s.volume >= 0.0)) s.volume = 0.0;
    if (!(s.bid < s.price && s.price < s.ask)) {
        process_.requote(def, s, RegimeMultipliers{}, s.volatility);
    }
    if (s.updated_at_ms <= 0) s.updated_at_ms = now_ms;
    return s;
}

void MarketEngine::rollover_locked(int64_t now_ms) {
    int64_t day = now_ms / utils::kDayMs;
    if (day == day_) return;
    day_ = day;
    prices_.update([](PriceStore::Table& table) {
        for (auto& kv : table) {
            auto& s = kv.second.state;
            s.prev_close = s.price;
            s.open = s.high = s.low = s.price;
            s.volume = 0.0;
        }
    });
    spdlog::info("Session rollover at {}", utils::ms_to_iso(now_ms));
}

void MarketEngine::queue_transition_locked(const RegimeTransition& t) {
    if (t.closed) pending_regimes_.push_back(*t.closed);
    pending_regimes_.push_back(t.opened);
}

TickEvent MarketEngine::make_tick(const InstrumentDef& def, const PriceState& s,
                                  const std::string& regime, int64_t now_ms) const {
    TickEvent ev;
    ev.ticker = def.ticker;
    ev.price = s.price;
    ev.bid = s.bid;
    ev.ask = s.ask;
    ev.open = s.open;
    ev.high = s.high;
    ev.low = s.low;
    ev.prev_close = s.prev_close;
    ev.volume = s.volume;
    double change = s.price - s.prev_close;
    ev.change = utils::round_to(change, def.decimals());
    ev.change_pct = s.prev_close > 0.0 ? utils::round_to(change / s.prev_close * 100.0, 2) : 0.0;
    ev.volatility = utils::round_to(s.volatility, 6);
    ev.regime = regime;
    ev.timestamp_ms = now_ms;
    return ev;
}

std::vector<TickEvent> MarketEngine::tick(int64_t now_ms) {
    std::vector<TickEvent> events;
    std::vector<PriceState> states;
    std::vector<Candle> candles_out;
    std::vector<RegimeRecord> regimes_out;
    std::optional<RegimeTransition> transition;
    {
        std::lock_guard<std::mutex> lock(mu_);
        ++tick_count_;
        rollover_locked(now_ms);

        SessionFlags session = MarketClock::session_flags(utils::ms_to_ts(now_ms));
        const FactorVector& factors = factors_.step(rng_, session);
        transition = regime_.update(now_ms, rng_);
        if (transition) queue_transition_locked(*transition);
        const RegimeMultipliers mult = regime_.multipliers();
        const std::string regime_name = to_string(regime_.kind());

        std::vector<Candle> completed;
        events.reserve(catalog_.size());
        prices_.update([&](PriceStore::Table& table) {
            for (const auto& def : catalog_.all()) {
                auto it = table.find(def.ticker);
                if (it == table.end()) continue;
                auto& entry = it->second;
                double volume = process_.step(def, entry.state, entry.order_flow, factors, mult,
                                              session, now_ms, rng_);
                candles_.on_tick(def.ticker, entry.state.price, volume, now_ms, completed);
                events.push_back(make_tick(def, entry.state, regime_name, now_ms));
            }
        });

        pending_candles_.insert(pending_candles_.end(), completed.begin(), completed.end());
        if (pending_candles_.size() > kMaxPendingCandles) {
            size_t drop = pending_candles_.size() - kMaxPendingCandles;
            pending_candles_.erase(pending_candles_.begin(),
                                   pending_candles_.begin() + static_cast<std::ptrdiff_t>(drop));
            if (throttle_.allow("engine.candle_overflow")) {
                spdlog::warn("Pending candle buffer full, dropped {} oldest bars", drop);
            }
        }

        if (tick_count_ % static_cast<uint64_t>(config_.engine.persist_every_ticks) == 0) {
            states = prices_.snapshot();
            candles_out.assign(pending_candles_.begin(), pending_candles_.end());
            pending_candles_.clear();
        }
        regimes_out.swap(pending_regimes_);
    }

    if (!states.empty() || !candles_out.empty() || !regimes_out.empty()) {
        persist(states, std::move(candles_out), std::move(regimes_out));
    }
    if (transition) bus_.publish_regime(transition->opened);
    bus_.publish_ticks(events);
    return events;
}

void MarketEngine::persist(const std::vector<PriceState>& states, std::vector<Candle> candles,
                           std::vector<RegimeRecord> regimes) {
    try {
        if (!regimes.empty()) {
            for (const auto& r : regimes) store_.save_regime(r);
            regimes.clear();
        }
        if (!candles.empty()) {
            store_.upsert_candles(candles);
            candles.clear();
        }
        if (!states.empty()) store_.upsert_price_states(states);
    } catch (const StorageError& e) {
        if (throttle_.allow("engine.persist")) {
            spdlog::warn("Market data save failed ({} suppressed): {}",
                         throttle_.suppressed("engine.persist"), e.what());
        }
        std::lock_guard<std::mutex> lock(mu_);
        pending_regimes_.insert(pending_regimes_.begin(), regimes.begin(), regimes.end());
        pending_candles_.insert(pending_candles_.begin(), candles.begin(), candles.end());
    }
}

void MarketEngine::flush(int64_t now_ms) {
    std::vector<PriceState> states = prices_.snapshot();
    for (auto& s : states) s.updated_at_ms = now_ms;
    std::vector<Candle> candles;
    std::vector<RegimeRecord> regimes;
    {
        std::lock_guard<std::mutex> lock(mu_);
        candles.assign(pending_candles_.begin(), pending_candles_.end());
        pending_candles_.clear();
        regimes.swap(pending_regimes_);
    }
    persist(states, std::move(candles), std::move(regimes));
    spdlog::info("Market state flushed ({} instruments)", states.size());
}

double MarketEngine::apply_news_shock(const std::string& ticker, double impact_pct, int64_t now_ms) {
    const InstrumentDef* def = catalog_.find(ticker);
    if (!def) return 0.0;

    double applied = 0.0;
    std::optional<RegimeTransition> transition;
    {
        std::lock_guard<std::mutex> lock(mu_);
        const RegimeMultipliers mult = regime_.multipliers();
        prices_.update([&](PriceStore::Table& table) {
            auto it = table.find(ticker);
            if (it == table.end()) return;
            applied = process_.apply_news_shock(*def, it->second.state, impact_pct, mult, now_ms);
        });
        if (std::abs(applied) >= config_.regime.shock_threshold_pct) {
            transition = regime_.force_event_shock(now_ms, "news_shock:" + ticker);
            if (transition) queue_transition_locked(*transition);
        }
    }
    spdlog::info("News shock {} requested {:.4f} applied {:.4f}", ticker, impact_pct, applied);
    if (transition) bus_.publish_regime(transition->opened);
    return applied;
}

const InstrumentDef* MarketEngine::instrument(const std::string& ticker) const {
    return catalog_.find(ticker);
}

std::optional<PriceState> MarketEngine::price(const std::string& ticker) const {
    return prices_.get(ticker);
}

RegimeRecord MarketEngine::regime() const {
    std::lock_guard<std::mutex> lock(mu_);
    return regime_.current();
}

void MarketEngine::add_order_flow(const std::string& ticker, OrderSide side, double notional) {
    if (!std::isfinite(notional) || notional <= 0.0) return;
    double impact = notional * kOrderFlowImpactPerNotional;
    prices_.add_order_flow(ticker, is_buy(side) ? impact : -impact);
}

std::vector<PriceState> MarketEngine::prices() const {
    return prices_.snapshot();
}

std::optional<Candle> MarketEngine::current_candle(const std::string& ticker,
                                                   const std::string& interval) const {
    std::lock_guard<std::mutex> lock(mu_);
    return candles_.current(ticker, interval);
}

std::vector<Candle> MarketEngine::candles(const std::string& ticker, const std::string& interval,
                                          size_t limit) {
    std::vector<Candle> out;
    if (limit == 0) return out;
    try {
        out = store_.load_candles(ticker, interval, limit);
    } catch (const StorageError& e) {
        if (throttle_.allow("engine.load_candles")) {
            spdlog::warn("Candle history unavailable: {}", e.what());
        }
    }
    if (auto open_bar = current_candle(ticker, interval)) {
        if (!out.empty() && out.back().open_time_ms == open_bar->open_time_ms) out.pop_back();
        out.push_back(*open_bar);
        if (out.size() > limit) out.erase(out.begin());
    }
    return out;
}

FactorVector MarketEngine::factors() const {
    std::lock_guard<std::mutex> lock(mu_);
    return factors_.values();
}

uint64_t MarketEngine::tick_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return tick_count_;
}

size_t MarketEngine::pending_candles() const {
    std::lock_guard<std::mutex> lock(mu_);
    return pending_candles_.size();
}

} // namespace exchange_sim
