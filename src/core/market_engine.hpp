#pragma once

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "candle_aggregator.hpp"
#include "config.hpp"
#include "event_bus.hpp"
#include "instruments.hpp"
#include "log_throttle.hpp"
#include "macro_factors.hpp"
#include "market_view.hpp"
#include "price_process.hpp"
#include "price_store.hpp"
#include "regime.hpp"
#include "store.hpp"

namespace exchange_sim {

/**
 * Price side of the exchange. One tick runs:
 *   macro factors -> regime -> price process (every instrument)
 *   -> candles -> persistence batch -> tick broadcast
 *
 * tick() must not run concurrently with itself; queries and
 * add_order_flow() may be called from any thread.
 */
class MarketEngine : public MarketView {
public:
    static constexpr size_t kMaxPendingCandles = 50000;

    MarketEngine(const Config& config, const InstrumentCatalog& catalog, Store& store,
                 EventBus& bus, uint64_t seed);

    // Restore price states and the active regime from storage, or start
    // fresh at base price +/- 1%.
    void init(int64_t now_ms);

    std::vector<TickEvent> tick(int64_t now_ms);

    // Final write of price states and completed candles.
    void flush(int64_t now_ms);

    /**
     * Apply a news shock. Moves are bounded per asset class; a move of at
     * least shock_threshold_pct forces the event_shock regime.
     *
     * @return the realized move as a fraction of price (0 for unknown tickers)
     */
    double apply_news_shock(const std::string& ticker, double impact_pct, int64_t now_ms);

    // MarketView
    const InstrumentDef* instrument(const std::string& ticker) const override;
    std::optional<PriceState> price(const std::string& ticker) const override;
    RegimeRecord regime() const override;
    void add_order_flow(const std::string& ticker, OrderSide side, double notional) override;

    // Query surface
    std::vector<PriceState> prices() const;
    std::optional<Candle> current_candle(const std::string& ticker, const std::string& interval) const;
    std::vector<Candle> candles(const std::string& ticker, const std::string& interval, size_t limit);
    FactorVector factors() const;
    double order_flow(const std::string& ticker) const { return prices_.order_flow(ticker); }
    const InstrumentCatalog& catalog() const { return catalog_; }
    uint64_t tick_count() const;
    size_t pending_candles() const;

private:
    void rollover_locked(int64_t now_ms);
    void queue_transition_locked(const RegimeTransition& t);
    void persist(const std::vector<PriceState>& states, std::vector<Candle> candles,
                 std::vector<RegimeRecord> regimes);
    PriceState sanitize(const InstrumentDef& def, PriceState s, int64_t now_ms);
    TickEvent make_tick(const InstrumentDef& def, const PriceState& s, const std::string& regime,
                        int64_t now_ms) const;

    Config config_;
    const InstrumentCatalog& catalog_;
    Store& store_;
    EventBus& bus_;
    PriceProcess process_;
    PriceStore prices_;
    LogThrottle throttle_;

    mutable std::mutex mu_;
    std::mt19937_64 rng_;
    MacroFactorProcess factors_;
    RegimeController regime_;
    CandleAggregator candles_;
    std::deque<Candle> pending_candles_;
    std::vector<RegimeRecord> pending_regimes_;
    uint64_t tick_count_{0};
    int64_t day_{0};
};

} // namespace exchange_sim
