#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include "borrow_accrual.hpp"
#include "config.hpp"
#include "event_bus.hpp"
#include "execution_model.hpp"
#include "fill_executor.hpp"
#include "instruments.hpp"
#include "log_throttle.hpp"
#include "margin_monitor.hpp"
#include "market_engine.hpp"
#include "order_book.hpp"
#include "order_matcher.hpp"
#include "store.hpp"

namespace exchange_sim {

/**
 * Owns the whole pipeline and the fixed-period scheduler. Each tick runs
 *   price engine -> borrow accrual -> order matching -> margin monitor
 * A tick that starts while the previous one is still running, or while the
 * exchange is paused, is skipped rather than queued.
 */
class Exchange {
public:
    Exchange(const Config& config, std::shared_ptr<Store> store, InstrumentCatalog catalog,
             uint64_t seed);
    ~Exchange();

    Exchange(const Exchange&) = delete;
    Exchange& operator=(const Exchange&) = delete;

    // Restores market state and starts the scheduler thread.
    void start();
    // Stops the scheduler and flushes market state.
    void stop();
    bool running() const { return running_.load(); }

    // Restores market state without starting the scheduler.
    void init(int64_t now_ms);

    // Runs one full tick. Returns false if the tick was skipped.
    bool tick_once(int64_t now_ms);

    void pause(const std::string& reason);
    void resume();
    bool paused() const { return paused_.load(); }

    /**
     * Pre-trade cost estimate. A sell that would open or extend a short is
     * charged one day of borrow; `user_id` may be empty to skip the
     * position lookup.
     */
    std::optional<OrderEstimate> estimate_order(const std::string& user_id, const std::string& ticker,
                                                OrderSide side, double qty);

    // Display depth for `ticker` with resting limit orders merged in.
    // nullopt for an unknown or unpriced ticker.
    std::optional<OrderBookView> order_book(const std::string& ticker);

    double apply_news_shock(const std::string& ticker, double impact_pct);

    uint64_t ticks_run() const { return ticks_run_.load(); }
    uint64_t skipped_ticks() const { return skipped_ticks_.load(); }
    MatchStats last_match_stats() const;

    MarketEngine& market() { return engine_; }
    const MarketEngine& market() const { return engine_; }
    ExecutionModel& execution_model() { return model_; }
    EventBus& bus() { return bus_; }
    Store& store() { return *store_; }
    const Config& config() const { return config_; }

private:
    void run_loop();

    Config config_;
    std::shared_ptr<Store> store_;
    InstrumentCatalog catalog_;
    EventBus bus_;
    ExecutionModel model_;
    MarketEngine engine_;
    FillExecutor executor_;
    OrderMatcher matcher_;
    BorrowAccrual accrual_;
    MarginMonitor margin_;
    LogThrottle throttle_;

    std::atomic<bool> running_{false};
    std::atomic<bool> paused_{false};
    std::atomic<bool> in_flight_{false};
    std::atomic<uint64_t> ticks_run_{0};
    std::atomic<uint64_t> skipped_ticks_{0};
    mutable std::mutex stats_mu_;
    MatchStats last_match_;

    std::mutex book_mu_;
    std::mt19937_64 book_rng_;

    std::mutex loop_mu_;
    std::condition_variable loop_cv_;
    std::unique_ptr<std::thread> loop_thread_;
};

} // namespace exchange_sim
