#include "exchange.hpp"
#include <algorithm>
#include <chrono>
#include <spdlog/spdlog.h>
#include "errors.hpp"
#include "utils.hpp"

namespace exchange_sim {

Exchange::Exchange(const Config& config, std::shared_ptr<Store> store, InstrumentCatalog catalog,
                   uint64_t seed)
    : config_(config),
      store_(std::move(store)),
      catalog_(std::move(catalog)),
      model_(config.execution.realism_enabled),
      engine_(config_, catalog_, *store_, bus_, seed),
      executor_(*store_, engine_, model_, bus_, config_.execution),
      matcher_(*store_, engine_, executor_),
      accrual_(*store_, engine_, model_, config_.execution),
      margin_(*store_, engine_, model_, bus_, config_.execution),
      book_rng_(seed ^ 0x9e3779b97f4a7c15ULL) {}

Exchange::~Exchange() {
    stop();
}

void Exchange::init(int64_t now_ms) {
    engine_.init(now_ms);
}

void Exchange::start() {
    if (running_.exchange(true)) return;
    init(utils::now_ms());
    loop_thread_ = std::make_unique<std::thread>([this]() { run_loop(); });
    spdlog::info("Exchange started: {} instruments, tick {}ms, realism {}", catalog_.size(),
                 config_.engine.tick_interval_ms, model_.realism_enabled() ? "on" : "off");
}

void Exchange::stop() {
    {
        std::lock_guard<std::mutex> lock(loop_mu_);
        if (!running_.load()) return;
        running_.store(false);
    }
    loop_cv_.notify_all();
    if (loop_thread_ && loop_thread_->joinable()) loop_thread_->join();
    loop_thread_.reset();
    engine_.flush(utils::now_ms());
    spdlog::info("Exchange stopped after {} ticks ({} skipped)", ticks_run_.load(),
                 skipped_ticks_.load());
}

void Exchange::run_loop() {
    const auto interval = std::chrono::milliseconds(config_.engine.tick_interval_ms);
    auto next = std::chrono::steady_clock::now() + interval;
    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(loop_mu_);
            loop_cv_.wait_until(lock, next, [this]() { return !running_.load(); });
        }
        if (!running_.load()) break;
        tick_once(utils::now_ms());
        next += interval;
        auto now = std::chrono::steady_clock::now();
        if (next < now) next = now + interval;   // fell behind: do not burst
    }
}

bool Exchange::tick_once(int64_t now_ms) {
    if (paused_.load()) {
        ++skipped_ticks_;
        return false;
    }
    bool expected = false;
    if (!in_flight_.compare_exchange_strong(expected, true)) {
        ++skipped_ticks_;
        if (throttle_.allow("exchange.overrun")) {
            spdlog::warn("Tick skipped: previous tick still running");
        }
        return false;
    }

    try {
        engine_.tick(now_ms);
        accrual_.run(now_ms);
        MatchStats stats = matcher_.match_all(now_ms);
        {
            std::lock_guard<std::mutex> lock(stats_mu_);
            last_match_ = stats;
        }
        margin_.run(now_ms);
    } catch (const std::exception& e) {
        if (throttle_.allow("exchange.tick")) {
            spdlog::error("Tick failed ({} suppressed): {}", throttle_.suppressed("exchange.tick"),
                          e.what());
        }
    }
    ++ticks_run_;
    in_flight_.store(false);
    return true;
}

MatchStats Exchange::last_match_stats() const {
    std::lock_guard<std::mutex> lock(stats_mu_);
    return last_match_;
}

void Exchange::pause(const std::string& reason) {
    if (!paused_.exchange(true)) spdlog::warn("Exchange paused: {}", reason);
}

void Exchange::resume() {
    if (paused_.exchange(false)) spdlog::info("Exchange resumed");
}

std::optional<OrderEstimate> Exchange::estimate_order(const std::string& user_id,
                                                      const std::string& ticker, OrderSide side,
                                                      double qty) {
    const InstrumentDef* def = engine_.instrument(ticker);
    auto quote = engine_.price(ticker);
    if (!def || !quote || !(qty > 0.0)) return std::nullopt;

    double held = 0.0;
    if (!user_id.empty() && !is_buy(side)) {
        try {
            for (const auto& pos : store_->load_positions(user_id)) {
                if (pos.ticker == ticker) held = pos.qty;
            }
        } catch (const StorageError& e) {
            spdlog::warn("Position lookup for estimate failed, assuming flat: {}", e.what());
        }
    }

    const RegimeRecord regime = engine_.regime();
    ExecutionInputs inputs;
    inputs.micro = def->micro;
    inputs.side = side;
    inputs.qty = qty;
    inputs.reference_price = is_buy(side) ? quote->ask : quote->bid;
    inputs.mid_price = quote->mid();
    inputs.volatility = quote->volatility;
    inputs.regime = regime.kind;
    inputs.regime_mult = regime.mult;
    inputs.opens_short_qty = is_buy(side) ? 0.0 : std::max(0.0, qty - std::max(0.0, held));
    return model_.estimate_order(inputs);
}

std::optional<OrderBookView> Exchange::order_book(const std::string& ticker) {
    const InstrumentDef* def = engine_.instrument(ticker);
    auto quote = engine_.price(ticker);
    if (!def || !quote) return std::nullopt;

    std::vector<Order> resting;
    try {
        for (auto& order : store_->load_open_orders()) {
            if (order.ticker == ticker) resting.push_back(std::move(order));
        }
    } catch (const StorageError& e) {
        if (throttle_.allow("exchange.book")) {
            spdlog::warn("Open orders unavailable for book ({} suppressed): {}",
                         throttle_.suppressed("exchange.book"), e.what());
        }
    }

    std::lock_guard<std::mutex> lock(book_mu_);
    return generate_book(*def, *quote, resting, book_rng_, utils::now_ms());
}

double Exchange::apply_news_shock(const std::string& ticker, double impact_pct) {
    return engine_.apply_news_shock(ticker, impact_pct, utils::now_ms());
}

} // namespace exchange_sim
