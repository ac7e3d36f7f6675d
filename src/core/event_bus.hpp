#pragma once

#include <functional>
#include <mutex>
#include <vector>
#include <spdlog/spdlog.h>
#include "types.hpp"

namespace exchange_sim {

/**
 * Observer lists for the tick, fill and regime streams. Listeners run on
 * the publishing thread; a throwing listener is logged and skipped.
 */
class EventBus {
public:
    using TickListener = std::function<void(const std::vector<TickEvent>&)>;
    using FillListener = std::function<void(const FillEvent&)>;
    using RegimeListener = std::function<void(const RegimeRecord&)>;

    void add_tick_listener(TickListener fn) {
        std::lock_guard<std::mutex> lock(mu_);
        tick_listeners_.push_back(std::move(fn));
    }

    void add_fill_listener(FillListener fn) {
        std::lock_guard<std::mutex> lock(mu_);
        fill_listeners_.push_back(std::move(fn));
    }

    void add_regime_listener(RegimeListener fn) {
        std::lock_guard<std::mutex> lock(mu_);
        regime_listeners_.push_back(std::move(fn));
    }

    void publish_ticks(const std::vector<TickEvent>& ticks) {
        std::vector<TickListener> listeners;
        {
            std::lock_guard<std::mutex> lock(mu_);
            listeners = tick_listeners_;
        }
        for (auto& fn : listeners) dispatch("tick", fn, ticks);
    }

    void publish_fill(const FillEvent& fill) {
        std::vector<FillListener> listeners;
        {
            std::lock_guard<std::mutex> lock(mu_);
            listeners = fill_listeners_;
        }
        for (auto& fn : listeners) dispatch("fill", fn, fill);
    }

    void publish_regime(const RegimeRecord& regime) {
        std::vector<RegimeListener> listeners;
        {
            std::lock_guard<std::mutex> lock(mu_);
            listeners = regime_listeners_;
        }
        for (auto& fn : listeners) dispatch("regime", fn, regime);
    }

private:
    template <typename Fn, typename Event>
    static void dispatch(const char* stream, Fn& fn, const Event& ev) {
        try {
            fn(ev);
        } catch (const std::exception& e) {
            spdlog::error("{} listener failed: {}", stream, e.what());
        }
    }

    std::mutex mu_;
    std::vector<TickListener> tick_listeners_;
    std::vector<FillListener> fill_listeners_;
    std::vector<RegimeListener> regime_listeners_;
};

} // namespace exchange_sim
