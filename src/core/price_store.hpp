#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "types.hpp"

namespace exchange_sim {

/**
 * Owned table of per-instrument price state and signed order-flow impact.
 * Readers get copies; the tick mutates through update(), the only bulk
 * write path.
 */
class PriceStore {
public:
    struct Entry {
        PriceState state;
        double order_flow{0.0};
    };
    using Table = std::unordered_map<std::string, Entry>;

    void reset(const std::vector<PriceState>& states) {
        std::lock_guard<std::mutex> lock(mu_);
        entries_.clear();
        for (const auto& s : states) entries_[s.ticker] = Entry{s, 0.0};
    }

    std::optional<PriceState> get(const std::string& ticker) const {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = entries_.find(ticker);
        if (it == entries_.end()) return std::nullopt;
        return it->second.state;
    }

    std::vector<PriceState> snapshot() const {
        std::lock_guard<std::mutex> lock(mu_);
        std::vector<PriceState> out;
        out.reserve(entries_.size());
        for (const auto& kv : entries_) out.push_back(kv.second.state);
        return out;
    }

    bool add_order_flow(const std::string& ticker, double signed_impact) {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = entries_.find(ticker);
        if (it == entries_.end()) return false;
        it->second.order_flow += signed_impact;
        return true;
    }

    double order_flow(const std::string& ticker) const {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = entries_.find(ticker);
        return it == entries_.end() ? 0.0 : it->second.order_flow;
    }

    template <typename Fn>
    void update(Fn&& fn) {
        std::lock_guard<std::mutex> lock(mu_);
        fn(entries_);
    }

private:
    mutable std::mutex mu_;
    Table entries_;
};

} // namespace exchange_sim
