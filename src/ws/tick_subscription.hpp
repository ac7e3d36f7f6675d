#pragma once

#include <set>
#include <string>
#include <vector>

namespace exchange_sim {

/**
 * Tick filter of one stream client. A fresh client receives every ticker.
 * After its first subscribe it receives only the tickers it holds, so
 * unsubscribing the last one stops the tick stream instead of reopening it.
 */
class TickSubscription {
public:
    void subscribe(const std::vector<std::string>& tickers) {
        filtered_ = true;
        tickers_.insert(tickers.begin(), tickers.end());
    }

    void unsubscribe(const std::vector<std::string>& tickers) {
        for (const auto& t : tickers) tickers_.erase(t);
    }

    bool all() const { return !filtered_; }

    bool wants(const std::string& ticker) const {
        return !filtered_ || tickers_.count(ticker) > 0;
    }

    std::vector<std::string> tickers() const {
        return std::vector<std::string>(tickers_.begin(), tickers_.end());
    }

private:
    bool filtered_{false};
    std::set<std::string> tickers_;
};

} // namespace exchange_sim
