#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "types.hpp"

namespace exchange_sim {

struct CandleInterval {
    const char* name;
    int64_t ms;
};

constexpr size_t kCandleIntervalCount = 6;
extern const std::array<CandleInterval, kCandleIntervalCount> kCandleIntervals;

std::optional<int64_t> candle_interval_ms(const std::string& name);

/**
 * Rolls ticks into 1m/5m/15m/1h/4h/1D OHLCV bars, one open bar per
 * ticker and interval. A tick whose aligned bucket is past the open bar
 * completes it and starts a new bar at the tick's price.
 *
 * Not thread-safe; the owning MarketEngine serializes access.
 */
class CandleAggregator {
public:
    // Opens a fresh bar on every interval at `price`.
    void seed(const std::string& ticker, double price, int64_t now_ms);

    // Folds one tick in; appends completed bars to `completed`.
    void on_tick(const std::string& ticker, double price, double volume, int64_t now_ms,
                 std::vector<Candle>& completed);

    std::optional<Candle> current(const std::string& ticker, const std::string& interval) const;

private:
    using Bars = std::array<Candle, kCandleIntervalCount>;
    std::unordered_map<std::string, Bars> bars_;
};

} // namespace exchange_sim
