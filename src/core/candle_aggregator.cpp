#include "candle_aggregator.hpp"
#include <algorithm>
#include "utils.hpp"

namespace exchange_sim {

const std::array<CandleInterval, kCandleIntervalCount> kCandleIntervals{{
    {"1m", 60LL * 1000},
    {"5m", 5LL * 60 * 1000},
    {"15m", 15LL * 60 * 1000},
    {"1h", 60LL * 60 * 1000},
    {"4h", 4LL * 60 * 60 * 1000},
    {"1D", 24LL * 60 * 60 * 1000},
}};

std::optional<int64_t> candle_interval_ms(const std::string& name) {
    for (const auto& iv : kCandleIntervals) {
        if (name == iv.name) return iv.ms;
    }
    return std::nullopt;
}

namespace {

Candle open_bar(const std::string& ticker, const CandleInterval& iv, int64_t open_time,
                double price, double volume) {
    Candle c;
    c.ticker = ticker;
    c.interval = iv.name;
    c.open_time_ms = open_time;
    c.open = c.high = c.low = c.close = price;
    c.volume = volume;
    return c;
}

} // namespace

void CandleAggregator::seed(const std::string& ticker, double price, int64_t now_ms) {
    Bars bars;
    for (size_t i = 0; i < kCandleIntervalCount; ++i) {
        const auto& iv = kCandleIntervals[i];
        bars[i] = open_bar(ticker, iv, utils::floor_to_interval(now_ms, iv.ms), price, 0.0);
    }
    bars_[ticker] = std::move(bars);
}

void CandleAggregator::on_tick(const std::string& ticker, double price, double volume,
                               int64_t now_ms, std::vector<Candle>& completed) {
    auto it = bars_.find(ticker);
    if (it == bars_.end()) {
        seed(ticker, price, now_ms);
        it = bars_.find(ticker);
    }
    volume = std::max(0.0, volume);
    for (size_t i = 0; i < kCandleIntervalCount; ++i) {
        const auto& iv = kCandleIntervals[i];
        Candle& bar = it->second[i];
        int64_t bucket = utils::floor_to_interval(now_ms, iv.ms);
        if (bucket > bar.open_time_ms) {
            completed.push_back(bar);
            bar = open_bar(ticker, iv, bucket, price, volume);
        } else {
            bar.high = std::max(bar.high, price);
            bar.low = std::min(bar.low, price);
            bar.close = price;
            bar.volume += volume;
        }
    }
}

std::optional<Candle> CandleAggregator::current(const std::string& ticker,
                                                const std::string& interval) const {
    auto it = bars_.find(ticker);
    if (it == bars_.end()) return std::nullopt;
    for (size_t i = 0; i < kCandleIntervalCount; ++i) {
        if (interval == kCandleIntervals[i].name) return it->second[i];
    }
    return std::nullopt;
}

} // namespace exchange_sim
