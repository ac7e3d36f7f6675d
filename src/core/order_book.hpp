#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>
#include "instruments.hpp"
#include "types.hpp"

namespace exchange_sim {

struct BookLevel {
    double price{0.0};
    double qty{0.0};
    bool user{false};   // level opened by a resting user limit order
};

/**
 * Display-only depth around the last price. Not a matching book: fills are
 * priced by ExecutionModel and never consume these levels.
 */
struct OrderBookView {
    std::string ticker;
    std::vector<BookLevel> bids;   // best (highest) first
    std::vector<BookLevel> asks;   // best (lowest) first
    double spread{0.0};
    double mid{0.0};
    int64_t timestamp_ms{0};
};

constexpr size_t kBookDepth = 10;

/**
 * Synthetic depth: kBookDepth levels per side, spaced by
 * max(price * vol * 0.015, one tick), with size thinning away from the
 * mid. Live limit orders on `quote.ticker` are added to the level within
 * half a step of their limit or open a level of their own.
 */
OrderBookView generate_book(const InstrumentDef& def, const PriceState& quote,
                            const std::vector<Order>& open_orders, std::mt19937_64& rng,
                            int64_t now_ms);

} // namespace exchange_sim
