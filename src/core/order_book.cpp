#include "order_book.hpp"
#include <algorithm>
#include <cmath>
#include "utils.hpp"

namespace exchange_sim {

namespace {

void merge_order(std::vector<BookLevel>& levels, double price, double qty, double step) {
    for (auto& level : levels) {
        if (std::abs(level.price - price) < step * 0.5) {
            level.qty += qty;
            return;
        }
    }
    levels.push_back({price, qty, true});
}

} // namespace

OrderBookView generate_book(const InstrumentDef& def, const PriceState& quote,
                            const std::vector<Order>& open_orders, std::mt19937_64& rng,
                            int64_t now_ms) {
    OrderBookView book;
    book.ticker = def.ticker;
    book.mid = quote.price;
    book.timestamp_ms = now_ms;

    const int decimals = def.decimals();
    const double vol = quote.volatility > 0.0 ? quote.volatility : def.base_volatility;
    const double step = std::max(quote.price * vol * 0.015, std::pow(10.0, -decimals));

    std::uniform_real_distribution<double> size_jitter(0.5, 1.5);
    for (size_t i = 0; i < kBookDepth; ++i) {
        double offset = step * static_cast<double>(i + 1);
        double base = 800.0 - 50.0 * static_cast<double>(i);
        book.bids.push_back({utils::round_to(quote.price - offset, decimals),
                             std::floor(base * size_jitter(rng)), false});
        book.asks.push_back({utils::round_to(quote.price + offset, decimals),
                             std::floor(base * size_jitter(rng)), false});
    }

    for (const auto& order : open_orders) {
        if (order.ticker != def.ticker || order.type != OrderType::LIMIT) continue;
        if (!order.is_live() || !order.limit_price || order.remaining() <= 0.0) continue;
        auto& levels = is_buy(order.side) ? book.bids : book.asks;
        merge_order(levels, *order.limit_price, order.remaining(), step);
    }

    std::sort(book.bids.begin(), book.bids.end(),
              [](const BookLevel& a, const BookLevel& b) { return a.price > b.price; });
    std::sort(book.asks.begin(), book.asks.end(),
              [](const BookLevel& a, const BookLevel& b) { return a.price < b.price; });
    if (book.bids.size() > kBookDepth) book.bids.resize(kBookDepth);
    if (book.asks.size() > kBookDepth) book.asks.resize(kBookDepth);

    book.spread = utils::round_to(book.asks.front().price - book.bids.front().price, decimals);
    return book;
}

} // namespace exchange_sim
