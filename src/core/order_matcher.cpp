#include "order_matcher.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include "errors.hpp"
#include "position_accounting.hpp"

namespace exchange_sim {

OrderMatcher::OrderMatcher(Store& store, MarketView& market, FillExecutor& executor)
    : store_(store), market_(market), executor_(executor) {}

MatchStats OrderMatcher::match_all(int64_t now_ms) {
    MatchStats stats;
    std::vector<Order> orders;
    try {
        orders = store_.load_open_orders();
    } catch (const StorageError& e) {
        ++stats.errors;
        if (throttle_.allow("matcher.load")) {
            spdlog::warn("Open orders unavailable ({} suppressed): {}",
                         throttle_.suppressed("matcher.load"), e.what());
        }
        return stats;
    }

    for (auto& order : orders) {
        ++stats.scanned;
        auto quote = market_.price(order.ticker);
        if (!quote) {
            ++stats.skipped;
            continue;
        }
        try {
            auto req = evaluate(order, *quote);
            if (!req) continue;
            FillResult res = executor_.execute(*req, now_ms);
            switch (res.outcome) {
                case FillOutcome::FILLED:
                case FillOutcome::PARTIAL: ++stats.fills; break;
                case FillOutcome::CANCELLED: ++stats.cancelled; break;
                case FillOutcome::SKIPPED: ++stats.skipped; break;
            }
        } catch (const std::exception& e) {
            ++stats.errors;
            if (throttle_.allow("matcher.order")) {
                spdlog::error("Matching order {} failed ({} suppressed): {}", order.id,
                              throttle_.suppressed("matcher.order"), e.what());
            }
        }
    }
    return stats;
}

std::optional<FillRequest> OrderMatcher::evaluate(Order& order, const PriceState& quote) {
    if (!order.is_live() || order.remaining() <= kQtyEpsilon) return std::nullopt;

    switch (order.type) {
        case OrderType::MARKET:
            return market_request(order, quote);

        case OrderType::LIMIT:
            if (is_marketable_limit(order, quote)) return limit_request(order, quote);
            break;

        case OrderType::STOP:
        case OrderType::STOP_LOSS:
            if (is_stop_triggered(order, quote)) return market_request(order, quote);
            break;

        case OrderType::STOP_LIMIT:
            if (!order.stop_triggered && is_stop_triggered(order, quote)) {
                order.stop_triggered = true;
                store_.mark_stop_triggered(order.id);
            }
            if (order.stop_triggered && is_marketable_limit(order, quote)) {
                return limit_request(order, quote);
            }
            break;

        case OrderType::TAKE_PROFIT:
            if (is_take_profit_triggered(order, quote)) return market_request(order, quote);
            break;

        case OrderType::TRAILING_STOP:
            if (update_trailing_extreme(order, quote)) {
                store_.update_trail_high(order.id, *order.trail_high);
            }
            if (is_trailing_stop_triggered(order, quote)) return market_request(order, quote);
            break;
    }
    return std::nullopt;
}

bool OrderMatcher::is_marketable_limit(const Order& order, const PriceState& quote) {
    if (!order.limit_price) return false;
    if (is_buy(order.side)) {
        return quote.ask > 0.0 && quote.ask <= *order.limit_price;
    }
    return quote.bid > 0.0 && quote.bid >= *order.limit_price;
}

bool OrderMatcher::is_stop_triggered(const Order& order, const PriceState& quote) {
    if (!order.stop_price) return false;
    if (is_buy(order.side)) return quote.price >= *order.stop_price;
    return quote.price <= *order.stop_price;
}

bool OrderMatcher::is_take_profit_triggered(const Order& order, const PriceState& quote) {
    if (!order.stop_price) return false;
    if (is_buy(order.side)) return quote.price <= *order.stop_price;
    return quote.price >= *order.stop_price;
}

bool OrderMatcher::is_trailing_stop_triggered(const Order& order, const PriceState& quote) {
    if (!order.trail_high || !order.trail_pct) return false;
    double pct = *order.trail_pct / 100.0;
    if (is_buy(order.side)) {
        // Buy trailing stop fires when price rises off the low
        return quote.price >= *order.trail_high * (1.0 + pct);
    }
    return quote.price <= *order.trail_high * (1.0 - pct);
}

bool OrderMatcher::update_trailing_extreme(Order& order, const PriceState& quote) {
    if (!(quote.price > 0.0)) return false;
    if (!order.trail_high) {
        order.trail_high = quote.price;
        return true;
    }
    double next = is_buy(order.side) ? std::min(*order.trail_high, quote.price)
                                     : std::max(*order.trail_high, quote.price);
    if (next == *order.trail_high) return false;
    order.trail_high = next;
    return true;
}

double OrderMatcher::side_reference_price(const Order& order, const PriceState& quote) {
    return is_buy(order.side) ? quote.ask : quote.bid;
}

FillRequest OrderMatcher::market_request(const Order& order, const PriceState& quote) {
    FillRequest req;
    req.order_id = order.id;
    req.user_id = order.user_id;
    req.ticker = order.ticker;
    req.qty = order.remaining();
    req.reference_price = side_reference_price(order, quote);
    return req;
}

FillRequest OrderMatcher::limit_request(const Order& order, const PriceState& quote) {
    FillRequest req = market_request(order, quote);
    req.reference_price = is_buy(order.side) ? std::min(quote.ask, *order.limit_price)
                                             : std::max(quote.bid, *order.limit_price);
    req.limit_price = order.limit_price;
    return req;
}

} // namespace exchange_sim
