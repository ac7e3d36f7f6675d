#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../core/execution_model.hpp"
#include "../core/instruments.hpp"
#include "../core/order_book.hpp"
#include "../core/types.hpp"
#include "../core/utils.hpp"

namespace exchange_sim {
namespace market_format {

inline nlohmann::json maybe_iso(int64_t ms) {
    if (ms <= 0) return nullptr;
    return utils::ms_to_iso(ms);
}

inline nlohmann::json format_instrument(const InstrumentDef& def) {
    return {
        {"ticker", def.ticker},
        {"name", def.name},
        {"asset_class", to_string(def.asset_class)},
        {"sector", def.sector},
        {"base_price", def.base_price},
        {"min_price", def.min_price()},
        {"max_price", def.max_price()},
        {"decimals", def.decimals()},
        {"base_volatility", def.base_volatility},
        {"max_tick_move_pct", def.risk.max_tick_move_pct},
        {"base_spread_bps", def.micro.base_spread_bps},
        {"commission_bps", def.micro.commission_bps},
        {"borrow_apr_short", def.micro.borrow_apr_short}
    };
}

inline nlohmann::json format_price(const PriceState& s) {
    double change = s.price - s.prev_close;
    return {
        {"ticker", s.ticker},
        {"price", s.price},
        {"bid", s.bid},
        {"ask", s.ask},
        {"open", s.open},
        {"high", s.high},
        {"low", s.low},
        {"prev_close", s.prev_close},
        {"volume", s.volume},
        {"change", change},
        {"change_pct", s.prev_close > 0.0 ? utils::round_to(change / s.prev_close * 100.0, 2) : 0.0},
        {"volatility", s.volatility},
        {"updated_at", maybe_iso(s.updated_at_ms)}
    };
}

inline nlohmann::json format_tick(const TickEvent& t) {
    return {
        {"ticker", t.ticker},
        {"price", t.price},
        {"bid", t.bid},
        {"ask", t.ask},
        {"open", t.open},
        {"high", t.high},
        {"low", t.low},
        {"prev_close", t.prev_close},
        {"volume", t.volume},
        {"change", t.change},
        {"change_pct", t.change_pct},
        {"volatility", t.volatility},
        {"regime", t.regime},
        {"timestamp", t.timestamp_ms}
    };
}

inline nlohmann::json format_candle(const Candle& c) {
    return {
        {"t", c.open_time_ms},
        {"o", c.open},
        {"h", c.high},
        {"l", c.low},
        {"c", c.close},
        {"v", c.volume}
    };
}

inline nlohmann::json format_regime(const RegimeRecord& r) {
    return {
        {"id", r.id},
        {"regime", to_string(r.kind)},
        {"reason", r.reason},
        {"liquidity_mult", r.mult.liquidity},
        {"volatility_mult", r.mult.volatility},
        {"news_mult", r.mult.news},
        {"borrow_mult", r.mult.borrow},
        {"started_at", maybe_iso(r.started_at_ms)},
        {"ended_at", r.ended_at_ms ? maybe_iso(*r.ended_at_ms) : nlohmann::json(nullptr)}
    };
}

inline nlohmann::json format_fill(const FillEvent& f) {
    return {
        {"kind", to_string(f.kind)},
        {"user_id", f.user_id},
        {"order_id", f.order_id},
        {"trade_id", f.trade_id},
        {"ticker", f.ticker},
        {"side", to_string(f.side)},
        {"qty", f.qty},
        {"price", f.price},
        {"total", f.total},
        {"commission", f.commission},
        {"borrow_cost", f.borrow_cost},
        {"slippage_bps", f.slippage_bps},
        {"execution_quality_score", f.execution_quality_score},
        {"net_pnl", f.net_pnl},
        {"regime", f.regime},
        {"timestamp", f.timestamp_ms}
    };
}

inline nlohmann::json format_book(const OrderBookView& book) {
    auto levels = [](const std::vector<BookLevel>& side) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& l : side) {
            nlohmann::json level = {{"price", l.price}, {"qty", l.qty}};
            if (l.user) level["user"] = true;
            out.push_back(level);
        }
        return out;
    };
    return {
        {"ticker", book.ticker},
        {"bids", levels(book.bids)},
        {"asks", levels(book.asks)},
        {"spread", book.spread},
        {"mid", book.mid},
        {"timestamp", book.timestamp_ms}
    };
}

inline nlohmann::json format_metrics(const FillMetricsSummary& m, int64_t window_ms) {
    return {
        {"window_ms", window_ms},
        {"count", m.count},
        {"avg_slippage_bps", utils::round_to(m.avg_slippage_bps, 4)},
        {"avg_execution_quality", utils::round_to(m.avg_execution_quality, 2)}
    };
}

} // namespace market_format
} // namespace exchange_sim
