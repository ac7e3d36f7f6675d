#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace exchange_sim {

enum class OrderSide { BUY, SELL };
enum class OrderType { MARKET, LIMIT, STOP, STOP_LOSS, STOP_LIMIT, TAKE_PROFIT, TRAILING_STOP };
enum class OrderStatus { OPEN, PARTIAL, FILLED, CANCELLED };

enum class RegimeKind { NORMAL, TIGHT_LIQUIDITY, HIGH_VOLATILITY, EVENT_SHOCK };

struct Order {
    std::string id;
    std::string user_id;
    std::string ticker;
    OrderType type{OrderType::MARKET};
    OrderSide side{OrderSide::BUY};
    double qty{0.0};
    double filled_qty{0.0};
    std::optional<double> limit_price;
    std::optional<double> stop_price;
    std::optional<double> trail_pct;
    std::optional<double> trail_high;   // running extreme for trailing stops (low for buys)
    std::optional<std::string> oco_id;
    bool stop_triggered{false};
    OrderStatus status{OrderStatus::OPEN};
    int64_t created_at_ms{0};
    int64_t filled_at_ms{0};
    int64_t cancelled_at_ms{0};

    double remaining() const { return qty - filled_qty; }
    bool is_live() const { return status == OrderStatus::OPEN || status == OrderStatus::PARTIAL; }
};

struct Position {
    std::string user_id;
    std::string ticker;
    double qty{0.0};               // positive = long, negative = short
    double avg_cost{0.0};
    double accrued_borrow{0.0};    // borrow charged since the short was opened
    int64_t opened_at_ms{0};
    int64_t last_borrow_accrual_ms{0};
};

struct Trade {
    std::string id;
    std::string order_id;
    std::string user_id;
    std::string ticker;
    OrderSide side{OrderSide::BUY};
    double qty{0.0};
    double price{0.0};
    double notional{0.0};
    double pnl{0.0};
    double mid_price{0.0};
    double slippage_bps{0.0};
    double slippage_cost{0.0};
    double commission{0.0};
    double borrow_cost{0.0};
    double execution_quality_score{100.0};
    std::string regime;
    int64_t executed_at_ms{0};
};

struct Candle {
    std::string ticker;
    std::string interval;
    int64_t open_time_ms{0};
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};
    double volume{0.0};
};

struct PriceState {
    std::string ticker;
    double price{0.0};
    double bid{0.0};
    double ask{0.0};
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double prev_close{0.0};
    double volume{0.0};
    double volatility{0.0};
    double anchor{0.0};
    double last_log_return{0.0};
    int64_t updated_at_ms{0};

    double mid() const { return (bid + ask) / 2.0; }
};

struct RegimeMultipliers {
    double liquidity{1.0};
    double volatility{1.0};
    double news{1.0};
    double borrow{1.0};
};

struct RegimeRecord {
    std::string id;
    RegimeKind kind{RegimeKind::NORMAL};
    RegimeMultipliers mult;
    std::string reason;
    int64_t started_at_ms{0};
    std::optional<int64_t> ended_at_ms;
};

struct TickEvent {
    std::string ticker;
    double price{0.0};
    double bid{0.0};
    double ask{0.0};
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double prev_close{0.0};
    double volume{0.0};
    double change{0.0};
    double change_pct{0.0};
    double volatility{0.0};
    std::string regime;
    int64_t timestamp_ms{0};
};

enum class FillKind { FILL, MARGIN_CALL };

struct FillEvent {
    FillKind kind{FillKind::FILL};
    std::string user_id;
    std::string order_id;
    std::string trade_id;
    std::string ticker;
    OrderSide side{OrderSide::BUY};
    double qty{0.0};
    double price{0.0};
    double total{0.0};
    double commission{0.0};
    double borrow_cost{0.0};
    double slippage_bps{0.0};
    double execution_quality_score{100.0};
    double net_pnl{0.0};
    std::string regime;
    int64_t timestamp_ms{0};
};

const char* to_string(OrderSide side);
const char* to_string(OrderType type);
const char* to_string(OrderStatus status);
const char* to_string(RegimeKind kind);
const char* to_string(FillKind kind);

std::optional<OrderSide> parse_order_side(const std::string& s);
std::optional<OrderType> parse_order_type(const std::string& s);
std::optional<OrderStatus> parse_order_status(const std::string& s);
std::optional<RegimeKind> parse_regime_kind(const std::string& s);

inline bool is_buy(OrderSide side) { return side == OrderSide::BUY; }

} // namespace exchange_sim
