#include "types.hpp"

namespace exchange_sim {

const char* to_string(OrderSide side) {
    return side == OrderSide::BUY ? "buy" : "sell";
}

const char* to_string(OrderType type) {
    switch (type) {
        case OrderType::MARKET: return "market";
        case OrderType::LIMIT: return "limit";
        case OrderType::STOP: return "stop";
        case OrderType::STOP_LOSS: return "stop-loss";
        case OrderType::STOP_LIMIT: return "stop-limit";
        case OrderType::TAKE_PROFIT: return "take-profit";
        case OrderType::TRAILING_STOP: return "trailing-stop";
    }
    return "market";
}

const char* to_string(OrderStatus status) {
    switch (status) {
        case OrderStatus::OPEN: return "open";
        case OrderStatus::PARTIAL: return "partial";
        case OrderStatus::FILLED: return "filled";
        case OrderStatus::CANCELLED: return "cancelled";
    }
    return "open";
}

const char* to_string(RegimeKind kind) {
    switch (kind) {
        case RegimeKind::NORMAL: return "normal";
        case RegimeKind::TIGHT_LIQUIDITY: return "tight_liquidity";
        case RegimeKind::HIGH_VOLATILITY: return "high_volatility";
        case RegimeKind::EVENT_SHOCK: return "event_shock";
    }
    return "normal";
}

const char* to_string(FillKind kind) {
    return kind == FillKind::MARGIN_CALL ? "margin_call" : "fill";
}

std::optional<OrderSide> parse_order_side(const std::string& s) {
    if (s == "buy") return OrderSide::BUY;
    if (s == "sell") return OrderSide::SELL;
    return std::nullopt;
}

std::optional<OrderType> parse_order_type(const std::string& s) {
    if (s == "market") return OrderType::MARKET;
    if (s == "limit") return OrderType::LIMIT;
    if (s == "stop") return OrderType::STOP;
    if (s == "stop-loss") return OrderType::STOP_LOSS;
    if (s == "stop-limit") return OrderType::STOP_LIMIT;
    if (s == "take-profit") return OrderType::TAKE_PROFIT;
    if (s == "trailing-stop") return OrderType::TRAILING_STOP;
    return std::nullopt;
}

std::optional<OrderStatus> parse_order_status(const std::string& s) {
    if (s == "open") return OrderStatus::OPEN;
    if (s == "partial") return OrderStatus::PARTIAL;
    if (s == "filled") return OrderStatus::FILLED;
    if (s == "cancelled") return OrderStatus::CANCELLED;
    return std::nullopt;
}

std::optional<RegimeKind> parse_regime_kind(const std::string& s) {
    if (s == "normal") return RegimeKind::NORMAL;
    if (s == "tight_liquidity") return RegimeKind::TIGHT_LIQUIDITY;
    if (s == "high_volatility") return RegimeKind::HIGH_VOLATILITY;
    if (s == "event_shock") return RegimeKind::EVENT_SHOCK;
    return std::nullopt;
}

} // namespace exchange_sim
