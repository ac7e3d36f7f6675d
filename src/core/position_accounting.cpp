#include "position_accounting.hpp"
#include <algorithm>
#include <cmath>

namespace exchange_sim {

namespace {

Position open_position(const std::string& user_id, const std::string& ticker, double signed_qty,
                       double price, int64_t now_ms) {
    Position p;
    p.user_id = user_id;
    p.ticker = ticker;
    p.qty = signed_qty;
    p.avg_cost = price;
    p.accrued_borrow = 0.0;
    p.opened_at_ms = now_ms;
    p.last_borrow_accrual_ms = now_ms;
    return p;
}

} // namespace

PositionUpdate apply_fill(const std::optional<Position>& existing, const std::string& user_id,
                          const std::string& ticker, OrderSide side, double qty, double price,
                          int64_t now_ms) {
    PositionUpdate out;
    const bool buy = is_buy(side);
    const double held = existing ? existing->qty : 0.0;

    if (std::abs(held) <= kQtyEpsilon) {
        out.position = open_position(user_id, ticker, buy ? qty : -qty, price, now_ms);
        if (!buy) out.opened_short_qty = qty;
        return out;
    }

    Position pos = *existing;
    const bool same_direction = (buy && held > 0.0) || (!buy && held < 0.0);
    if (same_direction) {
        double size = std::abs(held);
        double total = size + qty;
        pos.avg_cost = (size * pos.avg_cost + qty * price) / total;
        pos.qty = buy ? total : -total;
        if (!buy) out.opened_short_qty = qty;
        out.position = pos;
        return out;
    }

    // Opposing fill: close first, then open any surplus the other way.
    double size = std::abs(held);
    double closed = std::min(qty, size);
    out.closed_qty = closed;
    out.realized_pnl = buy ? closed * (pos.avg_cost - price)    // covering a short
                           : closed * (price - pos.avg_cost);   // selling a long
    if (held < 0.0) {
        out.realized_borrow = pos.accrued_borrow * (closed / size);
    }

    double remaining = size - closed;
    double surplus = qty - closed;
    if (surplus > kQtyEpsilon) {
        out.position = open_position(user_id, ticker, buy ? surplus : -surplus, price, now_ms);
        if (!buy) out.opened_short_qty = surplus;
    } else if (remaining > kQtyEpsilon) {
        pos.qty = held < 0.0 ? -remaining : remaining;
        pos.accrued_borrow = std::max(0.0, pos.accrued_borrow - out.realized_borrow);
        out.position = pos;
    }
    return out;
}

} // namespace exchange_sim
