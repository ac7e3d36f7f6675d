#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "types.hpp"

namespace exchange_sim {

constexpr double kQtyEpsilon = 1e-9;

/**
 * Result of folding one fill into a position.
 */
struct PositionUpdate {
    std::optional<Position> position;   // nullopt: position is flat, delete the row
    double closed_qty{0.0};
    double realized_pnl{0.0};           // gross PnL of the closed leg
    double realized_borrow{0.0};        // accrued borrow released with the closed short qty
    double opened_short_qty{0.0};
};

/**
 * Weighted-average-cost position update for one fill.
 *
 * - Adding to a position in the same direction re-averages the cost.
 * - An opposing fill closes min(qty, |position|) and realizes PnL against
 *   avg_cost; any surplus opens a new position at the fill price.
 * - Closing part of a short releases the same fraction of accrued borrow.
 */
PositionUpdate apply_fill(const std::optional<Position>& existing, const std::string& user_id,
                          const std::string& ticker, OrderSide side, double qty, double price,
                          int64_t now_ms);

} // namespace exchange_sim
