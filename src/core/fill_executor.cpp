#include "fill_executor.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include "borrow_accrual.hpp"
#include "position_accounting.hpp"
#include "utils.hpp"

namespace exchange_sim {

const char* to_string(FillOutcome outcome) {
    switch (outcome) {
        case FillOutcome::FILLED: return "filled";
        case FillOutcome::PARTIAL: return "partial";
        case FillOutcome::CANCELLED: return "cancelled";
        case FillOutcome::SKIPPED: return "skipped";
    }
    return "skipped";
}

FillExecutor::FillExecutor(Store& store, MarketView& market, ExecutionModel& model, EventBus& bus,
                           const ExecutionConfig& config)
    : store_(store), market_(market), model_(model), bus_(bus), config_(config) {}

FillResult FillExecutor::execute(const FillRequest& req, int64_t now_ms) {
    FillResult result;
    const InstrumentDef* def = market_.instrument(req.ticker);
    auto quote = market_.price(req.ticker);
    if (!def || !quote) {
        spdlog::warn("Fill for order {} skipped: no market for {}", req.order_id, req.ticker);
        return result;
    }
    const RegimeRecord regime = market_.regime();

    auto txn = store_.begin(req.user_id);
    auto order = txn->lock_order(req.order_id);
    if (!order || !order->is_live()) return result;

    double qty = std::min(req.qty, order->remaining());
    if (!(qty > kQtyEpsilon)) return result;

    auto cash = txn->lock_cash();
    if (!cash) {
        spdlog::warn("Fill for order {} skipped: no account {}", order->id, order->user_id);
        return result;
    }
    auto position = txn->lock_position(order->ticker);

    ExecutionInputs inputs;
    inputs.micro = def->micro;
    inputs.side = order->side;
    inputs.reference_price = req.reference_price;
    inputs.mid_price = quote->mid();
    inputs.volatility = quote->volatility;
    inputs.regime = regime.kind;
    inputs.regime_mult = regime.mult;
    inputs.opens_short_qty = 0.0;   // borrow is charged by periodic accrual only

    auto price_at = [&](double q) {
        inputs.qty = q;
        ExecutionEstimate est = model_.estimate(inputs);
        if (req.limit_price) est = model_.cap_to_limit(est, inputs, *req.limit_price);
        return est;
    };

    ExecutionEstimate est = price_at(qty);
    if (is_buy(order->side)) {
        int iterations = 0;
        while (est.notional + est.commission > *cash + 1e-9) {
            double per_unit = est.fill_price * (1.0 + def->micro.commission_bps / 10000.0);
            double next = per_unit > 0.0 ? std::floor(std::min(qty - 1.0, *cash / per_unit)) : 0.0;
            if (next <= 0.0 || ++iterations > config_.max_reprice_iterations) {
                qty = 0.0;
                break;
            }
            qty = next;
            est = price_at(qty);
        }
    }

    if (qty <= 0.0) {
        order->status = OrderStatus::CANCELLED;
        order->cancelled_at_ms = now_ms;
        txn->update_order(*order);
        txn->commit();
        spdlog::warn("Order {} cancelled: insufficient funds ({} cash {:.2f})",
                     order->id, order->user_id, *cash);
        result.outcome = FillOutcome::CANCELLED;
        return result;
    }

    const bool buy = is_buy(order->side);
    double new_cash = buy ? *cash - est.notional - est.commission
                          : *cash + est.notional - est.commission;

    // Borrow on the existing short is settled before new shares join it
    if (!buy && position && position->qty < -kQtyEpsilon) {
        new_cash -= settle_borrow(*position, *def, quote->price, model_, regime.mult, now_ms);
    }

    PositionUpdate update = apply_fill(position, order->user_id, order->ticker, order->side, qty,
                                       est.fill_price, now_ms);
    double net_pnl = update.realized_pnl - est.commission - update.realized_borrow;

    Trade trade;
    trade.id = utils::generate_id();
    trade.order_id = order->id;
    trade.user_id = order->user_id;
    trade.ticker = order->ticker;
    trade.side = order->side;
    trade.qty = qty;
    trade.price = est.fill_price;
    trade.notional = est.notional;
    trade.pnl = utils::round_to(net_pnl, 4);
    trade.mid_price = est.mid_price;
    trade.slippage_bps = est.slippage_bps;
    trade.slippage_cost = est.slippage_cost;
    trade.commission = est.commission;
    trade.borrow_cost = utils::round_to(update.realized_borrow, 4);
    trade.execution_quality_score = est.execution_quality_score;
    trade.regime = est.regime;
    trade.executed_at_ms = now_ms;

    txn->set_cash(new_cash);
    if (update.position) txn->upsert_position(*update.position);
    else txn->delete_position(order->ticker);
    txn->append_trade(trade);

    order->filled_qty = std::min(order->qty, order->filled_qty + qty);
    order->filled_at_ms = now_ms;
    order->status = order->remaining() <= kQtyEpsilon ? OrderStatus::FILLED : OrderStatus::PARTIAL;
    txn->update_order(*order);
    if (order->oco_id) {
        result.oco_cancelled = txn->cancel_oco_siblings(*order->oco_id, order->id, now_ms);
    }
    txn->commit();
    txn.reset();

    result.outcome = order->status == OrderStatus::FILLED ? FillOutcome::FILLED : FillOutcome::PARTIAL;
    result.trade = trade;

    market_.add_order_flow(order->ticker, order->side, est.notional);
    model_.record_fill(now_ms, est.slippage_bps, est.execution_quality_score);

    FillEvent ev;
    ev.kind = FillKind::FILL;
    ev.user_id = order->user_id;
    ev.order_id = order->id;
    ev.trade_id = trade.id;
    ev.ticker = order->ticker;
    ev.side = order->side;
    ev.qty = qty;
    ev.price = trade.price;
    ev.total = trade.notional;
    ev.commission = trade.commission;
    ev.borrow_cost = trade.borrow_cost;
    ev.slippage_bps = trade.slippage_bps;
    ev.execution_quality_score = trade.execution_quality_score;
    ev.net_pnl = trade.pnl;
    ev.regime = trade.regime;
    ev.timestamp_ms = now_ms;
    bus_.publish_fill(ev);

    spdlog::info("Fill {} {} {} x{} @ {} ({}){}", order->id, to_string(order->side), order->ticker,
                 qty, trade.price, to_string(order->status),
                 result.oco_cancelled > 0 ? fmt::format(", {} OCO cancelled", result.oco_cancelled) : "");
    return result;
}

} // namespace exchange_sim
