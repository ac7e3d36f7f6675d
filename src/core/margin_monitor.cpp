#include "margin_monitor.hpp"
#include <cmath>
#include <set>
#include <spdlog/spdlog.h>
#include "errors.hpp"
#include "position_accounting.hpp"
#include "utils.hpp"

namespace exchange_sim {

MarginMonitor::MarginMonitor(Store& store, MarketView& market, ExecutionModel& model, EventBus& bus,
                             const ExecutionConfig& config)
    : store_(store), market_(market), model_(model), bus_(bus), config_(config) {}

MarginStats MarginMonitor::run(int64_t now_ms) {
    MarginStats stats;
    std::set<std::string> users;
    try {
        for (const auto& pos : store_.load_short_positions()) users.insert(pos.user_id);
    } catch (const StorageError& e) {
        ++stats.errors;
        if (throttle_.allow("margin.load")) {
            spdlog::warn("Margin check skipped ({} suppressed): {}",
                         throttle_.suppressed("margin.load"), e.what());
        }
        return stats;
    }

    for (const auto& user : users) {
        ++stats.users_checked;
        try {
            size_t closed = check_user(user, now_ms);
            if (closed > 0) {
                ++stats.margin_calls;
                stats.positions_closed += closed;
            }
        } catch (const StorageError& e) {
            ++stats.errors;
            if (throttle_.allow("margin.user")) {
                spdlog::warn("Margin check for {} failed ({} suppressed): {}", user,
                             throttle_.suppressed("margin.user"), e.what());
            }
        }
    }
    return stats;
}

size_t MarginMonitor::check_user(const std::string& user_id, int64_t now_ms) {
    auto txn = store_.begin(user_id);
    auto cash = txn->lock_cash();
    if (!cash) return 0;
    std::vector<Position> positions = txn->lock_positions();

    double exposure = 0.0;
    double equity = *cash;
    for (const auto& pos : positions) {
        auto quote = market_.price(pos.ticker);
        // Unpriced positions are carried at cost
        double mark = quote ? quote->price : pos.avg_cost;
        equity += pos.qty * mark;
        if (pos.qty < -kQtyEpsilon) exposure += std::abs(pos.qty) * mark;
    }
    if (exposure <= 0.0 || equity >= config_.margin_requirement * exposure) return 0;

    spdlog::info("Margin call for {}: equity {:.2f} below {:.2f}x short exposure {:.2f}",
                 user_id, equity, config_.margin_requirement, exposure);

    const RegimeRecord regime = market_.regime();
    double balance = *cash;
    std::vector<Trade> trades;
    for (const auto& pos : positions) {
        if (pos.qty >= -kQtyEpsilon) continue;
        const InstrumentDef* def = market_.instrument(pos.ticker);
        auto quote = market_.price(pos.ticker);
        if (!def || !quote) {
            spdlog::warn("Margin call for {}: no market for {}, short left open", user_id, pos.ticker);
            continue;
        }
        double qty = std::abs(pos.qty);

        ExecutionInputs inputs;
        inputs.micro = def->micro;
        inputs.side = OrderSide::BUY;
        inputs.qty = qty;
        inputs.reference_price = quote->ask;
        inputs.mid_price = quote->mid();
        inputs.volatility = quote->volatility;
        inputs.regime = regime.kind;
        inputs.regime_mult = regime.mult;
        ExecutionEstimate est = model_.estimate(inputs);

        PositionUpdate update = apply_fill(pos, user_id, pos.ticker, OrderSide::BUY, qty,
                                           est.fill_price, now_ms);
        balance -= est.notional + est.commission;

        Trade trade;
        trade.id = utils::generate_id();
        trade.order_id = kMarginCallOrderId;
        trade.user_id = user_id;
        trade.ticker = pos.ticker;
        trade.side = OrderSide::BUY;
        trade.qty = qty;
        trade.price = est.fill_price;
        trade.notional = est.notional;
        trade.pnl = utils::round_to(update.realized_pnl - est.commission - update.realized_borrow, 4);
        trade.mid_price = est.mid_price;
        trade.slippage_bps = est.slippage_bps;
        trade.slippage_cost = est.slippage_cost;
        trade.commission = est.commission;
        trade.borrow_cost = utils::round_to(update.realized_borrow, 4);
        trade.execution_quality_score = est.execution_quality_score;
        trade.regime = est.regime;
        trade.executed_at_ms = now_ms;

        if (update.position) txn->upsert_position(*update.position);
        else txn->delete_position(pos.ticker);
        txn->append_trade(trade);
        trades.push_back(trade);
    }
    if (trades.empty()) return 0;

    txn->set_cash(balance);
    txn->commit();
    txn.reset();

    for (const auto& trade : trades) {
        market_.add_order_flow(trade.ticker, trade.side, trade.notional);
        model_.record_fill(now_ms, trade.slippage_bps, trade.execution_quality_score);

        FillEvent ev;
        ev.kind = FillKind::MARGIN_CALL;
        ev.user_id = user_id;
        ev.order_id = trade.order_id;
        ev.trade_id = trade.id;
        ev.ticker = trade.ticker;
        ev.side = trade.side;
        ev.qty = trade.qty;
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

        spdlog::info("Margin call closed {} {} x{} @ {} pnl {:.2f}", user_id, trade.ticker,
                     trade.qty, trade.price, trade.pnl);
    }
    return trades.size();
}

} // namespace exchange_sim
