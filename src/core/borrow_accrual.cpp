#include "borrow_accrual.hpp"
#include <cmath>
#include <spdlog/spdlog.h>
#include "errors.hpp"
#include "position_accounting.hpp"

namespace exchange_sim {

double settle_borrow(Position& pos, const InstrumentDef& def, double mark,
                     const ExecutionModel& model, const RegimeMultipliers& mult, int64_t now_ms) {
    int64_t since = pos.last_borrow_accrual_ms > 0 ? pos.last_borrow_accrual_ms : pos.opened_at_ms;
    double amount = 0.0;
    if (pos.qty < -kQtyEpsilon && now_ms > since) {
        amount = model.estimate_borrow_accrual(std::abs(pos.qty) * mark, def.micro.borrow_apr_short,
                                               now_ms - since, mult);
    }
    pos.accrued_borrow += amount;
    pos.last_borrow_accrual_ms = now_ms;
    return amount;
}

BorrowAccrual::BorrowAccrual(Store& store, MarketView& market, ExecutionModel& model,
                             const ExecutionConfig& config)
    : store_(store), market_(market), model_(model), config_(config) {}

AccrualStats BorrowAccrual::run(int64_t now_ms) {
    AccrualStats stats;
    std::vector<Position> shorts;
    try {
        shorts = store_.load_short_positions();
    } catch (const StorageError& e) {
        ++stats.errors;
        if (throttle_.allow("accrual.load")) {
            spdlog::warn("Short positions unavailable ({} suppressed): {}",
                         throttle_.suppressed("accrual.load"), e.what());
        }
        return stats;
    }

    for (const auto& pos : shorts) {
        int64_t since = pos.last_borrow_accrual_ms > 0 ? pos.last_borrow_accrual_ms : pos.opened_at_ms;
        if (now_ms - since < config_.borrow_accrual_interval_ms) continue;
        try {
            double charged = accrue(pos, now_ms);
            if (charged > 0.0) {
                ++stats.charged;
                stats.total += charged;
            }
        } catch (const StorageError& e) {
            ++stats.errors;
            if (throttle_.allow("accrual.charge")) {
                spdlog::warn("Borrow accrual for {} {} failed ({} suppressed): {}", pos.user_id,
                             pos.ticker, throttle_.suppressed("accrual.charge"), e.what());
            }
        }
    }
    if (stats.charged > 0) {
        spdlog::debug("Borrow accrued on {} shorts, total {:.6f}", stats.charged, stats.total);
    }
    return stats;
}

double BorrowAccrual::accrue(const Position& snapshot, int64_t now_ms) {
    const InstrumentDef* def = market_.instrument(snapshot.ticker);
    auto quote = market_.price(snapshot.ticker);
    if (!def || !quote) return 0.0;

    auto txn = store_.begin(snapshot.user_id);
    auto cash = txn->lock_cash();
    if (!cash) return 0.0;
    auto pos = txn->lock_position(snapshot.ticker);
    if (!pos || pos->qty >= -kQtyEpsilon) return 0.0;

    int64_t since = pos->last_borrow_accrual_ms > 0 ? pos->last_borrow_accrual_ms : pos->opened_at_ms;
    if (now_ms - since < config_.borrow_accrual_interval_ms) return 0.0;

    double amount = settle_borrow(*pos, *def, quote->price, model_, market_.regime().mult, now_ms);
    txn->set_cash(*cash - amount);
    txn->upsert_position(*pos);
    txn->commit();
    return amount;
}

} // namespace exchange_sim
