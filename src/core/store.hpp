#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "types.hpp"

namespace exchange_sim {

/**
 * One ledger transaction scoped to a single user. Rows are locked as they
 * are read (lock_*) and held until commit or destruction. Writes are not
 * visible to other readers before commit(); destroying an uncommitted
 * transaction rolls it back.
 *
 * Rows are always locked in the order order -> cash -> position(s), so
 * two transactions on the same user never wait on each other in a cycle.
 *
 * Every method may throw StorageUnavailable (transient) or StorageError.
 */
class LedgerTxn {
public:
    virtual ~LedgerTxn() = default;

    virtual std::optional<Order> lock_order(const std::string& order_id) = 0;
    virtual std::optional<double> lock_cash() = 0;
    virtual std::optional<Position> lock_position(const std::string& ticker) = 0;
    virtual std::vector<Position> lock_positions() = 0;

    virtual void set_cash(double cash) = 0;
    virtual void upsert_position(const Position& pos) = 0;
    virtual void delete_position(const std::string& ticker) = 0;
    virtual void append_trade(const Trade& trade) = 0;
    virtual void update_order(const Order& order) = 0;

    // Cancels every other live order of this user sharing `oco_id`.
    // Returns the number cancelled.
    virtual int cancel_oco_siblings(const std::string& oco_id, const std::string& filled_order_id,
                                    int64_t now_ms) = 0;

    virtual void commit() = 0;
};

/**
 * Persistence gateway used by the engine and the ledger.
 */
class Store {
public:
    virtual ~Store() = default;

    virtual std::unique_ptr<LedgerTxn> begin(const std::string& user_id) = 0;

    // Accounts
    virtual void create_account(const std::string& user_id, double cash) = 0;
    virtual std::optional<double> get_cash(const std::string& user_id) = 0;

    // Orders
    virtual void insert_order(const Order& order) = 0;
    virtual std::optional<Order> get_order(const std::string& order_id) = 0;
    virtual bool cancel_order(const std::string& order_id, int64_t now_ms) = 0;
    virtual std::vector<Order> load_open_orders() = 0;
    virtual void update_trail_high(const std::string& order_id, double trail_high) = 0;
    virtual void mark_stop_triggered(const std::string& order_id) = 0;

    // Positions and trades
    virtual std::vector<Position> load_positions(const std::string& user_id) = 0;
    virtual std::vector<Position> load_short_positions() = 0;
    virtual std::vector<Trade> load_trades(const std::string& user_id) = 0;

    // Market data
    virtual void upsert_price_states(const std::vector<PriceState>& states) = 0;
    virtual std::vector<PriceState> load_price_states() = 0;
    virtual void upsert_candles(const std::vector<Candle>& candles) = 0;
    virtual std::vector<Candle> load_candles(const std::string& ticker, const std::string& interval,
                                             size_t limit) = 0;

    // Regimes; save_regime inserts or closes a row by id.
    virtual void save_regime(const RegimeRecord& regime) = 0;
    virtual std::optional<RegimeRecord> load_active_regime() = 0;
};

} // namespace exchange_sim
