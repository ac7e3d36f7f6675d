#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>
#include "store.hpp"

namespace exchange_sim {

/**
 * In-process Store. A per-user mutex stands in for row locks: a LedgerTxn
 * holds its user's mutex from begin() until commit or rollback, and stages
 * its writes until commit(). Used when Postgres is disabled and in tests.
 */
class MemoryStore : public Store {
public:
    MemoryStore() = default;

    std::unique_ptr<LedgerTxn> begin(const std::string& user_id) override;

    void create_account(const std::string& user_id, double cash) override;
    std::optional<double> get_cash(const std::string& user_id) override;

    void insert_order(const Order& order) override;
    std::optional<Order> get_order(const std::string& order_id) override;
    bool cancel_order(const std::string& order_id, int64_t now_ms) override;
    std::vector<Order> load_open_orders() override;
    void update_trail_high(const std::string& order_id, double trail_high) override;
    void mark_stop_triggered(const std::string& order_id) override;

    std::vector<Position> load_positions(const std::string& user_id) override;
    std::vector<Position> load_short_positions() override;
    std::vector<Trade> load_trades(const std::string& user_id) override;

    void upsert_price_states(const std::vector<PriceState>& states) override;
    std::vector<PriceState> load_price_states() override;
    void upsert_candles(const std::vector<Candle>& candles) override;
    std::vector<Candle> load_candles(const std::string& ticker, const std::string& interval,
                                     size_t limit) override;

    void save_regime(const RegimeRecord& regime) override;
    std::optional<RegimeRecord> load_active_regime() override;

    // Simulated outage: while unavailable every call throws StorageUnavailable.
    void set_available(bool available) { available_ = available; }
    void put_position(const Position& pos);
    std::vector<RegimeRecord> regimes() const;

private:
    friend class MemoryLedgerTxn;

    using CandleKey = std::tuple<std::string, std::string, int64_t>;

    void check_available() const;
    std::mutex& user_mutex(const std::string& user_id);

    std::atomic<bool> available_{true};

    std::mutex locks_mu_;
    std::unordered_map<std::string, std::unique_ptr<std::mutex>> user_locks_;

    mutable std::mutex data_mu_;
    std::unordered_map<std::string, double> cash_;
    std::unordered_map<std::string, Order> orders_;
    std::vector<std::string> order_seq_;
    std::map<std::string, std::map<std::string, Position>> positions_;  // user -> ticker
    std::vector<Trade> trades_;
    std::map<std::string, PriceState> prices_;
    std::map<CandleKey, Candle> candles_;
    std::map<std::string, RegimeRecord> regimes_;
    std::vector<std::string> regime_seq_;
};

} // namespace exchange_sim
