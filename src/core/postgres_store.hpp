#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <libpq-fe.h>
#include <spdlog/spdlog.h>
#include "config.hpp"
#include "store.hpp"

namespace exchange_sim {

/**
 * PostgreSQL-backed Store.
 *
 * Tables: accounts, orders, positions, trades, price_states, candles,
 * regimes (created on connect).
 *
 * One connection guarded by a mutex; a LedgerTxn holds it from BEGIN to
 * COMMIT/ROLLBACK and locks rows with SELECT ... FOR UPDATE under
 * SET LOCAL lock_timeout. Connection loss, lock timeouts, deadlocks and
 * serialization failures throw StorageUnavailable; other failures throw
 * StorageError.
 */
class PostgresStore : public Store {
public:
    explicit PostgresStore(const PostgresConfig& config);
    ~PostgresStore() override;

    // Connection management
    bool connect();
    void disconnect();
    bool is_connected() const;
    bool ensure_schema();

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

private:
    friend class PostgresLedgerTxn;

    using ResultPtr = std::unique_ptr<PGresult, decltype(&PQclear)>;

    // Caller holds conn_mu_.
    void ensure_connected();
    void exec_sql(const std::string& sql);
    ResultPtr query(const std::string& sql);
    int exec_count(const std::string& sql);
    [[noreturn]] void fail(const std::string& what, const PGresult* res);
    std::string escape(const std::string& str);

    PostgresConfig config_;
    PGconn* conn_{nullptr};
    std::mutex conn_mu_;
};

/**
 * Connects and prepares the schema; nullptr when disabled or unreachable.
 */
class PostgresStoreFactory {
public:
    static std::shared_ptr<PostgresStore> create(const PostgresConfig& config) {
        if (!config.enabled) {
            return nullptr;
        }
        auto store = std::make_shared<PostgresStore>(config);
        if (!store->connect()) {
            spdlog::warn("Failed to connect to PostgreSQL, falling back to in-memory store");
            return nullptr;
        }
        if (!store->ensure_schema()) {
            spdlog::warn("Failed to create PostgreSQL schema");
            return nullptr;
        }
        spdlog::info("Connected to PostgreSQL {}:{} db={}",
                     config.host, config.port, config.database);
        return store;
    }
};

} // namespace exchange_sim
