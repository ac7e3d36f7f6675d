#include "postgres_store.hpp"
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <spdlog/fmt/fmt.h>
#include "errors.hpp"

namespace exchange_sim {

namespace {

constexpr const char* kOrderColumns =
    "id, user_id, ticker, type, side, qty, filled_qty, limit_price, stop_price, trail_pct, "
    "trail_high, oco_id, stop_triggered, status, created_at, filled_at, cancelled_at";

constexpr const char* kPositionColumns =
    "user_id, ticker, qty, avg_cost, accrued_borrow, opened_at, last_borrow_accrual_at";

constexpr const char* kTradeColumns =
    "id, order_id, user_id, ticker, side, qty, price, notional, pnl, mid_price, slippage_bps, "
    "slippage_cost, commission, borrow_cost, execution_quality_score, regime, executed_at";

constexpr const char* kPriceColumns =
    "ticker, price, bid, ask, open, high, low, prev_close, volume, volatility, anchor, "
    "last_log_return, updated_at";

constexpr const char* kRegimeColumns =
    "id, regime, liquidity_mult, vol_mult, news_mult, borrow_mult, reason, started_at, ended_at";

std::string num(double v) {
    if (!std::isfinite(v)) return "'NaN'::double precision";
    return fmt::format("{}", v);
}

std::string opt_num(const std::optional<double>& v) {
    return v ? num(*v) : std::string("NULL");
}

bool is_null(const PGresult* res, int row, int col) {
    return PQgetisnull(res, row, col) != 0;
}

std::string text(const PGresult* res, int row, int col) {
    return PQgetvalue(res, row, col);
}

double dbl(const PGresult* res, int row, int col) {
    return is_null(res, row, col) ? 0.0 : std::stod(PQgetvalue(res, row, col));
}

int64_t i64(const PGresult* res, int row, int col) {
    return is_null(res, row, col) ? 0 : std::stoll(PQgetvalue(res, row, col));
}

std::optional<double> opt_dbl(const PGresult* res, int row, int col) {
    if (is_null(res, row, col)) return std::nullopt;
    return std::stod(PQgetvalue(res, row, col));
}

Order row_to_order(const PGresult* res, int r) {
    Order o;
    o.id = text(res, r, 0);
    o.user_id = text(res, r, 1);
    o.ticker = text(res, r, 2);
    o.type = parse_order_type(text(res, r, 3)).value_or(OrderType::MARKET);
    o.side = parse_order_side(text(res, r, 4)).value_or(OrderSide::BUY);
    o.qty = dbl(res, r, 5);
    o.filled_qty = dbl(res, r, 6);
    o.limit_price = opt_dbl(res, r, 7);
    o.stop_price = opt_dbl(res, r, 8);
    o.trail_pct = opt_dbl(res, r, 9);
    o.trail_high = opt_dbl(res, r, 10);
    if (!is_null(res, r, 11)) o.oco_id = text(res, r, 11);
    o.stop_triggered = text(res, r, 12) == "t";
    o.status = parse_order_status(text(res, r, 13)).value_or(OrderStatus::CANCELLED);
    o.created_at_ms = i64(res, r, 14);
    o.filled_at_ms = i64(res, r, 15);
    o.cancelled_at_ms = i64(res, r, 16);
    return o;
}

Position row_to_position(const PGresult* res, int r) {
    Position p;
    p.user_id = text(res, r, 0);
    p.ticker = text(res, r, 1);
    p.qty = dbl(res, r, 2);
    p.avg_cost = dbl(res, r, 3);
    p.accrued_borrow = dbl(res, r, 4);
    p.opened_at_ms = i64(res, r, 5);
    p.last_borrow_accrual_ms = i64(res, r, 6);
    return p;
}

Trade row_to_trade(const PGresult* res, int r) {
    Trade t;
    t.id = text(res, r, 0);
    t.order_id = text(res, r, 1);
    t.user_id = text(res, r, 2);
    t.ticker = text(res, r, 3);
    t.side = parse_order_side(text(res, r, 4)).value_or(OrderSide::BUY);
    t.qty = dbl(res, r, 5);
    t.price = dbl(res, r, 6);
    t.notional = dbl(res, r, 7);
    t.pnl = dbl(res, r, 8);
    t.mid_price = dbl(res, r, 9);
    t.slippage_bps = dbl(res, r, 10);
    t.slippage_cost = dbl(res, r, 11);
    t.commission = dbl(res, r, 12);
    t.borrow_cost = dbl(res, r, 13);
    t.execution_quality_score = dbl(res, r, 14);
    t.regime = text(res, r, 15);
    t.executed_at_ms = i64(res, r, 16);
    return t;
}

PriceState row_to_price(const PGresult* res, int r) {
    PriceState s;
    s.ticker = text(res, r, 0);
    s.price = dbl(res, r, 1);
    s.bid = dbl(res, r, 2);
    s.ask = dbl(res, r, 3);
    s.open = dbl(res, r, 4);
    s.high = dbl(res, r, 5);
    s.low = dbl(res, r, 6);
    s.prev_close = dbl(res, r, 7);
    s.volume = dbl(res, r, 8);
    s.volatility = dbl(res, r, 9);
    s.anchor = dbl(res, r, 10);
    s.last_log_return = dbl(res, r, 11);
    s.updated_at_ms = i64(res, r, 12);
    return s;
}

RegimeRecord row_to_regime(const PGresult* res, int r) {
    RegimeRecord rec;
    rec.id = text(res, r, 0);
    rec.kind = parse_regime_kind(text(res, r, 1)).value_or(RegimeKind::NORMAL);
    rec.mult.liquidity = dbl(res, r, 2);
    rec.mult.volatility = dbl(res, r, 3);
    rec.mult.news = dbl(res, r, 4);
    rec.mult.borrow = dbl(res, r, 5);
    rec.reason = text(res, r, 6);
    rec.started_at_ms = i64(res, r, 7);
    if (!is_null(res, r, 8)) rec.ended_at_ms = i64(res, r, 8);
    return rec;
}

// SQLSTATE classes retried on the next tick.
bool is_transient_sqlstate(const char* state) {
    if (!state) return false;
    return std::strncmp(state, "08", 2) == 0       // connection exception
        || std::strcmp(state, "55P03") == 0        // lock_not_available
        || std::strcmp(state, "40001") == 0        // serialization_failure
        || std::strcmp(state, "40P01") == 0        // deadlock_detected
        || std::strcmp(state, "57P01") == 0;       // admin_shutdown
}

} // namespace

PostgresStore::PostgresStore(const PostgresConfig& config)
    : config_(config) {}

PostgresStore::~PostgresStore() {
    disconnect();
}

bool PostgresStore::connect() {
    std::lock_guard<std::mutex> lock(conn_mu_);
    if (conn_) {
        return true;
    }

    std::string conn_str = fmt::format(
        "host={} port={} dbname={} user={} password={}",
        config_.host, config_.port, config_.database,
        config_.user, config_.password);

    conn_ = PQconnectdb(conn_str.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        spdlog::error("PostgreSQL connection failed: {}", PQerrorMessage(conn_));
        PQfinish(conn_);
        conn_ = nullptr;
        return false;
    }

    return true;
}

void PostgresStore::disconnect() {
    std::lock_guard<std::mutex> lock(conn_mu_);
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

bool PostgresStore::is_connected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

void PostgresStore::ensure_connected() {
    if (!conn_) throw StorageUnavailable("PostgreSQL not connected");
    if (PQstatus(conn_) == CONNECTION_OK) return;
    PQreset(conn_);
    if (PQstatus(conn_) != CONNECTION_OK) {
        throw StorageUnavailable(fmt::format("PostgreSQL reconnect failed: {}", PQerrorMessage(conn_)));
    }
    spdlog::info("PostgreSQL connection re-established");
}

void PostgresStore::fail(const std::string& what, const PGresult* res) {
    const char* state = res ? PQresultErrorField(res, PG_DIAG_SQLSTATE) : nullptr;
    std::string msg = fmt::format("{}: {}", what, PQerrorMessage(conn_));
    if (PQstatus(conn_) != CONNECTION_OK || is_transient_sqlstate(state)) {
        throw StorageUnavailable(msg);
    }
    throw StorageError(msg);
}

void PostgresStore::exec_sql(const std::string& sql) {
    ensure_connected();
    ResultPtr res(PQexec(conn_, sql.c_str()), &PQclear);
    auto status = PQresultStatus(res.get());
    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        fail("PostgreSQL exec failed", res.get());
    }
}

int PostgresStore::exec_count(const std::string& sql) {
    ensure_connected();
    ResultPtr res(PQexec(conn_, sql.c_str()), &PQclear);
    if (PQresultStatus(res.get()) != PGRES_COMMAND_OK) {
        fail("PostgreSQL exec failed", res.get());
    }
    const char* n = PQcmdTuples(res.get());
    return (n && *n) ? std::atoi(n) : 0;
}

PostgresStore::ResultPtr PostgresStore::query(const std::string& sql) {
    ensure_connected();
    ResultPtr res(PQexec(conn_, sql.c_str()), &PQclear);
    if (PQresultStatus(res.get()) != PGRES_TUPLES_OK) {
        fail("PostgreSQL query failed", res.get());
    }
    return res;
}

std::string PostgresStore::escape(const std::string& str) {
    if (!conn_) return "''";
    char* escaped = PQescapeLiteral(conn_, str.c_str(), str.size());
    if (!escaped) return "''";
    std::string result(escaped);
    PQfreemem(escaped);
    return result;
}

bool PostgresStore::ensure_schema() {
    const char* schema = R"(
        CREATE TABLE IF NOT EXISTS accounts (
            user_id TEXT PRIMARY KEY,
            cash DOUBLE PRECISION NOT NULL
        );

        CREATE TABLE IF NOT EXISTS orders (
            id TEXT PRIMARY KEY,
            user_id TEXT NOT NULL REFERENCES accounts(user_id) ON DELETE CASCADE,
            ticker VARCHAR(16) NOT NULL,
            type VARCHAR(16) NOT NULL,
            side VARCHAR(8) NOT NULL,
            qty DOUBLE PRECISION NOT NULL,
            filled_qty DOUBLE PRECISION NOT NULL DEFAULT 0,
            limit_price DOUBLE PRECISION,
            stop_price DOUBLE PRECISION,
            trail_pct DOUBLE PRECISION,
            trail_high DOUBLE PRECISION,
            oco_id TEXT,
            stop_triggered BOOLEAN NOT NULL DEFAULT FALSE,
            status VARCHAR(16) NOT NULL DEFAULT 'open',
            created_at BIGINT NOT NULL,
            filled_at BIGINT,
            cancelled_at BIGINT
        );

        CREATE TABLE IF NOT EXISTS positions (
            user_id TEXT NOT NULL REFERENCES accounts(user_id) ON DELETE CASCADE,
            ticker VARCHAR(16) NOT NULL,
            qty DOUBLE PRECISION NOT NULL,
            avg_cost DOUBLE PRECISION NOT NULL CHECK (avg_cost >= 0),
            accrued_borrow DOUBLE PRECISION NOT NULL DEFAULT 0,
            opened_at BIGINT NOT NULL,
            last_borrow_accrual_at BIGINT NOT NULL,
            PRIMARY KEY (user_id, ticker)
        );

        CREATE TABLE IF NOT EXISTS trades (
            id TEXT PRIMARY KEY,
            order_id TEXT NOT NULL,
            user_id TEXT NOT NULL,
            ticker VARCHAR(16) NOT NULL,
            side VARCHAR(8) NOT NULL,
            qty DOUBLE PRECISION NOT NULL,
            price DOUBLE PRECISION NOT NULL,
            notional DOUBLE PRECISION NOT NULL,
            pnl DOUBLE PRECISION NOT NULL DEFAULT 0,
            mid_price DOUBLE PRECISION NOT NULL DEFAULT 0,
            slippage_bps DOUBLE PRECISION NOT NULL DEFAULT 0,
            slippage_cost DOUBLE PRECISION NOT NULL DEFAULT 0,
            commission DOUBLE PRECISION NOT NULL DEFAULT 0,
            borrow_cost DOUBLE PRECISION NOT NULL DEFAULT 0,
            execution_quality_score DOUBLE PRECISION NOT NULL DEFAULT 100,
            regime VARCHAR(32) NOT NULL DEFAULT 'normal',
            executed_at BIGINT NOT NULL
        );

        CREATE TABLE IF NOT EXISTS price_states (
            ticker VARCHAR(16) PRIMARY KEY,
            price DOUBLE PRECISION NOT NULL,
            bid DOUBLE PRECISION NOT NULL,
            ask DOUBLE PRECISION NOT NULL,
            open DOUBLE PRECISION NOT NULL,
            high DOUBLE PRECISION NOT NULL,
            low DOUBLE PRECISION NOT NULL,
            prev_close DOUBLE PRECISION NOT NULL,
            volume DOUBLE PRECISION NOT NULL,
            volatility DOUBLE PRECISION NOT NULL,
            anchor DOUBLE PRECISION NOT NULL,
            last_log_return DOUBLE PRECISION NOT NULL DEFAULT 0,
            updated_at BIGINT NOT NULL
        );

        CREATE TABLE IF NOT EXISTS candles (
            ticker VARCHAR(16) NOT NULL,
            interval VARCHAR(8) NOT NULL,
            open_time BIGINT NOT NULL,
            open DOUBLE PRECISION NOT NULL,
            high DOUBLE PRECISION NOT NULL,
            low DOUBLE PRECISION NOT NULL,
            close DOUBLE PRECISION NOT NULL,
            volume DOUBLE PRECISION NOT NULL DEFAULT 0,
            PRIMARY KEY (ticker, interval, open_time)
        );

        CREATE TABLE IF NOT EXISTS regimes (
            id TEXT PRIMARY KEY,
            regime VARCHAR(32) NOT NULL,
            liquidity_mult DOUBLE PRECISION NOT NULL,
            vol_mult DOUBLE PRECISION NOT NULL,
            news_mult DOUBLE PRECISION NOT NULL,
            borrow_mult DOUBLE PRECISION NOT NULL,
            reason TEXT NOT NULL DEFAULT '',
            started_at BIGINT NOT NULL,
            ended_at BIGINT
        );

        CREATE INDEX IF NOT EXISTS idx_orders_status ON orders(status);
        CREATE INDEX IF NOT EXISTS idx_orders_oco ON orders(oco_id) WHERE oco_id IS NOT NULL;
        CREATE INDEX IF NOT EXISTS idx_positions_short ON positions(qty) WHERE qty < 0;
        CREATE INDEX IF NOT EXISTS idx_trades_user ON trades(user_id, executed_at);
        CREATE INDEX IF NOT EXISTS idx_regimes_active ON regimes(started_at) WHERE ended_at IS NULL;
    )";

    std::lock_guard<std::mutex> lock(conn_mu_);
    try {
        exec_sql(schema);
        return true;
    } catch (const StorageError& e) {
        spdlog::error("Schema creation failed: {}", e.what());
        return false;
    }
}

// ─── Ledger transaction ────────────────────────────────────────────────────────

class PostgresLedgerTxn : public LedgerTxn {
public:
    PostgresLedgerTxn(PostgresStore& store, std::string user_id)
        : store_(store), user_id_(std::move(user_id)), lock_(store_.conn_mu_) {
        store_.exec_sql("BEGIN");
        open_ = true;
        try {
            store_.exec_sql(fmt::format("SET LOCAL lock_timeout = '{}ms'", store_.config_.lock_timeout_ms));
        } catch (const StorageError&) {
            rollback();
            throw;
        }
    }

    ~PostgresLedgerTxn() override {
        rollback();
    }

    std::optional<Order> lock_order(const std::string& order_id) override {
        auto res = store_.query(fmt::format(
            "SELECT {} FROM orders WHERE id = {} AND user_id = {} FOR UPDATE",
            kOrderColumns, store_.escape(order_id), store_.escape(user_id_)));
        if (PQntuples(res.get()) == 0) return std::nullopt;
        return row_to_order(res.get(), 0);
    }

    std::optional<double> lock_cash() override {
        auto res = store_.query(fmt::format(
            "SELECT cash FROM accounts WHERE user_id = {} FOR UPDATE", store_.escape(user_id_)));
        if (PQntuples(res.get()) == 0) return std::nullopt;
        return dbl(res.get(), 0, 0);
    }

    std::optional<Position> lock_position(const std::string& ticker) override {
        auto res = store_.query(fmt::format(
            "SELECT {} FROM positions WHERE user_id = {} AND ticker = {} FOR UPDATE",
            kPositionColumns, store_.escape(user_id_), store_.escape(ticker)));
        if (PQntuples(res.get()) == 0) return std::nullopt;
        return row_to_position(res.get(), 0);
    }

    std::vector<Position> lock_positions() override {
        auto res = store_.query(fmt::format(
            "SELECT {} FROM positions WHERE user_id = {} ORDER BY ticker FOR UPDATE",
            kPositionColumns, store_.escape(user_id_)));
        std::vector<Position> out;
        for (int i = 0; i < PQntuples(res.get()); ++i) out.push_back(row_to_position(res.get(), i));
        return out;
    }

    void set_cash(double cash) override {
        store_.exec_sql(fmt::format("UPDATE accounts SET cash = {} WHERE user_id = {}",
                                    num(cash), store_.escape(user_id_)));
    }

    void upsert_position(const Position& p) override {
        store_.exec_sql(fmt::format(
            "INSERT INTO positions ({}) VALUES ({}, {}, {}, {}, {}, {}, {}) "
            "ON CONFLICT (user_id, ticker) DO UPDATE SET qty = EXCLUDED.qty, "
            "avg_cost = EXCLUDED.avg_cost, accrued_borrow = EXCLUDED.accrued_borrow, "
            "opened_at = EXCLUDED.opened_at, last_borrow_accrual_at = EXCLUDED.last_borrow_accrual_at",
            kPositionColumns, store_.escape(user_id_), store_.escape(p.ticker), num(p.qty),
            num(p.avg_cost), num(p.accrued_borrow), p.opened_at_ms, p.last_borrow_accrual_ms));
    }

    void delete_position(const std::string& ticker) override {
        store_.exec_sql(fmt::format("DELETE FROM positions WHERE user_id = {} AND ticker = {}",
                                    store_.escape(user_id_), store_.escape(ticker)));
    }

    void append_trade(const Trade& t) override {
        store_.exec_sql(fmt::format(
            "INSERT INTO trades ({}) VALUES ({}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {})",
            kTradeColumns, store_.escape(t.id), store_.escape(t.order_id), store_.escape(t.user_id),
            store_.escape(t.ticker), store_.escape(to_string(t.side)), num(t.qty), num(t.price),
            num(t.notional), num(t.pnl), num(t.mid_price), num(t.slippage_bps), num(t.slippage_cost),
            num(t.commission), num(t.borrow_cost), num(t.execution_quality_score),
            store_.escape(t.regime), t.executed_at_ms));
    }

    void update_order(const Order& o) override {
        store_.exec_sql(fmt::format(
            "UPDATE orders SET filled_qty = {}, status = {}, trail_high = {}, stop_triggered = {}, "
            "filled_at = {}, cancelled_at = {} WHERE id = {}",
            num(o.filled_qty), store_.escape(to_string(o.status)), opt_num(o.trail_high),
            o.stop_triggered ? "TRUE" : "FALSE",
            o.filled_at_ms > 0 ? std::to_string(o.filled_at_ms) : std::string("NULL"),
            o.cancelled_at_ms > 0 ? std::to_string(o.cancelled_at_ms) : std::string("NULL"),
            store_.escape(o.id)));
    }

    int cancel_oco_siblings(const std::string& oco_id, const std::string& filled_order_id,
                            int64_t now_ms) override {
        return store_.exec_count(fmt::format(
            "UPDATE orders SET status = 'cancelled', cancelled_at = {} "
            "WHERE oco_id = {} AND id <> {} AND user_id = {} AND status IN ('open', 'partial')",
            now_ms, store_.escape(oco_id), store_.escape(filled_order_id), store_.escape(user_id_)));
    }

    void commit() override {
        store_.exec_sql("COMMIT");
        open_ = false;
    }

private:
    void rollback() {
        if (!open_) return;
        open_ = false;
        try {
            store_.exec_sql("ROLLBACK");
        } catch (const StorageError& e) {
            spdlog::warn("Rollback failed for {}: {}", user_id_, e.what());
        }
    }

    PostgresStore& store_;
    std::string user_id_;
    std::unique_lock<std::mutex> lock_;
    bool open_{false};
};

std::unique_ptr<LedgerTxn> PostgresStore::begin(const std::string& user_id) {
    return std::make_unique<PostgresLedgerTxn>(*this, user_id);
}

// ─── Accounts ──────────────────────────────────────────────────────────────────

void PostgresStore::create_account(const std::string& user_id, double cash) {
    std::lock_guard<std::mutex> lock(conn_mu_);
    exec_sql(fmt::format(
        "INSERT INTO accounts (user_id, cash) VALUES ({}, {}) "
        "ON CONFLICT (user_id) DO UPDATE SET cash = EXCLUDED.cash",
        escape(user_id), num(cash)));
}

std::optional<double> PostgresStore::get_cash(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(conn_mu_);
    auto res = query(fmt::format("SELECT cash FROM accounts WHERE user_id = {}", escape(user_id)));
    if (PQntuples(res.get()) == 0) return std::nullopt;
    return dbl(res.get(), 0, 0);
}

// ─── Orders ────────────────────────────────────────────────────────────────────

void PostgresStore::insert_order(const Order& o) {
    std::lock_guard<std::mutex> lock(conn_mu_);
    exec_sql(fmt::format(
        "INSERT INTO orders ({}) VALUES ({}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, NULL, NULL) "
        "ON CONFLICT (id) DO NOTHING",
        kOrderColumns, escape(o.id), escape(o.user_id), escape(o.ticker),
        escape(to_string(o.type)), escape(to_string(o.side)), num(o.qty), num(o.filled_qty),
        opt_num(o.limit_price), opt_num(o.stop_price), opt_num(o.trail_pct), opt_num(o.trail_high),
        o.oco_id ? escape(*o.oco_id) : std::string("NULL"), o.stop_triggered ? "TRUE" : "FALSE",
        escape(to_string(o.status)), o.created_at_ms));
}

std::optional<Order> PostgresStore::get_order(const std::string& order_id) {
    std::lock_guard<std::mutex> lock(conn_mu_);
    auto res = query(fmt::format("SELECT {} FROM orders WHERE id = {}", kOrderColumns, escape(order_id)));
    if (PQntuples(res.get()) == 0) return std::nullopt;
    return row_to_order(res.get(), 0);
}

bool PostgresStore::cancel_order(const std::string& order_id, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(conn_mu_);
    return exec_count(fmt::format(
        "UPDATE orders SET status = 'cancelled', cancelled_at = {} "
        "WHERE id = {} AND status IN ('open', 'partial')",
        now_ms, escape(order_id))) > 0;
}

std::vector<Order> PostgresStore::load_open_orders() {
    std::lock_guard<std::mutex> lock(conn_mu_);
    auto res = query(fmt::format(
        "SELECT {} FROM orders WHERE status IN ('open', 'partial') ORDER BY created_at, id",
        kOrderColumns));
    std::vector<Order> out;
    for (int i = 0; i < PQntuples(res.get()); ++i) out.push_back(row_to_order(res.get(), i));
    return out;
}

void PostgresStore::update_trail_high(const std::string& order_id, double trail_high) {
    std::lock_guard<std::mutex> lock(conn_mu_);
    exec_sql(fmt::format("UPDATE orders SET trail_high = {} WHERE id = {}",
                         num(trail_high), escape(order_id)));
}

void PostgresStore::mark_stop_triggered(const std::string& order_id) {
    std::lock_guard<std::mutex> lock(conn_mu_);
    exec_sql(fmt::format("UPDATE orders SET stop_triggered = TRUE WHERE id = {}", escape(order_id)));
}

// ─── Positions and trades ──────────────────────────────────────────────────────

std::vector<Position> PostgresStore::load_positions(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(conn_mu_);
    auto res = query(fmt::format("SELECT {} FROM positions WHERE user_id = {} ORDER BY ticker",
                                 kPositionColumns, escape(user_id)));
    std::vector<Position> out;
    for (int i = 0; i < PQntuples(res.get()); ++i) out.push_back(row_to_position(res.get(), i));
    return out;
}

std::vector<Position> PostgresStore::load_short_positions() {
    std::lock_guard<std::mutex> lock(conn_mu_);
    auto res = query(fmt::format("SELECT {} FROM positions WHERE qty < 0 ORDER BY user_id, ticker",
                                 kPositionColumns));
    std::vector<Position> out;
    for (int i = 0; i < PQntuples(res.get()); ++i) out.push_back(row_to_position(res.get(), i));
    return out;
}

std::vector<Trade> PostgresStore::load_trades(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(conn_mu_);
    auto res = query(fmt::format("SELECT {} FROM trades WHERE user_id = {} ORDER BY executed_at, id",
                                 kTradeColumns, escape(user_id)));
    std::vector<Trade> out;
    for (int i = 0; i < PQntuples(res.get()); ++i) out.push_back(row_to_trade(res.get(), i));
    return out;
}

// ─── Market data ───────────────────────────────────────────────────────────────

void PostgresStore::upsert_price_states(const std::vector<PriceState>& states) {
    if (states.empty()) return;
    std::string values;
    for (const auto& s : states) {
        if (!values.empty()) values += ", ";
        values += fmt::format("({}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {})",
                              escape(s.ticker), num(s.price), num(s.bid), num(s.ask), num(s.open),
                              num(s.high), num(s.low), num(s.prev_close), num(s.volume),
                              num(s.volatility), num(s.anchor), num(s.last_log_return),
                              s.updated_at_ms);
    }
    std::lock_guard<std::mutex> lock(conn_mu_);
    exec_sql(fmt::format(
        "INSERT INTO price_states ({}) VALUES {} ON CONFLICT (ticker) DO UPDATE SET "
        "price = EXCLUDED.price, bid = EXCLUDED.bid, ask = EXCLUDED.ask, open = EXCLUDED.open, "
        "high = EXCLUDED.high, low = EXCLUDED.low, prev_close = EXCLUDED.prev_close, "
        "volume = EXCLUDED.volume, volatility = EXCLUDED.volatility, anchor = EXCLUDED.anchor, "
        "last_log_return = EXCLUDED.last_log_return, updated_at = EXCLUDED.updated_at",
        kPriceColumns, values));
}

std::vector<PriceState> PostgresStore::load_price_states() {
    std::lock_guard<std::mutex> lock(conn_mu_);
    auto res = query(fmt::format("SELECT {} FROM price_states", kPriceColumns));
    std::vector<PriceState> out;
    for (int i = 0; i < PQntuples(res.get()); ++i) out.push_back(row_to_price(res.get(), i));
    return out;
}

void PostgresStore::upsert_candles(const std::vector<Candle>& candles) {
    if (candles.empty()) return;
    std::string values;
    for (const auto& c : candles) {
        if (!values.empty()) values += ", ";
        values += fmt::format("({}, {}, {}, {}, {}, {}, {}, {})",
                              escape(c.ticker), escape(c.interval), c.open_time_ms, num(c.open),
                              num(c.high), num(c.low), num(c.close), num(c.volume));
    }
    std::lock_guard<std::mutex> lock(conn_mu_);
    exec_sql(fmt::format(
        "INSERT INTO candles (ticker, interval, open_time, open, high, low, close, volume) "
        "VALUES {} ON CONFLICT (ticker, interval, open_time) DO UPDATE SET "
        "high = GREATEST(candles.high, EXCLUDED.high), low = LEAST(candles.low, EXCLUDED.low), "
        "close = EXCLUDED.close, volume = candles.volume + EXCLUDED.volume",
        values));
}

std::vector<Candle> PostgresStore::load_candles(const std::string& ticker,
                                                const std::string& interval, size_t limit) {
    std::lock_guard<std::mutex> lock(conn_mu_);
    auto res = query(fmt::format(
        "SELECT ticker, interval, open_time, open, high, low, close, volume FROM ("
        "SELECT * FROM candles WHERE ticker = {} AND interval = {} "
        "ORDER BY open_time DESC LIMIT {}) recent ORDER BY open_time",
        escape(ticker), escape(interval), limit));
    std::vector<Candle> out;
    for (int i = 0; i < PQntuples(res.get()); ++i) {
        Candle c;
        c.ticker = text(res.get(), i, 0);
        c.interval = text(res.get(), i, 1);
        c.open_time_ms = i64(res.get(), i, 2);
        c.open = dbl(res.get(), i, 3);
        c.high = dbl(res.get(), i, 4);
        c.low = dbl(res.get(), i, 5);
        c.close = dbl(res.get(), i, 6);
        c.volume = dbl(res.get(), i, 7);
        out.push_back(c);
    }
    return out;
}

// ─── Regimes ───────────────────────────────────────────────────────────────────

void PostgresStore::save_regime(const RegimeRecord& r) {
    std::lock_guard<std::mutex> lock(conn_mu_);
    exec_sql(fmt::format(
        "INSERT INTO regimes ({}) VALUES ({}, {}, {}, {}, {}, {}, {}, {}, {}) "
        "ON CONFLICT (id) DO UPDATE SET ended_at = EXCLUDED.ended_at",
        kRegimeColumns, escape(r.id), escape(to_string(r.kind)), num(r.mult.liquidity),
        num(r.mult.volatility), num(r.mult.news), num(r.mult.borrow), escape(r.reason),
        r.started_at_ms, r.ended_at_ms ? std::to_string(*r.ended_at_ms) : std::string("NULL")));
}

std::optional<RegimeRecord> PostgresStore::load_active_regime() {
    std::lock_guard<std::mutex> lock(conn_mu_);
    auto res = query(fmt::format(
        "SELECT {} FROM regimes WHERE ended_at IS NULL ORDER BY started_at DESC LIMIT 1",
        kRegimeColumns));
    if (PQntuples(res.get()) == 0) return std::nullopt;
    return row_to_regime(res.get(), 0);
}

} // namespace exchange_sim
