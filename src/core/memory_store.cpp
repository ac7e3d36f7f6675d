#include "memory_store.hpp"
#include <algorithm>
#include <cstddef>
#include <limits>
#include "errors.hpp"

namespace exchange_sim {

class MemoryLedgerTxn : public LedgerTxn {
public:
    MemoryLedgerTxn(MemoryStore& store, std::string user_id)
        : store_(store), user_id_(std::move(user_id)), lock_(store_.user_mutex(user_id_)) {}

    std::optional<Order> lock_order(const std::string& order_id) override {
        store_.check_available();
        auto staged = orders_.find(order_id);
        if (staged != orders_.end()) return staged->second;
        std::lock_guard<std::mutex> lock(store_.data_mu_);
        auto it = store_.orders_.find(order_id);
        if (it == store_.orders_.end() || it->second.user_id != user_id_) return std::nullopt;
        return it->second;
    }

    std::optional<double> lock_cash() override {
        store_.check_available();
        if (cash_) return cash_;
        std::lock_guard<std::mutex> lock(store_.data_mu_);
        auto it = store_.cash_.find(user_id_);
        if (it == store_.cash_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<Position> lock_position(const std::string& ticker) override {
        store_.check_available();
        auto staged = positions_.find(ticker);
        if (staged != positions_.end()) return staged->second;
        std::lock_guard<std::mutex> lock(store_.data_mu_);
        auto user = store_.positions_.find(user_id_);
        if (user == store_.positions_.end()) return std::nullopt;
        auto it = user->second.find(ticker);
        if (it == user->second.end()) return std::nullopt;
        return it->second;
    }

    std::vector<Position> lock_positions() override {
        store_.check_available();
        std::map<std::string, Position> merged;
        {
            std::lock_guard<std::mutex> lock(store_.data_mu_);
            auto user = store_.positions_.find(user_id_);
            if (user != store_.positions_.end()) merged = user->second;
        }
        for (const auto& kv : positions_) {
            if (kv.second) merged[kv.first] = *kv.second;
            else merged.erase(kv.first);
        }
        std::vector<Position> out;
        for (auto& kv : merged) out.push_back(kv.second);
        return out;
    }

    void set_cash(double cash) override { cash_ = cash; }

    void upsert_position(const Position& pos) override { positions_[pos.ticker] = pos; }

    void delete_position(const std::string& ticker) override { positions_[ticker] = std::nullopt; }

    void append_trade(const Trade& trade) override { trades_.push_back(trade); }

    void update_order(const Order& order) override { orders_[order.id] = order; }

    int cancel_oco_siblings(const std::string& oco_id, const std::string& filled_order_id,
                            int64_t now_ms) override {
        store_.check_available();
        std::vector<Order> siblings;
        {
            std::lock_guard<std::mutex> lock(store_.data_mu_);
            for (const auto& id : store_.order_seq_) {
                if (id == filled_order_id) continue;
                auto staged = orders_.find(id);
                const Order& o = staged != orders_.end() ? staged->second : store_.orders_.at(id);
                if (o.user_id == user_id_ && o.oco_id && *o.oco_id == oco_id && o.is_live()) {
                    siblings.push_back(o);
                }
            }
        }
        for (auto& o : siblings) {
            o.status = OrderStatus::CANCELLED;
            o.cancelled_at_ms = now_ms;
            orders_[o.id] = o;
        }
        return static_cast<int>(siblings.size());
    }

    void commit() override {
        store_.check_available();
        std::lock_guard<std::mutex> lock(store_.data_mu_);
        if (cash_) store_.cash_[user_id_] = *cash_;
        for (const auto& kv : positions_) {
            auto& book = store_.positions_[user_id_];
            if (kv.second) book[kv.first] = *kv.second;
            else book.erase(kv.first);
        }
        for (const auto& kv : orders_) store_.orders_[kv.first] = kv.second;
        store_.trades_.insert(store_.trades_.end(), trades_.begin(), trades_.end());
        discard();
    }

private:
    void discard() {
        cash_.reset();
        positions_.clear();
        orders_.clear();
        trades_.clear();
    }

    MemoryStore& store_;
    std::string user_id_;
    std::unique_lock<std::mutex> lock_;
    std::optional<double> cash_;
    std::map<std::string, std::optional<Position>> positions_;
    std::map<std::string, Order> orders_;
    std::vector<Trade> trades_;
};

void MemoryStore::check_available() const {
    if (!available_) throw StorageUnavailable("memory store marked unavailable");
}

std::mutex& MemoryStore::user_mutex(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(locks_mu_);
    auto& slot = user_locks_[user_id];
    if (!slot) slot = std::make_unique<std::mutex>();
    return *slot;
}

std::unique_ptr<LedgerTxn> MemoryStore::begin(const std::string& user_id) {
    check_available();
    return std::make_unique<MemoryLedgerTxn>(*this, user_id);
}

void MemoryStore::create_account(const std::string& user_id, double cash) {
    check_available();
    std::lock_guard<std::mutex> lock(data_mu_);
    cash_[user_id] = cash;
}

std::optional<double> MemoryStore::get_cash(const std::string& user_id) {
    check_available();
    std::lock_guard<std::mutex> lock(data_mu_);
    auto it = cash_.find(user_id);
    if (it == cash_.end()) return std::nullopt;
    return it->second;
}

void MemoryStore::insert_order(const Order& order) {
    check_available();
    std::lock_guard<std::mutex> lock(data_mu_);
    if (orders_.emplace(order.id, order).second) order_seq_.push_back(order.id);
}

std::optional<Order> MemoryStore::get_order(const std::string& order_id) {
    check_available();
    std::lock_guard<std::mutex> lock(data_mu_);
    auto it = orders_.find(order_id);
    if (it == orders_.end()) return std::nullopt;
    return it->second;
}

bool MemoryStore::cancel_order(const std::string& order_id, int64_t now_ms) {
    check_available();
    std::string user_id;
    {
        std::lock_guard<std::mutex> lock(data_mu_);
        auto it = orders_.find(order_id);
        if (it == orders_.end()) return false;
        user_id = it->second.user_id;
    }
    std::lock_guard<std::mutex> row(user_mutex(user_id));
    std::lock_guard<std::mutex> lock(data_mu_);
    auto& order = orders_.at(order_id);
    if (!order.is_live()) return false;
    order.status = OrderStatus::CANCELLED;
    order.cancelled_at_ms = now_ms;
    return true;
}

std::vector<Order> MemoryStore::load_open_orders() {
    check_available();
    std::lock_guard<std::mutex> lock(data_mu_);
    std::vector<Order> out;
    for (const auto& id : order_seq_) {
        const auto& o = orders_.at(id);
        if (o.is_live()) out.push_back(o);
    }
    return out;
}

void MemoryStore::update_trail_high(const std::string& order_id, double trail_high) {
    check_available();
    std::lock_guard<std::mutex> lock(data_mu_);
    auto it = orders_.find(order_id);
    if (it != orders_.end()) it->second.trail_high = trail_high;
}

void MemoryStore::mark_stop_triggered(const std::string& order_id) {
    check_available();
    std::lock_guard<std::mutex> lock(data_mu_);
    auto it = orders_.find(order_id);
    if (it != orders_.end()) it->second.stop_triggered = true;
}

std::vector<Position> MemoryStore::load_positions(const std::string& user_id) {
    check_available();
    std::lock_guard<std::mutex> lock(data_mu_);
    std::vector<Position> out;
    auto it = positions_.find(user_id);
    if (it == positions_.end()) return out;
    for (const auto& kv : it->second) out.push_back(kv.second);
    return out;
}

std::vector<Position> MemoryStore::load_short_positions() {
    check_available();
    std::lock_guard<std::mutex> lock(data_mu_);
    std::vector<Position> out;
    for (const auto& user : positions_) {
        for (const auto& kv : user.second) {
            if (kv.second.qty < 0.0) out.push_back(kv.second);
        }
    }
    return out;
}

std::vector<Trade> MemoryStore::load_trades(const std::string& user_id) {
    check_available();
    std::lock_guard<std::mutex> lock(data_mu_);
    std::vector<Trade> out;
    for (const auto& t : trades_) {
        if (t.user_id == user_id) out.push_back(t);
    }
    return out;
}

void MemoryStore::put_position(const Position& pos) {
    std::lock_guard<std::mutex> lock(data_mu_);
    positions_[pos.user_id][pos.ticker] = pos;
}

void MemoryStore::upsert_price_states(const std::vector<PriceState>& states) {
    check_available();
    std::lock_guard<std::mutex> lock(data_mu_);
    for (const auto& s : states) prices_[s.ticker] = s;
}

std::vector<PriceState> MemoryStore::load_price_states() {
    check_available();
    std::lock_guard<std::mutex> lock(data_mu_);
    std::vector<PriceState> out;
    for (const auto& kv : prices_) out.push_back(kv.second);
    return out;
}

void MemoryStore::upsert_candles(const std::vector<Candle>& candles) {
    check_available();
    std::lock_guard<std::mutex> lock(data_mu_);
    for (const auto& c : candles) {
        CandleKey key{c.ticker, c.interval, c.open_time_ms};
        auto it = candles_.find(key);
        if (it == candles_.end()) {
            candles_.emplace(key, c);
            continue;
        }
        auto& bar = it->second;
        bar.high = std::max(bar.high, c.high);
        bar.low = std::min(bar.low, c.low);
        bar.close = c.close;
        bar.volume += c.volume;
    }
}

std::vector<Candle> MemoryStore::load_candles(const std::string& ticker,
                                              const std::string& interval, size_t limit) {
    check_available();
    std::lock_guard<std::mutex> lock(data_mu_);
    std::vector<Candle> out;
    auto lo = candles_.lower_bound(CandleKey{ticker, interval, std::numeric_limits<int64_t>::min()});
    for (auto it = lo; it != candles_.end(); ++it) {
        if (std::get<0>(it->first) != ticker || std::get<1>(it->first) != interval) break;
        out.push_back(it->second);
    }
    if (out.size() > limit) out.erase(out.begin(), out.end() - static_cast<std::ptrdiff_t>(limit));
    return out;
}

void MemoryStore::save_regime(const RegimeRecord& regime) {
    check_available();
    std::lock_guard<std::mutex> lock(data_mu_);
    if (regimes_.find(regime.id) == regimes_.end()) regime_seq_.push_back(regime.id);
    regimes_[regime.id] = regime;
}

std::optional<RegimeRecord> MemoryStore::load_active_regime() {
    check_available();
    std::lock_guard<std::mutex> lock(data_mu_);
    for (auto it = regime_seq_.rbegin(); it != regime_seq_.rend(); ++it) {
        const auto& r = regimes_.at(*it);
        if (!r.ended_at_ms) return r;
    }
    return std::nullopt;
}

std::vector<RegimeRecord> MemoryStore::regimes() const {
    std::lock_guard<std::mutex> lock(data_mu_);
    std::vector<RegimeRecord> out;
    for (const auto& id : regime_seq_) out.push_back(regimes_.at(id));
    return out;
}

} // namespace exchange_sim
