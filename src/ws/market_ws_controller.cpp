#include "market_ws_controller.hpp"
#include <spdlog/spdlog.h>
#include "../control/market_format.hpp"
#include "../core/utils.hpp"

namespace exchange_sim {

std::shared_ptr<Exchange> MarketWsController::exchange_;
std::mutex MarketWsController::conn_mutex_;
std::map<drogon::WebSocketConnectionPtr, TickSubscription> MarketWsController::connections_;

void MarketWsController::init(std::shared_ptr<Exchange> exchange) {
    exchange_ = std::move(exchange);
    auto& bus = exchange_->bus();
    bus.add_tick_listener([](const std::vector<TickEvent>& ticks) { broadcast_ticks(ticks); });
    bus.add_fill_listener([](const FillEvent& fill) { broadcast_fill(fill); });
    bus.add_regime_listener([](const RegimeRecord& regime) { broadcast_regime(regime); });
    spdlog::info("MarketWsController initialized");
}

size_t MarketWsController::connection_count() {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    return connections_.size();
}

void MarketWsController::handleNewConnection(const drogon::HttpRequestPtr& req,
                                             const drogon::WebSocketConnectionPtr& conn) {
    spdlog::info("Stream client connected from {}", req->getPeerAddr().toIp());
    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        connections_[conn] = TickSubscription{};
    }
    nlohmann::json welcome;
    welcome["type"] = "connected";
    if (exchange_) welcome["regime"] = market_format::format_regime(exchange_->market().regime());
    conn->send(welcome.dump());
}

void MarketWsController::handleConnectionClosed(const drogon::WebSocketConnectionPtr& conn) {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    connections_.erase(conn);
    spdlog::debug("Stream client disconnected, {} remaining", connections_.size());
}

void MarketWsController::handleNewMessage(const drogon::WebSocketConnectionPtr& conn,
                                          std::string&& message,
                                          const drogon::WebSocketMessageType& type) {
    if (type == drogon::WebSocketMessageType::Ping) {
        conn->send(message, drogon::WebSocketMessageType::Pong);
        return;
    }
    if (message.empty()) return;

    nlohmann::json reply;
    try {
        auto msg = nlohmann::json::parse(message);
        std::string action = msg.value("action", "");
        if (action == "ping") {
            reply["type"] = "pong";
            reply["timestamp"] = utils::now_ms();
        } else if (action == "subscribe" || action == "unsubscribe") {
            auto tickers = msg.value("tickers", std::vector<std::string>{});
            std::lock_guard<std::mutex> lock(conn_mutex_);
            auto& subs = connections_[conn];
            if (action == "subscribe") subs.subscribe(tickers);
            else subs.unsubscribe(tickers);
            reply["type"] = "subscriptions";
            reply["tickers"] = subs.tickers();
        } else {
            reply["type"] = "error";
            reply["message"] = "unknown action";
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Stream: failed to parse message: {}", e.what());
        reply["type"] = "error";
        reply["message"] = "invalid message";
    }
    conn->send(reply.dump());
}

void MarketWsController::broadcast_ticks(const std::vector<TickEvent>& ticks) {
    std::vector<std::pair<drogon::WebSocketConnectionPtr, TickSubscription>> conns;
    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        if (connections_.empty()) return;
        conns.assign(connections_.begin(), connections_.end());
    }

    nlohmann::json all = nlohmann::json::array();
    for (const auto& t : ticks) all.push_back(market_format::format_tick(t));
    const std::string all_payload = nlohmann::json{{"type", "tick"}, {"data", all}}.dump();

    std::vector<drogon::WebSocketConnectionPtr> stale;
    for (const auto& entry : conns) {
        const auto& conn = entry.first;
        if (!conn || !conn->connected()) {
            stale.push_back(conn);
            continue;
        }
        if (entry.second.all()) {
            conn->send(all_payload);
            continue;
        }
        nlohmann::json data = nlohmann::json::array();
        for (size_t i = 0; i < ticks.size(); ++i) {
            if (entry.second.wants(ticks[i].ticker)) data.push_back(all[i]);
        }
        if (!data.empty()) conn->send(nlohmann::json{{"type", "tick"}, {"data", data}}.dump());
    }
    drop_stale(stale);
}

void MarketWsController::broadcast_fill(const FillEvent& fill) {
    nlohmann::json msg;
    msg["type"] = fill.kind == FillKind::MARGIN_CALL ? "margin_call" : "fill";
    msg["data"] = market_format::format_fill(fill);
    send_all(msg.dump());
}

void MarketWsController::broadcast_regime(const RegimeRecord& regime) {
    nlohmann::json msg;
    msg["type"] = "regime";
    msg["data"] = market_format::format_regime(regime);
    send_all(msg.dump());
}

void MarketWsController::send_all(const std::string& payload) {
    std::vector<drogon::WebSocketConnectionPtr> conns;
    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        for (const auto& kv : connections_) conns.push_back(kv.first);
    }
    std::vector<drogon::WebSocketConnectionPtr> stale;
    for (const auto& conn : conns) {
        if (!conn || !conn->connected()) {
            stale.push_back(conn);
            continue;
        }
        conn->send(payload);
    }
    drop_stale(stale);
}

void MarketWsController::drop_stale(const std::vector<drogon::WebSocketConnectionPtr>& stale) {
    if (stale.empty()) return;
    std::lock_guard<std::mutex> lock(conn_mutex_);
    for (const auto& conn : stale) connections_.erase(conn);
}

} // namespace exchange_sim
