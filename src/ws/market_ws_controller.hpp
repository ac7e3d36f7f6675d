#pragma once

#include <drogon/WebSocketController.h>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../core/exchange.hpp"
#include "tick_subscription.hpp"

namespace exchange_sim {

/**
 * WebSocket stream of ticks, fills and regime changes.
 *
 * Clients connect to /v1/stream. Without a subscription a client receives
 * ticks for every instrument; {"action":"subscribe","tickers":[...]}
 * narrows the tick stream to the subscribed tickers and "unsubscribe"
 * removes them. Fill and regime messages go to every client.
 */
class MarketWsController : public drogon::WebSocketController<MarketWsController> {
public:
    static const bool isAutoCreation = false;

    // Registers the bus listeners. Call once before the app runs.
    static void init(std::shared_ptr<Exchange> exchange);

    static void broadcast_ticks(const std::vector<TickEvent>& ticks);
    static void broadcast_fill(const FillEvent& fill);
    static void broadcast_regime(const RegimeRecord& regime);

    static size_t connection_count();

    void handleNewConnection(const drogon::HttpRequestPtr& req,
                             const drogon::WebSocketConnectionPtr& conn) override;
    void handleConnectionClosed(const drogon::WebSocketConnectionPtr& conn) override;
    void handleNewMessage(const drogon::WebSocketConnectionPtr& conn,
                          std::string&& message,
                          const drogon::WebSocketMessageType& type) override;

    WS_PATH_LIST_BEGIN
    WS_PATH_ADD("/v1/stream");
    WS_PATH_LIST_END

private:
    static void send_all(const std::string& payload);
    static void drop_stale(const std::vector<drogon::WebSocketConnectionPtr>& stale);

    static std::shared_ptr<Exchange> exchange_;
    static std::mutex conn_mutex_;
    static std::map<drogon::WebSocketConnectionPtr, TickSubscription> connections_;
};

} // namespace exchange_sim
