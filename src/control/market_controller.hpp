#pragma once

#include <functional>
#include <memory>
#include <string>
#include <drogon/HttpController.h>
#include <nlohmann/json.hpp>
#include "../core/exchange.hpp"

namespace exchange_sim {

/**
 * Read-only HTTP query surface: instruments, prices, candles, book depth, regime,
 * execution metrics and pre-trade estimates.
 */
class MarketController : public drogon::HttpController<MarketController> {
public:
    static const bool isAutoCreation = false;
    METHOD_LIST_BEGIN
    ADD_METHOD_TO(MarketController::instruments, "/v1/instruments", drogon::Get);
    ADD_METHOD_TO(MarketController::prices, "/v1/prices", drogon::Get);
    ADD_METHOD_TO(MarketController::price, "/v1/prices/{1}", drogon::Get);
    ADD_METHOD_TO(MarketController::candles, "/v1/candles/{1}", drogon::Get);
    ADD_METHOD_TO(MarketController::orderBook, "/v1/orderbook/{1}", drogon::Get);
    ADD_METHOD_TO(MarketController::regime, "/v1/regime", drogon::Get);
    ADD_METHOD_TO(MarketController::executionMetrics, "/v1/execution/metrics", drogon::Get);
    ADD_METHOD_TO(MarketController::estimate, "/v1/estimate", drogon::Get);
    ADD_METHOD_TO(MarketController::status, "/v1/status", drogon::Get);
    METHOD_LIST_END

    explicit MarketController(std::shared_ptr<Exchange> exchange);

    void instruments(const drogon::HttpRequestPtr& req,
                     std::function<void(const drogon::HttpResponsePtr&)>&& cb);
    void prices(const drogon::HttpRequestPtr& req,
                std::function<void(const drogon::HttpResponsePtr&)>&& cb);
    void price(const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& cb, std::string ticker);
    void candles(const drogon::HttpRequestPtr& req,
                 std::function<void(const drogon::HttpResponsePtr&)>&& cb, std::string ticker);
    void orderBook(const drogon::HttpRequestPtr& req,
                   std::function<void(const drogon::HttpResponsePtr&)>&& cb, std::string ticker);
    void regime(const drogon::HttpRequestPtr& req,
                std::function<void(const drogon::HttpResponsePtr&)>&& cb);
    void executionMetrics(const drogon::HttpRequestPtr& req,
                          std::function<void(const drogon::HttpResponsePtr&)>&& cb);
    void estimate(const drogon::HttpRequestPtr& req,
                  std::function<void(const drogon::HttpResponsePtr&)>&& cb);
    void status(const drogon::HttpRequestPtr& req,
                std::function<void(const drogon::HttpResponsePtr&)>&& cb);

private:
    drogon::HttpResponsePtr json_resp(nlohmann::json body, int code = 200);
    drogon::HttpResponsePtr error_resp(const std::string& message, int code);

    std::shared_ptr<Exchange> exchange_;
};

} // namespace exchange_sim
