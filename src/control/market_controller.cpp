#include "market_controller.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "market_format.hpp"
#include "../core/candle_aggregator.hpp"
#include "../core/utils.hpp"

using json = nlohmann::json;

namespace exchange_sim {

namespace {

constexpr size_t kDefaultCandleLimit = 200;
constexpr size_t kMaxCandleLimit = 5000;
constexpr int64_t kDefaultMetricsWindowMs = 5 * 60 * 1000;

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

} // namespace

MarketController::MarketController(std::shared_ptr<Exchange> exchange)
    : exchange_(std::move(exchange)) {}

drogon::HttpResponsePtr MarketController::json_resp(json body, int code) {
    auto resp = drogon::HttpResponse::newHttpResponse();
    resp->setStatusCode(static_cast<drogon::HttpStatusCode>(code));
    resp->setContentTypeCode(drogon::CT_APPLICATION_JSON);
    resp->setBody(body.dump());
    return resp;
}

drogon::HttpResponsePtr MarketController::error_resp(const std::string& message, int code) {
    return json_resp(json{{"error", message}}, code);
}

void MarketController::instruments(const drogon::HttpRequestPtr&,
                                   std::function<void(const drogon::HttpResponsePtr&)>&& cb) {
    json out = json::array();
    for (const auto& def : exchange_->market().catalog().all()) {
        out.push_back(market_format::format_instrument(def));
    }
    cb(json_resp(out));
}

void MarketController::prices(const drogon::HttpRequestPtr&,
                              std::function<void(const drogon::HttpResponsePtr&)>&& cb) {
    json out = json::array();
    for (const auto& s : exchange_->market().prices()) {
        out.push_back(market_format::format_price(s));
    }
    cb(json_resp(out));
}

void MarketController::price(const drogon::HttpRequestPtr&,
                             std::function<void(const drogon::HttpResponsePtr&)>&& cb,
                             std::string ticker) {
    auto state = exchange_->market().price(upper(ticker));
    if (!state) {
        cb(error_resp("unknown ticker", 404));
        return;
    }
    cb(json_resp(market_format::format_price(*state)));
}

void MarketController::candles(const drogon::HttpRequestPtr& req,
                               std::function<void(const drogon::HttpResponsePtr&)>&& cb,
                               std::string ticker) {
    ticker = upper(ticker);
    if (!exchange_->market().instrument(ticker)) {
        cb(error_resp("unknown ticker", 404));
        return;
    }
    std::string interval = req->getParameter("interval");
    if (interval.empty()) interval = "1m";
    if (!candle_interval_ms(interval)) {
        cb(error_resp("interval must be one of 1m, 5m, 15m, 1h, 4h, 1D", 400));
        return;
    }
    size_t limit = kDefaultCandleLimit;
    auto limit_str = req->getParameter("limit");
    if (!limit_str.empty()) {
        try {
            long long n = std::stoll(limit_str);
            if (n <= 0) throw std::invalid_argument("non-positive");
            limit = std::min(static_cast<size_t>(n), kMaxCandleLimit);
        } catch (const std::exception&) {
            cb(error_resp("limit must be a positive integer", 400));
            return;
        }
    }

    json bars = json::array();
    for (const auto& c : exchange_->market().candles(ticker, interval, limit)) {
        bars.push_back(market_format::format_candle(c));
    }
    cb(json_resp({{"ticker", ticker}, {"interval", interval}, {"bars", bars}}));
}

void MarketController::orderBook(const drogon::HttpRequestPtr&,
                                 std::function<void(const drogon::HttpResponsePtr&)>&& cb,
                                 std::string ticker) {
    auto book = exchange_->order_book(upper(ticker));
    if (!book) {
        cb(error_resp("unknown ticker", 404));
        return;
    }
    cb(json_resp(market_format::format_book(*book)));
}

void MarketController::regime(const drogon::HttpRequestPtr&,
                              std::function<void(const drogon::HttpResponsePtr&)>&& cb) {
    cb(json_resp(market_format::format_regime(exchange_->market().regime())));
}

void MarketController::executionMetrics(const drogon::HttpRequestPtr& req,
                                        std::function<void(const drogon::HttpResponsePtr&)>&& cb) {
    int64_t window_ms = kDefaultMetricsWindowMs;
    auto param = req->getParameter("window_ms");
    if (!param.empty()) {
        try {
            window_ms = std::stoll(param);
        } catch (const std::exception&) {
            cb(error_resp("window_ms must be an integer", 400));
            return;
        }
    }
    auto summary = exchange_->execution_model().recent_metrics(window_ms, utils::now_ms());
    json body = market_format::format_metrics(summary, window_ms);
    body["realism_enabled"] = exchange_->execution_model().realism_enabled();
    cb(json_resp(body));
}

void MarketController::estimate(const drogon::HttpRequestPtr& req,
                                std::function<void(const drogon::HttpResponsePtr&)>&& cb) {
    std::string ticker = upper(req->getParameter("ticker"));
    auto side = parse_order_side(req->getParameter("side"));
    if (ticker.empty() || !side) {
        cb(error_resp("ticker and side (buy|sell) are required", 400));
        return;
    }
    double qty = 0.0;
    try {
        qty = std::stod(req->getParameter("qty"));
    } catch (const std::exception&) {
        cb(error_resp("qty must be a number", 400));
        return;
    }
    if (!(qty > 0.0)) {
        cb(error_resp("qty must be positive", 400));
        return;
    }

    auto est = exchange_->estimate_order(req->getParameter("user_id"), ticker, *side, qty);
    if (!est) {
        cb(error_resp("unknown ticker", 404));
        return;
    }
    cb(json_resp({
        {"ticker", ticker},
        {"side", to_string(*side)},
        {"qty", qty},
        {"est_fill_price", est->est_fill_price},
        {"est_slippage_bps", est->est_slippage_bps},
        {"est_slippage_cost", est->est_slippage_cost},
        {"est_commission", est->est_commission},
        {"est_borrow_day", est->est_borrow_day},
        {"est_total_cost", est->est_total_cost},
        {"est_execution_quality_score", est->est_execution_quality_score},
        {"regime", est->regime}
    }));
}

void MarketController::status(const drogon::HttpRequestPtr&,
                              std::function<void(const drogon::HttpResponsePtr&)>&& cb) {
    MatchStats match = exchange_->last_match_stats();
    cb(json_resp({
        {"running", exchange_->running()},
        {"paused", exchange_->paused()},
        {"ticks_run", exchange_->ticks_run()},
        {"ticks_skipped", exchange_->skipped_ticks()},
        {"pending_candles", exchange_->market().pending_candles()},
        {"regime", to_string(exchange_->market().regime().kind)},
        {"last_match", {
            {"scanned", match.scanned},
            {"fills", match.fills},
            {"cancelled", match.cancelled},
            {"skipped", match.skipped},
            {"errors", match.errors}
        }}
    }));
}

} // namespace exchange_sim
