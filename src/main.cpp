#include <memory>
#include <random>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <drogon/drogon.h>
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/exchange.hpp"
#include "core/instruments.hpp"
#include "core/memory_store.hpp"
#include "core/postgres_store.hpp"
#include "control/market_controller.hpp"
#include "ws/market_ws_controller.hpp"

namespace {

void setup_logging(const exchange_sim::LoggingConfig& cfg) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!cfg.file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.file));
    }
    auto logger = std::make_shared<spdlog::logger>("exchange_sim", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(cfg.level));
    spdlog::flush_on(spdlog::level::warn);
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config/settings.json";
    if (argc > 1) {
        config_path = argv[1];
    }

    exchange_sim::Config cfg;
    try {
        exchange_sim::load_config(cfg, config_path);
        setup_logging(cfg.logging);
    } catch (const std::exception& e) {
        spdlog::critical("Invalid configuration {}: {}", config_path, e.what());
        return 1;
    }

    spdlog::info("Exchange simulator starting. HTTP port={} bind={}",
                 cfg.services.http_port, cfg.services.bind_address);

    std::shared_ptr<exchange_sim::Store> store;
    try {
        store = exchange_sim::PostgresStoreFactory::create(cfg.postgres);
    } catch (const exchange_sim::StorageError& e) {
        spdlog::warn("PostgreSQL unavailable: {}", e.what());
    }
    if (store) {
        spdlog::info("Using PostgreSQL store {}@{}:{}/{}", cfg.postgres.user, cfg.postgres.host,
                     cfg.postgres.port, cfg.postgres.database);
    } else {
        store = std::make_shared<exchange_sim::MemoryStore>();
        spdlog::info("Using in-memory store");
    }

    uint64_t seed = cfg.engine.seed != 0 ? cfg.engine.seed : std::random_device{}();

    std::shared_ptr<exchange_sim::Exchange> exchange;
    try {
        exchange = std::make_shared<exchange_sim::Exchange>(
            cfg, store, exchange_sim::InstrumentCatalog::defaults(), seed);
    } catch (const std::invalid_argument& e) {
        spdlog::critical("Invalid instrument catalogue: {}", e.what());
        return 1;
    }

    exchange_sim::MarketWsController::init(exchange);
    exchange->start();

    auto market_ctrl = std::make_shared<exchange_sim::MarketController>(exchange);
    drogon::app().addListener(cfg.services.bind_address, cfg.services.http_port);
    drogon::app().registerController(market_ctrl);
    drogon::app().registerController(std::make_shared<exchange_sim::MarketWsController>());
    spdlog::info("Starting Drogon listener on {}:{}", cfg.services.bind_address, cfg.services.http_port);
    drogon::app().run();

    exchange->stop();
    spdlog::info("Exchange simulator stopped");
    return 0;
}
