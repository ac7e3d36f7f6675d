#pragma once

#include <cstdint>
#include <fstream>
#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "errors.hpp"

namespace exchange_sim {

using json = nlohmann::json;

struct PostgresConfig {
    bool enabled{false};
    std::string host{"localhost"};
    uint16_t port{5432};
    std::string database{"exchange_sim"};
    std::string user{"postgres"};
    std::string password{};
    int lock_timeout_ms{2000};
};

struct ServiceConfig {
    uint16_t http_port{8500};
    std::string bind_address{"127.0.0.1"};
};

struct EngineConfig {
    int64_t tick_interval_ms{1000};
    int persist_every_ticks{5};
    uint64_t seed{0};                 // 0 = seed from random_device
    bool restore_state{true};
};

struct PriceModelConfig {
    // GARCH(1,1)
    double garch_alpha{0.06};
    double garch_beta{0.90};
    double min_vol_factor{0.3};
    double max_vol_factor{5.0};
    double vol_of_vol{1.0};

    double shock_multiplier{0.35};
    double jump_scale_mult{1.0};
    double dynamic_anchor_weight{0.6};

    // Order-flow feedback
    double order_flow_decay{0.25};
    double order_flow_noise_floor{0.001};
    double max_order_flow_pct{0.02};

    // Volume simulation
    double volume_base{50.0};
    double volume_jitter{500.0};
    double volume_move_mult{0.5};
    double volume_vol_mult{10.0};
};

struct RegimeWeights {
    double normal{62.0};
    double tight_liquidity{18.0};
    double high_volatility{16.0};
    double event_shock{4.0};

    double total() const { return normal + tight_liquidity + high_volatility + event_shock; }
};

struct RegimeConfig {
    int64_t review_interval_ms{180000};
    double jitter_pct{0.2};
    RegimeWeights weights;
    double shock_threshold_pct{0.015};
    int64_t event_shock_hold_ms{45000};
};

struct ExecutionConfig {
    bool realism_enabled{true};
    double margin_requirement{1.1};          // equity must cover 110% of short exposure
    int64_t borrow_accrual_interval_ms{30000};
    int max_reprice_iterations{64};
};

struct LoggingConfig {
    std::string level{"info"};
    std::string file{};
};

struct Config {
    PostgresConfig postgres;
    ServiceConfig services;
    EngineConfig engine;
    PriceModelConfig price_model;
    RegimeConfig regime;
    ExecutionConfig execution;
    LoggingConfig logging;
};

inline void validate_config(const Config& cfg) {
    if (cfg.engine.tick_interval_ms <= 0) {
        throw ConfigError("engine.tick_interval_ms must be positive");
    }
    if (cfg.engine.persist_every_ticks <= 0) {
        throw ConfigError("engine.persist_every_ticks must be positive");
    }
    const auto& pm = cfg.price_model;
    if (pm.garch_alpha < 0.0 || pm.garch_beta < 0.0 || pm.garch_alpha + pm.garch_beta >= 1.0) {
        throw ConfigError("price_model: garch_alpha + garch_beta must be in [0, 1)");
    }
    if (pm.min_vol_factor <= 0.0 || pm.max_vol_factor < pm.min_vol_factor) {
        throw ConfigError("price_model: vol factors must satisfy 0 < min <= max");
    }
    if (pm.order_flow_decay < 0.0 || pm.order_flow_decay >= 1.0) {
        throw ConfigError("price_model.order_flow_decay must be in [0, 1)");
    }
    if (pm.dynamic_anchor_weight < 0.0 || pm.dynamic_anchor_weight > 1.0) {
        throw ConfigError("price_model.dynamic_anchor_weight must be in [0, 1]");
    }
    const auto& rg = cfg.regime;
    if (rg.review_interval_ms <= 0 || rg.event_shock_hold_ms <= 0) {
        throw ConfigError("regime intervals must be positive");
    }
    if (rg.jitter_pct < 0.0 || rg.jitter_pct >= 1.0) {
        throw ConfigError("regime.jitter_pct must be in [0, 1)");
    }
    if (rg.weights.normal < 0.0 || rg.weights.tight_liquidity < 0.0 ||
        rg.weights.high_volatility < 0.0 || rg.weights.event_shock < 0.0 ||
        rg.weights.total() <= 0.0) {
        throw ConfigError("regime.weights must be non-negative with a positive sum");
    }
    if (cfg.execution.margin_requirement < 1.0) {
        throw ConfigError("execution.margin_requirement must be >= 1.0");
    }
    if (cfg.execution.borrow_accrual_interval_ms <= 0 || cfg.execution.max_reprice_iterations <= 0) {
        throw ConfigError("execution intervals and iteration limits must be positive");
    }
}

inline void load_config(Config& cfg, const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        spdlog::warn("Config file {} not found, using defaults", path);
        return;
    }
    try {
        json j = json::parse(f, nullptr, true, true);
        if (j.contains("postgres")) {
            auto& pg = j["postgres"];
            cfg.postgres.enabled = pg.value("enabled", cfg.postgres.enabled);
            cfg.postgres.host = pg.value("host", cfg.postgres.host);
            cfg.postgres.port = pg.value("port", cfg.postgres.port);
            cfg.postgres.database = pg.value("database", cfg.postgres.database);
            cfg.postgres.user = pg.value("user", cfg.postgres.user);
            cfg.postgres.password = pg.value("password", cfg.postgres.password);
            cfg.postgres.lock_timeout_ms = pg.value("lock_timeout_ms", cfg.postgres.lock_timeout_ms);
        }
        if (j.contains("services")) {
            auto& svc = j["services"];
            cfg.services.http_port = svc.value("http_port", cfg.services.http_port);
            cfg.services.bind_address = svc.value("bind_address", cfg.services.bind_address);
        }
        if (j.contains("engine")) {
            auto& e = j["engine"];
            cfg.engine.tick_interval_ms = e.value("tick_interval_ms", cfg.engine.tick_interval_ms);
            cfg.engine.persist_every_ticks = e.value("persist_every_ticks", cfg.engine.persist_every_ticks);
            cfg.engine.seed = e.value("seed", cfg.engine.seed);
            cfg.engine.restore_state = e.value("restore_state", cfg.engine.restore_state);
        }
        if (j.contains("price_model")) {
            auto& p = j["price_model"];
            auto& pm = cfg.price_model;
            pm.garch_alpha = p.value("garch_alpha", pm.garch_alpha);
            pm.garch_beta = p.value("garch_beta", pm.garch_beta);
            pm.min_vol_factor = p.value("min_vol_factor", pm.min_vol_factor);
            pm.max_vol_factor = p.value("max_vol_factor", pm.max_vol_factor);
            pm.vol_of_vol = p.value("vol_of_vol", pm.vol_of_vol);
            pm.shock_multiplier = p.value("shock_multiplier", pm.shock_multiplier);
            pm.jump_scale_mult = p.value("jump_scale_mult", pm.jump_scale_mult);
            pm.dynamic_anchor_weight = p.value("dynamic_anchor_weight", pm.dynamic_anchor_weight);
            pm.order_flow_decay = p.value("order_flow_decay", pm.order_flow_decay);
            pm.order_flow_noise_floor = p.value("order_flow_noise_floor", pm.order_flow_noise_floor);
            pm.max_order_flow_pct = p.value("max_order_flow_pct", pm.max_order_flow_pct);
            pm.volume_base = p.value("volume_base", pm.volume_base);
            pm.volume_jitter = p.value("volume_jitter", pm.volume_jitter);
            pm.volume_move_mult = p.value("volume_move_mult", pm.volume_move_mult);
            pm.volume_vol_mult = p.value("volume_vol_mult", pm.volume_vol_mult);
        }
        if (j.contains("regime")) {
            auto& r = j["regime"];
            cfg.regime.review_interval_ms = r.value("review_interval_ms", cfg.regime.review_interval_ms);
            cfg.regime.jitter_pct = r.value("jitter_pct", cfg.regime.jitter_pct);
            cfg.regime.shock_threshold_pct = r.value("shock_threshold_pct", cfg.regime.shock_threshold_pct);
            cfg.regime.event_shock_hold_ms = r.value("event_shock_hold_ms", cfg.regime.event_shock_hold_ms);
            if (r.contains("weights")) {
                auto& w = r["weights"];
                cfg.regime.weights.normal = w.value("normal", cfg.regime.weights.normal);
                cfg.regime.weights.tight_liquidity = w.value("tight_liquidity", cfg.regime.weights.tight_liquidity);
                cfg.regime.weights.high_volatility = w.value("high_volatility", cfg.regime.weights.high_volatility);
                cfg.regime.weights.event_shock = w.value("event_shock", cfg.regime.weights.event_shock);
            }
        }
        if (j.contains("execution")) {
            auto& e = j["execution"];
            cfg.execution.realism_enabled = e.value("realism_enabled", cfg.execution.realism_enabled);
            cfg.execution.margin_requirement = e.value("margin_requirement", cfg.execution.margin_requirement);
            cfg.execution.borrow_accrual_interval_ms = e.value("borrow_accrual_interval_ms",
                                                               cfg.execution.borrow_accrual_interval_ms);
            cfg.execution.max_reprice_iterations = e.value("max_reprice_iterations",
                                                           cfg.execution.max_reprice_iterations);
        }
        if (j.contains("logging")) {
            auto& l = j["logging"];
            cfg.logging.level = l.value("level", cfg.logging.level);
            cfg.logging.file = l.value("file", cfg.logging.file);
        }
    } catch (const json::exception& e) {
        throw ConfigError("invalid config " + path + ": " + e.what());
    }
    validate_config(cfg);
}

} // namespace exchange_sim
