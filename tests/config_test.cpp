#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <string>
#include "../src/core/config.hpp"

using namespace exchange_sim;

static std::string write_temp(const std::string& name, const std::string& body) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << body;
    return path;
}

TEST(ConfigTest, MissingFileKeepsDefaults) {
    Config cfg;
    load_config(cfg, "/nonexistent/exchange_sim_settings.json");
    EXPECT_EQ(cfg.engine.tick_interval_ms, 1000);
    EXPECT_EQ(cfg.engine.persist_every_ticks, 5);
    EXPECT_DOUBLE_EQ(cfg.execution.margin_requirement, 1.1);
    EXPECT_EQ(cfg.services.http_port, 8500);
    EXPECT_FALSE(cfg.postgres.enabled);
}

TEST(ConfigTest, OverridesSectionsAndAllowsComments) {
    auto path = write_temp("exchange_sim_config_ok.json", R"({
        // comments are accepted
        "engine": { "tick_interval_ms": 250, "seed": 99, "restore_state": false },
        "price_model": { "garch_alpha": 0.05, "order_flow_decay": 0.5 },
        "regime": { "review_interval_ms": 60000, "weights": { "event_shock": 0 } },
        "execution": { "realism_enabled": false, "margin_requirement": 1.5 },
        "postgres": { "enabled": true, "host": "db", "port": 6543 },
        "logging": { "level": "debug" }
    })");
    Config cfg;
    load_config(cfg, path);
    EXPECT_EQ(cfg.engine.tick_interval_ms, 250);
    EXPECT_EQ(cfg.engine.seed, 99u);
    EXPECT_FALSE(cfg.engine.restore_state);
    EXPECT_EQ(cfg.engine.persist_every_ticks, 5);
    EXPECT_DOUBLE_EQ(cfg.price_model.garch_alpha, 0.05);
    EXPECT_DOUBLE_EQ(cfg.price_model.garch_beta, 0.90);
    EXPECT_DOUBLE_EQ(cfg.price_model.order_flow_decay, 0.5);
    EXPECT_EQ(cfg.regime.review_interval_ms, 60000);
    EXPECT_DOUBLE_EQ(cfg.regime.weights.event_shock, 0.0);
    EXPECT_DOUBLE_EQ(cfg.regime.weights.normal, 62.0);
    EXPECT_FALSE(cfg.execution.realism_enabled);
    EXPECT_DOUBLE_EQ(cfg.execution.margin_requirement, 1.5);
    EXPECT_TRUE(cfg.postgres.enabled);
    EXPECT_EQ(cfg.postgres.host, "db");
    EXPECT_EQ(cfg.postgres.port, 6543);
    EXPECT_EQ(cfg.logging.level, "debug");
    std::remove(path.c_str());
}

TEST(ConfigTest, MalformedJsonIsConfigError) {
    auto path = write_temp("exchange_sim_config_bad.json", "{ \"engine\": { ");
    Config cfg;
    EXPECT_THROW(load_config(cfg, path), ConfigError);
    std::remove(path.c_str());
}

TEST(ConfigTest, WrongTypeIsConfigError) {
    auto path = write_temp("exchange_sim_config_type.json",
                           R"({ "engine": { "tick_interval_ms": "fast" } })");
    Config cfg;
    EXPECT_THROW(load_config(cfg, path), ConfigError);
    std::remove(path.c_str());
}

TEST(ConfigTest, ValidationRejectsBadValues) {
    Config cfg;
    EXPECT_NO_THROW(validate_config(cfg));

    Config garch = cfg;
    garch.price_model.garch_alpha = 0.2;
    garch.price_model.garch_beta = 0.85;
    EXPECT_THROW(validate_config(garch), ConfigError);

    Config margin = cfg;
    margin.execution.margin_requirement = 0.9;
    EXPECT_THROW(validate_config(margin), ConfigError);

    Config weights = cfg;
    weights.regime.weights = RegimeWeights{0.0, 0.0, 0.0, 0.0};
    EXPECT_THROW(validate_config(weights), ConfigError);

    Config tick = cfg;
    tick.engine.tick_interval_ms = 0;
    EXPECT_THROW(validate_config(tick), ConfigError);
}
