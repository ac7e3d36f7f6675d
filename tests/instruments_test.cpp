#include <gtest/gtest.h>
#include <set>
#include <stdexcept>
#include "../src/core/instruments.hpp"
#include "test_support.hpp"

using namespace exchange_sim;
using exchange_sim::testing_support::stock;

TEST(InstrumentsTest, DefaultCatalogHasThirtyInstruments) {
    auto catalog = InstrumentCatalog::defaults();
    EXPECT_EQ(catalog.size(), 30u);

    std::set<AssetClass> classes;
    for (const auto& def : catalog.all()) {
        classes.insert(def.asset_class);
        EXPECT_EQ(catalog.find(def.ticker), &def);
    }
    EXPECT_EQ(classes.size(), 6u);
    EXPECT_EQ(catalog.find("NOPE"), nullptr);
}

TEST(InstrumentsTest, Decimals) {
    auto catalog = InstrumentCatalog::defaults();
    EXPECT_EQ(catalog.find("EURUSD")->decimals(), 4);
    EXPECT_EQ(catalog.find("NATG")->decimals(), 3);
    EXPECT_EQ(catalog.find("OGLD")->decimals(), 2);
    EXPECT_EQ(catalog.find("AAPL")->decimals(), 2);
    EXPECT_EQ(catalog.find("BTCX")->decimals(), 2);
}

TEST(InstrumentsTest, PriceBoundsFollowClassRisk) {
    auto catalog = InstrumentCatalog::defaults();
    const auto* btc = catalog.find("BTCX");
    EXPECT_DOUBLE_EQ(btc->min_price(), 67500 * 0.05);
    EXPECT_DOUBLE_EQ(btc->max_price(), 67500 * 20.0);
    const auto* eur = catalog.find("EURUSD");
    EXPECT_DOUBLE_EQ(eur->risk.max_tick_move_pct, 0.01);
    EXPECT_DOUBLE_EQ(eur->micro.commission_bps, 0.6);
}

TEST(InstrumentsTest, ValidateRejectsBadDefinitions) {
    auto bad_price = stock("BAD", 0.0);
    EXPECT_THROW(bad_price.validate(), std::invalid_argument);

    auto bad_vol = stock("BAD");
    bad_vol.base_volatility = -1.0;
    EXPECT_THROW(bad_vol.validate(), std::invalid_argument);

    auto bad_bounds = stock("BAD");
    bad_bounds.risk.max_price_factor = 0.5;
    EXPECT_THROW(bad_bounds.validate(), std::invalid_argument);

    auto bad_jump = stock("BAD");
    bad_jump.style.jump_prob = 1.5;
    EXPECT_THROW(bad_jump.validate(), std::invalid_argument);

    EXPECT_NO_THROW(stock("GOOD").validate());
}

TEST(InstrumentsTest, CatalogRejectsDuplicates) {
    std::vector<InstrumentDef> defs{stock("AAA"), stock("BBB"), stock("AAA")};
    EXPECT_THROW(InstrumentCatalog{defs}, std::invalid_argument);
}

TEST(InstrumentsTest, CatalogValidatesEntries) {
    auto broken = stock("CCC");
    broken.mean_rev_rate = 1.5;
    std::vector<InstrumentDef> defs{stock("AAA"), broken};
    EXPECT_THROW(InstrumentCatalog{defs}, std::invalid_argument);
}
