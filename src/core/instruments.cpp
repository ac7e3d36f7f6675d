#include "instruments.hpp"
#include <cmath>
#include <stdexcept>

namespace exchange_sim {

const char* to_string(AssetClass c) {
    switch (c) {
        case AssetClass::STOCK: return "Stock";
        case AssetClass::ETF: return "ETF";
        case AssetClass::FUTURE: return "Future";
        case AssetClass::COMMODITY: return "Commodity";
        case AssetClass::FOREX: return "Forex";
        case AssetClass::CRYPTO: return "Crypto";
    }
    return "Stock";
}

Microstructure class_microstructure(AssetClass c) {
    switch (c) {
        case AssetClass::STOCK:     return {2.5e9, 2.4, 65.0, 1.0, 0.01, 0.03};
        case AssetClass::ETF:       return {1.2e9, 1.6, 52.0, 1.0, 0.01, 0.02};
        case AssetClass::FUTURE:    return {4.0e9, 1.8, 58.0, 0.8, 0.01, 0.01};
        case AssetClass::COMMODITY: return {9.0e8, 4.5, 78.0, 1.2, 0.01, 0.025};
        case AssetClass::FOREX:     return {5.0e9, 0.8, 42.0, 0.6, 0.01, 0.015};
        case AssetClass::CRYPTO:    return {8.0e8, 6.0, 110.0, 1.4, 0.01, 0.08};
    }
    return Microstructure{};
}

ClassRisk class_risk(AssetClass c) {
    switch (c) {
        case AssetClass::STOCK:     return {0.03, 1.0, 0.10, 10.0, 0.25};
        case AssetClass::ETF:       return {0.02, 0.8, 0.10, 10.0, 0.12};
        case AssetClass::FUTURE:    return {0.02, 0.9, 0.10, 10.0, 0.08};
        case AssetClass::COMMODITY: return {0.03, 1.1, 0.10, 10.0, 0.12};
        case AssetClass::FOREX:     return {0.01, 0.6, 0.20, 5.0, 0.04};
        case AssetClass::CRYPTO:    return {0.05, 1.4, 0.05, 20.0, 0.30};
    }
    return ClassRisk{};
}

int InstrumentDef::decimals() const {
    if (asset_class == AssetClass::FOREX) return 4;
    if (asset_class == AssetClass::COMMODITY && base_price < 10.0) return 3;
    return 2;
}

void InstrumentDef::validate() const {
    auto fail = [this](const std::string& what) {
        throw std::invalid_argument("instrument " + ticker + ": " + what);
    };
    if (ticker.empty()) fail("empty ticker");
    if (!(base_price > 0.0)) fail("base_price must be positive");
    if (!(base_volatility > 0.0)) fail("base_volatility must be positive");
    if (mean_rev_rate < 0.0 || mean_rev_rate >= 1.0) fail("mean_rev_rate must be in [0, 1)");
    if (!(risk.max_tick_move_pct > 0.0 && risk.max_tick_move_pct < 1.0)) {
        fail("max_tick_move_pct must be in (0, 1)");
    }
    if (!(risk.min_price_factor > 0.0 && risk.min_price_factor < 1.0 && risk.max_price_factor > 1.0)) {
        fail("price bounds must bracket base_price");
    }
    if (style.jump_prob < 0.0 || style.jump_prob > 1.0) fail("jump_prob must be in [0, 1]");
    if (style.anchor_follow_rate < 0.0 || style.anchor_follow_rate > 1.0) {
        fail("anchor_follow_rate must be in [0, 1]");
    }
    if (style.spread_mult <= 0.0 || style.volume_mult <= 0.0 || style.idio_mult < 0.0) {
        fail("style multipliers must be positive");
    }
    for (double l : style.loadings) {
        if (!std::isfinite(l)) fail("non-finite factor loading");
    }
    if (micro.avg_daily_dollar_volume <= 0.0) fail("avg_daily_dollar_volume must be positive");
}

namespace {

//                              risk_on usd    rates  energy metals crypto vol
const FactorVector kTechLoad   {1.00, -0.15, -0.35, 0.00, 0.00, 0.10, -0.50};
const FactorVector kAutoLoad   {1.20, -0.10, -0.30, -0.20, 0.00, 0.15, -0.60};
const FactorVector kMemeLoad   {1.60, -0.10, -0.20, 0.00, 0.00, 0.40, -0.80};
const FactorVector kHealthLoad {0.60, -0.10, -0.20, 0.00, 0.00, 0.00, -0.30};
const FactorVector kMetalsLoad {-0.10, -0.60, -0.30, 0.00, 1.00, 0.00, 0.20};
const FactorVector kEnergyLoad {0.30, -0.30, 0.00, 1.20, 0.00, 0.00, 0.00};
const FactorVector kIndexLoad  {1.00, -0.10, -0.30, 0.00, 0.00, 0.00, -0.60};
const FactorVector kVolLoad    {-1.20, 0.00, 0.00, 0.00, 0.00, 0.00, 2.00};
const FactorVector kBondLoad   {-0.20, 0.10, -1.00, 0.00, 0.00, 0.00, 0.20};
const FactorVector kBankLoad   {0.80, 0.10, 0.50, 0.00, 0.00, 0.00, -0.40};
const FactorVector kRealtyLoad {0.50, -0.10, -0.80, 0.00, 0.00, 0.00, -0.30};
const FactorVector kCryptoLoad {0.60, -0.30, -0.10, 0.00, 0.00, 1.30, -0.20};
const FactorVector kEurLoad    {0.10, -1.00, -0.20, 0.00, 0.00, 0.00, 0.00};
const FactorVector kGbpLoad    {0.15, -0.90, -0.20, 0.00, 0.00, 0.00, 0.00};
const FactorVector kJpyLoad    {0.20, 1.00, 0.50, 0.00, 0.00, 0.00, -0.20};

InstrumentStyle style(const FactorVector& loadings, double trend, double jump_prob, double jump_scale,
                      double mean_rev_mult, double anchor_follow, double spread_mult = 1.0,
                      double volume_mult = 1.0, double idio_mult = 1.0) {
    InstrumentStyle s;
    s.loadings = loadings;
    s.trend_persistence = trend;
    s.jump_prob = jump_prob;
    s.jump_scale = jump_scale;
    s.mean_rev_mult = mean_rev_mult;
    s.anchor_follow_rate = anchor_follow;
    s.spread_mult = spread_mult;
    s.volume_mult = volume_mult;
    s.idio_mult = idio_mult;
    return s;
}

InstrumentDef make(const char* ticker, const char* name, AssetClass cls, const char* sector,
                   double base_price, double vol, double drift, double mean_rev,
                   const InstrumentStyle& st) {
    InstrumentDef d;
    d.ticker = ticker;
    d.name = name;
    d.asset_class = cls;
    d.sector = sector;
    d.base_price = base_price;
    d.base_volatility = vol;
    d.drift = drift;
    d.mean_rev_rate = mean_rev;
    d.micro = class_microstructure(cls);
    d.risk = class_risk(cls);
    d.style = st;
    return d;
}

} // namespace

InstrumentCatalog::InstrumentCatalog(std::vector<InstrumentDef> defs) : defs_(std::move(defs)) {
    for (size_t i = 0; i < defs_.size(); ++i) {
        defs_[i].validate();
        if (!index_.emplace(defs_[i].ticker, i).second) {
            throw std::invalid_argument("duplicate instrument " + defs_[i].ticker);
        }
    }
}

const InstrumentDef* InstrumentCatalog::find(const std::string& ticker) const {
    auto it = index_.find(ticker);
    if (it == index_.end()) return nullptr;
    return &defs_[it->second];
}

InstrumentCatalog InstrumentCatalog::defaults() {
    using C = AssetClass;
    auto tech = style(kTechLoad, 0.08, 0.004, 3.0, 1.0, 0.004);
    auto growth = style(kTechLoad, 0.12, 0.008, 3.5, 0.8, 0.006, 1.2, 1.3, 1.2);
    std::vector<InstrumentDef> defs{
        // Stocks - large cap
        make("AAPL", "Apricot Corp", C::STOCK, "Tech", 185, 0.018, 0.0001, 0.002, tech),
        make("MSFT", "MegaSoft", C::STOCK, "Tech", 420, 0.016, 0.00012, 0.002, tech),
        make("NVDA", "NeuraVolt", C::STOCK, "Tech", 875, 0.032, 0.0002, 0.0015, growth),
        make("AMZN", "AmazoNet", C::STOCK, "Tech", 195, 0.02, 0.00015, 0.002, tech),
        make("GOOG", "GooglTech", C::STOCK, "Tech", 175, 0.019, 0.0001, 0.002, tech),
        make("META", "MetaVerse Inc", C::STOCK, "Tech", 510, 0.025, 0.00015, 0.0018, tech),
        make("TSLA", "VoltMotors", C::STOCK, "Auto", 245, 0.038, 0.0002, 0.001,
             style(kAutoLoad, 0.12, 0.008, 3.5, 0.8, 0.006, 1.1, 1.4, 1.2)),
        // Stocks - growth / speculative
        make("MOON", "LunarTech", C::STOCK, "Meme", 42, 0.065, 0.0005, 0.0005,
             style(kMemeLoad, 0.18, 0.015, 4.0, 0.5, 0.01, 1.6, 1.8, 1.4)),
        make("BIOT", "BioTera", C::STOCK, "Healthcare", 78, 0.04, 0.0003, 0.001,
             style(kHealthLoad, 0.06, 0.012, 4.0, 0.9, 0.005, 1.3, 1.1, 1.3)),
        make("QNTM", "QuantumLeap", C::STOCK, "Tech", 34, 0.045, 0.0003, 0.001, growth),
        // Commodities
        make("OGLD", "OmniGold", C::COMMODITY, "Metals", 2050, 0.012, 0.00005, 0.003,
             style(kMetalsLoad, 0.06, 0.003, 2.5, 1.2, 0.003)),
        make("SLVR", "SilverEdge", C::COMMODITY, "Metals", 28.5, 0.022, 0.00003, 0.003,
             style(kMetalsLoad, 0.07, 0.005, 3.0, 1.1, 0.004, 1.2)),
        make("CRUD", "CrudeFlow", C::COMMODITY, "Energy", 78, 0.025, 0.0, 0.004,
             style(kEnergyLoad, 0.09, 0.006, 3.5, 1.1, 0.004, 1.1, 1.2)),
        make("NATG", "NatGas Plus", C::COMMODITY, "Energy", 3.2, 0.04, 0.0, 0.005,
             style(kEnergyLoad, 0.08, 0.01, 4.0, 1.2, 0.005, 1.4, 1.1, 1.3)),
        make("COPR", "CopperLine", C::COMMODITY, "Metals", 4.25, 0.018, 0.00005, 0.003,
             style(kMetalsLoad, 0.07, 0.004, 3.0, 1.1, 0.004)),
        // Futures / indices
        make("SPXF", "S&P Futures", C::FUTURE, "Index", 5200, 0.012, 0.0001, 0.002,
             style(kIndexLoad, 0.06, 0.002, 2.5, 1.0, 0.003, 0.8, 1.5, 0.6)),
        make("NQFT", "NQ Futures", C::FUTURE, "Index", 18500, 0.016, 0.00012, 0.002,
             style(kIndexLoad, 0.07, 0.003, 2.5, 1.0, 0.003, 0.8, 1.4, 0.7)),
        make("DOWF", "Dow Futures", C::FUTURE, "Index", 39000, 0.01, 0.00008, 0.002,
             style(kIndexLoad, 0.05, 0.002, 2.5, 1.0, 0.003, 0.8, 1.3, 0.6)),
        make("VIXF", "Fear Index", C::FUTURE, "Volatility", 18, 0.06, -0.0002, 0.008,
             style(kVolLoad, 0.04, 0.015, 4.5, 1.6, 0.008, 1.5, 1.2, 1.2)),
        // ETFs
        make("SAFE", "Treasury ETF", C::ETF, "Bonds", 102, 0.003, 0.00003, 0.005,
             style(kBondLoad, 0.03, 0.001, 2.0, 1.3, 0.002, 0.7, 0.8, 0.6)),
        make("BNKX", "BankEx ETF", C::ETF, "Finance", 45, 0.014, 0.00006, 0.003,
             style(kBankLoad, 0.06, 0.003, 3.0, 1.0, 0.004)),
        make("NRGY", "Energy ETF", C::ETF, "Energy", 88, 0.022, 0.00008, 0.003,
             style(kEnergyLoad, 0.07, 0.004, 3.0, 1.0, 0.004)),
        make("MEDS", "HealthCare ETF", C::ETF, "Healthcare", 155, 0.015, 0.0001, 0.003,
             style(kHealthLoad, 0.05, 0.003, 2.5, 1.0, 0.004, 0.9)),
        make("SEMX", "SemiConductor ETF", C::ETF, "Tech", 240, 0.028, 0.00015, 0.002,
             style(kTechLoad, 0.09, 0.005, 3.0, 0.9, 0.005, 1.0, 1.1)),
        make("REIT", "RealtyFund ETF", C::ETF, "RealEstate", 38, 0.012, 0.00005, 0.004,
             style(kRealtyLoad, 0.05, 0.003, 2.5, 1.1, 0.003, 1.0, 0.9)),
        // Crypto
        make("BTCX", "Bitcoin Index", C::CRYPTO, "Crypto", 67500, 0.035, 0.0002, 0.001,
             style(kCryptoLoad, 0.12, 0.01, 3.5, 0.7, 0.006, 1.0, 1.3)),
        make("ETHX", "Ethereum Index", C::CRYPTO, "Crypto", 3500, 0.04, 0.00015, 0.001,
             style(kCryptoLoad, 0.12, 0.012, 3.5, 0.7, 0.006, 1.1, 1.3, 1.1)),
        make("SOLX", "Solana Index", C::CRYPTO, "Crypto", 145, 0.055, 0.0003, 0.0008,
             style(kCryptoLoad, 0.15, 0.015, 4.0, 0.6, 0.008, 1.3, 1.4, 1.3)),
        // Forex
        make("EURUSD", "Euro/Dollar", C::FOREX, "FX", 1.0850, 0.004, 0.0, 0.006,
             style(kEurLoad, 0.04, 0.002, 2.5, 1.3, 0.003, 0.6, 1.6, 0.7)),
        make("GBPUSD", "Pound/Dollar", C::FOREX, "FX", 1.2700, 0.005, 0.0, 0.006,
             style(kGbpLoad, 0.04, 0.002, 2.5, 1.3, 0.003, 0.7, 1.4, 0.7)),
        make("USDJPY", "Dollar/Yen", C::FOREX, "FX", 150.50, 0.005, 0.0, 0.005,
             style(kJpyLoad, 0.05, 0.003, 3.0, 1.2, 0.003, 0.7, 1.4, 0.8)),
    };
    return InstrumentCatalog(std::move(defs));
}

} // namespace exchange_sim
