#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include "macro_factors.hpp"

namespace exchange_sim {

enum class AssetClass { STOCK, ETF, FUTURE, COMMODITY, FOREX, CRYPTO };

const char* to_string(AssetClass c);

/**
 * Per-class execution microstructure used by the cost model.
 */
struct Microstructure {
    double avg_daily_dollar_volume{2.5e9};
    double base_spread_bps{2.4};
    double impact_coeff{65.0};
    double commission_bps{1.0};
    double commission_min_usd{0.01};
    double borrow_apr_short{0.03};
};

/**
 * Per-class risk limits for the price process.
 */
struct ClassRisk {
    double max_tick_move_pct{0.03};
    double risk_multiplier{1.0};     // widens the volatility ceiling
    double min_price_factor{0.1};    // hard floor = base_price * factor
    double max_price_factor{10.0};   // hard ceiling = base_price * factor
    double max_news_impact_pct{0.25};
};

struct InstrumentStyle {
    FactorVector loadings{};
    double trend_persistence{0.08};
    double jump_prob{0.004};
    double jump_scale{3.0};
    double mean_rev_mult{1.0};
    double anchor_follow_rate{0.005};
    double spread_mult{1.0};
    double volume_mult{1.0};
    double idio_mult{1.0};
};

struct InstrumentDef {
    std::string ticker;
    std::string name;
    AssetClass asset_class{AssetClass::STOCK};
    std::string sector;
    double base_price{0.0};
    double base_volatility{0.0};
    double drift{0.0};
    double mean_rev_rate{0.0};
    Microstructure micro;
    ClassRisk risk;
    InstrumentStyle style;

    double min_price() const { return base_price * risk.min_price_factor; }
    double max_price() const { return base_price * risk.max_price_factor; }

    // Display precision: 4 for FX, 3 for sub-10 commodities, otherwise 2.
    int decimals() const;

    // Throws std::invalid_argument on an inconsistent definition.
    void validate() const;
};

Microstructure class_microstructure(AssetClass c);
ClassRisk class_risk(AssetClass c);

/**
 * Immutable set of instruments, loaded once at start.
 */
class InstrumentCatalog {
public:
    explicit InstrumentCatalog(std::vector<InstrumentDef> defs);

    const InstrumentDef* find(const std::string& ticker) const;
    const std::vector<InstrumentDef>& all() const { return defs_; }
    size_t size() const { return defs_.size(); }

    /**
     * The 30 stock, ETF, future, commodity, FX and crypto instruments.
     */
    static InstrumentCatalog defaults();

private:
    std::vector<InstrumentDef> defs_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace exchange_sim
