#pragma once

#include <optional>
#include <string>
#include "instruments.hpp"
#include "types.hpp"

namespace exchange_sim {

/**
 * What the ledger side (matcher, fill executor, accrual, margin monitor)
 * needs from the price side: instrument definitions, the latest quote, the
 * active regime, and the order-flow feedback hook.
 */
class MarketView {
public:
    virtual ~MarketView() = default;

    virtual const InstrumentDef* instrument(const std::string& ticker) const = 0;
    virtual std::optional<PriceState> price(const std::string& ticker) const = 0;
    virtual RegimeRecord regime() const = 0;
    virtual void add_order_flow(const std::string& ticker, OrderSide side, double notional) = 0;
};

} // namespace exchange_sim
