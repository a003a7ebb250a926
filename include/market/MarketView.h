#pragma once

#include <optional>
#include <string>
#include <vector>

#include "market/InstrumentRegistry.h"
#include "market/PriceBarStore.h"
#include "market/SignalStore.h"
#include "market/SimulationClock.h"

namespace astock {
namespace market {

// Read-only window onto the market data for the decision policy. All
// lookups go through the clock-guarded stores.
class MarketView {
public:
    MarketView(const SimulationClock& clock,
               const InstrumentRegistry& instruments,
               const PriceBarStore& bars,
               const SignalStore& signals)
        : clock_(clock), instruments_(instruments), bars_(bars), signals_(signals) {}

    Date today() const { return clock_.now(); }

    std::optional<Instrument> instrument(const std::string& symbol) const {
        return instruments_.get(symbol, clock_.now());
    }

    std::optional<PriceBar> priceBar(const std::string& symbol, const Date& date) const {
        return bars_.get(symbol, date);
    }

    std::optional<PriceBar> latestBar(const std::string& symbol) const {
        return bars_.getOrCarryForward(symbol, clock_.now());
    }

    std::vector<PriceBar> history(const std::string& symbol, size_t count) const {
        return bars_.history(symbol, clock_.now(), count);
    }

    consensus::ConsensusSignal signal(const std::string& symbol, const Date& date) const {
        return signals_.get(symbol, date);
    }

private:
    const SimulationClock& clock_;
    const InstrumentRegistry& instruments_;
    const PriceBarStore& bars_;
    const SignalStore& signals_;
};

} // namespace market
} // namespace astock
