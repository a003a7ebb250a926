#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/PriceMath.h"
#include "common/Types.h"
#include "market/SimulationClock.h"

namespace astock {
namespace market {

// Read-only (after loading) per-symbol, per-day bars. Every lookup is
// checked against the shared clock.
class PriceBarStore {
public:
    explicit PriceBarStore(const SimulationClock& clock, Price tick = common::kPriceTick)
        : clock_(clock), tick_(tick) {}

    // Rounds prices to the tick and flattens suspended / data-missing bars
    // to the carried-forward shape. Such a bar without a previous close takes
    // the last stored close before its date, whichever order bars arrive in.
    // A later insert for the same key replaces the earlier one.
    void insert(PriceBar bar);

    std::optional<PriceBar> get(const std::string& symbol, const Date& date) const;

    // Today's bar, or a data-missing bar carried forward from the last
    // close before `date`. Empty only when the symbol has no prior history.
    std::optional<PriceBar> getOrCarryForward(const std::string& symbol, const Date& date) const;

    // Up to `count` bars ending at `end` (inclusive), oldest first
    std::vector<PriceBar> history(const std::string& symbol, const Date& end, size_t count) const;

    // Dates with at least one bar in [start, end]; reads keys only
    std::vector<Date> tradingDates(const Date& start, const Date& end) const;

    std::vector<std::string> symbols() const;
    size_t size() const;

    // Applies the carried-forward invariant to a bar in place
    static void normalize(PriceBar& bar, Price tick = common::kPriceTick);

    Price tick() const { return tick_; }

private:
    const SimulationClock& clock_;
    Price tick_;
    std::map<std::string, std::map<Date, PriceBar>> bars_;
};

} // namespace market
} // namespace astock
