#pragma once

#include "common/Types.h"

namespace astock {
namespace rules {

// Market rule table injected into the validator, ledger and price-limit
// calculator. One validator serves every market; only this table changes.
struct TradingRules {
    Quantity min_lot = 100;           // buy quantities must be a multiple
    int settlement_days = 1;          // T+N, counted in calendar days
    bool enforce_price_bands = true;

    double main_band = 0.10;
    double science_innovation_band = 0.20;
    double growth_enterprise_band = 0.20;
    double special_treatment_band = 0.05;

    double price_tick = 0.01;

    // Shanghai / Shenzhen A-share rules
    static TradingRules aShare() { return TradingRules{}; }

    // Continuous market without lots, bands or settlement delay
    static TradingRules unrestricted() {
        TradingRules r;
        r.min_lot = 1;
        r.settlement_days = 0;
        r.enforce_price_bands = false;
        return r;
    }

    // A lot acquired on `acquired` may be sold on `today`
    bool isSettled(const Date& acquired, const Date& today) const {
        return acquired.addDays(settlement_days) <= today;
    }
};

} // namespace rules
} // namespace astock
