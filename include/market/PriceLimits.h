#pragma once

#include "common/PriceMath.h"
#include "common/Types.h"
#include "rules/TradingRules.h"

namespace astock {
namespace market {

struct PriceLimitPair {
    Price limit_up = 0.0;
    Price limit_down = 0.0;
    Price tick = common::kPriceTick;  // increment prices are rounded to before comparing
};

// Derived daily price band. Never stored.
class PriceLimits {
public:
    // science-innovation / growth-enterprise first, then special treatment, then main
    static double ratioFor(Board board, bool special_treatment, const rules::TradingRules& rules);

    // round(prev_close * (1 +/- r), 2)
    static PriceLimitPair compute(Board board, bool special_treatment, Price prev_close,
                                  const rules::TradingRules& rules);

    static PriceLimitPair compute(const Instrument& instrument, Price prev_close,
                                  const rules::TradingRules& rules) {
        return compute(instrument.board, instrument.special_treatment, prev_close, rules);
    }

    // Inclusive: touching the limit price counts as the limit state
    static bool isLimitUp(Price price, const PriceLimitPair& limits);
    static bool isLimitDown(Price price, const PriceLimitPair& limits);

    // Status of a bar from its own fields, for feeds that do not pre-resolve it
    static DayStatus resolveStatus(const PriceBar& bar, const Instrument& instrument,
                                   const rules::TradingRules& rules);
};

} // namespace market
} // namespace astock
