#include "market/PriceLimits.h"
#include "common/PriceMath.h"

namespace astock {
namespace market {

namespace {
constexpr double kCompareEps = 1e-9;
}

double PriceLimits::ratioFor(Board board, bool special_treatment, const rules::TradingRules& rules) {
    if (board == Board::SCIENCE_INNOVATION) {
        return rules.science_innovation_band;
    }
    if (board == Board::GROWTH_ENTERPRISE) {
        return rules.growth_enterprise_band;
    }
    if (special_treatment) {
        return rules.special_treatment_band;
    }
    return rules.main_band;
}

PriceLimitPair PriceLimits::compute(Board board, bool special_treatment, Price prev_close,
                                    const rules::TradingRules& rules) {
    const double r = ratioFor(board, special_treatment, rules);
    PriceLimitPair limits;
    limits.tick = rules.price_tick;
    limits.limit_up = common::roundToTick(prev_close * (1.0 + r), rules.price_tick);
    limits.limit_down = common::roundToTick(prev_close * (1.0 - r), rules.price_tick);
    return limits;
}

bool PriceLimits::isLimitUp(Price price, const PriceLimitPair& limits) {
    return common::roundToTick(price, limits.tick) >= limits.limit_up - kCompareEps;
}

bool PriceLimits::isLimitDown(Price price, const PriceLimitPair& limits) {
    return common::roundToTick(price, limits.tick) <= limits.limit_down + kCompareEps;
}

DayStatus PriceLimits::resolveStatus(const PriceBar& bar, const Instrument& instrument,
                                     const rules::TradingRules& rules) {
    if (bar.status == DayStatus::SUSPENDED || bar.status == DayStatus::DATA_MISSING) {
        return bar.status;
    }
    if (bar.suspension_reason || bar.volume <= 0.0) {
        return DayStatus::SUSPENDED;
    }
    if (!rules.enforce_price_bands || bar.prev_close <= 0.0) {
        return DayStatus::NORMAL;
    }

    const PriceLimitPair limits = compute(instrument, bar.prev_close, rules);
    if (isLimitUp(bar.close, limits)) {
        return DayStatus::LIMIT_UP;
    }
    if (isLimitDown(bar.close, limits)) {
        return DayStatus::LIMIT_DOWN;
    }
    return DayStatus::NORMAL;
}

} // namespace market
} // namespace astock
