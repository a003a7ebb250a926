#pragma once
// ===================================================================
// A-share price increment helpers
//
// Every listed A-share quotes in 0.01 CNY. Limit prices and itemised
// costs are rounded to this increment before they are compared or summed.
// ===================================================================

#include <cmath>
#include <cstdio>
#include <string>

namespace astock {
namespace common {

constexpr double kPriceTick = 0.01;

// Guard against binary representation error (e.g. 2.675 stored as 2.67499...)
constexpr double kRoundingGuard = 1e-9;

// Half away from zero, to the given tick
inline double roundToTick(double value, double tick = kPriceTick) {
    if (tick <= 0.0) return value;
    const double scaled = value / tick;
    const double nudged = scaled >= 0.0 ? scaled + kRoundingGuard : scaled - kRoundingGuard;
    return std::round(nudged) * tick;
}

inline double roundUpToTick(double value, double tick = kPriceTick) {
    if (tick <= 0.0) return value;
    return std::ceil(value / tick - kRoundingGuard) * tick;
}

inline double roundDownToTick(double value, double tick = kPriceTick) {
    if (tick <= 0.0) return value;
    return std::floor(value / tick + kRoundingGuard) * tick;
}

inline bool samePrice(double a, double b, double tick = kPriceTick) {
    return std::abs(a - b) < tick * 0.5;
}

inline std::string priceToString(double price) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", price);
    return std::string(buf);
}

} // namespace common
} // namespace astock
