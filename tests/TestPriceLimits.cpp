#include "market/InstrumentRegistry.h"
#include "market/PriceBarStore.h"
#include "market/PriceLimits.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace astock;

namespace {
bool near(double a, double b) {
    return std::abs(a - b) < 1e-9;
}

PriceBar makeBar(const std::string& symbol, double prev_close, double close, double volume = 1000.0) {
    PriceBar bar;
    bar.symbol = symbol;
    bar.date = Date::fromYmd(2024, 3, 1);
    bar.prev_close = prev_close;
    bar.open = bar.high = bar.low = bar.close = close;
    bar.volume = volume;
    return bar;
}
}

int main() {
    const auto rules = rules::TradingRules::aShare();

    // Rounded band around an awkward previous close
    auto main_limits = market::PriceLimits::compute(Board::MAIN, false, 9.99, rules);
    if (!near(main_limits.limit_up, 10.99) || !near(main_limits.limit_down, 8.99)) {
        std::cerr << "[TEST] 9.99 main band: " << main_limits.limit_up << " / " << main_limits.limit_down << "\n";
        return 1;
    }

    auto star_limits = market::PriceLimits::compute(Board::SCIENCE_INNOVATION, false, 50.0, rules);
    assert(near(star_limits.limit_up, 60.00));
    assert(near(star_limits.limit_down, 40.00));

    auto gem_limits = market::PriceLimits::compute(Board::GROWTH_ENTERPRISE, false, 12.34, rules);
    assert(near(gem_limits.limit_up, 14.81));   // 14.808
    assert(near(gem_limits.limit_down, 9.87));  // 9.872

    auto st_limits = market::PriceLimits::compute(Board::MAIN, true, 10.00, rules);
    assert(near(st_limits.limit_up, 10.50));
    assert(near(st_limits.limit_down, 9.50));

    // Board band wins over special treatment
    assert(near(market::PriceLimits::ratioFor(Board::SCIENCE_INNOVATION, true, rules), 0.20));
    assert(near(market::PriceLimits::ratioFor(Board::GROWTH_ENTERPRISE, true, rules), 0.20));
    assert(near(market::PriceLimits::ratioFor(Board::MAIN, true, rules), 0.05));
    assert(near(market::PriceLimits::ratioFor(Board::MAIN, false, rules), 0.10));

    // Each side equals round(p * (1 +/- r), 2) on its own
    for (double p : {1.01, 3.33, 9.99, 17.77, 123.45}) {
        for (double r : {0.10, 0.20, 0.05}) {
            rules::TradingRules custom = rules;
            custom.main_band = r;
            auto limits = market::PriceLimits::compute(Board::MAIN, false, p, custom);
            const double up = std::round(p * (1.0 + r) * 100.0 + 1e-7) / 100.0;
            const double down = std::round(p * (1.0 - r) * 100.0 + 1e-7) / 100.0;
            if (!near(limits.limit_up, up) || !near(limits.limit_down, down)) {
                std::cerr << "[TEST] band mismatch p=" << p << " r=" << r << "\n";
                return 1;
            }
        }
    }

    // Inclusive boundary
    assert(market::PriceLimits::isLimitUp(60.00, star_limits));
    assert(!market::PriceLimits::isLimitUp(59.99, star_limits));
    assert(market::PriceLimits::isLimitDown(40.00, star_limits));
    assert(!market::PriceLimits::isLimitDown(40.01, star_limits));

    // Status resolution
    auto star = market::InstrumentRegistry::makeInstrument("688001.SH", "Example Tech");
    assert(star.board == Board::SCIENCE_INNOVATION);
    assert(market::PriceLimits::resolveStatus(makeBar("688001.SH", 50.0, 60.0), star, rules) == DayStatus::LIMIT_UP);
    assert(market::PriceLimits::resolveStatus(makeBar("688001.SH", 50.0, 40.0), star, rules) == DayStatus::LIMIT_DOWN);
    assert(market::PriceLimits::resolveStatus(makeBar("688001.SH", 50.0, 55.0), star, rules) == DayStatus::NORMAL);
    assert(market::PriceLimits::resolveStatus(makeBar("688001.SH", 50.0, 55.0, 0.0), star, rules) == DayStatus::SUSPENDED);

    auto halted = makeBar("688001.SH", 50.0, 55.0);
    halted.suspension_reason = "major asset restructuring";
    assert(market::PriceLimits::resolveStatus(halted, star, rules) == DayStatus::SUSPENDED);

    // No bands outside the A-share table
    assert(market::PriceLimits::resolveStatus(makeBar("688001.SH", 50.0, 60.0), star,
                                              rules::TradingRules::unrestricted()) == DayStatus::NORMAL);

    // A configured tick applies to the limit comparison and to stored prices
    rules::TradingRules coarse = rules;
    coarse.price_tick = 0.05;
    auto bank = market::InstrumentRegistry::makeInstrument("600000.SH", "Example Bank");
    auto coarse_limits = market::PriceLimits::compute(bank, 10.00, coarse);
    assert(near(coarse_limits.tick, 0.05));
    assert(market::PriceLimits::isLimitUp(10.98, coarse_limits));
    assert(!market::PriceLimits::isLimitUp(10.97, coarse_limits));
    assert(market::PriceLimits::resolveStatus(makeBar("600000.SH", 10.00, 10.98), bank, coarse) == DayStatus::LIMIT_UP);
    assert(market::PriceLimits::resolveStatus(makeBar("600000.SH", 10.00, 10.98), bank, rules) == DayStatus::NORMAL);

    auto coarse_bar = makeBar("600000.SH", 10.02, 10.52);
    market::PriceBarStore::normalize(coarse_bar, coarse.price_tick);
    assert(near(coarse_bar.close, 10.50));
    assert(near(coarse_bar.prev_close, 10.00));

    // Classification helpers
    assert(market::InstrumentRegistry::classifyBoard("300750.SZ") == Board::GROWTH_ENTERPRISE);
    assert(market::InstrumentRegistry::classifyBoard("301001.SZ") == Board::GROWTH_ENTERPRISE);
    assert(market::InstrumentRegistry::classifyBoard("600519.SH") == Board::MAIN);
    assert(market::InstrumentRegistry::isSpecialTreatmentName("*ST Example"));
    assert(market::InstrumentRegistry::isSpecialTreatmentName("ST Example"));
    assert(market::InstrumentRegistry::isSpecialTreatmentName("S*ST Example"));
    assert(!market::InstrumentRegistry::isSpecialTreatmentName("Example Bank"));
    assert(market::InstrumentRegistry::venueOf("600519.sh") == "SH");

    std::cout << "[TEST] PriceLimits PASSED\n";
    return 0;
}
