#include "metrics/MetricsCalculator.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace astock;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

std::vector<EquityPoint> series(double initial, const std::vector<double>& totals) {
    std::vector<EquityPoint> out;
    double prev = initial;
    Date d = Date::fromYmd(2024, 1, 2);
    for (double total : totals) {
        EquityPoint p;
        p.date = d;
        p.cash = total;
        p.total_value = total;
        p.daily_return = total / prev - 1.0;
        prev = total;
        out.push_back(p);
        d = d.addDays(1);
    }
    return out;
}

portfolio::RoundTrip roundTrip(double pnl) {
    portfolio::RoundTrip rt;
    rt.symbol = "600000.SH";
    rt.quantity = 100;
    rt.pnl = pnl;
    return rt;
}
}

int main() {
    const double capital = 1000000.0;

    // Nothing happened: every ratio is defined or empty, nothing divides by zero
    auto empty = metrics::MetricsCalculator::compute({}, {}, {}, capital, 0.03);
    assert(empty.trading_days == 0);
    assert(near(empty.total_return, 0.0));
    assert(near(empty.final_value, capital));
    assert(!empty.sharpe_ratio.has_value());
    assert(!empty.win_rate.has_value());
    assert(!empty.profit_factor.has_value());
    assert(near(empty.expectancy, 0.0));

    // Flat equity: zero variance gives no Sharpe
    auto flat = metrics::MetricsCalculator::compute(series(capital, {capital, capital, capital}), {}, {}, capital, 0.03);
    if (flat.sharpe_ratio.has_value()) {
        std::cerr << "[TEST] zero-variance series produced a Sharpe ratio\n";
        return 1;
    }
    assert(near(flat.max_drawdown, 0.0));
    assert(near(flat.annualized_return, 0.0));
    assert(flat.trading_days == 3);

    // Up, down, up
    auto curve = series(capital, {1010000.0, 990000.0, 1020000.0});
    auto m = metrics::MetricsCalculator::compute(curve, {}, {}, capital, 0.03);
    assert(near(m.total_return, 0.02));
    assert(near(m.annualized_return, std::pow(1.02, 252.0 / 3.0) - 1.0, 1e-9));
    assert(near(m.max_drawdown, 990000.0 / 1010000.0 - 1.0));
    assert(m.sharpe_ratio.has_value());

    double mean = 0.0;
    for (const auto& p : curve) mean += p.daily_return;
    mean /= 3.0;
    double var = 0.0;
    for (const auto& p : curve) var += (p.daily_return - mean) * (p.daily_return - mean);
    const double vol = std::sqrt(var / 3.0) * std::sqrt(252.0);
    assert(near(m.annualized_volatility, vol));
    assert(near(*m.sharpe_ratio, (m.annualized_return - 0.03) / vol));

    // Initial capital is the first peak
    auto dip = metrics::MetricsCalculator::compute(series(capital, {980000.0}), {}, {}, capital, 0.03);
    assert(near(dip.max_drawdown, -0.02));
    assert(near(dip.total_return, -0.02));

    // Trade statistics
    Trade t1;
    t1.costs.total_cost = 15.10;
    Trade t2;
    t2.costs.total_cost = 20.75;
    auto traded = metrics::MetricsCalculator::compute(curve, {t1, t2},
                                                      {roundTrip(100.0), roundTrip(-50.0), roundTrip(30.0)},
                                                      capital, 0.03);
    assert(traded.trade_count == 2);
    assert(near(traded.total_costs, 35.85));
    assert(traded.trade_stats.round_trips == 3);
    assert(near(*traded.win_rate, 2.0 / 3.0));
    assert(near(*traded.profit_factor, 2.6));
    assert(near(traded.average_win, 65.0));
    assert(near(traded.average_loss, -50.0));
    assert(near(traded.expectancy, 80.0 / 3.0));

    // Only winners: profit factor undefined, win rate 1
    auto winners = metrics::MetricsCalculator::compute(curve, {}, {roundTrip(10.0)}, capital, 0.03);
    assert(!winners.profit_factor.has_value());
    assert(near(*winners.win_rate, 1.0));

    // A break-even round trip is not a win
    auto even = metrics::MetricsCalculator::compute(curve, {}, {roundTrip(0.0)}, capital, 0.03);
    assert(near(*even.win_rate, 0.0));

    std::cout << "[TEST] Metrics PASSED\n";
    return 0;
}
