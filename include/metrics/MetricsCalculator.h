#pragma once

#include <optional>
#include <vector>

#include "common/Types.h"
#include "portfolio/PortfolioLedger.h"

namespace astock {
namespace metrics {

constexpr double kTradingDaysPerYear = 252.0;

struct TradeStats {
    int round_trips = 0;
    int wins = 0;
    int losses = 0;
    double gross_profit = 0.0;
    double gross_loss_abs = 0.0;
    double net_profit = 0.0;

    // Sentinels: empty when the denominator is zero
    std::optional<double> winRate() const {
        if (round_trips <= 0) return std::nullopt;
        return static_cast<double>(wins) / static_cast<double>(round_trips);
    }
    std::optional<double> profitFactor() const {
        if (gross_loss_abs <= 1e-12) return std::nullopt;
        return gross_profit / gross_loss_abs;
    }
    double expectancy() const {
        return (round_trips > 0) ? (net_profit / static_cast<double>(round_trips)) : 0.0;
    }
    double averageWin() const {
        return (wins > 0) ? (gross_profit / static_cast<double>(wins)) : 0.0;
    }
    double averageLoss() const {
        return (losses > 0) ? (-gross_loss_abs / static_cast<double>(losses)) : 0.0;
    }
};

struct PerformanceMetrics {
    double initial_capital = 0.0;
    double final_value = 0.0;
    double total_return = 0.0;
    double annualized_return = 0.0;
    double max_drawdown = 0.0;          // <= 0
    double annualized_volatility = 0.0;
    std::optional<double> sharpe_ratio; // empty on zero variance
    std::optional<double> win_rate;     // empty with no round trips
    std::optional<double> profit_factor;
    double average_win = 0.0;
    double average_loss = 0.0;          // <= 0
    double expectancy = 0.0;
    double total_costs = 0.0;
    int trading_days = 0;
    int trade_count = 0;
    TradeStats trade_stats;
};

// Derives performance figures from a finished (or aborted) run. Never
// divides by zero; undefined ratios are reported as empty.
class MetricsCalculator {
public:
    static PerformanceMetrics compute(const std::vector<EquityPoint>& series,
                                      const std::vector<Trade>& trades,
                                      const std::vector<portfolio::RoundTrip>& round_trips,
                                      double initial_capital,
                                      double risk_free_rate);

    static double maxDrawdown(const std::vector<EquityPoint>& series, double initial_capital);
    static TradeStats tradeStats(const std::vector<portfolio::RoundTrip>& round_trips);
};

} // namespace metrics
} // namespace astock
