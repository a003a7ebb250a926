#include "metrics/MetricsCalculator.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include <cmath>

namespace astock {
namespace metrics {
namespace {
void accumulateStats(TradeStats& s, const portfolio::RoundTrip& rt) {
    s.round_trips++;
    s.net_profit += rt.pnl;
    if (rt.pnl > 0.0) {
        s.wins++;
        s.gross_profit += rt.pnl;
    } else if (rt.pnl < 0.0) {
        s.losses++;
        s.gross_loss_abs += std::abs(rt.pnl);
    }
}
}

TradeStats MetricsCalculator::tradeStats(const std::vector<portfolio::RoundTrip>& round_trips) {
    TradeStats stats;
    for (const auto& rt : round_trips) {
        accumulateStats(stats, rt);
    }
    return stats;
}

double MetricsCalculator::maxDrawdown(const std::vector<EquityPoint>& series, double initial_capital) {
    double peak = initial_capital;
    double worst = 0.0;
    for (const auto& point : series) {
        peak = std::max(peak, point.total_value);
        if (peak > 0.0) {
            worst = std::min(worst, point.total_value / peak - 1.0);
        }
    }
    return worst;
}

PerformanceMetrics MetricsCalculator::compute(const std::vector<EquityPoint>& series,
                                              const std::vector<Trade>& trades,
                                              const std::vector<portfolio::RoundTrip>& round_trips,
                                              double initial_capital,
                                              double risk_free_rate) {
    PerformanceMetrics m;
    m.initial_capital = initial_capital;
    m.trading_days = static_cast<int>(series.size());
    m.trade_count = static_cast<int>(trades.size());
    m.final_value = series.empty() ? initial_capital : series.back().total_value;

    for (const auto& trade : trades) {
        m.total_costs += trade.costs.total_cost;
    }

    m.trade_stats = tradeStats(round_trips);
    m.win_rate = m.trade_stats.winRate();
    m.profit_factor = m.trade_stats.profitFactor();
    m.average_win = m.trade_stats.averageWin();
    m.average_loss = m.trade_stats.averageLoss();
    m.expectancy = m.trade_stats.expectancy();

    if (series.empty() || initial_capital <= 0.0) {
        return m;
    }

    m.total_return = m.final_value / initial_capital - 1.0;
    const double growth = 1.0 + m.total_return;
    m.annualized_return = growth > 0.0
        ? std::pow(growth, kTradingDaysPerYear / static_cast<double>(m.trading_days)) - 1.0
        : -1.0;

    m.max_drawdown = maxDrawdown(series, initial_capital);

    std::vector<double> returns;
    returns.reserve(series.size());
    for (const auto& point : series) {
        returns.push_back(point.daily_return);
    }
    const double mean = analytics::TechnicalIndicators::calculateMean(returns);
    const double daily_std = analytics::TechnicalIndicators::calculateStandardDeviation(returns, mean);
    m.annualized_volatility = daily_std * std::sqrt(kTradingDaysPerYear);

    if (m.annualized_volatility > 1e-12) {
        m.sharpe_ratio = (m.annualized_return - risk_free_rate) / m.annualized_volatility;
    }

    return m;
}

} // namespace metrics
} // namespace astock
