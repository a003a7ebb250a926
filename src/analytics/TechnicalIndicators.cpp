#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace astock {
namespace analytics {

double TechnicalIndicators::calculateSMA(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return 0.0;

    // Mean of the most recent `period` values
    double sum = 0.0;
    for (size_t i = prices.size() - period; i < prices.size(); ++i) {
        sum += prices[i];
    }

    return sum / period;
}

double TechnicalIndicators::calculateHighest(const std::vector<double>& values, int lookback) {
    if (values.empty()) return 0.0;

    size_t start = 0;
    if (lookback > 0 && values.size() > static_cast<size_t>(lookback)) {
        start = values.size() - lookback;
    }
    return *std::max_element(values.begin() + start, values.end());
}

std::optional<consensus::TechnicalSignal> TechnicalIndicators::deriveTechnicalSignal(
    const std::vector<PriceBar>& bars,
    int short_period,
    int long_period,
    int high_lookback
) {
    if (long_period <= 0 || bars.size() < static_cast<size_t>(long_period)) {
        return std::nullopt;
    }
    if (!bars.back().tradable()) {
        return std::nullopt;
    }

    // Suspended and data-missing bars stay out of the averages
    std::vector<PriceBar> traded;
    traded.reserve(bars.size());
    for (const auto& bar : bars) {
        if (bar.tradable()) {
            traded.push_back(bar);
        }
    }
    if (traded.size() < static_cast<size_t>(long_period)) {
        return std::nullopt;
    }

    const auto closes = extractClosePrices(traded);
    const auto highs = extractHighPrices(traded);

    consensus::TechnicalSignal signal;
    signal.close = closes.back();
    signal.high_52w = calculateHighest(highs, high_lookback);
    signal.ma_short = calculateSMA(closes, short_period);
    signal.ma_long = calculateSMA(closes, long_period);
    return signal;
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<PriceBar>& bars) {
    std::vector<double> prices;
    prices.reserve(bars.size());

    for (const auto& bar : bars) {
        prices.push_back(bar.close);
    }

    return prices;
}

std::vector<double> TechnicalIndicators::extractHighPrices(const std::vector<PriceBar>& bars) {
    std::vector<double> prices;
    prices.reserve(bars.size());

    for (const auto& bar : bars) {
        prices.push_back(bar.high);
    }

    return prices;
}

double TechnicalIndicators::calculateMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;

    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double TechnicalIndicators::calculateStandardDeviation(
    const std::vector<double>& values,
    double mean
) {
    if (values.empty()) return 0.0;
    double sum_sq_diff = 0.0;
    for (double val : values) {
        sum_sq_diff += (val - mean) * (val - mean);
    }
    return std::sqrt(sum_sq_diff / values.size());
}

} // namespace analytics
} // namespace astock
