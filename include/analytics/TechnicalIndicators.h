#pragma once

#include <optional>
#include <vector>

#include "common/Types.h"
#include "consensus/ConsensusTypes.h"

namespace astock {
namespace analytics {

class TechnicalIndicators {
public:
    // SMA over the last `period` values; 0 when there are fewer values
    static double calculateSMA(const std::vector<double>& prices, int period);

    // Highest value over the last `lookback` entries (all entries when fewer)
    static double calculateHighest(const std::vector<double>& values, int lookback);

    // Builds the technical consensus family from trailing bars (oldest first).
    // Empty when fewer than `long_period` bars are available or the latest
    // bar carries no fresh close.
    static std::optional<consensus::TechnicalSignal> deriveTechnicalSignal(
        const std::vector<PriceBar>& bars,
        int short_period = 5,
        int long_period = 20,
        int high_lookback = 250);

    static std::vector<double> extractClosePrices(const std::vector<PriceBar>& bars);
    static std::vector<double> extractHighPrices(const std::vector<PriceBar>& bars);

    static double calculateMean(const std::vector<double>& values);
    // Population standard deviation around `mean`
    static double calculateStandardDeviation(const std::vector<double>& values, double mean);
};

} // namespace analytics
} // namespace astock
