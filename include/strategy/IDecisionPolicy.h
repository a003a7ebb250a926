#pragma once

#include <string>
#include <vector>

#include "common/Types.h"
#include "consensus/ConsensusTypes.h"
#include "market/MarketView.h"
#include "portfolio/PortfolioLedger.h"

namespace astock {
namespace strategy {

struct PolicyInfo {
    std::string name;
    std::string description;
};

// Decision policy called once per simulated day. It sees the portfolio
// only as a snapshot and the market only through the clock-guarded view;
// its orders are the only input the validator accepts for that day.
class IDecisionPolicy {
public:
    virtual ~IDecisionPolicy() = default;

    virtual PolicyInfo getInfo() const = 0;

    // `scores` holds today's consensus scores for the universe, symbol ascending
    virtual std::vector<Order> proposeOrders(
        const Date& current_date,
        const portfolio::PortfolioSnapshot& snapshot,
        const std::vector<consensus::ConsensusScore>& scores,
        const market::MarketView& market_view
    ) = 0;

    // Called before the first simulated day of each run
    virtual void reset() {}
};

} // namespace strategy
} // namespace astock
