#pragma once

#include "strategy/IDecisionPolicy.h"

namespace astock {
namespace strategy {

struct RotationPolicyConfig {
    int entry_score = 60;
    int exit_score = 40;
    double min_completeness = 0.5;
    int max_positions = 5;
    double position_pct = 0.20;   // of total equity per new position
    Quantity lot_size = 100;
};

// Holds the top-ranked consensus names. Sells whatever is settled once a
// holding's score falls below the exit line (or it drops out of the
// universe), then fills free slots with the best-scored names not held.
class ConsensusRotationPolicy : public IDecisionPolicy {
public:
    explicit ConsensusRotationPolicy(RotationPolicyConfig config = RotationPolicyConfig{})
        : config_(config) {}

    PolicyInfo getInfo() const override;

    std::vector<Order> proposeOrders(
        const Date& current_date,
        const portfolio::PortfolioSnapshot& snapshot,
        const std::vector<consensus::ConsensusScore>& scores,
        const market::MarketView& market_view
    ) override;

    const RotationPolicyConfig& config() const { return config_; }

private:
    RotationPolicyConfig config_;
};

} // namespace strategy
} // namespace astock
