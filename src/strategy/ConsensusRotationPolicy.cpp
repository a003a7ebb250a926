#include "strategy/ConsensusRotationPolicy.h"
#include "consensus/ConsensusScorer.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <map>

namespace astock {
namespace strategy {

PolicyInfo ConsensusRotationPolicy::getInfo() const {
    PolicyInfo info;
    info.name = "consensus_rotation";
    info.description = "Rotate into the highest consensus scores, exit on score decay";
    return info;
}

std::vector<Order> ConsensusRotationPolicy::proposeOrders(
    const Date& current_date,
    const portfolio::PortfolioSnapshot& snapshot,
    const std::vector<consensus::ConsensusScore>& scores,
    const market::MarketView& market_view
) {
    std::vector<Order> orders;

    std::map<std::string, int> total_by_symbol;
    for (const auto& s : scores) {
        total_by_symbol[s.symbol] = s.total;
    }

    // 1. Exits
    int kept_positions = 0;
    for (const auto& pos : snapshot.positions) {
        auto it = total_by_symbol.find(pos.symbol);
        const bool decayed = (it == total_by_symbol.end()) || it->second < config_.exit_score;
        if (!decayed) {
            kept_positions++;
            continue;
        }
        if (pos.sellable <= 0) {
            // Not settled yet; still occupies a slot today
            kept_positions++;
            continue;
        }

        Order sell;
        sell.symbol = pos.symbol;
        sell.side = OrderSide::SELL;
        sell.quantity = pos.sellable;
        sell.requested_date = current_date;
        orders.push_back(sell);

        if (pos.sellable < pos.quantity) {
            kept_positions++;
        }
        LOG_DEBUG("{} exit {} qty={} score={}", current_date.toString(), pos.symbol, pos.sellable,
                  it == total_by_symbol.end() ? -1 : it->second);
    }

    // 2. Entries
    int free_slots = config_.max_positions - kept_positions;
    if (free_slots <= 0 || config_.lot_size <= 0) {
        return orders;
    }

    const auto ranked = consensus::ConsensusScorer::rank(scores, config_.entry_score, config_.min_completeness);
    const double budget_per_position = snapshot.total_value * config_.position_pct;
    double cash_left = snapshot.cash;

    for (const auto& candidate : ranked) {
        if (free_slots <= 0) {
            break;
        }
        if (snapshot.position(candidate.symbol) != nullptr) {
            continue;
        }

        auto bar = market_view.latestBar(candidate.symbol);
        if (!bar || !bar->tradable() || bar->close <= 0.0) {
            continue;
        }

        const double budget = std::min(budget_per_position, cash_left);
        const Quantity lots = static_cast<Quantity>(std::floor(budget / bar->close)) / config_.lot_size;
        const Quantity qty = lots * config_.lot_size;
        if (qty <= 0) {
            continue;
        }

        Order buy;
        buy.symbol = candidate.symbol;
        buy.side = OrderSide::BUY;
        buy.quantity = qty;
        buy.requested_date = current_date;
        orders.push_back(buy);

        cash_left -= static_cast<double>(qty) * bar->close;
        free_slots--;
        LOG_DEBUG("{} entry {} qty={} score={}", current_date.toString(), candidate.symbol, qty, candidate.total);
    }

    return orders;
}

} // namespace strategy
} // namespace astock
