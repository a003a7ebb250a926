#include "execution/CostModel.h"
#include "common/PriceMath.h"
#include "market/InstrumentRegistry.h"

#include <algorithm>

namespace astock {
namespace execution {

CostBreakdown CostModel::priceOrder(const Order& order, Price fill_price, const std::string& venue) const {
    CostBreakdown costs;
    if (order.quantity <= 0 || fill_price <= 0.0) {
        return costs;
    }

    const double tick = config_.price_tick;
    const Amount notional = static_cast<double>(order.quantity) * fill_price;

    costs.commission = common::roundToTick(
        std::max(notional * config_.commission_rate, config_.min_commission), tick);

    if (order.side == OrderSide::SELL) {
        costs.stamp_duty = common::roundToTick(notional * config_.stamp_duty_rate, tick);
    }

    if (!config_.transfer_fee_venue.empty() && venue == config_.transfer_fee_venue) {
        costs.transfer_fee = common::roundToTick(notional * config_.transfer_fee_rate, tick);
    }

    costs.slippage = common::roundToTick(notional * config_.slippage_rate, tick);

    costs.total_cost = common::roundToTick(
        costs.commission + costs.stamp_duty + costs.transfer_fee + costs.slippage, tick);
    return costs;
}

CostBreakdown CostModel::priceOrder(const Order& order, Price fill_price) const {
    return priceOrder(order, fill_price, market::InstrumentRegistry::venueOf(order.symbol));
}

Amount CostModel::netCashDelta(const Order& order, Price fill_price, const CostBreakdown& costs) const {
    const Amount notional = static_cast<double>(order.quantity) * fill_price;
    const Amount delta = order.side == OrderSide::BUY
        ? -(notional + costs.total_cost)
        : notional - costs.total_cost;
    return common::roundToTick(delta, config_.price_tick);
}

Quantity CostModel::maxAffordable(const std::string& symbol, Price fill_price, Amount cash, Quantity lot) const {
    if (fill_price <= 0.0 || cash <= 0.0 || lot <= 0) {
        return 0;
    }

    // Upper bound ignoring costs, then walk down one lot at a time
    Quantity qty = static_cast<Quantity>(cash / fill_price) / lot * lot;
    Order probe;
    probe.symbol = symbol;
    probe.side = OrderSide::BUY;
    while (qty > 0) {
        probe.quantity = qty;
        const auto costs = priceOrder(probe, fill_price);
        if (static_cast<double>(qty) * fill_price + costs.total_cost <= cash + 1e-9) {
            return qty;
        }
        qty -= lot;
    }
    return 0;
}

} // namespace execution
} // namespace astock
