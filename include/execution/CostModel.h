#pragma once

#include <string>

#include "common/Types.h"

namespace astock {
namespace execution {

struct CostConfig {
    double commission_rate = 0.0003;
    double min_commission = 5.0;        // CNY per order
    double stamp_duty_rate = 0.0005;    // sells only
    double transfer_fee_rate = 0.00001;
    std::string transfer_fee_venue = "SH";
    double slippage_rate = 0.001;       // against the trader, both sides
    double price_tick = 0.01;
};

// Itemised transaction costs for one fill. Each item is rounded to the
// price tick before the total is formed.
class CostModel {
public:
    explicit CostModel(CostConfig config = CostConfig{}) : config_(config) {}

    CostBreakdown priceOrder(const Order& order, Price fill_price, const std::string& venue) const;

    // Venue taken from the symbol suffix
    CostBreakdown priceOrder(const Order& order, Price fill_price) const;

    // Cash change of a fill after costs: negative for buys, positive for sells
    Amount netCashDelta(const Order& order, Price fill_price, const CostBreakdown& costs) const;

    // Largest quantity in whole `lot`s whose notional plus costs fits in `cash`
    Quantity maxAffordable(const std::string& symbol, Price fill_price, Amount cash, Quantity lot) const;

    const CostConfig& config() const { return config_; }

private:
    CostConfig config_;
};

} // namespace execution
} // namespace astock
