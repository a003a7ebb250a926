#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"
#include "rules/TradingRules.h"

namespace astock {
namespace portfolio {

// Realised result of one sell, matched FIFO against the lots it consumed
struct RoundTrip {
    std::string symbol;
    Date entry_date;         // acquisition date of the oldest consumed lot
    Date exit_date;
    Quantity quantity = 0;
    Amount cost_basis = 0.0; // includes buy-side costs
    Amount proceeds = 0.0;   // net of sell-side costs
    Amount pnl = 0.0;

    bool isWin() const { return pnl > 0.0; }
};

struct PositionView {
    std::string symbol;
    Quantity quantity = 0;
    Quantity sellable = 0;
    Price avg_cost = 0.0;
    Price mark_price = 0.0;
    Amount market_value = 0.0;
    Date first_acquired;
};

// Read-only copy handed to the decision policy
struct PortfolioSnapshot {
    Date date;
    Amount cash = 0.0;
    Amount market_value = 0.0;
    Amount total_value = 0.0;
    std::vector<PositionView> positions;  // symbol ascending

    const PositionView* position(const std::string& symbol) const;
};

// Cash, lots and the trade log of one simulated account. Only the
// simulation engine mutates it; orders are applied one at a time.
class PortfolioLedger {
public:
    explicit PortfolioLedger(Amount initial_cash);

    Amount cash() const { return cash_; }
    Amount initialCash() const { return initial_cash_; }

    // Lots of `symbol`, acquisition date ascending; empty when not held
    std::vector<Lot> lots(const std::string& symbol) const;
    std::vector<std::string> heldSymbols() const;
    Quantity quantity(const std::string& symbol) const;
    Quantity sellableQuantity(const std::string& symbol, const Date& date, const rules::TradingRules& rules) const;

    // Throws std::invalid_argument when cash does not cover the trade
    void applyBuy(const Trade& trade);

    // Consumes settled lots oldest first. Throws std::invalid_argument when
    // fewer than trade.quantity settled shares are held.
    RoundTrip applySell(const Trade& trade, const rules::TradingRules& rules);

    // Updates mark prices for the given symbols and returns the holdings value.
    // Held symbols without a price keep their previous mark.
    Amount markToMarket(const std::map<std::string, Price>& prices);
    Amount marketValue() const;
    Amount totalValue() const { return cash_ + marketValue(); }

    PortfolioSnapshot snapshot(const Date& date, const rules::TradingRules& rules) const;

    const std::vector<Trade>& trades() const { return trades_; }
    const std::vector<RoundTrip>& roundTrips() const { return round_trips_; }

private:
    Price markPrice(const std::string& symbol) const;

    Amount initial_cash_;
    Amount cash_;
    std::map<std::string, std::vector<Lot>> lots_;
    std::map<std::string, Price> marks_;
    std::vector<Trade> trades_;
    std::vector<RoundTrip> round_trips_;
};

} // namespace portfolio
} // namespace astock
