#pragma once

#include <string>
#include <vector>

#include "common/Types.h"
#include "rules/TradingRules.h"

namespace astock {
namespace rules {

enum class RejectReason {
    NONE,
    SUSPENDED,    // halted, data missing, or not actively listed
    LIMIT_BAND,   // buy at limit-up / sell at limit-down
    LOT_SIZE,     // buy not a positive multiple of the lot, or non-positive sell
    SETTLEMENT    // not enough settled (T+N) shares
};

std::string toString(RejectReason reason);

struct ValidationResult {
    bool accepted = true;
    RejectReason reason = RejectReason::NONE;
    std::string message;  // human-readable, never parsed

    static ValidationResult accept() { return ValidationResult{}; }
    static ValidationResult reject(RejectReason reason, std::string message) {
        ValidationResult r;
        r.accepted = false;
        r.reason = reason;
        r.message = std::move(message);
        return r;
    }
};

// Pure rule check of a proposed order. Checks run in a fixed order and
// stop at the first failure:
//   1. suspension  2. price band  3. lot size  4. settlement
// Cash sufficiency is not a rule; the engine checks it at execution time.
class TradeValidator {
public:
    explicit TradeValidator(TradingRules rules = TradingRules::aShare()) : rules_(rules) {}

    ValidationResult validate(const Order& order,
                              const Instrument& instrument,
                              const PriceBar& bar,
                              const std::vector<Lot>& holding_lots,
                              const Date& current_date) const;

    // Quantity of `symbol` held in lots that have settled by `current_date`
    Quantity settledQuantity(const std::string& symbol,
                             const std::vector<Lot>& holding_lots,
                             const Date& current_date) const;

    const TradingRules& rules() const { return rules_; }

private:
    ValidationResult checkSuspension(const Instrument& instrument, const PriceBar& bar) const;
    ValidationResult checkPriceBand(const Order& order, const PriceBar& bar) const;
    ValidationResult checkLotSize(const Order& order) const;
    ValidationResult checkSettlement(const Order& order,
                                     const std::vector<Lot>& holding_lots,
                                     const Date& current_date) const;

    TradingRules rules_;
};

} // namespace rules
} // namespace astock
