#include "rules/TradeValidator.h"

namespace astock {
namespace rules {

std::string toString(RejectReason reason) {
    switch (reason) {
        case RejectReason::NONE: return "none";
        case RejectReason::SUSPENDED: return "suspended";
        case RejectReason::LIMIT_BAND: return "limit_band";
        case RejectReason::LOT_SIZE: return "lot_size";
        case RejectReason::SETTLEMENT: return "settlement";
    }
    return "none";
}

ValidationResult TradeValidator::validate(const Order& order,
                                          const Instrument& instrument,
                                          const PriceBar& bar,
                                          const std::vector<Lot>& holding_lots,
                                          const Date& current_date) const {
    ValidationResult result = checkSuspension(instrument, bar);
    if (!result.accepted) {
        return result;
    }

    result = checkPriceBand(order, bar);
    if (!result.accepted) {
        return result;
    }

    result = checkLotSize(order);
    if (!result.accepted) {
        return result;
    }

    if (order.side == OrderSide::SELL) {
        result = checkSettlement(order, holding_lots, current_date);
        if (!result.accepted) {
            return result;
        }
    }

    return ValidationResult::accept();
}

Quantity TradeValidator::settledQuantity(const std::string& symbol,
                                         const std::vector<Lot>& holding_lots,
                                         const Date& current_date) const {
    Quantity settled = 0;
    for (const auto& lot : holding_lots) {
        if (lot.symbol == symbol && rules_.isSettled(lot.acquisition_date, current_date)) {
            settled += lot.quantity;
        }
    }
    return settled;
}

ValidationResult TradeValidator::checkSuspension(const Instrument& instrument, const PriceBar& bar) const {
    if (!bar.tradable()) {
        std::string message = instrument.symbol + " is " + toString(bar.status) + " on " + bar.date.toString();
        if (bar.suspension_reason) {
            message += " (" + *bar.suspension_reason + ")";
        }
        return ValidationResult::reject(RejectReason::SUSPENDED, message);
    }
    if (instrument.listing_status != ListingStatus::ACTIVE) {
        return ValidationResult::reject(
            RejectReason::SUSPENDED,
            instrument.symbol + " listing status is " + toString(instrument.listing_status));
    }
    return ValidationResult::accept();
}

ValidationResult TradeValidator::checkPriceBand(const Order& order, const PriceBar& bar) const {
    if (!rules_.enforce_price_bands) {
        return ValidationResult::accept();
    }
    if (order.side == OrderSide::BUY && bar.status == DayStatus::LIMIT_UP) {
        return ValidationResult::reject(RejectReason::LIMIT_BAND,
                                        order.symbol + " is limit-up, buy not allowed");
    }
    if (order.side == OrderSide::SELL && bar.status == DayStatus::LIMIT_DOWN) {
        return ValidationResult::reject(RejectReason::LIMIT_BAND,
                                        order.symbol + " is limit-down, sell not allowed");
    }
    return ValidationResult::accept();
}

ValidationResult TradeValidator::checkLotSize(const Order& order) const {
    if (order.quantity <= 0) {
        return ValidationResult::reject(RejectReason::LOT_SIZE,
                                        "quantity must be positive, got " + std::to_string(order.quantity));
    }
    // Odd-lot sells are allowed
    if (order.side == OrderSide::BUY && rules_.min_lot > 1 && order.quantity % rules_.min_lot != 0) {
        return ValidationResult::reject(
            RejectReason::LOT_SIZE,
            "buy quantity " + std::to_string(order.quantity) + " is not a multiple of " +
                std::to_string(rules_.min_lot));
    }
    return ValidationResult::accept();
}

ValidationResult TradeValidator::checkSettlement(const Order& order,
                                                 const std::vector<Lot>& holding_lots,
                                                 const Date& current_date) const {
    const Quantity settled = settledQuantity(order.symbol, holding_lots, current_date);
    if (settled < order.quantity) {
        return ValidationResult::reject(
            RejectReason::SETTLEMENT,
            "T+" + std::to_string(rules_.settlement_days) + ": " + std::to_string(settled) +
                " settled shares of " + order.symbol + ", requested " + std::to_string(order.quantity));
    }
    return ValidationResult::accept();
}

} // namespace rules
} // namespace astock
