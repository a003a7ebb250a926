#pragma once

#include <string>
#include <vector>
#include <optional>

#include "common/Date.h"

namespace astock {

using Price = double;
using Quantity = long long;
using Amount = double;

enum class Board { MAIN, SCIENCE_INNOVATION, GROWTH_ENTERPRISE };
enum class ListingStatus { ACTIVE, SUSPENDED_UNKNOWN, DELISTED };
enum class DayStatus { NORMAL, LIMIT_UP, LIMIT_DOWN, SUSPENDED, DATA_MISSING };
enum class OrderSide { BUY, SELL };

struct Instrument {
    std::string symbol;         // exchange-qualified, e.g. 600519.SH
    std::string name;
    Board board = Board::MAIN;
    bool special_treatment = false;
    ListingStatus listing_status = ListingStatus::ACTIVE;
};

// OHLC of a suspended or data-missing day equals prev_close and volume is 0.
struct PriceBar {
    std::string symbol;
    Date date;
    Price open = 0.0;
    Price high = 0.0;
    Price low = 0.0;
    Price close = 0.0;
    double volume = 0.0;
    Amount amount = 0.0;
    Price prev_close = 0.0;
    DayStatus status = DayStatus::NORMAL;
    std::optional<std::string> suspension_reason;

    bool tradable() const {
        return status != DayStatus::SUSPENDED && status != DayStatus::DATA_MISSING;
    }
};

struct Order {
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    Quantity quantity = 0;
    Date requested_date;
};

struct Lot {
    std::string symbol;
    Quantity quantity = 0;
    Date acquisition_date;
    Price cost_per_share = 0.0;  // fill price plus buy-side costs
};

struct CostBreakdown {
    Amount commission = 0.0;
    Amount stamp_duty = 0.0;
    Amount transfer_fee = 0.0;
    Amount slippage = 0.0;
    Amount total_cost = 0.0;
};

struct Trade {
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    Date date;
    Quantity quantity = 0;
    Price fill_price = 0.0;
    CostBreakdown costs;
    Amount net_cash_delta = 0.0;
};

struct EquityPoint {
    Date date;
    Amount cash = 0.0;
    Amount market_value = 0.0;   // holdings only
    Amount total_value = 0.0;    // cash + holdings
    double daily_return = 0.0;
};

std::string toString(Board board);
std::string toString(ListingStatus status);
std::string toString(DayStatus status);
std::string toString(OrderSide side);

std::optional<Board> boardFromString(const std::string& value);
std::optional<ListingStatus> listingStatusFromString(const std::string& value);
std::optional<DayStatus> dayStatusFromString(const std::string& value);
std::optional<OrderSide> orderSideFromString(const std::string& value);

} // namespace astock
