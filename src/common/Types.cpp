#include "common/Types.h"

#include <algorithm>
#include <cctype>

namespace astock {

namespace {
std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
}

std::string toString(Board board) {
    switch (board) {
        case Board::MAIN: return "main";
        case Board::SCIENCE_INNOVATION: return "science_innovation";
        case Board::GROWTH_ENTERPRISE: return "growth_enterprise";
    }
    return "main";
}

std::string toString(ListingStatus status) {
    switch (status) {
        case ListingStatus::ACTIVE: return "active";
        case ListingStatus::SUSPENDED_UNKNOWN: return "suspended_unknown";
        case ListingStatus::DELISTED: return "delisted";
    }
    return "active";
}

std::string toString(DayStatus status) {
    switch (status) {
        case DayStatus::NORMAL: return "normal";
        case DayStatus::LIMIT_UP: return "limit_up";
        case DayStatus::LIMIT_DOWN: return "limit_down";
        case DayStatus::SUSPENDED: return "suspended";
        case DayStatus::DATA_MISSING: return "data_missing";
    }
    return "normal";
}

std::string toString(OrderSide side) {
    return side == OrderSide::BUY ? "buy" : "sell";
}

std::optional<Board> boardFromString(const std::string& value) {
    const std::string v = toLowerCopy(value);
    if (v == "main" || v == "main_board") return Board::MAIN;
    if (v == "science_innovation" || v == "star_market" || v == "star") return Board::SCIENCE_INNOVATION;
    if (v == "growth_enterprise" || v == "gem_board" || v == "gem") return Board::GROWTH_ENTERPRISE;
    return std::nullopt;
}

std::optional<ListingStatus> listingStatusFromString(const std::string& value) {
    const std::string v = toLowerCopy(value);
    if (v == "active") return ListingStatus::ACTIVE;
    if (v == "suspended_unknown" || v == "suspended") return ListingStatus::SUSPENDED_UNKNOWN;
    if (v == "delisted") return ListingStatus::DELISTED;
    return std::nullopt;
}

std::optional<DayStatus> dayStatusFromString(const std::string& value) {
    const std::string v = toLowerCopy(value);
    if (v == "normal") return DayStatus::NORMAL;
    if (v == "limit_up") return DayStatus::LIMIT_UP;
    if (v == "limit_down") return DayStatus::LIMIT_DOWN;
    if (v == "suspended") return DayStatus::SUSPENDED;
    if (v == "data_missing") return DayStatus::DATA_MISSING;
    return std::nullopt;
}

std::optional<OrderSide> orderSideFromString(const std::string& value) {
    const std::string v = toLowerCopy(value);
    if (v == "buy") return OrderSide::BUY;
    if (v == "sell") return OrderSide::SELL;
    return std::nullopt;
}

} // namespace astock
