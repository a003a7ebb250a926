#include "portfolio/PortfolioLedger.h"
#include "common/PriceMath.h"

#include <algorithm>
#include <stdexcept>

namespace astock {
namespace portfolio {

const PositionView* PortfolioSnapshot::position(const std::string& symbol) const {
    for (const auto& p : positions) {
        if (p.symbol == symbol) {
            return &p;
        }
    }
    return nullptr;
}

PortfolioLedger::PortfolioLedger(Amount initial_cash)
    : initial_cash_(initial_cash)
    , cash_(initial_cash) {
}

std::vector<Lot> PortfolioLedger::lots(const std::string& symbol) const {
    auto it = lots_.find(symbol);
    if (it == lots_.end()) {
        return {};
    }
    return it->second;
}

std::vector<std::string> PortfolioLedger::heldSymbols() const {
    std::vector<std::string> out;
    for (const auto& [symbol, held] : lots_) {
        if (!held.empty()) {
            out.push_back(symbol);
        }
    }
    return out;
}

Quantity PortfolioLedger::quantity(const std::string& symbol) const {
    Quantity total = 0;
    auto it = lots_.find(symbol);
    if (it != lots_.end()) {
        for (const auto& lot : it->second) {
            total += lot.quantity;
        }
    }
    return total;
}

Quantity PortfolioLedger::sellableQuantity(const std::string& symbol,
                                           const Date& date,
                                           const rules::TradingRules& rules) const {
    Quantity total = 0;
    auto it = lots_.find(symbol);
    if (it != lots_.end()) {
        for (const auto& lot : it->second) {
            if (rules.isSettled(lot.acquisition_date, date)) {
                total += lot.quantity;
            }
        }
    }
    return total;
}

void PortfolioLedger::applyBuy(const Trade& trade) {
    if (trade.side != OrderSide::BUY || trade.quantity <= 0) {
        throw std::invalid_argument("applyBuy: not a positive buy for " + trade.symbol);
    }
    const Amount required = -trade.net_cash_delta;
    if (required > cash_ + 1e-9) {
        throw std::invalid_argument("applyBuy: insufficient cash for " + trade.symbol);
    }

    Lot lot;
    lot.symbol = trade.symbol;
    lot.quantity = trade.quantity;
    lot.acquisition_date = trade.date;
    lot.cost_per_share = required / static_cast<double>(trade.quantity);

    lots_[trade.symbol].push_back(lot);
    cash_ = common::roundToTick(cash_ + trade.net_cash_delta);
    if (marks_.find(trade.symbol) == marks_.end()) {
        marks_[trade.symbol] = trade.fill_price;
    }
    trades_.push_back(trade);
}

RoundTrip PortfolioLedger::applySell(const Trade& trade, const rules::TradingRules& rules) {
    if (trade.side != OrderSide::SELL || trade.quantity <= 0) {
        throw std::invalid_argument("applySell: not a positive sell for " + trade.symbol);
    }
    if (sellableQuantity(trade.symbol, trade.date, rules) < trade.quantity) {
        throw std::invalid_argument("applySell: insufficient settled shares for " + trade.symbol);
    }

    auto& held = lots_[trade.symbol];

    RoundTrip rt;
    rt.symbol = trade.symbol;
    rt.exit_date = trade.date;
    rt.quantity = trade.quantity;
    rt.proceeds = trade.net_cash_delta;
    rt.entry_date = held.front().acquisition_date;

    // Settled lots form a prefix of the date-ordered queue
    Quantity remaining = trade.quantity;
    auto it = held.begin();
    while (remaining > 0 && it != held.end()) {
        const Quantity take = std::min(remaining, it->quantity);
        rt.cost_basis += static_cast<double>(take) * it->cost_per_share;
        it->quantity -= take;
        remaining -= take;
        if (it->quantity == 0) {
            it = held.erase(it);
        } else {
            ++it;
        }
    }
    if (held.empty()) {
        lots_.erase(trade.symbol);
    }

    rt.cost_basis = common::roundToTick(rt.cost_basis);
    rt.pnl = common::roundToTick(rt.proceeds - rt.cost_basis);

    cash_ = common::roundToTick(cash_ + trade.net_cash_delta);
    trades_.push_back(trade);
    round_trips_.push_back(rt);
    return rt;
}

Amount PortfolioLedger::markToMarket(const std::map<std::string, Price>& prices) {
    for (const auto& [symbol, price] : prices) {
        if (price > 0.0) {
            marks_[symbol] = price;
        }
    }
    return marketValue();
}

Price PortfolioLedger::markPrice(const std::string& symbol) const {
    auto it = marks_.find(symbol);
    if (it != marks_.end()) {
        return it->second;
    }
    auto lot_it = lots_.find(symbol);
    if (lot_it != lots_.end() && !lot_it->second.empty()) {
        return lot_it->second.front().cost_per_share;
    }
    return 0.0;
}

Amount PortfolioLedger::marketValue() const {
    Amount total = 0.0;
    for (const auto& [symbol, held] : lots_) {
        Quantity qty = 0;
        for (const auto& lot : held) {
            qty += lot.quantity;
        }
        total += static_cast<double>(qty) * markPrice(symbol);
    }
    return common::roundToTick(total);
}

PortfolioSnapshot PortfolioLedger::snapshot(const Date& date, const rules::TradingRules& rules) const {
    PortfolioSnapshot snap;
    snap.date = date;
    snap.cash = cash_;

    for (const auto& [symbol, held] : lots_) {
        if (held.empty()) {
            continue;
        }
        PositionView view;
        view.symbol = symbol;
        view.first_acquired = held.front().acquisition_date;

        Amount cost = 0.0;
        for (const auto& lot : held) {
            view.quantity += lot.quantity;
            cost += static_cast<double>(lot.quantity) * lot.cost_per_share;
            if (rules.isSettled(lot.acquisition_date, date)) {
                view.sellable += lot.quantity;
            }
        }
        view.avg_cost = view.quantity > 0 ? cost / static_cast<double>(view.quantity) : 0.0;
        view.mark_price = markPrice(symbol);
        view.market_value = common::roundToTick(static_cast<double>(view.quantity) * view.mark_price);
        snap.market_value += view.market_value;
        snap.positions.push_back(view);
    }

    snap.market_value = common::roundToTick(snap.market_value);
    snap.total_value = common::roundToTick(snap.cash + snap.market_value);
    return snap;
}

} // namespace portfolio
} // namespace astock
