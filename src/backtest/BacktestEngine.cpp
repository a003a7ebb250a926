#include "backtest/BacktestEngine.h"
#include "analytics/TechnicalIndicators.h"
#include "backtest/DataHistory.h"
#include "common/Logger.h"
#include "common/PriceMath.h"
#include "market/MarketView.h"
#include "market/PriceLimits.h"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace astock {
namespace backtest {

std::string toString(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::EXECUTED: return "executed";
        case OutcomeKind::REJECTED: return "rejected";
        case OutcomeKind::EXECUTION_FAILED: return "execution_failed";
    }
    return "executed";
}

std::string toString(ExecutionFailure failure) {
    switch (failure) {
        case ExecutionFailure::NONE: return "none";
        case ExecutionFailure::INSUFFICIENT_FUNDS: return "insufficient_funds";
        case ExecutionFailure::INSUFFICIENT_SELLABLE: return "insufficient_sellable";
        case ExecutionFailure::NO_PRICE: return "no_price";
    }
    return "none";
}

BacktestEngine::BacktestEngine(BacktestConfig config,
                               rules::TradingRules rules,
                               execution::CostConfig cost_config,
                               consensus::ConsensusConfig consensus_config)
    : config_(std::move(config))
    , rules_(rules)
    , bars_(clock_, rules.price_tick)
    , signals_(clock_)
    , validator_(rules)
    , cost_model_(cost_config)
    , scorer_(signals_, consensus_config)
    , ledger_(std::make_unique<portfolio::PortfolioLedger>(config_.initial_capital)) {

    if (config_.initial_capital <= 0.0) {
        throw std::invalid_argument("initial capital must be positive");
    }
    if (config_.start_date && config_.end_date && *config_.end_date < *config_.start_date) {
        throw std::invalid_argument("end date " + config_.end_date->toString() +
                                    " is before start date " + config_.start_date->toString());
    }
}

void BacktestEngine::loadData() {
    for (const auto& record : DataHistory::loadInstruments(config_.instruments_path)) {
        if (record.effective_from) {
            addInstrument(record.instrument, *record.effective_from);
        } else {
            addInstrument(record.instrument);
        }
    }
    for (const auto& bar : DataHistory::loadPriceBars(config_.price_bars_path)) {
        addPriceBar(bar);
    }
    for (const auto& signal : DataHistory::loadSignals(config_.signals_path)) {
        addSignal(signal);
    }

    LOG_INFO("Market data ready: {} instruments, {} bars, {} signals",
             instruments_.size(), bars_.size(), signals_.size());
}

void BacktestEngine::addInstrument(const Instrument& instrument) {
    instruments_.add(instrument);
}

void BacktestEngine::addInstrument(const Instrument& instrument, const Date& effective_from) {
    instruments_.add(instrument, effective_from);
}

void BacktestEngine::addPriceBar(const PriceBar& bar) {
    bars_.insert(bar);
}

void BacktestEngine::addSignal(const consensus::ConsensusSignal& signal) {
    signals_.insert(signal);
}

void BacktestEngine::setPolicy(std::shared_ptr<strategy::IDecisionPolicy> policy) {
    policy_ = std::move(policy);
}

std::vector<Date> BacktestEngine::tradingCalendar() const {
    const Date start = config_.start_date ? *config_.start_date : Date::fromYmd(1900, 1, 1);
    const Date end = config_.end_date ? *config_.end_date : Date::fromYmd(9999, 12, 31);
    return bars_.tradingDates(start, end);
}

std::vector<std::string> BacktestEngine::universe() const {
    if (config_.universe.empty()) {
        return bars_.symbols();
    }
    std::set<std::string> unique(config_.universe.begin(), config_.universe.end());
    return std::vector<std::string>(unique.begin(), unique.end());
}

BacktestEngine::Result BacktestEngine::run() {
    if (!policy_) {
        throw std::invalid_argument("BacktestEngine::run called without a decision policy");
    }

    // Fresh state for every run so that replays are identical
    clock_.reset();
    ledger_ = std::make_unique<portfolio::PortfolioLedger>(config_.initial_capital);
    score_history_.clear();
    equity_.clear();
    outcomes_.clear();
    previous_total_ = config_.initial_capital;
    result_ = Result{};
    policy_->reset();

    const auto calendar = tradingCalendar();
    LOG_INFO("Starting backtest: policy={} days={} capital={:.2f}",
             policy_->getInfo().name, calendar.size(), config_.initial_capital);

    try {
        for (const auto& date : calendar) {
            runDay(date);
        }
    } catch (const market::CausalityViolation& e) {
        collectResult();
        result_.valid = false;
        result_.failure_reason = e.what();
        if (clock_.started()) {
            result_.failed_on = clock_.now();
        }
        LOG_ERROR("Backtest aborted on {}: {}",
                  result_.failed_on ? result_.failed_on->toString() : std::string("(not started)"),
                  e.what());
        throw;
    }

    collectResult();

    const auto& m = result_.metrics;
    LOG_INFO("Backtest completed: final={:.2f} return={:.4f} mdd={:.4f} trades={}",
             m.final_value, m.total_return, m.max_drawdown, m.trade_count);
    return result_;
}

void BacktestEngine::collectResult() {
    result_.equity = equity_;
    result_.trades = ledger_->trades();
    result_.round_trips = ledger_->roundTrips();
    result_.outcomes = outcomes_;
    result_.scores = score_history_.all();
    result_.metrics = metrics::MetricsCalculator::compute(
        result_.equity, result_.trades, result_.round_trips,
        config_.initial_capital, config_.risk_free_rate);
}

void BacktestEngine::runDay(const Date& date) {
    // 1. Advance time
    clock_.advanceTo(date);

    // 2. Causal data for the universe plus anything still held
    const auto symbols = universe();
    std::vector<std::string> priced = symbols;
    for (const auto& held : ledger_->heldSymbols()) {
        if (std::find(priced.begin(), priced.end(), held) == priced.end()) {
            priced.push_back(held);
        }
    }
    auto day_bars = loadDayBars(date, priced);

    // 3. Scores
    auto scores = scoreDay(date, symbols);
    score_history_.record(scores);

    // 4. Policy
    ledger_->markToMarket(markPrices(day_bars));
    const auto snapshot = ledger_->snapshot(date, rules_);
    const market::MarketView view(clock_, instruments_, bars_, signals_);
    const auto orders = policy_->proposeOrders(date, snapshot, scores, view);

    // 5. Orders apply one at a time; later orders see earlier fills
    for (const auto& order : orders) {
        outcomes_.push_back(processOrder(order, date, day_bars));
    }

    // 6. Mark to market and record the day
    ledger_->markToMarket(markPrices(day_bars));

    EquityPoint point;
    point.date = date;
    point.cash = ledger_->cash();
    point.market_value = ledger_->marketValue();
    point.total_value = common::roundToTick(point.cash + point.market_value);
    point.daily_return = previous_total_ > 0.0 ? point.total_value / previous_total_ - 1.0 : 0.0;
    previous_total_ = point.total_value;
    equity_.push_back(point);

    LOG_DEBUG("{} cash={:.2f} holdings={:.2f} total={:.2f} orders={}",
              date.toString(), point.cash, point.market_value, point.total_value, orders.size());
}

Instrument BacktestEngine::instrumentFor(const std::string& symbol, const Date& date) const {
    auto instrument = instruments_.get(symbol, date);
    if (instrument) {
        return *instrument;
    }
    return market::InstrumentRegistry::makeInstrument(symbol, "");
}

std::map<std::string, PriceBar> BacktestEngine::loadDayBars(const Date& date,
                                                            const std::vector<std::string>& symbols) const {
    std::map<std::string, PriceBar> out;
    for (const auto& symbol : symbols) {
        auto bar = bars_.getOrCarryForward(symbol, date);
        if (!bar) {
            continue;
        }
        // A feed that left the status unresolved is classified here
        if (bar->status == DayStatus::NORMAL) {
            bar->status = market::PriceLimits::resolveStatus(*bar, instrumentFor(symbol, date), rules_);
            if (!bar->tradable()) {
                market::PriceBarStore::normalize(*bar, rules_.price_tick);
            }
        }
        out.emplace(symbol, *bar);
    }
    return out;
}

std::vector<consensus::ConsensusScore> BacktestEngine::scoreDay(const Date& date,
                                                                const std::vector<std::string>& symbols) const {
    std::vector<consensus::ConsensusSignal> day_signals;
    day_signals.reserve(symbols.size());

    const size_t lookback = static_cast<size_t>(
        std::max(config_.high_lookback, config_.ma_long_period));

    for (const auto& symbol : symbols) {
        auto signal = signals_.get(symbol, date);
        if (config_.derive_technical_from_bars && !signal.technical) {
            const auto history = bars_.history(symbol, date, lookback);
            if (!history.empty() && history.back().date == date) {
                signal.technical = analytics::TechnicalIndicators::deriveTechnicalSignal(
                    history, config_.ma_short_period, config_.ma_long_period, config_.high_lookback);
            }
        }
        day_signals.push_back(std::move(signal));
    }

    return scorer_.scoreSignals(day_signals);
}

OrderOutcome BacktestEngine::reject(OrderOutcome outcome, rules::RejectReason reason, const std::string& message) const {
    outcome.kind = OutcomeKind::REJECTED;
    outcome.reject_reason = reason;
    outcome.message = message;
    Logger::getInstance().logRejection(outcome.date, outcome.order, "rejected:" + rules::toString(reason), message);
    return outcome;
}

OrderOutcome BacktestEngine::fail(OrderOutcome outcome, ExecutionFailure failure, const std::string& message) const {
    outcome.kind = OutcomeKind::EXECUTION_FAILED;
    outcome.failure = failure;
    outcome.message = message;
    Logger::getInstance().logRejection(outcome.date, outcome.order, "failed:" + toString(failure), message);
    return outcome;
}

OrderOutcome BacktestEngine::processOrder(const Order& proposed,
                                          const Date& date,
                                          std::map<std::string, PriceBar>& day_bars) {
    OrderOutcome outcome;
    outcome.date = date;
    outcome.order = proposed;
    if (outcome.order.requested_date != date) {
        LOG_WARN("Order for {} requested {} executes on {}", proposed.symbol,
                 proposed.requested_date.toString(), date.toString());
        outcome.order.requested_date = date;
    }
    const Order& order = outcome.order;

    // Symbols outside the universe are priced on demand
    auto bar_it = day_bars.find(order.symbol);
    if (bar_it == day_bars.end()) {
        auto extra = loadDayBars(date, {order.symbol});
        if (extra.empty()) {
            PriceBar missing;
            missing.symbol = order.symbol;
            missing.date = date;
            missing.status = DayStatus::DATA_MISSING;
            extra.emplace(order.symbol, missing);
        }
        bar_it = day_bars.insert(*extra.begin()).first;
    }
    const PriceBar& bar = bar_it->second;

    // Rules
    const auto instrument = instrumentFor(order.symbol, date);
    const auto verdict = validator_.validate(order, instrument, bar, ledger_->lots(order.symbol), date);
    if (!verdict.accepted) {
        return reject(outcome, verdict.reason, verdict.message);
    }

    // Execution
    const Price price = fillPrice(bar);
    if (price <= 0.0) {
        return fail(outcome, ExecutionFailure::NO_PRICE, "no usable fill price");
    }

    const auto costs = cost_model_.priceOrder(order, price, market::InstrumentRegistry::venueOf(order.symbol));
    const Amount delta = cost_model_.netCashDelta(order, price, costs);

    if (order.side == OrderSide::BUY && -delta > ledger_->cash() + 1e-9) {
        return fail(outcome, ExecutionFailure::INSUFFICIENT_FUNDS,
                    "needs " + common::priceToString(-delta) + ", cash " + common::priceToString(ledger_->cash()));
    }
    if (order.side == OrderSide::SELL) {
        const Quantity sellable = ledger_->sellableQuantity(order.symbol, date, rules_);
        if (sellable < order.quantity) {
            return fail(outcome, ExecutionFailure::INSUFFICIENT_SELLABLE,
                        "sellable " + std::to_string(sellable) + " < " + std::to_string(order.quantity));
        }
    }

    Trade trade;
    trade.symbol = order.symbol;
    trade.side = order.side;
    trade.date = date;
    trade.quantity = order.quantity;
    trade.fill_price = price;
    trade.costs = costs;
    trade.net_cash_delta = delta;

    if (order.side == OrderSide::BUY) {
        ledger_->applyBuy(trade);
    } else {
        ledger_->applySell(trade, rules_);
    }

    Logger::getInstance().logTrade(trade);
    LOG_INFO("{} {} {} x{} @ {} costs={} cash={:.2f}", date.toString(), toString(order.side), order.symbol,
             order.quantity, common::priceToString(price), common::priceToString(costs.total_cost), ledger_->cash());

    outcome.kind = OutcomeKind::EXECUTED;
    outcome.trade = trade;
    return outcome;
}

// Fills at the close, the same price the day's limit status is resolved
// from and the latest price the policy has seen
Price BacktestEngine::fillPrice(const PriceBar& bar) {
    return bar.close;
}

std::map<std::string, Price> BacktestEngine::markPrices(const std::map<std::string, PriceBar>& day_bars) const {
    std::map<std::string, Price> prices;
    for (const auto& [symbol, bar] : day_bars) {
        // Suspended and data-missing bars already carry prev_close
        prices[symbol] = bar.close;
    }
    return prices;
}

} // namespace backtest
} // namespace astock
