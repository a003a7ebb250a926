#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "backtest/BacktestConfig.h"
#include "common/Types.h"
#include "consensus/ConsensusScorer.h"
#include "consensus/ScoreHistory.h"
#include "execution/CostModel.h"
#include "market/InstrumentRegistry.h"
#include "market/PriceBarStore.h"
#include "market/SignalStore.h"
#include "market/SimulationClock.h"
#include "metrics/MetricsCalculator.h"
#include "portfolio/PortfolioLedger.h"
#include "rules/TradeValidator.h"
#include "strategy/IDecisionPolicy.h"

namespace astock {
namespace backtest {

enum class OutcomeKind { EXECUTED, REJECTED, EXECUTION_FAILED };

enum class ExecutionFailure {
    NONE,
    INSUFFICIENT_FUNDS,
    INSUFFICIENT_SELLABLE,
    NO_PRICE
};

std::string toString(OutcomeKind kind);
std::string toString(ExecutionFailure failure);

// What happened to one proposed order
struct OrderOutcome {
    Date date;
    Order order;
    OutcomeKind kind = OutcomeKind::EXECUTED;
    rules::RejectReason reject_reason = rules::RejectReason::NONE;
    ExecutionFailure failure = ExecutionFailure::NONE;
    std::string message;
    std::optional<Trade> trade;
};

// Day-by-day replay of historical A-share data against a decision policy.
//
// Per day: advance clock -> load causal bars and signals -> score the
// universe -> ask the policy once -> validate and execute each order in
// sequence -> mark to market -> emit an equity point.
class BacktestEngine {
public:
    struct Result {
        std::vector<EquityPoint> equity;
        std::vector<Trade> trades;
        std::vector<portfolio::RoundTrip> round_trips;
        std::vector<OrderOutcome> outcomes;
        std::vector<consensus::ConsensusScore> scores;
        metrics::PerformanceMetrics metrics;
        bool valid = true;
        std::string failure_reason;
        std::optional<Date> failed_on;
    };

    // Throws std::invalid_argument on a non-positive capital or an end date
    // before the start date
    BacktestEngine(BacktestConfig config,
                   rules::TradingRules rules = rules::TradingRules::aShare(),
                   execution::CostConfig cost_config = execution::CostConfig{},
                   consensus::ConsensusConfig consensus_config = consensus::ConsensusConfig{});

    BacktestEngine(const BacktestEngine&) = delete;
    BacktestEngine& operator=(const BacktestEngine&) = delete;

    // Reads the configured instrument, price-bar and signal files
    void loadData();

    void addInstrument(const Instrument& instrument);
    void addInstrument(const Instrument& instrument, const Date& effective_from);
    void addPriceBar(const PriceBar& bar);
    void addSignal(const consensus::ConsensusSignal& signal);

    void setPolicy(std::shared_ptr<strategy::IDecisionPolicy> policy);

    // Replays every trading day in range from a fresh ledger. On a
    // causality violation the partial result is kept (valid = false,
    // see getResult()) and the exception is rethrown.
    Result run();

    const Result& getResult() const { return result_; }

    const market::SimulationClock& clock() const { return clock_; }
    const market::InstrumentRegistry& instruments() const { return instruments_; }
    const market::PriceBarStore& priceBars() const { return bars_; }
    const market::SignalStore& signals() const { return signals_; }
    const portfolio::PortfolioLedger& ledger() const { return *ledger_; }
    const consensus::ScoreHistory& scoreHistory() const { return score_history_; }
    const BacktestConfig& config() const { return config_; }

private:
    std::vector<Date> tradingCalendar() const;
    std::vector<std::string> universe() const;

    void runDay(const Date& date);

    Instrument instrumentFor(const std::string& symbol, const Date& date) const;
    std::map<std::string, PriceBar> loadDayBars(const Date& date, const std::vector<std::string>& symbols) const;
    std::vector<consensus::ConsensusScore> scoreDay(const Date& date, const std::vector<std::string>& symbols) const;

    OrderOutcome processOrder(const Order& proposed, const Date& date, std::map<std::string, PriceBar>& day_bars);
    OrderOutcome reject(OrderOutcome outcome, rules::RejectReason reason, const std::string& message) const;
    OrderOutcome fail(OrderOutcome outcome, ExecutionFailure failure, const std::string& message) const;

    static Price fillPrice(const PriceBar& bar);
    std::map<std::string, Price> markPrices(const std::map<std::string, PriceBar>& day_bars) const;
    void collectResult();

    BacktestConfig config_;
    rules::TradingRules rules_;

    market::SimulationClock clock_;
    market::InstrumentRegistry instruments_;
    market::PriceBarStore bars_;
    market::SignalStore signals_;

    rules::TradeValidator validator_;
    execution::CostModel cost_model_;
    consensus::ConsensusScorer scorer_;

    std::shared_ptr<strategy::IDecisionPolicy> policy_;
    std::unique_ptr<portfolio::PortfolioLedger> ledger_;
    consensus::ScoreHistory score_history_;

    std::vector<EquityPoint> equity_;
    std::vector<OrderOutcome> outcomes_;
    Amount previous_total_ = 0.0;
    Result result_;
};

} // namespace backtest
} // namespace astock
