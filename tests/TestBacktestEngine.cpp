#include "backtest/BacktestEngine.h"
#include "backtest/ResultStore.h"
#include "strategy/ConsensusRotationPolicy.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <stdexcept>

using namespace astock;
using backtest::BacktestConfig;
using backtest::BacktestEngine;
using backtest::OutcomeKind;

namespace {
bool near(double a, double b) {
    return std::abs(a - b) < 1e-6;
}

// Replays a fixed order list per date
class ScriptedPolicy : public strategy::IDecisionPolicy {
public:
    explicit ScriptedPolicy(std::map<Date, std::vector<Order>> script) : script_(std::move(script)) {}

    strategy::PolicyInfo getInfo() const override {
        return strategy::PolicyInfo{"scripted", "fixed orders"};
    }

    std::vector<Order> proposeOrders(const Date& current_date,
                                     const portfolio::PortfolioSnapshot& snapshot,
                                     const std::vector<consensus::ConsensusScore>&,
                                     const market::MarketView&) override {
        snapshots_.push_back(snapshot);
        auto it = script_.find(current_date);
        return it == script_.end() ? std::vector<Order>{} : it->second;
    }

    const std::vector<portfolio::PortfolioSnapshot>& snapshots() const { return snapshots_; }

private:
    std::map<Date, std::vector<Order>> script_;
    std::vector<portfolio::PortfolioSnapshot> snapshots_;
};

// Peeks at tomorrow's bar on its second day
class PeekingPolicy : public strategy::IDecisionPolicy {
public:
    strategy::PolicyInfo getInfo() const override {
        return strategy::PolicyInfo{"peeking", "reads future bars"};
    }

    std::vector<Order> proposeOrders(const Date& current_date,
                                     const portfolio::PortfolioSnapshot&,
                                     const std::vector<consensus::ConsensusScore>&,
                                     const market::MarketView& view) override {
        if (++calls_ == 2) {
            view.priceBar("000001.SZ", current_date.addDays(1));
        }
        return {};
    }

    void reset() override { calls_ = 0; }

private:
    int calls_ = 0;
};

PriceBar makeBar(const std::string& symbol, const Date& date, Price prev_close, Price close) {
    PriceBar bar;
    bar.symbol = symbol;
    bar.date = date;
    bar.prev_close = prev_close;
    bar.open = close;
    bar.high = close;
    bar.low = close;
    bar.close = close;
    bar.volume = 100000.0;
    bar.amount = close * bar.volume;
    return bar;
}

Order makeOrder(const std::string& symbol, OrderSide side, Quantity qty, const Date& date) {
    Order order;
    order.symbol = symbol;
    order.side = side;
    order.quantity = qty;
    order.requested_date = date;
    return order;
}

const Date kDay1 = Date::fromYmd(2024, 1, 2);
const Date kDay2 = Date::fromYmd(2024, 1, 3);
const Date kDay3 = Date::fromYmd(2024, 1, 4);

void addBasicHistory(BacktestEngine& engine) {
    engine.addInstrument(market::InstrumentRegistry::makeInstrument("000001.SZ", "Ping An Bank"));
    engine.addPriceBar(makeBar("000001.SZ", kDay1, 100.0, 101.0));
    engine.addPriceBar(makeBar("000001.SZ", kDay2, 101.0, 105.0));
}
}

int main() {
    std::cout << "[TEST] Starting BacktestEngine Test..." << std::endl;

    // 1. Buy, same-day sell blocked by T+1, next-day sell with exact cash
    {
        BacktestConfig config;
        config.initial_capital = 1000000.0;
        BacktestEngine engine(config);
        addBasicHistory(engine);

        std::map<Date, std::vector<Order>> script;
        script[kDay1] = {makeOrder("000001.SZ", OrderSide::BUY, 100, kDay1),
                         makeOrder("000001.SZ", OrderSide::SELL, 100, kDay1)};
        script[kDay2] = {makeOrder("000001.SZ", OrderSide::SELL, 100, kDay2)};
        auto policy = std::make_shared<ScriptedPolicy>(script);
        engine.setPolicy(policy);

        const auto result = engine.run();
        assert(result.valid);
        assert(result.equity.size() == 2);
        assert(result.outcomes.size() == 3);

        assert(result.outcomes[0].kind == OutcomeKind::EXECUTED);
        assert(result.outcomes[0].trade.has_value());
        assert(near(result.outcomes[0].trade->costs.total_cost, 15.10));
        assert(result.outcomes[1].kind == OutcomeKind::REJECTED);
        assert(result.outcomes[1].reject_reason == rules::RejectReason::SETTLEMENT);
        assert(result.outcomes[2].kind == OutcomeKind::EXECUTED);
        assert(near(result.outcomes[2].trade->costs.total_cost, 20.75));
        assert(near(result.outcomes[2].trade->net_cash_delta, 10479.25));

        assert(near(result.equity[0].cash, 989884.90));
        assert(near(result.equity[0].market_value, 10100.0));
        assert(near(result.equity[0].total_value, 999984.90));
        if (!near(result.equity[1].cash, 1000364.15)) {
            std::cerr << "[TEST] unexpected final cash " << result.equity[1].cash << "\n";
            return 1;
        }
        assert(near(result.equity[1].market_value, 0.0));

        assert(result.trades.size() == 2);
        assert(result.round_trips.size() == 1);
        assert(near(result.round_trips[0].pnl, 364.15));
        assert(result.metrics.win_rate && near(*result.metrics.win_rate, 1.0));
        assert(!result.metrics.profit_factor.has_value());
        assert(near(result.metrics.total_costs, 35.85));

        // The policy saw the portfolio before each day's orders
        assert(policy->snapshots().size() == 2);
        assert(policy->snapshots()[0].positions.empty());
        assert(policy->snapshots()[1].position("000001.SZ") != nullptr);
        assert(policy->snapshots()[1].position("000001.SZ")->sellable == 100);

        // Scores recorded for every universe member every day
        assert(engine.scoreHistory().size() == 2);
        assert(engine.scoreHistory().get("000001.SZ", kDay2).has_value());

        // Replays are identical
        const auto again = engine.run();
        assert(again.equity.size() == result.equity.size());
        for (size_t i = 0; i < again.equity.size(); ++i) {
            assert(again.equity[i].total_value == result.equity[i].total_value);
            assert(again.equity[i].cash == result.equity[i].cash);
        }
        assert(again.trades.size() == result.trades.size());
        for (size_t i = 0; i < again.trades.size(); ++i) {
            assert(again.trades[i].net_cash_delta == result.trades[i].net_cash_delta);
        }

        // Results on disk
        const auto out_dir = std::filesystem::temp_directory_path() / "astock_test_results";
        std::filesystem::remove_all(out_dir);
        backtest::ResultStore store(out_dir);
        assert(store.write(result, policy->getInfo().name));
        assert(std::filesystem::exists(out_dir / "equity.jsonl"));
        assert(std::filesystem::exists(out_dir / "trades.jsonl"));
        assert(std::filesystem::exists(out_dir / "scores.jsonl"));
        std::ifstream summary_file(out_dir / "summary.json");
        const auto summary = nlohmann::json::parse(summary_file);
        assert(summary["valid"].get<bool>());
        assert(summary["policy"] == "scripted");
        assert(summary["outcome_counts"]["settlement"].get<int>() == 1);
        assert(summary["outcome_counts"]["executed"].get<int>() == 2);
        assert(summary["sharpe_ratio"].is_number());
        assert(summary["profit_factor"].is_null());
        std::filesystem::remove_all(out_dir);
    }

    // 2. Limit-up on the science-innovation board blocks the buy
    {
        BacktestEngine engine(BacktestConfig{});
        engine.addInstrument(market::InstrumentRegistry::makeInstrument("688981.SH", "SMIC"));
        engine.addPriceBar(makeBar("688981.SH", kDay1, 50.0, 60.0));

        std::map<Date, std::vector<Order>> script;
        script[kDay1] = {makeOrder("688981.SH", OrderSide::BUY, 100, kDay1)};
        engine.setPolicy(std::make_shared<ScriptedPolicy>(script));

        const auto result = engine.run();
        assert(result.outcomes.size() == 1);
        assert(result.outcomes[0].kind == OutcomeKind::REJECTED);
        assert(result.outcomes[0].reject_reason == rules::RejectReason::LIMIT_BAND);
        assert(result.trades.empty());
        assert(near(result.equity[0].total_value, 1000000.0));
    }

    // 2b. Opening at the limit but closing inside the band fills at the close
    {
        BacktestEngine engine(BacktestConfig{});
        engine.addInstrument(market::InstrumentRegistry::makeInstrument("688981.SH", "SMIC"));
        PriceBar bar = makeBar("688981.SH", kDay1, 50.0, 55.0);
        bar.open = 60.0;
        bar.high = 60.0;
        engine.addPriceBar(bar);

        std::map<Date, std::vector<Order>> script;
        script[kDay1] = {makeOrder("688981.SH", OrderSide::BUY, 100, kDay1)};
        engine.setPolicy(std::make_shared<ScriptedPolicy>(script));

        const auto result = engine.run();
        assert(result.outcomes.size() == 1);
        assert(result.outcomes[0].kind == OutcomeKind::EXECUTED);
        assert(result.trades.size() == 1);
        if (!near(result.trades[0].fill_price, 55.0)) {
            std::cerr << "[TEST] filled at " << result.trades[0].fill_price << " instead of the close\n";
            return 1;
        }
    }

    // 3. Too little cash is an execution failure, not a rule rejection
    {
        BacktestConfig config;
        config.initial_capital = 10000.0;
        BacktestEngine engine(config);
        addBasicHistory(engine);

        std::map<Date, std::vector<Order>> script;
        script[kDay1] = {makeOrder("000001.SZ", OrderSide::BUY, 100, kDay1),
                         makeOrder("000001.SZ", OrderSide::BUY, 150, kDay1)};
        engine.setPolicy(std::make_shared<ScriptedPolicy>(script));

        const auto result = engine.run();
        assert(result.outcomes.size() == 2);
        assert(result.outcomes[0].kind == OutcomeKind::EXECUTION_FAILED);
        assert(result.outcomes[0].failure == backtest::ExecutionFailure::INSUFFICIENT_FUNDS);
        assert(result.outcomes[1].kind == OutcomeKind::REJECTED);
        assert(result.outcomes[1].reject_reason == rules::RejectReason::LOT_SIZE);
        assert(near(result.equity.back().cash, 10000.0));
    }

    // 4. A suspended holding stays valued at the previous close and cannot be sold
    {
        BacktestEngine engine(BacktestConfig{});
        addBasicHistory(engine);
        PriceBar halted = makeBar("000001.SZ", kDay3, 105.0, 0.0);
        halted.status = DayStatus::SUSPENDED;
        halted.suspension_reason = std::string("pending announcement");
        engine.addPriceBar(halted);

        std::map<Date, std::vector<Order>> script;
        script[kDay1] = {makeOrder("000001.SZ", OrderSide::BUY, 100, kDay1)};
        script[kDay3] = {makeOrder("000001.SZ", OrderSide::SELL, 100, kDay3)};
        engine.setPolicy(std::make_shared<ScriptedPolicy>(script));

        const auto result = engine.run();
        assert(result.equity.size() == 3);
        assert(near(result.equity[2].market_value, 10500.0));
        assert(result.outcomes.back().kind == OutcomeKind::REJECTED);
        assert(result.outcomes.back().reject_reason == rules::RejectReason::SUSPENDED);
        assert(engine.ledger().quantity("000001.SZ") == 100);
    }

    // 5. Reading a future bar aborts the run and keeps the partial result
    {
        BacktestEngine engine(BacktestConfig{});
        addBasicHistory(engine);
        engine.setPolicy(std::make_shared<PeekingPolicy>());

        bool thrown = false;
        try {
            engine.run();
        } catch (const market::CausalityViolation& e) {
            thrown = true;
            assert(e.requested() == Date::fromYmd(2024, 1, 4));
        }
        if (!thrown) {
            std::cerr << "[TEST] look-ahead was not detected\n";
            return 1;
        }
        const auto& partial = engine.getResult();
        assert(!partial.valid);
        assert(!partial.failure_reason.empty());
        assert(partial.failed_on && *partial.failed_on == kDay2);
        assert(partial.equity.size() == 1);
    }

    // 6. Misconfiguration
    {
        bool thrown = false;
        try {
            BacktestConfig config;
            config.initial_capital = 0.0;
            BacktestEngine engine(config);
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);

        thrown = false;
        try {
            BacktestConfig config;
            config.start_date = kDay2;
            config.end_date = kDay1;
            BacktestEngine engine(config);
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);

        thrown = false;
        BacktestEngine engine(BacktestConfig{});
        try {
            engine.run();
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);
    }

    // 7. Date range limits the calendar
    {
        BacktestConfig config;
        config.start_date = kDay2;
        BacktestEngine engine(config);
        addBasicHistory(engine);
        engine.setPolicy(std::make_shared<ScriptedPolicy>(std::map<Date, std::vector<Order>>{}));
        const auto result = engine.run();
        assert(result.equity.size() == 1);
        assert(result.equity[0].date == kDay2);
        assert(near(result.equity[0].daily_return, 0.0));
    }

    // 8. Rotation policy buys the well-scored name in whole lots
    {
        BacktestConfig config;
        config.derive_technical_from_bars = false;
        BacktestEngine engine(config);
        addBasicHistory(engine);

        consensus::ConsensusSignal signal;
        signal.symbol = "000001.SZ";
        signal.date = kDay1;
        consensus::CapitalFlowSignal flow;
        flow.northbound_net_inflow = 5.0e7;
        flow.margin_net_buy = 2.0e7;
        signal.capital_flow = flow;
        consensus::LogicSignal logic;
        logic.analyst_buy_count = 8;
        logic.sector_heat_rank = 1;
        signal.logic = logic;
        signal.sentiment = consensus::SentimentSignal{15000.0};
        engine.addSignal(signal);

        engine.setPolicy(std::make_shared<strategy::ConsensusRotationPolicy>());
        const auto result = engine.run();

        assert(!result.trades.empty());
        const auto& buy = result.trades.front();
        assert(buy.symbol == "000001.SZ");
        assert(buy.side == OrderSide::BUY);
        assert(buy.date == kDay1);
        assert(buy.quantity == 1900);

        const auto score = engine.scoreHistory().get("000001.SZ", kDay1);
        assert(score && score->total == 80);
        assert(near(score->completeness, 0.75));

        // Signals vanish on day 2, the score drops to zero and the settled lot is sold
        assert(result.trades.size() == 2);
        assert(result.trades[1].side == OrderSide::SELL);
        assert(result.trades[1].date == kDay2);
    }

    std::cout << "[TEST] BacktestEngine Test PASSED!" << std::endl;
    return 0;
}
