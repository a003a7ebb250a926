#include "consensus/ConsensusScorer.h"
#include "consensus/ScoreHistory.h"
#include "analytics/TechnicalIndicators.h"
#include "market/SignalStore.h"
#include "market/SimulationClock.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace astock;
using namespace astock::consensus;

namespace {
const Date kDay = Date::fromYmd(2024, 6, 3);

ConsensusSignal fullSignal(const std::string& symbol) {
    ConsensusSignal s;
    s.symbol = symbol;
    s.date = kDay;
    s.technical = TechnicalSignal{99.0, 100.0, 10.5, 10.0};
    CapitalFlowSignal flow;
    flow.northbound_net_inflow = 2.0e7;
    flow.margin_net_buy = 1.5e7;
    s.capital_flow = flow;
    LogicSignal logic;
    logic.analyst_buy_count = 6;
    logic.sector_heat_rank = 1;
    s.logic = logic;
    s.sentiment = SentimentSignal{12000.0};
    return s;
}
}

int main() {
    market::SimulationClock clock;
    market::SignalStore store(clock);
    ConsensusScorer scorer(store);

    // All four families absent: zero, never an error
    ConsensusSignal empty;
    empty.symbol = "000001.SZ";
    empty.date = kDay;
    auto zero = scorer.scoreSignal(empty);
    if (zero.total != 0 || zero.completeness != 0.0 || zero.missing.size() != 4) {
        std::cerr << "[TEST] all-absent signal: total=" << zero.total << " completeness=" << zero.completeness << "\n";
        return 1;
    }

    auto full = scorer.scoreSignal(fullSignal("600000.SH"));
    assert(full.technical == 20 && full.capital_flow == 30 && full.logic == 30 && full.sentiment == 20);
    assert(full.total == 100);
    assert(full.completeness == 1.0);
    assert(full.missing.empty());

    // Technical: near-high is inclusive, golden cross is strict
    ConsensusSignal tech = empty;
    tech.technical = TechnicalSignal{95.0, 100.0, 10.0, 10.0};
    assert(scorer.scoreSignal(tech).technical == 10);
    tech.technical = TechnicalSignal{94.99, 100.0, 10.1, 10.0};
    assert(scorer.scoreSignal(tech).technical == 10);
    tech.technical = TechnicalSignal{94.99, 100.0, 9.9, 10.0};
    auto tech_zero = scorer.scoreSignal(tech);
    assert(tech_zero.technical == 0);
    // Present with zero points still counts toward completeness
    assert(std::abs(tech_zero.completeness - 0.25) < 1e-12);

    // Capital flow halves are independent; thresholds are strict
    ConsensusSignal flow = empty;
    CapitalFlowSignal half;
    half.margin_net_buy = 2.0e7;
    flow.capital_flow = half;
    auto flow_score = scorer.scoreSignal(flow);
    assert(flow_score.capital_flow == 15);
    assert(flow_score.missing.size() == 3);
    half.northbound_net_inflow = 1.0e7;
    flow.capital_flow = half;
    assert(scorer.scoreSignal(flow).capital_flow == 15);

    // Logic: count threshold inclusive, rank window [1, top-N]
    ConsensusSignal logic = empty;
    LogicSignal l;
    l.analyst_buy_count = 5;
    l.sector_heat_rank = 10;
    logic.logic = l;
    assert(scorer.scoreSignal(logic).logic == 30);
    l.analyst_buy_count = 4;
    l.sector_heat_rank = 11;
    logic.logic = l;
    assert(scorer.scoreSignal(logic).logic == 0);
    l.sector_heat_rank = 0;
    logic.logic = l;
    assert(scorer.scoreSignal(logic).logic == 0);

    // Sentiment steps
    ConsensusSignal senti = empty;
    senti.sentiment = SentimentSignal{3000.0};
    assert(scorer.scoreSignal(senti).sentiment == 0);
    senti.sentiment = SentimentSignal{3001.0};
    assert(scorer.scoreSignal(senti).sentiment == 10);
    senti.sentiment = SentimentSignal{10000.0};
    assert(scorer.scoreSignal(senti).sentiment == 10);
    senti.sentiment = SentimentSignal{10000.5};
    assert(scorer.scoreSignal(senti).sentiment == 20);

    // Store-backed scoring and ranking
    auto strong = fullSignal("600519.SH");
    auto tied = fullSignal("000858.SZ");
    auto weak = fullSignal("601318.SH");
    weak.capital_flow.reset();
    weak.logic.reset();   // 40 points, completeness 0.5
    store.insert(strong);
    store.insert(tied);
    store.insert(weak);

    clock.advanceTo(kDay);
    const std::vector<std::string> universe{"601318.SH", "600519.SH", "000858.SZ", "300999.SZ"};

    auto all = scorer.scoreUniverse(universe, kDay);
    assert(all.size() == 4);
    assert(all[0].symbol == "000858.SZ" && all[1].symbol == "300999.SZ");
    assert(all[1].total == 0 && all[1].completeness == 0.0);

    auto ranked = scorer.filter(universe, kDay, 30, 0.5);
    assert(ranked.size() == 3);
    assert(ranked[0].symbol == "000858.SZ");   // tie on 100 broken by symbol
    assert(ranked[1].symbol == "600519.SH");
    assert(ranked[2].symbol == "601318.SH" && ranked[2].total == 40);

    assert(scorer.filter(universe, kDay, 0, 0.75).size() == 2);

    // Parallel fan-out returns the same ordered result
    ConsensusConfig parallel_config;
    parallel_config.worker_threads = 3;
    ConsensusScorer parallel(store, parallel_config);
    auto par = parallel.scoreUniverse(universe, kDay);
    assert(par.size() == all.size());
    for (size_t i = 0; i < par.size(); ++i) {
        assert(par[i].symbol == all[i].symbol);
        assert(par[i].total == all[i].total);
    }

    // Future dates are refused through the store
    bool refused = false;
    try {
        scorer.score("600519.SH", kDay.addDays(1));
    } catch (const market::CausalityViolation&) {
        refused = true;
    }
    assert(refused);

    // History keeps one entry per (date, symbol)
    ScoreHistory history;
    history.record(all);
    history.record(all);
    assert(history.size() == 4);
    assert(history.get("600519.SH", kDay)->total == 100);
    assert(!history.get("600519.SH", kDay.addDays(1)).has_value());
    assert(history.onDate(kDay).size() == 4);

    // Technical family derived from trailing bars
    std::vector<PriceBar> bars;
    for (int i = 0; i < 20; ++i) {
        PriceBar b;
        b.symbol = "600519.SH";
        b.date = kDay.addDays(i - 19);
        b.close = 10.0 + i;
        b.open = b.low = b.close;
        b.high = b.close + 0.5;
        b.volume = 1000.0;
        bars.push_back(b);
    }
    auto derived = analytics::TechnicalIndicators::deriveTechnicalSignal(bars, 5, 20, 250);
    assert(derived.has_value());
    assert(std::abs(derived->ma_short - 27.0) < 1e-9);
    assert(std::abs(derived->ma_long - 19.5) < 1e-9);
    assert(std::abs(derived->high_52w - 29.5) < 1e-9);
    assert(std::abs(derived->close - 29.0) < 1e-9);

    std::vector<PriceBar> short_history(bars.begin() + 5, bars.end());
    assert(!analytics::TechnicalIndicators::deriveTechnicalSignal(short_history, 5, 20, 250).has_value());

    std::cout << "[TEST] ConsensusScorer PASSED\n";
    return 0;
}
