#include "consensus/ConsensusScorer.h"
#include "common/ParallelFor.h"

#include <algorithm>
#include <thread>

namespace astock {
namespace consensus {

namespace {
bool byTotalThenSymbol(const ConsensusScore& a, const ConsensusScore& b) {
    if (a.total != b.total) {
        return a.total > b.total;
    }
    return a.symbol < b.symbol;
}

bool bySymbol(const ConsensusScore& a, const ConsensusScore& b) {
    return a.symbol < b.symbol;
}
}

ConsensusScore ConsensusScorer::score(const std::string& symbol, const Date& date) const {
    return scoreSignal(signals_.get(symbol, date));
}

ConsensusScore ConsensusScorer::scoreSignal(const ConsensusSignal& signal) const {
    ConsensusScore out;
    out.symbol = signal.symbol;
    out.date = signal.date;

    if (signal.hasFamily(Family::TECHNICAL)) {
        out.technical = technicalScore(*signal.technical);
    } else {
        out.missing.push_back(Family::TECHNICAL);
    }

    if (signal.hasFamily(Family::CAPITAL_FLOW)) {
        out.capital_flow = capitalFlowScore(*signal.capital_flow);
    } else {
        out.missing.push_back(Family::CAPITAL_FLOW);
    }

    if (signal.hasFamily(Family::LOGIC)) {
        out.logic = logicScore(*signal.logic);
    } else {
        out.missing.push_back(Family::LOGIC);
    }

    if (signal.hasFamily(Family::SENTIMENT)) {
        out.sentiment = sentimentScore(*signal.sentiment);
    } else {
        out.missing.push_back(Family::SENTIMENT);
    }

    out.total = out.technical + out.capital_flow + out.logic + out.sentiment;
    out.completeness = 1.0 - static_cast<double>(out.missing.size()) / static_cast<double>(kFamilyCount);
    return out;
}

int ConsensusScorer::technicalScore(const TechnicalSignal& t) const {
    int points = 0;
    if (t.high_52w > 0.0 && t.close >= t.high_52w * (1.0 - config_.near_high_ratio)) {
        points += 10;
    }
    if (t.ma_short > t.ma_long) {
        points += 10;
    }
    return std::min(points, kTechnicalMax);
}

int ConsensusScorer::capitalFlowScore(const CapitalFlowSignal& c) const {
    int points = 0;
    if (c.northbound_net_inflow && *c.northbound_net_inflow > config_.northbound_threshold) {
        points += 15;
    }
    if (c.margin_net_buy && *c.margin_net_buy > config_.margin_threshold) {
        points += 15;
    }
    return std::min(points, kCapitalFlowMax);
}

int ConsensusScorer::logicScore(const LogicSignal& l) const {
    int points = 0;
    if (l.analyst_buy_count && *l.analyst_buy_count >= config_.analyst_buy_min) {
        points += 15;
    }
    if (l.sector_heat_rank && *l.sector_heat_rank >= 1 && *l.sector_heat_rank <= config_.sector_heat_top_n) {
        points += 15;
    }
    return std::min(points, kLogicMax);
}

int ConsensusScorer::sentimentScore(const SentimentSignal& s) const {
    if (s.discussion_volume > config_.sentiment_high) {
        return kSentimentMax;
    }
    if (s.discussion_volume > config_.sentiment_low) {
        return 10;
    }
    return 0;
}

size_t ConsensusScorer::workerCount(size_t jobs) const {
    size_t workers = config_.worker_threads > 0
        ? static_cast<size_t>(config_.worker_threads)
        : static_cast<size_t>(std::max(1u, std::thread::hardware_concurrency()));
    return std::min(workers, std::max<size_t>(jobs, 1));
}

std::vector<ConsensusScore> ConsensusScorer::scoreUniverse(const std::vector<std::string>& symbols,
                                                           const Date& date) const {
    std::vector<ConsensusScore> out(symbols.size());
    common::parallelFor(symbols.size(), workerCount(symbols.size()), [&](size_t i) {
        out[i] = score(symbols[i], date);
    });
    std::sort(out.begin(), out.end(), bySymbol);
    return out;
}

std::vector<ConsensusScore> ConsensusScorer::scoreSignals(const std::vector<ConsensusSignal>& signals) const {
    std::vector<ConsensusScore> out(signals.size());
    common::parallelFor(signals.size(), workerCount(signals.size()), [&](size_t i) {
        out[i] = scoreSignal(signals[i]);
    });
    std::sort(out.begin(), out.end(), bySymbol);
    return out;
}

std::vector<ConsensusScore> ConsensusScorer::filter(const std::vector<std::string>& universe,
                                                    const Date& date,
                                                    int min_score,
                                                    double min_completeness) const {
    return rank(scoreUniverse(universe, date), min_score, min_completeness);
}

std::vector<ConsensusScore> ConsensusScorer::rank(std::vector<ConsensusScore> scores,
                                                  int min_score,
                                                  double min_completeness) {
    scores.erase(std::remove_if(scores.begin(), scores.end(),
                                [&](const ConsensusScore& s) {
                                    return s.total < min_score || s.completeness + 1e-12 < min_completeness;
                                }),
                 scores.end());
    std::sort(scores.begin(), scores.end(), byTotalThenSymbol);
    return scores;
}

} // namespace consensus
} // namespace astock
