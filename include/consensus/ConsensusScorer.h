#pragma once

#include <string>
#include <vector>

#include "consensus/ConsensusTypes.h"
#include "market/SignalStore.h"

namespace astock {
namespace consensus {

struct ConsensusConfig {
    // Technical
    double near_high_ratio = 0.05;          // close within 5% of the 52-week high

    // Capital flow (CNY)
    double northbound_threshold = 1.0e7;
    double margin_threshold = 1.0e7;

    // Logic
    int analyst_buy_min = 5;
    int sector_heat_top_n = 10;

    // Sentiment
    double sentiment_high = 10000.0;
    double sentiment_low = 3000.0;

    // 0 = hardware concurrency, 1 = score on the calling thread
    int worker_threads = 1;
};

// Bounded multi-factor score. Each family is a step function of
// thresholded inputs; an absent family contributes exactly 0.
class ConsensusScorer {
public:
    ConsensusScorer(const market::SignalStore& signals, ConsensusConfig config = ConsensusConfig{})
        : signals_(signals), config_(config) {}

    ConsensusScore score(const std::string& symbol, const Date& date) const;

    // Scores an already-fetched signal; does not touch the store
    ConsensusScore scoreSignal(const ConsensusSignal& signal) const;

    // Result is sorted by symbol regardless of worker count
    std::vector<ConsensusScore> scoreUniverse(const std::vector<std::string>& symbols, const Date& date) const;
    std::vector<ConsensusScore> scoreSignals(const std::vector<ConsensusSignal>& signals) const;

    // Total descending, then symbol ascending
    std::vector<ConsensusScore> filter(const std::vector<std::string>& universe,
                                       const Date& date,
                                       int min_score,
                                       double min_completeness) const;

    static std::vector<ConsensusScore> rank(std::vector<ConsensusScore> scores,
                                            int min_score,
                                            double min_completeness);

    const ConsensusConfig& config() const { return config_; }

private:
    int technicalScore(const TechnicalSignal& t) const;
    int capitalFlowScore(const CapitalFlowSignal& c) const;
    int logicScore(const LogicSignal& l) const;
    int sentimentScore(const SentimentSignal& s) const;

    size_t workerCount(size_t jobs) const;

    const market::SignalStore& signals_;
    ConsensusConfig config_;
};

} // namespace consensus
} // namespace astock
