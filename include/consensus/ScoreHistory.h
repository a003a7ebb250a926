#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "consensus/ConsensusTypes.h"

namespace astock {
namespace consensus {

// Every score computed during a run, keyed by (date, symbol)
class ScoreHistory {
public:
    void record(const ConsensusScore& score);
    void record(const std::vector<ConsensusScore>& scores);

    std::optional<ConsensusScore> get(const std::string& symbol, const Date& date) const;

    // Date ascending, then symbol ascending
    std::vector<ConsensusScore> all() const;
    std::vector<ConsensusScore> onDate(const Date& date) const;

    size_t size() const { return scores_.size(); }
    bool empty() const { return scores_.empty(); }
    void clear() { scores_.clear(); }

private:
    std::map<std::pair<Date, std::string>, ConsensusScore> scores_;
};

} // namespace consensus
} // namespace astock
