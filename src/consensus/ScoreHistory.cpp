#include "consensus/ScoreHistory.h"

namespace astock {
namespace consensus {

void ScoreHistory::record(const ConsensusScore& score) {
    scores_[{score.date, score.symbol}] = score;
}

void ScoreHistory::record(const std::vector<ConsensusScore>& scores) {
    for (const auto& score : scores) {
        record(score);
    }
}

std::optional<ConsensusScore> ScoreHistory::get(const std::string& symbol, const Date& date) const {
    auto it = scores_.find({date, symbol});
    if (it == scores_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ConsensusScore> ScoreHistory::all() const {
    std::vector<ConsensusScore> out;
    out.reserve(scores_.size());
    for (const auto& [key, score] : scores_) {
        out.push_back(score);
    }
    return out;
}

std::vector<ConsensusScore> ScoreHistory::onDate(const Date& date) const {
    std::vector<ConsensusScore> out;
    for (auto it = scores_.lower_bound({date, std::string()});
         it != scores_.end() && it->first.first == date; ++it) {
        out.push_back(it->second);
    }
    return out;
}

} // namespace consensus
} // namespace astock
