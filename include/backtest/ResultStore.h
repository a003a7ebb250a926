#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

#include "backtest/BacktestEngine.h"

namespace astock {
namespace backtest {

// Writes a finished run to `output_dir`:
//   equity.jsonl   one EquityPoint per line
//   trades.jsonl   one Trade per line
//   scores.jsonl   one ConsensusScore per line
//   summary.json   metrics, validity and outcome counts
// Existing files are replaced.
class ResultStore {
public:
    explicit ResultStore(std::filesystem::path output_dir);

    bool write(const BacktestEngine::Result& result, const std::string& policy_name) const;

    static nlohmann::json toJson(const EquityPoint& point);
    static nlohmann::json toJson(const Trade& trade);
    static nlohmann::json toJson(const consensus::ConsensusScore& score);
    static nlohmann::json toJson(const OrderOutcome& outcome);
    static nlohmann::json summaryJson(const BacktestEngine::Result& result, const std::string& policy_name);

    const std::filesystem::path& outputDir() const { return output_dir_; }

private:
    template <typename T>
    bool writeLines(const std::string& file_name, const std::vector<T>& rows) const;

    std::filesystem::path output_dir_;
};

} // namespace backtest
} // namespace astock
