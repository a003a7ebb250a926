#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "backtest/BacktestConfig.h"
#include "consensus/ConsensusScorer.h"
#include "execution/CostModel.h"
#include "rules/TradingRules.h"
#include "strategy/ConsensusRotationPolicy.h"

namespace astock {

class Config {
public:
    static Config& getInstance();

    // Relative paths resolve against the executable directory. A missing
    // or unreadable file leaves the defaults in place.
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);

    // Back to built-in defaults
    void reset();

    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }

    rules::TradingRules getTradingRules() const { return trading_rules_; }
    execution::CostConfig getCostConfig() const { return cost_config_; }
    consensus::ConsensusConfig getConsensusConfig() const { return consensus_config_; }
    backtest::BacktestConfig getBacktestConfig() const { return backtest_config_; }
    strategy::RotationPolicyConfig getRotationPolicyConfig() const { return rotation_policy_config_; }

    void setInitialCapital(double v) { backtest_config_.initial_capital = v; }

private:
    Config() = default;

    std::string log_level_ = "info";
    std::string log_dir_ = "logs";

    rules::TradingRules trading_rules_ = rules::TradingRules::aShare();
    execution::CostConfig cost_config_;
    consensus::ConsensusConfig consensus_config_;
    backtest::BacktestConfig backtest_config_;
    strategy::RotationPolicyConfig rotation_policy_config_;
};

} // namespace astock
