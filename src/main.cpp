#include "common/Logger.h"
#include "common/Config.h"
#include "backtest/BacktestEngine.h"
#include "backtest/ResultStore.h"
#include "strategy/ConsensusRotationPolicy.h"

#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

using namespace astock;

namespace {
std::string optionalPct(const std::optional<double>& v) {
    if (!v) {
        return "n/a";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << (*v * 100.0) << "%";
    return oss.str();
}

std::string optionalRatio(const std::optional<double>& v) {
    if (!v) {
        return "n/a";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << *v;
    return oss.str();
}

void printSummary(const backtest::BacktestEngine::Result& result) {
    const auto& m = result.metrics;
    std::cout << "\nBacktest result" << (result.valid ? "" : " (INVALID)") << "\n";
    std::cout << "---------------------------------------------\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Initial capital:   " << m.initial_capital << " CNY\n";
    std::cout << "Final value:       " << m.final_value << " CNY\n";
    std::cout << "Total return:      " << (m.total_return * 100.0) << "%\n";
    std::cout << "Annualized return: " << (m.annualized_return * 100.0) << "%\n";
    std::cout << "Max drawdown:      " << (m.max_drawdown * 100.0) << "%\n";
    std::cout << "Sharpe:            " << optionalRatio(m.sharpe_ratio) << "\n";
    std::cout << "Win rate:          " << optionalPct(m.win_rate) << "\n";
    std::cout << "Profit factor:     " << optionalRatio(m.profit_factor) << "\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Expectancy:        " << m.expectancy << " CNY/round trip\n";
    std::cout << "Costs paid:        " << m.total_costs << " CNY\n";
    std::cout << "Trading days:      " << m.trading_days << "\n";
    std::cout << "Trades:            " << m.trade_count << " (" << m.trade_stats.round_trips << " round trips)\n";

    int rejected = 0;
    int failed = 0;
    for (const auto& outcome : result.outcomes) {
        if (outcome.kind == backtest::OutcomeKind::REJECTED) rejected++;
        if (outcome.kind == backtest::OutcomeKind::EXECUTION_FAILED) failed++;
    }
    std::cout << "Rejected orders:   " << rejected << "\n";
    std::cout << "Failed orders:     " << failed << "\n";
    if (!result.valid) {
        std::cout << "Failure:           " << result.failure_reason << "\n";
    }
    std::cout << "---------------------------------------------\n";
}
}

int main(int argc, char* argv[]) {
    std::string config_path = "config/config.json";
    bool json_mode = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--json") {
            json_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "usage: astock_backtest [config.json] [--json]\n";
            return 0;
        } else {
            config_path = arg;
        }
    }

    try {
        auto& config = Config::getInstance();
        config.load(config_path);

        Logger::getInstance().initialize(config.getLogDir());
        Logger::getInstance().setLevel(config.getLogLevel());

        const auto bt_config = config.getBacktestConfig();
        backtest::BacktestEngine engine(bt_config,
                                        config.getTradingRules(),
                                        config.getCostConfig(),
                                        config.getConsensusConfig());
        engine.loadData();

        auto policy = std::make_shared<strategy::ConsensusRotationPolicy>(config.getRotationPolicyConfig());
        engine.setPolicy(policy);
        const std::string policy_name = policy->getInfo().name;

        backtest::ResultStore store(bt_config.output_dir);
        try {
            engine.run();
        } catch (const market::CausalityViolation& e) {
            // Partial, explicitly invalid result is still written for inspection
            if (!store.write(engine.getResult(), policy_name)) {
                std::cerr << "Failed to write partial results to " << bt_config.output_dir << "\n";
            }
            if (json_mode) {
                std::cout << backtest::ResultStore::summaryJson(engine.getResult(), policy_name).dump() << "\n";
            } else {
                printSummary(engine.getResult());
            }
            std::cerr << "Run aborted: " << e.what() << "\n";
            return 2;
        }

        const auto& result = engine.getResult();
        if (!store.write(result, policy_name)) {
            std::cerr << "Failed to write results to " << bt_config.output_dir << "\n";
            return 1;
        }

        if (json_mode) {
            std::cout << backtest::ResultStore::summaryJson(result, policy_name).dump() << "\n";
        } else {
            printSummary(result);
        }
        return result.valid ? 0 : 2;

    } catch (const std::exception& e) {
        LOG_ERROR("Fatal: {}", e.what());
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }
}
