#include "backtest/ResultStore.h"
#include "common/Logger.h"

#include <fstream>
#include <map>

namespace astock {
namespace backtest {

namespace {
template <typename T>
nlohmann::json optionalToJson(const std::optional<T>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}
}

ResultStore::ResultStore(std::filesystem::path output_dir)
    : output_dir_(std::move(output_dir)) {
}

template <typename T>
bool ResultStore::writeLines(const std::string& file_name, const std::vector<T>& rows) const {
    const auto path = output_dir_ / file_name;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        LOG_ERROR("Result file open failed: {}", path.string());
        return false;
    }
    for (const auto& row : rows) {
        out << toJson(row).dump() << "\n";
    }
    return static_cast<bool>(out);
}

bool ResultStore::write(const BacktestEngine::Result& result, const std::string& policy_name) const {
    std::error_code ec;
    std::filesystem::create_directories(output_dir_, ec);
    if (ec) {
        LOG_ERROR("Cannot create output directory {}: {}", output_dir_.string(), ec.message());
        return false;
    }

    bool ok = writeLines("equity.jsonl", result.equity);
    ok = writeLines("trades.jsonl", result.trades) && ok;
    ok = writeLines("scores.jsonl", result.scores) && ok;

    const auto summary_path = output_dir_ / "summary.json";
    std::ofstream summary(summary_path, std::ios::binary | std::ios::trunc);
    if (!summary.is_open()) {
        LOG_ERROR("Result file open failed: {}", summary_path.string());
        return false;
    }
    summary << summaryJson(result, policy_name).dump(2) << "\n";
    ok = static_cast<bool>(summary) && ok;

    if (ok) {
        LOG_INFO("Results written to {}", output_dir_.string());
    }
    return ok;
}

nlohmann::json ResultStore::toJson(const EquityPoint& point) {
    nlohmann::json j;
    j["date"] = point.date.toString();
    j["cash"] = point.cash;
    j["market_value"] = point.market_value;
    j["total_value"] = point.total_value;
    j["daily_return"] = point.daily_return;
    return j;
}

nlohmann::json ResultStore::toJson(const Trade& trade) {
    nlohmann::json j;
    j["date"] = trade.date.toString();
    j["symbol"] = trade.symbol;
    j["side"] = toString(trade.side);
    j["quantity"] = trade.quantity;
    j["fill_price"] = trade.fill_price;
    j["costs"] = {
        {"commission", trade.costs.commission},
        {"stamp_duty", trade.costs.stamp_duty},
        {"transfer_fee", trade.costs.transfer_fee},
        {"slippage", trade.costs.slippage},
        {"total", trade.costs.total_cost}
    };
    j["net_cash_delta"] = trade.net_cash_delta;
    return j;
}

nlohmann::json ResultStore::toJson(const consensus::ConsensusScore& score) {
    nlohmann::json j;
    j["date"] = score.date.toString();
    j["symbol"] = score.symbol;
    j["technical"] = score.technical;
    j["capital_flow"] = score.capital_flow;
    j["logic"] = score.logic;
    j["sentiment"] = score.sentiment;
    j["total"] = score.total;
    nlohmann::json missing = nlohmann::json::array();
    for (auto family : score.missing) {
        missing.push_back(consensus::toString(family));
    }
    j["missing"] = missing;
    j["completeness"] = score.completeness;
    return j;
}

nlohmann::json ResultStore::toJson(const OrderOutcome& outcome) {
    nlohmann::json j;
    j["date"] = outcome.date.toString();
    j["symbol"] = outcome.order.symbol;
    j["side"] = toString(outcome.order.side);
    j["quantity"] = outcome.order.quantity;
    j["outcome"] = toString(outcome.kind);
    if (outcome.kind == OutcomeKind::REJECTED) {
        j["reason"] = rules::toString(outcome.reject_reason);
    } else if (outcome.kind == OutcomeKind::EXECUTION_FAILED) {
        j["reason"] = toString(outcome.failure);
    }
    if (!outcome.message.empty()) {
        j["message"] = outcome.message;
    }
    return j;
}

nlohmann::json ResultStore::summaryJson(const BacktestEngine::Result& result, const std::string& policy_name) {
    const auto& m = result.metrics;

    nlohmann::json j;
    j["policy"] = policy_name;
    j["valid"] = result.valid;
    if (!result.valid) {
        j["failure_reason"] = result.failure_reason;
        if (result.failed_on) {
            j["failed_on"] = result.failed_on->toString();
        }
    }
    if (!result.equity.empty()) {
        j["start_date"] = result.equity.front().date.toString();
        j["end_date"] = result.equity.back().date.toString();
    }

    j["initial_capital"] = m.initial_capital;
    j["final_value"] = m.final_value;
    j["total_return"] = m.total_return;
    j["annualized_return"] = m.annualized_return;
    j["max_drawdown"] = m.max_drawdown;
    j["annualized_volatility"] = m.annualized_volatility;
    j["sharpe_ratio"] = optionalToJson(m.sharpe_ratio);
    j["win_rate"] = optionalToJson(m.win_rate);
    j["profit_factor"] = optionalToJson(m.profit_factor);
    j["average_win"] = m.average_win;
    j["average_loss"] = m.average_loss;
    j["expectancy"] = m.expectancy;
    j["total_costs"] = m.total_costs;
    j["trading_days"] = m.trading_days;
    j["trade_count"] = m.trade_count;
    j["round_trips"] = m.trade_stats.round_trips;

    std::map<std::string, int> outcome_counts;
    nlohmann::json rejected = nlohmann::json::array();
    for (const auto& outcome : result.outcomes) {
        if (outcome.kind == OutcomeKind::REJECTED) {
            outcome_counts[rules::toString(outcome.reject_reason)]++;
        } else if (outcome.kind == OutcomeKind::EXECUTION_FAILED) {
            outcome_counts[toString(outcome.failure)]++;
        } else {
            outcome_counts["executed"]++;
        }
        if (outcome.kind != OutcomeKind::EXECUTED) {
            rejected.push_back(toJson(outcome));
        }
    }
    j["outcome_counts"] = outcome_counts;
    j["rejected_orders"] = rejected;
    return j;
}

} // namespace backtest
} // namespace astock
