#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Date.h"

namespace astock {
namespace backtest {

struct BacktestConfig {
    double initial_capital = 1000000.0;       // CNY
    std::optional<Date> start_date;           // empty = first bar date
    std::optional<Date> end_date;             // empty = last bar date
    double risk_free_rate = 0.03;

    std::string instruments_path = "data/instruments.jsonl";
    std::string price_bars_path = "data/price_bars.jsonl";
    std::string signals_path = "data/signals.jsonl";
    std::string output_dir = "output";

    // Empty = every symbol with price bars
    std::vector<std::string> universe;

    // Fill an absent technical family from trailing bars
    bool derive_technical_from_bars = true;
    int ma_short_period = 5;
    int ma_long_period = 20;
    int high_lookback = 250;
};

} // namespace backtest
} // namespace astock
