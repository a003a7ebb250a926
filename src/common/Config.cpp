#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace astock {

namespace {
std::string lowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void readDate(const nlohmann::json& j, const char* key, std::optional<Date>& out) {
    if (!j.contains(key) || !j[key].is_string()) {
        return;
    }
    const std::string text = j[key].get<std::string>();
    if (text.empty()) {
        out.reset();
        return;
    }
    auto parsed = Date::parse(text);
    if (!parsed) {
        std::cerr << "Warning: invalid " << key << " '" << text << "', keeping default" << std::endl;
        return;
    }
    out = *parsed;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    log_level_ = "info";
    log_dir_ = "logs";
    trading_rules_ = rules::TradingRules::aShare();
    cost_config_ = execution::CostConfig{};
    consensus_config_ = consensus::ConsensusConfig{};
    backtest_config_ = backtest::BacktestConfig{};
    rotation_policy_config_ = strategy::RotationPolicyConfig{};
}

void Config::load(const std::string& path) {
    try {
        std::filesystem::path config_path;
        if (std::filesystem::path(path).is_absolute()) {
            config_path = path;
        } else {
            config_path = utils::PathUtils::resolveRelativePath(path);
        }

        std::cout << "Config file: " << config_path << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cout << "Warning: config file not found: " << config_path << std::endl;
            std::cout << "Using defaults." << std::endl;
            return;
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cout << "Warning: cannot open config file." << std::endl;
            return;
        }

        nlohmann::json j;
        file >> j;
        loadFromJson(j);

        std::cout << "Config loaded: capital=" << backtest_config_.initial_capital
                  << ", lot=" << trading_rules_.min_lot
                  << ", T+" << trading_rules_.settlement_days << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
    }
}

void Config::loadFromJson(const nlohmann::json& j) {
    if (j.contains("logging")) {
        auto& l = j["logging"];
        log_level_ = l.value("level", log_level_);
        log_dir_ = l.value("dir", log_dir_);
    }

    if (j.contains("market")) {
        auto& m = j["market"];
        const std::string type = lowerCopy(m.value("type", std::string("a_share")));
        trading_rules_ = (type == "unrestricted") ? rules::TradingRules::unrestricted()
                                                  : rules::TradingRules::aShare();
        trading_rules_.min_lot = m.value("min_lot", trading_rules_.min_lot);
        trading_rules_.settlement_days = m.value("settlement_days", trading_rules_.settlement_days);
        trading_rules_.enforce_price_bands = m.value("enforce_price_bands", trading_rules_.enforce_price_bands);
        trading_rules_.price_tick = m.value("price_tick", trading_rules_.price_tick);
        if (m.contains("bands")) {
            auto& b = m["bands"];
            trading_rules_.main_band = b.value("main", trading_rules_.main_band);
            trading_rules_.science_innovation_band = b.value("science_innovation", trading_rules_.science_innovation_band);
            trading_rules_.growth_enterprise_band = b.value("growth_enterprise", trading_rules_.growth_enterprise_band);
            trading_rules_.special_treatment_band = b.value("special_treatment", trading_rules_.special_treatment_band);
        }
    }

    if (j.contains("costs")) {
        auto& c = j["costs"];
        cost_config_.commission_rate = c.value("commission_rate", cost_config_.commission_rate);
        cost_config_.min_commission = c.value("min_commission", cost_config_.min_commission);
        cost_config_.stamp_duty_rate = c.value("stamp_duty_rate", cost_config_.stamp_duty_rate);
        cost_config_.transfer_fee_rate = c.value("transfer_fee_rate", cost_config_.transfer_fee_rate);
        cost_config_.transfer_fee_venue = c.value("transfer_fee_venue", cost_config_.transfer_fee_venue);
        cost_config_.slippage_rate = c.value("slippage_rate", cost_config_.slippage_rate);
    }
    cost_config_.price_tick = trading_rules_.price_tick;

    if (j.contains("consensus")) {
        auto& s = j["consensus"];
        consensus_config_.near_high_ratio = s.value("near_high_ratio", consensus_config_.near_high_ratio);
        consensus_config_.northbound_threshold = s.value("northbound_threshold", consensus_config_.northbound_threshold);
        consensus_config_.margin_threshold = s.value("margin_threshold", consensus_config_.margin_threshold);
        consensus_config_.analyst_buy_min = s.value("analyst_buy_min", consensus_config_.analyst_buy_min);
        consensus_config_.sector_heat_top_n = s.value("sector_heat_top_n", consensus_config_.sector_heat_top_n);
        consensus_config_.sentiment_high = s.value("sentiment_high", consensus_config_.sentiment_high);
        consensus_config_.sentiment_low = s.value("sentiment_low", consensus_config_.sentiment_low);
        consensus_config_.worker_threads = s.value("worker_threads", consensus_config_.worker_threads);
    }

    if (j.contains("backtest")) {
        auto& t = j["backtest"];
        backtest_config_.initial_capital = t.value("initial_capital", backtest_config_.initial_capital);
        readDate(t, "start_date", backtest_config_.start_date);
        readDate(t, "end_date", backtest_config_.end_date);
        backtest_config_.risk_free_rate = t.value("risk_free_rate", backtest_config_.risk_free_rate);
        backtest_config_.instruments_path = t.value("instruments_path", backtest_config_.instruments_path);
        backtest_config_.price_bars_path = t.value("price_bars_path", backtest_config_.price_bars_path);
        backtest_config_.signals_path = t.value("signals_path", backtest_config_.signals_path);
        backtest_config_.output_dir = t.value("output_dir", backtest_config_.output_dir);
        if (t.contains("universe")) {
            backtest_config_.universe = t["universe"].get<std::vector<std::string>>();
        }
        backtest_config_.derive_technical_from_bars =
            t.value("derive_technical_from_bars", backtest_config_.derive_technical_from_bars);
        backtest_config_.ma_short_period = t.value("ma_short_period", backtest_config_.ma_short_period);
        backtest_config_.ma_long_period = t.value("ma_long_period", backtest_config_.ma_long_period);
        backtest_config_.high_lookback = t.value("high_lookback", backtest_config_.high_lookback);
    }

    if (j.contains("policy")) {
        auto& p = j["policy"];
        rotation_policy_config_.entry_score = p.value("entry_score", rotation_policy_config_.entry_score);
        rotation_policy_config_.exit_score = p.value("exit_score", rotation_policy_config_.exit_score);
        rotation_policy_config_.min_completeness = p.value("min_completeness", rotation_policy_config_.min_completeness);
        rotation_policy_config_.max_positions = p.value("max_positions", rotation_policy_config_.max_positions);
        rotation_policy_config_.position_pct = p.value("position_pct", rotation_policy_config_.position_pct);
    }
    rotation_policy_config_.lot_size = trading_rules_.min_lot;
}

} // namespace astock
