#include "backtest/DataHistory.h"
#include "common/Logger.h"
#include "market/InstrumentRegistry.h"
#include "market/PriceBarStore.h"

#include <filesystem>
#include <fstream>

namespace astock {
namespace backtest {

namespace {
std::optional<Date> dateField(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string()) {
        return std::nullopt;
    }
    return Date::parse(j[key].get<std::string>());
}

template <typename T>
nlohmann::json optionalToJson(const std::optional<T>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

template <typename T>
std::optional<T> optionalFromJson(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<T>();
}
}

template <typename T, typename Parser>
std::vector<T> DataHistory::loadLines(const std::string& file_path, const char* what, Parser parse) {
    std::vector<T> out;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open {} file: {}", what, file_path);
        return out;
    }

    std::string row;
    size_t line_no = 0;
    size_t skipped = 0;
    while (std::getline(file, row)) {
        line_no++;
        if (row.empty() || row.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        try {
            auto parsed = parse(nlohmann::json::parse(row));
            if (parsed) {
                out.push_back(std::move(*parsed));
            } else {
                skipped++;
                LOG_WARN("Skipping incomplete {} record at {}:{}", what, file_path, line_no);
            }
        } catch (const nlohmann::json::exception& e) {
            skipped++;
            LOG_WARN("Skipping malformed {} record at {}:{} - {}", what, file_path, line_no, e.what());
        }
    }

    LOG_INFO("Loaded {} {} records from {} ({} skipped)", out.size(), what, file_path, skipped);
    return out;
}

std::vector<PriceBar> DataHistory::loadPriceBars(const std::string& file_path) {
    return loadLines<PriceBar>(file_path, "price bar", &DataHistory::priceBarFromJson);
}

std::vector<consensus::ConsensusSignal> DataHistory::loadSignals(const std::string& file_path) {
    return loadLines<consensus::ConsensusSignal>(file_path, "signal", &DataHistory::signalFromJson);
}

std::vector<InstrumentRecord> DataHistory::loadInstruments(const std::string& file_path) {
    return loadLines<InstrumentRecord>(file_path, "instrument", &DataHistory::instrumentFromJson);
}

bool DataHistory::appendLine(const std::string& file_path, const nlohmann::json& line) {
    const std::filesystem::path path(file_path);
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            LOG_ERROR("Cannot create directory {}: {}", path.parent_path().string(), ec.message());
            return false;
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        LOG_ERROR("Cannot open {} for append", file_path);
        return false;
    }
    out << line.dump() << "\n";
    return static_cast<bool>(out);
}

bool DataHistory::appendPriceBar(const std::string& file_path, const PriceBar& bar, Price tick) {
    PriceBar normalized = bar;
    market::PriceBarStore::normalize(normalized, tick);
    return appendLine(file_path, toJson(normalized));
}

bool DataHistory::appendSignal(const std::string& file_path, const consensus::ConsensusSignal& signal) {
    return appendLine(file_path, toJson(signal));
}

bool DataHistory::appendInstrument(const std::string& file_path, const InstrumentRecord& record) {
    return appendLine(file_path, toJson(record));
}

nlohmann::json DataHistory::toJson(const PriceBar& bar) {
    nlohmann::json j;
    j["symbol"] = bar.symbol;
    j["date"] = bar.date.toString();
    j["open"] = bar.open;
    j["high"] = bar.high;
    j["low"] = bar.low;
    j["close"] = bar.close;
    j["volume"] = bar.volume;
    j["amount"] = bar.amount;
    j["prev_close"] = bar.prev_close;
    j["status"] = toString(bar.status);
    if (bar.suspension_reason) {
        j["suspension_reason"] = *bar.suspension_reason;
    }
    return j;
}

nlohmann::json DataHistory::toJson(const consensus::ConsensusSignal& signal) {
    nlohmann::json j;
    j["symbol"] = signal.symbol;
    j["date"] = signal.date.toString();

    if (signal.technical) {
        j["technical"] = {
            {"close", signal.technical->close},
            {"high_52w", signal.technical->high_52w},
            {"ma_short", signal.technical->ma_short},
            {"ma_long", signal.technical->ma_long}
        };
    }
    if (signal.capital_flow && !signal.capital_flow->empty()) {
        j["capital_flow"] = {
            {"northbound_net_inflow", optionalToJson(signal.capital_flow->northbound_net_inflow)},
            {"margin_net_buy", optionalToJson(signal.capital_flow->margin_net_buy)}
        };
    }
    if (signal.logic && !signal.logic->empty()) {
        j["logic"] = {
            {"analyst_buy_count", optionalToJson(signal.logic->analyst_buy_count)},
            {"sector_heat_rank", optionalToJson(signal.logic->sector_heat_rank)}
        };
    }
    if (signal.sentiment) {
        j["sentiment"] = {{"discussion_volume", signal.sentiment->discussion_volume}};
    }
    return j;
}

nlohmann::json DataHistory::toJson(const InstrumentRecord& record) {
    nlohmann::json j;
    j["symbol"] = record.instrument.symbol;
    j["name"] = record.instrument.name;
    j["board"] = toString(record.instrument.board);
    j["special_treatment"] = record.instrument.special_treatment;
    j["listing_status"] = toString(record.instrument.listing_status);
    if (record.effective_from) {
        j["effective_from"] = record.effective_from->toString();
    }
    return j;
}

std::optional<PriceBar> DataHistory::priceBarFromJson(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("symbol") || !j.contains("close")) {
        return std::nullopt;
    }
    auto date = dateField(j, "date");
    if (!date) {
        return std::nullopt;
    }

    PriceBar bar;
    bar.symbol = j["symbol"].get<std::string>();
    bar.date = *date;
    bar.close = j["close"].get<double>();
    bar.open = j.value("open", bar.close);
    bar.high = j.value("high", bar.close);
    bar.low = j.value("low", bar.close);
    bar.volume = j.value("volume", 0.0);
    bar.amount = j.value("amount", 0.0);
    bar.prev_close = j.value("prev_close", 0.0);

    if (j.contains("status") && j["status"].is_string()) {
        auto status = dayStatusFromString(j["status"].get<std::string>());
        if (!status) {
            return std::nullopt;
        }
        bar.status = *status;
    }
    if (j.contains("suspension_reason") && j["suspension_reason"].is_string()) {
        bar.suspension_reason = j["suspension_reason"].get<std::string>();
        bar.status = DayStatus::SUSPENDED;
    }
    return bar;
}

std::optional<consensus::ConsensusSignal> DataHistory::signalFromJson(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("symbol")) {
        return std::nullopt;
    }
    auto date = dateField(j, "date");
    if (!date) {
        return std::nullopt;
    }

    consensus::ConsensusSignal signal;
    signal.symbol = j["symbol"].get<std::string>();
    signal.date = *date;

    if (j.contains("technical") && j["technical"].is_object()) {
        auto& t = j["technical"];
        // A technical record is all-or-nothing
        if (t.contains("close") && t.contains("high_52w") && t.contains("ma_short") && t.contains("ma_long")) {
            consensus::TechnicalSignal tech;
            tech.close = t["close"].get<double>();
            tech.high_52w = t["high_52w"].get<double>();
            tech.ma_short = t["ma_short"].get<double>();
            tech.ma_long = t["ma_long"].get<double>();
            signal.technical = tech;
        }
    }
    if (j.contains("capital_flow") && j["capital_flow"].is_object()) {
        auto& c = j["capital_flow"];
        consensus::CapitalFlowSignal flow;
        flow.northbound_net_inflow = optionalFromJson<double>(c, "northbound_net_inflow");
        flow.margin_net_buy = optionalFromJson<double>(c, "margin_net_buy");
        if (!flow.empty()) {
            signal.capital_flow = flow;
        }
    }
    if (j.contains("logic") && j["logic"].is_object()) {
        auto& l = j["logic"];
        consensus::LogicSignal logic;
        logic.analyst_buy_count = optionalFromJson<int>(l, "analyst_buy_count");
        logic.sector_heat_rank = optionalFromJson<int>(l, "sector_heat_rank");
        if (!logic.empty()) {
            signal.logic = logic;
        }
    }
    if (j.contains("sentiment") && j["sentiment"].is_object() && j["sentiment"].contains("discussion_volume")) {
        consensus::SentimentSignal sentiment;
        sentiment.discussion_volume = j["sentiment"]["discussion_volume"].get<double>();
        signal.sentiment = sentiment;
    }
    return signal;
}

std::optional<InstrumentRecord> DataHistory::instrumentFromJson(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("symbol")) {
        return std::nullopt;
    }

    InstrumentRecord record;
    record.instrument = market::InstrumentRegistry::makeInstrument(
        j["symbol"].get<std::string>(), j.value("name", std::string()));

    if (j.contains("board") && j["board"].is_string()) {
        auto board = boardFromString(j["board"].get<std::string>());
        if (!board) {
            return std::nullopt;
        }
        record.instrument.board = *board;
    }
    record.instrument.special_treatment = j.value("special_treatment", record.instrument.special_treatment);
    if (j.contains("listing_status") && j["listing_status"].is_string()) {
        auto status = listingStatusFromString(j["listing_status"].get<std::string>());
        if (!status) {
            return std::nullopt;
        }
        record.instrument.listing_status = *status;
    }
    record.effective_from = dateField(j, "effective_from");
    return record;
}

} // namespace backtest
} // namespace astock
