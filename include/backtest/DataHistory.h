#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "common/PriceMath.h"
#include "common/Types.h"
#include "consensus/ConsensusTypes.h"

namespace astock {
namespace backtest {

struct InstrumentRecord {
    Instrument instrument;
    std::optional<Date> effective_from;  // empty = valid for the whole history
};

// Append-only JSON Lines history, one record per (symbol, date).
//
//   price_bars.jsonl  {"symbol","date","open","high","low","close","volume",
//                      "amount","prev_close","status"?,"suspension_reason"?}
//   signals.jsonl     {"symbol","date","technical"?,"capital_flow"?,
//                      "logic"?,"sentiment"?}
//   instruments.jsonl {"symbol","name","board"?,"special_treatment"?,
//                      "listing_status"?,"effective_from"?}
//
// Malformed lines are skipped with a warning; loaders return what parsed.
class DataHistory {
public:
    static std::vector<PriceBar> loadPriceBars(const std::string& file_path);
    static std::vector<consensus::ConsensusSignal> loadSignals(const std::string& file_path);
    static std::vector<InstrumentRecord> loadInstruments(const std::string& file_path);

    // Writers apply the carried-forward and rounding invariants first
    static bool appendPriceBar(const std::string& file_path, const PriceBar& bar,
                               Price tick = common::kPriceTick);
    static bool appendSignal(const std::string& file_path, const consensus::ConsensusSignal& signal);
    static bool appendInstrument(const std::string& file_path, const InstrumentRecord& record);

    static nlohmann::json toJson(const PriceBar& bar);
    static nlohmann::json toJson(const consensus::ConsensusSignal& signal);
    static nlohmann::json toJson(const InstrumentRecord& record);

    // Empty when a required field is missing or has the wrong type
    static std::optional<PriceBar> priceBarFromJson(const nlohmann::json& j);
    static std::optional<consensus::ConsensusSignal> signalFromJson(const nlohmann::json& j);
    static std::optional<InstrumentRecord> instrumentFromJson(const nlohmann::json& j);

private:
    static bool appendLine(const std::string& file_path, const nlohmann::json& line);

    template <typename T, typename Parser>
    static std::vector<T> loadLines(const std::string& file_path, const char* what, Parser parse);
};

} // namespace backtest
} // namespace astock
