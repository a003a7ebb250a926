#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Date.h"

namespace astock {
namespace consensus {

enum class Family { TECHNICAL, CAPITAL_FLOW, LOGIC, SENTIMENT };

constexpr int kFamilyCount = 4;

// Maximum points per family
constexpr int kTechnicalMax = 20;
constexpr int kCapitalFlowMax = 30;
constexpr int kLogicMax = 30;
constexpr int kSentimentMax = 20;

std::string toString(Family family);

// Price-technical raw fields, present or absent as a whole
struct TechnicalSignal {
    double close = 0.0;
    double high_52w = 0.0;
    double ma_short = 0.0;
    double ma_long = 0.0;
};

// Each half is an indivisible measurement that may be missing on its own
struct CapitalFlowSignal {
    std::optional<double> northbound_net_inflow;  // CNY
    std::optional<double> margin_net_buy;         // CNY

    bool empty() const { return !northbound_net_inflow && !margin_net_buy; }
};

struct LogicSignal {
    std::optional<int> analyst_buy_count;
    std::optional<int> sector_heat_rank;          // 1 = hottest

    bool empty() const { return !analyst_buy_count && !sector_heat_rank; }
};

struct SentimentSignal {
    double discussion_volume = 0.0;
};

struct ConsensusSignal {
    std::string symbol;
    Date date;
    std::optional<TechnicalSignal> technical;
    std::optional<CapitalFlowSignal> capital_flow;
    std::optional<LogicSignal> logic;
    std::optional<SentimentSignal> sentiment;

    bool hasFamily(Family family) const;
};

struct ConsensusScore {
    std::string symbol;
    Date date;
    int technical = 0;     // [0, 20]
    int capital_flow = 0;  // [0, 30]
    int logic = 0;         // [0, 30]
    int sentiment = 0;     // [0, 20]
    int total = 0;         // [0, 100]
    std::vector<Family> missing;
    double completeness = 0.0;  // 1 - |missing| / 4
};

} // namespace consensus
} // namespace astock
