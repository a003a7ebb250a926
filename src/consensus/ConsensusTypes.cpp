#include "consensus/ConsensusTypes.h"

namespace astock {
namespace consensus {

std::string toString(Family family) {
    switch (family) {
        case Family::TECHNICAL: return "technical";
        case Family::CAPITAL_FLOW: return "capital_flow";
        case Family::LOGIC: return "logic";
        case Family::SENTIMENT: return "sentiment";
    }
    return "technical";
}

bool ConsensusSignal::hasFamily(Family family) const {
    switch (family) {
        case Family::TECHNICAL: return technical.has_value();
        case Family::CAPITAL_FLOW: return capital_flow.has_value() && !capital_flow->empty();
        case Family::LOGIC: return logic.has_value() && !logic->empty();
        case Family::SENTIMENT: return sentiment.has_value();
    }
    return false;
}

} // namespace consensus
} // namespace astock
