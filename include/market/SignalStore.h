#pragma once

#include <map>
#include <string>

#include "consensus/ConsensusTypes.h"
#include "market/SimulationClock.h"

namespace astock {
namespace market {

// Per-symbol, per-day consensus inputs. Missing data is represented as
// absent families, never as an error.
class SignalStore {
public:
    explicit SignalStore(const SimulationClock& clock) : clock_(clock) {}

    // Empty capital-flow / logic records are stored as absent
    void insert(consensus::ConsensusSignal signal);

    // All families absent when nothing was stored for (symbol, date)
    consensus::ConsensusSignal get(const std::string& symbol, const Date& date) const;

    size_t size() const;

private:
    const SimulationClock& clock_;
    std::map<std::string, std::map<Date, consensus::ConsensusSignal>> signals_;
};

} // namespace market
} // namespace astock
