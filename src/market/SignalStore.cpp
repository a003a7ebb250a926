#include "market/SignalStore.h"

namespace astock {
namespace market {

void SignalStore::insert(consensus::ConsensusSignal signal) {
    if (signal.capital_flow && signal.capital_flow->empty()) {
        signal.capital_flow.reset();
    }
    if (signal.logic && signal.logic->empty()) {
        signal.logic.reset();
    }
    auto& series = signals_[signal.symbol];
    const Date key = signal.date;
    series[key] = std::move(signal);
}

consensus::ConsensusSignal SignalStore::get(const std::string& symbol, const Date& date) const {
    clock_.require(date, "consensus signal " + symbol);

    const auto it = signals_.find(symbol);
    if (it != signals_.end()) {
        const auto sig_it = it->second.find(date);
        if (sig_it != it->second.end()) {
            return sig_it->second;
        }
    }

    consensus::ConsensusSignal absent;
    absent.symbol = symbol;
    absent.date = date;
    return absent;
}

size_t SignalStore::size() const {
    size_t total = 0;
    for (const auto& entry : signals_) {
        total += entry.second.size();
    }
    return total;
}

} // namespace market
} // namespace astock
