#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"

namespace astock {
namespace market {

// Per-symbol classification, versioned by effective date so that a
// historical date always resolves to the same record.
class InstrumentRegistry {
public:
    void add(const Instrument& instrument, const Date& effective_from);
    void add(const Instrument& instrument);

    std::optional<Instrument> get(const std::string& symbol, const Date& as_of) const;
    bool contains(const std::string& symbol) const;
    std::vector<std::string> symbols() const;
    size_t size() const { return records_.size(); }

    // 688xxx -> science-innovation, 300xxx/301xxx -> growth-enterprise
    static Board classifyBoard(const std::string& symbol);
    // ST, *ST, SST, S*ST name prefixes
    static bool isSpecialTreatmentName(const std::string& name);
    // "SH" for 600519.SH, empty when the symbol carries no suffix
    static std::string venueOf(const std::string& symbol);

    static Instrument makeInstrument(const std::string& symbol, const std::string& name);

private:
    std::map<std::string, std::map<Date, Instrument>> records_;
};

} // namespace market
} // namespace astock
