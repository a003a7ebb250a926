#include "market/InstrumentRegistry.h"

#include <algorithm>
#include <cctype>

namespace astock {
namespace market {

namespace {
const Date kBeginningOfTime = Date::fromYmd(1900, 1, 1);

std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}
}

void InstrumentRegistry::add(const Instrument& instrument, const Date& effective_from) {
    records_[instrument.symbol][effective_from] = instrument;
}

void InstrumentRegistry::add(const Instrument& instrument) {
    add(instrument, kBeginningOfTime);
}

std::optional<Instrument> InstrumentRegistry::get(const std::string& symbol, const Date& as_of) const {
    const auto it = records_.find(symbol);
    if (it == records_.end() || it->second.empty()) {
        return std::nullopt;
    }
    const auto& versions = it->second;
    auto upper = versions.upper_bound(as_of);
    if (upper == versions.begin()) {
        return std::nullopt;
    }
    --upper;
    return upper->second;
}

bool InstrumentRegistry::contains(const std::string& symbol) const {
    return records_.count(symbol) > 0;
}

std::vector<std::string> InstrumentRegistry::symbols() const {
    std::vector<std::string> out;
    out.reserve(records_.size());
    for (const auto& entry : records_) {
        out.push_back(entry.first);
    }
    return out;
}

Board InstrumentRegistry::classifyBoard(const std::string& symbol) {
    const std::string code = symbol.substr(0, symbol.find('.'));
    if (startsWith(code, "688")) {
        return Board::SCIENCE_INNOVATION;
    }
    if (startsWith(code, "300") || startsWith(code, "301")) {
        return Board::GROWTH_ENTERPRISE;
    }
    return Board::MAIN;
}

bool InstrumentRegistry::isSpecialTreatmentName(const std::string& name) {
    const std::string trimmed = trimCopy(name);
    for (const char* prefix : {"ST", "*ST", "SST", "S*ST"}) {
        if (startsWith(trimmed, prefix)) {
            return true;
        }
    }
    return false;
}

std::string InstrumentRegistry::venueOf(const std::string& symbol) {
    const auto dot = symbol.rfind('.');
    if (dot == std::string::npos) {
        return "";
    }
    std::string venue = symbol.substr(dot + 1);
    std::transform(venue.begin(), venue.end(), venue.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return venue;
}

Instrument InstrumentRegistry::makeInstrument(const std::string& symbol, const std::string& name) {
    Instrument instrument;
    instrument.symbol = symbol;
    instrument.name = name;
    instrument.board = classifyBoard(symbol);
    instrument.special_treatment = isSpecialTreatmentName(name);
    instrument.listing_status = ListingStatus::ACTIVE;
    return instrument;
}

} // namespace market
} // namespace astock
