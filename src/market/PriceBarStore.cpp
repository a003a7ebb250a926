#include "market/PriceBarStore.h"
#include "common/PriceMath.h"

#include <set>

namespace astock {
namespace market {

void PriceBarStore::normalize(PriceBar& bar, Price tick) {
    bar.prev_close = common::roundToTick(bar.prev_close, tick);
    if (!bar.tradable()) {
        bar.open = bar.prev_close;
        bar.high = bar.prev_close;
        bar.low = bar.prev_close;
        bar.close = bar.prev_close;
        bar.volume = 0.0;
        bar.amount = 0.0;
        return;
    }
    bar.open = common::roundToTick(bar.open, tick);
    bar.high = common::roundToTick(bar.high, tick);
    bar.low = common::roundToTick(bar.low, tick);
    bar.close = common::roundToTick(bar.close, tick);
}

void PriceBarStore::insert(PriceBar bar) {
    auto& series = bars_[bar.symbol];
    const Date key = bar.date;

    if (!bar.tradable() && bar.prev_close <= 0.0) {
        auto before = series.lower_bound(key);
        if (before != series.begin()) {
            --before;
            bar.prev_close = before->second.close;
        }
    }
    normalize(bar, tick_);
    auto it = series.insert_or_assign(key, std::move(bar)).first;

    // Halted days stored earlier without a price now carry this close
    Price carried = it->second.close;
    for (++it; it != series.end() && !it->second.tradable() && it->second.prev_close <= 0.0; ++it) {
        it->second.prev_close = carried;
        normalize(it->second, tick_);
        carried = it->second.close;
    }
}

std::optional<PriceBar> PriceBarStore::get(const std::string& symbol, const Date& date) const {
    clock_.require(date, "price bar " + symbol);
    const auto it = bars_.find(symbol);
    if (it == bars_.end()) {
        return std::nullopt;
    }
    const auto bar_it = it->second.find(date);
    if (bar_it == it->second.end()) {
        return std::nullopt;
    }
    return bar_it->second;
}

std::optional<PriceBar> PriceBarStore::getOrCarryForward(const std::string& symbol, const Date& date) const {
    clock_.require(date, "price bar " + symbol);
    const auto it = bars_.find(symbol);
    if (it == bars_.end()) {
        return std::nullopt;
    }
    const auto& series = it->second;
    auto bar_it = series.find(date);
    if (bar_it != series.end()) {
        return bar_it->second;
    }

    auto before = series.lower_bound(date);
    if (before == series.begin()) {
        return std::nullopt;
    }
    --before;

    PriceBar carried;
    carried.symbol = symbol;
    carried.date = date;
    carried.prev_close = before->second.close;
    carried.status = DayStatus::DATA_MISSING;
    normalize(carried, tick_);
    return carried;
}

std::vector<PriceBar> PriceBarStore::history(const std::string& symbol, const Date& end, size_t count) const {
    clock_.require(end, "price history " + symbol);
    std::vector<PriceBar> out;
    const auto it = bars_.find(symbol);
    if (it == bars_.end() || count == 0) {
        return out;
    }
    const auto& series = it->second;
    auto upper = series.upper_bound(end);
    while (upper != series.begin() && out.size() < count) {
        --upper;
        out.push_back(upper->second);
    }
    return std::vector<PriceBar>(out.rbegin(), out.rend());
}

std::vector<Date> PriceBarStore::tradingDates(const Date& start, const Date& end) const {
    std::set<Date> dates;
    for (const auto& entry : bars_) {
        const auto& series = entry.second;
        for (auto it = series.lower_bound(start); it != series.end() && it->first <= end; ++it) {
            dates.insert(it->first);
        }
    }
    return std::vector<Date>(dates.begin(), dates.end());
}

std::vector<std::string> PriceBarStore::symbols() const {
    std::vector<std::string> out;
    out.reserve(bars_.size());
    for (const auto& entry : bars_) {
        out.push_back(entry.first);
    }
    return out;
}

size_t PriceBarStore::size() const {
    size_t total = 0;
    for (const auto& entry : bars_) {
        total += entry.second.size();
    }
    return total;
}

} // namespace market
} // namespace astock
