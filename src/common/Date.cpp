#include "common/Date.h"

#include <cctype>
#include <cstdio>

namespace astock {

namespace {
// Howard Hinnant's days_from_civil / civil_from_days
int daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int>(doe) - 719468;
}

bool isLeap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned lastDayOfMonth(int y, unsigned m) {
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && isLeap(y)) {
        return 29;
    }
    return kDays[m - 1];
}

bool allDigits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}
}

Date Date::fromYmd(int year, unsigned month, unsigned day) {
    return Date(daysFromCivil(year, month, day));
}

std::optional<Date> Date::parse(const std::string& text) {
    std::string y, m, d;
    if (text.size() == 10 && text[4] == '-' && text[7] == '-') {
        y = text.substr(0, 4);
        m = text.substr(5, 2);
        d = text.substr(8, 2);
    } else if (text.size() == 8) {
        y = text.substr(0, 4);
        m = text.substr(4, 2);
        d = text.substr(6, 2);
    } else {
        return std::nullopt;
    }
    if (!allDigits(y) || !allDigits(m) || !allDigits(d)) {
        return std::nullopt;
    }

    const int year = std::stoi(y);
    const unsigned month = static_cast<unsigned>(std::stoi(m));
    const unsigned day = static_cast<unsigned>(std::stoi(d));
    if (month < 1 || month > 12 || day < 1 || day > lastDayOfMonth(year, month)) {
        return std::nullopt;
    }
    return fromYmd(year, month, day);
}

Date::Ymd Date::toYmd() const {
    int z = days_ + 719468;
    const int era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int y = static_cast<int>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return Ymd{m <= 2 ? y + 1 : y, m, d};
}

int Date::year() const { return toYmd().y; }
unsigned Date::month() const { return toYmd().m; }
unsigned Date::day() const { return toYmd().d; }

std::string Date::toString() const {
    const Ymd ymd = toYmd();
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", ymd.y, ymd.m, ymd.d);
    return std::string(buf);
}

} // namespace astock
