#pragma once

#include <optional>
#include <string>

namespace astock {

// Calendar day stored as a count of days since 1970-01-01.
class Date {
public:
    Date() = default;
    explicit Date(int days_since_epoch) : days_(days_since_epoch) {}

    static Date fromYmd(int year, unsigned month, unsigned day);

    // Accepts "YYYY-MM-DD" and "YYYYMMDD"
    static std::optional<Date> parse(const std::string& text);

    int year() const;
    unsigned month() const;
    unsigned day() const;

    int days() const { return days_; }
    Date addDays(int n) const { return Date(days_ + n); }
    int daysUntil(const Date& other) const { return other.days_ - days_; }

    std::string toString() const;

    bool operator==(const Date& o) const { return days_ == o.days_; }
    bool operator!=(const Date& o) const { return days_ != o.days_; }
    bool operator<(const Date& o) const { return days_ < o.days_; }
    bool operator<=(const Date& o) const { return days_ <= o.days_; }
    bool operator>(const Date& o) const { return days_ > o.days_; }
    bool operator>=(const Date& o) const { return days_ >= o.days_; }

private:
    struct Ymd {
        int y;
        unsigned m;
        unsigned d;
    };
    Ymd toYmd() const;

    int days_ = 0;
};

} // namespace astock
