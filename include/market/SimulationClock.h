#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "common/Date.h"

namespace astock {
namespace market {

// Raised when simulation code asks for data stamped after the current
// simulated date. Fatal to the run.
class CausalityViolation : public std::logic_error {
public:
    CausalityViolation(const std::string& what_arg, Date requested, std::optional<Date> clock_date)
        : std::logic_error(what_arg), requested_(requested), clock_date_(clock_date) {}

    Date requested() const { return requested_; }
    std::optional<Date> clockDate() const { return clock_date_; }

private:
    Date requested_;
    std::optional<Date> clock_date_;
};

// Single source of "now" shared by every data store in a run.
class SimulationClock {
public:
    bool started() const { return current_.has_value(); }

    Date now() const {
        if (!current_) {
            throw std::logic_error("SimulationClock has not been started");
        }
        return *current_;
    }

    // Time only moves forward
    void advanceTo(const Date& date) {
        if (current_ && date <= *current_) {
            throw std::logic_error("SimulationClock cannot move from " + current_->toString() +
                                   " to " + date.toString());
        }
        current_ = date;
    }

    void reset() { current_.reset(); }

    // Precondition on every guarded lookup
    void require(const Date& requested, const std::string& what) const {
        if (!current_) {
            throw CausalityViolation(
                "look-ahead: " + what + " for " + requested.toString() + " before the clock started",
                requested, current_);
        }
        if (requested > *current_) {
            throw CausalityViolation(
                "look-ahead: " + what + " for " + requested.toString() +
                " while current date is " + current_->toString(),
                requested, current_);
        }
    }

private:
    std::optional<Date> current_;
};

} // namespace market
} // namespace astock
