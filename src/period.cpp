#include "period.hpp"
#include "errors.hpp"
#include <algorithm>
#include <array>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace landcalc {

// ============================================================================
// Date Implementation
// ============================================================================

Date::Date() : year(1970), month(1), day(1) {}

Date::Date(int y, int m, int d) : year(y), month(m), day(d) {
    if (m < 1 || m > 12) {
        throw ValidationError("Month must be between 1 and 12, got " + std::to_string(m));
    }
    if (d < 1 || d > days_in_month(y, m)) {
        throw ValidationError("Day " + std::to_string(d) + " out of range for " +
                              std::to_string(y) + "-" + std::to_string(m));
    }
}

bool Date::operator==(const Date& other) const {
    return year == other.year && month == other.month && day == other.day;
}

bool Date::operator!=(const Date& other) const {
    return !(*this == other);
}

bool Date::operator<(const Date& other) const {
    if (year != other.year) return year < other.year;
    if (month != other.month) return month < other.month;
    return day < other.day;
}

bool Date::operator<=(const Date& other) const {
    return !(other < *this);
}

bool Date::operator>=(const Date& other) const {
    return !(*this < other);
}

bool Date::is_leap_year(int y) {
    return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
}

int Date::days_in_month(int y, int m) {
    static const std::array<int, 12> kDays = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap_year(y)) {
        return 29;
    }
    return kDays[static_cast<size_t>(m - 1)];
}

Date Date::add_months(int months) const {
    int total = (year * 12 + (month - 1)) + months;
    int y = total / 12;
    int m = total % 12 + 1;
    int d = std::min(day, days_in_month(y, m));
    return Date(y, m, d);
}

Date Date::end_of_month() const {
    return Date(year, month, days_in_month(year, month));
}

std::string Date::to_iso() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << year << "-"
        << std::setw(2) << month << "-" << std::setw(2) << day;
    return oss.str();
}

std::string Date::month_label() const {
    static const std::array<const char*, 12> kNames = {
        "Jan", "Feb", "Mar", "Apr", "May", "Jun",
        "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    return std::string(kNames[static_cast<size_t>(month - 1)]) + " " + std::to_string(year);
}

Date Date::parse_iso(const std::string& text) {
    int y = 0;
    int m = 0;
    int d = 0;
    char dash1 = 0;
    char dash2 = 0;
    std::istringstream iss(text);
    iss >> y >> dash1 >> m >> dash2 >> d;
    if (!iss && !iss.eof()) {
        throw ValidationError("Malformed date: '" + text + "'");
    }
    if (dash1 != '-' || dash2 != '-' || y <= 0) {
        throw ValidationError("Malformed date: '" + text + "' (expected YYYY-MM-DD)");
    }
    return Date(y, m, d);
}

// ============================================================================
// Period Generation
// ============================================================================

std::vector<Period> generate_periods(const Date& start_date, size_t period_count) {
    if (period_count == 0) {
        throw ValidationError("Period count must be at least 1");
    }

    std::vector<Period> periods;
    periods.reserve(period_count);

    for (size_t i = 0; i < period_count; ++i) {
        Period p;
        p.index = i;
        p.sequence = i + 1;
        p.start_date = start_date.add_months(static_cast<int>(i));
        p.end_date = p.start_date.end_of_month();
        p.label = p.start_date.month_label();
        periods.push_back(p);
    }

    return periods;
}

size_t period_index_for_date(const std::vector<Period>& periods,
                             const std::optional<Date>& target) {
    if (!target) {
        return 0;
    }
    for (const Period& p : periods) {
        if (p.end_date >= *target) {
            return p.index;
        }
    }
    return periods.empty() ? 0 : periods.size() - 1;
}

// ============================================================================
// Horizon Resolution
// ============================================================================

HorizonInputs::HorizonInputs()
    : max_budget_period(0),
      max_sale_period(0),
      include_financing(false) {}

size_t resolve_period_count(const Date& start_date, const HorizonInputs& inputs) {
    size_t required = std::max({inputs.max_budget_period, inputs.max_sale_period, size_t(1)});

    if (!inputs.include_financing) {
        return required;
    }

    if (inputs.hold_period_months) {
        required = std::max(required, *inputs.hold_period_months);
    }

    // Each extension can move later loan start dates, so remap against the
    // current horizon every time it grows.
    std::vector<Period> periods = generate_periods(start_date, required);
    for (const auto& loan : inputs.loans) {
        size_t loan_start = period_index_for_date(periods, loan.start_date);
        size_t needed = loan_start + loan.term_months;
        if (needed > required) {
            required = needed;
            periods = generate_periods(start_date, required);
        }
    }

    if (inputs.hold_period_months) {
        required = std::min(required, *inputs.hold_period_months);
    }

    return std::max(required, size_t(1));
}

} // namespace landcalc
