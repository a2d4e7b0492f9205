#ifndef LANDCALC_PERIOD_HPP
#define LANDCALC_PERIOD_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace landcalc {

// Calendar date (proleptic Gregorian), no time-of-day component
struct Date {
    int year;
    int month;      // 1-12
    int day;        // 1-31

    Date();
    Date(int y, int m, int d);

    bool operator==(const Date& other) const;
    bool operator!=(const Date& other) const;
    bool operator<(const Date& other) const;
    bool operator<=(const Date& other) const;
    bool operator>=(const Date& other) const;

    // Add calendar months, clipping the day to the target month's length
    Date add_months(int months) const;

    // Last day of this date's month
    Date end_of_month() const;

    // YYYY-MM-DD
    std::string to_iso() const;

    // "Jan 2025"
    std::string month_label() const;

    // Parse YYYY-MM-DD (anything after the date, e.g. a time part, is ignored)
    // Throws ValidationError on malformed input
    static Date parse_iso(const std::string& text);

    static bool is_leap_year(int year);
    static int days_in_month(int year, int month);
};

// Amount attributed to one period; sparse series omit zero entries
struct PeriodAmount {
    size_t period_index;    // 0-based
    double amount;

    PeriodAmount() : period_index(0), amount(0.0) {}
    PeriodAmount(size_t index, double value) : period_index(index), amount(value) {}
};

// One monthly calculation period
struct Period {
    size_t index;           // 0-based
    size_t sequence;        // 1-based
    Date start_date;
    Date end_date;          // Last day of the month
    std::string label;
};

// Build the ordered monthly period sequence.
// Period i begins at start_date + i months and ends on the last day of that month.
// Throws ValidationError when period_count is zero.
std::vector<Period> generate_periods(const Date& start_date, size_t period_count);

// Map a date to the first period whose end date is on or after it.
// Missing date maps to period 0; a date past the horizon maps to the last period.
size_t period_index_for_date(const std::vector<Period>& periods,
                             const std::optional<Date>& target);

// Inputs to the horizon calculation, gathered by the engine
struct HorizonInputs {
    size_t max_budget_period;                       // Latest budget end period (1-based)
    size_t max_sale_period;                         // Latest parcel sale period (1-based)
    std::optional<size_t> hold_period_months;       // DCF hold horizon
    bool include_financing;

    // (start date, term months) per in-scope loan; used only with financing
    struct LoanSpan {
        std::optional<Date> start_date;
        size_t term_months;
    };
    std::vector<LoanSpan> loans;

    HorizonInputs();
};

// Resolve the projection length in months.
//
// Base = max(latest budget period, latest sale period, 1). With financing the
// base is first raised to the hold period, then extended so every loan fits
// (loan start period + term months), and only then clipped to the hold period.
size_t resolve_period_count(const Date& start_date, const HorizonInputs& inputs);

} // namespace landcalc

#endif // LANDCALC_PERIOD_HPP
