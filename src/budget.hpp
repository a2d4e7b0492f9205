#ifndef LANDCALC_BUDGET_HPP
#define LANDCALC_BUDGET_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace landcalc {

enum class TimingMethod : uint8_t {
    Lump = 0,
    Distributed = 1,
    Curve = 2
};

std::string timing_method_to_string(TimingMethod method);

// Case-insensitive; empty text resolves to Distributed.
// Throws ValidationError for anything else.
TimingMethod parse_timing_method(const std::string& text);

// One funded cost activity from the project budget
struct BudgetItem {
    int64_t fact_id;
    std::optional<int64_t> container_id;    // Division the cost belongs to
    std::string container_label;
    std::string description;
    std::string activity;                   // Raw budget activity, mapped to a display category
    double amount;
    std::optional<size_t> start_period;     // 1-based; absent means period 1
    std::optional<int> periods_to_complete; // Absent or <= 0 means 1
    std::optional<size_t> end_period;       // Explicit end, used only for horizon sizing
    TimingMethod timing_method;
    std::optional<double> curve_steepness;  // Absent means 0.5
    std::optional<double> escalation_rate;  // Annual, stored as a percentage (3 = 3%)

    BudgetItem();

    // 1-based last period this item touches before any horizon truncation
    size_t last_period() const;
};

// One-time land purchase record
struct AcquisitionCost {
    int64_t acquisition_id;
    std::string description;
    double amount;
    bool applied_to_purchase;

    AcquisitionCost();
};

// Parcel acreage totals used to pro-rate acquisition under a container filter
struct AcreageSplit {
    double total_acres;
    double filtered_acres;

    AcreageSplit();
    AcreageSplit(double total, double filtered);
};

} // namespace landcalc

#endif // LANDCALC_BUDGET_HPP
