#include "budget.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>

namespace landcalc {

std::string timing_method_to_string(TimingMethod method) {
    switch (method) {
        case TimingMethod::Lump: return "lump";
        case TimingMethod::Distributed: return "distributed";
        case TimingMethod::Curve: return "curve";
    }
    return "distributed";
}

TimingMethod parse_timing_method(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower.empty() || lower == "distributed") return TimingMethod::Distributed;
    if (lower == "lump") return TimingMethod::Lump;
    if (lower == "curve") return TimingMethod::Curve;

    throw ValidationError("Unknown timing method: '" + text + "'");
}

BudgetItem::BudgetItem()
    : fact_id(0),
      amount(0.0),
      timing_method(TimingMethod::Distributed) {}

size_t BudgetItem::last_period() const {
    if (end_period) {
        return *end_period;
    }
    size_t start = start_period.value_or(1);
    int duration = periods_to_complete.value_or(1);
    if (duration <= 0) {
        duration = 1;
    }
    return start + static_cast<size_t>(duration) - 1;
}

AcquisitionCost::AcquisitionCost()
    : acquisition_id(0), amount(0.0), applied_to_purchase(true) {}

AcreageSplit::AcreageSplit() : total_acres(0.0), filtered_acres(0.0) {}

AcreageSplit::AcreageSplit(double total, double filtered)
    : total_acres(total), filtered_acres(filtered) {}

} // namespace landcalc
