#ifndef LANDCALC_COST_SCHEDULE_HPP
#define LANDCALC_COST_SCHEDULE_HPP

#include "budget.hpp"
#include "period.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace landcalc {

// Category that receives the synthetic acquisition item
inline const char* const kLandAcquisitionCategory = "Land Acquisition";

// A budget item after distribution across periods (amounts are positive costs)
struct CostScheduleItem {
    int64_t fact_id;                        // -1 for the synthetic acquisition item
    std::optional<int64_t> container_id;
    std::string container_label;
    std::string description;
    double total_amount;                    // Sum of placed, inflated period amounts
    std::vector<PeriodAmount> periods;

    CostScheduleItem();
};

struct CostCategory {
    double total;
    std::vector<CostScheduleItem> items;

    CostCategory();
};

struct CostSchedule {
    std::map<std::string, CostCategory> category_summary;
    double total_costs;
    std::vector<double> period_totals;      // One entry per period

    CostSchedule();
};

// Display order of cost categories
const std::vector<std::string>& cost_category_order();

// Map a budget activity to its display category.
// Descriptions mentioning "contingency" win over the activity.
std::string category_for_activity(const std::string& activity, const std::string& description);

// S-curve weights for a cost spread over `period_count` periods.
//
// A logistic curve is sampled at period_count points spread over [-6, 6] and
// scaled by 2 x steepness; the incremental weight of each period is the
// discrete derivative of the curve (the first period takes the first sample).
// Weights are renormalised so they sum to 1.
std::vector<double> scurve_weights(size_t period_count, double steepness);

// Escalate an amount placed in a 1-based period: amount x (1 + rate)^((sequence - 1) / 12)
double apply_inflation(double amount, size_t period_sequence, double annual_rate);

// Distribute one budget item across the projection horizon.
//
// Shares are computed over the item's declared duration; periods past
// max_periods are dropped without redistributing their share, so a truncated
// curve item places less than its full amount. An item whose
// effective duration is one period (or whose method is lump) is placed whole
// in its start period.
std::vector<PeriodAmount> distribute_budget_item(
    double amount,
    size_t start_period,
    int periods_to_complete,
    size_t max_periods,
    TimingMethod timing_method,
    double curve_steepness,
    double inflation_rate
);

/**
 * @brief Build the cost schedule for a projection run
 *
 * @param items Budget items for the project
 * @param period_count Projection horizon in months
 * @param container_filter Optional division filter; also triggers acreage pro-rating
 * @param inflation_rate Portfolio-wide annual cost inflation (fraction)
 * @param acquisitions One-time land purchase records
 * @param acreage Total vs filtered acreage for acquisition pro-rating
 * @return Categorised schedule whose period totals sum to total_costs
 */
CostSchedule build_cost_schedule(
    const std::vector<BudgetItem>& items,
    size_t period_count,
    const std::optional<std::vector<int64_t>>& container_filter,
    std::optional<double> inflation_rate,
    const std::vector<AcquisitionCost>& acquisitions = {},
    const AcreageSplit& acreage = AcreageSplit()
);

} // namespace landcalc

#endif // LANDCALC_COST_SCHEDULE_HPP
