#include "cost_schedule.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <numeric>

namespace landcalc {

namespace {

constexpr double kDefaultCurveSteepness = 0.5;

std::string to_lower(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool passes_filter(const BudgetItem& item,
                   const std::optional<std::vector<int64_t>>& container_filter) {
    if (!container_filter) {
        return true;
    }
    if (!item.container_id) {
        return false;
    }
    return std::find(container_filter->begin(), container_filter->end(),
                     *item.container_id) != container_filter->end();
}

std::string acquisition_description(double proportion) {
    if (proportion >= 1.0) {
        return "Land Acquisition";
    }
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "Land Acquisition (%.0f%% allocation)", proportion * 100.0);
    return buffer;
}

} // anonymous namespace

// ============================================================================
// Struct Constructors
// ============================================================================

CostScheduleItem::CostScheduleItem() : fact_id(0), total_amount(0.0) {}

CostCategory::CostCategory() : total(0.0) {}

CostSchedule::CostSchedule() : total_costs(0.0) {}

// ============================================================================
// Categorisation
// ============================================================================

const std::vector<std::string>& cost_category_order() {
    static const std::vector<std::string> kOrder = {
        "Land Acquisition",
        "Planning & Engineering",
        "Development Costs",
        "Improvement Costs",
        "Operating Costs",
        "Financing Costs",
        "Disposition Costs",
        "Contingency",
        "Other Costs"
    };
    return kOrder;
}

std::string category_for_activity(const std::string& activity, const std::string& description) {
    if (to_lower(description).find("contingency") != std::string::npos) {
        return "Contingency";
    }
    if (activity.empty()) {
        return "Other Costs";
    }

    const std::string key = to_lower(activity);
    if (key == "acquisition") return "Land Acquisition";
    if (key == "planning" || key == "engineering" || key == "planning & engineering") {
        return "Planning & Engineering";
    }
    if (key == "improvement" || key == "development") return "Development Costs";
    if (key == "operations") return "Operating Costs";
    if (key == "financing") return "Financing Costs";
    if (key == "disposition" || key == "sales") return "Disposition Costs";

    return "Development Costs";
}

// ============================================================================
// Distribution
// ============================================================================

std::vector<double> scurve_weights(size_t period_count, double steepness) {
    if (period_count == 0) {
        return {};
    }
    if (period_count == 1) {
        return {1.0};
    }

    std::vector<double> cumulative(period_count);
    for (size_t i = 0; i < period_count; ++i) {
        double x = (static_cast<double>(i) / static_cast<double>(period_count - 1)) * 12.0 - 6.0;
        x *= steepness * 2.0;
        cumulative[i] = 1.0 / (1.0 + std::exp(-x));
    }

    std::vector<double> weights(period_count);
    weights[0] = cumulative[0];
    for (size_t i = 1; i < period_count; ++i) {
        weights[i] = cumulative[i] - cumulative[i - 1];
    }

    // The logistic is strictly positive, so the sum is too
    double sum = std::accumulate(weights.begin(), weights.end(), 0.0);
    for (double& w : weights) {
        w /= sum;
    }
    return weights;
}

double apply_inflation(double amount, size_t period_sequence, double annual_rate) {
    if (annual_rate == 0.0 || period_sequence <= 1) {
        return amount;
    }
    double years = static_cast<double>(period_sequence - 1) / 12.0;
    return amount * std::pow(1.0 + annual_rate, years);
}

std::vector<PeriodAmount> distribute_budget_item(
    double amount,
    size_t start_period,
    int periods_to_complete,
    size_t max_periods,
    TimingMethod timing_method,
    double curve_steepness,
    double inflation_rate
) {
    std::vector<PeriodAmount> placed;

    size_t start = std::max(start_period, size_t(1));
    size_t duration = periods_to_complete > 0 ? static_cast<size_t>(periods_to_complete) : 1;
    if (start > max_periods) {
        return placed;
    }

    size_t end = std::min(start + duration - 1, max_periods);
    size_t effective = end - start + 1;

    auto place = [&](size_t sequence, double share) {
        placed.emplace_back(sequence - 1, apply_inflation(share, sequence, inflation_rate));
    };

    if (timing_method == TimingMethod::Lump || effective == 1) {
        place(start, amount);
        return placed;
    }

    placed.reserve(effective);
    if (timing_method == TimingMethod::Curve) {
        std::vector<double> weights = scurve_weights(duration, curve_steepness);
        for (size_t i = 0; i < effective; ++i) {
            place(start + i, amount * weights[i]);
        }
    } else {
        double share = amount / static_cast<double>(duration);
        for (size_t i = 0; i < effective; ++i) {
            place(start + i, share);
        }
    }
    return placed;
}

// ============================================================================
// Schedule Builder
// ============================================================================

CostSchedule build_cost_schedule(
    const std::vector<BudgetItem>& items,
    size_t period_count,
    const std::optional<std::vector<int64_t>>& container_filter,
    std::optional<double> inflation_rate,
    const std::vector<AcquisitionCost>& acquisitions,
    const AcreageSplit& acreage
) {
    CostSchedule schedule;
    schedule.period_totals.assign(period_count, 0.0);

    auto record = [&](const std::string& category, CostScheduleItem entry) {
        for (const PeriodAmount& pa : entry.periods) {
            schedule.period_totals[pa.period_index] += pa.amount;
            entry.total_amount += pa.amount;
        }
        CostCategory& bucket = schedule.category_summary[category];
        bucket.total += entry.total_amount;
        schedule.total_costs += entry.total_amount;
        bucket.items.push_back(std::move(entry));
    };

    // Acquisition goes first so it leads the Land Acquisition category
    double acquisition_total = 0.0;
    for (const AcquisitionCost& acq : acquisitions) {
        if (acq.applied_to_purchase && acq.amount > 0.0) {
            acquisition_total += acq.amount;
        }
    }
    if (acquisition_total > 0.0 && period_count > 0) {
        double proportion = 1.0;
        if (container_filter && acreage.total_acres > 0.0) {
            proportion = acreage.filtered_acres / acreage.total_acres;
        }
        double allocated = acquisition_total * proportion;
        if (allocated > 0.0) {
            CostScheduleItem entry;
            entry.fact_id = -1;
            entry.description = acquisition_description(proportion);
            entry.periods.emplace_back(0, allocated);
            record(kLandAcquisitionCategory, std::move(entry));
        }
    }

    const double portfolio_rate = inflation_rate.value_or(0.0);

    for (const BudgetItem& item : items) {
        if (item.amount <= 0.0 || !passes_filter(item, container_filter)) {
            continue;
        }

        double rate = item.escalation_rate ? *item.escalation_rate / 100.0 : portfolio_rate;

        CostScheduleItem entry;
        entry.fact_id = item.fact_id;
        entry.container_id = item.container_id;
        entry.container_label = item.container_label;
        entry.description = item.description;
        entry.periods = distribute_budget_item(
            item.amount,
            item.start_period.value_or(1),
            item.periods_to_complete.value_or(1),
            period_count,
            item.timing_method,
            item.curve_steepness.value_or(kDefaultCurveSteepness),
            rate
        );
        if (entry.periods.empty()) {
            continue;
        }

        record(category_for_activity(item.activity, item.description), std::move(entry));
    }

    return schedule;
}

} // namespace landcalc
