#ifndef LANDCALC_METRICS_HPP
#define LANDCALC_METRICS_HPP

#include "absorption.hpp"
#include "cost_schedule.hpp"
#include "period.hpp"
#include "section.hpp"
#include <optional>
#include <vector>

namespace landcalc {

// Scheduled costs bucketed for the summary
struct CostsByCategory {
    double acquisition;
    double planning;
    double development;
    double financing;
    double contingency;
    double other;

    CostsByCategory();
};

struct SummaryMetrics {
    // Revenue
    double total_gross_revenue;
    double total_commissions;
    double total_transaction_costs;
    double total_subdivision_costs;
    double total_revenue_deductions;
    double total_net_revenue;

    // Costs and profit
    double total_costs;
    CostsByCategory costs_by_category;
    double gross_profit;                    // Net revenue less total costs
    std::optional<double> gross_margin;     // Empty when net revenue is not positive

    // Returns
    std::optional<double> irr;              // Annual, from calendar-year buckets
    std::optional<double> npv;              // Monthly series at the equivalent monthly rate
    std::optional<double> equity_multiple;  // Empty when there are no outflows
    double peak_equity;                     // Most negative cumulative cash flow (<= 0)
    std::optional<size_t> payback_period;   // First period with cumulative >= 0

    double total_cash_in;
    double total_cash_out;                  // Absolute value
    double net_cash_flow;
    std::vector<double> cumulative_cash_flow;
    std::vector<double> annual_cash_flows;

    SummaryMetrics();
};

// Internal rate of return per period of `cash_flows`.
// Newton iteration from 10% with a bracketing bisection fallback.
// Empty if the series has no sign change or no root is found.
std::optional<double> irr(const std::vector<double>& cash_flows);

// Net present value with the first flow at t = 0
double npv(double rate, const std::vector<double>& cash_flows);

// (1 + annual)^(1/12) - 1
double monthly_rate_from_annual(double annual_rate);

// Inflows / |outflows|; empty when outflows are zero
std::optional<double> equity_multiple(double total_inflows, double total_outflows);

// Sum every contributing section's line items per period
std::vector<double> build_net_cash_flows(const std::vector<Section>& sections, size_t period_count);

// Sum monthly flows into calendar-year buckets keyed by each period's start date
std::vector<double> aggregate_to_annual(const std::vector<double>& monthly,
                                        const std::vector<Period>& periods);

/**
 * @brief Reduce an assembled projection to investment metrics
 *
 * @param sections Assembled sections
 * @param periods Projection periods
 * @param absorption Revenue schedule (revenue totals)
 * @param costs Cost schedule (cost totals)
 * @param discount_rate Annual discount rate; NPV is computed only when positive
 */
SummaryMetrics calculate_summary_metrics(const std::vector<Section>& sections,
                                         const std::vector<Period>& periods,
                                         const AbsorptionSchedule& absorption,
                                         const CostSchedule& costs,
                                         std::optional<double> discount_rate);

} // namespace landcalc

#endif // LANDCALC_METRICS_HPP
