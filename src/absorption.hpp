#ifndef LANDCALC_ABSORPTION_HPP
#define LANDCALC_ABSORPTION_HPP

#include "parcel.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace landcalc {

// A parcel sale after escalation, ready to be bucketed by period
struct ScheduledSale {
    int64_t parcel_id;
    std::string parcel_code;
    std::optional<int64_t> container_id;
    std::string container_label;
    std::optional<int64_t> division_id;
    size_t sale_period;             // 1-based
    int units;
    double gross_revenue;
    double net_revenue;
    double commissions;
    double closing_costs;           // Legal + closing + title
    double subdivision_costs;

    ScheduledSale();
};

struct PeriodSales {
    size_t period_index;            // sale_period - 1
    size_t period_sequence;
    std::vector<ScheduledSale> parcels;
    int total_units;
    double total_gross_revenue;
    double total_net_revenue;

    PeriodSales();
};

struct AbsorptionSchedule {
    std::vector<PeriodSales> period_sales;  // Ascending by period
    size_t total_parcels;
    int total_units;
    double total_gross_revenue;
    double total_net_revenue;
    double total_commissions;
    double total_closing_costs;
    double total_subdivision_costs;

    AbsorptionSchedule();
};

// Price escalation factor for a 1-based sale period: (1 + g)^((period - 1) / 12).
// Returns 1 when the growth rate is absent or not positive.
double price_escalation_factor(size_t sale_period, std::optional<double> price_growth_rate);

// Escalate one parcel sale. Returns nullopt for parcels without a sale period
// or with neither units nor acreage.
std::optional<ScheduledSale> schedule_parcel_sale(const ParcelSale& parcel,
                                                  std::optional<double> price_growth_rate);

/**
 * @brief Group parcel sales into per-period revenue buckets
 *
 * Gross revenue, net revenue, commissions and closing costs are escalated by
 * the same factor; subdivision costs are never escalated. Totals are exact
 * sums over the included parcels.
 *
 * @param sales Parcel sale records
 * @param price_growth_rate Annual price growth (fraction), optional
 * @return Schedule with period buckets sorted by sale period
 */
AbsorptionSchedule build_absorption_schedule(const std::vector<ParcelSale>& sales,
                                             std::optional<double> price_growth_rate);

} // namespace landcalc

#endif // LANDCALC_ABSORPTION_HPP
