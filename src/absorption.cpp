#include "absorption.hpp"
#include <cmath>
#include <map>

namespace landcalc {

ScheduledSale::ScheduledSale()
    : parcel_id(0),
      sale_period(1),
      units(0),
      gross_revenue(0.0),
      net_revenue(0.0),
      commissions(0.0),
      closing_costs(0.0),
      subdivision_costs(0.0) {}

PeriodSales::PeriodSales()
    : period_index(0),
      period_sequence(1),
      total_units(0),
      total_gross_revenue(0.0),
      total_net_revenue(0.0) {}

AbsorptionSchedule::AbsorptionSchedule()
    : total_parcels(0),
      total_units(0),
      total_gross_revenue(0.0),
      total_net_revenue(0.0),
      total_commissions(0.0),
      total_closing_costs(0.0),
      total_subdivision_costs(0.0) {}

double price_escalation_factor(size_t sale_period, std::optional<double> price_growth_rate) {
    if (!price_growth_rate || *price_growth_rate <= 0.0 || sale_period <= 1) {
        return 1.0;
    }
    double years = static_cast<double>(sale_period - 1) / 12.0;
    return std::pow(1.0 + *price_growth_rate, years);
}

std::optional<ScheduledSale> schedule_parcel_sale(const ParcelSale& parcel,
                                                  std::optional<double> price_growth_rate) {
    if (!parcel.sale_period || *parcel.sale_period == 0) {
        return std::nullopt;
    }
    if (parcel.units == 0.0 && parcel.acres == 0.0) {
        return std::nullopt;
    }

    const double factor = price_escalation_factor(*parcel.sale_period, price_growth_rate);

    ScheduledSale sale;
    sale.parcel_id = parcel.parcel_id;
    sale.parcel_code = parcel.parcel_code;
    sale.container_id = parcel.container_id;
    sale.container_label = parcel.container_label;
    sale.division_id = parcel.division_id;
    sale.sale_period = *parcel.sale_period;
    sale.units = parcel.lot_count();
    sale.gross_revenue = parcel.gross_revenue * factor;
    sale.net_revenue = parcel.net_revenue * factor;
    sale.commissions = parcel.commissions * factor;
    sale.closing_costs = parcel.transaction_costs() * factor;
    sale.subdivision_costs = parcel.subdivision_costs;
    return sale;
}

AbsorptionSchedule build_absorption_schedule(const std::vector<ParcelSale>& sales,
                                             std::optional<double> price_growth_rate) {
    AbsorptionSchedule schedule;
    std::map<size_t, PeriodSales> by_period;

    for (const ParcelSale& parcel : sales) {
        std::optional<ScheduledSale> sale = schedule_parcel_sale(parcel, price_growth_rate);
        if (!sale) {
            continue;
        }

        PeriodSales& bucket = by_period[sale->sale_period];
        bucket.period_sequence = sale->sale_period;
        bucket.period_index = sale->sale_period - 1;
        bucket.total_units += sale->units;
        bucket.total_gross_revenue += sale->gross_revenue;
        bucket.total_net_revenue += sale->net_revenue;

        schedule.total_parcels++;
        schedule.total_units += sale->units;
        schedule.total_gross_revenue += sale->gross_revenue;
        schedule.total_net_revenue += sale->net_revenue;
        schedule.total_commissions += sale->commissions;
        schedule.total_closing_costs += sale->closing_costs;
        schedule.total_subdivision_costs += sale->subdivision_costs;

        bucket.parcels.push_back(std::move(*sale));
    }

    schedule.period_sales.reserve(by_period.size());
    for (auto& entry : by_period) {
        schedule.period_sales.push_back(std::move(entry.second));
    }
    return schedule;
}

} // namespace landcalc
