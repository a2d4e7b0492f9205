#ifndef LANDCALC_PARCEL_HPP
#define LANDCALC_PARCEL_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace landcalc {

// Sale assumptions for one parcel, as supplied by the parcel-sale provider
struct ParcelSale {
    int64_t parcel_id;
    std::string parcel_code;
    std::optional<int64_t> container_id;    // Phase/area used for revenue display lines
    std::string container_label;
    std::optional<int64_t> division_id;     // Product division, groups lots for debt and lotbank
    std::optional<size_t> sale_period;      // 1-based; absent excludes the parcel
    double units;
    double acres;
    double gross_revenue;
    double net_revenue;
    double commissions;
    double legal_costs;
    double closing_costs;
    double title_costs;
    double subdivision_costs;               // Cost-based, never escalated

    ParcelSale();

    // Legal + closing + title
    double transaction_costs() const;

    // Units rounded down; a parcel with no units counts as a single sale
    int lot_count() const;
};

} // namespace landcalc

#endif // LANDCALC_PARCEL_HPP
