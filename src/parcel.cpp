#include "parcel.hpp"

namespace landcalc {

ParcelSale::ParcelSale()
    : parcel_id(0),
      units(0.0),
      acres(0.0),
      gross_revenue(0.0),
      net_revenue(0.0),
      commissions(0.0),
      legal_costs(0.0),
      closing_costs(0.0),
      title_costs(0.0),
      subdivision_costs(0.0) {}

double ParcelSale::transaction_costs() const {
    return legal_costs + closing_costs + title_costs;
}

int ParcelSale::lot_count() const {
    int count = static_cast<int>(units);
    return count != 0 ? count : 1;
}

} // namespace landcalc
