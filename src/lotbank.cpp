#include "lotbank.hpp"
#include "errors.hpp"
#include <algorithm>

namespace landcalc {

LotbankProduct::LotbankProduct()
    : product_id(0),
      lot_count(0),
      retail_lot_price(0.0),
      deposit_pct(0.0),
      deposit_cap_pct(0.0),
      premium_pct(0.0) {}

double LotbankProduct::deposit_per_lot() const {
    return std::min(deposit_pct, deposit_cap_pct) * retail_lot_price;
}

int LotbankProduct::lots_remaining_at(size_t period) const {
    if (lots_remaining_by_period.empty()) {
        return lot_count;
    }
    if (period < lots_remaining_by_period.size()) {
        return lots_remaining_by_period[period];
    }
    return lots_remaining_by_period.back();
}

void validate_lots_remaining(const LotbankProduct& product) {
    int previous = product.lot_count;
    for (size_t i = 0; i < product.lots_remaining_by_period.size(); ++i) {
        int remaining = product.lots_remaining_by_period[i];
        if (remaining < 0) {
            throw ValidationError("Product " + std::to_string(product.product_id) +
                                  ": lots remaining is negative in period " + std::to_string(i));
        }
        if (remaining > previous) {
            throw ValidationError("Product " + std::to_string(product.product_id) +
                                  ": lots remaining increases in period " + std::to_string(i));
        }
        previous = remaining;
    }
}

LotbankParams::LotbankParams()
    : management_fee_pct(0.0),
      default_provision_pct(0.0),
      underwriting_fee(0.0),
      num_periods(0) {}

LotbankProductPeriod::LotbankProductPeriod()
    : period(0),
      product_id(0),
      lots_remaining(0),
      deposit_credit(0.0),
      deposit_outstanding(0.0),
      management_fee(0.0),
      default_provision(0.0) {}

LotbankPeriod::LotbankPeriod()
    : period(0),
      total_deposit_credit(0.0),
      management_fee(0.0),
      default_provision(0.0) {}

LotbankResult::LotbankResult()
    : initial_deposit_received(0.0),
      total_credits_returned(0.0),
      total_management_fees(0.0),
      total_default_provision(0.0),
      underwriting_fee(0.0) {}

// ============================================================================
// LotbankEngine Implementation
// ============================================================================

LotbankResult LotbankEngine::calculate(const LotbankParams& params) const {
    LotbankResult result;
    result.underwriting_fee = params.underwriting_fee;

    std::vector<double> outstanding(params.products.size(), 0.0);
    for (size_t p = 0; p < params.products.size(); ++p) {
        const LotbankProduct& product = params.products[p];
        validate_lots_remaining(product);
        outstanding[p] = product.deposit_per_lot() * static_cast<double>(product.lot_count);
        result.initial_deposit_received += outstanding[p];
    }

    const double provision_periods = static_cast<double>(std::max(params.num_periods, size_t(1)));

    result.periods.resize(params.num_periods);
    for (size_t t = 0; t < params.num_periods; ++t) {
        LotbankPeriod& period = result.periods[t];
        period.period = t;

        for (size_t p = 0; p < params.products.size(); ++p) {
            const LotbankProduct& product = params.products[p];

            LotbankProductPeriod detail;
            detail.period = t;
            detail.product_id = product.product_id;
            detail.lots_remaining = product.lots_remaining_at(t);

            const double remaining = static_cast<double>(detail.lots_remaining);
            if (detail.lots_remaining <= 0) {
                detail.deposit_credit = outstanding[p];
            } else {
                double allowed = remaining * product.retail_lot_price * product.deposit_cap_pct;
                if (outstanding[p] > allowed) {
                    detail.deposit_credit = outstanding[p] - allowed;
                }
            }
            outstanding[p] -= detail.deposit_credit;
            detail.deposit_outstanding = outstanding[p];

            detail.management_fee =
                remaining * product.retail_lot_price * params.management_fee_pct / 12.0;
            detail.default_provision =
                product.deposit_per_lot() * remaining * params.default_provision_pct / provision_periods;

            period.total_deposit_credit += detail.deposit_credit;
            period.management_fee += detail.management_fee;
            period.default_provision += detail.default_provision;
            period.product_details.push_back(detail);
        }

        result.total_credits_returned += period.total_deposit_credit;
        result.total_management_fees += period.management_fee;
        result.total_default_provision += period.default_provision;
    }

    return result;
}

// ============================================================================
// Product Construction
// ============================================================================

std::vector<LotbankProduct> build_lotbank_products(
    const std::vector<Division>& divisions,
    const AbsorptionSchedule& absorption,
    size_t num_periods,
    const std::optional<std::vector<int64_t>>& container_filter
) {
    std::vector<LotbankProduct> products;

    for (const Division& division : divisions) {
        if (!division.has_lotbank_pricing()) {
            continue;
        }
        if (container_filter &&
            std::find(container_filter->begin(), container_filter->end(),
                      division.division_id) == container_filter->end()) {
            continue;
        }

        std::vector<int> sold(num_periods, 0);
        for (const PeriodSales& bucket : absorption.period_sales) {
            if (bucket.period_index >= num_periods) {
                continue;
            }
            for (const ScheduledSale& sale : bucket.parcels) {
                if (sale.division_id && *sale.division_id == division.division_id) {
                    sold[bucket.period_index] += sale.units;
                }
            }
        }

        int total_lots = 0;
        for (int s : sold) {
            total_lots += s;
        }
        if (total_lots <= 0) {
            continue;
        }

        LotbankProduct product;
        product.product_id = division.division_id;
        product.lot_count = total_lots;
        product.retail_lot_price = *division.retail_lot_price;
        product.deposit_pct = *division.option_deposit_pct;
        product.deposit_cap_pct = division.option_deposit_cap_pct.value_or(*division.option_deposit_pct);
        product.premium_pct = division.premium_pct.value_or(0.0);

        int remaining = total_lots;
        product.lots_remaining_by_period.reserve(num_periods);
        for (int s : sold) {
            remaining -= s;
            product.lots_remaining_by_period.push_back(remaining);
        }

        products.push_back(std::move(product));
    }

    return products;
}

} // namespace landcalc
