#ifndef LANDCALC_LOTBANK_HPP
#define LANDCALC_LOTBANK_HPP

#include "absorption.hpp"
#include "project.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace landcalc {

// One lotbank product (a division) with its take-down schedule
struct LotbankProduct {
    int64_t product_id;
    int lot_count;
    double retail_lot_price;
    double deposit_pct;                     // Fractions of retail lot price
    double deposit_cap_pct;
    double premium_pct;
    std::vector<int> lots_remaining_by_period;  // Lots still optioned at the end of each period

    LotbankProduct();

    // Deposit per lot; the rate is capped at deposit_cap_pct
    double deposit_per_lot() const;

    // Lots remaining at the end of a period; the last entry carries forward
    int lots_remaining_at(size_t period) const;
};

// Throws ValidationError when lots_remaining_by_period rises, goes negative,
// or starts above the product's lot count
void validate_lots_remaining(const LotbankProduct& product);

struct LotbankParams {
    std::vector<LotbankProduct> products;
    double management_fee_pct;              // Annual, applied monthly
    double default_provision_pct;
    double underwriting_fee;
    size_t num_periods;

    LotbankParams();
};

struct LotbankProductPeriod {
    size_t period;
    int64_t product_id;
    int lots_remaining;
    double deposit_credit;
    double deposit_outstanding;
    double management_fee;
    double default_provision;

    LotbankProductPeriod();
};

struct LotbankPeriod {
    size_t period;
    double total_deposit_credit;
    double management_fee;
    double default_provision;
    std::vector<LotbankProductPeriod> product_details;

    LotbankPeriod();
};

struct LotbankResult {
    std::vector<LotbankPeriod> periods;
    double initial_deposit_received;
    double total_credits_returned;
    double total_management_fees;
    double total_default_provision;
    double underwriting_fee;

    LotbankResult();
};

/**
 * @brief Option-deposit economics for a lotbank deal
 *
 * Deposits are received at period 0. Each period, the deposit held against a
 * product may not exceed deposit_cap_pct of the remaining lot value; any
 * excess is credited back, and a sold-out product is credited in full.
 * Management fees run on remaining lot value; the default provision runs on
 * the deposit attached to remaining lots, spread over the horizon.
 */
class LotbankEngine {
public:
    LotbankResult calculate(const LotbankParams& params) const;
};

/**
 * @brief Build lotbank products from divisions and the absorption schedule
 *
 * Only divisions with a deposit percentage and retail lot price qualify (and,
 * under a container filter, only filtered divisions). Lot counts are the
 * units the division sells inside the horizon; divisions that sell nothing
 * are skipped.
 */
std::vector<LotbankProduct> build_lotbank_products(
    const std::vector<Division>& divisions,
    const AbsorptionSchedule& absorption,
    size_t num_periods,
    const std::optional<std::vector<int64_t>>& container_filter
);

} // namespace landcalc

#endif // LANDCALC_LOTBANK_HPP
