#ifndef LANDCALC_DEBT_SERVICE_HPP
#define LANDCALC_DEBT_SERVICE_HPP

#include "absorption.hpp"
#include "cost_schedule.hpp"
#include "loan.hpp"
#include "period.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace landcalc {

// Per-period cost and lot-sale context for the debt and lotbank engines
struct PeriodCosts {
    size_t period_index;
    Date date;                                          // Period end date
    double total_costs;
    std::map<int64_t, int> lots_sold_by_product;        // Keyed by division
    std::map<int64_t, double> cost_per_lot_by_product;

    PeriodCosts();
};

/**
 * @brief Build the per-period context consumed by the debt service engine
 *
 * Lots are grouped by the parcel's division. Cost per lot is the division's
 * scheduled budget divided by its lots, falling back to the project total
 * over all lots when the division carries no budget of its own.
 */
std::vector<PeriodCosts> build_period_costs(const CostSchedule& costs,
                                            const AbsorptionSchedule& absorption,
                                            const std::vector<Period>& periods);

// ============================================================================
// Revolver
// ============================================================================

// Revolver terms in engine units (fractions, 0-based start period)
struct RevolverParams {
    double loan_to_cost_pct;
    double interest_rate_annual;
    double origination_fee_pct;
    double interest_reserve_inflator;
    double repayment_acceleration;
    double release_price_pct;
    double release_price_minimum;
    double closing_costs;
    size_t loan_start_period;
    size_t loan_term_months;
    std::string draw_trigger_type;

    RevolverParams();
};

struct RevolverPeriod {
    size_t period_index;
    double beginning_balance;
    double cost_draw;
    double accrued_interest;
    double interest_reserve_draw;
    double interest_reserve_balance;
    double origination_cost;
    double release_payments;
    std::map<int64_t, double> release_payments_by_product;
    double ending_balance;

    RevolverPeriod();

    // Cash effect on the project: draws and reserve-paid interest in,
    // accrued interest, releases and origination out
    double net_cash_flow() const;
};

struct RevolverResult {
    std::vector<RevolverPeriod> periods;
    double commitment_amount;
    double total_interest;
    double interest_reserve_funded;
    double origination_fee;
    double closing_costs;
    double total_release_payments;
    double peak_balance;
    double peak_balance_pct;
    int iterations_to_converge;
    bool reserve_converged;

    RevolverResult();
};

// ============================================================================
// Term Loan
// ============================================================================

struct TermParams {
    double loan_amount;
    double interest_rate_annual;
    int amortization_months;
    int interest_only_months;
    size_t loan_term_months;
    double origination_fee_pct;
    size_t loan_start_period;

    TermParams();
};

struct TermPeriod {
    size_t period_index;
    double beginning_balance;
    double scheduled_payment;
    double interest_component;
    double principal_component;
    double ending_balance;
    bool is_io_period;
    bool is_balloon;
    double balloon_amount;

    TermPeriod();
};

struct TermResult {
    std::vector<TermPeriod> periods;
    double loan_amount;
    double total_interest;
    double total_principal;
    double balloon_amount;
    double monthly_payment_io;
    double monthly_payment_amort;

    TermResult();
};

// Level payment that amortises `principal` over `months` at `monthly_rate`
double amortizing_payment(double principal, double monthly_rate, int months);

// ============================================================================
// Engine
// ============================================================================

class DebtServiceEngine {
public:
    static constexpr int kMaxIterations = 15;
    static constexpr double kConvergenceTolerance = 1.0;

    /**
     * @brief Size and schedule a construction revolver
     *
     * The commitment covers loan-to-cost of (costs + closing + reserve), with
     * the origination fee solved analytically. The interest reserve is found
     * with solve_fixed_point. Throws UnsupportedConfigurationError for draw
     * triggers other than COST_INCURRED.
     */
    RevolverResult calculate_revolver(const RevolverParams& params,
                                      const std::vector<PeriodCosts>& period_data) const;

    // Interest-only then amortising schedule with a balloon at maturity
    TermResult calculate_term(const TermParams& params, size_t num_periods) const;

    // Release price per lot = max(cost x pct x acceleration, minimum)
    static double release_price(double cost_per_lot, double release_pct,
                                double acceleration, double minimum);

private:
    std::vector<RevolverPeriod> generate_revolver_schedule(
        const RevolverParams& params,
        const std::vector<PeriodCosts>& period_data,
        double commitment,
        double interest_reserve,
        double origination_fee) const;
};

// Translate loan master records (percentages) into engine parameters
RevolverParams revolver_params_from_loan(const Loan& loan, const std::vector<Period>& periods);
TermParams term_params_from_loan(const Loan& loan, const std::vector<Period>& periods);

// Stated net proceeds, else amount less fee, interest reserve and closing costs
double resolve_net_loan_proceeds(const Loan& loan, double loan_amount);

// Per-period project cash effect of a term loan
std::vector<double> term_cash_flows(const TermResult& result, size_t loan_start_period,
                                    double net_proceeds);

} // namespace landcalc

#endif // LANDCALC_DEBT_SERVICE_HPP
