#include "debt_service.hpp"
#include "errors.hpp"
#include "fixed_point.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace landcalc {

namespace {

double sum_interest(const std::vector<RevolverPeriod>& periods) {
    double total = 0.0;
    for (const auto& p : periods) {
        total += p.accrued_interest;
    }
    return total;
}

} // anonymous namespace

// ============================================================================
// Struct Constructors
// ============================================================================

PeriodCosts::PeriodCosts() : period_index(0), total_costs(0.0) {}

RevolverParams::RevolverParams()
    : loan_to_cost_pct(0.0),
      interest_rate_annual(0.0),
      origination_fee_pct(0.0),
      interest_reserve_inflator(1.0),
      repayment_acceleration(1.0),
      release_price_pct(0.0),
      release_price_minimum(0.0),
      closing_costs(0.0),
      loan_start_period(0),
      loan_term_months(0) {}

RevolverPeriod::RevolverPeriod()
    : period_index(0),
      beginning_balance(0.0),
      cost_draw(0.0),
      accrued_interest(0.0),
      interest_reserve_draw(0.0),
      interest_reserve_balance(0.0),
      origination_cost(0.0),
      release_payments(0.0),
      ending_balance(0.0) {}

double RevolverPeriod::net_cash_flow() const {
    return cost_draw - accrued_interest + interest_reserve_draw - release_payments - origination_cost;
}

RevolverResult::RevolverResult()
    : commitment_amount(0.0),
      total_interest(0.0),
      interest_reserve_funded(0.0),
      origination_fee(0.0),
      closing_costs(0.0),
      total_release_payments(0.0),
      peak_balance(0.0),
      peak_balance_pct(0.0),
      iterations_to_converge(0),
      reserve_converged(false) {}

TermParams::TermParams()
    : loan_amount(0.0),
      interest_rate_annual(0.0),
      amortization_months(0),
      interest_only_months(0),
      loan_term_months(0),
      origination_fee_pct(0.0),
      loan_start_period(0) {}

TermPeriod::TermPeriod()
    : period_index(0),
      beginning_balance(0.0),
      scheduled_payment(0.0),
      interest_component(0.0),
      principal_component(0.0),
      ending_balance(0.0),
      is_io_period(false),
      is_balloon(false),
      balloon_amount(0.0) {}

TermResult::TermResult()
    : loan_amount(0.0),
      total_interest(0.0),
      total_principal(0.0),
      balloon_amount(0.0),
      monthly_payment_io(0.0),
      monthly_payment_amort(0.0) {}

// ============================================================================
// Period Context
// ============================================================================

std::vector<PeriodCosts> build_period_costs(const CostSchedule& costs,
                                            const AbsorptionSchedule& absorption,
                                            const std::vector<Period>& periods) {
    const size_t period_count = periods.size();

    std::map<size_t, std::map<int64_t, int>> lots_by_period;
    std::map<int64_t, int> total_lots_by_division;

    for (const PeriodSales& bucket : absorption.period_sales) {
        for (const ScheduledSale& sale : bucket.parcels) {
            if (!sale.division_id || sale.units <= 0) {
                continue;
            }
            lots_by_period[bucket.period_index][*sale.division_id] += sale.units;
            total_lots_by_division[*sale.division_id] += sale.units;
        }
    }

    std::map<int64_t, double> costs_by_division;
    for (const auto& entry : costs.category_summary) {
        for (const CostScheduleItem& item : entry.second.items) {
            if (item.container_id) {
                costs_by_division[*item.container_id] += item.total_amount;
            }
        }
    }

    int total_lots = 0;
    for (const auto& entry : total_lots_by_division) {
        total_lots += entry.second;
    }
    const double default_cost_per_lot =
        total_lots > 0 ? costs.total_costs / static_cast<double>(total_lots) : 0.0;

    std::map<int64_t, double> cost_per_lot;
    for (const auto& entry : total_lots_by_division) {
        auto it = costs_by_division.find(entry.first);
        if (it == costs_by_division.end() || it->second == 0.0) {
            cost_per_lot[entry.first] = default_cost_per_lot;
        } else {
            cost_per_lot[entry.first] = it->second / static_cast<double>(entry.second);
        }
    }

    std::vector<PeriodCosts> result(period_count);
    for (size_t i = 0; i < period_count; ++i) {
        PeriodCosts& pc = result[i];
        pc.period_index = i;
        pc.date = periods[i].end_date;
        pc.total_costs = i < costs.period_totals.size() ? costs.period_totals[i] : 0.0;
        auto lots = lots_by_period.find(i);
        if (lots != lots_by_period.end()) {
            pc.lots_sold_by_product = lots->second;
        }
        pc.cost_per_lot_by_product = cost_per_lot;
    }
    return result;
}

// ============================================================================
// Helpers
// ============================================================================

double amortizing_payment(double principal, double monthly_rate, int months) {
    if (months <= 0 || principal <= 0.0) {
        return 0.0;
    }
    if (monthly_rate == 0.0) {
        return principal / static_cast<double>(months);
    }
    return principal * monthly_rate / (1.0 - std::pow(1.0 + monthly_rate, -months));
}

double DebtServiceEngine::release_price(double cost_per_lot, double release_pct,
                                        double acceleration, double minimum) {
    return std::max(cost_per_lot * release_pct * acceleration, minimum);
}

// ============================================================================
// Revolver
// ============================================================================

RevolverResult DebtServiceEngine::calculate_revolver(
    const RevolverParams& params,
    const std::vector<PeriodCosts>& period_data
) const {
    if (!params.draw_trigger_type.empty() && params.draw_trigger_type != "COST_INCURRED") {
        throw UnsupportedConfigurationError(
            "draw_trigger_type '" + params.draw_trigger_type + "' (only COST_INCURRED is supported)");
    }

    const double base_costs = std::accumulate(
        period_data.begin(), period_data.end(), 0.0,
        [](double acc, const PeriodCosts& pc) { return acc + pc.total_costs; });
    const double ltc = params.loan_to_cost_pct;
    const double fee_pct = params.origination_fee_pct;
    const double denom = 1.0 - ltc * fee_pct;
    if (denom <= 0.0) {
        throw ValidationError("Loan-to-cost and origination fee leave no loan capacity");
    }
    if (params.interest_reserve_inflator >= 2.0) {
        throw ValidationError("Interest reserve inflator must be below 2.0");
    }

    // inflator 1.2 leaves a 20% cushion: reserve = interest / (2 - 1.2)
    const double reserve_multiplier = 1.0 / (2.0 - params.interest_reserve_inflator);

    auto commitment_for = [&](double reserve) {
        return (base_costs + params.closing_costs + reserve) * ltc / denom;
    };

    auto next_reserve = [&](double reserve) {
        double commitment = commitment_for(reserve);
        auto schedule = generate_revolver_schedule(params, period_data, commitment, reserve,
                                                   commitment * fee_pct);
        return sum_interest(schedule) * reserve_multiplier;
    };

    FixedPointResult solved = solve_fixed_point(
        next_reserve, 0.0, FixedPointOptions(kConvergenceTolerance, kMaxIterations));

    RevolverResult result;
    result.interest_reserve_funded = solved.value;
    result.commitment_amount = commitment_for(solved.value);
    result.origination_fee = result.commitment_amount * fee_pct;
    result.closing_costs = params.closing_costs;
    result.iterations_to_converge = solved.iterations;
    result.reserve_converged = solved.converged;

    result.periods = generate_revolver_schedule(params, period_data, result.commitment_amount,
                                                result.interest_reserve_funded,
                                                result.origination_fee);

    for (const RevolverPeriod& p : result.periods) {
        result.total_interest += p.accrued_interest;
        result.total_release_payments += p.release_payments;
        result.peak_balance = std::max(result.peak_balance, p.ending_balance);
    }
    result.peak_balance_pct =
        result.commitment_amount != 0.0 ? result.peak_balance / result.commitment_amount : 0.0;

    return result;
}

// The reserve is an escrow held by the lender: it is funded from commitment
// capacity and pays interest, but never sits in the loan balance. Cost draws
// are reverse-filled so later periods are funded first.
std::vector<RevolverPeriod> DebtServiceEngine::generate_revolver_schedule(
    const RevolverParams& params,
    const std::vector<PeriodCosts>& period_data,
    double commitment,
    double interest_reserve,
    double origination_fee
) const {
    const double monthly_rate = params.interest_rate_annual / 12.0;
    const size_t term_start = params.loan_start_period;
    const size_t term_end = params.loan_start_period + params.loan_term_months;

    auto in_term = [&](size_t index) { return index >= term_start && index < term_end; };

    // Pass 1: reverse-fill cost draws against the capacity left for costs
    double remaining_capacity =
        std::max(commitment - interest_reserve - origination_fee - params.closing_costs, 0.0);
    std::map<size_t, double> draw_by_period;
    for (auto it = period_data.rbegin(); it != period_data.rend(); ++it) {
        if (!in_term(it->period_index)) {
            continue;
        }
        if (remaining_capacity <= 0.0) {
            break;
        }
        double draw = std::min(it->total_costs, remaining_capacity);
        draw_by_period[it->period_index] = draw;
        remaining_capacity -= draw;
    }

    // Pass 2: roll the balance forward
    std::vector<RevolverPeriod> schedule;
    schedule.reserve(period_data.size());

    double reserve_balance = 0.0;
    double ending_balance = 0.0;

    for (const PeriodCosts& pc : period_data) {
        RevolverPeriod rp;
        rp.period_index = pc.period_index;
        rp.beginning_balance = ending_balance;
        double balance = rp.beginning_balance;

        if (pc.period_index == params.loan_start_period) {
            rp.origination_cost = origination_fee + params.closing_costs;
            reserve_balance += interest_reserve;
            balance += rp.origination_cost;
        }

        if (in_term(pc.period_index)) {
            rp.accrued_interest = rp.beginning_balance * monthly_rate;

            auto draw = draw_by_period.find(pc.period_index);
            rp.cost_draw = draw != draw_by_period.end() ? draw->second : 0.0;
            balance += rp.cost_draw + rp.accrued_interest;

            if (reserve_balance > 0.0 && rp.accrued_interest > 0.0) {
                rp.interest_reserve_draw = std::min(rp.accrued_interest, reserve_balance);
                reserve_balance -= rp.interest_reserve_draw;
            }

            double releases = 0.0;
            for (const auto& sold : pc.lots_sold_by_product) {
                auto cost = pc.cost_per_lot_by_product.find(sold.first);
                double cost_per_lot = cost != pc.cost_per_lot_by_product.end() ? cost->second : 0.0;
                double payment = release_price(cost_per_lot, params.release_price_pct,
                                               params.repayment_acceleration,
                                               params.release_price_minimum) * sold.second;
                rp.release_payments_by_product[sold.first] = payment;
                releases += payment;
            }
            if (releases > 0.0) {
                releases = std::min(releases, std::max(balance, 0.0));
                balance -= releases;
            }
            rp.release_payments = releases;
        }

        rp.interest_reserve_balance = reserve_balance;
        rp.ending_balance = std::max(balance, 0.0);
        ending_balance = rp.ending_balance;
        schedule.push_back(std::move(rp));
    }

    return schedule;
}

// ============================================================================
// Term Loan
// ============================================================================

TermResult DebtServiceEngine::calculate_term(const TermParams& params, size_t num_periods) const {
    TermResult result;
    result.loan_amount = params.loan_amount;
    result.periods.resize(num_periods);

    const double monthly_rate = params.interest_rate_annual / 12.0;
    const size_t start = params.loan_start_period;
    size_t term_months = params.loan_term_months > 0 ? params.loan_term_months : num_periods;
    term_months = start < num_periods ? std::min(term_months, num_periods - start) : 0;
    const int io_months = std::max(params.interest_only_months, 0);
    const int amort_months = std::max(params.amortization_months, 0);

    result.monthly_payment_io = params.loan_amount * monthly_rate;
    result.monthly_payment_amort = amortizing_payment(params.loan_amount, monthly_rate, amort_months);

    double balance = params.loan_amount;

    for (size_t i = 0; i < num_periods; ++i) {
        TermPeriod& tp = result.periods[i];
        tp.period_index = i;

        if (i < start || i - start >= term_months) {
            continue;
        }
        const size_t months_into_loan = i - start;

        tp.beginning_balance = balance;
        tp.interest_component = balance * monthly_rate;
        result.total_interest += tp.interest_component;

        if (amort_months == 0 || months_into_loan < static_cast<size_t>(io_months)) {
            tp.scheduled_payment = tp.interest_component;
            tp.is_io_period = true;
        } else if (balance > 0.0) {
            // The final amortising payment retires only what remains
            tp.scheduled_payment = std::min(result.monthly_payment_amort,
                                            balance + tp.interest_component);
            tp.principal_component = std::min(tp.scheduled_payment - tp.interest_component, balance);
            balance -= tp.principal_component;
            if (balance < 1e-6) {
                balance = 0.0;
            }
            result.total_principal += tp.principal_component;
        }

        tp.ending_balance = balance;

        if (months_into_loan == term_months - 1 && tp.ending_balance > 0.0) {
            tp.is_balloon = true;
            tp.balloon_amount = tp.ending_balance;
            result.balloon_amount += tp.balloon_amount;
            balance = 0.0;
            tp.ending_balance = 0.0;
        }
    }

    return result;
}

std::vector<double> term_cash_flows(const TermResult& result, size_t loan_start_period,
                                    double net_proceeds) {
    std::vector<double> flows(result.periods.size(), 0.0);
    for (const TermPeriod& tp : result.periods) {
        double amount = 0.0;
        if (tp.period_index == loan_start_period) {
            amount += net_proceeds;
        }
        amount -= tp.scheduled_payment;
        if (tp.is_balloon) {
            amount -= tp.balloon_amount;
        }
        flows[tp.period_index] = amount;
    }
    return flows;
}

// ============================================================================
// Loan Translation
// ============================================================================

RevolverParams revolver_params_from_loan(const Loan& loan, const std::vector<Period>& periods) {
    RevolverParams params;
    params.loan_to_cost_pct = loan.loan_to_cost_pct / 100.0;
    params.interest_rate_annual = loan.interest_rate_pct / 100.0;
    params.origination_fee_pct = loan.origination_fee_pct / 100.0;
    params.interest_reserve_inflator = loan.interest_reserve_inflator.value_or(1.0);
    params.repayment_acceleration = loan.repayment_acceleration.value_or(1.0);
    params.release_price_pct = loan.release_price_pct / 100.0;
    params.release_price_minimum = loan.minimum_release_amount;
    params.closing_costs = loan.closing_costs();
    params.loan_start_period = period_index_for_date(periods, loan.loan_start_date);
    params.loan_term_months = loan.resolve_term_months(periods.size());
    params.draw_trigger_type = loan.draw_trigger_type;
    return params;
}

TermParams term_params_from_loan(const Loan& loan, const std::vector<Period>& periods) {
    TermParams params;
    params.loan_amount = loan.loan_amount.value_or(loan.commitment_amount);
    params.interest_rate_annual = loan.interest_rate_pct / 100.0;
    params.amortization_months = loan.resolve_amortization_months();
    params.interest_only_months = loan.interest_only_months;
    params.loan_term_months = loan.resolve_term_months(periods.size());
    params.origination_fee_pct = loan.origination_fee_pct / 100.0;
    params.loan_start_period = period_index_for_date(periods, loan.loan_start_date);
    return params;
}

double resolve_net_loan_proceeds(const Loan& loan, double loan_amount) {
    if (loan.net_loan_proceeds) {
        return *loan.net_loan_proceeds;
    }
    double origination_fee = loan_amount * (loan.origination_fee_pct / 100.0);
    return loan_amount - origination_fee - loan.interest_reserve_amount - loan.closing_costs();
}

} // namespace landcalc
