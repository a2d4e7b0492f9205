#ifndef LANDCALC_LOAN_HPP
#define LANDCALC_LOAN_HPP

#include "period.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace landcalc {

enum class StructureType : uint8_t {
    Term = 0,
    Revolver = 1
};

std::string structure_type_to_string(StructureType type);

// Accepts TERM / REVOLVER in any case; throws ValidationError otherwise
StructureType parse_structure_type(const std::string& text);

// Loan master record. Percentage fields are stored as entered (6 = 6%).
struct Loan {
    int64_t loan_id;
    std::string loan_name;
    StructureType structure_type;

    double commitment_amount;
    std::optional<double> loan_amount;          // Term loans; falls back to commitment
    double interest_rate_pct;
    std::optional<int> loan_term_months;        // Takes precedence over years
    std::optional<int> loan_term_years;
    int amortization_months;                    // 0 = interest only for the full term
    std::optional<int> amortization_years;      // Used when amortization_months is 0
    int interest_only_months;

    double origination_fee_pct;
    double loan_to_cost_pct;                    // Revolver sizing
    std::optional<double> interest_reserve_inflator;
    std::optional<double> repayment_acceleration;
    double release_price_pct;
    double minimum_release_amount;

    double appraisal_costs;
    double legal_costs;
    double other_closing_costs;
    std::optional<double> net_loan_proceeds;    // Overrides computed term-loan proceeds
    double interest_reserve_amount;             // Term loans: reserve withheld at funding

    std::string draw_trigger_type;              // Revolvers: COST_INCURRED or empty
    std::optional<int64_t> takes_out_loan_id;   // Refinancing link; not supported

    std::vector<int64_t> container_ids;         // Containers the loan is assigned to
    std::optional<Date> loan_start_date;

    Loan();

    double closing_costs() const;

    // Months if given, else years x 12, else the projection horizon
    size_t resolve_term_months(size_t horizon_months) const;

    int resolve_amortization_months() const;

    // Without a filter every loan is in scope; with one, only loans assigned
    // to at least one filtered container
    bool in_scope(const std::optional<std::vector<int64_t>>& container_filter) const;
};

} // namespace landcalc

#endif // LANDCALC_LOAN_HPP
