#include "loan.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>

namespace landcalc {

std::string structure_type_to_string(StructureType type) {
    switch (type) {
        case StructureType::Term: return "TERM";
        case StructureType::Revolver: return "REVOLVER";
    }
    return "TERM";
}

StructureType parse_structure_type(const std::string& text) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TERM") return StructureType::Term;
    if (upper == "REVOLVER") return StructureType::Revolver;

    throw ValidationError("Unknown loan structure type: '" + text + "'");
}

Loan::Loan()
    : loan_id(0),
      structure_type(StructureType::Term),
      commitment_amount(0.0),
      interest_rate_pct(0.0),
      amortization_months(0),
      interest_only_months(0),
      origination_fee_pct(0.0),
      loan_to_cost_pct(0.0),
      release_price_pct(0.0),
      minimum_release_amount(0.0),
      appraisal_costs(0.0),
      legal_costs(0.0),
      other_closing_costs(0.0),
      interest_reserve_amount(0.0) {}

double Loan::closing_costs() const {
    return appraisal_costs + legal_costs + other_closing_costs;
}

size_t Loan::resolve_term_months(size_t horizon_months) const {
    if (loan_term_months && *loan_term_months > 0) {
        return static_cast<size_t>(*loan_term_months);
    }
    if (loan_term_years && *loan_term_years > 0) {
        return static_cast<size_t>(*loan_term_years) * 12;
    }
    return horizon_months;
}

int Loan::resolve_amortization_months() const {
    if (amortization_months > 0) {
        return amortization_months;
    }
    if (amortization_years && *amortization_years > 0) {
        return *amortization_years * 12;
    }
    return 0;
}

bool Loan::in_scope(const std::optional<std::vector<int64_t>>& container_filter) const {
    if (!container_filter) {
        return true;
    }
    for (int64_t id : container_ids) {
        if (std::find(container_filter->begin(), container_filter->end(), id) != container_filter->end()) {
            return true;
        }
    }
    return false;
}

} // namespace landcalc
