#include "project.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>

namespace landcalc {

namespace {

const Date kDefaultStartDate(2025, 1, 1);
constexpr double kDefaultDiscountRate = 0.10;

} // anonymous namespace

std::string analysis_type_to_string(AnalysisType type) {
    switch (type) {
        case AnalysisType::LandDevelopment: return "LAND_DEVELOPMENT";
        case AnalysisType::Lotbank: return "LOTBANK";
    }
    return "LAND_DEVELOPMENT";
}

AnalysisType parse_analysis_type(const std::string& text) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "LOTBANK") return AnalysisType::Lotbank;
    if (upper.empty() || upper == "LAND" || upper == "LAND_DEV" || upper == "LAND_DEVELOPMENT") {
        return AnalysisType::LandDevelopment;
    }

    throw ValidationError("Unknown analysis type: '" + text + "'");
}

LotbankTerms::LotbankTerms()
    : management_fee_pct(0.0), default_provision_pct(0.0), underwriting_fee(0.0) {}

ProjectRecord::ProjectRecord()
    : project_id(0), analysis_type(AnalysisType::LandDevelopment) {}

Date ProjectRecord::start_date() const {
    return analysis_start_date.value_or(kDefaultStartDate);
}

DcfAssumptions::DcfAssumptions() : selling_costs_pct(0.0) {}

std::optional<size_t> DcfAssumptions::hold_period_months() const {
    if (hold_period_years && *hold_period_years > 0) {
        return static_cast<size_t>(*hold_period_years) * 12;
    }
    return std::nullopt;
}

double DcfAssumptions::effective_discount_rate() const {
    return discount_rate.value_or(kDefaultDiscountRate);
}

Division::Division() : division_id(0) {}

bool Division::has_lotbank_pricing() const {
    return option_deposit_pct.has_value() && retail_lot_price.has_value();
}

} // namespace landcalc
