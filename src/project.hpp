#ifndef LANDCALC_PROJECT_HPP
#define LANDCALC_PROJECT_HPP

#include "period.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace landcalc {

enum class AnalysisType : uint8_t {
    LandDevelopment = 0,
    Lotbank = 1
};

std::string analysis_type_to_string(AnalysisType type);

// LOTBANK selects the lotbank structure; empty, LAND, LAND_DEV and
// LAND_DEVELOPMENT select plain land development. Case-insensitive.
// Throws ValidationError for anything else.
AnalysisType parse_analysis_type(const std::string& text);

// Deal-level lotbank terms (fractions, e.g. 0.006 = 0.6% per year)
struct LotbankTerms {
    double management_fee_pct;
    double default_provision_pct;
    double underwriting_fee;

    LotbankTerms();
};

struct ProjectRecord {
    int64_t project_id;
    std::string project_name;
    std::optional<Date> analysis_start_date;    // Absent means 2025-01-01
    AnalysisType analysis_type;
    LotbankTerms lotbank;

    ProjectRecord();

    Date start_date() const;
};

// Discounted-cash-flow assumptions (fractions)
struct DcfAssumptions {
    std::optional<int> hold_period_years;
    std::optional<double> discount_rate;        // Absent means 0.10
    std::optional<double> price_growth_rate;
    std::optional<double> cost_inflation_rate;
    double selling_costs_pct;

    DcfAssumptions();

    std::optional<size_t> hold_period_months() const;
    double effective_discount_rate() const;
};

// Product division. Lotbank pricing is present only on lotbank deals.
struct Division {
    int64_t division_id;
    std::string display_name;
    std::optional<double> option_deposit_pct;       // Fraction of retail lot price
    std::optional<double> option_deposit_cap_pct;
    std::optional<double> retail_lot_price;
    std::optional<double> premium_pct;

    Division();

    bool has_lotbank_pricing() const;
};

} // namespace landcalc

#endif // LANDCALC_PROJECT_HPP
