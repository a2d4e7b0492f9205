#include "json_writer.hpp"
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace landcalc {
namespace io {

namespace {

template <typename T>
json nullable(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

json series_to_json(const std::vector<PeriodAmount>& series) {
    json out = json::array();
    for (const PeriodAmount& pa : series) {
        out.push_back({{"period", pa.period_index}, {"amount", pa.amount}});
    }
    return out;
}

json line_to_json(const LineItem& line) {
    return {
        {"line_id", line.line_id},
        {"category", line.category},
        {"subcategory", line.subcategory},
        {"description", line.description},
        {"container_id", nullable(line.container_id)},
        {"container_label", line.container_label},
        {"source_type", line.source_type},
        {"total", line.total},
        {"periods", series_to_json(line.periods)}
    };
}

json section_to_json(const Section& section) {
    json lines = json::array();
    for (const LineItem& line : section.line_items) {
        lines.push_back(line_to_json(line));
    }
    return {
        {"section_id", section.section_id},
        {"section_name", section.section_name},
        {"kind", section_kind_to_string(section.kind)},
        {"line_items", lines},
        {"subtotals", series_to_json(section.subtotals)},
        {"section_total", section.section_total}
    };
}

json summary_to_json(const SummaryMetrics& m) {
    const CostsByCategory& c = m.costs_by_category;
    return {
        {"total_gross_revenue", m.total_gross_revenue},
        {"total_commissions", m.total_commissions},
        {"total_transaction_costs", m.total_transaction_costs},
        {"total_subdivision_costs", m.total_subdivision_costs},
        {"total_revenue_deductions", m.total_revenue_deductions},
        {"total_net_revenue", m.total_net_revenue},
        {"total_costs", m.total_costs},
        {"costs_by_category", {
            {"acquisition", c.acquisition},
            {"planning", c.planning},
            {"development", c.development},
            {"financing", c.financing},
            {"contingency", c.contingency},
            {"other", c.other}
        }},
        {"gross_profit", m.gross_profit},
        {"gross_margin", nullable(m.gross_margin)},
        {"irr", nullable(m.irr)},
        {"npv", nullable(m.npv)},
        {"equity_multiple", nullable(m.equity_multiple)},
        {"peak_equity", m.peak_equity},
        {"payback_period", nullable(m.payback_period)},
        {"total_cash_in", m.total_cash_in},
        {"total_cash_out", m.total_cash_out},
        {"net_cash_flow", m.net_cash_flow},
        {"annual_cash_flows", m.annual_cash_flows}
    };
}

json loan_to_json(const LoanSummary& loan) {
    json out = {
        {"loan_id", loan.loan_id},
        {"loan_name", loan.loan_name},
        {"structure_type", structure_type_to_string(loan.structure_type)},
        {"loan_start_period", loan.loan_start_period},
        {"loan_term_months", loan.loan_term_months},
        {"commitment_amount", loan.commitment_amount},
        {"total_interest", loan.total_interest},
        {"peak_balance", loan.peak_balance},
        {"origination_fee", loan.origination_fee},
        {"interest_reserve", loan.interest_reserve}
    };
    if (loan.structure_type == StructureType::Term) {
        out["balloon_amount"] = loan.balloon_amount;
    } else {
        out["iterations"] = loan.iterations;
    }
    return out;
}

} // anonymous namespace

json projection_to_json(const Projection& projection) {
    json periods = json::array();
    for (const Period& p : projection.periods) {
        periods.push_back({
            {"index", p.index},
            {"sequence", p.sequence},
            {"start_date", p.start_date.to_iso()},
            {"end_date", p.end_date.to_iso()},
            {"label", p.label}
        });
    }

    json sections = json::array();
    for (const Section& section : projection.sections) {
        sections.push_back(section_to_json(section));
    }

    json loans = json::array();
    for (const LoanSummary& loan : projection.loans) {
        loans.push_back(loan_to_json(loan));
    }

    return {
        {"project_id", projection.project_id},
        {"project_name", projection.project_name},
        {"period_type", projection.period_type},
        {"start_date", projection.start_date.to_iso()},
        {"end_date", projection.end_date.to_iso()},
        {"total_periods", projection.total_periods},
        {"discount_rate", projection.discount_rate},
        {"periods", periods},
        {"sections", sections},
        {"summary", summary_to_json(projection.summary)},
        {"loans", loans}
    };
}

void write_projection_json(std::ostream& os, const Projection& projection, bool pretty_print) {
    os << projection_to_json(projection).dump(pretty_print ? 2 : -1) << "\n";
}

void write_projection_json(const std::string& filepath, const Projection& projection,
                           bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_projection_json(file, projection, pretty_print);
}

} // namespace io
} // namespace landcalc
