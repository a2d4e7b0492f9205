#include "section.hpp"
#include <algorithm>
#include <cctype>
#include <map>

namespace landcalc {

namespace {

// Per-container revenue accumulated by period
struct ContainerRevenue {
    std::optional<int64_t> container_id;
    std::string label;
    std::map<size_t, double> gross;
    std::map<size_t, double> net;
};

std::string section_slug(const std::string& category) {
    std::string slug;
    for (char c : category) {
        if (c == ' ') {
            slug += '-';
        } else if (c == '&') {
            slug += "and";
        } else {
            slug += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return slug;
}

std::string to_upper(const std::string& text) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper;
}

std::vector<PeriodAmount> from_map(const std::map<size_t, double>& values, double sign) {
    std::vector<PeriodAmount> out;
    for (const auto& entry : values) {
        if (entry.second != 0.0) {
            out.emplace_back(entry.first, sign * entry.second);
        }
    }
    return out;
}

double sum_amounts(const std::vector<PeriodAmount>& periods) {
    double total = 0.0;
    for (const PeriodAmount& pa : periods) {
        total += pa.amount;
    }
    return total;
}

LineItem single_amount_line(std::string id, std::string subcategory, std::string description,
                            size_t period, double amount) {
    LineItem line;
    line.line_id = std::move(id);
    line.category = "lotbank";
    line.subcategory = std::move(subcategory);
    line.description = std::move(description);
    line.periods.emplace_back(period, amount);
    line.total = amount;
    line.source_type = "lotbank";
    return line;
}

} // anonymous namespace

std::string section_kind_to_string(SectionKind kind) {
    switch (kind) {
        case SectionKind::Cost: return "COST";
        case SectionKind::RevenueGross: return "REVENUE_GROSS";
        case SectionKind::RevenueDeduction: return "REVENUE_DEDUCTION";
        case SectionKind::RevenueNet: return "REVENUE_NET";
        case SectionKind::Financing: return "FINANCING";
        case SectionKind::LotbankOptionDeposits: return "LOTBANK_OPTION_DEPOSITS";
        case SectionKind::LotbankDepositCredits: return "LOTBANK_DEPOSIT_CREDITS";
        case SectionKind::LotbankUnderwritingFee: return "LOTBANK_UNDERWRITING_FEE";
        case SectionKind::LotbankManagementFees: return "LOTBANK_MANAGEMENT_FEES";
        case SectionKind::LotbankDefaultProvision: return "LOTBANK_DEFAULT_PROVISION";
    }
    return "COST";
}

bool contributes_to_net_cash_flow(SectionKind kind) {
    switch (kind) {
        case SectionKind::RevenueGross:
        case SectionKind::RevenueDeduction:
            return false;
        case SectionKind::Cost:
        case SectionKind::RevenueNet:
        case SectionKind::Financing:
        case SectionKind::LotbankOptionDeposits:
        case SectionKind::LotbankDepositCredits:
        case SectionKind::LotbankUnderwritingFee:
        case SectionKind::LotbankManagementFees:
        case SectionKind::LotbankDefaultProvision:
            return true;
    }
    return true;
}

LineItem::LineItem() : total(0.0) {}

Section::Section() : kind(SectionKind::Cost), section_total(0.0) {}

std::vector<PeriodAmount> sparse_series(const std::vector<double>& dense) {
    std::vector<PeriodAmount> out;
    for (size_t i = 0; i < dense.size(); ++i) {
        if (dense[i] != 0.0) {
            out.emplace_back(i, dense[i]);
        }
    }
    return out;
}

std::vector<PeriodAmount> calculate_subtotals(const std::vector<LineItem>& line_items,
                                              size_t period_count) {
    std::vector<double> totals(period_count, 0.0);
    for (const LineItem& item : line_items) {
        for (const PeriodAmount& pa : item.periods) {
            if (pa.period_index < period_count) {
                totals[pa.period_index] += pa.amount;
            }
        }
    }
    return sparse_series(totals);
}

LineItem make_loan_line(int64_t loan_id, const std::string& loan_name,
                        const std::vector<double>& cash_flows) {
    LineItem line;
    line.line_id = "financing-loan-" + std::to_string(loan_id);
    line.category = "financing";
    line.subcategory = "Debt Service";
    line.description = loan_name;
    line.periods = sparse_series(cash_flows);
    line.total = sum_amounts(line.periods);
    line.source_type = "debt";
    return line;
}

// ============================================================================
// SectionAssembler Implementation
// ============================================================================

SectionAssembler::SectionAssembler(size_t period_count) : period_count_(period_count) {}

Section SectionAssembler::make_section(std::string id, std::string name, SectionKind kind,
                                       std::vector<LineItem> lines) const {
    Section section;
    section.section_id = std::move(id);
    section.section_name = std::move(name);
    section.kind = kind;
    section.line_items = std::move(lines);
    section.subtotals = calculate_subtotals(section.line_items, period_count_);
    for (const LineItem& item : section.line_items) {
        section.section_total += item.total;
    }
    return section;
}

std::vector<Section> SectionAssembler::assemble(
    const CostSchedule& costs,
    const AbsorptionSchedule& absorption,
    const std::vector<LineItem>& financing_lines,
    const std::optional<LotbankSectionInput>& lotbank
) const {
    std::vector<Section> sections = build_cost_sections(costs);

    for (Section& s : build_revenue_sections(absorption)) {
        sections.push_back(std::move(s));
    }

    if (auto financing = build_financing_section(financing_lines)) {
        sections.push_back(std::move(*financing));
    }

    if (lotbank) {
        for (Section& s : build_lotbank_sections(*lotbank)) {
            sections.push_back(std::move(s));
        }
    }

    return sections;
}

std::vector<Section> SectionAssembler::build_cost_sections(const CostSchedule& costs) const {
    std::vector<Section> sections;

    for (const std::string& category : cost_category_order()) {
        auto it = costs.category_summary.find(category);
        if (it == costs.category_summary.end()) {
            continue;
        }

        std::vector<LineItem> lines;
        for (const CostScheduleItem& item : it->second.items) {
            LineItem line;
            line.line_id = item.fact_id >= 0 ? "cost-" + std::to_string(item.fact_id)
                                             : std::string("cost-acquisition");
            line.category = "cost";
            line.subcategory = category;
            line.description = item.description;
            line.container_id = item.container_id;
            line.container_label = item.container_label;
            for (const PeriodAmount& pa : item.periods) {
                if (pa.period_index < period_count_ && pa.amount != 0.0) {
                    line.periods.emplace_back(pa.period_index, -pa.amount);
                }
            }
            line.total = sum_amounts(line.periods);
            line.source_type = item.fact_id >= 0 ? "budget" : "acquisition";
            lines.push_back(std::move(line));
        }

        sections.push_back(make_section("cost-" + section_slug(category), to_upper(category),
                                        SectionKind::Cost, std::move(lines)));
    }

    return sections;
}

std::vector<Section> SectionAssembler::build_revenue_sections(
    const AbsorptionSchedule& absorption
) const {
    // Containers keep the order they first appear in the schedule
    std::vector<ContainerRevenue> containers;
    std::map<size_t, double> commissions;
    std::map<size_t, double> transaction_costs;
    std::map<size_t, double> subdivision_costs;

    for (const PeriodSales& bucket : absorption.period_sales) {
        if (bucket.period_index >= period_count_) {
            continue;
        }
        for (const ScheduledSale& sale : bucket.parcels) {
            auto it = std::find_if(containers.begin(), containers.end(),
                                   [&](const ContainerRevenue& c) {
                                       return c.container_id == sale.container_id;
                                   });
            if (it == containers.end()) {
                ContainerRevenue entry;
                entry.container_id = sale.container_id;
                entry.label = sale.container_label;
                containers.push_back(entry);
                it = containers.end() - 1;
            }
            it->gross[bucket.period_index] += sale.gross_revenue;
            it->net[bucket.period_index] += sale.net_revenue;

            commissions[bucket.period_index] += sale.commissions;
            transaction_costs[bucket.period_index] += sale.closing_costs;
            subdivision_costs[bucket.period_index] += sale.subdivision_costs;
        }
    }

    auto container_line = [](const ContainerRevenue& c, const std::string& prefix,
                             const std::string& subcategory, const std::map<size_t, double>& values,
                             const std::string& source) {
        LineItem line;
        line.line_id = prefix + (c.container_id ? std::to_string(*c.container_id) : std::string("project"));
        line.category = "revenue";
        line.subcategory = subcategory;
        line.description = c.label.empty() ? std::string("Project Level") : c.label;
        line.container_id = c.container_id;
        line.container_label = c.label;
        line.periods = from_map(values, 1.0);
        line.total = sum_amounts(line.periods);
        line.source_type = source;
        return line;
    };

    std::vector<LineItem> gross_lines;
    std::vector<LineItem> net_lines;
    for (const ContainerRevenue& c : containers) {
        gross_lines.push_back(container_line(c, "revenue-gross-", "Parcel Sales", c.gross, "parcel"));
        net_lines.push_back(container_line(c, "revenue-net-", "Net Revenue", c.net, "calculated"));
    }

    std::vector<LineItem> deduction_lines;
    auto add_deduction = [&](const std::string& id, const std::string& description,
                             const std::map<size_t, double>& values) {
        LineItem line;
        line.line_id = id;
        line.category = "revenue";
        line.subcategory = "Revenue Deductions";
        line.description = description;
        line.periods = from_map(values, -1.0);
        line.total = sum_amounts(line.periods);
        line.source_type = "calculated";
        if (line.total < 0.0) {
            deduction_lines.push_back(std::move(line));
        }
    };
    add_deduction("revenue-deduction-commissions", "Commissions", commissions);
    add_deduction("revenue-deduction-transaction-costs", "Transaction Costs", transaction_costs);
    add_deduction("revenue-deduction-subdivision", "Subdivision Costs", subdivision_costs);

    std::vector<Section> sections;
    sections.push_back(make_section("revenue-gross", "GROSS REVENUE",
                                    SectionKind::RevenueGross, std::move(gross_lines)));
    sections.push_back(make_section("revenue-deductions", "REVENUE DEDUCTIONS",
                                    SectionKind::RevenueDeduction, std::move(deduction_lines)));
    sections.push_back(make_section("revenue-net", "NET REVENUE",
                                    SectionKind::RevenueNet, std::move(net_lines)));
    return sections;
}

std::optional<Section> SectionAssembler::build_financing_section(
    const std::vector<LineItem>& lines
) const {
    if (lines.empty()) {
        return std::nullopt;
    }
    return make_section("financing", "FINANCING", SectionKind::Financing, lines);
}

std::vector<Section> SectionAssembler::build_lotbank_sections(
    const LotbankSectionInput& lotbank
) const {
    const LotbankResult& result = lotbank.result;
    std::vector<Section> sections;

    if (result.initial_deposit_received > 0.0) {
        std::vector<LineItem> lines;
        lines.push_back(single_amount_line("lotbank-option-deposits", "Option Deposits",
                                           "Builder Option Deposits Received", 0,
                                           result.initial_deposit_received));
        sections.push_back(make_section("lotbank-option-deposits", "OPTION DEPOSITS",
                                        SectionKind::LotbankOptionDeposits, std::move(lines)));
    }

    std::vector<LineItem> credit_lines;
    for (const LotbankProduct& product : lotbank.products) {
        LineItem line;
        line.line_id = "lotbank-deposit-credit-" + std::to_string(product.product_id);
        line.category = "lotbank";
        line.subcategory = "Deposit Credits";
        line.description = "Deposit Credit - Product " + std::to_string(product.product_id);
        line.source_type = "lotbank";
        for (const LotbankPeriod& lp : result.periods) {
            for (const LotbankProductPeriod& detail : lp.product_details) {
                if (detail.product_id == product.product_id && detail.deposit_credit > 0.0) {
                    line.periods.emplace_back(lp.period, -detail.deposit_credit);
                }
            }
        }
        if (!line.periods.empty()) {
            line.total = sum_amounts(line.periods);
            credit_lines.push_back(std::move(line));
        }
    }
    if (!credit_lines.empty()) {
        sections.push_back(make_section("lotbank-deposit-credits", "DEPOSIT CREDITS",
                                        SectionKind::LotbankDepositCredits, std::move(credit_lines)));
    }

    if (result.underwriting_fee > 0.0) {
        std::vector<LineItem> lines;
        lines.push_back(single_amount_line("lotbank-underwriting-fee", "Underwriting Fee",
                                           "Lotbank Underwriting Fee", 0, -result.underwriting_fee));
        sections.push_back(make_section("lotbank-underwriting-fee", "UNDERWRITING FEE",
                                        SectionKind::LotbankUnderwritingFee, std::move(lines)));
    }

    auto recurring_line = [&](const std::string& id, const std::string& subcategory,
                              const std::string& description, double LotbankPeriod::*field) {
        LineItem line;
        line.line_id = id;
        line.category = "lotbank";
        line.subcategory = subcategory;
        line.description = description;
        line.source_type = "lotbank";
        for (const LotbankPeriod& lp : result.periods) {
            double value = lp.*field;
            if (value > 0.0) {
                line.periods.emplace_back(lp.period, -value);
            }
        }
        line.total = sum_amounts(line.periods);
        return line;
    };

    if (result.total_management_fees > 0.0) {
        std::vector<LineItem> lines;
        lines.push_back(recurring_line("lotbank-management-fees", "Management Fees",
                                       "Lotbank Management Fees", &LotbankPeriod::management_fee));
        sections.push_back(make_section("lotbank-management-fees", "MANAGEMENT FEES",
                                        SectionKind::LotbankManagementFees, std::move(lines)));
    }

    if (result.total_default_provision > 0.0) {
        std::vector<LineItem> lines;
        lines.push_back(recurring_line("lotbank-default-provision", "Default Provision",
                                       "Builder Default Provision", &LotbankPeriod::default_provision));
        sections.push_back(make_section("lotbank-default-provision", "DEFAULT PROVISION",
                                        SectionKind::LotbankDefaultProvision, std::move(lines)));
    }

    return sections;
}

} // namespace landcalc
