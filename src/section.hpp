#ifndef LANDCALC_SECTION_HPP
#define LANDCALC_SECTION_HPP

#include "absorption.hpp"
#include "cost_schedule.hpp"
#include "lotbank.hpp"
#include "period.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace landcalc {

enum class SectionKind : uint8_t {
    Cost = 0,
    RevenueGross = 1,
    RevenueDeduction = 2,
    RevenueNet = 3,
    Financing = 4,
    LotbankOptionDeposits = 5,
    LotbankDepositCredits = 6,
    LotbankUnderwritingFee = 7,
    LotbankManagementFees = 8,
    LotbankDefaultProvision = 9
};

std::string section_kind_to_string(SectionKind kind);

// Gross revenue and its deductions are already netted into net revenue
bool contributes_to_net_cash_flow(SectionKind kind);

// Signed cash-flow row: costs and outflows negative, revenue and inflows positive
struct LineItem {
    std::string line_id;
    std::string category;           // cost, revenue, financing, lotbank
    std::string subcategory;
    std::string description;
    std::optional<int64_t> container_id;
    std::string container_label;
    std::vector<PeriodAmount> periods;  // Sparse, ascending, no zero entries
    double total;
    std::string source_type;

    LineItem();
};

struct Section {
    std::string section_id;
    std::string section_name;
    SectionKind kind;
    std::vector<LineItem> line_items;
    std::vector<PeriodAmount> subtotals;    // Non-zero period sums only
    double section_total;

    Section();
};

// Drop zero entries from a dense per-period series
std::vector<PeriodAmount> sparse_series(const std::vector<double>& dense);

// Sum line items per period, omitting periods whose sum is zero
std::vector<PeriodAmount> calculate_subtotals(const std::vector<LineItem>& line_items,
                                              size_t period_count);

// Financing row for one loan from its dense per-period cash effect
LineItem make_loan_line(int64_t loan_id, const std::string& loan_name,
                        const std::vector<double>& cash_flows);

// Lotbank results plus the products they were computed for
struct LotbankSectionInput {
    LotbankResult result;
    std::vector<LotbankProduct> products;
};

/**
 * @brief Groups schedules into display sections in a fixed order
 *
 * Order: cost categories (display order), gross revenue, revenue deductions,
 * net revenue, financing, then the lotbank sections (option deposits,
 * deposit credits, underwriting fee, management fees, default provision).
 * Amounts for periods outside the horizon are dropped.
 */
class SectionAssembler {
public:
    explicit SectionAssembler(size_t period_count);

    std::vector<Section> assemble(const CostSchedule& costs,
                                  const AbsorptionSchedule& absorption,
                                  const std::vector<LineItem>& financing_lines,
                                  const std::optional<LotbankSectionInput>& lotbank) const;

    std::vector<Section> build_cost_sections(const CostSchedule& costs) const;
    std::vector<Section> build_revenue_sections(const AbsorptionSchedule& absorption) const;
    std::optional<Section> build_financing_section(const std::vector<LineItem>& lines) const;
    std::vector<Section> build_lotbank_sections(const LotbankSectionInput& lotbank) const;

private:
    Section make_section(std::string id, std::string name, SectionKind kind,
                         std::vector<LineItem> lines) const;

    size_t period_count_;
};

} // namespace landcalc

#endif // LANDCALC_SECTION_HPP
