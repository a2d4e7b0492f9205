/**
 * @file projection_engine.hpp
 * @brief Monthly cash-flow projection for a land development project
 *
 * Pipeline: periods -> cost schedule + absorption schedule -> (debt service,
 * lotbank) -> sections -> summary metrics. Every stage is a pure function of
 * the records the data provider returns, so repeated runs with the same
 * inputs produce identical output.
 */

#ifndef LANDCALC_PROJECTION_ENGINE_HPP
#define LANDCALC_PROJECTION_ENGINE_HPP

#include "data_provider.hpp"
#include "debt_service.hpp"
#include "logger.hpp"
#include "lotbank.hpp"
#include "metrics.hpp"
#include "period.hpp"
#include "section.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace landcalc {

/**
 * @brief Summary of one loan's schedule, reported next to the financing section
 */
struct LoanSummary {
    int64_t loan_id;
    std::string loan_name;
    StructureType structure_type;
    size_t loan_start_period;
    size_t loan_term_months;
    double commitment_amount;       ///< Revolver commitment or term loan amount
    double total_interest;
    double peak_balance;
    double balloon_amount;          ///< Term loans only
    double origination_fee;
    double interest_reserve;        ///< Revolver reserve funded / term reserve withheld
    int iterations;                 ///< Reserve solver iterations (revolvers)

    LoanSummary();
};

/**
 * @brief Complete output of one projection run
 */
struct Projection {
    int64_t project_id;
    std::string project_name;
    std::string period_type;        ///< Always "month"
    Date start_date;
    Date end_date;
    size_t total_periods;
    double discount_rate;
    std::vector<Period> periods;
    std::vector<Section> sections;
    SummaryMetrics summary;
    std::vector<LoanSummary> loans;

    Projection();
};

/**
 * @brief Runs projections against a data provider
 *
 * The provider must outlive the engine.
 */
class ProjectionEngine {
public:
    explicit ProjectionEngine(const ProjectDataProvider& provider);

    /**
     * @brief Project monthly cash flows for a project
     *
     * @param project_id Project to run
     * @param container_ids Optional division filter
     * @param include_financing Add the financing section and extend the horizon for loans
     * @return Projection with periods, ordered sections and summary metrics
     *
     * @throws NotFoundError If the project does not exist
     * @throws UnsupportedConfigurationError If an in-scope loan takes out another loan
     * @throws ValidationError On malformed inputs
     */
    Projection project(int64_t project_id,
                       const ContainerFilter& container_ids = std::nullopt,
                       bool include_financing = false) const;

private:
    std::vector<LineItem> build_financing_lines(
        const std::vector<Loan>& loans,
        const CostSchedule& costs,
        const AbsorptionSchedule& absorption,
        const std::vector<Period>& periods,
        std::vector<LoanSummary>& summaries,
        ProjectionContext& ctx) const;

    const ProjectDataProvider& provider_;
    DebtServiceEngine debt_engine_;
    LotbankEngine lotbank_engine_;
};

} // namespace landcalc

#endif // LANDCALC_PROJECTION_ENGINE_HPP
