#include "projection_engine.hpp"
#include "cost_schedule.hpp"
#include "absorption.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <sstream>

namespace landcalc {

namespace {

using Clock = std::chrono::high_resolution_clock;

double elapsed_ms(Clock::time_point since) {
    return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
}

std::string format_filter(const ContainerFilter& containers) {
    if (!containers) {
        return "";
    }
    std::ostringstream oss;
    for (size_t i = 0; i < containers->size(); ++i) {
        if (i > 0) oss << ",";
        oss << (*containers)[i];
    }
    return oss.str();
}

HorizonInputs gather_horizon(const std::vector<BudgetItem>& budget,
                             const std::vector<ParcelSale>& parcels,
                             const std::vector<Loan>& loans,
                             const DcfAssumptions& dcf,
                             bool include_financing) {
    HorizonInputs inputs;
    for (const BudgetItem& item : budget) {
        inputs.max_budget_period = std::max(inputs.max_budget_period, item.last_period());
    }
    for (const ParcelSale& parcel : parcels) {
        if (parcel.sale_period) {
            inputs.max_sale_period = std::max(inputs.max_sale_period, *parcel.sale_period);
        }
    }
    inputs.include_financing = include_financing;
    if (include_financing) {
        inputs.hold_period_months = dcf.hold_period_months();
        for (const Loan& loan : loans) {
            HorizonInputs::LoanSpan span;
            span.start_date = loan.loan_start_date;
            span.term_months = loan.resolve_term_months(0);
            inputs.loans.push_back(span);
        }
    }
    return inputs;
}

} // anonymous namespace

LoanSummary::LoanSummary()
    : loan_id(0),
      structure_type(StructureType::Term),
      loan_start_period(0),
      loan_term_months(0),
      commitment_amount(0.0),
      total_interest(0.0),
      peak_balance(0.0),
      balloon_amount(0.0),
      origination_fee(0.0),
      interest_reserve(0.0),
      iterations(0) {}

Projection::Projection()
    : project_id(0),
      period_type("month"),
      total_periods(0),
      discount_rate(0.0) {}

// ============================================================================
// ProjectionEngine Implementation
// ============================================================================

ProjectionEngine::ProjectionEngine(const ProjectDataProvider& provider)
    : provider_(provider) {}

Projection ProjectionEngine::project(int64_t project_id,
                                     const ContainerFilter& container_ids,
                                     bool include_financing) const {
    Logger& logger = Logger::get_instance();
    const auto run_start = Clock::now();

    ProjectionContext ctx(project_id);
    ctx.containers = format_filter(container_ids);

    try {
        std::optional<ProjectRecord> record = provider_.find_project(project_id);
        if (!record) {
            throw NotFoundError("project " + std::to_string(project_id));
        }
        logger.log_projection_start(ctx, include_financing);

        const DcfAssumptions dcf = provider_.dcf_assumptions(project_id);
        const std::vector<BudgetItem> budget = provider_.budget_items(project_id, container_ids);
        const std::vector<ParcelSale> parcels = provider_.parcel_sales(project_id, container_ids);

        std::vector<Loan> loans;
        if (include_financing) {
            loans = provider_.loans(project_id, container_ids);
            for (const Loan& loan : loans) {
                if (loan.takes_out_loan_id) {
                    throw UnsupportedConfigurationError(
                        "loan " + std::to_string(loan.loan_id) + " takes out loan " +
                        std::to_string(*loan.takes_out_loan_id) + "; refinancing chains are not implemented");
                }
            }
        }

        // Periods
        auto stage_start = Clock::now();
        ctx.stage = "periods";
        const Date start_date = record->start_date();
        const size_t period_count = resolve_period_count(
            start_date, gather_horizon(budget, parcels, loans, dcf, include_financing));
        std::vector<Period> periods = generate_periods(start_date, period_count);
        logger.log_stage_complete(ctx, periods.size(), elapsed_ms(stage_start));

        // Costs
        stage_start = Clock::now();
        ctx.stage = "costs";
        const CostSchedule costs = build_cost_schedule(
            budget, period_count, container_ids, dcf.cost_inflation_rate,
            provider_.acquisition_costs(project_id),
            provider_.parcel_acreage(project_id, container_ids));
        logger.log_stage_complete(ctx, costs.category_summary.size(), elapsed_ms(stage_start));

        // Revenue
        stage_start = Clock::now();
        ctx.stage = "absorption";
        const AbsorptionSchedule absorption = build_absorption_schedule(parcels, dcf.price_growth_rate);
        if (absorption.total_parcels < parcels.size()) {
            logger.log_warning(ctx, std::to_string(parcels.size() - absorption.total_parcels) +
                                    " parcels excluded (no sale period or no units/acreage)");
        }
        logger.log_stage_complete(ctx, absorption.total_parcels, elapsed_ms(stage_start));

        Projection projection;

        // Financing
        std::vector<LineItem> financing_lines;
        if (include_financing && !loans.empty()) {
            stage_start = Clock::now();
            ctx.stage = "financing";
            financing_lines = build_financing_lines(loans, costs, absorption, periods,
                                                    projection.loans, ctx);
            logger.log_stage_complete(ctx, financing_lines.size(), elapsed_ms(stage_start));
        }

        // Lotbank
        std::optional<LotbankSectionInput> lotbank;
        if (record->analysis_type == AnalysisType::Lotbank) {
            stage_start = Clock::now();
            ctx.stage = "lotbank";
            std::vector<LotbankProduct> products = build_lotbank_products(
                provider_.divisions(project_id), absorption, period_count, container_ids);
            if (products.empty()) {
                logger.log_warning(ctx, "lotbank deal has no divisions with deposit pricing and sales");
            } else {
                LotbankParams params;
                params.products = products;
                params.management_fee_pct = record->lotbank.management_fee_pct;
                params.default_provision_pct = record->lotbank.default_provision_pct;
                params.underwriting_fee = record->lotbank.underwriting_fee;
                params.num_periods = period_count;

                LotbankSectionInput input;
                input.result = lotbank_engine_.calculate(params);
                input.products = std::move(products);
                lotbank = std::move(input);
            }
            logger.log_stage_complete(ctx, lotbank ? lotbank->products.size() : 0, elapsed_ms(stage_start));
        }

        // Sections and metrics
        stage_start = Clock::now();
        ctx.stage = "sections";
        SectionAssembler assembler(period_count);
        projection.sections = assembler.assemble(costs, absorption, financing_lines, lotbank);
        logger.log_stage_complete(ctx, projection.sections.size(), elapsed_ms(stage_start));

        stage_start = Clock::now();
        ctx.stage = "metrics";
        const double discount_rate = dcf.effective_discount_rate();
        projection.summary = calculate_summary_metrics(projection.sections, periods, absorption,
                                                       costs, discount_rate);
        logger.log_stage_complete(ctx, projection.summary.annual_cash_flows.size(), elapsed_ms(stage_start));

        projection.project_id = project_id;
        projection.project_name = record->project_name;
        projection.start_date = periods.front().start_date;
        projection.end_date = periods.back().end_date;
        projection.total_periods = periods.size();
        projection.discount_rate = discount_rate;
        projection.periods = std::move(periods);

        ctx.stage.clear();
        logger.log_projection_complete(ctx, projection.total_periods, projection.sections.size(),
                                       elapsed_ms(run_start));
        return projection;
    } catch (const std::exception& e) {
        logger.log_error(ctx, e.what());
        throw;
    }
}

std::vector<LineItem> ProjectionEngine::build_financing_lines(
    const std::vector<Loan>& loans,
    const CostSchedule& costs,
    const AbsorptionSchedule& absorption,
    const std::vector<Period>& periods,
    std::vector<LoanSummary>& summaries,
    ProjectionContext& ctx
) const {
    Logger& logger = Logger::get_instance();
    const std::vector<PeriodCosts> period_data = build_period_costs(costs, absorption, periods);

    // Revolvers first, then term loans, each in provider order
    std::vector<const Loan*> ordered;
    for (const Loan& loan : loans) {
        if (loan.structure_type == StructureType::Revolver) ordered.push_back(&loan);
    }
    for (const Loan& loan : loans) {
        if (loan.structure_type == StructureType::Term) ordered.push_back(&loan);
    }

    std::vector<LineItem> lines;
    for (const Loan* loan : ordered) {
        LoanSummary summary;
        summary.loan_id = loan->loan_id;
        summary.loan_name = loan->loan_name;
        summary.structure_type = loan->structure_type;

        std::vector<double> flows(periods.size(), 0.0);

        if (loan->structure_type == StructureType::Revolver) {
            RevolverParams params = revolver_params_from_loan(*loan, periods);
            RevolverResult result = debt_engine_.calculate_revolver(params, period_data);
            for (const RevolverPeriod& rp : result.periods) {
                flows[rp.period_index] = rp.net_cash_flow();
            }
            if (!result.reserve_converged) {
                logger.log_warning(ctx, "interest reserve for loan " + std::to_string(loan->loan_id) +
                                        " did not converge in " +
                                        std::to_string(result.iterations_to_converge) + " iterations");
            }
            logger.log_loan_schedule(ctx, loan->loan_id, "REVOLVER", result.iterations_to_converge,
                                     result.reserve_converged, result.peak_balance);

            summary.loan_start_period = params.loan_start_period;
            summary.loan_term_months = params.loan_term_months;
            summary.commitment_amount = result.commitment_amount;
            summary.total_interest = result.total_interest;
            summary.peak_balance = result.peak_balance;
            summary.origination_fee = result.origination_fee;
            summary.interest_reserve = result.interest_reserve_funded;
            summary.iterations = result.iterations_to_converge;
        } else {
            TermParams params = term_params_from_loan(*loan, periods);
            TermResult result = debt_engine_.calculate_term(params, periods.size());
            double net_proceeds = resolve_net_loan_proceeds(*loan, params.loan_amount);
            flows = term_cash_flows(result, params.loan_start_period, net_proceeds);

            double peak = 0.0;
            for (const TermPeriod& tp : result.periods) {
                peak = std::max(peak, tp.beginning_balance);
            }
            logger.log_loan_schedule(ctx, loan->loan_id, "TERM", 0, true, peak);

            summary.loan_start_period = params.loan_start_period;
            summary.loan_term_months = params.loan_term_months;
            summary.commitment_amount = result.loan_amount;
            summary.total_interest = result.total_interest;
            summary.peak_balance = peak;
            summary.balloon_amount = result.balloon_amount;
            summary.origination_fee = params.loan_amount * params.origination_fee_pct;
            summary.interest_reserve = loan->interest_reserve_amount;
        }

        lines.push_back(make_loan_line(loan->loan_id, loan->loan_name, flows));
        summaries.push_back(summary);
    }
    return lines;
}

} // namespace landcalc
