#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "errors.hpp"
#include "in_memory_provider.hpp"
#include "projection_engine.hpp"
#include <algorithm>

using namespace landcalc;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Test Fixtures
// ============================================================================

namespace {

constexpr int64_t kProjectId = 1;

void quiet_logger() {
    LoggerConfig config;
    config.min_level = LogLevel::ERROR;
    config.enable_console = false;
    Logger::get_instance().configure(config);
}

BudgetItem lump_cost(int64_t fact_id, int64_t container, double amount, size_t start) {
    BudgetItem item;
    item.fact_id = fact_id;
    item.container_id = container;
    item.description = "Site work";
    item.activity = "Development";
    item.amount = amount;
    item.start_period = start;
    item.timing_method = TimingMethod::Lump;
    return item;
}

ParcelSale parcel(int64_t id, int64_t container, int64_t division, size_t sale_period,
                  double units, double gross) {
    ParcelSale p;
    p.parcel_id = id;
    p.parcel_code = "P-" + std::to_string(id);
    p.container_id = container;
    p.container_label = "Phase " + std::to_string(container);
    p.division_id = division;
    p.sale_period = sale_period;
    p.units = units;
    p.acres = 5.0;
    p.gross_revenue = gross;
    p.commissions = gross * 0.05;
    p.net_revenue = gross - p.commissions;
    return p;
}

Loan interest_only_term_loan(int64_t id, std::vector<int64_t> containers) {
    Loan loan;
    loan.loan_id = id;
    loan.loan_name = "Land Loan";
    loan.structure_type = StructureType::Term;
    loan.commitment_amount = 500000.0;
    loan.interest_rate_pct = 6.0;
    loan.loan_term_months = 24;
    loan.container_ids = std::move(containers);
    loan.loan_start_date = Date(2025, 1, 1);
    return loan;
}

ProjectInputs base_inputs() {
    ProjectInputs inputs;
    inputs.project.project_id = kProjectId;
    inputs.project.project_name = "Riverside Ranch";
    inputs.project.analysis_start_date = Date(2025, 1, 1);
    inputs.dcf.discount_rate = 0.10;

    inputs.budget = {lump_cost(101, 10, 1000000.0, 1), lump_cost(102, 20, 200000.0, 3)};
    inputs.parcels = {parcel(1, 10, 100, 12, 10, 2000000.0), parcel(2, 20, 200, 6, 4, 400000.0)};
    return inputs;
}

const Section* find_section(const Projection& projection, SectionKind kind) {
    auto it = std::find_if(projection.sections.begin(), projection.sections.end(),
                           [kind](const Section& s) { return s.kind == kind; });
    return it == projection.sections.end() ? nullptr : &*it;
}

} // anonymous namespace

// ============================================================================
// Engine Tests
// ============================================================================

TEST_CASE("Projection of a simple project", "[engine]") {
    quiet_logger();
    InMemoryDataProvider provider(base_inputs());
    ProjectionEngine engine(provider);

    Projection projection = engine.project(kProjectId);

    REQUIRE(projection.project_name == "Riverside Ranch");
    REQUIRE(projection.period_type == "month");
    REQUIRE(projection.total_periods == 12);
    REQUIRE(projection.periods.size() == 12);
    REQUIRE(projection.start_date == Date(2025, 1, 1));
    REQUIRE(projection.end_date == Date(2025, 12, 31));
    REQUIRE(projection.discount_rate == 0.10);
    REQUIRE(projection.loans.empty());
    REQUIRE(find_section(projection, SectionKind::Financing) == nullptr);

    SECTION("Lump cost lands in the first period") {
        const Section* cost = find_section(projection, SectionKind::Cost);
        REQUIRE(cost != nullptr);
        REQUIRE(cost->section_id == "cost-development-costs");
        REQUIRE(cost->subtotals.front().period_index == 0);
        REQUIRE_THAT(cost->subtotals.front().amount, WithinAbs(-1000000.0, 1e-6));
        REQUIRE_THAT(cost->section_total, WithinAbs(-1200000.0, 1e-6));
    }

    SECTION("Summary ties to the schedules") {
        const SummaryMetrics& m = projection.summary;
        REQUIRE_THAT(m.total_gross_revenue, WithinAbs(2400000.0, 1e-6));
        REQUIRE_THAT(m.total_net_revenue, WithinAbs(2280000.0, 1e-6));
        REQUIRE_THAT(m.total_costs, WithinAbs(1200000.0, 1e-6));
        REQUIRE_THAT(m.net_cash_flow, WithinAbs(1080000.0, 1e-6));
        REQUIRE_THAT(m.peak_equity, WithinAbs(-1200000.0, 1e-6));
        REQUIRE(m.payback_period.has_value());
        REQUIRE(*m.payback_period == 11);
        REQUIRE_FALSE(m.irr.has_value());
        REQUIRE(m.npv.has_value());
    }
}

TEST_CASE("Projection runs are repeatable", "[engine]") {
    quiet_logger();
    ProjectInputs inputs = base_inputs();
    inputs.loans = {interest_only_term_loan(5, {10})};
    InMemoryDataProvider provider(inputs);
    ProjectionEngine engine(provider);

    Projection first = engine.project(kProjectId, std::nullopt, true);
    Projection second = engine.project(kProjectId, std::nullopt, true);

    REQUIRE(first.total_periods == second.total_periods);
    REQUIRE(first.sections.size() == second.sections.size());
    for (size_t i = 0; i < first.sections.size(); ++i) {
        REQUIRE(first.sections[i].section_id == second.sections[i].section_id);
        REQUIRE(first.sections[i].section_total == second.sections[i].section_total);
    }
    REQUIRE(first.summary.cumulative_cash_flow == second.summary.cumulative_cash_flow);
}

TEST_CASE("Unknown project", "[engine]") {
    quiet_logger();
    InMemoryDataProvider provider(base_inputs());
    ProjectionEngine engine(provider);

    REQUIRE_THROWS_AS(engine.project(99), NotFoundError);
}

TEST_CASE("Financing", "[engine]") {
    quiet_logger();
    ProjectInputs inputs = base_inputs();
    inputs.loans = {interest_only_term_loan(5, {10})};
    InMemoryDataProvider provider(inputs);
    ProjectionEngine engine(provider);

    SECTION("Financing is opt-in") {
        Projection projection = engine.project(kProjectId);
        REQUIRE(projection.total_periods == 12);
        REQUIRE(find_section(projection, SectionKind::Financing) == nullptr);
    }

    SECTION("Loan term extends the horizon and adds a financing section") {
        Projection projection = engine.project(kProjectId, std::nullopt, true);
        REQUIRE(projection.total_periods == 24);

        const Section* financing = find_section(projection, SectionKind::Financing);
        REQUIRE(financing != nullptr);
        REQUIRE(financing->line_items.size() == 1);
        REQUIRE(financing->line_items[0].line_id == "financing-loan-5");

        // Proceeds in, 24 months of interest and the balloon out
        REQUIRE_THAT(financing->section_total, WithinAbs(-60000.0, 1e-6));

        REQUIRE(projection.loans.size() == 1);
        const LoanSummary& loan = projection.loans[0];
        REQUIRE(loan.structure_type == StructureType::Term);
        REQUIRE(loan.loan_term_months == 24);
        REQUIRE_THAT(loan.total_interest, WithinAbs(60000.0, 1e-6));
        REQUIRE_THAT(loan.balloon_amount, WithinAbs(500000.0, 1e-6));

        REQUIRE(projection.sections.back().kind == SectionKind::Financing);
    }

    SECTION("Hold period caps the horizon") {
        ProjectInputs held = inputs;
        held.dcf.hold_period_years = 1;
        InMemoryDataProvider held_provider(held);
        Projection projection = ProjectionEngine(held_provider).project(kProjectId, std::nullopt, true);
        REQUIRE(projection.total_periods == 12);
    }

    SECTION("Container filter excludes unassigned loans") {
        Projection projection = engine.project(kProjectId, std::vector<int64_t>{20}, true);
        REQUIRE(projection.loans.empty());
        REQUIRE(find_section(projection, SectionKind::Financing) == nullptr);
        REQUIRE(projection.total_periods == 6);
        REQUIRE_THAT(projection.summary.total_costs, WithinAbs(200000.0, 1e-6));
    }

    SECTION("Refinancing chains are rejected") {
        ProjectInputs chained = inputs;
        Loan takeout = interest_only_term_loan(6, {10});
        takeout.takes_out_loan_id = 5;
        chained.loans.push_back(takeout);
        InMemoryDataProvider chained_provider(chained);

        ProjectionEngine chained_engine(chained_provider);
        REQUIRE_THROWS_AS(chained_engine.project(kProjectId, std::nullopt, true),
                          UnsupportedConfigurationError);
        REQUIRE_NOTHROW(chained_engine.project(kProjectId));
    }
}

TEST_CASE("Acquisition is pro-rated by filtered acreage", "[engine]") {
    quiet_logger();
    ProjectInputs inputs = base_inputs();
    AcquisitionCost land;
    land.acquisition_id = 1;
    land.amount = 800000.0;
    inputs.acquisitions = {land};
    InMemoryDataProvider provider(inputs);
    ProjectionEngine engine(provider);

    Projection whole = engine.project(kProjectId);
    REQUIRE(whole.sections.front().section_id == "cost-land-acquisition");
    REQUIRE_THAT(whole.sections.front().section_total, WithinAbs(-800000.0, 1e-6));

    Projection phase = engine.project(kProjectId, std::vector<int64_t>{10});
    REQUIRE(phase.sections.front().line_items[0].description == "Land Acquisition (50% allocation)");
    REQUIRE_THAT(phase.sections.front().section_total, WithinAbs(-400000.0, 1e-6));
}

TEST_CASE("Lotbank projection", "[engine]") {
    quiet_logger();
    ProjectInputs inputs = base_inputs();
    inputs.project.analysis_type = AnalysisType::Lotbank;
    inputs.project.lotbank.management_fee_pct = 0.006;
    inputs.project.lotbank.default_provision_pct = 0.02;
    inputs.project.lotbank.underwriting_fee = 25000.0;

    Division division;
    division.division_id = 100;
    division.display_name = "50' Lots";
    division.option_deposit_pct = 0.15;
    division.retail_lot_price = 200000.0;
    inputs.divisions = {division};

    InMemoryDataProvider provider(inputs);
    Projection projection = ProjectionEngine(provider).project(kProjectId);

    const Section* deposits = find_section(projection, SectionKind::LotbankOptionDeposits);
    REQUIRE(deposits != nullptr);
    REQUIRE_THAT(deposits->section_total, WithinAbs(10 * 200000.0 * 0.15, 1e-6));

    const Section* credits = find_section(projection, SectionKind::LotbankDepositCredits);
    REQUIRE(credits != nullptr);
    REQUIRE_THAT(credits->section_total, WithinAbs(-300000.0, 1e-6));

    REQUIRE(find_section(projection, SectionKind::LotbankUnderwritingFee) != nullptr);
    REQUIRE(find_section(projection, SectionKind::LotbankManagementFees) != nullptr);
    REQUIRE(projection.sections.back().kind == SectionKind::LotbankDefaultProvision);

    SECTION("Land development projects carry no lotbank sections") {
        ProjectInputs plain = inputs;
        plain.project.analysis_type = AnalysisType::LandDevelopment;
        InMemoryDataProvider plain_provider(plain);
        Projection dev = ProjectionEngine(plain_provider).project(kProjectId);
        REQUIRE(find_section(dev, SectionKind::LotbankOptionDeposits) == nullptr);
    }
}
