#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "io/csv_reader.hpp"
#include "io/record_loader.hpp"
#include "errors.hpp"
#include <sstream>

using namespace landcalc;
using Catch::Matchers::ContainsSubstring;

#ifndef LANDCALC_TEST_DATA_DIR
#define LANDCALC_TEST_DATA_DIR "data"
#endif

TEST_CASE("CsvReader", "[loader]") {
    std::istringstream is("a, b ,c\r\n\"x, y\",\"say \"\"hi\"\"\",\n");
    CsvReader reader(is);

    auto header = reader.read_row();
    REQUIRE(header == std::vector<std::string>{"a", "b", "c"});

    REQUIRE(reader.has_more());
    auto row = reader.read_row();
    REQUIRE(row.size() == 3);
    REQUIRE(row[0] == "x, y");
    REQUIRE(row[1] == "say \"hi\"");
    REQUIRE(row[2].empty());

    REQUIRE_FALSE(reader.has_more());
}

TEST_CASE("Budget CSV", "[loader]") {
    std::istringstream is(
        "fact_id,container_id,description,activity,amount,start_period,periods_to_complete,timing_method,escalation_rate\n"
        "11,3,Mass grading,Development,1200000,4,12,curve,3\n"
        "12,,\"Permits, fees\",Planning,45000,0,,LUMP,\n"
        "\n");

    auto items = load_budget_items(is);
    REQUIRE(items.size() == 2);

    REQUIRE(items[0].fact_id == 11);
    REQUIRE(items[0].container_id == std::optional<int64_t>(3));
    REQUIRE(items[0].amount == 1200000.0);
    REQUIRE(items[0].start_period == std::optional<size_t>(4));
    REQUIRE(items[0].periods_to_complete == std::optional<int>(12));
    REQUIRE(items[0].timing_method == TimingMethod::Curve);
    REQUIRE(items[0].escalation_rate == std::optional<double>(3.0));
    REQUIRE(items[0].last_period() == 15);

    REQUIRE_FALSE(items[1].container_id.has_value());
    REQUIRE(items[1].description == "Permits, fees");
    REQUIRE_FALSE(items[1].start_period.has_value());
    REQUIRE(items[1].timing_method == TimingMethod::Lump);
    REQUIRE_FALSE(items[1].escalation_rate.has_value());
}

TEST_CASE("Loader errors", "[loader]") {
    SECTION("Missing required column") {
        std::istringstream is("fact_id,description\n1,Grading\n");
        REQUIRE_THROWS_WITH(load_budget_items(is), ContainsSubstring("requires column: amount"));
    }

    SECTION("Unparseable number names the row") {
        std::istringstream is("fact_id,amount\n1,100\n2,12k\n");
        REQUIRE_THROWS_WITH(load_budget_items(is), ContainsSubstring("row 3"));
    }

    SECTION("Unknown enum value") {
        std::istringstream is("loan_id,structure_type\n1,BRIDGE\n");
        REQUIRE_THROWS_AS(load_loans(is), ValidationError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_WITH(load_parcel_sales("no/such/parcels.csv"),
                            ContainsSubstring("Cannot open file"));
    }
}

TEST_CASE("Parcel, acquisition and division CSVs", "[loader]") {
    std::istringstream parcels(
        "parcel_id,parcel_code,container_id,division_id,sale_period,units,acres,gross_revenue,net_revenue,commissions,legal_costs,closing_costs,title_costs\n"
        "1,P-1,10,100,12,24,6.5,2400000,2280000,96000,5000,15000,4000\n"
        "2,P-2,10,100,,10,2,900000,850000,0,0,0,0\n");
    auto sales = load_parcel_sales(parcels);
    REQUIRE(sales.size() == 2);
    REQUIRE(sales[0].sale_period == std::optional<size_t>(12));
    REQUIRE(sales[0].transaction_costs() == 24000.0);
    REQUIRE(sales[0].subdivision_costs == 0.0);
    REQUIRE_FALSE(sales[1].sale_period.has_value());

    std::istringstream acquisitions(
        "acquisition_id,description,amount,applied_to_purchase\n"
        "1,Purchase price,3000000,\n"
        "2,Earnest money,50000,no\n");
    auto costs = load_acquisition_costs(acquisitions);
    REQUIRE(costs.size() == 2);
    REQUIRE(costs[0].applied_to_purchase);
    REQUIRE_FALSE(costs[1].applied_to_purchase);

    std::istringstream divisions(
        "division_id,display_name,option_deposit_pct,retail_lot_price\n"
        "100,50' Lots,0.15,185000\n"
        "200,Commercial,,\n");
    auto divs = load_divisions(divisions);
    REQUIRE(divs.size() == 2);
    REQUIRE(divs[0].has_lotbank_pricing());
    REQUIRE_FALSE(divs[1].has_lotbank_pricing());
}

TEST_CASE("Loan CSV", "[loader]") {
    std::istringstream is(
        "loan_id,loan_name,structure_type,commitment_amount,interest_rate_pct,loan_term_months,amortization_months,container_ids,loan_start_date,takes_out_loan_id\n"
        "1,A&D Revolver,revolver,0,8.5,36,,10;20,2025-03-01,\n"
        "2,Takeout,Term,2000000,6,,240,,,1\n");

    auto loans = load_loans(is);
    REQUIRE(loans.size() == 2);

    REQUIRE(loans[0].structure_type == StructureType::Revolver);
    REQUIRE(loans[0].container_ids == std::vector<int64_t>{10, 20});
    REQUIRE(loans[0].loan_start_date == std::optional<Date>(Date(2025, 3, 1)));
    REQUIRE(loans[0].amortization_months == 0);
    REQUIRE(loans[0].resolve_term_months(12) == 36);

    REQUIRE(loans[1].structure_type == StructureType::Term);
    REQUIRE(loans[1].container_ids.empty());
    REQUIRE_FALSE(loans[1].loan_start_date.has_value());
    REQUIRE(loans[1].takes_out_loan_id == std::optional<int64_t>(1));
    REQUIRE(loans[1].resolve_term_months(48) == 48);
}

TEST_CASE("Sample project inputs", "[loader]") {
    ProjectConfig config = parse_project_config_from_file(std::string(LANDCALC_TEST_DATA_DIR) + "/project.json");
    ProjectInputs inputs = load_project_inputs(config);

    REQUIRE(inputs.project.project_id == 1);
    REQUIRE_FALSE(inputs.budget.empty());
    REQUIRE_FALSE(inputs.parcels.empty());
    REQUIRE_FALSE(inputs.acquisitions.empty());
    REQUIRE_FALSE(inputs.loans.empty());
    REQUIRE_FALSE(inputs.divisions.empty());
}
