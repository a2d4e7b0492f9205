#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "cost_schedule.hpp"
#include "errors.hpp"
#include <cmath>
#include <numeric>

using namespace landcalc;
using Catch::Approx;

namespace {

BudgetItem make_budget_item(int64_t fact_id, double amount, size_t start, int duration,
                            TimingMethod method = TimingMethod::Distributed) {
    BudgetItem item;
    item.fact_id = fact_id;
    item.container_id = 1;
    item.container_label = "Phase 1";
    item.description = "Item " + std::to_string(fact_id);
    item.activity = "Development";
    item.amount = amount;
    item.start_period = start;
    item.periods_to_complete = duration;
    item.timing_method = method;
    return item;
}

double sum_amounts(const std::vector<PeriodAmount>& placed) {
    double total = 0.0;
    for (const auto& pa : placed) total += pa.amount;
    return total;
}

} // anonymous namespace

// ============================================================================
// Timing Method Tests
// ============================================================================

TEST_CASE("parse_timing_method", "[cost]") {
    REQUIRE(parse_timing_method("lump") == TimingMethod::Lump);
    REQUIRE(parse_timing_method("Distributed") == TimingMethod::Distributed);
    REQUIRE(parse_timing_method("CURVE") == TimingMethod::Curve);
    REQUIRE(parse_timing_method("") == TimingMethod::Distributed);
    REQUIRE_THROWS_AS(parse_timing_method("weekly"), ValidationError);
}

// ============================================================================
// Distribution Tests
// ============================================================================

TEST_CASE("Lump sum lands whole in the start period", "[cost]") {
    auto placed = distribute_budget_item(1000000.0, 3, 12, 24, TimingMethod::Lump, 0.5, 0.0);

    REQUIRE(placed.size() == 1);
    REQUIRE(placed[0].period_index == 2);
    REQUIRE(placed[0].amount == Approx(1000000.0));
}

TEST_CASE("Even distribution splits the amount over the duration", "[cost]") {
    auto placed = distribute_budget_item(120000.0, 1, 12, 24, TimingMethod::Distributed, 0.5, 0.0);

    REQUIRE(placed.size() == 12);
    for (size_t i = 0; i < placed.size(); ++i) {
        REQUIRE(placed[i].period_index == i);
        REQUIRE(placed[i].amount == Approx(10000.0));
    }
}

TEST_CASE("A single-period duration places the full amount", "[cost]") {
    auto placed = distribute_budget_item(5000.0, 4, 1, 12, TimingMethod::Curve, 0.5, 0.0);

    REQUIRE(placed.size() == 1);
    REQUIRE(placed[0].period_index == 3);
    REQUIRE(placed[0].amount == Approx(5000.0));
}

TEST_CASE("S-curve weights", "[cost]") {
    SECTION("Sum to one") {
        for (size_t n : {2u, 5u, 12u, 36u}) {
            for (double steepness : {0.25, 0.5, 1.0}) {
                auto w = scurve_weights(n, steepness);
                REQUIRE(w.size() == n);
                double sum = std::accumulate(w.begin(), w.end(), 0.0);
                REQUIRE(std::abs(sum - 1.0) < 1e-9);
            }
        }
    }

    SECTION("Middle periods carry more than the tails") {
        auto w = scurve_weights(12, 0.5);
        REQUIRE(w[6] > w[1]);
        REQUIRE(w[6] > w[11]);
    }

    SECTION("Degenerate sizes") {
        REQUIRE(scurve_weights(0, 0.5).empty());
        REQUIRE(scurve_weights(1, 0.5) == std::vector<double>{1.0});
    }

    SECTION("Curve distribution preserves the amount") {
        auto placed = distribute_budget_item(250000.0, 1, 18, 24, TimingMethod::Curve, 0.5, 0.0);
        REQUIRE(placed.size() == 18);
        REQUIRE(sum_amounts(placed) == Approx(250000.0));
    }
}

TEST_CASE("Items past the horizon are truncated without gross-up", "[cost]") {
    // 12-month item starting in month 7 of a 12-month horizon keeps 6 months
    auto placed = distribute_budget_item(120000.0, 7, 12, 12, TimingMethod::Distributed, 0.5, 0.0);

    REQUIRE(placed.size() == 6);
    REQUIRE(placed.front().period_index == 6);
    REQUIRE(placed.back().period_index == 11);
    for (const auto& pa : placed) {
        REQUIRE(pa.amount == Approx(10000.0));
    }
    REQUIRE(sum_amounts(placed) == Approx(60000.0));

    SECTION("A truncated curve keeps the leading weights of the full curve") {
        auto placed = distribute_budget_item(120000.0, 1, 12, 6, TimingMethod::Curve, 0.5, 0.0);
        auto w = scurve_weights(12, 0.5);
        REQUIRE(placed.size() == 6);
        for (size_t i = 0; i < 6; ++i) {
            REQUIRE(placed[i].amount == Approx(120000.0 * w[i]));
        }
        REQUIRE(sum_amounts(placed) < 120000.0);
    }

    SECTION("An item that starts after the horizon places nothing") {
        REQUIRE(distribute_budget_item(1000.0, 13, 1, 12, TimingMethod::Lump, 0.5, 0.0).empty());
    }
}

TEST_CASE("Cost inflation compounds from period one", "[cost]") {
    REQUIRE(apply_inflation(1000.0, 1, 0.03) == Approx(1000.0));
    REQUIRE(apply_inflation(1000.0, 13, 0.03) == Approx(1030.0));
    REQUIRE(apply_inflation(1000.0, 25, 0.03) == Approx(1060.9));
    REQUIRE(apply_inflation(1000.0, 25, 0.0) == Approx(1000.0));

    auto placed = distribute_budget_item(24000.0, 1, 24, 24, TimingMethod::Distributed, 0.5, 0.03);
    REQUIRE(placed[0].amount == Approx(1000.0));
    REQUIRE(placed[12].amount == Approx(1030.0));
}

// ============================================================================
// Categorisation Tests
// ============================================================================

TEST_CASE("Budget activities map to display categories", "[cost]") {
    REQUIRE(category_for_activity("Acquisition", "") == "Land Acquisition");
    REQUIRE(category_for_activity("Planning", "") == "Planning & Engineering");
    REQUIRE(category_for_activity("Development", "") == "Development Costs");
    REQUIRE(category_for_activity("Operations", "") == "Operating Costs");
    REQUIRE(category_for_activity("Financing", "") == "Financing Costs");
    REQUIRE(category_for_activity("Disposition", "") == "Disposition Costs");
    REQUIRE(category_for_activity("", "Misc") == "Other Costs");
    REQUIRE(category_for_activity("Development", "Hard cost contingency") == "Contingency");

    const auto& order = cost_category_order();
    REQUIRE(order.front() == "Land Acquisition");
    REQUIRE(order.back() == "Other Costs");
}

// ============================================================================
// Schedule Builder Tests
// ============================================================================

TEST_CASE("build_cost_schedule", "[cost]") {
    std::vector<BudgetItem> items = {
        make_budget_item(1, 120000.0, 1, 12),
        make_budget_item(2, 50000.0, 3, 1, TimingMethod::Lump),
    };
    items[1].activity = "Planning";

    SECTION("Period totals reconcile with category totals") {
        CostSchedule schedule = build_cost_schedule(items, 12, std::nullopt, std::nullopt);

        REQUIRE(schedule.total_costs == Approx(170000.0));
        REQUIRE(schedule.period_totals.size() == 12);
        double period_sum = std::accumulate(schedule.period_totals.begin(),
                                            schedule.period_totals.end(), 0.0);
        REQUIRE(period_sum == Approx(schedule.total_costs));
        REQUIRE(schedule.period_totals[2] == Approx(60000.0));

        REQUIRE(schedule.category_summary.at("Development Costs").total == Approx(120000.0));
        REQUIRE(schedule.category_summary.at("Planning & Engineering").total == Approx(50000.0));
    }

    SECTION("Non-positive amounts are skipped") {
        items.push_back(make_budget_item(3, 0.0, 1, 1));
        items.push_back(make_budget_item(4, -500.0, 1, 1));
        CostSchedule schedule = build_cost_schedule(items, 12, std::nullopt, std::nullopt);
        REQUIRE(schedule.category_summary.at("Development Costs").items.size() == 1);
    }

    SECTION("Truncated items report only the placed amount") {
        CostSchedule schedule = build_cost_schedule(items, 6, std::nullopt, std::nullopt);
        REQUIRE(schedule.category_summary.at("Development Costs").total == Approx(60000.0));
        REQUIRE(schedule.total_costs == Approx(110000.0));
    }

    SECTION("Container filter drops other containers") {
        items[1].container_id = 2;
        CostSchedule schedule = build_cost_schedule(items, 12, std::vector<int64_t>{2}, std::nullopt);
        REQUIRE(schedule.total_costs == Approx(50000.0));
        REQUIRE(schedule.category_summary.count("Development Costs") == 0);
    }

    SECTION("Item escalation overrides the portfolio rate") {
        std::vector<BudgetItem> late = {make_budget_item(5, 1000.0, 13, 1, TimingMethod::Lump)};
        CostSchedule portfolio = build_cost_schedule(late, 24, std::nullopt, 0.03);
        REQUIRE(portfolio.total_costs == Approx(1030.0));

        late[0].escalation_rate = 5.0;
        CostSchedule own = build_cost_schedule(late, 24, std::nullopt, 0.03);
        REQUIRE(own.total_costs == Approx(1050.0));
    }
}

TEST_CASE("Land acquisition is scheduled in the first period", "[cost]") {
    std::vector<AcquisitionCost> acquisitions(3);
    acquisitions[0].amount = 2000000.0;
    acquisitions[1].amount = 500000.0;
    acquisitions[2].amount = 100000.0;
    acquisitions[2].applied_to_purchase = false;

    SECTION("Full project") {
        CostSchedule schedule = build_cost_schedule({}, 12, std::nullopt, std::nullopt, acquisitions);
        const auto& land = schedule.category_summary.at(kLandAcquisitionCategory);
        REQUIRE(land.items.size() == 1);
        REQUIRE(land.items[0].fact_id == -1);
        REQUIRE(land.items[0].description == "Land Acquisition");
        REQUIRE(land.total == Approx(2500000.0));
        REQUIRE(schedule.period_totals[0] == Approx(2500000.0));
    }

    SECTION("Pro-rated by acreage under a filter") {
        CostSchedule schedule = build_cost_schedule({}, 12, std::vector<int64_t>{1}, std::nullopt,
                                                    acquisitions, AcreageSplit(100.0, 40.0));
        const auto& land = schedule.category_summary.at(kLandAcquisitionCategory);
        REQUIRE(land.total == Approx(1000000.0));
        REQUIRE(land.items[0].description == "Land Acquisition (40% allocation)");
    }
}
