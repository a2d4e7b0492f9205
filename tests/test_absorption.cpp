#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "absorption.hpp"

using namespace landcalc;
using Catch::Approx;

namespace {

ParcelSale make_parcel(int64_t id, size_t sale_period, double units, double gross) {
    ParcelSale p;
    p.parcel_id = id;
    p.parcel_code = "P-" + std::to_string(id);
    p.container_id = 10;
    p.container_label = "Phase 1";
    p.division_id = 100;
    p.sale_period = sale_period;
    p.units = units;
    p.acres = 5.0;
    p.gross_revenue = gross;
    p.commissions = gross * 0.03;
    p.legal_costs = 1000.0;
    p.closing_costs = 2000.0;
    p.title_costs = 500.0;
    p.subdivision_costs = 10000.0;
    p.net_revenue = gross - p.commissions - p.transaction_costs() - p.subdivision_costs;
    return p;
}

} // anonymous namespace

TEST_CASE("Parcel transaction costs and lot count", "[absorption]") {
    ParcelSale p = make_parcel(1, 1, 12.0, 1200000.0);
    REQUIRE(p.transaction_costs() == Approx(3500.0));
    REQUIRE(p.lot_count() == 12);

    p.units = 0.0;
    REQUIRE(p.lot_count() == 1);
}

TEST_CASE("Price escalation factor", "[absorption]") {
    REQUIRE(price_escalation_factor(1, 0.05) == Approx(1.0));
    REQUIRE(price_escalation_factor(13, 0.05) == Approx(1.05));
    REQUIRE(price_escalation_factor(25, 0.05) == Approx(1.1025));
    REQUIRE(price_escalation_factor(25, std::nullopt) == Approx(1.0));
    REQUIRE(price_escalation_factor(25, 0.0) == Approx(1.0));
}

TEST_CASE("schedule_parcel_sale", "[absorption]") {
    SECTION("Revenue and transaction costs escalate, subdivision costs do not") {
        ParcelSale p = make_parcel(1, 13, 10.0, 1000000.0);
        auto sale = schedule_parcel_sale(p, 0.05);

        REQUIRE(sale.has_value());
        REQUIRE(sale->gross_revenue == Approx(1050000.0));
        REQUIRE(sale->commissions == Approx(31500.0));
        REQUIRE(sale->closing_costs == Approx(3675.0));
        REQUIRE(sale->subdivision_costs == Approx(10000.0));
        REQUIRE(sale->net_revenue == Approx(p.net_revenue * 1.05));
        REQUIRE(sale->units == 10);
    }

    SECTION("Parcels without a sale period are excluded") {
        ParcelSale p = make_parcel(2, 1, 10.0, 1000000.0);
        p.sale_period.reset();
        REQUIRE_FALSE(schedule_parcel_sale(p, std::nullopt).has_value());
    }

    SECTION("Parcels with neither units nor acreage are excluded") {
        ParcelSale p = make_parcel(3, 4, 0.0, 1000000.0);
        p.acres = 0.0;
        REQUIRE_FALSE(schedule_parcel_sale(p, std::nullopt).has_value());
    }

    SECTION("Acreage-only parcel counts as one unit") {
        ParcelSale p = make_parcel(4, 4, 0.0, 1000000.0);
        auto sale = schedule_parcel_sale(p, std::nullopt);
        REQUIRE(sale.has_value());
        REQUIRE(sale->units == 1);
    }
}

TEST_CASE("build_absorption_schedule groups sales by period", "[absorption]") {
    std::vector<ParcelSale> parcels = {
        make_parcel(1, 6, 10.0, 1000000.0),
        make_parcel(2, 3, 5.0, 400000.0),
        make_parcel(3, 6, 8.0, 900000.0),
    };
    parcels.push_back(make_parcel(4, 1, 1.0, 100.0));
    parcels.back().sale_period.reset();

    AbsorptionSchedule schedule = build_absorption_schedule(parcels, std::nullopt);

    REQUIRE(schedule.total_parcels == 3);
    REQUIRE(schedule.total_units == 23);
    REQUIRE(schedule.total_gross_revenue == Approx(2300000.0));
    REQUIRE(schedule.total_subdivision_costs == Approx(30000.0));

    REQUIRE(schedule.period_sales.size() == 2);
    REQUIRE(schedule.period_sales[0].period_sequence == 3);
    REQUIRE(schedule.period_sales[0].period_index == 2);
    REQUIRE(schedule.period_sales[1].period_sequence == 6);
    REQUIRE(schedule.period_sales[1].parcels.size() == 2);
    REQUIRE(schedule.period_sales[1].total_units == 18);
    REQUIRE(schedule.period_sales[1].total_gross_revenue == Approx(1900000.0));

    SECTION("Totals equal the sum over periods") {
        double net = 0.0;
        int units = 0;
        for (const auto& ps : schedule.period_sales) {
            net += ps.total_net_revenue;
            units += ps.total_units;
        }
        REQUIRE(net == Approx(schedule.total_net_revenue));
        REQUIRE(units == schedule.total_units);
    }
}
