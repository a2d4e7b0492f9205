#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "lotbank.hpp"
#include "errors.hpp"

using namespace landcalc;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Test Fixtures
// ============================================================================

namespace {

LotbankProduct make_product(int lot_count, double price, double deposit_pct, double cap_pct,
                            std::vector<int> lots_remaining) {
    LotbankProduct product;
    product.product_id = 1;
    product.lot_count = lot_count;
    product.retail_lot_price = price;
    product.deposit_pct = deposit_pct;
    product.deposit_cap_pct = cap_pct;
    product.lots_remaining_by_period = std::move(lots_remaining);
    return product;
}

LotbankParams make_params(const LotbankProduct& product, size_t num_periods) {
    LotbankParams params;
    params.products = {product};
    params.num_periods = num_periods;
    return params;
}

} // anonymous namespace

// ============================================================================
// Deposit Credit Tests
// ============================================================================

TEST_CASE("Lotbank: single lot is credited in full when it sells", "[lotbank]") {
    LotbankEngine engine;
    auto result = engine.calculate(make_params(make_product(1, 200000.0, 0.15, 0.20, {1, 1, 0}), 3));

    REQUIRE_THAT(result.initial_deposit_received, WithinAbs(30000.0, 0.01));
    REQUIRE_THAT(result.periods[0].total_deposit_credit, WithinAbs(0.0, 0.01));
    REQUIRE_THAT(result.periods[1].total_deposit_credit, WithinAbs(0.0, 0.01));
    REQUIRE_THAT(result.periods[2].total_deposit_credit, WithinAbs(30000.0, 0.01));
    REQUIRE_THAT(result.initial_deposit_received - result.total_credits_returned, WithinAbs(0.0, 0.01));
}

TEST_CASE("Lotbank: zero deposit produces no credits", "[lotbank]") {
    LotbankEngine engine;
    auto result = engine.calculate(make_params(make_product(10, 100000.0, 0.0, 0.20, {8, 6, 4, 2, 0}), 5));

    REQUIRE_THAT(result.initial_deposit_received, WithinAbs(0.0, 0.01));
    REQUIRE_THAT(result.total_credits_returned, WithinAbs(0.0, 0.01));
    for (const auto& lp : result.periods) {
        REQUIRE_THAT(lp.total_deposit_credit, WithinAbs(0.0, 0.01));
    }
}

TEST_CASE("Lotbank: cap equal to deposit credits from the first sale", "[lotbank]") {
    LotbankEngine engine;
    auto result = engine.calculate(make_params(
        make_product(10, 100000.0, 0.20, 0.20, {9, 8, 7, 6, 5, 4, 3, 2, 1, 0}), 10));

    REQUIRE_THAT(result.initial_deposit_received, WithinAbs(200000.0, 0.01));
    // 200k held against 900k of remaining value at a 20% cap
    REQUIRE_THAT(result.periods[0].total_deposit_credit, WithinAbs(20000.0, 0.01));
    for (const auto& lp : result.periods) {
        REQUIRE_THAT(lp.total_deposit_credit, WithinAbs(20000.0, 0.01));
    }
    REQUIRE_THAT(result.initial_deposit_received - result.total_credits_returned, WithinAbs(0.0, 0.01));
}

TEST_CASE("Lotbank: bulk sale in the final period", "[lotbank]") {
    LotbankEngine engine;
    auto result = engine.calculate(make_params(make_product(50, 150000.0, 0.15, 0.20, {50, 50, 50, 0}), 4));

    const double initial = 0.15 * 150000.0 * 50;
    REQUIRE_THAT(result.initial_deposit_received, WithinAbs(initial, 0.01));
    REQUIRE_THAT(result.periods[0].total_deposit_credit, WithinAbs(0.0, 0.01));
    REQUIRE_THAT(result.periods[1].total_deposit_credit, WithinAbs(0.0, 0.01));
    REQUIRE_THAT(result.periods[2].total_deposit_credit, WithinAbs(0.0, 0.01));
    REQUIRE_THAT(result.periods[3].total_deposit_credit, WithinAbs(initial, 0.01));
    REQUIRE_THAT(result.periods[3].product_details[0].deposit_outstanding, WithinAbs(0.0, 0.01));
}

TEST_CASE("Lotbank: deposit rate is capped", "[lotbank]") {
    LotbankProduct product = make_product(10, 100000.0, 0.25, 0.20, {});
    REQUIRE_THAT(product.deposit_per_lot(), WithinAbs(20000.0, 1e-9));
    REQUIRE(product.lots_remaining_at(3) == 10);
}

// ============================================================================
// Fee Tests
// ============================================================================

TEST_CASE("Lotbank: management fee follows remaining lot value", "[lotbank]") {
    LotbankParams params = make_params(make_product(10, 100000.0, 0.10, 0.20, {8, 6, 4, 2, 0}), 5);
    params.management_fee_pct = 0.006;
    auto result = LotbankEngine().calculate(params);

    const double expected[] = {
        800000.0 * 0.006 / 12, 600000.0 * 0.006 / 12, 400000.0 * 0.006 / 12,
        200000.0 * 0.006 / 12, 0.0};
    for (size_t i = 0; i < result.periods.size(); ++i) {
        REQUIRE_THAT(result.periods[i].management_fee, WithinAbs(expected[i], 0.01));
        if (i > 0) {
            REQUIRE(result.periods[i].management_fee <= result.periods[i - 1].management_fee);
        }
    }
    REQUIRE_THAT(result.total_management_fees, WithinAbs(1000.0, 0.01));
}

TEST_CASE("Lotbank: default provision spreads over the horizon", "[lotbank]") {
    LotbankParams params = make_params(make_product(10, 100000.0, 0.10, 0.20, {10, 10, 10, 10, 10}), 5);
    params.default_provision_pct = 0.02;
    params.underwriting_fee = 48000.0;
    auto result = LotbankEngine().calculate(params);

    for (const auto& lp : result.periods) {
        REQUIRE_THAT(lp.default_provision, WithinAbs(400.0, 0.01));
    }
    REQUIRE_THAT(result.total_default_provision, WithinAbs(2000.0, 0.01));
    REQUIRE_THAT(result.underwriting_fee, WithinAbs(48000.0, 0.01));
}

// ============================================================================
// Validation Tests
// ============================================================================

TEST_CASE("Lots remaining must be non-increasing and non-negative", "[lotbank]") {
    LotbankEngine engine;

    SECTION("Increase") {
        auto params = make_params(make_product(10, 100000.0, 0.1, 0.2, {8, 9, 4}), 3);
        REQUIRE_THROWS_AS(engine.calculate(params), ValidationError);
    }

    SECTION("Negative") {
        auto params = make_params(make_product(10, 100000.0, 0.1, 0.2, {8, 4, -1}), 3);
        REQUIRE_THROWS_AS(engine.calculate(params), ValidationError);
    }

    SECTION("Above the lot count") {
        auto params = make_params(make_product(10, 100000.0, 0.1, 0.2, {11, 4, 0}), 3);
        REQUIRE_THROWS_AS(engine.calculate(params), ValidationError);
    }
}

// ============================================================================
// Product Construction Tests
// ============================================================================

TEST_CASE("build_lotbank_products from divisions and sales", "[lotbank]") {
    Division priced;
    priced.division_id = 7;
    priced.display_name = "50' Lots";
    priced.option_deposit_pct = 0.15;
    priced.retail_lot_price = 90000.0;

    Division unpriced;
    unpriced.division_id = 8;

    AbsorptionSchedule absorption;
    for (size_t period : {2u, 5u}) {
        PeriodSales bucket;
        bucket.period_index = period;
        bucket.period_sequence = period + 1;
        ScheduledSale sale;
        sale.division_id = 7;
        sale.units = 4;
        bucket.parcels.push_back(sale);
        ScheduledSale other;
        other.division_id = 8;
        other.units = 3;
        bucket.parcels.push_back(other);
        absorption.period_sales.push_back(bucket);
    }

    auto products = build_lotbank_products({priced, unpriced}, absorption, 8, std::nullopt);

    REQUIRE(products.size() == 1);
    const LotbankProduct& product = products[0];
    REQUIRE(product.product_id == 7);
    REQUIRE(product.lot_count == 8);
    REQUIRE_THAT(product.deposit_cap_pct, WithinAbs(0.15, 1e-12));
    REQUIRE(product.lots_remaining_by_period == std::vector<int>{8, 8, 4, 4, 4, 0, 0, 0});
    REQUIRE_NOTHROW(validate_lots_remaining(product));

    SECTION("Filter excludes other divisions") {
        REQUIRE(build_lotbank_products({priced}, absorption, 8, std::vector<int64_t>{8}).empty());
    }

    SECTION("Sales outside the horizon are ignored") {
        auto short_products = build_lotbank_products({priced}, absorption, 4, std::nullopt);
        REQUIRE(short_products.size() == 1);
        REQUIRE(short_products[0].lot_count == 4);
    }
}
