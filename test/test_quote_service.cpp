// LX Zap - Quote Tests

#include <catch2/catch.hpp>
#include <zap/quote_service.hpp>
#include <zap/pricing.hpp>
#include "zap_fixture.hpp"

using namespace zap;
using namespace zap_test;

TEST_CASE("Quotes match the pricing formula", "[quote]") {
    ZapFixture f;
    ReserveOracle oracle(f.chain.registry());
    QuoteService quotes(oracle, sim::Chain::WRAPPED_ADDRESS);

    Amount expected = pricing::required_input(10 * E18, 1000 * E18, 2000 * E18);
    REQUIRE(quotes.required_input(10 * E18, USDC) == expected);

    Quote q = quotes.quote(10 * E18, USDC);
    REQUIRE(q.desired_output == 10 * E18);
    REQUIRE(q.required_input == expected);
}

TEST_CASE("Total funds equals required input plus deposit", "[quote]") {
    ZapFixture f;

    const Amount outputs[] = {1, 1000, 3 * E18, 499 * E18};
    const Amount deposits[] = {1, 7 * E18, AMOUNT_MAX / 2};
    for (Amount out : outputs) {
        for (Amount dep : deposits) {
            REQUIRE(f.zap.quote_total_funds_needed(out, GOLD, dep) ==
                    f.zap.quote_required_input(out, GOLD) + dep);
        }
    }
}

TEST_CASE("Quotes validate like the swap paths", "[quote]") {
    ZapFixture f;

    SECTION("Zero output") {
        REQUIRE(error_of([&] { f.zap.quote_required_input(0, USDC); }) ==
                Errc::InsufficientOutputAmount);
        REQUIRE(error_of([&] { f.zap.quote_total_funds_needed(0, USDC, 1); }) ==
                Errc::InsufficientOutputAmount);
    }

    SECTION("Sentinel and base asset are not tradeable") {
        REQUIRE(error_of([&] { f.zap.quote_required_input(1, ZERO_ADDRESS); }) ==
                Errc::InvalidToken);
        REQUIRE(error_of([&] { f.zap.quote_required_input(1, sim::Chain::WRAPPED_ADDRESS); }) ==
                Errc::InvalidToken);
    }

    SECTION("Unknown pair") {
        REQUIRE_FALSE(f.zap.pair_exists(LONE));
        REQUIRE(f.zap.pair_exists(USDC));
        REQUIRE(error_of([&] { f.zap.quote_required_input(1, LONE); }) == Errc::PairNotFound);
        REQUIRE(error_of([&] { f.zap.quote_total_funds_needed(1, LONE, 1); }) ==
                Errc::PairNotFound);
    }

    SECTION("Output at or above the reserve") {
        REQUIRE(error_of([&] { f.zap.quote_required_input(2000 * E18, USDC); }) ==
                Errc::InsufficientInputAmount);
    }

    SECTION("Total overflow is an error, not a wrap") {
        REQUIRE(error_of([&] { f.zap.quote_total_funds_needed(1, USDC, AMOUNT_MAX); }) ==
                Errc::InsufficientInputAmount);
    }
}

TEST_CASE("Quoting moves no funds", "[quote]") {
    ZapFixture f;
    Reserves before = f.usdc_pool.get_reserves();

    f.zap.quote_total_funds_needed(5 * E18, USDC, 2 * E18);

    Reserves after = f.usdc_pool.get_reserves();
    REQUIRE(after.reserve0 == before.reserve0);
    REQUIRE(after.reserve1 == before.reserve1);
    REQUIRE(f.zap_holds_nothing(f.usdc));
    REQUIRE(f.events.swaps().empty());
}
