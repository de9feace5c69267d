// LX Zap - Reserve Oracle Tests

#include <catch2/catch.hpp>
#include <zap/reserve_oracle.hpp>
#include "zap_fixture.hpp"

using namespace zap;
using namespace zap_test;

// Registry that hands out a fixed pool for one pair, nothing else
class SinglePoolRegistry : public IPoolRegistry {
public:
    SinglePoolRegistry(IPool& pool, const AssetId& a, const AssetId& b)
        : pool_(pool), a_(a), b_(b) {}

    IPool* get_pool(const AssetId& a, const AssetId& b) const override {
        if ((a == a_ && b == b_) || (a == b_ && b == a_)) return &pool_;
        return nullptr;
    }

private:
    IPool& pool_;
    AssetId a_;
    AssetId b_;
};

TEST_CASE("Reserves follow the requested direction", "[oracle]") {
    ZapFixture f;
    ReserveOracle oracle(f.chain.registry());
    const AssetId base = sim::Chain::WRAPPED_ADDRESS;

    SECTION("Token in slot 0") {
        REQUIRE(f.usdc_pool.token0() == USDC);

        auto [base_reserve, token_reserve] = oracle.reserves_for(base, USDC);
        REQUIRE(base_reserve == 1000 * E18);
        REQUIRE(token_reserve == 2000 * E18);

        auto [token_in, base_out] = oracle.reserves_for(USDC, base);
        REQUIRE(token_in == 2000 * E18);
        REQUIRE(base_out == 1000 * E18);
    }

    SECTION("Token in slot 1") {
        REQUIRE(f.gold_pool.token0() == base);

        auto [base_reserve, token_reserve] = oracle.reserves_for(base, GOLD);
        REQUIRE(base_reserve == 1000 * E18);
        REQUIRE(token_reserve == 500 * E18);
    }

    SECTION("Lookup is order independent") {
        REQUIRE(&oracle.pool_for(base, USDC) == &oracle.pool_for(USDC, base));
    }
}

TEST_CASE("Missing pair", "[oracle]") {
    ZapFixture f;
    ReserveOracle oracle(f.chain.registry());

    REQUIRE_FALSE(oracle.exists(LONE, sim::Chain::WRAPPED_ADDRESS));
    REQUIRE(oracle.exists(USDC, sim::Chain::WRAPPED_ADDRESS));
    REQUIRE(error_of([&] { oracle.reserves_for(sim::Chain::WRAPPED_ADDRESS, LONE); }) ==
            Errc::PairNotFound);
    REQUIRE(error_of([&] { oracle.pool_for(USDC, GOLD); }) == Errc::PairNotFound);
}

TEST_CASE("Oracle reads through any registry", "[oracle]") {
    ZapFixture f;
    SinglePoolRegistry registry(f.gold_pool, GOLD, sim::Chain::WRAPPED_ADDRESS);
    ReserveOracle oracle(registry);

    auto [gold_in, base_out] = oracle.reserves_for(GOLD, sim::Chain::WRAPPED_ADDRESS);
    REQUIRE(gold_in == 500 * E18);
    REQUIRE(base_out == 1000 * E18);
    REQUIRE_FALSE(oracle.exists(USDC, sim::Chain::WRAPPED_ADDRESS));
}
