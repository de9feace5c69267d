// Shared test helpers: a seeded in-memory chain and a zap bound to it

#pragma once

#include <optional>

#include "zap/zap.hpp"

namespace zap_test {

using namespace zap;

constexpr Amount E18 = 1000000000000000000ULL;

constexpr Address PROVIDER = make_address(0x0C00);
constexpr Address ALICE = make_address(0x0A11);
constexpr Address OWNER = make_address(0x0E0E);
constexpr Address ZAP = make_address(0x0F00);

// Below the wrapped native address: token sits in slot 0
constexpr Address USDC = make_address(0x1000);
// Above the wrapped native address: token sits in slot 1
constexpr Address GOLD = make_address(0xF100);
// Registered token without a pool
constexpr Address LONE = make_address(0x2000);

// Error kind raised by fn, or nullopt if it returned normally
template <typename Fn>
std::optional<Errc> error_of(Fn&& fn) {
    try {
        fn();
    } catch (const Error& e) {
        return e.code();
    }
    return std::nullopt;
}

struct ZapFixture {
    sim::Chain chain;
    EventLog events;
    sim::Token& usdc;
    sim::Token& gold;
    sim::Token& lone;
    sim::Pair& usdc_pool;
    sim::Pair& gold_pool;
    LiquidityOrchestrator zap;

    ZapFixture()
        : usdc(chain.create_token(USDC, "USDC"))
        , gold(chain.create_token(GOLD, "GOLD"))
        , lone(chain.create_token(LONE, "LONE"))
        , usdc_pool(seed(usdc, 2000 * E18, 1000 * E18))
        , gold_pool(seed(gold, 500 * E18, 1000 * E18))
        , zap(ZAP, OWNER, ZapDeps{chain.registry(), chain.wrapped(), chain.router(),
                                  chain.assets(), chain.bank(), events}) {}

    sim::Pair& seed(sim::Token& token, Amount token_reserve, Amount base_reserve) {
        token.mint(PROVIDER, token_reserve);
        chain.bank().mint(PROVIDER, base_reserve);
        return chain.create_pool(token, token_reserve, base_reserve, PROVIDER);
    }

    uint64_t deadline() const { return chain.now() + 600; }

    // Funds ALICE with exactly `value` and attaches it to a call to the zap
    CallContext fund_and_pay(Amount value) {
        chain.bank().mint(ALICE, value);
        return chain.pay(ALICE, ZAP, value);
    }

    bool zap_holds_nothing(const sim::Token& token) const {
        return chain.bank().balance_of(ZAP) == 0 &&
               chain.wrapped().balance_of(ZAP) == 0 &&
               token.balance_of(ZAP) == 0;
    }
};

}  // namespace zap_test
