// =============================================================================
// orchestrator.cpp - Swap / swap-and-deposit settlement
// =============================================================================

#include "zap/orchestrator.hpp"
#include "zap/error.hpp"
#include "zap/reentrancy.hpp"
#include "zap/uint256.hpp"
#include <spdlog/spdlog.h>

namespace zap {

// =============================================================================
// Constructor
// =============================================================================

LiquidityOrchestrator::LiquidityOrchestrator(const Address& self, const Address& owner,
                                             const ZapDeps& deps)
    : self_(self)
    , owner_(owner)
    , deps_(deps)
    , oracle_(deps.registry)
    , quotes_(oracle_, deps.wrapped.address())
    , executor_(oracle_, deps.wrapped, deps.bank, self) {}

// =============================================================================
// Internal Helpers
// =============================================================================

void LiquidityOrchestrator::check_deadline(const CallContext& ctx, uint64_t deadline) const {
    if (deadline < ctx.timestamp) {
        throw Error(Errc::DeadlineExpired);
    }
}

IFungibleToken& LiquidityOrchestrator::token_contract(const AssetId& token) const {
    IFungibleToken* contract = deps_.assets.find(token);
    if (!contract) {
        throw Error(Errc::InvalidToken, "unknown token " + to_hex(token));
    }
    return *contract;
}

void LiquidityOrchestrator::refund(const Address& to, Amount amount) {
    if (amount == 0) return;
    if (!deps_.bank.transfer(self_, to, amount)) {
        throw Error(Errc::TransferFailed, "native refund");
    }
}

// =============================================================================
// Swap Only
// =============================================================================

Amount LiquidityOrchestrator::swap_exact_output(const CallContext& ctx, const SwapRequest& req) {
    ReentrancyGuard guard(busy_);
    try {
        return do_swap(ctx, req);
    } catch (const Error& e) {
        spdlog::warn("swap_exact_output from {} failed: {}", to_hex(ctx.caller), e.what());
        throw;
    }
}

Amount LiquidityOrchestrator::do_swap(const CallContext& ctx, const SwapRequest& req) {
    check_deadline(ctx, req.deadline);
    Amount required = quotes_.required_input(req.desired_output, req.output_asset);
    if (ctx.value < required) {
        throw Error(Errc::InsufficientInputAmount,
                    "need " + to_string(required) + ", got " + to_string(ctx.value));
    }

    Amount spent = executor_.execute(quotes_.base(), req.output_asset, req.desired_output,
                                     ctx.caller, ctx.timestamp);
    refund(ctx.caller, ctx.value - spent);

    deps_.events.on_swap(SwapExecuted{ctx.caller, req.output_asset, spent, req.desired_output});
    return spent;
}

// =============================================================================
// Swap And Deposit
// =============================================================================

SettlementResult LiquidityOrchestrator::swap_and_add_liquidity(const CallContext& ctx,
                                                               const ZapRequest& req) {
    ReentrancyGuard guard(busy_);
    try {
        return do_zap(ctx, req);
    } catch (const Error& e) {
        spdlog::warn("swap_and_add_liquidity from {} failed: {}", to_hex(ctx.caller), e.what());
        throw;
    }
}

SettlementResult LiquidityOrchestrator::do_zap(const CallContext& ctx, const ZapRequest& req) {
    check_deadline(ctx, req.deadline);
    quotes_.check_request(req.desired_output, req.output_asset);
    if (req.secondary_deposit == 0) {
        throw Error(Errc::InsufficientInputAmount, "no deposit amount");
    }

    // 1. Swap into our own balance; funds must cover both legs
    Amount total = quotes_.total_funds_needed(req.desired_output, req.output_asset,
                                              req.secondary_deposit);
    IFungibleToken& token = token_contract(req.output_asset);
    if (ctx.value < total) {
        throw Error(Errc::InsufficientInputAmount,
                    "need " + to_string(total) + ", got " + to_string(ctx.value));
    }
    Amount spent = executor_.execute(quotes_.base(), req.output_asset, req.desired_output,
                                     self_, ctx.timestamp);

    // 2. Authorise the router for exactly what was acquired
    IDepositRouter& router = deps_.router;
    if (!token.approve(self_, router.address(), req.desired_output)) {
        throw Error(Errc::TransferFailed, "router approval");
    }

    // 3. Deposit; the router refunds unused native funds to us
    if (!deps_.bank.transfer(self_, router.address(), req.secondary_deposit)) {
        throw Error(Errc::TransferFailed, "native funds for deposit");
    }
    DepositResult deposit = router.add_liquidity_native(
        CallContext{self_, req.secondary_deposit, ctx.timestamp},
        req.output_asset, req.desired_output,
        req.min_token_deposit, req.min_base_deposit,
        ctx.caller, req.deadline);

    // 4. Settle leftovers with the caller
    auto token_left = math::checked_sub(req.desired_output, deposit.token_used);
    if (!token_left) {
        throw Error(Errc::TransferFailed, "router consumed more tokens than approved");
    }
    if (*token_left > 0 && !token.transfer(self_, ctx.caller, *token_left)) {
        throw Error(Errc::TransferFailed, "leftover token");
    }

    auto base_left = math::checked_sub(ctx.value - spent, deposit.base_used);
    if (!base_left) {
        throw Error(Errc::TransferFailed, "router consumed more native funds than supplied");
    }
    refund(ctx.caller, *base_left);

    // 5. Record
    deps_.events.on_swap(SwapExecuted{ctx.caller, req.output_asset, spent, req.desired_output});
    deps_.events.on_liquidity(LiquidityAdded{ctx.caller, req.output_asset, deposit.token_used,
                                             deposit.base_used, deposit.units});

    spdlog::info("zap settled for {}: spent {}, deposited {} + {}, units {}",
                 to_hex(ctx.caller), to_string(spent), to_string(deposit.token_used),
                 to_string(deposit.base_used), to_string(deposit.units));

    return SettlementResult{spent, deposit.token_used, deposit.base_used, deposit.units};
}

// =============================================================================
// Administration
// =============================================================================

void LiquidityOrchestrator::recover_asset(const CallContext& ctx, const AssetId& token,
                                          Amount amount) {
    ReentrancyGuard guard(busy_);

    if (ctx.caller != owner_) {
        throw Error(Errc::Unauthorized, to_hex(ctx.caller));
    }
    if (token == deps_.wrapped.address()) {
        throw Error(Errc::InvalidToken, "wrapped native cannot be recovered");
    }
    if (!token_contract(token).transfer(self_, owner_, amount)) {
        throw Error(Errc::TransferFailed, "recovery transfer");
    }

    spdlog::info("recovered {} of {} to owner", to_string(amount), to_hex(token));
}

// =============================================================================
// Queries
// =============================================================================

bool LiquidityOrchestrator::pair_exists(const AssetId& token) const {
    return oracle_.exists(token, quotes_.base());
}

} // namespace zap
