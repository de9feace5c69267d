#ifndef ZAP_ORCHESTRATOR_HPP
#define ZAP_ORCHESTRATOR_HPP

#include "types.hpp"
#include "interfaces.hpp"
#include "events.hpp"
#include "reserve_oracle.hpp"
#include "quote_service.hpp"
#include "swap_executor.hpp"

namespace zap {

// =============================================================================
// Collaborators bound at construction
// =============================================================================

struct ZapDeps {
    const IPoolRegistry& registry;
    IWrappedNative& wrapped;
    IDepositRouter& router;
    const IAssetDirectory& assets;
    INativeBank& bank;
    IEventSink& events;
};

// =============================================================================
// LiquidityOrchestrator - exact-output swap, optionally followed by a
// liquidity deposit into the same pair
//
// Native funds attached to a call (ctx.value) are credited to `self` by the
// host before entry and are fully paid out (pair, router or refund) before
// return. Every funds-moving operation is reentrancy-guarded.
// =============================================================================

class LiquidityOrchestrator {
public:
    LiquidityOrchestrator(const Address& self, const Address& owner, const ZapDeps& deps);
    ~LiquidityOrchestrator() = default;

    // Non-copyable
    LiquidityOrchestrator(const LiquidityOrchestrator&) = delete;
    LiquidityOrchestrator& operator=(const LiquidityOrchestrator&) = delete;

    // =========================================================================
    // Funds-moving operations
    // =========================================================================

    // Buy exactly req.desired_output tokens for the caller; returns base spent
    Amount swap_exact_output(const CallContext& ctx, const SwapRequest& req);

    // Buy tokens, deposit them with req.secondary_deposit native funds and
    // send the liquidity units to the caller
    SettlementResult swap_and_add_liquidity(const CallContext& ctx, const ZapRequest& req);

    // Owner-only sweep of a stray token balance (never the wrapped native)
    void recover_asset(const CallContext& ctx, const AssetId& token, Amount amount);

    // =========================================================================
    // Read-only
    // =========================================================================

    Amount quote_required_input(Amount desired_output, const AssetId& token) const {
        return quotes_.required_input(desired_output, token);
    }

    Amount quote_total_funds_needed(Amount desired_output, const AssetId& token,
                                    Amount secondary_deposit) const {
        return quotes_.total_funds_needed(desired_output, token, secondary_deposit);
    }

    bool pair_exists(const AssetId& token) const;

    const Address& address() const { return self_; }
    const Address& owner() const { return owner_; }
    bool busy() const { return busy_; }

private:
    Address self_;
    Address owner_;
    ZapDeps deps_;

    ReserveOracle oracle_;
    QuoteService quotes_;
    SwapExecutor executor_;

    bool busy_{false};

    void check_deadline(const CallContext& ctx, uint64_t deadline) const;
    IFungibleToken& token_contract(const AssetId& token) const;
    void refund(const Address& to, Amount amount);

    Amount do_swap(const CallContext& ctx, const SwapRequest& req);
    SettlementResult do_zap(const CallContext& ctx, const ZapRequest& req);
};

} // namespace zap

#endif // ZAP_ORCHESTRATOR_HPP
