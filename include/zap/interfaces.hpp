#ifndef ZAP_INTERFACES_HPP
#define ZAP_INTERFACES_HPP

#include <vector>

#include "types.hpp"

namespace zap {

// =============================================================================
// External Collaborators
//
// The host chain owns every balance and every pool. These interfaces are the
// only way the zap touches them. Payable calls receive a CallContext whose
// value has already been moved to the callee through INativeBank.
// =============================================================================

// Native coin balances kept by the host
class INativeBank {
public:
    virtual ~INativeBank() = default;

    virtual Amount balance_of(const Address& holder) const = 0;

    // Returns false if `from` cannot cover `amount`
    virtual bool transfer(const Address& from, const Address& to, Amount amount) = 0;
};

// ERC-20 style fungible token
class IFungibleToken {
public:
    virtual ~IFungibleToken() = default;

    virtual Address address() const = 0;
    virtual Amount balance_of(const Address& holder) const = 0;
    virtual Amount allowance(const Address& owner, const Address& spender) const = 0;

    virtual bool transfer(const Address& from, const Address& to, Amount amount) = 0;
    virtual bool approve(const Address& owner, const Address& spender, Amount amount) = 0;
    virtual bool transfer_from(const Address& spender, const Address& from,
                               const Address& to, Amount amount) = 0;
};

// Native coin tokenised as a fungible token
class IWrappedNative : public IFungibleToken {
public:
    // Mint ctx.value wrapped units to ctx.caller
    virtual void deposit(const CallContext& ctx) = 0;

    // Burn `amount` wrapped units of `holder` and pay out native funds
    virtual void withdraw(const Address& holder, Amount amount) = 0;
};

// Constant-product pair; its own token is the liquidity unit
class IPool : public IFungibleToken {
public:
    virtual Reserves get_reserves() const = 0;
    virtual AssetId token0() const = 0;
    virtual AssetId token1() const = 0;

    // Low-level exchange: pays the requested outputs to `to` and checks the
    // fee-adjusted invariant against whatever input has been transferred in
    virtual void swap(Amount amount0_out, Amount amount1_out, const Address& to,
                      const std::vector<uint8_t>& data) = 0;
};

// Factory lookup; returns nullptr when no pair exists
class IPoolRegistry {
public:
    virtual ~IPoolRegistry() = default;

    virtual IPool* get_pool(const AssetId& a, const AssetId& b) const = 0;
};

// Resolves an asset id to its token contract
class IAssetDirectory {
public:
    virtual ~IAssetDirectory() = default;

    virtual IFungibleToken* find(const AssetId& asset) const = 0;
};

// External liquidity router (token + native deposit)
class IDepositRouter {
public:
    virtual ~IDepositRouter() = default;

    virtual Address address() const = 0;

    // Payable: ctx.value is the native amount offered. Pulls at most
    // `amount_token` of `token` from ctx.caller through its allowance,
    // refunds unused native funds to ctx.caller and mints units to `to`.
    virtual DepositResult add_liquidity_native(const CallContext& ctx,
                                               const AssetId& token,
                                               Amount amount_token,
                                               Amount min_token,
                                               Amount min_base,
                                               const Address& to,
                                               uint64_t deadline) = 0;
};

} // namespace zap

#endif // ZAP_INTERFACES_HPP
