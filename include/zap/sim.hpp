#ifndef ZAP_SIM_HPP
#define ZAP_SIM_HPP

#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "types.hpp"
#include "error.hpp"
#include "interfaces.hpp"

namespace zap {
namespace sim {

// =============================================================================
// In-memory host: native balances, ERC-20 tokens, wrapped native,
// constant-product pairs, pair registry and deposit router.
// Used for dry runs (CLI) and as the collaborator set in tests.
// =============================================================================

using BalanceMap = std::unordered_map<Address, Amount, AddressHash>;

// =============================================================================
// NativeBank
// =============================================================================

class NativeBank : public INativeBank {
public:
    Amount balance_of(const Address& holder) const override;
    bool transfer(const Address& from, const Address& to, Amount amount) override;

    void mint(const Address& to, Amount amount) { balances_[to] += amount; }

    BalanceMap state() const { return balances_; }
    void restore(const BalanceMap& balances) { balances_ = balances; }

private:
    BalanceMap balances_;
};

// =============================================================================
// Token ledger shared by every token-like contract
// =============================================================================

struct TokenState {
    BalanceMap balances;
    std::map<std::pair<Address, Address>, Amount> allowances;
    Amount total_supply = 0;
};

template <typename Interface>
class BasicToken : public Interface {
public:
    BasicToken(const Address& self, std::string symbol)
        : self_(self), symbol_(std::move(symbol)) {}

    Address address() const override { return self_; }
    const std::string& symbol() const { return symbol_; }
    Amount total_supply() const { return state_.total_supply; }

    Amount balance_of(const Address& holder) const override {
        auto it = state_.balances.find(holder);
        return it != state_.balances.end() ? it->second : 0;
    }

    Amount allowance(const Address& owner, const Address& spender) const override {
        auto it = state_.allowances.find({owner, spender});
        return it != state_.allowances.end() ? it->second : 0;
    }

    bool transfer(const Address& from, const Address& to, Amount amount) override {
        Amount& from_balance = state_.balances[from];
        if (from_balance < amount) return false;
        from_balance -= amount;
        state_.balances[to] += amount;
        return true;
    }

    bool approve(const Address& owner, const Address& spender, Amount amount) override {
        state_.allowances[{owner, spender}] = amount;
        return true;
    }

    bool transfer_from(const Address& spender, const Address& from,
                       const Address& to, Amount amount) override {
        Amount& allowed = state_.allowances[{from, spender}];
        if (allowed < amount) return false;
        if (!transfer(from, to, amount)) return false;
        allowed -= amount;
        return true;
    }

    void mint(const Address& to, Amount amount) {
        state_.balances[to] += amount;
        state_.total_supply += amount;
    }

    bool burn(const Address& from, Amount amount) {
        Amount& balance = state_.balances[from];
        if (balance < amount) return false;
        balance -= amount;
        state_.total_supply -= amount;
        return true;
    }

    const TokenState& state() const { return state_; }
    void restore(const TokenState& state) { state_ = state; }

protected:
    Address self_;
    std::string symbol_;
    TokenState state_;
};

using Token = BasicToken<IFungibleToken>;

// =============================================================================
// WrappedNative
// =============================================================================

class WrappedNative : public BasicToken<IWrappedNative> {
public:
    WrappedNative(const Address& self, NativeBank& bank)
        : BasicToken<IWrappedNative>(self, "WLUX"), bank_(bank) {}

    void deposit(const CallContext& ctx) override;
    void withdraw(const Address& holder, Amount amount) override;

private:
    NativeBank& bank_;
};

// =============================================================================
// Pair - constant-product pool, 0.3% fee, liquidity units as its own token
// =============================================================================

class Pair : public BasicToken<IPool> {
public:
    Pair(const Address& self, IFungibleToken& a, IFungibleToken& b);

    Reserves get_reserves() const override { return reserves_; }
    AssetId token0() const override { return token0_->address(); }
    AssetId token1() const override { return token1_->address(); }

    void swap(Amount amount0_out, Amount amount1_out, const Address& to,
              const std::vector<uint8_t>& data) override;

    // Mint units for whatever was transferred in since the last update
    Amount mint(const Address& to);

    void restore_reserves(const Reserves& r) { reserves_ = r; }

private:
    IFungibleToken* token0_;
    IFungibleToken* token1_;
    Reserves reserves_{0, 0, 0};

    void update(Amount balance0, Amount balance1);
};

// =============================================================================
// Registry
// =============================================================================

class Registry : public IPoolRegistry {
public:
    IPool* get_pool(const AssetId& a, const AssetId& b) const override { return find_pair(a, b); }

    Pair* find_pair(const AssetId& a, const AssetId& b) const;

    // Throws std::invalid_argument on identical tokens or a duplicate pair
    Pair& create_pair(IFungibleToken& a, IFungibleToken& b, const Address& pair_address);

    const std::vector<Pair*>& pairs() const { return ordered_; }

    // Forgets the most recently created pair
    void drop_last();

private:
    std::map<std::pair<AssetId, AssetId>, std::unique_ptr<Pair>> pairs_;
    std::vector<Pair*> ordered_;
};

// =============================================================================
// AssetDirectory
// =============================================================================

class AssetDirectory : public IAssetDirectory {
public:
    IFungibleToken* find(const AssetId& asset) const override;

    void add(IFungibleToken& token) { tokens_[token.address()] = &token; }
    void remove(const AssetId& asset) { tokens_.erase(asset); }

private:
    std::unordered_map<AssetId, IFungibleToken*, AddressHash> tokens_;
};

// =============================================================================
// Router - token + native deposits at the current pool ratio
// =============================================================================

class Router : public IDepositRouter {
public:
    Router(const Address& self, Registry& registry, WrappedNative& wrapped,
           const AssetDirectory& assets, NativeBank& bank)
        : self_(self), registry_(registry), wrapped_(wrapped), assets_(assets), bank_(bank) {}

    Address address() const override { return self_; }

    DepositResult add_liquidity_native(const CallContext& ctx,
                                       const AssetId& token,
                                       Amount amount_token,
                                       Amount min_token,
                                       Amount min_base,
                                       const Address& to,
                                       uint64_t deadline) override;

private:
    Address self_;
    Registry& registry_;
    WrappedNative& wrapped_;
    const AssetDirectory& assets_;
    NativeBank& bank_;
};

// =============================================================================
// Chain - owns a full collaborator set and emulates the host's atomic
// transaction boundary with snapshot/restore
// =============================================================================

class Chain {
public:
    static constexpr Address WRAPPED_ADDRESS = make_address(0xA000);
    static constexpr Address ROUTER_ADDRESS = make_address(0xA001);
    static constexpr Address REGISTRY_ADDRESS = make_address(0xA002);

    Chain();

    // Non-copyable
    Chain(const Chain&) = delete;
    Chain& operator=(const Chain&) = delete;

    NativeBank& bank() { return bank_; }
    const NativeBank& bank() const { return bank_; }
    WrappedNative& wrapped() { return wrapped_; }
    const WrappedNative& wrapped() const { return wrapped_; }
    Registry& registry() { return registry_; }
    Router& router() { return router_; }
    AssetDirectory& assets() { return assets_; }

    Token& create_token(const Address& addr, const std::string& symbol);
    Token* token(const AssetId& asset) const;

    // New token/wrapped pair seeded by `provider`, who must hold both sides
    Pair& create_pool(Token& token, Amount token_reserve, Amount base_reserve,
                      const Address& provider);

    uint64_t now() const { return now_; }
    void set_now(uint64_t t) { now_ = t; }

    // Moves `value` native funds from caller to `to`, as the host does
    // before entering a payable call. Throws TransferFailed.
    CallContext pay(const Address& caller, const Address& to, Amount value);

    // Runs fn; on any exception every balance, reserve, token and pool is
    // rolled back and the exception propagates
    template <typename Fn>
    auto atomically(Fn&& fn) -> decltype(fn()) {
        Snapshot saved = snapshot();
        try {
            return fn();
        } catch (...) {
            restore(saved);
            throw;
        }
    }

private:
    struct Snapshot {
        BalanceMap native;
        TokenState wrapped;
        std::vector<TokenState> tokens;
        std::vector<std::pair<TokenState, Reserves>> pairs;
        uint16_t next_pair;
    };

    NativeBank bank_;
    WrappedNative wrapped_;
    Registry registry_;
    AssetDirectory assets_;
    Router router_;
    std::vector<std::unique_ptr<Token>> tokens_;
    uint64_t now_{1700000000};
    uint16_t next_pair_{0xB000};

    Snapshot snapshot() const;
    void restore(const Snapshot& s);
};

} // namespace sim
} // namespace zap

#endif // ZAP_SIM_HPP
