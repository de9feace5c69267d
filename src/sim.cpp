// =============================================================================
// sim.cpp - In-memory host collaborators
// =============================================================================

#include "zap/sim.hpp"
#include "zap/pricing.hpp"
#include "zap/uint256.hpp"
#include <algorithm>
#include <stdexcept>

namespace zap {
namespace sim {

// =============================================================================
// NativeBank
// =============================================================================

Amount NativeBank::balance_of(const Address& holder) const {
    auto it = balances_.find(holder);
    return it != balances_.end() ? it->second : 0;
}

bool NativeBank::transfer(const Address& from, const Address& to, Amount amount) {
    Amount& from_balance = balances_[from];
    if (from_balance < amount) return false;
    from_balance -= amount;
    balances_[to] += amount;
    return true;
}

// =============================================================================
// WrappedNative
// =============================================================================

void WrappedNative::deposit(const CallContext& ctx) {
    mint(ctx.caller, ctx.value);
}

void WrappedNative::withdraw(const Address& holder, Amount amount) {
    if (!burn(holder, amount)) {
        throw Error(Errc::TransferFailed, "unwrap exceeds balance");
    }
    if (!bank_.transfer(self_, holder, amount)) {
        throw Error(Errc::TransferFailed, "unwrap payout");
    }
}

// =============================================================================
// Pair
// =============================================================================

Pair::Pair(const Address& self, IFungibleToken& a, IFungibleToken& b)
    : BasicToken<IPool>(self, "LX-LP") {
    if (sorts_before(a.address(), b.address())) {
        token0_ = &a;
        token1_ = &b;
    } else {
        token0_ = &b;
        token1_ = &a;
    }
}

void Pair::update(Amount balance0, Amount balance1) {
    reserves_.reserve0 = balance0;
    reserves_.reserve1 = balance1;
}

void Pair::swap(Amount amount0_out, Amount amount1_out, const Address& to,
                const std::vector<uint8_t>& data) {
    if (amount0_out == 0 && amount1_out == 0) {
        throw Error(Errc::InsufficientOutputAmount);
    }
    if (amount0_out >= reserves_.reserve0 || amount1_out >= reserves_.reserve1) {
        throw Error(Errc::InsufficientInputAmount, "insufficient liquidity");
    }
    if (to == token0_->address() || to == token1_->address()) {
        throw Error(Errc::InvalidToken, "recipient is a pool token");
    }
    // Flash-swap callbacks are not supported
    if (!data.empty()) {
        throw Error(Errc::InvalidToken, "callback payload not supported");
    }

    if (amount0_out > 0 && !token0_->transfer(self_, to, amount0_out)) {
        throw Error(Errc::TransferFailed, "token0 out");
    }
    if (amount1_out > 0 && !token1_->transfer(self_, to, amount1_out)) {
        throw Error(Errc::TransferFailed, "token1 out");
    }

    Amount balance0 = token0_->balance_of(self_);
    Amount balance1 = token1_->balance_of(self_);

    Amount kept0 = reserves_.reserve0 - amount0_out;
    Amount kept1 = reserves_.reserve1 - amount1_out;
    Amount amount0_in = balance0 > kept0 ? balance0 - kept0 : 0;
    Amount amount1_in = balance1 > kept1 ? balance1 - kept1 : 0;
    if (amount0_in == 0 && amount1_in == 0) {
        throw Error(Errc::InsufficientInputAmount);
    }

    // Fee-adjusted invariant: (b0*1000 - in0*3) * (b1*1000 - in1*3) >= r0*r1*1000^2
    constexpr Amount fee_part = fee::DENOMINATOR - fee::NUMERATOR;
    auto scaled0 = math::checked_mul(balance0, fee::DENOMINATOR);
    auto scaled1 = math::checked_mul(balance1, fee::DENOMINATOR);
    if (!scaled0 || !scaled1) {
        throw Error(Errc::InsufficientInputAmount, "balance overflow");
    }
    Amount adjusted0 = *scaled0 - amount0_in * fee_part;
    Amount adjusted1 = *scaled1 - amount1_in * fee_part;

    auto k_before = u256::checked_mul(u256::mul(reserves_.reserve0, reserves_.reserve1),
                                      Amount(fee::DENOMINATOR) * fee::DENOMINATOR);
    if (!k_before || u256::mul(adjusted0, adjusted1) < *k_before) {
        throw Error(Errc::InsufficientInputAmount, "K");
    }

    update(balance0, balance1);
}

Amount Pair::mint(const Address& to) {
    Amount balance0 = token0_->balance_of(self_);
    Amount balance1 = token1_->balance_of(self_);
    Amount amount0 = balance0 - reserves_.reserve0;
    Amount amount1 = balance1 - reserves_.reserve1;

    Amount liquidity = 0;
    if (state_.total_supply == 0) {
        liquidity = math::sqrt(u256::mul(amount0, amount1));
        if (liquidity <= MINIMUM_LIQUIDITY) {
            throw Error(Errc::InsufficientInputAmount, "insufficient liquidity minted");
        }
        liquidity -= MINIMUM_LIQUIDITY;
        BasicToken<IPool>::mint(ZERO_ADDRESS, MINIMUM_LIQUIDITY);
    } else {
        auto by0 = math::mul_div(amount0, state_.total_supply, reserves_.reserve0);
        auto by1 = math::mul_div(amount1, state_.total_supply, reserves_.reserve1);
        if (!by0 || !by1) {
            throw Error(Errc::InsufficientInputAmount, "liquidity overflow");
        }
        liquidity = std::min(*by0, *by1);
    }
    if (liquidity == 0) {
        throw Error(Errc::InsufficientInputAmount, "insufficient liquidity minted");
    }

    BasicToken<IPool>::mint(to, liquidity);
    update(balance0, balance1);
    return liquidity;
}

// =============================================================================
// Registry
// =============================================================================

namespace {

std::pair<AssetId, AssetId> sorted_key(const AssetId& a, const AssetId& b) {
    return sorts_before(a, b) ? std::make_pair(a, b) : std::make_pair(b, a);
}

} // anonymous namespace

Pair* Registry::find_pair(const AssetId& a, const AssetId& b) const {
    auto it = pairs_.find(sorted_key(a, b));
    return it != pairs_.end() ? it->second.get() : nullptr;
}

Pair& Registry::create_pair(IFungibleToken& a, IFungibleToken& b, const Address& pair_address) {
    if (a.address() == b.address()) {
        throw std::invalid_argument("identical pair tokens");
    }
    auto key = sorted_key(a.address(), b.address());
    if (pairs_.count(key)) {
        throw std::invalid_argument("pair already exists: " + to_hex(key.first) + "/" +
                                    to_hex(key.second));
    }
    auto pair = std::make_unique<Pair>(pair_address, a, b);
    Pair& ref = *pair;
    pairs_.emplace(key, std::move(pair));
    ordered_.push_back(&ref);
    return ref;
}

void Registry::drop_last() {
    if (ordered_.empty()) return;
    Pair* last = ordered_.back();
    ordered_.pop_back();
    pairs_.erase(sorted_key(last->token0(), last->token1()));
}

// =============================================================================
// AssetDirectory
// =============================================================================

IFungibleToken* AssetDirectory::find(const AssetId& asset) const {
    auto it = tokens_.find(asset);
    return it != tokens_.end() ? it->second : nullptr;
}

// =============================================================================
// Router
// =============================================================================

DepositResult Router::add_liquidity_native(const CallContext& ctx,
                                           const AssetId& token,
                                           Amount amount_token,
                                           Amount min_token,
                                           Amount min_base,
                                           const Address& to,
                                           uint64_t deadline) {
    if (deadline < ctx.timestamp) {
        throw Error(Errc::DeadlineExpired);
    }
    if (amount_token == 0 || ctx.value == 0) {
        throw Error(Errc::InsufficientInputAmount, "empty deposit");
    }

    Pair* pair = registry_.find_pair(token, wrapped_.address());
    IFungibleToken* token_contract = assets_.find(token);
    if (!pair || !token_contract) {
        throw Error(Errc::PairNotFound, to_hex(token));
    }

    // Deposit at the current ratio, capped by what was offered
    Amount reserve_token = 0;
    Amount reserve_base = 0;
    Reserves r = pair->get_reserves();
    if (pair->token0() == token) {
        reserve_token = r.reserve0;
        reserve_base = r.reserve1;
    } else {
        reserve_token = r.reserve1;
        reserve_base = r.reserve0;
    }

    Amount use_token = amount_token;
    Amount use_base = ctx.value;
    if (reserve_token != 0 || reserve_base != 0) {
        Amount base_optimal = pricing::proportional(amount_token, reserve_token, reserve_base);
        if (base_optimal <= ctx.value) {
            if (base_optimal < min_base) {
                throw Error(Errc::InsufficientInputAmount, "base below minimum");
            }
            use_base = base_optimal;
        } else {
            Amount token_optimal = pricing::proportional(ctx.value, reserve_base, reserve_token);
            if (token_optimal < min_token) {
                throw Error(Errc::InsufficientOutputAmount, "token below minimum");
            }
            use_token = token_optimal;
        }
    }

    if (!token_contract->transfer_from(self_, ctx.caller, pair->address(), use_token)) {
        throw Error(Errc::TransferFailed, "token into pair");
    }
    if (!bank_.transfer(self_, wrapped_.address(), use_base)) {
        throw Error(Errc::TransferFailed, "native for wrap");
    }
    wrapped_.deposit(CallContext{self_, use_base, ctx.timestamp});
    if (!wrapped_.transfer(self_, pair->address(), use_base)) {
        throw Error(Errc::TransferFailed, "wrapped into pair");
    }

    Amount units = pair->mint(to);

    Amount unused = ctx.value - use_base;
    if (unused > 0 && !bank_.transfer(self_, ctx.caller, unused)) {
        throw Error(Errc::TransferFailed, "native refund");
    }

    return DepositResult{use_token, use_base, units};
}

// =============================================================================
// Chain
// =============================================================================

Chain::Chain()
    : wrapped_(WRAPPED_ADDRESS, bank_)
    , router_(ROUTER_ADDRESS, registry_, wrapped_, assets_, bank_) {
    assets_.add(wrapped_);
}

Token& Chain::create_token(const Address& addr, const std::string& symbol) {
    if (assets_.find(addr)) {
        throw std::invalid_argument("address already in use: " + to_hex(addr));
    }
    tokens_.push_back(std::make_unique<Token>(addr, symbol));
    Token& token = *tokens_.back();
    assets_.add(token);
    return token;
}

Token* Chain::token(const AssetId& asset) const {
    for (const auto& t : tokens_) {
        if (t->address() == asset) return t.get();
    }
    return nullptr;
}

Pair& Chain::create_pool(Token& token, Amount token_reserve, Amount base_reserve,
                         const Address& provider) {
    Pair& pair = registry_.create_pair(token, wrapped_, make_address(next_pair_++));
    assets_.add(pair);

    if (!token.transfer(provider, pair.address(), token_reserve)) {
        throw Error(Errc::TransferFailed, "provider token balance");
    }
    if (!bank_.transfer(provider, wrapped_.address(), base_reserve)) {
        throw Error(Errc::TransferFailed, "provider native balance");
    }
    wrapped_.deposit(CallContext{provider, base_reserve, now_});
    if (!wrapped_.transfer(provider, pair.address(), base_reserve)) {
        throw Error(Errc::TransferFailed, "provider wrapped balance");
    }
    pair.mint(provider);
    return pair;
}

CallContext Chain::pay(const Address& caller, const Address& to, Amount value) {
    if (value > 0 && !bank_.transfer(caller, to, value)) {
        throw Error(Errc::TransferFailed, "caller cannot cover attached value");
    }
    return CallContext{caller, value, now_};
}

Chain::Snapshot Chain::snapshot() const {
    Snapshot s;
    s.native = bank_.state();
    s.wrapped = wrapped_.state();
    for (const auto& t : tokens_) {
        s.tokens.push_back(t->state());
    }
    for (const Pair* p : registry_.pairs()) {
        s.pairs.emplace_back(p->state(), p->get_reserves());
    }
    s.next_pair = next_pair_;
    return s;
}

void Chain::restore(const Snapshot& s) {
    // Pools first: they point at the tokens being dropped
    const auto& pairs = registry_.pairs();
    while (pairs.size() > s.pairs.size()) {
        assets_.remove(pairs.back()->address());
        registry_.drop_last();
    }
    while (tokens_.size() > s.tokens.size()) {
        assets_.remove(tokens_.back()->address());
        tokens_.pop_back();
    }
    next_pair_ = s.next_pair;

    bank_.restore(s.native);
    wrapped_.restore(s.wrapped);
    for (size_t i = 0; i < s.tokens.size(); ++i) {
        tokens_[i]->restore(s.tokens[i]);
    }
    for (size_t i = 0; i < s.pairs.size(); ++i) {
        pairs[i]->restore(s.pairs[i].first);
        pairs[i]->restore_reserves(s.pairs[i].second);
    }
}

} // namespace sim
} // namespace zap
