// =============================================================================
// uint256.cpp - 256-bit intermediate arithmetic
// =============================================================================

#include "zap/uint256.hpp"

namespace zap {

namespace {

constexpr U128 MASK64 = (U128(1) << 64) - 1;

inline U256 shl1(const U256& x) {
    return U256(x.lo << 1, (x.hi << 1) | (x.lo >> 127));
}

inline U256 shr1(const U256& x) {
    return U256((x.lo >> 1) | (x.hi << 127), x.hi >> 1);
}

// Wrapping subtraction; callers guarantee a >= b (modulo a carried-out bit)
inline U256 sub_wrap(const U256& a, const U256& b) {
    U256 r;
    r.lo = a.lo - b.lo;
    U128 borrow = (a.lo < b.lo) ? 1 : 0;
    r.hi = a.hi - b.hi - borrow;
    return r;
}

inline bool bit_at(const U256& x, int i) {
    if (i >= 128) return ((x.hi >> (i - 128)) & 1) != 0;
    return ((x.lo >> i) & 1) != 0;
}

inline void set_bit(U256& x, int i) {
    if (i >= 128) x.hi |= U128(1) << (i - 128);
    else x.lo |= U128(1) << i;
}

inline int bit_length(const U256& x) {
    int n = 0;
    U128 tmp = x.hi != 0 ? x.hi : x.lo;
    while (tmp != 0) { tmp >>= 1; n++; }
    return x.hi != 0 ? n + 128 : n;
}

} // anonymous namespace

namespace u256 {

U256 mul(U128 a, U128 b) {
    // Split into 64-bit halves to avoid overflow
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    // Accumulate with carry
    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

std::optional<U256> checked_mul(const U256& a, U128 b) {
    U256 low = mul(a.lo, b);
    U256 high = mul(a.hi, b);
    // high is shifted up by 128 bits: its upper limb must be empty
    if (high.hi != 0) return std::nullopt;
    U128 top = low.hi + high.lo;
    if (top < low.hi) return std::nullopt;
    return U256(low.lo, top);
}

std::optional<U256> checked_add(const U256& a, const U256& b) {
    U256 r;
    r.lo = a.lo + b.lo;
    U128 carry = (r.lo < a.lo) ? 1 : 0;
    r.hi = a.hi + b.hi + carry;
    if (r.hi < a.hi || (carry && r.hi == a.hi)) return std::nullopt;
    return r;
}

std::optional<U256> div(const U256& num, const U256& denom) {
    if (denom.is_zero()) return std::nullopt;
    if (num.fits_u128() && denom.fits_u128()) return U256(num.lo / denom.lo);
    if (num < denom) return U256(0);

    // Restoring long division, one bit at a time from the top set bit
    U256 quot;
    U256 rem;
    for (int i = bit_length(num) - 1; i >= 0; --i) {
        bool carried = (rem.hi >> 127) != 0;
        rem = shl1(rem);
        if (bit_at(num, i)) rem.lo |= 1;
        if (carried || rem >= denom) {
            rem = sub_wrap(rem, denom);
            set_bit(quot, i);
        }
    }
    return quot;
}

} // namespace u256

namespace math {

std::optional<Amount> mul_div(Amount a, Amount b, Amount denom) {
    if (denom == 0) return std::nullopt;
    auto q = u256::div(u256::mul(a, b), U256(denom));
    if (!q || !q->fits_u128()) return std::nullopt;
    return q->lo;
}

Amount sqrt(const U256& x) {
    if (x.is_zero()) return 0;

    // Bitwise method: result has at most 128 bits
    U256 rem = x;
    U256 res;
    int shift = (bit_length(x) - 1) & ~1;
    U256 bit;
    set_bit(bit, shift);

    while (!bit.is_zero()) {
        auto candidate = u256::checked_add(res, bit);
        if (candidate && rem >= *candidate) {
            rem = sub_wrap(rem, *candidate);
            res = shr1(res);
            // res + bit fits because bit is above every set bit of shr1(res)
            res = *u256::checked_add(res, bit);
        } else {
            res = shr1(res);
        }
        bit = shr1(shr1(bit));
    }
    return res.lo;
}

} // namespace math

} // namespace zap
