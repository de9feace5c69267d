#ifndef ZAP_UINT256_HPP
#define ZAP_UINT256_HPP

#include <optional>

#include "types.hpp"

namespace zap {

// =============================================================================
// U256 - 256-bit unsigned integer as two U128 limbs
// Used for intermediate products in pricing; all public arithmetic is checked.
// =============================================================================

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits

    constexpr U256() : lo(0), hi(0) {}
    constexpr U256(U128 l) : lo(l), hi(0) {}
    constexpr U256(U128 l, U128 h) : lo(l), hi(h) {}

    bool operator==(const U256& other) const { return lo == other.lo && hi == other.hi; }
    bool operator!=(const U256& other) const { return !(*this == other); }
    bool operator<(const U256& other) const {
        return hi < other.hi || (hi == other.hi && lo < other.lo);
    }
    bool operator>(const U256& other) const { return other < *this; }
    bool operator<=(const U256& other) const { return !(other < *this); }
    bool operator>=(const U256& other) const { return !(*this < other); }

    bool is_zero() const { return lo == 0 && hi == 0; }
    bool fits_u128() const { return hi == 0; }
};

namespace u256 {

// Full 128x128 -> 256 product (never overflows)
U256 mul(U128 a, U128 b);

// a * b, nullopt on overflow past 256 bits
std::optional<U256> checked_mul(const U256& a, U128 b);

// a + b, nullopt on overflow past 256 bits
std::optional<U256> checked_add(const U256& a, const U256& b);

// Floor division; nullopt if denom is zero
std::optional<U256> div(const U256& num, const U256& denom);

} // namespace u256

// =============================================================================
// Checked 128-bit amount arithmetic
// =============================================================================

namespace math {

inline std::optional<Amount> checked_add(Amount a, Amount b) {
    Amount r = a + b;
    if (r < a) return std::nullopt;
    return r;
}

inline std::optional<Amount> checked_sub(Amount a, Amount b) {
    if (b > a) return std::nullopt;
    return a - b;
}

inline std::optional<Amount> checked_mul(Amount a, Amount b) {
    U256 p = u256::mul(a, b);
    if (!p.fits_u128()) return std::nullopt;
    return p.lo;
}

// floor(a * b / denom) with a 256-bit intermediate; nullopt on zero denom or
// a quotient that does not fit 128 bits
std::optional<Amount> mul_div(Amount a, Amount b, Amount denom);

// Integer square root (floor)
Amount sqrt(const U256& x);

} // namespace math

} // namespace zap

#endif // ZAP_UINT256_HPP
