// =============================================================================
// pricing.cpp - Constant-product exact-output / exact-input formulas
// =============================================================================

#include "zap/pricing.hpp"
#include "zap/error.hpp"
#include "zap/uint256.hpp"

namespace zap {
namespace pricing {

Amount required_input(Amount desired_output, Amount reserve_in, Amount reserve_out) {
    if (desired_output == 0) {
        throw Error(Errc::InsufficientOutputAmount);
    }
    if (reserve_in == 0 || reserve_out == 0) {
        throw Error(Errc::InsufficientInputAmount, "empty reserves");
    }

    auto remaining = math::checked_sub(reserve_out, desired_output);
    if (!remaining || *remaining == 0) {
        throw Error(Errc::InsufficientInputAmount, "output exceeds reserve");
    }

    auto numerator = u256::checked_mul(u256::mul(reserve_in, desired_output), fee::DENOMINATOR);
    if (!numerator) {
        throw Error(Errc::InsufficientInputAmount, "numerator overflow");
    }
    U256 denominator = u256::mul(*remaining, fee::NUMERATOR);

    auto quotient = u256::div(*numerator, denominator);
    if (!quotient || !quotient->fits_u128() || quotient->lo == AMOUNT_MAX) {
        throw Error(Errc::InsufficientInputAmount, "required input exceeds 128 bits");
    }
    return quotient->lo + 1;
}

Amount output_for(Amount input, Amount reserve_in, Amount reserve_out) {
    if (input == 0) {
        throw Error(Errc::InsufficientInputAmount);
    }
    if (reserve_in == 0 || reserve_out == 0) {
        throw Error(Errc::InsufficientInputAmount, "empty reserves");
    }

    U256 input_with_fee = u256::mul(input, fee::NUMERATOR);
    auto numerator = u256::checked_mul(input_with_fee, reserve_out);
    auto denominator = u256::checked_add(u256::mul(reserve_in, fee::DENOMINATOR), input_with_fee);
    if (!numerator || !denominator) {
        throw Error(Errc::InsufficientInputAmount, "overflow");
    }

    // Quotient is strictly below reserve_out, so it fits 128 bits
    return u256::div(*numerator, *denominator)->lo;
}

Amount proportional(Amount amount_a, Amount reserve_a, Amount reserve_b) {
    if (amount_a == 0) {
        throw Error(Errc::InsufficientInputAmount);
    }
    if (reserve_a == 0 || reserve_b == 0) {
        throw Error(Errc::InsufficientInputAmount, "empty reserves");
    }
    auto b = math::mul_div(amount_a, reserve_b, reserve_a);
    if (!b) {
        throw Error(Errc::InsufficientInputAmount, "overflow");
    }
    return *b;
}

} // namespace pricing
} // namespace zap
