#ifndef ZAP_PRICING_HPP
#define ZAP_PRICING_HPP

#include "types.hpp"

namespace zap {

// =============================================================================
// Constant-Product Pricing (0.3% fee on the input side)
//
// All functions are pure and throw zap::Error on invalid input. Products are
// formed in 256 bits; nothing wraps.
// =============================================================================

namespace pricing {

// Input needed to take exactly `desired_output` out of the pool.
//   floor(reserve_in * out * 1000 / ((reserve_out - out) * 997)) + 1
// The +1 rounds in the pool's favour.
// Throws InsufficientOutputAmount if out == 0, InsufficientInputAmount if a
// reserve is empty, out >= reserve_out, or the result exceeds 128 bits.
Amount required_input(Amount desired_output, Amount reserve_in, Amount reserve_out);

// Output paid for exactly `input` (exact-input direction).
//   input * 997 * reserve_out / (reserve_in * 1000 + input * 997)
Amount output_for(Amount input, Amount reserve_in, Amount reserve_out);

// Amount of B matching `amount_a` at the current reserve ratio
Amount proportional(Amount amount_a, Amount reserve_a, Amount reserve_b);

} // namespace pricing

} // namespace zap

#endif // ZAP_PRICING_HPP
