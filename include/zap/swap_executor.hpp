#ifndef ZAP_SWAP_EXECUTOR_HPP
#define ZAP_SWAP_EXECUTOR_HPP

#include "types.hpp"
#include "interfaces.hpp"
#include "reserve_oracle.hpp"

namespace zap {

// =============================================================================
// SwapExecutor - exact-output swap straight against the pair
//
// Spends native funds held by `self`: wraps exactly the required input,
// pushes it into the pair and calls the pair's low-level swap.
// =============================================================================

class SwapExecutor {
public:
    SwapExecutor(const ReserveOracle& oracle,
                 IWrappedNative& wrapped,
                 INativeBank& bank,
                 const Address& self)
        : oracle_(oracle), wrapped_(wrapped), bank_(bank), self_(self) {}

    // Returns the wrapped amount paid into the pair.
    // input_asset must be the wrapped native token.
    Amount execute(const AssetId& input_asset,
                   const AssetId& output_asset,
                   Amount desired_output,
                   const Address& recipient,
                   uint64_t timestamp);

private:
    const ReserveOracle& oracle_;
    IWrappedNative& wrapped_;
    INativeBank& bank_;
    Address self_;
};

} // namespace zap

#endif // ZAP_SWAP_EXECUTOR_HPP
