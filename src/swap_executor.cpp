// =============================================================================
// swap_executor.cpp - Wrap, pay in, swap out
// =============================================================================

#include "zap/swap_executor.hpp"
#include "zap/error.hpp"
#include "zap/pricing.hpp"
#include <spdlog/spdlog.h>

namespace zap {

Amount SwapExecutor::execute(const AssetId& input_asset,
                             const AssetId& output_asset,
                             Amount desired_output,
                             const Address& recipient,
                             uint64_t timestamp) {
    if (input_asset != wrapped_.address()) {
        throw Error(Errc::InvalidToken, "input must be the wrapped native asset");
    }

    IPool& pool = oracle_.pool_for(input_asset, output_asset);
    auto [reserve_in, reserve_out] = ReserveOracle::ordered(pool, input_asset);
    Amount amount_in = pricing::required_input(desired_output, reserve_in, reserve_out);

    // Wrap exactly amount_in
    if (!bank_.transfer(self_, wrapped_.address(), amount_in)) {
        throw Error(Errc::TransferFailed, "native funds for wrap");
    }
    wrapped_.deposit(CallContext{self_, amount_in, timestamp});

    if (!wrapped_.transfer(self_, pool.address(), amount_in)) {
        throw Error(Errc::TransferFailed, "wrapped input to pool");
    }

    // Output goes out of whichever slot is not the input
    Amount amount0_out = 0;
    Amount amount1_out = 0;
    if (input_asset == pool.token0()) {
        amount1_out = desired_output;
    } else {
        amount0_out = desired_output;
    }
    pool.swap(amount0_out, amount1_out, recipient, {});

    spdlog::debug("swap: paid {} for {} of {} to {}",
                  to_string(amount_in), to_string(desired_output),
                  to_hex(output_asset), to_hex(recipient));
    return amount_in;
}

} // namespace zap
