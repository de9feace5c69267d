// =============================================================================
// reserve_oracle.cpp - Pair lookup and reserve ordering
// =============================================================================

#include "zap/reserve_oracle.hpp"
#include "zap/error.hpp"

namespace zap {

IPool& ReserveOracle::pool_for(const AssetId& a, const AssetId& b) const {
    IPool* pool = registry_.get_pool(a, b);
    if (!pool) {
        throw Error(Errc::PairNotFound, to_hex(a) + "/" + to_hex(b));
    }
    return *pool;
}

bool ReserveOracle::exists(const AssetId& a, const AssetId& b) const {
    return registry_.get_pool(a, b) != nullptr;
}

std::pair<Amount, Amount> ReserveOracle::reserves_for(const AssetId& input,
                                                      const AssetId& output) const {
    return ordered(pool_for(input, output), input);
}

std::pair<Amount, Amount> ReserveOracle::ordered(const IPool& pool, const AssetId& input) {
    Reserves r = pool.get_reserves();
    // Slot 0 holds the lower-ordered asset
    if (input == pool.token0()) {
        return {r.reserve0, r.reserve1};
    }
    return {r.reserve1, r.reserve0};
}

} // namespace zap
