#ifndef ZAP_RESERVE_ORACLE_HPP
#define ZAP_RESERVE_ORACLE_HPP

#include <utility>

#include "types.hpp"
#include "interfaces.hpp"

namespace zap {

// =============================================================================
// ReserveOracle - reads pair reserves in caller-requested order
// =============================================================================

class ReserveOracle {
public:
    explicit ReserveOracle(const IPoolRegistry& registry) : registry_(registry) {}

    // Pool for the pair; throws Errc::PairNotFound
    IPool& pool_for(const AssetId& a, const AssetId& b) const;

    bool exists(const AssetId& a, const AssetId& b) const;

    // (reserve of input asset, reserve of output asset)
    std::pair<Amount, Amount> reserves_for(const AssetId& input,
                                           const AssetId& output) const;

    // Same, for an already resolved pool
    static std::pair<Amount, Amount> ordered(const IPool& pool, const AssetId& input);

private:
    const IPoolRegistry& registry_;
};

} // namespace zap

#endif // ZAP_RESERVE_ORACLE_HPP
