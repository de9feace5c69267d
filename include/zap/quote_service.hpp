#ifndef ZAP_QUOTE_SERVICE_HPP
#define ZAP_QUOTE_SERVICE_HPP

#include "types.hpp"
#include "reserve_oracle.hpp"

namespace zap {

// =============================================================================
// QuoteService - read-only cost estimates against the base/token pair
// =============================================================================

class QuoteService {
public:
    QuoteService(const ReserveOracle& oracle, const AssetId& base)
        : oracle_(oracle), base_(base) {}

    // Base input needed to receive exactly `desired_output` of `token`
    Amount required_input(Amount desired_output, const AssetId& token) const;

    // required_input + secondary_deposit
    Amount total_funds_needed(Amount desired_output, const AssetId& token,
                              Amount secondary_deposit) const;

    Quote quote(Amount desired_output, const AssetId& token) const {
        return Quote{desired_output, required_input(desired_output, token)};
    }

    // Shared request checks: InsufficientOutputAmount, then InvalidToken
    void check_request(Amount desired_output, const AssetId& token) const;

    const AssetId& base() const { return base_; }

private:
    const ReserveOracle& oracle_;
    AssetId base_;
};

} // namespace zap

#endif // ZAP_QUOTE_SERVICE_HPP
