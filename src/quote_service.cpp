// =============================================================================
// quote_service.cpp - Read-only quotes
// =============================================================================

#include "zap/quote_service.hpp"
#include "zap/error.hpp"
#include "zap/pricing.hpp"
#include "zap/uint256.hpp"

namespace zap {

void QuoteService::check_request(Amount desired_output, const AssetId& token) const {
    if (desired_output == 0) {
        throw Error(Errc::InsufficientOutputAmount);
    }
    if (is_zero(token) || token == base_) {
        throw Error(Errc::InvalidToken, to_hex(token));
    }
}

Amount QuoteService::required_input(Amount desired_output, const AssetId& token) const {
    check_request(desired_output, token);
    auto [reserve_in, reserve_out] = oracle_.reserves_for(base_, token);
    return pricing::required_input(desired_output, reserve_in, reserve_out);
}

Amount QuoteService::total_funds_needed(Amount desired_output, const AssetId& token,
                                        Amount secondary_deposit) const {
    auto total = math::checked_add(required_input(desired_output, token), secondary_deposit);
    if (!total) {
        throw Error(Errc::InsufficientInputAmount, "total overflows");
    }
    return *total;
}

} // namespace zap
