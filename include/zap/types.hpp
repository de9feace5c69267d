#ifndef ZAP_TYPES_HPP
#define ZAP_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>

namespace zap {

// =============================================================================
// Addresses (EVM 20-byte addresses)
// =============================================================================

using Address = std::array<uint8_t, 20>;

// Asset identities are token contract addresses. The all-zero address is the
// sentinel "no asset" value.
using AssetId = Address;

constexpr Address ZERO_ADDRESS = {};

inline bool is_zero(const Address& a) {
    for (uint8_t b : a) if (b != 0) return false;
    return true;
}

// Helper to build a short address whose low two bytes are `n`
constexpr Address make_address(uint16_t n) {
    Address addr = {};
    addr[18] = static_cast<uint8_t>((n >> 8) & 0xFF);
    addr[19] = static_cast<uint8_t>(n & 0xFF);
    return addr;
}

// Parse "0x" + 40 hex digits; throws std::invalid_argument
Address parse_address(std::string_view text);

// Lower-case "0x..." form
std::string to_hex(const Address& a);

// Canonical ordering used by pools: lower address is slot 0
inline bool sorts_before(const AssetId& a, const AssetId& b) { return a < b; }

struct AddressHash {
    size_t operator()(const Address& a) const {
        uint64_t h = 0;
        for (uint8_t b : a) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

// =============================================================================
// Amounts
// =============================================================================

using U128 = unsigned __int128;
using Amount = U128;

constexpr Amount AMOUNT_MAX = ~Amount(0);

// Decimal rendering/parsing of 128-bit amounts
std::string to_string(Amount v);
Amount parse_amount(std::string_view text);

// =============================================================================
// Constant-Product Fee (0.3% taken from the input side)
// =============================================================================

namespace fee {
constexpr uint32_t NUMERATOR = 997;
constexpr uint32_t DENOMINATOR = 1000;
}

// Liquidity permanently locked by a pool on its first mint
constexpr Amount MINIMUM_LIQUIDITY = 1000;

// =============================================================================
// Call Context (what the host supplies with every call)
// =============================================================================

struct CallContext {
    Address caller;       // msg.sender
    Amount value;         // Native funds attached to the call
    uint64_t timestamp;   // Current block time (seconds)
};

// =============================================================================
// Requests
// =============================================================================

struct SwapRequest {
    Amount desired_output;
    AssetId output_asset;
    uint64_t deadline;
};

struct ZapRequest {
    Amount desired_output;
    AssetId output_asset;
    uint64_t deadline;
    Amount secondary_deposit;     // Native funds for the deposit leg
    Amount min_token_deposit;     // Slippage floor, token side
    Amount min_base_deposit;      // Slippage floor, base side
};

// =============================================================================
// Results
// =============================================================================

struct Reserves {
    Amount reserve0;
    Amount reserve1;
    uint32_t timestamp;
};

struct Quote {
    Amount desired_output;
    Amount required_input;
};

struct DepositResult {
    Amount token_used;
    Amount base_used;
    Amount units;
};

struct SettlementResult {
    Amount base_spent;            // Paid into the pool for the swap leg
    Amount token_deposited;
    Amount base_deposited;
    Amount liquidity_received;
};

} // namespace zap

#endif // ZAP_TYPES_HPP
