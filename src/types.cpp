// =============================================================================
// types.cpp - Address and amount text conversions
// =============================================================================

#include "zap/types.hpp"
#include <algorithm>
#include <stdexcept>

namespace zap {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

Address parse_address(std::string_view text) {
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
    }
    if (text.size() != 40) {
        throw std::invalid_argument("address must have 40 hex digits: " + std::string(text));
    }

    Address addr{};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(text[2 * i]);
        int lo = hex_value(text[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid hex digit in address: " + std::string(text));
        }
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

std::string to_hex(const Address& a) {
    static const char digits[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(42);
    for (uint8_t b : a) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

std::string to_string(Amount v) {
    if (v == 0) return "0";
    std::string out;
    while (v != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

Amount parse_amount(std::string_view text) {
    if (text.empty()) {
        throw std::invalid_argument("empty amount");
    }
    Amount v = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("invalid amount: " + std::string(text));
        }
        Amount digit = static_cast<Amount>(c - '0');
        if (v > (AMOUNT_MAX - digit) / 10) {
            throw std::out_of_range("amount exceeds 128 bits: " + std::string(text));
        }
        v = v * 10 + digit;
    }
    return v;
}

} // namespace zap
