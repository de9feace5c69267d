#ifndef ZAP_ERROR_HPP
#define ZAP_ERROR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace zap {

// =============================================================================
// Error Kinds
// =============================================================================

enum class Errc : uint8_t {
    DeadlineExpired = 1,
    InsufficientOutputAmount = 2,
    InsufficientInputAmount = 3,
    PairNotFound = 4,
    TransferFailed = 5,
    InvalidToken = 6,
    UnexpectedReentry = 7,
    Unauthorized = 8
};

inline constexpr const char* to_string(Errc e) noexcept {
    switch (e) {
        case Errc::DeadlineExpired: return "DeadlineExpired";
        case Errc::InsufficientOutputAmount: return "InsufficientOutputAmount";
        case Errc::InsufficientInputAmount: return "InsufficientInputAmount";
        case Errc::PairNotFound: return "PairNotFound";
        case Errc::TransferFailed: return "TransferFailed";
        case Errc::InvalidToken: return "InvalidToken";
        case Errc::UnexpectedReentry: return "UnexpectedReentry";
        case Errc::Unauthorized: return "Unauthorized";
    }
    return "unknown";
}

// =============================================================================
// Error - raised by every failing operation; aborts the whole call
// =============================================================================

class Error : public std::runtime_error {
public:
    explicit Error(Errc code)
        : std::runtime_error(to_string(code)), code_(code) {}

    Error(Errc code, const std::string& detail)
        : std::runtime_error(std::string(to_string(code)) + ": " + detail), code_(code) {}

    Errc code() const noexcept { return code_; }

private:
    Errc code_;
};

} // namespace zap

#endif // ZAP_ERROR_HPP
