#ifndef ZAP_REENTRANCY_HPP
#define ZAP_REENTRANCY_HPP

#include "error.hpp"

namespace zap {

// =============================================================================
// ReentrancyGuard - scoped busy flag
//
// Marks the owning instance busy for the lifetime of the guard. Entering
// while busy throws UnexpectedReentry; the flag is cleared on every exit,
// including exceptions.
// =============================================================================

class ReentrancyGuard {
public:
    explicit ReentrancyGuard(bool& busy) : busy_(busy) {
        if (busy_) {
            throw Error(Errc::UnexpectedReentry);
        }
        busy_ = true;
    }

    ~ReentrancyGuard() { busy_ = false; }

    ReentrancyGuard(const ReentrancyGuard&) = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

private:
    bool& busy_;
};

} // namespace zap

#endif // ZAP_REENTRANCY_HPP
