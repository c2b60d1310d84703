#pragma once

#include "veilmarket/core/types.hpp"

namespace veilmarket::ledger {

// ============================================================================
// Reentrancy Guard
// ============================================================================

/// Non-reentrant lock for state-mutating entry points.
/// Hold a Scope for the whole operation; a nested Scope on the same guard
/// throws ReentrancyError. Released on every exit path.
class ReentrancyGuard {
private:
    bool entered_ = false;

public:
    class Scope {
    private:
        ReentrancyGuard& guard_;

    public:
        explicit Scope(ReentrancyGuard& guard) : guard_(guard) {
            if (guard_.entered_) {
                throw ReentrancyError();
            }
            guard_.entered_ = true;
        }

        ~Scope() { guard_.entered_ = false; }

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;
    };

    bool entered() const { return entered_; }
};

} // namespace veilmarket::ledger
