#pragma once

#include "veilmarket/core/types.hpp"
#include "veilmarket/crypto/coprocessor.hpp"
#include <vector>

namespace veilmarket::crypto {

// ============================================================================
// Encrypted Input Session
// ============================================================================

/// One batch of values bound to (target contract, submitter).
///
/// Values are appended in order and encrypted together by a single
/// encrypt() call, which yields one handle per value and one proof that
/// authenticates the whole ordered bundle. A handle is only importable
/// together with the proof from the same encrypt() call.
///
/// Single use: once encrypted, further add*/encrypt calls throw
/// SessionStateError. Not thread safe; use one instance per logical batch.
class EncryptedInput {
private:
    Coprocessor& coprocessor_;
    Address contract_;
    Address submitter_;
    std::vector<TypedValue> values_;
    bool finalized_ = false;

public:
    EncryptedInput(Coprocessor& coprocessor, const Address& contract, const Address& submitter);

    EncryptedInput(const EncryptedInput&) = delete;
    EncryptedInput& operator=(const EncryptedInput&) = delete;

    /// Append a value; throws ValidationError if it does not fit the width
    EncryptedInput& add(FheType type, uint64_t value);

    EncryptedInput& add8(uint64_t value) { return add(FheType::Uint8, value); }
    EncryptedInput& add16(uint64_t value) { return add(FheType::Uint16, value); }
    EncryptedInput& add32(uint64_t value) { return add(FheType::Uint32, value); }
    EncryptedInput& add64(uint64_t value) { return add(FheType::Uint64, value); }

    /// Finalize: encrypt every appended value under one proof
    EncryptedBundle encrypt();

    // Accessors
    size_t size() const { return values_.size(); }
    bool finalized() const { return finalized_; }
    const Address& contract() const { return contract_; }
    const Address& submitter() const { return submitter_; }
};

} // namespace veilmarket::crypto
