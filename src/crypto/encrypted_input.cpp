#include "veilmarket/crypto/encrypted_input.hpp"

namespace veilmarket::crypto {

EncryptedInput::EncryptedInput(
    Coprocessor& coprocessor,
    const Address& contract,
    const Address& submitter
) : coprocessor_(coprocessor), contract_(contract), submitter_(submitter) {

    if (is_zero(contract) || is_zero(submitter)) {
        throw ValidationError("Encrypted input needs a target contract and a submitter");
    }
}

EncryptedInput& EncryptedInput::add(FheType type, uint64_t value) {
    if (finalized_) {
        throw SessionStateError("Encrypted input already finalized");
    }
    if (value > max_value(type)) {
        throw ValidationError("Value " + std::to_string(value) + " does not fit in " +
                              std::to_string(bit_width(type)) + " bits");
    }
    if (values_.size() >= input_proof::kMaxHandles) {
        throw ValidationError("Encrypted input is full");
    }

    values_.emplace_back(type, value);
    return *this;
}

EncryptedBundle EncryptedInput::encrypt() {
    if (finalized_) {
        throw SessionStateError("Encrypted input already finalized");
    }
    if (values_.empty()) {
        throw SessionStateError("Cannot encrypt an empty input");
    }

    auto bundle = coprocessor_.encrypt_input(contract_, submitter_, values_);

    // Only a successful encryption consumes the session
    finalized_ = true;
    return bundle;
}

} // namespace veilmarket::crypto
