#pragma once

#include "veilmarket/core/types.hpp"
#include <array>
#include <mutex>
#include <set>
#include <span>
#include <unordered_map>
#include <utility>
#include <vector>

namespace veilmarket::crypto {

// ============================================================================
// Coprocessor Outputs
// ============================================================================

/// Result of finalizing one encrypted input session
struct EncryptedBundle {
    std::vector<Handle> handles;     ///< One per appended value, same order
    std::vector<uint8_t> proof;      ///< Covers the whole ordered bundle
};

/// Output of the decryption oracle for a list of public handles
struct DecryptionResult {
    std::vector<uint8_t> cleartexts;        ///< One 32-byte BE word per handle
    std::vector<uint8_t> decryption_proof;  ///< KMS signature over handles + cleartexts
    std::vector<uint64_t> values;           ///< Convenience copy of the decoded words
};

/// Input proof layout: [count:1][handles:32*count][signature:32]
namespace input_proof {
constexpr size_t kHeaderSize = 1;
constexpr size_t kSignatureSize = 32;
constexpr size_t kMaxHandles = 255;

inline size_t expected_size(size_t count) {
    return kHeaderSize + count * sizeof(Handle) + kSignatureSize;
}
} // namespace input_proof

// ============================================================================
// Coprocessor
// ============================================================================

/// Stand-in for the homomorphic-encryption network: ciphertext registry,
/// input verifier, access control list and threshold decryption oracle.
///
/// Ciphertexts are AES-128-CTR under a network key (IV = handle prefix),
/// input proofs and decryption proofs are HMAC-SHA256 signatures under
/// separate signer keys. Only the coprocessor holds key material.
class Coprocessor {
private:
    struct Ciphertext {
        FheType type;
        std::array<uint8_t, 8> bytes;
        bool public_decryptable = false;
    };

    CoprocessorConfig config_;
    std::array<uint8_t, 16> network_key_{};
    std::array<uint8_t, 32> input_signer_key_{};
    std::array<uint8_t, 32> kms_signer_key_{};

    std::unordered_map<Handle, Ciphertext, ByteArrayHash> ciphertexts_;
    std::set<std::pair<Handle, Address>> acl_;
    uint64_t trivial_counter_ = 0;

    mutable std::mutex mutex_;

public:
    explicit Coprocessor(CoprocessorConfig config = {});

    Coprocessor(const Coprocessor&) = delete;
    Coprocessor& operator=(const Coprocessor&) = delete;

    // ------------------------------------------------------------------
    // Encryption SDK
    // ------------------------------------------------------------------

    /// Encrypt an ordered bundle for (contract, submitter).
    /// Every call draws a fresh session nonce, so equal inputs in two
    /// sessions yield different handles and proofs
    EncryptedBundle encrypt_input(
        const Address& contract,
        const Address& submitter,
        std::span<const TypedValue> values
    );

    // ------------------------------------------------------------------
    // Input Verifier
    // ------------------------------------------------------------------

    /// Check that `handle` is entry handle_index(handle) of a bundle signed
    /// for (contract, submitter) and has the expected type.
    /// Throws ProofVerificationError; never mutates state
    void verify_input(
        const Address& contract,
        const Address& submitter,
        const Handle& handle,
        FheType expected_type,
        std::span<const uint8_t> proof
    ) const;

    /// Encrypt a public constant (plaintext offers still get handles)
    Handle trivial_encrypt(uint64_t value, FheType type);

    // ------------------------------------------------------------------
    // Access Control
    // ------------------------------------------------------------------

    /// Grant `subject` the right to request plaintext of `handle`.
    /// Throws ValidationError for an unknown handle
    void allow(const Handle& handle, const Address& subject);

    bool is_allowed(const Handle& handle, const Address& subject) const;

    /// Declassify; requester must hold an ACL grant (AuthorizationError)
    void make_publicly_decryptable(const Handle& handle, const Address& requester);

    bool is_publicly_decryptable(const Handle& handle) const;

    // ------------------------------------------------------------------
    // Decryption Oracle
    // ------------------------------------------------------------------

    /// Decrypt declassified handles; AuthorizationError if any is not public
    DecryptionResult public_decrypt(std::span<const Handle> handles) const;

    /// Verification primitive: does `proof` sign exactly (handles, cleartexts)?
    bool verify_decryption(
        std::span<const Handle> handles,
        std::span<const uint8_t> cleartexts,
        std::span<const uint8_t> proof
    ) const;

    /// Private decryption for an ACL-granted subject
    uint64_t user_decrypt(const Handle& handle, const Address& requester) const;

    // Accessors
    uint64_t chain_id() const { return config_.chain_id; }
    bool contains(const Handle& handle) const;
    size_t ciphertext_count() const;

private:
    void derive_keys();

    Handle make_handle(const Bytes32& digest, uint8_t index, FheType type) const;

    /// AES-128-CTR keystream XOR (same operation encrypts and decrypts)
    std::array<uint8_t, 8> apply_keystream(
        const Handle& handle,
        const std::array<uint8_t, 8>& input
    ) const;

    /// Caller holds mutex_
    uint64_t decrypt_locked(const Handle& handle) const;

    std::array<uint8_t, 32> sign_input(
        const Address& contract,
        const Address& submitter,
        std::span<const Handle> handles
    ) const;

    std::array<uint8_t, 32> sign_decryption(
        std::span<const Handle> handles,
        std::span<const uint8_t> cleartexts
    ) const;
};

/// Decode an oracle cleartext blob into `count` values.
/// Throws chain::DecodeError on wrong length or out-of-range words
std::vector<uint64_t> decode_cleartexts(std::span<const uint8_t> cleartexts, size_t count);

} // namespace veilmarket::crypto
