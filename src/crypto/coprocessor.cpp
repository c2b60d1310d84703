#include "veilmarket/crypto/coprocessor.hpp"
#include "veilmarket/chain/abi.hpp"
#include "veilmarket/core/log.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <algorithm>
#include <cstring>

namespace veilmarket::crypto {

// ============================================================================
// Hash / MAC Utilities
// ============================================================================

namespace {

/// Incremental SHA-256
class Sha256 {
private:
    EVP_MD_CTX* ctx_;

public:
    Sha256() : ctx_(EVP_MD_CTX_new()) {
        if (!ctx_ || EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
            EVP_MD_CTX_free(ctx_);
            throw std::runtime_error("Failed to initialize SHA-256");
        }
    }

    ~Sha256() { EVP_MD_CTX_free(ctx_); }

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    Sha256& update(const void* data, size_t len) {
        if (EVP_DigestUpdate(ctx_, data, len) != 1) {
            throw std::runtime_error("SHA-256 update failed");
        }
        return *this;
    }

    template<size_t N>
    Sha256& update(const std::array<uint8_t, N>& bytes) {
        return update(bytes.data(), bytes.size());
    }

    Sha256& update_u64(uint64_t value) {
        uint8_t be[8];
        for (size_t i = 0; i < 8; ++i) {
            be[i] = static_cast<uint8_t>((value >> ((7 - i) * 8)) & 0xFF);
        }
        return update(be, sizeof(be));
    }

    Bytes32 finish() {
        Bytes32 out{};
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx_, out.data(), &len) != 1) {
            throw std::runtime_error("SHA-256 finalize failed");
        }
        return out;
    }
};

std::array<uint8_t, 32> hmac_sha256(
    std::span<const uint8_t> key,
    std::span<const uint8_t> message
) {
    std::array<uint8_t, 32> mac{};
    unsigned int mac_len = 0;
    if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
             message.data(), message.size(), mac.data(), &mac_len) == nullptr ||
        mac_len != mac.size()) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }
    return mac;
}

void append_u64_be(std::vector<uint8_t>& out, uint64_t value) {
    for (size_t i = 0; i < 8; ++i) {
        out.push_back(static_cast<uint8_t>((value >> ((7 - i) * 8)) & 0xFF));
    }
}

template<size_t N>
void append(std::vector<uint8_t>& out, const std::array<uint8_t, N>& bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
}

} // anonymous namespace

// ============================================================================
// Construction / Key Material
// ============================================================================

Coprocessor::Coprocessor(CoprocessorConfig config) : config_(std::move(config)) {
    derive_keys();
}

void Coprocessor::derive_keys() {
    if (config_.key_seed.empty()) {
        if (RAND_bytes(network_key_.data(), static_cast<int>(network_key_.size())) != 1 ||
            RAND_bytes(input_signer_key_.data(), static_cast<int>(input_signer_key_.size())) != 1 ||
            RAND_bytes(kms_signer_key_.data(), static_cast<int>(kms_signer_key_.size())) != 1) {
            throw std::runtime_error("CSPRNG failure while generating coprocessor keys");
        }
        return;
    }

    // Deterministic: SHA-256(seed || label)
    auto derive = [this](std::string_view label) {
        Sha256 h;
        h.update(config_.key_seed.data(), config_.key_seed.size());
        h.update(label.data(), label.size());
        return h.finish();
    };

    auto network = derive("veilmarket/network-key");
    std::copy_n(network.begin(), network_key_.size(), network_key_.begin());
    input_signer_key_ = derive("veilmarket/input-signer");
    kms_signer_key_ = derive("veilmarket/kms-signer");
}

// ============================================================================
// Handle Construction / Ciphertexts
// ============================================================================

Handle Coprocessor::make_handle(const Bytes32& digest, uint8_t index, FheType type) const {
    Sha256 h;
    h.update(digest).update(&index, 1);
    Bytes32 mixed = h.finish();

    Handle handle{};
    std::copy_n(mixed.begin(), handle_layout::kIndexByte, handle.begin());
    handle[handle_layout::kIndexByte] = index;
    for (size_t i = 0; i < 8; ++i) {
        handle[handle_layout::kChainIdOffset + i] =
            static_cast<uint8_t>((config_.chain_id >> ((7 - i) * 8)) & 0xFF);
    }
    handle[handle_layout::kTypeByte] = static_cast<uint8_t>(type);
    handle[handle_layout::kVersionByte] = handle_layout::kVersion;
    return handle;
}

std::array<uint8_t, 8> Coprocessor::apply_keystream(
    const Handle& handle,
    const std::array<uint8_t, 8>& input
) const {
    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        throw std::runtime_error("Failed to allocate cipher context");
    }

    // Handles are unique, so their prefix is a unique IV
    std::array<uint8_t, 16> iv{};
    std::copy_n(handle.begin(), iv.size(), iv.begin());

    std::array<uint8_t, 8> output{};
    int outlen = 0;
    bool ok = EVP_EncryptInit_ex(ctx, EVP_aes_128_ctr(), nullptr,
                                 network_key_.data(), iv.data()) == 1 &&
              EVP_EncryptUpdate(ctx, output.data(), &outlen,
                                input.data(), static_cast<int>(input.size())) == 1;
    EVP_CIPHER_CTX_free(ctx);

    if (!ok || outlen != static_cast<int>(output.size())) {
        throw std::runtime_error("AES-128-CTR failed");
    }
    return output;
}

uint64_t Coprocessor::decrypt_locked(const Handle& handle) const {
    auto it = ciphertexts_.find(handle);
    if (it == ciphertexts_.end()) {
        throw ValidationError("Unknown handle " + to_hex(handle));
    }

    auto plain = apply_keystream(handle, it->second.bytes);
    uint64_t value = 0;
    for (size_t i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(plain[i]) << (i * 8);
    }
    return value;
}

// ============================================================================
// Encryption SDK
// ============================================================================

EncryptedBundle Coprocessor::encrypt_input(
    const Address& contract,
    const Address& submitter,
    std::span<const TypedValue> values
) {
    if (values.empty()) {
        throw ValidationError("Encrypted input bundle is empty");
    }
    if (values.size() > input_proof::kMaxHandles) {
        throw ValidationError("Encrypted input bundle exceeds " +
                              std::to_string(input_proof::kMaxHandles) + " values");
    }
    for (const auto& v : values) {
        if (v.value > max_value(v.type)) {
            throw ValidationError("Value does not fit in " +
                                  std::to_string(bit_width(v.type)) + " bits");
        }
    }

    std::array<uint8_t, 16> nonce{};
    if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
        throw std::runtime_error("CSPRNG failure while drawing session nonce");
    }

    // Bundle digest binds nonce, target, submitter and every (type, value)
    Sha256 h;
    h.update(nonce).update(contract).update(submitter).update_u64(values.size());
    for (const auto& v : values) {
        uint8_t tag = static_cast<uint8_t>(v.type);
        h.update(&tag, 1).update_u64(v.value);
    }
    Bytes32 digest = h.finish();

    EncryptedBundle bundle;
    bundle.handles.reserve(values.size());

    std::lock_guard<std::mutex> lock(mutex_);

    for (size_t i = 0; i < values.size(); ++i) {
        Handle handle = make_handle(digest, static_cast<uint8_t>(i), values[i].type);

        std::array<uint8_t, 8> plain{};
        for (size_t b = 0; b < 8; ++b) {
            plain[b] = static_cast<uint8_t>((values[i].value >> (b * 8)) & 0xFF);
        }

        ciphertexts_[handle] = Ciphertext{values[i].type, apply_keystream(handle, plain), false};
        bundle.handles.push_back(handle);
    }

    // Proof: [count][handles][signature]
    auto signature = sign_input(contract, submitter, bundle.handles);
    bundle.proof.reserve(input_proof::expected_size(values.size()));
    bundle.proof.push_back(static_cast<uint8_t>(values.size()));
    for (const auto& handle : bundle.handles) {
        append(bundle.proof, handle);
    }
    append(bundle.proof, signature);

    log::Line(log::Level::Debug, "Coprocessor")
        << "Encrypted bundle of " << values.size() << " values for submitter "
        << to_hex(submitter);

    return bundle;
}

Handle Coprocessor::trivial_encrypt(uint64_t value, FheType type) {
    if (value > max_value(type)) {
        throw ValidationError("Value does not fit in " +
                              std::to_string(bit_width(type)) + " bits");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    Sha256 h;
    static constexpr std::string_view kLabel = "veilmarket/trivial";
    h.update(kLabel.data(), kLabel.size())
     .update_u64(trivial_counter_++)
     .update_u64(value);
    uint8_t tag = static_cast<uint8_t>(type);
    h.update(&tag, 1);

    Handle handle = make_handle(h.finish(), 0, type);

    std::array<uint8_t, 8> plain{};
    for (size_t b = 0; b < 8; ++b) {
        plain[b] = static_cast<uint8_t>((value >> (b * 8)) & 0xFF);
    }
    ciphertexts_[handle] = Ciphertext{type, apply_keystream(handle, plain), false};
    return handle;
}

// ============================================================================
// Input Verifier
// ============================================================================

std::array<uint8_t, 32> Coprocessor::sign_input(
    const Address& contract,
    const Address& submitter,
    std::span<const Handle> handles
) const {
    // Message: contract(20) || submitter(20) || chain_id(8) || count(1) || handles
    std::vector<uint8_t> message;
    message.reserve(20 + 20 + 8 + 1 + handles.size() * sizeof(Handle));
    append(message, contract);
    append(message, submitter);
    append_u64_be(message, config_.chain_id);
    message.push_back(static_cast<uint8_t>(handles.size()));
    for (const auto& handle : handles) {
        append(message, handle);
    }
    return hmac_sha256(input_signer_key_, message);
}

void Coprocessor::verify_input(
    const Address& contract,
    const Address& submitter,
    const Handle& handle,
    FheType expected_type,
    std::span<const uint8_t> proof
) const {
    if (proof.size() < input_proof::kHeaderSize + input_proof::kSignatureSize) {
        throw ProofVerificationError("Input proof too short");
    }

    size_t count = proof[0];
    if (count == 0 || proof.size() != input_proof::expected_size(count)) {
        throw ProofVerificationError("Input proof length does not match its handle count");
    }

    std::vector<Handle> handles(count);
    for (size_t i = 0; i < count; ++i) {
        std::copy_n(proof.begin() + input_proof::kHeaderSize + i * sizeof(Handle),
                    sizeof(Handle), handles[i].begin());
    }

    auto expected = sign_input(contract, submitter, handles);
    auto signature = proof.subspan(proof.size() - input_proof::kSignatureSize);
    if (CRYPTO_memcmp(expected.data(), signature.data(), expected.size()) != 0) {
        throw ProofVerificationError("Input proof signature invalid for this contract and submitter");
    }

    size_t index = handle_index(handle);
    if (index >= count || handles[index] != handle) {
        throw ProofVerificationError("Handle " + to_hex(handle) +
                                     " is not covered by the supplied proof");
    }

    if (handle_type(handle) != expected_type) {
        throw ProofVerificationError("Handle type mismatch: expected " +
                                     std::to_string(bit_width(expected_type)) + "-bit value");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (ciphertexts_.find(handle) == ciphertexts_.end()) {
        throw ProofVerificationError("Handle has no registered ciphertext");
    }
}

// ============================================================================
// Access Control
// ============================================================================

void Coprocessor::allow(const Handle& handle, const Address& subject) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ciphertexts_.find(handle) == ciphertexts_.end()) {
        throw ValidationError("Cannot grant access to unknown handle " + to_hex(handle));
    }
    acl_.emplace(handle, subject);
}

bool Coprocessor::is_allowed(const Handle& handle, const Address& subject) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return acl_.count({handle, subject}) > 0;
}

void Coprocessor::make_publicly_decryptable(const Handle& handle, const Address& requester) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = ciphertexts_.find(handle);
    if (it == ciphertexts_.end()) {
        throw ValidationError("Cannot declassify unknown handle " + to_hex(handle));
    }
    if (acl_.count({handle, requester}) == 0) {
        throw AuthorizationError("Requester " + to_hex(requester) +
                                 " has no access to handle " + to_hex(handle));
    }
    it->second.public_decryptable = true;
}

bool Coprocessor::is_publicly_decryptable(const Handle& handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ciphertexts_.find(handle);
    return it != ciphertexts_.end() && it->second.public_decryptable;
}

// ============================================================================
// Decryption Oracle
// ============================================================================

std::array<uint8_t, 32> Coprocessor::sign_decryption(
    std::span<const Handle> handles,
    std::span<const uint8_t> cleartexts
) const {
    // Message: chain_id(8) || count(8) || handles || cleartexts
    std::vector<uint8_t> message;
    message.reserve(16 + handles.size() * sizeof(Handle) + cleartexts.size());
    append_u64_be(message, config_.chain_id);
    append_u64_be(message, handles.size());
    for (const auto& handle : handles) {
        append(message, handle);
    }
    message.insert(message.end(), cleartexts.begin(), cleartexts.end());
    return hmac_sha256(kms_signer_key_, message);
}

DecryptionResult Coprocessor::public_decrypt(std::span<const Handle> handles) const {
    if (handles.empty()) {
        throw ValidationError("No handles to decrypt");
    }

    DecryptionResult result;
    chain::AbiWriter words;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& handle : handles) {
            auto it = ciphertexts_.find(handle);
            if (it == ciphertexts_.end() || !it->second.public_decryptable) {
                throw AuthorizationError("Handle " + to_hex(handle) +
                                         " is not publicly decryptable");
            }
            uint64_t value = decrypt_locked(handle);
            result.values.push_back(value);
            words.put_uint(value);
        }
    }

    result.cleartexts = words.take();
    auto signature = sign_decryption(handles, result.cleartexts);
    result.decryption_proof.assign(signature.begin(), signature.end());
    return result;
}

bool Coprocessor::verify_decryption(
    std::span<const Handle> handles,
    std::span<const uint8_t> cleartexts,
    std::span<const uint8_t> proof
) const {
    if (proof.size() != 32 || handles.empty()) {
        return false;
    }

    auto expected = sign_decryption(handles, cleartexts);
    return CRYPTO_memcmp(expected.data(), proof.data(), expected.size()) == 0;
}

uint64_t Coprocessor::user_decrypt(const Handle& handle, const Address& requester) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (acl_.count({handle, requester}) == 0) {
        throw AuthorizationError("Requester " + to_hex(requester) +
                                 " has no access to handle " + to_hex(handle));
    }
    return decrypt_locked(handle);
}

bool Coprocessor::contains(const Handle& handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ciphertexts_.find(handle) != ciphertexts_.end();
}

size_t Coprocessor::ciphertext_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ciphertexts_.size();
}

// ============================================================================
// Cleartext Decoding
// ============================================================================

std::vector<uint64_t> decode_cleartexts(std::span<const uint8_t> cleartexts, size_t count) {
    if (cleartexts.size() != count * chain::kWordSize) {
        throw chain::DecodeError("Cleartext blob holds " +
                                 std::to_string(cleartexts.size() / chain::kWordSize) +
                                 " words, expected " + std::to_string(count));
    }

    chain::AbiReader reader(cleartexts);
    std::vector<uint64_t> values;
    values.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        values.push_back(reader.read_uint());
    }
    return values;
}

} // namespace veilmarket::crypto
