#pragma once

#include <cstdint>
#include <array>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <functional>
#include <stdexcept>

namespace veilmarket {

// ============================================================================
// Basic Types
// ============================================================================

/// 20-byte account / contract address
using Address = std::array<uint8_t, 20>;

/// 32-byte word (handles, transaction hashes, event topics)
using Bytes32 = std::array<uint8_t, 32>;

/// Opaque reference to a ciphertext held by the coprocessor
using Handle = Bytes32;

/// Transaction identity
using TxHash = Bytes32;

using OfferId = uint64_t;
using PurchaseId = uint64_t;

/// Smallest currency unit
using Amount = uint64_t;

/// Seconds since epoch
using Timestamp = uint64_t;

using BlockNumber = uint64_t;

/// Platform fee in basis points (1/10000)
using BasisPoints = uint16_t;

// ============================================================================
// Constants
// ============================================================================

constexpr BasisPoints kMaxFeeBps = 1000;          ///< 10%
constexpr uint64_t kBpsDenominator = 10'000;
constexpr Timestamp kSecondsPerDay = 86'400;
constexpr uint64_t kDefaultChainId = 11'155'111;  ///< Sepolia

// ============================================================================
// Encrypted Value Types
// ============================================================================

/// Ciphertext type tag, stored in byte 30 of every handle
enum class FheType : uint8_t {
    Uint8 = 2,
    Uint16 = 3,
    Uint32 = 4,
    Uint64 = 5
};

/// Bit width of an encrypted type
constexpr unsigned bit_width(FheType t) {
    switch (t) {
        case FheType::Uint8:  return 8;
        case FheType::Uint16: return 16;
        case FheType::Uint32: return 32;
        case FheType::Uint64: return 64;
    }
    return 0;
}

/// Largest plaintext representable by a type
constexpr uint64_t max_value(FheType t) {
    return bit_width(t) == 64 ? UINT64_MAX : ((1ULL << bit_width(t)) - 1);
}

/// Plaintext tagged with the width it is encrypted under
struct TypedValue {
    FheType type;
    uint64_t value;

    TypedValue() : type(FheType::Uint64), value(0) {}
    TypedValue(FheType t, uint64_t v) : type(t), value(v) {}
};

/// Handle layout (32 bytes):
/// [0..20] digest prefix || [21] index in bundle || [22..29] chain id (BE)
/// || [30] FheType || [31] version
namespace handle_layout {
constexpr size_t kIndexByte = 21;
constexpr size_t kChainIdOffset = 22;
constexpr size_t kTypeByte = 30;
constexpr size_t kVersionByte = 31;
constexpr uint8_t kVersion = 0;
} // namespace handle_layout

inline FheType handle_type(const Handle& h) {
    return static_cast<FheType>(h[handle_layout::kTypeByte]);
}

inline uint8_t handle_index(const Handle& h) {
    return h[handle_layout::kIndexByte];
}

// ============================================================================
// Call Context
// ============================================================================

/// Execution context of one state-mutating call, supplied by the
/// transaction submitter (wallet provider) and block producer
struct CallContext {
    Address sender{};
    Amount value = 0;        ///< Attached payment
    BlockNumber block = 0;
    Timestamp now = 0;       ///< Block timestamp
    TxHash tx_hash{};
};

// ============================================================================
// Configuration
// ============================================================================

/// Platform settings fixed at ledger construction
struct MarketConfig {
    Address address{};       ///< The ledger's own account
    Address owner{};
    Address treasury{};
    BasisPoints fee_bps = 250;
};

/// Coprocessor (encryption SDK / decryption oracle) parameters
struct CoprocessorConfig {
    uint64_t chain_id = kDefaultChainId;

    /// Empty: key material from the OS CSPRNG.
    /// Non-empty: deterministic keys (tests, benchmarks)
    std::vector<uint8_t> key_seed;
};

/// Reconciliation indexer parameters
struct IndexerConfig {
    BlockNumber deploy_block = 0;      ///< First block scanned for logs
    size_t max_parallel_fetches = 8;   ///< Concurrent lookups per stage
};

// ============================================================================
// Hex / Address Utilities
// ============================================================================

struct ByteArrayHash {
    template<size_t N>
    size_t operator()(const std::array<uint8_t, N>& bytes) const noexcept {
        // FNV-1a
        uint64_t h = 1469598103934665603ULL;
        for (uint8_t b : bytes) {
            h ^= b;
            h *= 1099511628211ULL;
        }
        return static_cast<size_t>(h);
    }
};

/// "0x" prefixed lowercase hex
std::string to_hex(std::span<const uint8_t> bytes);

/// Parse a 20-byte address, "0x" prefix optional; throws ValidationError
Address address_from_hex(std::string_view hex);

/// Parse a 32-byte word, "0x" prefix optional; throws ValidationError
Bytes32 bytes32_from_hex(std::string_view hex);

inline bool is_zero(const Address& a) {
    for (uint8_t b : a) {
        if (b != 0) return false;
    }
    return true;
}

// ============================================================================
// Error Types
// ============================================================================

/// Exception hierarchy
class VeilMarketError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

/// Malformed input; rejected before any state change
class ValidationError : public VeilMarketError {
    using VeilMarketError::VeilMarketError;
};

/// Caller is not permitted to perform the operation
class AuthorizationError : public VeilMarketError {
    using VeilMarketError::VeilMarketError;
};

/// Input proof or decryption proof does not authenticate the data
class ProofVerificationError : public VeilMarketError {
    using VeilMarketError::VeilMarketError;
};

/// Insufficient payment or a failed transfer leg
class PaymentError : public VeilMarketError {
    using VeilMarketError::VeilMarketError;
};

/// Log store unreachable or log entry malformed
class ReconciliationError : public VeilMarketError {
    using VeilMarketError::VeilMarketError;
};

/// Encoder session used after finalization or finalized empty
class SessionStateError : public VeilMarketError {
    using VeilMarketError::VeilMarketError;
};

class ReentrancyError : public VeilMarketError {
public:
    ReentrancyError() : VeilMarketError("Reentrant call rejected") {}
};

} // namespace veilmarket
