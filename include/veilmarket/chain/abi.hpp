#pragma once

#include "veilmarket/core/types.hpp"
#include <span>
#include <string>
#include <vector>

namespace veilmarket::chain {

// ============================================================================
// Word Codec
// ============================================================================

/// Thrown by AbiReader on truncated or non-canonical input
class DecodeError : public VeilMarketError {
    using VeilMarketError::VeilMarketError;
};

constexpr size_t kWordSize = 32;

/// Appends 32-byte words: integers big-endian and left-padded,
/// strings and lists length-prefixed
class AbiWriter {
private:
    std::vector<uint8_t> buffer_;

public:
    AbiWriter& put_uint(uint64_t value);
    AbiWriter& put_address(const Address& address);
    AbiWriter& put_bytes32(const Bytes32& word);

    /// [length word] [bytes, zero-padded to a word boundary]
    AbiWriter& put_string(const std::string& text);

    /// [count word] [handle words]
    AbiWriter& put_handles(std::span<const Handle> handles);

    const std::vector<uint8_t>& bytes() const { return buffer_; }
    std::vector<uint8_t> take() { return std::move(buffer_); }
};

/// Sequential reader over AbiWriter output
class AbiReader {
private:
    std::span<const uint8_t> data_;
    size_t offset_ = 0;

public:
    explicit AbiReader(std::span<const uint8_t> data) : data_(data) {}

    /// Throws DecodeError if the word does not fit 64 bits
    uint64_t read_uint();
    Address read_address();
    Bytes32 read_bytes32();
    std::string read_string();
    std::vector<Handle> read_handles();

    size_t remaining() const { return data_.size() - offset_; }
    bool at_end() const { return offset_ == data_.size(); }

    /// Throws DecodeError if trailing bytes remain
    void expect_end() const;

private:
    std::span<const uint8_t> next_word();
};

/// Single word helpers (topics)
Bytes32 uint_word(uint64_t value);
Bytes32 address_word(const Address& address);
uint64_t word_to_uint(const Bytes32& word);
Address word_to_address(const Bytes32& word);

/// SHA-256 of an event signature, e.g. "OfferPurchased(uint256,address,...)"
Bytes32 event_topic(std::string_view signature);

} // namespace veilmarket::chain
