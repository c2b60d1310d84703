#include "veilmarket/chain/abi.hpp"
#include <openssl/evp.h>
#include <algorithm>

namespace veilmarket::chain {

// ============================================================================
// Word Helpers
// ============================================================================

Bytes32 uint_word(uint64_t value) {
    Bytes32 word{};
    for (size_t i = 0; i < 8; ++i) {
        word[31 - i] = static_cast<uint8_t>((value >> (i * 8)) & 0xFF);
    }
    return word;
}

Bytes32 address_word(const Address& address) {
    Bytes32 word{};
    std::copy(address.begin(), address.end(), word.begin() + 12);
    return word;
}

uint64_t word_to_uint(const Bytes32& word) {
    for (size_t i = 0; i < 24; ++i) {
        if (word[i] != 0) {
            throw DecodeError("Word exceeds 64-bit range");
        }
    }

    uint64_t value = 0;
    for (size_t i = 24; i < 32; ++i) {
        value = (value << 8) | word[i];
    }
    return value;
}

Address word_to_address(const Bytes32& word) {
    for (size_t i = 0; i < 12; ++i) {
        if (word[i] != 0) {
            throw DecodeError("Address word has non-zero padding");
        }
    }

    Address address{};
    std::copy(word.begin() + 12, word.end(), address.begin());
    return address;
}

Bytes32 event_topic(std::string_view signature) {
    Bytes32 digest{};
    unsigned int len = 0;
    if (EVP_Digest(signature.data(), signature.size(), digest.data(), &len,
                   EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return digest;
}

// ============================================================================
// AbiWriter
// ============================================================================

AbiWriter& AbiWriter::put_uint(uint64_t value) {
    auto word = uint_word(value);
    buffer_.insert(buffer_.end(), word.begin(), word.end());
    return *this;
}

AbiWriter& AbiWriter::put_address(const Address& address) {
    auto word = address_word(address);
    buffer_.insert(buffer_.end(), word.begin(), word.end());
    return *this;
}

AbiWriter& AbiWriter::put_bytes32(const Bytes32& word) {
    buffer_.insert(buffer_.end(), word.begin(), word.end());
    return *this;
}

AbiWriter& AbiWriter::put_string(const std::string& text) {
    put_uint(text.size());

    buffer_.insert(buffer_.end(), text.begin(), text.end());

    // Pad to word boundary
    size_t padding = (kWordSize - text.size() % kWordSize) % kWordSize;
    buffer_.insert(buffer_.end(), padding, 0);
    return *this;
}

AbiWriter& AbiWriter::put_handles(std::span<const Handle> handles) {
    put_uint(handles.size());
    for (const auto& h : handles) {
        put_bytes32(h);
    }
    return *this;
}

// ============================================================================
// AbiReader
// ============================================================================

std::span<const uint8_t> AbiReader::next_word() {
    if (remaining() < kWordSize) {
        throw DecodeError("Truncated word at offset " + std::to_string(offset_));
    }
    auto word = data_.subspan(offset_, kWordSize);
    offset_ += kWordSize;
    return word;
}

uint64_t AbiReader::read_uint() {
    return word_to_uint(read_bytes32());
}

Address AbiReader::read_address() {
    return word_to_address(read_bytes32());
}

Bytes32 AbiReader::read_bytes32() {
    auto word = next_word();
    Bytes32 result{};
    std::copy(word.begin(), word.end(), result.begin());
    return result;
}

std::string AbiReader::read_string() {
    uint64_t length = read_uint();
    size_t padded = static_cast<size_t>((length + kWordSize - 1) / kWordSize * kWordSize);

    if (length > remaining() || padded > remaining()) {
        throw DecodeError("String length exceeds payload");
    }

    std::string text(reinterpret_cast<const char*>(data_.data() + offset_),
                     static_cast<size_t>(length));
    offset_ += padded;
    return text;
}

std::vector<Handle> AbiReader::read_handles() {
    uint64_t count = read_uint();
    if (count > remaining() / kWordSize) {
        throw DecodeError("Handle count exceeds payload");
    }

    std::vector<Handle> handles;
    handles.reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; ++i) {
        handles.push_back(read_bytes32());
    }
    return handles;
}

void AbiReader::expect_end() const {
    if (!at_end()) {
        throw DecodeError("Unexpected trailing bytes (" +
                          std::to_string(remaining()) + ")");
    }
}

} // namespace veilmarket::chain
