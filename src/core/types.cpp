#include "veilmarket/core/types.hpp"

namespace veilmarket {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

template<size_t N>
std::array<uint8_t, N> parse_fixed_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }

    if (hex.size() != N * 2) {
        throw ValidationError("Hex string must encode exactly " +
                              std::to_string(N) + " bytes");
    }

    std::array<uint8_t, N> result{};
    for (size_t i = 0; i < N; ++i) {
        int hi = hex_digit(hex[2 * i]);
        int lo = hex_digit(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw ValidationError("Invalid hex digit");
        }
        result[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// Hex Utilities
// ============================================================================

std::string to_hex(std::span<const uint8_t> bytes) {
    static constexpr char digits[] = "0123456789abcdef";

    std::string out;
    out.reserve(2 + bytes.size() * 2);
    out += "0x";
    for (uint8_t b : bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

Address address_from_hex(std::string_view hex) {
    return parse_fixed_hex<20>(hex);
}

Bytes32 bytes32_from_hex(std::string_view hex) {
    return parse_fixed_hex<32>(hex);
}

} // namespace veilmarket
