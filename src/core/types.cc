#include "types.hh"
#include <algorithm>

namespace shardkeep {

// ============================================================================
// Hex Encoding/Decoding
// ============================================================================

[[nodiscard]] std::string bytes_to_hex(std::span<const std::uint8_t> bytes) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(bytes.size() * 2);
    for (auto byte : bytes) {
        result.push_back(hex_chars[byte >> 4]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

namespace {

std::optional<std::uint8_t> hex_nibble(char c) {
    if (c >= '0' && c <= '9') return static_cast<std::uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<std::uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<std::uint8_t>(c - 'A' + 10);
    return std::nullopt;
}

}  // namespace

[[nodiscard]] std::optional<std::vector<std::uint8_t>> hex_to_bytes(std::string_view hex) {
    // Skip optional 0x prefix
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex = hex.substr(2);
    }

    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<std::uint8_t> result;
    result.reserve(hex.size() / 2);

    for (std::size_t i = 0; i < hex.size(); i += 2) {
        auto high = hex_nibble(hex[i]);
        auto low = hex_nibble(hex[i + 1]);
        if (!high || !low) {
            return std::nullopt;
        }
        result.push_back(static_cast<std::uint8_t>((*high << 4) | *low));
    }

    return result;
}

[[nodiscard]] std::optional<hash_t> hex_to_hash(std::string_view hex) {
    auto bytes = hex_to_bytes(hex);
    if (!bytes || bytes->size() != HASH_SIZE) {
        return std::nullopt;
    }
    hash_t result;
    std::copy(bytes->begin(), bytes->end(), result.begin());
    return result;
}

}  // namespace shardkeep
