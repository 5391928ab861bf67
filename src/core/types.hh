#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <chrono>
#include <compare>

namespace shardkeep {

// ============================================================================
// Hashing Constants
// ============================================================================

// SHA3-256 output size
inline constexpr std::size_t HASH_SIZE = 32;

// ============================================================================
// Erasure Coding Limits
// ============================================================================

// GF(2^8) elements index shards, so n can never exceed 255
inline constexpr std::size_t MAX_TOTAL_SHARDS = 255;

// Primitive polynomial: x^8 + x^4 + x^3 + x^2 + 1 (0x11d)
// Fixed permanently: changing it invalidates every encoded shard set
inline constexpr std::uint16_t GF_PRIMITIVE_POLY = 0x11d;

// Random content ids are this many bytes before hex encoding
inline constexpr std::size_t CONTENT_ID_BYTES = 16;

// ============================================================================
// Storage Constants
// ============================================================================

inline constexpr std::uint32_t SHARD_FILE_MAGIC = 0x31534B53;     // "SKS1"
inline constexpr std::uint8_t SHARD_FILE_VERSION = 1;
inline constexpr std::size_t DEFAULT_MAX_WORKERS = 8;

// ============================================================================
// Core Type Aliases
// ============================================================================

using hash_t = std::array<std::uint8_t, HASH_SIZE>;
using bytes_t = std::vector<std::uint8_t>;

// ============================================================================
// Time Utilities
// ============================================================================

using timestamp_t = std::chrono::microseconds;
using system_time_t = std::chrono::system_clock::time_point;

[[nodiscard]] inline std::uint64_t to_unix_micros(system_time_t t) {
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<timestamp_t>(t.time_since_epoch()).count());
}

[[nodiscard]] inline system_time_t from_unix_micros(std::uint64_t us) {
    return system_time_t(std::chrono::duration_cast<system_time_t::duration>(
        timestamp_t(static_cast<std::int64_t>(us))));
}

// ============================================================================
// Serialization Helpers
// ============================================================================

// Little-endian encoding
inline void encode_u16(std::uint8_t* dst, std::uint16_t val) {
    dst[0] = static_cast<std::uint8_t>(val);
    dst[1] = static_cast<std::uint8_t>(val >> 8);
}

inline void encode_u32(std::uint8_t* dst, std::uint32_t val) {
    dst[0] = static_cast<std::uint8_t>(val);
    dst[1] = static_cast<std::uint8_t>(val >> 8);
    dst[2] = static_cast<std::uint8_t>(val >> 16);
    dst[3] = static_cast<std::uint8_t>(val >> 24);
}

inline void encode_u64(std::uint8_t* dst, std::uint64_t val) {
    dst[0] = static_cast<std::uint8_t>(val);
    dst[1] = static_cast<std::uint8_t>(val >> 8);
    dst[2] = static_cast<std::uint8_t>(val >> 16);
    dst[3] = static_cast<std::uint8_t>(val >> 24);
    dst[4] = static_cast<std::uint8_t>(val >> 32);
    dst[5] = static_cast<std::uint8_t>(val >> 40);
    dst[6] = static_cast<std::uint8_t>(val >> 48);
    dst[7] = static_cast<std::uint8_t>(val >> 56);
}

[[nodiscard]] inline std::uint16_t decode_u16(const std::uint8_t* src) {
    return static_cast<std::uint16_t>(src[0]) |
           (static_cast<std::uint16_t>(src[1]) << 8);
}

[[nodiscard]] inline std::uint32_t decode_u32(const std::uint8_t* src) {
    return static_cast<std::uint32_t>(src[0]) |
           (static_cast<std::uint32_t>(src[1]) << 8) |
           (static_cast<std::uint32_t>(src[2]) << 16) |
           (static_cast<std::uint32_t>(src[3]) << 24);
}

[[nodiscard]] inline std::uint64_t decode_u64(const std::uint8_t* src) {
    return static_cast<std::uint64_t>(src[0]) |
           (static_cast<std::uint64_t>(src[1]) << 8) |
           (static_cast<std::uint64_t>(src[2]) << 16) |
           (static_cast<std::uint64_t>(src[3]) << 24) |
           (static_cast<std::uint64_t>(src[4]) << 32) |
           (static_cast<std::uint64_t>(src[5]) << 40) |
           (static_cast<std::uint64_t>(src[6]) << 48) |
           (static_cast<std::uint64_t>(src[7]) << 56);
}

// ============================================================================
// Hex Encoding/Decoding
// ============================================================================

[[nodiscard]] std::string bytes_to_hex(std::span<const std::uint8_t> bytes);
[[nodiscard]] std::optional<std::vector<std::uint8_t>> hex_to_bytes(std::string_view hex);
[[nodiscard]] std::optional<hash_t> hex_to_hash(std::string_view hex);

// ============================================================================
// Byte Helpers
// ============================================================================

[[nodiscard]] inline bytes_t to_bytes(std::string_view s) {
    return bytes_t(s.begin(), s.end());
}

}  // namespace shardkeep
