#pragma once

#include "core/types.hh"
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace shardkeep {

// ============================================================================
// SHA3-256 Hashing
// ============================================================================

class SHA3Hasher {
public:
    SHA3Hasher();
    ~SHA3Hasher();

    SHA3Hasher(const SHA3Hasher&) = delete;
    SHA3Hasher& operator=(const SHA3Hasher&) = delete;
    SHA3Hasher(SHA3Hasher&&) noexcept;
    SHA3Hasher& operator=(SHA3Hasher&&) noexcept;

    void update(std::span<const std::uint8_t> data);
    void update(std::string_view data);
    void update(const void* data, std::size_t len);
    [[nodiscard]] hash_t finalize();

    void reset();

private:
    void* ctx_;  // EVP_MD_CTX
};

// One-shot helpers
[[nodiscard]] hash_t sha3_256(std::span<const std::uint8_t> data);
[[nodiscard]] hash_t sha3_256(const void* data, std::size_t len);

// Hash multiple inputs (concatenated)
template<typename... Args>
[[nodiscard]] hash_t sha3_256_multi(Args&&... args) {
    SHA3Hasher hasher;
    (hasher.update(std::forward<Args>(args)), ...);
    return hasher.finalize();
}

// SHA3-256 of the empty byte string; stands in for absent shards
[[nodiscard]] const hash_t& empty_hash();

// ============================================================================
// Comparison and Randomness
// ============================================================================

// Constant-time comparison for checksums that decide trust
[[nodiscard]] bool hashes_equal(const hash_t& a, const hash_t& b);

// Fills buf from the OpenSSL CSPRNG; throws std::runtime_error on failure
void random_bytes(std::span<std::uint8_t> buf);

// CONTENT_ID_BYTES random bytes, hex encoded
[[nodiscard]] std::string random_content_id();

}  // namespace shardkeep
