#include "hash.hh"
#include "core/logging.hh"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <stdexcept>

namespace shardkeep {

namespace {

EVP_MD_CTX* as_ctx(void* p) {
    return static_cast<EVP_MD_CTX*>(p);
}

// Context of a hasher that has not been moved from
EVP_MD_CTX* live_ctx(void* p) {
    if (!p) {
        log::crypto.error("SHA3Hasher used after move");
        throw std::runtime_error("SHA3Hasher used after move");
    }
    return static_cast<EVP_MD_CTX*>(p);
}

}  // namespace

// ============================================================================
// SHA3Hasher Implementation
// ============================================================================

SHA3Hasher::SHA3Hasher() {
    ctx_ = EVP_MD_CTX_new();
    if (!ctx_) {
        log::crypto.error("Failed to create EVP_MD_CTX");
        throw std::runtime_error("Failed to create EVP_MD_CTX");
    }
    if (EVP_DigestInit_ex(as_ctx(ctx_), EVP_sha3_256(), nullptr) != 1) {
        log::crypto.error("Failed to initialize SHA3-256");
        EVP_MD_CTX_free(as_ctx(ctx_));
        throw std::runtime_error("Failed to initialize SHA3-256");
    }
}

SHA3Hasher::~SHA3Hasher() {
    if (ctx_) {
        EVP_MD_CTX_free(as_ctx(ctx_));
    }
}

SHA3Hasher::SHA3Hasher(SHA3Hasher&& other) noexcept : ctx_(other.ctx_) {
    other.ctx_ = nullptr;
}

SHA3Hasher& SHA3Hasher::operator=(SHA3Hasher&& other) noexcept {
    if (this != &other) {
        if (ctx_) {
            EVP_MD_CTX_free(as_ctx(ctx_));
        }
        ctx_ = other.ctx_;
        other.ctx_ = nullptr;
    }
    return *this;
}

void SHA3Hasher::update(std::span<const std::uint8_t> data) {
    update(data.data(), data.size());
}

void SHA3Hasher::update(std::string_view data) {
    update(data.data(), data.size());
}

void SHA3Hasher::update(const void* data, std::size_t len) {
    if (len == 0) {
        return;
    }
    if (EVP_DigestUpdate(live_ctx(ctx_), data, len) != 1) {
        log::crypto.error("SHA3-256 update failed");
        throw std::runtime_error("SHA3-256 update failed");
    }
}

hash_t SHA3Hasher::finalize() {
    hash_t result;
    unsigned int len = HASH_SIZE;
    if (EVP_DigestFinal_ex(live_ctx(ctx_), result.data(), &len) != 1) {
        log::crypto.error("SHA3-256 finalize failed");
        throw std::runtime_error("SHA3-256 finalize failed");
    }
    return result;
}

void SHA3Hasher::reset() {
    if (EVP_DigestInit_ex(live_ctx(ctx_), EVP_sha3_256(), nullptr) != 1) {
        log::crypto.error("SHA3-256 reset failed");
        throw std::runtime_error("SHA3-256 reset failed");
    }
}

// ============================================================================
// Convenience Functions
// ============================================================================

hash_t sha3_256(std::span<const std::uint8_t> data) {
    return sha3_256(data.data(), data.size());
}

hash_t sha3_256(const void* data, std::size_t len) {
    // EVP_Digest rejects a null pointer even for zero-length input
    static const std::uint8_t empty = 0;
    if (len == 0) {
        data = &empty;
    }

    hash_t result;
    unsigned int out_len = HASH_SIZE;
    if (EVP_Digest(data, len, result.data(), &out_len, EVP_sha3_256(), nullptr) != 1) {
        log::crypto.error("SHA3-256 failed");
        throw std::runtime_error("SHA3-256 failed");
    }
    return result;
}

const hash_t& empty_hash() {
    static const hash_t h = sha3_256(nullptr, 0);
    return h;
}

// ============================================================================
// Comparison and Randomness
// ============================================================================

bool hashes_equal(const hash_t& a, const hash_t& b) {
    return CRYPTO_memcmp(a.data(), b.data(), HASH_SIZE) == 0;
}

void random_bytes(std::span<std::uint8_t> buf) {
    if (buf.empty()) {
        return;
    }
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        log::crypto.error("RAND_bytes failed");
        throw std::runtime_error("Failed to obtain random bytes");
    }
}

std::string random_content_id() {
    std::array<std::uint8_t, CONTENT_ID_BYTES> id;
    random_bytes(id);
    return bytes_to_hex(id);
}

}  // namespace shardkeep
