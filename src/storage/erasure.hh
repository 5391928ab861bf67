#pragma once

#include "storage/gf256.hh"
#include "storage/shard.hh"
#include <span>
#include <string>

namespace shardkeep {

// ============================================================================
// Reed-Solomon Erasure Codec
// ============================================================================

// Systematic Reed-Solomon over GF(2^8). Shards [0, k) are slices of the
// zero-padded payload, shards [k, n) are parity. Any k of the n shards
// reconstruct the payload.
//
// The codec holds only its (k, n) and the derived generator matrix, so a
// single instance may be shared across threads.
class ErasureCodec {
public:
    // Throws ConfigurationError unless 1 <= k < n <= 255
    explicit ErasureCodec(RedundancyLevel level);

    [[nodiscard]] const RedundancyLevel& redundancy() const { return level_; }

    // Empty content_id draws a random one
    [[nodiscard]] ShardSet encode(std::span<const std::uint8_t> data,
                                  const std::string& content_id = "") const;

    // Never throws for missing or corrupted shards; failures are reported in
    // the result. Decoding uses the (k, n) recorded in the set's metadata.
    [[nodiscard]] RecoveryResult decode(const ShardSet& shard_set) const;

    // True iff every present shard's checksum matches its payload
    [[nodiscard]] bool verify_integrity(const ShardSet& shard_set) const;

    // Decodes, then re-encodes every shard from the recovered bytes with the
    // same metadata. Throws the StorageError subclass matching the decode
    // failure when the payload cannot be recovered.
    [[nodiscard]] ShardSet repair(const ShardSet& shard_set) const;

    [[nodiscard]] CodecStats get_stats() const;

    // At least k present shards pass their checksum
    [[nodiscard]] bool can_reconstruct(const ShardSet& shard_set) const;

    // n x k matrix whose top k rows are the identity and in which every
    // k-row subset is invertible
    [[nodiscard]] static GFMatrix generator_matrix(std::size_t k, std::size_t n);

private:
    [[nodiscard]] ShardSet encode_with(std::span<const std::uint8_t> data,
                                       std::shared_ptr<const ShardMetadata> metadata) const;

    [[nodiscard]] const GFMatrix& matrix_for(std::size_t k, std::size_t n,
                                             GFMatrix& scratch) const;

    RedundancyLevel level_;
    GFMatrix generator_;
};

}  // namespace shardkeep
