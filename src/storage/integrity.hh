#pragma once

#include "storage/merkle.hh"
#include "storage/shard.hh"

namespace shardkeep {

// ============================================================================
// Integrity Verifier
// ============================================================================

// Stateless checksum and Merkle checks over shards and shard sets
class IntegrityVerifier {
public:
    // Corrupted = present with a checksum mismatch, or in the wrong slot
    [[nodiscard]] IntegrityReport verify_shard_set(const ShardSet& shard_set) const;

    // Check for a single shard straight off a fetch, before it joins a set
    [[nodiscard]] bool verify_shard(const StorageShard& shard) const;

    [[nodiscard]] hash_t generate_merkle_root(const ShardSet& shard_set) const;

    // Throws std::out_of_range past n
    [[nodiscard]] MerkleProof generate_proof(const ShardSet& shard_set, std::size_t index) const;

    [[nodiscard]] bool verify_proof(const MerkleProof& proof) const;

    // Compares the fetched payload against a checksum from trusted metadata,
    // ignoring the checksum the backend returned with it
    [[nodiscard]] bool challenge_response_verify(const StorageShard& shard,
                                                 const hash_t& expected_checksum) const;
};

}  // namespace shardkeep
