#pragma once

#include "core/types.hh"
#include <vector>

namespace shardkeep {

class ShardSet;

// ============================================================================
// Merkle Proof
// ============================================================================

struct MerkleProof {
    std::size_t leaf_index = 0;
    hash_t leaf_hash{};
    std::vector<hash_t> siblings;  // Leaf level first
    hash_t root{};

    // Recomputes the root from leaf_hash and siblings
    [[nodiscard]] bool verify() const;
};

[[nodiscard]] bool verify_proof(const MerkleProof& proof);

// ============================================================================
// Merkle Tree
// ============================================================================

// Binary SHA3-256 tree over per-shard leaf hashes. The leaf count is padded
// to the next power of two by repeating the last leaf; internal nodes are
// sha3(left || right). Nothing above the leaves is cached, so the root
// always reflects the current leaves.
class MerkleTree {
public:
    MerkleTree() = default;
    explicit MerkleTree(std::vector<hash_t> leaves);

    // One leaf per slot: sha3 of the payload, empty_leaf() for absent slots
    [[nodiscard]] static MerkleTree from_shard_set(const ShardSet& shard_set);

    // Placeholder leaf for an absent shard
    [[nodiscard]] static const hash_t& empty_leaf();

    [[nodiscard]] static hash_t hash_pair(const hash_t& left, const hash_t& right);

    [[nodiscard]] std::size_t leaf_count() const { return leaves_.size(); }
    [[nodiscard]] const std::vector<hash_t>& leaves() const { return leaves_; }

    // Throws std::out_of_range
    void set_leaf(std::size_t index, const hash_t& leaf);

    // empty_leaf() for a tree without leaves
    [[nodiscard]] hash_t root() const;

    // Throws std::out_of_range
    [[nodiscard]] MerkleProof proof(std::size_t index) const;

private:
    [[nodiscard]] std::vector<std::vector<hash_t>> build_layers() const;

    std::vector<hash_t> leaves_;
};

}  // namespace shardkeep
