#include "storage/merkle.hh"
#include "storage/shard.hh"
#include "crypto/hash.hh"
#include <stdexcept>
#include <string>

namespace shardkeep {

// ============================================================================
// MerkleProof Implementation
// ============================================================================

bool MerkleProof::verify() const {
    hash_t current = leaf_hash;
    std::size_t idx = leaf_index;

    for (const auto& sibling : siblings) {
        if (idx % 2 == 0) {
            current = MerkleTree::hash_pair(current, sibling);
        } else {
            current = MerkleTree::hash_pair(sibling, current);
        }
        idx /= 2;
    }

    // A proof for an index past the padded width cannot fold down to 0
    return idx == 0 && hashes_equal(current, root);
}

bool verify_proof(const MerkleProof& proof) {
    return proof.verify();
}

// ============================================================================
// MerkleTree Implementation
// ============================================================================

MerkleTree::MerkleTree(std::vector<hash_t> leaves) : leaves_(std::move(leaves)) {}

MerkleTree MerkleTree::from_shard_set(const ShardSet& shard_set) {
    std::vector<hash_t> leaves;
    leaves.reserve(shard_set.total_shards());

    for (const auto& shard : shard_set.shards()) {
        leaves.push_back(shard ? sha3_256(shard->data) : empty_leaf());
    }

    return MerkleTree(std::move(leaves));
}

const hash_t& MerkleTree::empty_leaf() {
    return empty_hash();
}

hash_t MerkleTree::hash_pair(const hash_t& left, const hash_t& right) {
    SHA3Hasher hasher;
    hasher.update(left);
    hasher.update(right);
    return hasher.finalize();
}

void MerkleTree::set_leaf(std::size_t index, const hash_t& leaf) {
    leaves_.at(index) = leaf;
}

std::vector<std::vector<hash_t>> MerkleTree::build_layers() const {
    std::vector<std::vector<hash_t>> layers;

    std::vector<hash_t> base = leaves_;
    std::size_t width = 1;
    while (width < base.size()) {
        width <<= 1;
    }
    base.resize(width, base.back());
    layers.push_back(std::move(base));

    while (layers.back().size() > 1) {
        const auto& prev = layers.back();
        std::vector<hash_t> next;
        next.reserve(prev.size() / 2);

        for (std::size_t i = 0; i < prev.size(); i += 2) {
            next.push_back(hash_pair(prev[i], prev[i + 1]));
        }
        layers.push_back(std::move(next));
    }

    return layers;
}

hash_t MerkleTree::root() const {
    if (leaves_.empty()) {
        return empty_leaf();
    }
    return build_layers().back()[0];
}

MerkleProof MerkleTree::proof(std::size_t index) const {
    if (index >= leaves_.size()) {
        throw std::out_of_range("Merkle leaf index " + std::to_string(index) +
                                " out of range (" + std::to_string(leaves_.size()) + " leaves)");
    }

    auto layers = build_layers();

    MerkleProof result;
    result.leaf_index = index;
    result.leaf_hash = leaves_[index];
    result.root = layers.back()[0];

    std::size_t idx = index;
    for (std::size_t layer = 0; layer + 1 < layers.size(); ++layer) {
        result.siblings.push_back(layers[layer][idx ^ 1]);
        idx /= 2;
    }

    return result;
}

}  // namespace shardkeep
