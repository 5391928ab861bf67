#include "storage/integrity.hh"
#include "crypto/hash.hh"
#include "core/logging.hh"

namespace shardkeep {

IntegrityReport IntegrityVerifier::verify_shard_set(const ShardSet& shard_set) const {
    IntegrityReport report;

    for (std::size_t i = 0; i < shard_set.total_shards(); i++) {
        const auto& shard = shard_set[i];
        if (!shard) {
            report.missing_indices.push_back(i);
            continue;
        }

        report.shards_checked++;
        if (shard->index != i || !verify_shard(*shard)) {
            report.corrupted_indices.push_back(i);
            continue;
        }

        report.shards_valid++;
        report.valid_indices.push_back(i);
    }

    report.is_valid = report.corrupted_indices.empty() && report.missing_indices.empty() &&
                      shard_set.total_shards() > 0;
    report.can_recover = shard_set.data_shards() > 0 &&
                         report.shards_valid >= shard_set.data_shards();

    if (!report.corrupted_indices.empty()) {
        log::integrity.warn() << report.corrupted_indices.size() << " corrupted shard(s) in "
                              << (shard_set.metadata() ? shard_set.metadata()->content_id : "?");
    }
    SHARDKEEP_LOG_DEBUG(log::integrity) << "Verified " << report.shards_checked << " shards: "
                                        << report.shards_valid << " valid, "
                                        << report.missing_indices.size() << " missing";
    return report;
}

bool IntegrityVerifier::verify_shard(const StorageShard& shard) const {
    return shard.checksum_valid();
}

hash_t IntegrityVerifier::generate_merkle_root(const ShardSet& shard_set) const {
    return MerkleTree::from_shard_set(shard_set).root();
}

MerkleProof IntegrityVerifier::generate_proof(const ShardSet& shard_set, std::size_t index) const {
    return MerkleTree::from_shard_set(shard_set).proof(index);
}

bool IntegrityVerifier::verify_proof(const MerkleProof& proof) const {
    return shardkeep::verify_proof(proof);
}

bool IntegrityVerifier::challenge_response_verify(const StorageShard& shard,
                                                  const hash_t& expected_checksum) const {
    bool ok = hashes_equal(compute_checksum(shard.data), expected_checksum);
    if (!ok) {
        log::integrity.warn() << "Challenge failed for shard " << shard.index;
    }
    return ok;
}

}  // namespace shardkeep
