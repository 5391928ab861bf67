#include "storage/backup_record.hh"
#include "core/logging.hh"

namespace shardkeep {

std::string_view backup_status_string(BackupStatus status) {
    switch (status) {
        case BackupStatus::IN_PROGRESS: return "in_progress";
        case BackupStatus::COMPLETED: return "completed";
        case BackupStatus::FAILED: return "failed";
        case BackupStatus::VERIFIED: return "verified";
        case BackupStatus::CORRUPTED: return "corrupted";
    }
    return "unknown";
}

std::optional<BackupStatus> parse_backup_status(std::string_view s) {
    for (auto status : {BackupStatus::IN_PROGRESS, BackupStatus::COMPLETED, BackupStatus::FAILED,
                        BackupStatus::VERIFIED, BackupStatus::CORRUPTED}) {
        if (backup_status_string(status) == s) {
            return status;
        }
    }
    return std::nullopt;
}

// ============================================================================
// BackupRecord Implementation
// ============================================================================

std::map<std::size_t, StorageLocation> BackupRecord::locations() const {
    std::map<std::size_t, StorageLocation> result;
    for (const auto& shard : shards) {
        result[shard.shard_index] = StorageLocation{shard.backend_id, shard.location};
    }
    return result;
}

ShardSet BackupRecord::make_template() const {
    auto hash = hex_to_hash(content_hash);
    if (!hash) {
        throw StorageError(ErrorCode::INVALID_ARGUMENT,
                           "Backup " + content_id + " has a malformed content hash");
    }
    if (!RedundancyLevel::custom(data_shards, shard_count).is_valid()) {
        throw StorageError(ErrorCode::INVALID_ARGUMENT,
                           "Backup " + content_id + " records an invalid (k, n)");
    }

    auto metadata = std::make_shared<ShardMetadata>();
    metadata->content_id = content_id;
    metadata->original_size = total_size_bytes;
    metadata->data_shards = data_shards;
    metadata->total_shards = shard_count;
    metadata->content_hash = *hash;
    metadata->created_at = from_unix_micros(created_at_micros);
    return ShardSet::make_template(std::move(metadata));
}

BackupRecord make_backup_record(const ShardSet& shard_set,
                                const DistributionResult& distribution,
                                const RedundancyLevel& redundancy,
                                std::uint64_t belief_count,
                                bool encrypted) {
    const auto& metadata = shard_set.metadata();
    if (!metadata) {
        throw StorageError(ErrorCode::INVALID_ARGUMENT, "Shard set carries no metadata");
    }

    BackupRecord record;
    record.content_id = metadata->content_id;
    record.belief_count = belief_count;
    record.total_size_bytes = metadata->original_size;
    record.content_hash = bytes_to_hex(metadata->content_hash);
    record.redundancy_level = redundancy.name;
    record.data_shards = metadata->data_shards;
    record.shard_count = metadata->total_shards;
    record.created_at_micros = to_unix_micros(metadata->created_at);
    record.encrypted = encrypted;

    for (const auto& outcome : distribution.outcomes) {
        if (!outcome.ok() || !outcome.location || !shard_set.has(outcome.index)) {
            continue;
        }
        const auto& shard = *shard_set[outcome.index];

        ShardRecord entry;
        entry.shard_index = outcome.index;
        entry.is_parity = shard.is_parity();
        entry.size_bytes = shard.data.size();
        entry.checksum = bytes_to_hex(shard.checksum);
        entry.backend_id = outcome.location->backend_id;
        entry.location = outcome.location->locator;
        record.shards.push_back(std::move(entry));
    }

    std::size_t stored = record.shards.size();
    if (stored == record.shard_count) {
        record.status = BackupStatus::COMPLETED;
    } else if (stored >= record.data_shards) {
        record.status = BackupStatus::COMPLETED;
        record.error_message = "Degraded: " + std::to_string(stored) + " of " +
                               std::to_string(record.shard_count) + " shards stored";
        log::storage.warn() << "Backup " << record.content_id << " " << record.error_message;
    } else {
        record.status = BackupStatus::FAILED;
        record.error_message = "Only " + std::to_string(stored) + " of " +
                               std::to_string(record.shard_count) + " shards stored, " +
                               std::to_string(record.data_shards) + " needed";
        log::storage.error() << "Backup " << record.content_id << " failed: "
                             << record.error_message;
    }

    return record;
}

BackupStatus status_after_verification(const IntegrityReport& report) {
    return report.is_valid ? BackupStatus::VERIFIED : BackupStatus::CORRUPTED;
}

}  // namespace shardkeep
