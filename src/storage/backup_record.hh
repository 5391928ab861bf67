#pragma once

#include "storage/registry.hh"
#include "storage/shard.hh"
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shardkeep {

// ============================================================================
// Backup Status
// ============================================================================

enum class BackupStatus : std::uint8_t {
    IN_PROGRESS = 0,
    COMPLETED = 1,
    FAILED = 2,
    VERIFIED = 3,
    CORRUPTED = 4,
};

[[nodiscard]] std::string_view backup_status_string(BackupStatus status);
[[nodiscard]] std::optional<BackupStatus> parse_backup_status(std::string_view s);

// ============================================================================
// Persistence Records
// ============================================================================

// One stored shard, as the caller persists it
struct ShardRecord {
    std::size_t shard_index = 0;
    bool is_parity = false;
    std::uint64_t size_bytes = 0;
    std::string checksum;  // Hex
    std::string backend_id;
    std::string location;  // Backend locator
};

// Everything needed to find, fetch and check a backup again later
struct BackupRecord {
    std::string content_id;
    std::uint64_t belief_count = 0;
    std::uint64_t total_size_bytes = 0;
    std::string content_hash;  // Hex
    std::string redundancy_level;
    std::size_t data_shards = 0;
    std::size_t shard_count = 0;
    std::uint64_t created_at_micros = 0;
    bool encrypted = false;
    BackupStatus status = BackupStatus::IN_PROGRESS;
    std::string error_message;
    std::vector<ShardRecord> shards;

    [[nodiscard]] std::map<std::size_t, StorageLocation> locations() const;

    // All-absent shard set carrying the recorded metadata. Throws
    // StorageError(INVALID_ARGUMENT) when the record is malformed.
    [[nodiscard]] ShardSet make_template() const;
};

// COMPLETED when every shard was stored, COMPLETED with a degraded note
// when at least k were, FAILED otherwise
[[nodiscard]] BackupRecord make_backup_record(const ShardSet& shard_set,
                                              const DistributionResult& distribution,
                                              const RedundancyLevel& redundancy,
                                              std::uint64_t belief_count,
                                              bool encrypted);

[[nodiscard]] BackupStatus status_after_verification(const IntegrityReport& report);

}  // namespace shardkeep
