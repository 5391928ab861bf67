#pragma once

#include "storage/backend.hh"
#include <filesystem>
#include <map>
#include <mutex>

namespace shardkeep {

// ============================================================================
// Local File Backend
// ============================================================================

struct LocalFileBackendConfig {
    std::string backend_id = "local";
    std::filesystem::path base_dir;
    std::optional<std::uint64_t> quota_bytes;  // Payload bytes; unlimited when unset
};

// One file per shard at <base_dir>/<content_id>/shard_<index>.bin holding
// StorageShard::serialize(). Files are written to a temporary name and
// renamed into place, so readers never see a partial shard.
class LocalFileBackend : public StorageBackend {
public:
    // Creates base_dir if needed and rebuilds usage from the shard files
    // already present. Throws StorageError(IO_ERROR) if base_dir is unusable.
    explicit LocalFileBackend(LocalFileBackendConfig config);

    [[nodiscard]] const std::string& backend_id() const override { return config_.backend_id; }
    [[nodiscard]] BackendKind kind() const override { return BackendKind::LOCAL_FILE; }

    // Throws QuotaExceededError when the payload would push usage past the
    // quota, StorageError(IO_ERROR) when the write fails
    StorageLocation store_shard(const StorageShard& shard) override;

    [[nodiscard]] StorageShard retrieve_shard(const StorageLocation& location) override;
    bool delete_shard(const StorageLocation& location) override;
    [[nodiscard]] bool shard_exists(const StorageLocation& location) override;
    [[nodiscard]] std::vector<StorageLocation> list_shards(std::string_view prefix = "") override;
    [[nodiscard]] BackendStats get_stats() override;
    [[nodiscard]] bool health_check() override;

    [[nodiscard]] const std::filesystem::path& base_dir() const { return config_.base_dir; }

    // Throws StorageError(INVALID_ARGUMENT) for a malformed locator
    [[nodiscard]] std::filesystem::path path_for(const std::string& locator) const;

private:
    void scan_existing();

    LocalFileBackendConfig config_;

    // Guards usage accounting; held across each write so two stores can
    // never both pass the quota check
    mutable std::mutex mutex_;
    std::map<std::string, std::uint64_t> payload_sizes_;
    std::uint64_t used_bytes_ = 0;
};

}  // namespace shardkeep
