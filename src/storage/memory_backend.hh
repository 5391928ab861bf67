#pragma once

#include "storage/backend.hh"
#include <map>
#include <mutex>

namespace shardkeep {

// ============================================================================
// In-Memory Backend
// ============================================================================

// Process-local shard map. Nothing survives the object.
class MemoryBackend : public StorageBackend {
public:
    explicit MemoryBackend(std::string backend_id = "memory");

    [[nodiscard]] const std::string& backend_id() const override { return backend_id_; }
    [[nodiscard]] BackendKind kind() const override { return BackendKind::MEMORY; }

    StorageLocation store_shard(const StorageShard& shard) override;
    [[nodiscard]] StorageShard retrieve_shard(const StorageLocation& location) override;
    bool delete_shard(const StorageLocation& location) override;
    [[nodiscard]] bool shard_exists(const StorageLocation& location) override;
    [[nodiscard]] std::vector<StorageLocation> list_shards(std::string_view prefix = "") override;
    [[nodiscard]] BackendStats get_stats() override;
    [[nodiscard]] bool health_check() override { return true; }

    // Replaces stored payload bytes without touching the recorded checksum
    bool tamper(const StorageLocation& location, bytes_t data);

private:
    struct Entry {
        StorageShard shard;
        hash_t stored_checksum;  // Computed here at store time
    };

    std::string backend_id_;
    mutable std::mutex mutex_;
    std::map<std::string, Entry> shards_;
    std::uint64_t total_bytes_ = 0;
};

}  // namespace shardkeep
