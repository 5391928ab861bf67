#pragma once

#include "storage/backend.hh"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace shardkeep {

// ============================================================================
// Registry Configuration and Outcomes
// ============================================================================

struct RegistryConfig {
    std::size_t max_workers = DEFAULT_MAX_WORKERS;  // Concurrent shard I/O per call
};

// Result of storing or fetching one shard index
struct ShardOutcome {
    std::size_t index = 0;
    ErrorCode error = ErrorCode::OK;
    std::optional<StorageLocation> location;
    std::string error_message;

    [[nodiscard]] bool ok() const { return error == ErrorCode::OK; }
};

struct DistributionResult {
    std::vector<ShardOutcome> outcomes;  // outcomes[i] is shard i

    // Successfully stored shards only
    [[nodiscard]] std::map<std::size_t, StorageLocation> locations() const;
    [[nodiscard]] std::size_t stored_count() const;
    [[nodiscard]] std::vector<std::size_t> failed_indices() const;
};

// ============================================================================
// Backend Registry
// ============================================================================

// Owns the registered backends and spreads shard I/O across them. A failure
// on one shard is recorded in that shard's outcome and never aborts the
// rest of the batch.
class BackendRegistry {
public:
    explicit BackendRegistry(RegistryConfig config = {});

    // Throws StorageError(INVALID_ARGUMENT) for a null backend or a
    // backend_id already registered
    void register_backend(std::shared_ptr<StorageBackend> backend);

    // False when the id is unknown
    bool unregister_backend(std::string_view backend_id);

    [[nodiscard]] std::shared_ptr<StorageBackend> get_backend(std::string_view backend_id) const;

    // Registration order
    [[nodiscard]] std::vector<std::string> backend_ids() const;
    [[nodiscard]] std::size_t size() const;

    // A backend whose probe throws counts as unhealthy
    [[nodiscard]] std::map<std::string, bool> health_check_all();

    // Round-robin over the currently healthy backends, in registration
    // order. Absent shards are reported as SHARD_ABSENT.
    [[nodiscard]] DistributionResult distribute_shard_set(const ShardSet& shard_set);

    // Fetches every listed location into a copy of shard_template. Failed
    // fetches leave their slot empty; per-index outcomes go to *outcomes
    // when given. Throws StorageError(INVALID_ARGUMENT) if the template
    // has no metadata.
    [[nodiscard]] ShardSet retrieve_distributed(
        const std::map<std::size_t, StorageLocation>& locations,
        const ShardSet& shard_template,
        std::vector<ShardOutcome>* outcomes = nullptr);

    // Number of shards actually deleted
    std::size_t delete_distributed(const std::map<std::size_t, StorageLocation>& locations);

private:
    [[nodiscard]] std::vector<std::shared_ptr<StorageBackend>> snapshot() const;

    RegistryConfig config_;
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<StorageBackend>> backends_;
};

}  // namespace shardkeep
