#pragma once

#include "storage/shard.hh"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace shardkeep {

// ============================================================================
// Backend Kinds and Stats
// ============================================================================

enum class BackendKind : std::uint8_t {
    MEMORY = 0,
    LOCAL_FILE = 1,
};

[[nodiscard]] std::string_view backend_kind_string(BackendKind kind);

struct BackendStats {
    std::uint64_t total_bytes = 0;   // Payload bytes held
    std::uint64_t total_shards = 0;
    std::optional<std::uint64_t> quota_bytes;
    std::optional<double> quota_used_ratio;
};

// ============================================================================
// Storage Backend Interface
// ============================================================================

// Persists individual shards. Implementations must be safe to call from
// several threads at once; the registry fans shard I/O out across workers.
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    [[nodiscard]] virtual const std::string& backend_id() const = 0;
    [[nodiscard]] virtual BackendKind kind() const = 0;

    // Overwrites a shard already stored at the same locator
    virtual StorageLocation store_shard(const StorageShard& shard) = 0;

    // Throws NotFoundError when absent, CorruptionDetectedError when the
    // stored bytes no longer match the checksum recorded at store time
    [[nodiscard]] virtual StorageShard retrieve_shard(const StorageLocation& location) = 0;

    // False when nothing was stored there
    virtual bool delete_shard(const StorageLocation& location) = 0;

    [[nodiscard]] virtual bool shard_exists(const StorageLocation& location) = 0;

    // Sorted by locator
    [[nodiscard]] virtual std::vector<StorageLocation> list_shards(std::string_view prefix = "") = 0;

    [[nodiscard]] virtual BackendStats get_stats() = 0;

    // Cheap liveness probe
    [[nodiscard]] virtual bool health_check() = 0;

protected:
    // Throws StorageError(INVALID_ARGUMENT) for a location owned elsewhere
    void check_owner(const StorageLocation& location) const;
};

// ============================================================================
// Locators
// ============================================================================

// Non-empty, no path separators, no "..", no NUL
[[nodiscard]] bool valid_content_id(std::string_view content_id);

// "<content_id>/shard_<index>", index zero-padded to three digits.
// Throws StorageError(INVALID_ARGUMENT) for an unusable content id.
[[nodiscard]] std::string shard_locator(std::string_view content_id, std::size_t index);

[[nodiscard]] std::optional<std::pair<std::string, std::size_t>> parse_shard_locator(
    std::string_view locator);

}  // namespace shardkeep
