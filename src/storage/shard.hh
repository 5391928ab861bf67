#pragma once

#include "core/types.hh"
#include "core/errors.hh"
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace shardkeep {

// ============================================================================
// Redundancy Level
// ============================================================================

// A (k, n) pair: any k of n shards reconstruct the payload
struct RedundancyLevel {
    std::string name;
    std::size_t data_shards = 0;   // k
    std::size_t total_shards = 0;  // n

    [[nodiscard]] static RedundancyLevel minimal() { return {"minimal", 2, 3}; }
    [[nodiscard]] static RedundancyLevel personal() { return {"personal", 3, 5}; }
    [[nodiscard]] static RedundancyLevel federation() { return {"federation", 5, 9}; }
    [[nodiscard]] static RedundancyLevel paranoid() { return {"paranoid", 7, 15}; }

    // Not validated here; validate() or ErasureCodec will reject bad pairs
    [[nodiscard]] static RedundancyLevel custom(std::size_t k, std::size_t n);

    // Preset lookup by lowercase name
    [[nodiscard]] static std::optional<RedundancyLevel> from_name(std::string_view name);

    [[nodiscard]] std::size_t parity_shards() const {
        return total_shards > data_shards ? total_shards - data_shards : 0;
    }

    [[nodiscard]] bool is_valid() const;

    // Throws ConfigurationError unless 1 <= k < n <= 255
    void validate() const;

    bool operator==(const RedundancyLevel&) const = default;
};

// ============================================================================
// Shard Metadata
// ============================================================================

struct ShardMetadata {
    std::string content_id;
    std::size_t original_size = 0;
    std::size_t data_shards = 0;    // k
    std::size_t total_shards = 0;   // n
    hash_t content_hash{};          // SHA3-256 of the original payload
    system_time_t created_at{};

    [[nodiscard]] std::size_t shard_size() const;

    bool operator==(const ShardMetadata&) const = default;
};

// ============================================================================
// Storage Shard
// ============================================================================

struct StorageShard {
    std::size_t index = 0;
    bytes_t data;
    hash_t checksum{};                               // SHA3-256 of data
    std::shared_ptr<const ShardMetadata> metadata;

    [[nodiscard]] bool is_parity() const;

    // Recomputes the payload checksum and compares it to the stored one
    [[nodiscard]] bool checksum_valid() const;

    // Self-describing little-endian record carrying the metadata too
    [[nodiscard]] bytes_t serialize() const;
    [[nodiscard]] static std::optional<StorageShard> deserialize(
        std::span<const std::uint8_t> data);
};

[[nodiscard]] hash_t compute_checksum(std::span<const std::uint8_t> data);

// ============================================================================
// Shard Set
// ============================================================================

// n slots sharing one metadata record; absent shards are std::nullopt,
// never zeroed placeholders.
class ShardSet {
public:
    ShardSet() = default;
    explicit ShardSet(std::shared_ptr<const ShardMetadata> metadata);

    // All-absent set, used as the retrieval template
    [[nodiscard]] static ShardSet make_template(std::shared_ptr<const ShardMetadata> metadata);

    [[nodiscard]] const std::shared_ptr<const ShardMetadata>& metadata() const { return metadata_; }
    [[nodiscard]] std::size_t data_shards() const;
    [[nodiscard]] std::size_t total_shards() const { return shards_.size(); }

    [[nodiscard]] const std::optional<StorageShard>& operator[](std::size_t index) const {
        return shards_.at(index);
    }
    [[nodiscard]] std::optional<StorageShard>& operator[](std::size_t index) {
        return shards_.at(index);
    }

    [[nodiscard]] const std::vector<std::optional<StorageShard>>& shards() const { return shards_; }

    // Places shard at shard.index; throws std::out_of_range past n
    void set(StorageShard shard);
    void remove(std::size_t index);

    [[nodiscard]] bool has(std::size_t index) const;
    [[nodiscard]] std::size_t present_count() const;
    [[nodiscard]] std::vector<std::size_t> present_indices() const;
    [[nodiscard]] std::vector<std::size_t> missing_indices() const;
    [[nodiscard]] bool is_complete() const;

    bool operator==(const ShardSet& other) const;

private:
    std::shared_ptr<const ShardMetadata> metadata_;
    std::vector<std::optional<StorageShard>> shards_;
};

// ============================================================================
// Storage Location
// ============================================================================

struct StorageLocation {
    std::string backend_id;
    std::string locator;  // Backend-specific, opaque above the backend layer

    [[nodiscard]] std::string to_string() const { return backend_id + ":" + locator; }

    auto operator<=>(const StorageLocation&) const = default;
};

// ============================================================================
// Results
// ============================================================================

struct RecoveryResult {
    bool success = false;
    std::optional<bytes_t> data;
    std::string error_message;
    ErrorCode error = ErrorCode::OK;
    std::vector<std::size_t> used_indices;       // The k shards decoded from
    std::vector<std::size_t> corrupted_indices;  // Excluded by checksum

    [[nodiscard]] static RecoveryResult ok(bytes_t data, std::vector<std::size_t> used);
    [[nodiscard]] static RecoveryResult failure(ErrorCode error, std::string message);
};

struct IntegrityReport {
    bool is_valid = false;
    bool can_recover = false;
    std::size_t shards_checked = 0;
    std::size_t shards_valid = 0;
    std::vector<std::size_t> valid_indices;
    std::vector<std::size_t> missing_indices;
    std::vector<std::size_t> corrupted_indices;
};

struct CodecStats {
    std::size_t data_shards = 0;
    std::size_t total_shards = 0;
    std::size_t parity_shards = 0;
    std::size_t max_failures = 0;
    double overhead_percent = 0.0;
};

}  // namespace shardkeep
