#include "storage/shard.hh"
#include "crypto/hash.hh"
#include <algorithm>

namespace shardkeep {

// ============================================================================
// RedundancyLevel Implementation
// ============================================================================

RedundancyLevel RedundancyLevel::custom(std::size_t k, std::size_t n) {
    return {"custom", k, n};
}

std::optional<RedundancyLevel> RedundancyLevel::from_name(std::string_view name) {
    for (auto level : {minimal(), personal(), federation(), paranoid()}) {
        if (level.name == name) {
            return level;
        }
    }
    return std::nullopt;
}

bool RedundancyLevel::is_valid() const {
    return data_shards >= 1 && total_shards > data_shards && total_shards <= MAX_TOTAL_SHARDS;
}

void RedundancyLevel::validate() const {
    if (is_valid()) {
        return;
    }
    throw ConfigurationError(
        "Invalid redundancy (k=" + std::to_string(data_shards) +
        ", n=" + std::to_string(total_shards) + "): require 1 <= k < n <= " +
        std::to_string(MAX_TOTAL_SHARDS));
}

// ============================================================================
// ShardMetadata Implementation
// ============================================================================

std::size_t ShardMetadata::shard_size() const {
    if (data_shards == 0) {
        return 0;
    }
    return (original_size + data_shards - 1) / data_shards;
}

// ============================================================================
// StorageShard Implementation
// ============================================================================

hash_t compute_checksum(std::span<const std::uint8_t> data) {
    return sha3_256(data);
}

bool StorageShard::is_parity() const {
    return metadata && index >= metadata->data_shards;
}

bool StorageShard::checksum_valid() const {
    return hashes_equal(compute_checksum(data), checksum);
}

bytes_t StorageShard::serialize() const {
    const ShardMetadata empty_meta{};
    const ShardMetadata& meta = metadata ? *metadata : empty_meta;

    bytes_t result;
    result.reserve(4 + 1 + 2 * 3 + 8 * 2 + HASH_SIZE * 2 + 2 +
                   meta.content_id.size() + 8 + data.size());

    std::array<std::uint8_t, 8> buf;

    encode_u32(buf.data(), SHARD_FILE_MAGIC);
    result.insert(result.end(), buf.begin(), buf.begin() + 4);
    result.push_back(SHARD_FILE_VERSION);

    for (std::size_t v : {index, meta.data_shards, meta.total_shards}) {
        encode_u16(buf.data(), static_cast<std::uint16_t>(v));
        result.insert(result.end(), buf.begin(), buf.begin() + 2);
    }

    encode_u64(buf.data(), meta.original_size);
    result.insert(result.end(), buf.begin(), buf.end());
    encode_u64(buf.data(), to_unix_micros(meta.created_at));
    result.insert(result.end(), buf.begin(), buf.end());

    result.insert(result.end(), meta.content_hash.begin(), meta.content_hash.end());
    result.insert(result.end(), checksum.begin(), checksum.end());

    encode_u16(buf.data(), static_cast<std::uint16_t>(meta.content_id.size()));
    result.insert(result.end(), buf.begin(), buf.begin() + 2);
    result.insert(result.end(), meta.content_id.begin(), meta.content_id.end());

    encode_u64(buf.data(), data.size());
    result.insert(result.end(), buf.begin(), buf.end());
    result.insert(result.end(), data.begin(), data.end());

    return result;
}

std::optional<StorageShard> StorageShard::deserialize(std::span<const std::uint8_t> data) {
    // magic, version, index/k/n, original_size, created_at, two hashes, id length
    constexpr std::size_t FIXED_HEADER = 4 + 1 + 6 + 16 + HASH_SIZE * 2 + 2;
    if (data.size() < FIXED_HEADER) return std::nullopt;

    std::size_t offset = 0;
    if (decode_u32(data.data()) != SHARD_FILE_MAGIC) return std::nullopt;
    offset += 4;
    if (data[offset++] != SHARD_FILE_VERSION) return std::nullopt;

    auto meta = std::make_shared<ShardMetadata>();
    StorageShard shard;

    shard.index = decode_u16(data.data() + offset);
    offset += 2;
    meta->data_shards = decode_u16(data.data() + offset);
    offset += 2;
    meta->total_shards = decode_u16(data.data() + offset);
    offset += 2;

    meta->original_size = decode_u64(data.data() + offset);
    offset += 8;
    meta->created_at = from_unix_micros(decode_u64(data.data() + offset));
    offset += 8;

    std::copy_n(data.begin() + offset, HASH_SIZE, meta->content_hash.begin());
    offset += HASH_SIZE;
    std::copy_n(data.begin() + offset, HASH_SIZE, shard.checksum.begin());
    offset += HASH_SIZE;

    std::size_t id_len = decode_u16(data.data() + offset);
    offset += 2;
    if (data.size() < offset + id_len + 8) return std::nullopt;
    meta->content_id.assign(data.begin() + offset, data.begin() + offset + id_len);
    offset += id_len;

    std::uint64_t payload_len = decode_u64(data.data() + offset);
    offset += 8;
    if (data.size() - offset != payload_len) return std::nullopt;
    shard.data.assign(data.begin() + offset, data.end());

    if (shard.index >= meta->total_shards) return std::nullopt;

    shard.metadata = std::move(meta);
    return shard;
}

// ============================================================================
// ShardSet Implementation
// ============================================================================

ShardSet::ShardSet(std::shared_ptr<const ShardMetadata> metadata)
    : metadata_(std::move(metadata)) {
    if (metadata_) {
        shards_.resize(metadata_->total_shards);
    }
}

ShardSet ShardSet::make_template(std::shared_ptr<const ShardMetadata> metadata) {
    return ShardSet(std::move(metadata));
}

std::size_t ShardSet::data_shards() const {
    return metadata_ ? metadata_->data_shards : 0;
}

void ShardSet::set(StorageShard shard) {
    std::size_t index = shard.index;
    shards_.at(index) = std::move(shard);
}

void ShardSet::remove(std::size_t index) {
    shards_.at(index).reset();
}

bool ShardSet::has(std::size_t index) const {
    return index < shards_.size() && shards_[index].has_value();
}

std::size_t ShardSet::present_count() const {
    return static_cast<std::size_t>(std::count_if(
        shards_.begin(), shards_.end(), [](const auto& s) { return s.has_value(); }));
}

std::vector<std::size_t> ShardSet::present_indices() const {
    std::vector<std::size_t> result;
    for (std::size_t i = 0; i < shards_.size(); i++) {
        if (shards_[i]) result.push_back(i);
    }
    return result;
}

std::vector<std::size_t> ShardSet::missing_indices() const {
    std::vector<std::size_t> result;
    for (std::size_t i = 0; i < shards_.size(); i++) {
        if (!shards_[i]) result.push_back(i);
    }
    return result;
}

bool ShardSet::is_complete() const {
    return !shards_.empty() && present_count() == shards_.size();
}

bool ShardSet::operator==(const ShardSet& other) const {
    if ((metadata_ == nullptr) != (other.metadata_ == nullptr)) return false;
    if (metadata_ && !(*metadata_ == *other.metadata_)) return false;
    if (shards_.size() != other.shards_.size()) return false;

    for (std::size_t i = 0; i < shards_.size(); i++) {
        const auto& a = shards_[i];
        const auto& b = other.shards_[i];
        if (a.has_value() != b.has_value()) return false;
        if (!a) continue;
        if (a->index != b->index || a->data != b->data || a->checksum != b->checksum) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// RecoveryResult Implementation
// ============================================================================

RecoveryResult RecoveryResult::ok(bytes_t data, std::vector<std::size_t> used) {
    RecoveryResult result;
    result.success = true;
    result.data = std::move(data);
    result.used_indices = std::move(used);
    return result;
}

RecoveryResult RecoveryResult::failure(ErrorCode error, std::string message) {
    RecoveryResult result;
    result.success = false;
    result.error = error;
    result.error_message = std::move(message);
    return result;
}

}  // namespace shardkeep
