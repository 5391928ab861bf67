#include "storage/memory_backend.hh"
#include "crypto/hash.hh"
#include "core/logging.hh"

namespace shardkeep {

MemoryBackend::MemoryBackend(std::string backend_id) : backend_id_(std::move(backend_id)) {}

StorageLocation MemoryBackend::store_shard(const StorageShard& shard) {
    if (!shard.metadata) {
        throw StorageError(ErrorCode::INVALID_ARGUMENT, "Shard carries no metadata");
    }

    StorageLocation location{backend_id_, shard_locator(shard.metadata->content_id, shard.index)};
    Entry entry{shard, compute_checksum(shard.data)};

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = shards_.find(location.locator);
    if (it != shards_.end()) {
        total_bytes_ -= it->second.shard.data.size();
        it->second = std::move(entry);
    } else {
        shards_.emplace(location.locator, std::move(entry));
    }
    total_bytes_ += shard.data.size();

    SHARDKEEP_LOG_TRACE(log::backend) << "Stored " << location.to_string();
    return location;
}

StorageShard MemoryBackend::retrieve_shard(const StorageLocation& location) {
    check_owner(location);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = shards_.find(location.locator);
    if (it == shards_.end()) {
        throw NotFoundError("No shard at " + location.to_string());
    }

    const auto& entry = it->second;
    if (!hashes_equal(compute_checksum(entry.shard.data), entry.stored_checksum)) {
        log::backend.warn() << "Stored bytes changed at " << location.to_string();
        throw CorruptionDetectedError("Checksum mismatch at " + location.to_string());
    }
    return entry.shard;
}

bool MemoryBackend::delete_shard(const StorageLocation& location) {
    check_owner(location);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = shards_.find(location.locator);
    if (it == shards_.end()) {
        return false;
    }
    total_bytes_ -= it->second.shard.data.size();
    shards_.erase(it);
    return true;
}

bool MemoryBackend::shard_exists(const StorageLocation& location) {
    if (location.backend_id != backend_id_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return shards_.contains(location.locator);
}

std::vector<StorageLocation> MemoryBackend::list_shards(std::string_view prefix) {
    std::vector<StorageLocation> result;

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = shards_.lower_bound(std::string(prefix));
         it != shards_.end() && std::string_view(it->first).starts_with(prefix); ++it) {
        result.push_back({backend_id_, it->first});
    }
    return result;
}

BackendStats MemoryBackend::get_stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    BackendStats stats;
    stats.total_bytes = total_bytes_;
    stats.total_shards = shards_.size();
    return stats;
}

bool MemoryBackend::tamper(const StorageLocation& location, bytes_t data) {
    check_owner(location);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = shards_.find(location.locator);
    if (it == shards_.end()) {
        return false;
    }
    total_bytes_ -= it->second.shard.data.size();
    total_bytes_ += data.size();
    it->second.shard.data = std::move(data);
    return true;
}

}  // namespace shardkeep
