#include "storage/local_file_backend.hh"
#include "core/logging.hh"
#include <algorithm>
#include <atomic>
#include <fstream>
#include <iterator>
#include <unistd.h>

namespace shardkeep {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view SHARD_EXTENSION = ".bin";

std::atomic<std::uint64_t> temp_counter{0};

std::optional<bytes_t> read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    bytes_t data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return std::nullopt;
    }
    return data;
}

// "<content_id>/shard_NNN" for a shard file under base, or nullopt
std::optional<std::string> locator_for(const fs::path& base, const fs::path& file) {
    if (file.extension() != SHARD_EXTENSION) {
        return std::nullopt;
    }
    auto relative = file.lexically_relative(base);
    auto content_dir = relative.parent_path();
    if (content_dir.empty() || content_dir.has_parent_path()) {
        return std::nullopt;
    }

    std::string locator = content_dir.string() + "/" + relative.stem().string();
    if (!parse_shard_locator(locator)) {
        return std::nullopt;
    }
    return locator;
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

LocalFileBackend::LocalFileBackend(LocalFileBackendConfig config) : config_(std::move(config)) {
    std::error_code ec;
    fs::create_directories(config_.base_dir, ec);
    if (ec || !fs::is_directory(config_.base_dir)) {
        log::backend.error() << "Cannot use " << config_.base_dir.string() << " as shard directory";
        throw StorageError(ErrorCode::IO_ERROR,
                           "Cannot create shard directory " + config_.base_dir.string() +
                           (ec ? ": " + ec.message() : ""));
    }

    scan_existing();

    log::backend.info() << "Local backend " << config_.backend_id << " at "
                        << config_.base_dir.string() << ": " << payload_sizes_.size()
                        << " shards, " << used_bytes_ << " bytes";
}

void LocalFileBackend::scan_existing() {
    std::error_code ec;
    for (fs::recursive_directory_iterator it(config_.base_dir, ec), end; !ec && it != end;
         it.increment(ec)) {
        if (!it->is_regular_file()) {
            continue;
        }
        auto locator = locator_for(config_.base_dir, it->path());
        if (!locator) {
            continue;
        }

        auto bytes = read_file(it->path());
        auto shard = bytes ? StorageShard::deserialize(*bytes) : std::nullopt;
        if (!shard) {
            log::backend.warn() << "Unreadable shard file " << it->path().string();
            continue;
        }

        payload_sizes_[*locator] = shard->data.size();
        used_bytes_ += shard->data.size();
    }
    if (ec) {
        log::backend.warn() << "Scan of " << config_.base_dir.string()
                            << " stopped early: " << ec.message();
    }
}

fs::path LocalFileBackend::path_for(const std::string& locator) const {
    auto parsed = parse_shard_locator(locator);
    if (!parsed) {
        throw StorageError(ErrorCode::INVALID_ARGUMENT, "Malformed locator '" + locator + "'");
    }
    return config_.base_dir / locator;
}

// ============================================================================
// Shard Operations
// ============================================================================

StorageLocation LocalFileBackend::store_shard(const StorageShard& shard) {
    if (!shard.metadata) {
        throw StorageError(ErrorCode::INVALID_ARGUMENT, "Shard carries no metadata");
    }

    StorageLocation location{config_.backend_id,
                             shard_locator(shard.metadata->content_id, shard.index)};
    fs::path path = path_for(location.locator);
    path += SHARD_EXTENSION;

    auto bytes = shard.serialize();
    std::uint64_t payload = shard.data.size();

    std::lock_guard<std::mutex> lock(mutex_);

    std::uint64_t previous = 0;
    if (auto it = payload_sizes_.find(location.locator); it != payload_sizes_.end()) {
        previous = it->second;
    }

    std::uint64_t projected = used_bytes_ - previous + payload;
    if (config_.quota_bytes && projected > *config_.quota_bytes) {
        log::backend.warn() << "Quota exceeded on " << config_.backend_id << ": "
                            << projected << " > " << *config_.quota_bytes;
        throw QuotaExceededError("Storing " + location.to_string() + " needs " +
                                 std::to_string(projected) + " bytes, quota is " +
                                 std::to_string(*config_.quota_bytes));
    }

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw StorageError(ErrorCode::IO_ERROR,
                           "Cannot create " + path.parent_path().string() + ": " + ec.message());
    }

    fs::path temp_path = path;
    temp_path += ".tmp." + std::to_string(::getpid()) + "." + std::to_string(temp_counter++);

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        file.write(reinterpret_cast<const char*>(bytes.data()),
                   static_cast<std::streamsize>(bytes.size()));
        file.flush();
        if (!file) {
            file.close();
            fs::remove(temp_path, ec);
            throw StorageError(ErrorCode::IO_ERROR, "Failed to write " + temp_path.string());
        }
    }

    fs::rename(temp_path, path, ec);
    if (ec) {
        std::string reason = ec.message();
        fs::remove(temp_path, ec);
        throw StorageError(ErrorCode::IO_ERROR, "Failed to rename into " + path.string() + ": " + reason);
    }

    payload_sizes_[location.locator] = payload;
    used_bytes_ = projected;

    SHARDKEEP_LOG_TRACE(log::backend) << "Stored " << location.to_string() << " ("
                                      << payload << " bytes)";
    return location;
}

StorageShard LocalFileBackend::retrieve_shard(const StorageLocation& location) {
    check_owner(location);

    fs::path path = path_for(location.locator);
    path += SHARD_EXTENSION;

    auto bytes = read_file(path);
    if (!bytes) {
        throw NotFoundError("No shard at " + location.to_string());
    }

    auto shard = StorageShard::deserialize(*bytes);
    if (!shard) {
        log::backend.warn() << "Malformed shard file for " << location.to_string();
        throw CorruptionDetectedError("Malformed shard file at " + location.to_string());
    }

    auto expected = parse_shard_locator(location.locator);
    if (shard->index != expected->second || shard->metadata->content_id != expected->first) {
        log::backend.warn() << "Shard file at " << location.to_string() << " holds another shard";
        throw CorruptionDetectedError("Shard identity mismatch at " + location.to_string());
    }

    if (!shard->checksum_valid()) {
        log::backend.warn() << "Checksum mismatch reading " << location.to_string();
        throw CorruptionDetectedError("Checksum mismatch at " + location.to_string());
    }

    return *shard;
}

bool LocalFileBackend::delete_shard(const StorageLocation& location) {
    check_owner(location);

    fs::path path = path_for(location.locator);
    path += SHARD_EXTENSION;

    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) {
        throw StorageError(ErrorCode::IO_ERROR, "Failed to delete " + path.string() + ": " + ec.message());
    }

    if (auto it = payload_sizes_.find(location.locator); it != payload_sizes_.end()) {
        used_bytes_ -= it->second;
        payload_sizes_.erase(it);
    }
    return removed;
}

bool LocalFileBackend::shard_exists(const StorageLocation& location) {
    if (location.backend_id != config_.backend_id || !parse_shard_locator(location.locator)) {
        return false;
    }
    fs::path path = path_for(location.locator);
    path += SHARD_EXTENSION;

    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::vector<StorageLocation> LocalFileBackend::list_shards(std::string_view prefix) {
    std::vector<StorageLocation> result;

    std::error_code ec;
    for (fs::recursive_directory_iterator it(config_.base_dir, ec), end; !ec && it != end;
         it.increment(ec)) {
        if (!it->is_regular_file()) {
            continue;
        }
        // Temporary files end in ".tmp.<pid>.<n>" and never match
        auto locator = locator_for(config_.base_dir, it->path());
        if (locator && std::string_view(*locator).starts_with(prefix)) {
            result.push_back({config_.backend_id, std::move(*locator)});
        }
    }
    if (ec) {
        log::backend.warn() << "Listing " << config_.base_dir.string() << " failed: " << ec.message();
    }

    std::sort(result.begin(), result.end());
    return result;
}

BackendStats LocalFileBackend::get_stats() {
    std::lock_guard<std::mutex> lock(mutex_);

    BackendStats stats;
    stats.total_bytes = used_bytes_;
    stats.total_shards = payload_sizes_.size();
    stats.quota_bytes = config_.quota_bytes;
    if (config_.quota_bytes && *config_.quota_bytes > 0) {
        stats.quota_used_ratio = static_cast<double>(used_bytes_) /
                                 static_cast<double>(*config_.quota_bytes);
    }
    return stats;
}

bool LocalFileBackend::health_check() {
    std::error_code ec;
    bool healthy = fs::is_directory(config_.base_dir, ec) &&
                   ::access(config_.base_dir.c_str(), W_OK) == 0;
    if (!healthy) {
        log::backend.warn() << "Backend " << config_.backend_id << " unhealthy: "
                            << config_.base_dir.string() << " not writable";
    }
    return healthy;
}

}  // namespace shardkeep
