#include "storage/registry.hh"
#include "core/logging.hh"
#include "core/worker_pool.hh"
#include <algorithm>
#include <atomic>

namespace shardkeep {

namespace {

// Runs op, turning a thrown error into the outcome's code
template<typename Op>
void record(ShardOutcome& outcome, Op&& op) {
    try {
        op();
    } catch (const StorageError& e) {
        outcome.error = e.code();
        outcome.error_message = e.what();
    } catch (const std::exception& e) {
        outcome.error = ErrorCode::IO_ERROR;
        outcome.error_message = e.what();
    }
}

}  // namespace

// ============================================================================
// DistributionResult
// ============================================================================

std::map<std::size_t, StorageLocation> DistributionResult::locations() const {
    std::map<std::size_t, StorageLocation> result;
    for (const auto& outcome : outcomes) {
        if (outcome.ok() && outcome.location) {
            result.emplace(outcome.index, *outcome.location);
        }
    }
    return result;
}

std::size_t DistributionResult::stored_count() const {
    return static_cast<std::size_t>(std::count_if(
        outcomes.begin(), outcomes.end(), [](const auto& o) { return o.ok(); }));
}

std::vector<std::size_t> DistributionResult::failed_indices() const {
    std::vector<std::size_t> result;
    for (const auto& outcome : outcomes) {
        if (!outcome.ok()) {
            result.push_back(outcome.index);
        }
    }
    return result;
}

// ============================================================================
// Registration
// ============================================================================

BackendRegistry::BackendRegistry(RegistryConfig config) : config_(config) {}

void BackendRegistry::register_backend(std::shared_ptr<StorageBackend> backend) {
    if (!backend) {
        throw StorageError(ErrorCode::INVALID_ARGUMENT, "Cannot register a null backend");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& existing : backends_) {
        if (existing->backend_id() == backend->backend_id()) {
            throw StorageError(ErrorCode::INVALID_ARGUMENT,
                               "Backend '" + backend->backend_id() + "' already registered");
        }
    }

    log::registry.info() << "Registered " << backend_kind_string(backend->kind())
                         << " backend " << backend->backend_id();
    backends_.push_back(std::move(backend));
}

bool BackendRegistry::unregister_backend(std::string_view backend_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(backends_.begin(), backends_.end(),
                           [&](const auto& b) { return b->backend_id() == backend_id; });
    if (it == backends_.end()) {
        return false;
    }
    backends_.erase(it);
    log::registry.info() << "Unregistered backend " << backend_id;
    return true;
}

std::shared_ptr<StorageBackend> BackendRegistry::get_backend(std::string_view backend_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& backend : backends_) {
        if (backend->backend_id() == backend_id) {
            return backend;
        }
    }
    return nullptr;
}

std::vector<std::string> BackendRegistry::backend_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(backends_.size());
    for (const auto& backend : backends_) {
        ids.push_back(backend->backend_id());
    }
    return ids;
}

std::size_t BackendRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backends_.size();
}

std::vector<std::shared_ptr<StorageBackend>> BackendRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backends_;
}

// ============================================================================
// Health
// ============================================================================

std::map<std::string, bool> BackendRegistry::health_check_all() {
    auto backends = snapshot();
    std::vector<char> healthy(backends.size(), 0);

    parallel_for(backends.size(), config_.max_workers, [&](std::size_t i) {
        try {
            healthy[i] = backends[i]->health_check() ? 1 : 0;
        } catch (const std::exception& e) {
            log::registry.warn() << "Health check of " << backends[i]->backend_id()
                                 << " threw: " << e.what();
        }
    });

    std::map<std::string, bool> result;
    for (std::size_t i = 0; i < backends.size(); i++) {
        if (!healthy[i]) {
            log::registry.warn() << "Backend " << backends[i]->backend_id() << " is unhealthy";
        }
        result[backends[i]->backend_id()] = healthy[i] != 0;
    }
    return result;
}

// ============================================================================
// Distribution
// ============================================================================

DistributionResult BackendRegistry::distribute_shard_set(const ShardSet& shard_set) {
    DistributionResult result;
    result.outcomes.resize(shard_set.total_shards());
    for (std::size_t i = 0; i < result.outcomes.size(); i++) {
        result.outcomes[i].index = i;
    }

    auto health = health_check_all();
    std::vector<std::shared_ptr<StorageBackend>> healthy;
    for (auto& backend : snapshot()) {
        if (health[backend->backend_id()]) {
            healthy.push_back(std::move(backend));
        }
    }

    // Present shards in index order, each paired with its target
    std::vector<std::pair<std::size_t, std::shared_ptr<StorageBackend>>> assignments;
    for (std::size_t i = 0; i < shard_set.total_shards(); i++) {
        auto& outcome = result.outcomes[i];
        if (!shard_set[i]) {
            outcome.error = ErrorCode::SHARD_ABSENT;
            outcome.error_message = "Shard absent from set";
            continue;
        }
        if (healthy.empty()) {
            outcome.error = ErrorCode::BACKEND_UNAVAILABLE;
            outcome.error_message = "No healthy backend";
            continue;
        }
        assignments.emplace_back(i, healthy[assignments.size() % healthy.size()]);
    }

    parallel_for(assignments.size(), config_.max_workers, [&](std::size_t a) {
        std::size_t index = assignments[a].first;
        const auto& backend = assignments[a].second;
        auto& outcome = result.outcomes[index];
        record(outcome, [&] { outcome.location = backend->store_shard(*shard_set[index]); });
        if (!outcome.ok()) {
            log::registry.warn() << "Storing shard " << index << " on " << backend->backend_id()
                                 << " failed: " << outcome.error_message;
        }
    });

    std::size_t stored = result.stored_count();
    if (healthy.empty() && shard_set.present_count() > 0) {
        log::registry.error("No healthy backend for distribution");
    }
    log::registry.info() << "Distributed " << stored << "/" << shard_set.total_shards()
                         << " shards of "
                         << (shard_set.metadata() ? shard_set.metadata()->content_id : "?")
                         << " across " << healthy.size() << " backends";
    return result;
}

// ============================================================================
// Retrieval
// ============================================================================

ShardSet BackendRegistry::retrieve_distributed(
    const std::map<std::size_t, StorageLocation>& locations,
    const ShardSet& shard_template,
    std::vector<ShardOutcome>* outcomes) {

    const auto& metadata = shard_template.metadata();
    if (!metadata) {
        throw StorageError(ErrorCode::INVALID_ARGUMENT, "Retrieval template carries no metadata");
    }

    std::size_t n = shard_template.total_shards();
    std::vector<ShardOutcome> results(n);
    std::vector<std::optional<StorageShard>> fetched(n);
    for (std::size_t i = 0; i < n; i++) {
        results[i].index = i;
        results[i].error = ErrorCode::NOT_FOUND;
        results[i].error_message = "No location recorded";
    }

    std::vector<std::pair<std::size_t, StorageLocation>> requests;
    for (const auto& [index, location] : locations) {
        if (index >= n) {
            log::registry.warn() << "Ignoring location for out-of-range shard " << index;
            continue;
        }
        requests.emplace_back(index, location);
    }

    parallel_for(requests.size(), config_.max_workers, [&](std::size_t r) {
        std::size_t index = requests[r].first;
        const StorageLocation& location = requests[r].second;
        auto& outcome = results[index];
        outcome.error = ErrorCode::OK;
        outcome.error_message.clear();
        outcome.location = location;

        auto backend = get_backend(location.backend_id);
        if (!backend) {
            outcome.error = ErrorCode::BACKEND_UNAVAILABLE;
            outcome.error_message = "Backend '" + location.backend_id + "' not registered";
        } else {
            record(outcome, [&] {
                auto shard = backend->retrieve_shard(location);
                if (shard.index != index ||
                    !shard.metadata || shard.metadata->content_id != metadata->content_id) {
                    throw CorruptionDetectedError("Shard at " + location.to_string() +
                                                  " does not belong in slot " +
                                                  std::to_string(index));
                }
                shard.metadata = metadata;
                fetched[index] = std::move(shard);
            });
        }

        if (!outcome.ok()) {
            log::registry.warn() << "Fetching shard " << index << " from " << location.to_string()
                                 << " failed (" << error_code_string(outcome.error)
                                 << "): " << outcome.error_message;
        }
    });

    ShardSet result = ShardSet::make_template(metadata);
    for (auto& shard : fetched) {
        if (shard) {
            result.set(std::move(*shard));
        }
    }

    log::registry.info() << "Retrieved " << result.present_count() << "/" << n
                         << " shards of " << metadata->content_id;

    if (outcomes) {
        *outcomes = std::move(results);
    }
    return result;
}

std::size_t BackendRegistry::delete_distributed(
    const std::map<std::size_t, StorageLocation>& locations) {

    std::vector<StorageLocation> targets;
    targets.reserve(locations.size());
    for (const auto& entry : locations) {
        targets.push_back(entry.second);
    }

    std::atomic<std::size_t> deleted{0};
    parallel_for(targets.size(), config_.max_workers, [&](std::size_t i) {
        auto backend = get_backend(targets[i].backend_id);
        if (!backend) {
            log::registry.warn() << "Cannot delete " << targets[i].to_string()
                                 << ": backend not registered";
            return;
        }
        ShardOutcome outcome;
        record(outcome, [&] {
            if (backend->delete_shard(targets[i])) {
                deleted++;
            }
        });
        if (!outcome.ok()) {
            log::registry.warn() << "Deleting " << targets[i].to_string()
                                 << " failed: " << outcome.error_message;
        }
    });

    return deleted.load();
}

}  // namespace shardkeep
