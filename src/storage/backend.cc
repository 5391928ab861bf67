#include "storage/backend.hh"
#include <iomanip>
#include <sstream>

namespace shardkeep {

std::string_view backend_kind_string(BackendKind kind) {
    switch (kind) {
        case BackendKind::MEMORY: return "memory";
        case BackendKind::LOCAL_FILE: return "local_file";
    }
    return "unknown";
}

void StorageBackend::check_owner(const StorageLocation& location) const {
    if (location.backend_id != backend_id()) {
        throw StorageError(ErrorCode::INVALID_ARGUMENT,
                           "Location " + location.to_string() + " is not owned by " + backend_id());
    }
}

// ============================================================================
// Locators
// ============================================================================

namespace {

constexpr std::string_view SHARD_PREFIX = "shard_";

}  // namespace

bool valid_content_id(std::string_view content_id) {
    if (content_id.empty() || content_id == ".") {
        return false;
    }
    if (content_id.find("..") != std::string_view::npos) {
        return false;
    }
    for (char c : content_id) {
        if (c == '/' || c == '\\' || c == '\0') {
            return false;
        }
    }
    return true;
}

std::string shard_locator(std::string_view content_id, std::size_t index) {
    if (!valid_content_id(content_id)) {
        throw StorageError(ErrorCode::INVALID_ARGUMENT,
                           "Unusable content id '" + std::string(content_id) + "'");
    }

    std::ostringstream locator;
    locator << content_id << '/' << SHARD_PREFIX << std::setw(3) << std::setfill('0') << index;
    return locator.str();
}

std::optional<std::pair<std::string, std::size_t>> parse_shard_locator(std::string_view locator) {
    auto slash = locator.rfind('/');
    if (slash == std::string_view::npos) {
        return std::nullopt;
    }

    auto content_id = locator.substr(0, slash);
    auto name = locator.substr(slash + 1);
    if (!valid_content_id(content_id) || !name.starts_with(SHARD_PREFIX)) {
        return std::nullopt;
    }

    auto digits = name.substr(SHARD_PREFIX.size());
    if (digits.empty() || digits.size() > 3) {
        return std::nullopt;
    }

    std::size_t index = 0;
    for (char c : digits) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        index = index * 10 + static_cast<std::size_t>(c - '0');
    }
    if (index >= MAX_TOTAL_SHARDS) {
        return std::nullopt;
    }

    return std::make_pair(std::string(content_id), index);
}

}  // namespace shardkeep
