#include "storage/erasure.hh"
#include "crypto/hash.hh"
#include "core/logging.hh"
#include <algorithm>
#include <chrono>

namespace shardkeep {

namespace {

// Fold coeff * src into dst, byte by byte
void mul_add_row(std::vector<std::uint8_t>& dst,
                 std::span<const std::uint8_t> src,
                 GF256::element_type coeff) {
    if (coeff == GF256::zero) {
        return;
    }
    for (std::size_t b = 0; b < dst.size(); b++) {
        dst[b] = GF256::add(dst[b], GF256::mul(coeff, src[b]));
    }
}

system_time_t now_micros() {
    // Truncated so the timestamp survives serialization unchanged
    return from_unix_micros(to_unix_micros(std::chrono::system_clock::now()));
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

ErasureCodec::ErasureCodec(RedundancyLevel level) : level_(std::move(level)) {
    if (!level_.is_valid()) {
        log::codec.error() << "Rejected redundancy level " << level_.name
                           << " (k=" << level_.data_shards
                           << ", n=" << level_.total_shards << ")";
        level_.validate();
    }
    GF256::initialize();
    generator_ = generator_matrix(level_.data_shards, level_.total_shards);
}

GFMatrix ErasureCodec::generator_matrix(std::size_t k, std::size_t n) {
    RedundancyLevel::custom(k, n).validate();

    // Vandermonde rows over the distinct points 0..n-1: V[i][j] = i^j
    GFMatrix vandermonde(n, std::vector<GF256::element_type>(k));
    for (std::size_t i = 0; i < n; i++) {
        for (std::size_t j = 0; j < k; j++) {
            vandermonde[i][j] = GF256::pow(static_cast<GF256::element_type>(i), j);
        }
    }

    // V * inv(top) keeps every k-row subset invertible and makes the top
    // block the identity
    GFMatrix top(vandermonde.begin(), vandermonde.begin() + static_cast<std::ptrdiff_t>(k));
    auto top_inverse = invert_matrix<GF256>(std::move(top));
    if (!top_inverse) {
        log::codec.fatal() << "Vandermonde block is singular for k=" << k << ", n=" << n;
        throw InvariantViolationError("Singular Vandermonde block");
    }

    return multiply_matrix<GF256>(vandermonde, *top_inverse);
}

const GFMatrix& ErasureCodec::matrix_for(std::size_t k, std::size_t n,
                                         GFMatrix& scratch) const {
    if (k == level_.data_shards && n == level_.total_shards) {
        return generator_;
    }
    scratch = generator_matrix(k, n);
    return scratch;
}

// ============================================================================
// Encoding
// ============================================================================

ShardSet ErasureCodec::encode(std::span<const std::uint8_t> data,
                              const std::string& content_id) const {
    auto metadata = std::make_shared<ShardMetadata>();
    metadata->content_id = content_id.empty() ? random_content_id() : content_id;
    metadata->original_size = data.size();
    metadata->data_shards = level_.data_shards;
    metadata->total_shards = level_.total_shards;
    metadata->content_hash = sha3_256(data);
    metadata->created_at = now_micros();

    auto result = encode_with(data, metadata);

    SHARDKEEP_LOG_DEBUG(log::codec) << "Encoded " << data.size() << " bytes of "
                                    << metadata->content_id << " into "
                                    << level_.total_shards << " shards of "
                                    << metadata->shard_size() << " bytes";
    return result;
}

ShardSet ErasureCodec::encode_with(std::span<const std::uint8_t> data,
                                   std::shared_ptr<const ShardMetadata> metadata) const {
    std::size_t k = metadata->data_shards;
    std::size_t n = metadata->total_shards;
    std::size_t chunk_size = metadata->shard_size();

    GFMatrix scratch;
    const GFMatrix& generator = matrix_for(k, n, scratch);

    ShardSet result(metadata);

    // Systematic shards: contiguous slices of the zero-padded payload
    std::vector<bytes_t> chunks(k, bytes_t(chunk_size, 0));
    for (std::size_t i = 0; i < k; i++) {
        std::size_t begin = std::min(i * chunk_size, data.size());
        std::size_t end = std::min(begin + chunk_size, data.size());
        std::copy(data.begin() + static_cast<std::ptrdiff_t>(begin),
                  data.begin() + static_cast<std::ptrdiff_t>(end),
                  chunks[i].begin());
    }

    for (std::size_t row = 0; row < n; row++) {
        StorageShard shard;
        shard.index = row;
        shard.metadata = metadata;

        if (row < k) {
            shard.data = chunks[row];
        } else {
            shard.data.assign(chunk_size, 0);
            for (std::size_t i = 0; i < k; i++) {
                mul_add_row(shard.data, chunks[i], generator[row][i]);
            }
        }

        shard.checksum = compute_checksum(shard.data);
        result.set(std::move(shard));
    }

    return result;
}

// ============================================================================
// Decoding
// ============================================================================

RecoveryResult ErasureCodec::decode(const ShardSet& shard_set) const {
    const auto& metadata = shard_set.metadata();
    if (!metadata) {
        return RecoveryResult::failure(ErrorCode::INVALID_ARGUMENT,
                                       "Shard set carries no metadata");
    }

    std::size_t k = metadata->data_shards;
    std::size_t n = metadata->total_shards;
    if (!RedundancyLevel::custom(k, n).is_valid() || shard_set.total_shards() != n) {
        return RecoveryResult::failure(ErrorCode::CONFIGURATION,
                                       "Shard set has inconsistent (k, n)");
    }

    std::size_t chunk_size = metadata->shard_size();

    // Usable shards in ascending order, so systematic ones are preferred
    std::vector<std::size_t> usable;
    std::vector<std::size_t> corrupted;
    for (std::size_t i = 0; i < n; i++) {
        const auto& shard = shard_set[i];
        if (!shard) {
            continue;
        }
        if (shard->index != i || shard->data.size() != chunk_size || !shard->checksum_valid()) {
            corrupted.push_back(i);
            continue;
        }
        usable.push_back(i);
    }

    for (std::size_t index : corrupted) {
        log::codec.warn() << "Excluding corrupted shard " << index
                          << " of " << metadata->content_id;
    }

    if (usable.size() < k) {
        auto result = RecoveryResult::failure(
            ErrorCode::INSUFFICIENT_SHARDS,
            "Need " + std::to_string(k) + " valid shards, have " + std::to_string(usable.size()));
        result.corrupted_indices = std::move(corrupted);
        return result;
    }
    usable.resize(k);

    std::vector<bytes_t> chunks(k);

    if (usable.back() == k - 1) {
        // All systematic shards present: no inversion needed
        for (std::size_t i = 0; i < k; i++) {
            chunks[i] = shard_set[i]->data;
        }
    } else {
        GFMatrix scratch;
        const GFMatrix& generator = matrix_for(k, n, scratch);

        GFMatrix sub;
        sub.reserve(k);
        for (std::size_t index : usable) {
            sub.push_back(generator[index]);
        }

        auto inverse = invert_matrix<GF256>(std::move(sub));
        if (!inverse) {
            log::codec.fatal() << "Singular decode submatrix for " << metadata->content_id
                               << " (k=" << k << ", n=" << n << ")";
            auto result = RecoveryResult::failure(ErrorCode::INVARIANT_VIOLATION,
                                                  "Decode submatrix is singular");
            result.corrupted_indices = std::move(corrupted);
            return result;
        }

        for (std::size_t r = 0; r < k; r++) {
            chunks[r].assign(chunk_size, 0);
            for (std::size_t c = 0; c < k; c++) {
                mul_add_row(chunks[r], shard_set[usable[c]]->data, (*inverse)[r][c]);
            }
        }
    }

    bytes_t data;
    data.reserve(chunk_size * k);
    for (const auto& chunk : chunks) {
        data.insert(data.end(), chunk.begin(), chunk.end());
    }
    data.resize(metadata->original_size);

    if (!hashes_equal(sha3_256(data), metadata->content_hash)) {
        log::codec.warn() << "Content hash mismatch after decoding " << metadata->content_id;
        auto result = RecoveryResult::failure(ErrorCode::CORRUPTION_DETECTED,
                                              "Recovered content does not match its hash");
        result.corrupted_indices = std::move(corrupted);
        return result;
    }

    SHARDKEEP_LOG_DEBUG(log::codec) << "Decoded " << data.size() << " bytes of "
                                    << metadata->content_id << " from " << k << " shards";

    auto result = RecoveryResult::ok(std::move(data), std::move(usable));
    result.corrupted_indices = std::move(corrupted);
    return result;
}

// ============================================================================
// Verification and Repair
// ============================================================================

bool ErasureCodec::verify_integrity(const ShardSet& shard_set) const {
    return std::all_of(shard_set.shards().begin(), shard_set.shards().end(),
                       [](const auto& shard) { return !shard || shard->checksum_valid(); });
}

ShardSet ErasureCodec::repair(const ShardSet& shard_set) const {
    auto recovered = decode(shard_set);
    if (!recovered.success) {
        log::codec.warn() << "Repair failed: " << recovered.error_message;
        raise_error(recovered.error, "Repair failed: " + recovered.error_message);
    }

    auto repaired = encode_with(*recovered.data, shard_set.metadata());

    SHARDKEEP_LOG_INFO(log::codec) << "Repaired " << shard_set.metadata()->content_id
                                   << " (" << shard_set.missing_indices().size() << " missing, "
                                   << recovered.corrupted_indices.size() << " corrupted)";
    return repaired;
}

bool ErasureCodec::can_reconstruct(const ShardSet& shard_set) const {
    std::size_t k = shard_set.data_shards();
    std::size_t valid = static_cast<std::size_t>(std::count_if(
        shard_set.shards().begin(), shard_set.shards().end(),
        [](const auto& shard) { return shard && shard->checksum_valid(); }));
    return k > 0 && valid >= k;
}

CodecStats ErasureCodec::get_stats() const {
    CodecStats stats;
    stats.data_shards = level_.data_shards;
    stats.total_shards = level_.total_shards;
    stats.parity_shards = level_.parity_shards();
    stats.max_failures = level_.parity_shards();
    stats.overhead_percent = 100.0 * static_cast<double>(stats.parity_shards) /
                             static_cast<double>(stats.data_shards);
    return stats;
}

}  // namespace shardkeep
