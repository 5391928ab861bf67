#include <gtest/gtest.h>
#include "storage/erasure.hh"
#include "crypto/hash.hh"
#include "core/logging.hh"
#include <atomic>
#include <random>
#include <thread>

namespace shardkeep {
namespace {

bytes_t random_payload(std::size_t size, std::uint32_t seed) {
    std::mt19937 rng(seed);
    bytes_t data(size);
    for (auto& b : data) {
        b = static_cast<std::uint8_t>(rng());
    }
    return data;
}

// Copy of set keeping only the indices whose bit is set in mask
ShardSet keep_only(const ShardSet& set, std::uint32_t mask) {
    ShardSet result = set;
    for (std::size_t i = 0; i < set.total_shards(); ++i) {
        if (!(mask & (1u << i))) {
            result.remove(i);
        }
    }
    return result;
}

int popcount(std::uint32_t mask) {
    int count = 0;
    for (; mask; mask &= mask - 1) {
        ++count;
    }
    return count;
}

class ErasureCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink_ = std::make_shared<MemorySink>();
        Logger::instance().add_sink(sink_);
    }

    void TearDown() override {
        Logger::instance().remove_sink(sink_);
    }

    std::shared_ptr<MemorySink> sink_;
};

// ============================================================================
// Construction and Stats
// ============================================================================

TEST_F(ErasureCodecTest, RejectsInvalidRedundancy) {
    EXPECT_THROW(ErasureCodec(RedundancyLevel::custom(0, 3)), ConfigurationError);
    EXPECT_THROW(ErasureCodec(RedundancyLevel::custom(3, 3)), ConfigurationError);
    EXPECT_THROW(ErasureCodec(RedundancyLevel::custom(5, 4)), ConfigurationError);
    EXPECT_THROW(ErasureCodec(RedundancyLevel::custom(10, 256)), ConfigurationError);
    EXPECT_GE(sink_->count(LogLevel::ERROR, "storage.codec"), 4);
}

TEST_F(ErasureCodecTest, Stats) {
    auto stats = ErasureCodec(RedundancyLevel::personal()).get_stats();
    EXPECT_EQ(stats.data_shards, 3);
    EXPECT_EQ(stats.total_shards, 5);
    EXPECT_EQ(stats.parity_shards, 2);
    EXPECT_EQ(stats.max_failures, 2);
    EXPECT_NEAR(stats.overhead_percent, 200.0 / 3.0, 1e-9);

    auto paranoid = ErasureCodec(RedundancyLevel::paranoid()).get_stats();
    EXPECT_EQ(paranoid.max_failures, 8);
    EXPECT_NEAR(paranoid.overhead_percent, 800.0 / 7.0, 1e-9);
}

TEST_F(ErasureCodecTest, GeneratorMatrixIsSystematicMds) {
    constexpr std::size_t k = 4;
    constexpr std::size_t n = 8;
    auto g = ErasureCodec::generator_matrix(k, n);
    ASSERT_EQ(g.size(), n);

    GFMatrix top(g.begin(), g.begin() + k);
    EXPECT_EQ(top, identity_matrix<GF256>(k));

    for (std::uint32_t mask = 0; mask < (1u << n); ++mask) {
        if (popcount(mask) != static_cast<int>(k)) continue;
        GFMatrix sub;
        for (std::size_t i = 0; i < n; ++i) {
            if (mask & (1u << i)) sub.push_back(g[i]);
        }
        EXPECT_TRUE(invert_matrix<GF256>(sub).has_value()) << "rows mask " << mask;
    }
}

// ============================================================================
// Encoding
// ============================================================================

TEST_F(ErasureCodecTest, EncodeProducesSystematicShards) {
    ErasureCodec codec(RedundancyLevel::personal());
    auto data = to_bytes("hello world!!!!!");  // 16 bytes, k=3 -> 6-byte shards
    auto set = codec.encode(data, "doc-1");

    ASSERT_EQ(set.total_shards(), 5);
    EXPECT_TRUE(set.is_complete());
    EXPECT_EQ(set.metadata()->content_id, "doc-1");
    EXPECT_EQ(set.metadata()->original_size, 16);
    EXPECT_EQ(set.metadata()->content_hash, sha3_256(data));

    bytes_t padded = data;
    padded.resize(18, 0);
    for (std::size_t i = 0; i < 5; ++i) {
        const auto& shard = set[i];
        ASSERT_TRUE(shard.has_value());
        EXPECT_EQ(shard->index, i);
        EXPECT_EQ(shard->data.size(), 6);
        EXPECT_EQ(shard->is_parity(), i >= 3);
        EXPECT_TRUE(shard->checksum_valid());
        if (i < 3) {
            EXPECT_EQ(shard->data, bytes_t(padded.begin() + i * 6, padded.begin() + (i + 1) * 6));
        }
    }
}

TEST_F(ErasureCodecTest, EmptyContentIdIsRandom) {
    ErasureCodec codec(RedundancyLevel::minimal());
    auto a = codec.encode(to_bytes("x"));
    auto b = codec.encode(to_bytes("x"));
    EXPECT_EQ(a.metadata()->content_id.size(), CONTENT_ID_BYTES * 2);
    EXPECT_NE(a.metadata()->content_id, b.metadata()->content_id);
}

TEST_F(ErasureCodecTest, EncodeIsDeterministicPerContent) {
    ErasureCodec codec(RedundancyLevel::federation());
    auto data = random_payload(1000, 7);
    auto a = codec.encode(data, "same");
    auto b = codec.encode(data, "same");
    for (std::size_t i = 0; i < a.total_shards(); ++i) {
        EXPECT_EQ(a[i]->data, b[i]->data);
    }
}

// ============================================================================
// Round Trips
// ============================================================================

TEST_F(ErasureCodecTest, RoundTripSizes) {
    for (auto level : {RedundancyLevel::minimal(), RedundancyLevel::personal(),
                       RedundancyLevel::federation(), RedundancyLevel::paranoid()}) {
        ErasureCodec codec(level);
        for (std::size_t size : {std::size_t{0}, std::size_t{1}, level.data_shards - 1,
                                 level.data_shards, level.data_shards * 10, std::size_t{4097}}) {
            auto data = random_payload(size, static_cast<std::uint32_t>(size));
            auto result = codec.decode(codec.encode(data));
            ASSERT_TRUE(result.success) << level.name << " size " << size << ": "
                                        << result.error_message;
            EXPECT_EQ(*result.data, data);
        }
    }
}

TEST_F(ErasureCodecTest, EmptyPayloadEncodesEmptyChunks) {
    ErasureCodec codec(RedundancyLevel::personal());
    auto set = codec.encode(bytes_t{});
    EXPECT_EQ(set.metadata()->shard_size(), 0);
    for (const auto& shard : set.shards()) {
        ASSERT_TRUE(shard.has_value());
        EXPECT_TRUE(shard->data.empty());
    }

    auto result = codec.decode(keep_only(set, 0b11100));
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.data->empty());
}

TEST_F(ErasureCodecTest, MultiMegabyteRoundTrip) {
    ErasureCodec codec(RedundancyLevel::personal());
    auto data = random_payload(3 * 1024 * 1024 + 17, 99);
    auto set = codec.encode(data);

    // Lose two systematic shards so the parity path runs
    auto result = codec.decode(keep_only(set, 0b11001));
    ASSERT_TRUE(result.success);
    EXPECT_EQ(*result.data, data);
}

TEST_F(ErasureCodecTest, ExtremeParameters) {
    auto data = random_payload(600, 3);
    for (auto [k, n] : std::vector<std::pair<std::size_t, std::size_t>>{
             {1, 2}, {1, 255}, {128, 255}, {254, 255}}) {
        ErasureCodec codec(RedundancyLevel::custom(k, n));
        auto set = codec.encode(data);

        // Drop the first n - k shards, leaving exactly k
        for (std::size_t i = 0; i < n - k; ++i) {
            set.remove(i);
        }
        auto result = codec.decode(set);
        ASSERT_TRUE(result.success) << "k=" << k << " n=" << n << ": " << result.error_message;
        EXPECT_EQ(*result.data, data);
    }
}

// ============================================================================
// k-of-n Recovery
// ============================================================================

TEST_F(ErasureCodecTest, EverySurvivingSubsetAtLeastK) {
    for (auto level : {RedundancyLevel::personal(), RedundancyLevel::federation()}) {
        ErasureCodec codec(level);
        auto data = random_payload(257, 11);
        auto set = codec.encode(data);

        std::uint32_t all = (1u << level.total_shards) - 1;
        for (std::uint32_t mask = 0; mask <= all; ++mask) {
            auto result = codec.decode(keep_only(set, mask));
            if (popcount(mask) >= static_cast<int>(level.data_shards)) {
                ASSERT_TRUE(result.success) << level.name << " mask " << mask;
                EXPECT_EQ(*result.data, data);
            } else {
                EXPECT_FALSE(result.success) << level.name << " mask " << mask;
                EXPECT_FALSE(result.data.has_value());
                EXPECT_EQ(result.error, ErrorCode::INSUFFICIENT_SHARDS);
            }
        }
    }
}

TEST_F(ErasureCodecTest, AllParityRemoved) {
    ErasureCodec codec(RedundancyLevel::paranoid());
    auto data = random_payload(5000, 21);
    auto set = codec.encode(data);
    auto result = codec.decode(keep_only(set, 0x7f));
    ASSERT_TRUE(result.success);
    EXPECT_EQ(*result.data, data);
    EXPECT_EQ(result.used_indices, (std::vector<std::size_t>{0, 1, 2, 3, 4, 5, 6}));
}

TEST_F(ErasureCodecTest, DecodeUsesSetParametersNotCodecs) {
    ErasureCodec minimal(RedundancyLevel::minimal());
    ErasureCodec personal(RedundancyLevel::personal());
    auto data = to_bytes("encoded with one codec, decoded with another");
    auto set = minimal.encode(data);
    set.remove(0);

    auto result = personal.decode(set);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(*result.data, data);
}

// ============================================================================
// Threshold Behaviour
// ============================================================================

TEST_F(ErasureCodecTest, ThreeOfFiveSkipsTwoShards) {
    ErasureCodec codec(RedundancyLevel::custom(3, 5));
    auto set = codec.encode(to_bytes("hello world!!!!!"));
    set.remove(1);
    set.remove(3);

    auto result = codec.decode(set);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(*result.data, to_bytes("hello world!!!!!"));
    EXPECT_EQ(result.used_indices, (std::vector<std::size_t>{0, 2, 4}));
}

TEST_F(ErasureCodecTest, TwoOfThreeSurvivesAnySingleLoss) {
    ErasureCodec codec(RedundancyLevel::minimal());
    auto data = random_payload(100, 5);
    auto set = codec.encode(data);

    for (std::size_t lost = 0; lost < 3; ++lost) {
        auto damaged = set;
        damaged.remove(lost);
        auto result = codec.decode(damaged);
        ASSERT_TRUE(result.success) << "lost " << lost;
        EXPECT_EQ(*result.data, data);
    }
}

TEST_F(ErasureCodecTest, SevenOfFifteenThreshold) {
    ErasureCodec codec(RedundancyLevel::paranoid());
    auto data = random_payload(200, 8);
    auto set = codec.encode(data);

    // Every way of losing 8 of 15 shards still decodes
    int checked = 0;
    for (std::uint32_t mask = 0; mask < (1u << 15); ++mask) {
        if (popcount(mask) != 7) continue;
        auto result = codec.decode(keep_only(set, mask));
        ASSERT_TRUE(result.success) << "mask " << mask;
        ASSERT_EQ(*result.data, data);
        ++checked;
    }
    EXPECT_EQ(checked, 6435);

    // Losing 9 never does
    auto six = keep_only(set, (1u << 0) | (1u << 3) | (1u << 6) | (1u << 9) |
                              (1u << 12) | (1u << 14));
    auto failed = codec.decode(six);
    EXPECT_FALSE(failed.success);
    EXPECT_FALSE(failed.data.has_value());
    EXPECT_EQ(failed.error, ErrorCode::INSUFFICIENT_SHARDS);
    EXPECT_THROW((void)codec.repair(six), InsufficientShardsError);
}

// ============================================================================
// Corruption
// ============================================================================

TEST_F(ErasureCodecTest, FlippedByteIsFlaggedAndExcluded) {
    ErasureCodec codec(RedundancyLevel::personal());
    auto data = random_payload(300, 13);
    auto set = codec.encode(data);

    for (std::size_t i = 0; i < set.total_shards(); ++i) {
        auto damaged = set;
        damaged[i]->data[0] ^= 0x80;

        EXPECT_FALSE(codec.verify_integrity(damaged)) << "shard " << i;

        auto result = codec.decode(damaged);
        ASSERT_TRUE(result.success) << "shard " << i;
        EXPECT_EQ(*result.data, data);
        EXPECT_EQ(result.corrupted_indices, (std::vector<std::size_t>{i}));
    }
    EXPECT_GE(sink_->count(LogLevel::WARN, "storage.codec"), 5);
}

TEST_F(ErasureCodecTest, CorruptionBelowThresholdFails) {
    ErasureCodec codec(RedundancyLevel::personal());
    auto set = codec.encode(random_payload(90, 17));
    set[0]->data[0] ^= 1;
    set[1]->data[0] ^= 1;
    set[2]->data[0] ^= 1;

    auto result = codec.decode(set);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorCode::INSUFFICIENT_SHARDS);
    EXPECT_EQ(result.corrupted_indices.size(), 3);
}

TEST_F(ErasureCodecTest, ForgedChecksumCaughtByContentHash) {
    ErasureCodec codec(RedundancyLevel::personal());
    auto set = codec.encode(random_payload(90, 23));

    // Tampered payload with a matching checksum passes the shard check
    set[1]->data[3] ^= 0x42;
    set[1]->checksum = compute_checksum(set[1]->data);
    EXPECT_TRUE(codec.verify_integrity(set));

    auto result = codec.decode(set);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorCode::CORRUPTION_DETECTED);
    EXPECT_FALSE(result.data.has_value());
}

TEST_F(ErasureCodecTest, WrongSizedShardExcluded) {
    ErasureCodec codec(RedundancyLevel::personal());
    auto data = random_payload(90, 29);
    auto set = codec.encode(data);
    set[0]->data.push_back(0);
    set[0]->checksum = compute_checksum(set[0]->data);

    auto result = codec.decode(set);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(*result.data, data);
    EXPECT_EQ(result.corrupted_indices, (std::vector<std::size_t>{0}));
}

TEST_F(ErasureCodecTest, CanReconstruct) {
    ErasureCodec codec(RedundancyLevel::personal());
    auto set = codec.encode(random_payload(30, 31));
    EXPECT_TRUE(codec.can_reconstruct(set));

    set.remove(0);
    set.remove(1);
    EXPECT_TRUE(codec.can_reconstruct(set));

    set[2]->data[0] ^= 1;
    EXPECT_FALSE(codec.can_reconstruct(set));
}

// ============================================================================
// Repair
// ============================================================================

TEST_F(ErasureCodecTest, RepairRestoresOriginalSet) {
    ErasureCodec codec(RedundancyLevel::federation());
    auto set = codec.encode(random_payload(777, 37));

    auto damaged = set;
    damaged.remove(0);
    damaged.remove(6);
    damaged[3]->data[1] ^= 0xff;

    auto repaired = codec.repair(damaged);
    EXPECT_TRUE(repaired.is_complete());
    EXPECT_TRUE(codec.verify_integrity(repaired));
    EXPECT_EQ(repaired, set);
}

TEST_F(ErasureCodecTest, RepairIsIdempotent) {
    ErasureCodec codec(RedundancyLevel::personal());
    auto set = codec.encode(random_payload(500, 41));
    set.remove(2);
    set.remove(4);

    auto first = codec.repair(set);
    auto second = codec.repair(set);
    EXPECT_EQ(first, second);
    EXPECT_EQ(codec.repair(first), first);
}

TEST_F(ErasureCodecTest, RepairRejectsUndetectedTampering) {
    ErasureCodec codec(RedundancyLevel::personal());
    auto set = codec.encode(random_payload(60, 43));
    set[0]->data[0] ^= 1;
    set[0]->checksum = compute_checksum(set[0]->data);

    EXPECT_THROW((void)codec.repair(set), CorruptionDetectedError);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(ErasureCodecTest, SharedCodecAcrossThreads) {
    ErasureCodec codec(RedundancyLevel::federation());
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    for (std::uint32_t t = 0; t < 4; ++t) {
        threads.emplace_back([&, t]() {
            for (std::uint32_t i = 0; i < 20; ++i) {
                auto data = random_payload(100 + i, t * 100 + i);
                auto set = codec.encode(data);
                set.remove(i % 9);
                set.remove((i + 3) % 9);
                auto result = codec.decode(set);
                if (!result.success || *result.data != data) {
                    failures++;
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(failures.load(), 0);
}

}  // namespace
}  // namespace shardkeep
