#include <gtest/gtest.h>
#include "storage/memory_backend.hh"
#include "storage/local_file_backend.hh"
#include "storage/erasure.hh"
#include "crypto/hash.hh"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>

namespace shardkeep {
namespace {

namespace fs = std::filesystem;

ShardSet encode_payload(std::size_t size, const std::string& content_id,
                        RedundancyLevel level = RedundancyLevel::personal()) {
    bytes_t data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::uint8_t>(i * 31 + 7);
    }
    return ErasureCodec(level).encode(data, content_id);
}

// ============================================================================
// Locator Tests
// ============================================================================

TEST(ShardLocatorTest, Format) {
    EXPECT_EQ(shard_locator("abc", 0), "abc/shard_000");
    EXPECT_EQ(shard_locator("abc", 7), "abc/shard_007");
    EXPECT_EQ(shard_locator("abc", 12), "abc/shard_012");
    EXPECT_EQ(shard_locator("abc", 254), "abc/shard_254");
}

TEST(ShardLocatorTest, RejectsUnsafeContentIds) {
    EXPECT_FALSE(valid_content_id(""));
    EXPECT_FALSE(valid_content_id("."));
    EXPECT_FALSE(valid_content_id(".."));
    EXPECT_FALSE(valid_content_id("a/b"));
    EXPECT_FALSE(valid_content_id("a\\b"));
    EXPECT_FALSE(valid_content_id("x..y"));
    EXPECT_FALSE(valid_content_id(std::string("a\0b", 3)));
    EXPECT_TRUE(valid_content_id("backup-2024.tar"));

    EXPECT_THROW((void)shard_locator("../etc", 0), StorageError);
}

TEST(ShardLocatorTest, Parse) {
    auto parsed = parse_shard_locator("abc/shard_012");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->first, "abc");
    EXPECT_EQ(parsed->second, 12);

    EXPECT_FALSE(parse_shard_locator("abc").has_value());
    EXPECT_FALSE(parse_shard_locator("abc/part_000").has_value());
    EXPECT_FALSE(parse_shard_locator("abc/shard_").has_value());
    EXPECT_FALSE(parse_shard_locator("abc/shard_1x2").has_value());
    EXPECT_FALSE(parse_shard_locator("abc/shard_0001").has_value());
    EXPECT_FALSE(parse_shard_locator("abc/shard_255").has_value());
    EXPECT_FALSE(parse_shard_locator("../shard_000").has_value());
}

TEST(BackendKindTest, Names) {
    EXPECT_EQ(backend_kind_string(BackendKind::MEMORY), "memory");
    EXPECT_EQ(backend_kind_string(BackendKind::LOCAL_FILE), "local_file");
}

// ============================================================================
// Memory Backend Tests
// ============================================================================

TEST(MemoryBackendTest, StoreRetrieve) {
    MemoryBackend backend("mem");
    auto set = encode_payload(100, "doc");

    auto location = backend.store_shard(*set[2]);
    EXPECT_EQ(location.backend_id, "mem");
    EXPECT_EQ(location.locator, "doc/shard_002");
    EXPECT_TRUE(backend.shard_exists(location));

    auto shard = backend.retrieve_shard(location);
    EXPECT_EQ(shard.index, 2);
    EXPECT_EQ(shard.data, set[2]->data);
    EXPECT_TRUE(shard.checksum_valid());
}

TEST(MemoryBackendTest, MissingShard) {
    MemoryBackend backend;
    StorageLocation location{"memory", "doc/shard_000"};
    EXPECT_FALSE(backend.shard_exists(location));
    EXPECT_THROW((void)backend.retrieve_shard(location), NotFoundError);
    EXPECT_FALSE(backend.delete_shard(location));
}

TEST(MemoryBackendTest, ForeignLocationRejected) {
    MemoryBackend backend("mem");
    StorageLocation location{"other", "doc/shard_000"};
    EXPECT_FALSE(backend.shard_exists(location));
    EXPECT_THROW((void)backend.retrieve_shard(location), StorageError);
}

TEST(MemoryBackendTest, OverwriteKeepsAccounting) {
    MemoryBackend backend;
    auto small = encode_payload(30, "doc");
    auto large = encode_payload(300, "doc");

    (void)backend.store_shard(*small[0]);
    (void)backend.store_shard(*large[0]);

    auto stats = backend.get_stats();
    EXPECT_EQ(stats.total_shards, 1);
    EXPECT_EQ(stats.total_bytes, large[0]->data.size());
    EXPECT_FALSE(stats.quota_bytes.has_value());
}

TEST(MemoryBackendTest, DeleteAndList) {
    MemoryBackend backend;
    auto a = encode_payload(60, "alpha");
    auto b = encode_payload(60, "beta");
    for (const auto& shard : a.shards()) (void)backend.store_shard(*shard);
    for (const auto& shard : b.shards()) (void)backend.store_shard(*shard);

    EXPECT_EQ(backend.list_shards().size(), 10);
    auto alpha = backend.list_shards("alpha/");
    ASSERT_EQ(alpha.size(), 5);
    EXPECT_EQ(alpha[0].locator, "alpha/shard_000");
    EXPECT_EQ(alpha[4].locator, "alpha/shard_004");

    EXPECT_TRUE(backend.delete_shard(alpha[0]));
    EXPECT_EQ(backend.list_shards("alpha/").size(), 4);
    EXPECT_EQ(backend.get_stats().total_shards, 9);
}

TEST(MemoryBackendTest, TamperDetectedOnRetrieve) {
    MemoryBackend backend;
    auto set = encode_payload(60, "doc");
    auto location = backend.store_shard(*set[1]);

    auto altered = set[1]->data;
    altered[0] ^= 1;
    ASSERT_TRUE(backend.tamper(location, altered));
    EXPECT_THROW((void)backend.retrieve_shard(location), CorruptionDetectedError);
}

TEST(MemoryBackendTest, TamperRejectsForeignLocation) {
    MemoryBackend backend("mem");
    auto set = encode_payload(60, "doc");
    auto location = backend.store_shard(*set[1]);

    StorageLocation foreign{"other", location.locator};
    EXPECT_THROW((void)backend.tamper(foreign, {1, 2, 3}), StorageError);
    EXPECT_EQ(backend.retrieve_shard(location).data, set[1]->data);
}

TEST(MemoryBackendTest, ShardWithoutMetadataRejected) {
    MemoryBackend backend;
    StorageShard shard;
    shard.data = {1, 2, 3};
    EXPECT_THROW((void)backend.store_shard(shard), StorageError);
}

// ============================================================================
// Local File Backend Tests
// ============================================================================

class LocalFileBackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("shardkeep_backend_" + random_content_id());
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    LocalFileBackendConfig config(std::optional<std::uint64_t> quota = std::nullopt) const {
        LocalFileBackendConfig cfg;
        cfg.backend_id = "disk";
        cfg.base_dir = dir_;
        cfg.quota_bytes = quota;
        return cfg;
    }

    fs::path dir_;
};

TEST_F(LocalFileBackendTest, CreatesBaseDir) {
    LocalFileBackend backend(config());
    EXPECT_TRUE(fs::is_directory(dir_));
    EXPECT_TRUE(backend.health_check());
    EXPECT_EQ(backend.kind(), BackendKind::LOCAL_FILE);
}

TEST_F(LocalFileBackendTest, UnusableBaseDir) {
    fs::create_directories(dir_);
    std::ofstream(dir_ / "file") << "not a directory";

    auto cfg = config();
    cfg.base_dir = dir_ / "file";
    EXPECT_THROW(LocalFileBackend{cfg}, StorageError);
}

TEST_F(LocalFileBackendTest, StoreWritesShardFile) {
    LocalFileBackend backend(config());
    auto set = encode_payload(100, "doc");

    auto location = backend.store_shard(*set[3]);
    EXPECT_EQ(location.locator, "doc/shard_003");
    EXPECT_TRUE(fs::is_regular_file(dir_ / "doc" / "shard_003.bin"));
    EXPECT_TRUE(backend.shard_exists(location));

    auto shard = backend.retrieve_shard(location);
    EXPECT_EQ(shard.index, 3);
    EXPECT_EQ(shard.data, set[3]->data);
    EXPECT_EQ(*shard.metadata, *set.metadata());
}

TEST_F(LocalFileBackendTest, MissingShard) {
    LocalFileBackend backend(config());
    StorageLocation location{"disk", "doc/shard_000"};
    EXPECT_FALSE(backend.shard_exists(location));
    EXPECT_THROW((void)backend.retrieve_shard(location), NotFoundError);
    EXPECT_FALSE(backend.delete_shard(location));
}

TEST_F(LocalFileBackendTest, MalformedLocatorRejected) {
    LocalFileBackend backend(config());
    StorageLocation location{"disk", "../escape/shard_000"};
    EXPECT_FALSE(backend.shard_exists(location));
    EXPECT_THROW((void)backend.retrieve_shard(location), StorageError);
}

TEST_F(LocalFileBackendTest, InvalidContentIdRejected) {
    LocalFileBackend backend(config());
    auto set = encode_payload(10, "doc");
    auto shard = *set[0];
    auto meta = std::make_shared<ShardMetadata>(*shard.metadata);
    meta->content_id = "../outside";
    shard.metadata = meta;

    EXPECT_THROW((void)backend.store_shard(shard), StorageError);
    EXPECT_FALSE(fs::exists(dir_.parent_path() / "outside"));
}

TEST_F(LocalFileBackendTest, QuotaAllowsExactFit) {
    auto set = encode_payload(90, "doc");  // 30-byte shards
    LocalFileBackend backend(config(60));

    (void)backend.store_shard(*set[0]);
    (void)backend.store_shard(*set[1]);
    EXPECT_EQ(backend.get_stats().total_bytes, 60);

    EXPECT_THROW((void)backend.store_shard(*set[2]), QuotaExceededError);
    EXPECT_FALSE(fs::exists(dir_ / "doc" / "shard_002.bin"));
    EXPECT_EQ(backend.get_stats().total_bytes, 60);
}

TEST_F(LocalFileBackendTest, OverwriteCountsOnce) {
    auto set = encode_payload(90, "doc");
    LocalFileBackend backend(config(60));

    (void)backend.store_shard(*set[0]);
    (void)backend.store_shard(*set[1]);
    EXPECT_NO_THROW((void)backend.store_shard(*set[1]));

    auto stats = backend.get_stats();
    EXPECT_EQ(stats.total_shards, 2);
    EXPECT_EQ(stats.total_bytes, 60);
    ASSERT_TRUE(stats.quota_used_ratio.has_value());
    EXPECT_DOUBLE_EQ(*stats.quota_used_ratio, 1.0);
}

TEST_F(LocalFileBackendTest, DeleteFreesQuota) {
    auto set = encode_payload(90, "doc");
    LocalFileBackend backend(config(30));

    auto location = backend.store_shard(*set[0]);
    EXPECT_THROW((void)backend.store_shard(*set[1]), QuotaExceededError);

    EXPECT_TRUE(backend.delete_shard(location));
    EXPECT_FALSE(fs::exists(dir_ / "doc" / "shard_000.bin"));
    EXPECT_NO_THROW((void)backend.store_shard(*set[1]));
}

TEST_F(LocalFileBackendTest, CorruptedFileDetected) {
    LocalFileBackend backend(config());
    auto set = encode_payload(100, "doc");
    auto location = backend.store_shard(*set[0]);

    auto path = dir_ / "doc" / "shard_000.bin";
    {
        std::fstream file(path, std::ios::in | std::ios::out | std::ios::binary);
        char last = 0;
        file.seekg(-1, std::ios::end);
        file.get(last);
        file.seekp(-1, std::ios::end);
        file.put(static_cast<char>(last ^ 0x01));
    }
    EXPECT_THROW((void)backend.retrieve_shard(location), CorruptionDetectedError);

    std::ofstream(path, std::ios::binary | std::ios::trunc) << "garbage";
    EXPECT_THROW((void)backend.retrieve_shard(location), CorruptionDetectedError);
}

TEST_F(LocalFileBackendTest, SwappedFileDetected) {
    LocalFileBackend backend(config());
    auto set = encode_payload(100, "doc");
    auto loc0 = backend.store_shard(*set[0]);
    (void)backend.store_shard(*set[1]);

    fs::copy_file(dir_ / "doc" / "shard_001.bin", dir_ / "doc" / "shard_000.bin",
                  fs::copy_options::overwrite_existing);
    EXPECT_THROW((void)backend.retrieve_shard(loc0), CorruptionDetectedError);
}

TEST_F(LocalFileBackendTest, ListIgnoresTempAndStrayFiles) {
    LocalFileBackend backend(config());
    auto a = encode_payload(60, "alpha");
    auto b = encode_payload(60, "beta");
    for (const auto& shard : a.shards()) (void)backend.store_shard(*shard);
    (void)backend.store_shard(*b[4]);

    std::ofstream(dir_ / "alpha" / "shard_000.bin.tmp.1234.0") << "partial";
    std::ofstream(dir_ / "alpha" / "notes.txt") << "stray";
    std::ofstream(dir_ / "top.bin") << "stray";

    auto all = backend.list_shards();
    ASSERT_EQ(all.size(), 6);
    EXPECT_EQ(all.front().locator, "alpha/shard_000");
    EXPECT_EQ(all.back().locator, "beta/shard_004");

    auto beta = backend.list_shards("beta/");
    ASSERT_EQ(beta.size(), 1);
    EXPECT_EQ(beta[0].backend_id, "disk");
}

TEST_F(LocalFileBackendTest, RestartRebuildsUsage) {
    auto set = encode_payload(90, "doc");
    {
        LocalFileBackend backend(config(100));
        (void)backend.store_shard(*set[0]);
        (void)backend.store_shard(*set[4]);
    }

    LocalFileBackend reopened(config(100));
    auto stats = reopened.get_stats();
    EXPECT_EQ(stats.total_shards, 2);
    EXPECT_EQ(stats.total_bytes, 60);
    EXPECT_NO_THROW((void)reopened.store_shard(*set[1]));
    EXPECT_EQ(reopened.get_stats().total_bytes, 90);
    EXPECT_THROW((void)reopened.store_shard(*set[2]), QuotaExceededError);

    auto shard = reopened.retrieve_shard({"disk", "doc/shard_004"});
    EXPECT_EQ(shard.data, set[4]->data);
}

TEST_F(LocalFileBackendTest, ConcurrentStoresRespectQuota) {
    auto set = encode_payload(7 * 40, "doc", RedundancyLevel::paranoid());  // 40-byte shards
    LocalFileBackend backend(config(200));

    std::atomic<int> stored{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < set.total_shards(); ++i) {
        threads.emplace_back([&, i]() {
            try {
                (void)backend.store_shard(*set[i]);
                stored++;
            } catch (const QuotaExceededError&) {
                rejected++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(stored.load(), 5);
    EXPECT_EQ(rejected.load(), 10);
    EXPECT_EQ(backend.get_stats().total_bytes, 200);
    EXPECT_EQ(backend.list_shards().size(), 5);
}

}  // namespace
}  // namespace shardkeep
