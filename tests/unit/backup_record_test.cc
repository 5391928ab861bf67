#include <gtest/gtest.h>
#include "storage/backup_record.hh"
#include "storage/erasure.hh"
#include "storage/integrity.hh"
#include "storage/memory_backend.hh"

namespace shardkeep {
namespace {

class BackupRecordTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* id : {"east", "west", "north"}) {
            auto backend = std::make_shared<MemoryBackend>(id);
            backends_.push_back(backend);
            registry_.register_backend(backend);
        }
        data_ = to_bytes("beliefs exported at the end of the week, serialized and encrypted");
        set_ = codec_.encode(data_, "backup-1");
    }

    ErasureCodec codec_{RedundancyLevel::personal()};
    BackendRegistry registry_;
    std::vector<std::shared_ptr<MemoryBackend>> backends_;
    bytes_t data_;
    ShardSet set_;
};

TEST(BackupStatusTest, Names) {
    EXPECT_EQ(backup_status_string(BackupStatus::IN_PROGRESS), "in_progress");
    EXPECT_EQ(backup_status_string(BackupStatus::VERIFIED), "verified");
    EXPECT_EQ(parse_backup_status("corrupted"), BackupStatus::CORRUPTED);
    EXPECT_EQ(parse_backup_status("completed"), BackupStatus::COMPLETED);
    EXPECT_FALSE(parse_backup_status("done").has_value());
}

TEST_F(BackupRecordTest, CompletedRecord) {
    auto distribution = registry_.distribute_shard_set(set_);
    auto record = make_backup_record(set_, distribution, codec_.redundancy(), 42, true);

    EXPECT_EQ(record.status, BackupStatus::COMPLETED);
    EXPECT_TRUE(record.error_message.empty());
    EXPECT_EQ(record.content_id, "backup-1");
    EXPECT_EQ(record.belief_count, 42);
    EXPECT_TRUE(record.encrypted);
    EXPECT_EQ(record.redundancy_level, "personal");
    EXPECT_EQ(record.data_shards, 3);
    EXPECT_EQ(record.shard_count, 5);
    EXPECT_EQ(record.total_size_bytes, data_.size());
    EXPECT_EQ(record.content_hash, bytes_to_hex(set_.metadata()->content_hash));

    ASSERT_EQ(record.shards.size(), 5);
    EXPECT_FALSE(record.shards[2].is_parity);
    EXPECT_TRUE(record.shards[3].is_parity);
    EXPECT_EQ(record.shards[1].backend_id, "west");
    EXPECT_EQ(record.shards[1].location, "backup-1/shard_001");
    EXPECT_EQ(record.shards[1].checksum, bytes_to_hex(set_[1]->checksum));
    EXPECT_EQ(record.locations(), distribution.locations());
}

TEST_F(BackupRecordTest, DegradedRecord) {
    set_.remove(4);
    auto record = make_backup_record(set_, registry_.distribute_shard_set(set_),
                                     codec_.redundancy(), 1, false);
    EXPECT_EQ(record.status, BackupStatus::COMPLETED);
    EXPECT_EQ(record.error_message, "Degraded: 4 of 5 shards stored");
}

TEST_F(BackupRecordTest, FailedRecord) {
    set_.remove(0);
    set_.remove(1);
    set_.remove(2);
    auto record = make_backup_record(set_, registry_.distribute_shard_set(set_),
                                     codec_.redundancy(), 1, false);
    EXPECT_EQ(record.status, BackupStatus::FAILED);
    EXPECT_EQ(record.shards.size(), 2);
    EXPECT_FALSE(record.error_message.empty());
}

TEST_F(BackupRecordTest, TemplateRestoresMetadata) {
    auto record = make_backup_record(set_, registry_.distribute_shard_set(set_),
                                     codec_.redundancy(), 1, false);
    auto shard_template = record.make_template();

    EXPECT_EQ(shard_template.present_count(), 0);
    ASSERT_NE(shard_template.metadata(), nullptr);
    EXPECT_EQ(*shard_template.metadata(), *set_.metadata());
}

TEST_F(BackupRecordTest, MalformedTemplateRejected) {
    auto record = make_backup_record(set_, registry_.distribute_shard_set(set_),
                                     codec_.redundancy(), 1, false);

    auto bad_hash = record;
    bad_hash.content_hash = "not hex";
    EXPECT_THROW((void)bad_hash.make_template(), StorageError);

    auto bad_counts = record;
    bad_counts.data_shards = 5;
    EXPECT_THROW((void)bad_counts.make_template(), StorageError);
}

TEST_F(BackupRecordTest, RestoreFromRecordAfterLoss) {
    auto record = make_backup_record(set_, registry_.distribute_shard_set(set_),
                                     codec_.redundancy(), 7, false);

    // "west" holds shards 1 and 4
    ASSERT_TRUE(registry_.unregister_backend("west"));

    auto fetched = registry_.retrieve_distributed(record.locations(), record.make_template());
    IntegrityVerifier verifier;
    auto report = verifier.verify_shard_set(fetched);
    EXPECT_TRUE(report.can_recover);
    EXPECT_EQ(status_after_verification(report), BackupStatus::CORRUPTED);

    auto repaired = codec_.repair(fetched);
    EXPECT_EQ(status_after_verification(verifier.verify_shard_set(repaired)),
              BackupStatus::VERIFIED);
    EXPECT_EQ(repaired, set_);

    auto result = codec_.decode(repaired);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(*result.data, data_);
}

}  // namespace
}  // namespace shardkeep
