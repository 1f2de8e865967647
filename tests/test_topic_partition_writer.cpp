#include <gtest/gtest.h>
#include "../src/sink/topic_partition_writer.hpp"
#include "../src/sink/bytearray_format.hpp"
#include "../src/sink/partitioner.hpp"
#include "../src/sink/s3_storage.hpp"
#include "../src/sink/sink_errors.hpp"
#include "../src/config.hpp"
#include "fake_s3_client.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <thread>

using std::chrono::milliseconds;
using std::chrono::system_clock;

class TopicPartitionWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_ = std::make_shared<FakeS3Client>("test-bucket");
        init({});
    }

    // Rebuild config, storage and provider with extra properties
    void init(const std::map<std::string, std::string>& extra) {
        std::map<std::string, std::string> props = {
            {"s3.bucket.name", "test-bucket"},
            {"flush.size", "3"},
        };
        for (const auto& kv : extra) {
            props[kv.first] = kv.second;
        }
        provider_.reset();
        storage_.reset();
        config_ = SinkConfig::fromMap(props);
        storage_ = std::make_unique<S3Storage>(config_, "", client_);
        provider_ = std::make_unique<ByteArrayRecordWriterProvider>(*storage_, config_);
        partitioner_.configure(config_.props);
    }

    SinkRecord makeRecord(int64_t offset, int64_t timestamp_ms = 0) {
        SinkRecord record;
        record.topic = "events";
        record.kafka_partition = 0;
        record.kafka_offset = offset;
        record.timestamp = system_clock::time_point(milliseconds(timestamp_ms));
        record.value = "v" + std::to_string(offset);
        return record;
    }

    std::shared_ptr<FakeS3Client> client_;
    SinkConfig config_;
    std::unique_ptr<S3Storage> storage_;
    std::unique_ptr<ByteArrayRecordWriterProvider> provider_;
    DefaultPartitioner partitioner_;
    TopicPartition tp_{"events", 0};
};

TEST_F(TopicPartitionWriterTest, InitialState) {
    TopicPartitionWriter writer(tp_, *storage_, *provider_, partitioner_, config_);

    EXPECT_EQ(writer.getTopicPartition(), tp_);
    EXPECT_EQ(writer.getBufferedRecordCount(), 0u);
    EXPECT_EQ(writer.getOffsetToCommit(), -1);
    EXPECT_EQ(writer.getCommittedFileCount(), 0u);
}

TEST_F(TopicPartitionWriterTest, CommitKeyLayout) {
    TopicPartitionWriter writer(tp_, *storage_, *provider_, partitioner_, config_);

    EXPECT_EQ(writer.getCommitKey("partition=0", 42), "topics/events/partition=0/events+0+0000000042.bin");
}

TEST_F(TopicPartitionWriterTest, CommitKeyHonoursLayoutSettings) {
    init({{"topics.dir", "raw"}, {"file.delim", "_"}, {"filename.offset.zero.pad.width", "4"}});
    TopicPartitionWriter writer(tp_, *storage_, *provider_, partitioner_, config_);

    EXPECT_EQ(writer.getCommitKey("partition=0", 7), "raw/events/partition=0/events_0_0007.bin");
}

// Buffering alone never touches the store
TEST_F(TopicPartitionWriterTest, BufferDoesNoIo) {
    TopicPartitionWriter writer(tp_, *storage_, *provider_, partitioner_, config_);
    writer.buffer(makeRecord(0));
    writer.buffer(makeRecord(1));

    EXPECT_EQ(writer.getBufferedRecordCount(), 2u);
    EXPECT_EQ(client_->totalCalls(), 0u);
}

TEST_F(TopicPartitionWriterTest, WriteBelowFlushSizeKeepsBuffer) {
    TopicPartitionWriter writer(tp_, *storage_, *provider_, partitioner_, config_);
    writer.buffer(makeRecord(0));
    writer.buffer(makeRecord(1));
    writer.write();

    EXPECT_EQ(writer.getBufferedRecordCount(), 2u);
    EXPECT_EQ(client_->getObjectCount(), 0u);
}

// Records land in buffer order, flush.size per object
TEST_F(TopicPartitionWriterTest, WriteRotatesByFlushSize) {
    TopicPartitionWriter writer(tp_, *storage_, *provider_, partitioner_, config_);
    for (int64_t offset = 0; offset < 7; ++offset) {
        writer.buffer(makeRecord(offset));
    }
    writer.write();

    EXPECT_EQ(writer.getCommittedFileCount(), 2u);
    EXPECT_EQ(writer.getBufferedRecordCount(), 1u);
    EXPECT_EQ(writer.getOffsetToCommit(), 6);
    EXPECT_EQ(client_->getObject("test-bucket", "topics/events/partition=0/events+0+0000000000.bin"),
              "v0\nv1\nv2\n");
    EXPECT_EQ(client_->getObject("test-bucket", "topics/events/partition=0/events+0+0000000003.bin"),
              "v3\nv4\nv5\n");
    EXPECT_EQ(writer.getLastCommittedKey(), "topics/events/partition=0/events+0+0000000003.bin");
}

TEST_F(TopicPartitionWriterTest, ForceWriteCommitsRemainder) {
    TopicPartitionWriter writer(tp_, *storage_, *provider_, partitioner_, config_);
    writer.buffer(makeRecord(10));
    writer.buffer(makeRecord(11));
    writer.forceWrite();

    EXPECT_EQ(writer.getBufferedRecordCount(), 0u);
    EXPECT_EQ(writer.getOffsetToCommit(), 12);
    EXPECT_EQ(client_->getObject("test-bucket", "topics/events/partition=0/events+0+0000000010.bin"),
              "v10\nv11\n");
}

// Records spanning rotate.interval.ms are split at the interval boundary
TEST_F(TopicPartitionWriterTest, WriteRotatesByRecordInterval) {
    init({{"flush.size", "100"}, {"rotate.interval.ms", "1000"}});
    TopicPartitionWriter writer(tp_, *storage_, *provider_, partitioner_, config_);
    writer.buffer(makeRecord(0, 0));
    writer.buffer(makeRecord(1, 500));
    writer.buffer(makeRecord(2, 1200));
    writer.write();

    EXPECT_EQ(writer.getCommittedFileCount(), 1u);
    EXPECT_EQ(writer.getBufferedRecordCount(), 1u);
    EXPECT_EQ(writer.getOffsetToCommit(), 2);
    EXPECT_EQ(client_->getObject("test-bucket", "topics/events/partition=0/events+0+0000000000.bin"),
              "v0\nv1\n");
}

TEST_F(TopicPartitionWriterTest, WriteRotatesBySchedule) {
    init({{"flush.size", "100"}, {"rotate.schedule.interval.ms", "30"}});
    TopicPartitionWriter writer(tp_, *storage_, *provider_, partitioner_, config_);
    writer.buffer(makeRecord(0));
    writer.write();
    EXPECT_EQ(writer.getCommittedFileCount(), 0u);

    std::this_thread::sleep_for(milliseconds(50));
    writer.write();

    EXPECT_EQ(writer.getCommittedFileCount(), 1u);
    EXPECT_EQ(writer.getBufferedRecordCount(), 0u);
}

// One object never mixes encoded partitions
TEST_F(TopicPartitionWriterTest, ChunkStopsAtEncodedPartitionChange) {
    init({{"flush.size", "2"}});
    HourlyPartitioner hourly;
    hourly.configure(config_.props);
    TopicPartitionWriter writer(tp_, *storage_, *provider_, hourly, config_);

    const int64_t hour = 3600 * 1000;
    writer.buffer(makeRecord(0, 0));
    writer.buffer(makeRecord(1, hour));
    writer.buffer(makeRecord(2, hour + 1));
    writer.write();

    EXPECT_EQ(client_->getObject("test-bucket",
                                 "topics/events/year=1970/month=01/day=01/hour=00/events+0+0000000000.bin"),
              "v0\n");
    EXPECT_EQ(client_->getObject("test-bucket",
                                 "topics/events/year=1970/month=01/day=01/hour=01/events+0+0000000001.bin"),
              "v1\nv2\n");
    EXPECT_EQ(writer.getBufferedRecordCount(), 0u);
}

// A failed commit keeps the records so the write can be retried
TEST_F(TopicPartitionWriterTest, FailedCommitKeepsBuffer) {
    TopicPartitionWriter writer(tp_, *storage_, *provider_, partitioner_, config_);
    for (int64_t offset = 0; offset < 3; ++offset) {
        writer.buffer(makeRecord(offset));
    }

    client_->fail_key_substring = "events+0+0000000000";
    EXPECT_THROW(writer.write(), StorageException);
    EXPECT_EQ(writer.getBufferedRecordCount(), 3u);
    EXPECT_EQ(writer.getOffsetToCommit(), -1);
    EXPECT_EQ(client_->getObjectCount(), 0u);

    client_->fail_key_substring.clear();
    writer.write();
    EXPECT_EQ(writer.getBufferedRecordCount(), 0u);
    EXPECT_EQ(writer.getOffsetToCommit(), 3);
}

TEST_F(TopicPartitionWriterTest, CloseFlushesEverything) {
    TopicPartitionWriter writer(tp_, *storage_, *provider_, partitioner_, config_);
    writer.buffer(makeRecord(0));
    writer.close();

    EXPECT_EQ(writer.getBufferedRecordCount(), 0u);
    EXPECT_TRUE(client_->hasObject("test-bucket", "topics/events/partition=0/events+0+0000000000.bin"));
}

TEST_F(TopicPartitionWriterTest, FailedCloseClearsBufferAndThrows) {
    TopicPartitionWriter writer(tp_, *storage_, *provider_, partitioner_, config_);
    writer.buffer(makeRecord(0));
    client_->fail_key_substring = "events+0+";

    EXPECT_THROW(writer.close(), SinkException);
    EXPECT_EQ(writer.getBufferedRecordCount(), 0u);
    EXPECT_EQ(client_->getObjectCount(), 0u);
}
