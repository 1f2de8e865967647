#ifndef TOPIC_PARTITION_WRITER_HPP
#define TOPIC_PARTITION_WRITER_HPP

#include "../config.hpp"
#include "partitioner.hpp"
#include "record_writer.hpp"
#include "rotation_policy.hpp"
#include "s3_storage.hpp"
#include "sink_record.hpp"
#include <cstdint>
#include <deque>
#include <string>

// Buffers the records of a single input partition and commits them as
// objects when the rotation policy says so. Records leave the buffer only
// after the object holding them has been committed, so a failed write can
// be retried by calling write() again.
class TopicPartitionWriter {
public:
    TopicPartitionWriter(const TopicPartition& tp,
                         S3Storage& storage,
                         RecordWriterProvider& writer_provider,
                         Partitioner& partitioner,
                         const SinkConfig& config);

    TopicPartitionWriter(const TopicPartitionWriter&) = delete;
    TopicPartitionWriter& operator=(const TopicPartitionWriter&) = delete;

    // Append to the FIFO buffer. No I/O.
    void buffer(const SinkRecord& record);

    // Commit objects while a rotation trigger holds
    void write();

    // Commit everything buffered regardless of policy
    void forceWrite();

    // Final flush. The buffer is empty afterwards even if the flush failed.
    void close();

    // Object key for a chunk starting with the given record
    std::string getCommitKey(const std::string& encoded_partition, int64_t start_offset) const;

    size_t getBufferedRecordCount() const { return buffer_.size(); }
    // Next offset to consume, or -1 if nothing has been committed yet
    int64_t getOffsetToCommit() const { return offset_to_commit_; }
    size_t getCommittedFileCount() const { return committed_files_; }
    const std::string& getLastCommittedKey() const { return last_committed_key_; }
    const TopicPartition& getTopicPartition() const { return tp_; }

private:
    TopicPartition tp_;
    S3Storage& storage_;
    RecordWriterProvider& writer_provider_;
    Partitioner& partitioner_;
    const SinkConfig& config_;
    RotationPolicy rotation_;
    std::string log_prefix_;

    std::deque<SinkRecord> buffer_;
    int64_t offset_to_commit_;
    size_t committed_files_;
    std::string last_committed_key_;

    // True if the size or record-time trigger holds for the buffer head
    bool shouldRotate() const;

    // Number of leading records that may share one object
    size_t nextChunkSize() const;

    // Write and commit the next chunk, then drop it from the buffer
    void commitFile();
};

#endif // TOPIC_PARTITION_WRITER_HPP
