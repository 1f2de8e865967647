#ifndef QUEUE_CONSUMER_HPP
#define QUEUE_CONSUMER_HPP

#include "../config.hpp"
#include "../sink/s3_sink_task.hpp"
#include "../sink/sink_record.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <cppkafka/cppkafka.h>

// Counters published for the health server. Written by the polling thread only.
struct ConsumerStats {
    std::atomic<uint64_t> records_consumed{0};
    std::atomic<uint64_t> batches_consumed{0};
    std::atomic<uint64_t> offset_commits{0};
    std::atomic<uint64_t> flush_retries{0};
    std::atomic<uint64_t> buffered_records{0};
    std::atomic<uint64_t> assigned_partitions{0};
    std::atomic<int64_t> last_commit_epoch_ms{0};
};

// Drives an S3SinkTask from a Kafka consumer group. Assignment maps to
// open(), revocation to a forced flush, offset commit and close(). Offsets
// are committed only for records already visible in the object store.
class QueueConsumer {
public:
    QueueConsumer(const SinkConfig& config,
                  S3SinkTask& task,
                  std::atomic<bool>& running,
                  std::atomic<bool>& force_flush);
    ~QueueConsumer();

    // Create the consumer and subscribe (must be called before start)
    bool initialize();

    // Poll until running is cleared. Throws SinkException when the task
    // fails in a way retries cannot fix.
    void start();

    // Unsubscribe, which revokes and closes every writer
    void stop();

    const ConsumerStats& getStats() const { return stats_; }

    // Convert a consumed message into a sink record
    static SinkRecord toSinkRecord(const cppkafka::Message& msg);

    // Exponential backoff with jitter, capped at max_backoff_ms
    static std::chrono::milliseconds calculateBackoff(int attempt, int base_backoff_ms, int max_backoff_ms);

private:
    SinkConfig config_;
    S3SinkTask& task_;
    std::atomic<bool>& running_;
    std::atomic<bool>& force_flush_;

    std::unique_ptr<cppkafka::Consumer> consumer_;
    std::unique_ptr<cppkafka::Configuration> kafka_config_;
    ConsumerStats stats_;

    // Last offset committed to Kafka per partition
    std::map<TopicPartition, int64_t> committed_offsets_;

    // Set by rebalance callbacks, which must not throw into librdkafka
    bool fatal_error_;
    std::string fatal_message_;

    void onPartitionsAssigned(const cppkafka::TopicPartitionList& partitions);
    void onPartitionsRevoked(const cppkafka::TopicPartitionList& partitions);

    // Run flushAll (or forceFlushAll) with retry and backoff
    void flushWithRetry(bool force);

    // Commit preCommit() offsets that moved since the last commit
    void commitOffsets();

    void publishStats();

    static std::vector<TopicPartition> toTopicPartitions(const cppkafka::TopicPartitionList& partitions);
};

#endif // QUEUE_CONSUMER_HPP
