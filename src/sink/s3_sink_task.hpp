#ifndef S3_SINK_TASK_HPP
#define S3_SINK_TASK_HPP

#include "../config.hpp"
#include "component_registry.hpp"
#include "partitioner.hpp"
#include "record_writer.hpp"
#include "s3_client.hpp"
#include "s3_storage.hpp"
#include "sink_record.hpp"
#include "topic_partition_writer.hpp"
#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

// Owns one TopicPartitionWriter per assigned partition and drives them in
// response to assignment changes and record batches. Not re-entrant; the
// host calls open/put/close from a single thread.
class S3SinkTask {
public:
    S3SinkTask();
    ~S3SinkTask();

    S3SinkTask(const S3SinkTask&) = delete;
    S3SinkTask& operator=(const S3SinkTask&) = delete;

    // Parse the settings, connect to the object store and resolve the
    // format and partitioner. Throws ConfigException on invalid settings or
    // a missing bucket.
    void start(const std::map<std::string, std::string>& props);

    // Same, with an already constructed client
    void start(const std::map<std::string, std::string>& props, std::shared_ptr<S3Client> client);

    // Create a writer per partition. Rejects partitions already assigned
    // with std::logic_error and adds nothing in that case.
    void open(const std::vector<TopicPartition>& partitions);

    // Buffer each record in its partition's writer. Throws RoutingException
    // for a partition that is not assigned.
    void route(const std::vector<SinkRecord>& records);

    // Let every writer commit whatever its rotation policy allows
    void flushAll();

    // route() then flushAll()
    void put(const std::vector<SinkRecord>& records);

    // Commit every buffered record regardless of policy
    void forceFlushAll();

    // Next offset to commit for every partition that has committed data
    std::map<TopicPartition, int64_t> preCommit() const;

    // Final flush and release of every assigned writer. Failures are logged
    // per writer. The assignment is empty afterwards.
    void close(const std::vector<TopicPartition>& partitions);

    // Release the storage adapter
    void stop();

    bool isStarted() const { return storage_ != nullptr; }
    const std::set<TopicPartition>& getAssignment() const { return assignment_; }
    size_t getWriterCount() const { return writers_.size(); }
    TopicPartitionWriter* getWriter(const TopicPartition& tp);
    size_t getBufferedRecordCount() const;
    S3Storage* getStorage() { return storage_.get(); }
    const SinkConfig& getConfig() const { return config_; }

    // Register additional components before start()
    ComponentRegistry& getRegistry() { return registry_; }

private:
    ComponentRegistry registry_;
    SinkConfig config_;
    std::unique_ptr<S3Storage> storage_;
    std::unique_ptr<RecordWriterProvider> writer_provider_;
    std::unique_ptr<Partitioner> partitioner_;

    std::set<TopicPartition> assignment_;
    std::unordered_map<TopicPartition, std::unique_ptr<TopicPartitionWriter>> writers_;

    void ensureStarted() const;
};

#endif // S3_SINK_TASK_HPP
