#include "s3_sink_task.hpp"
#include "minio_s3_client.hpp"
#include "sink_errors.hpp"
#include <iostream>
#include <stdexcept>

S3SinkTask::S3SinkTask() = default;

S3SinkTask::~S3SinkTask() {
    // Writers reference the provider, partitioner and storage
    writers_.clear();
}

void S3SinkTask::start(const std::map<std::string, std::string>& props) {
    SinkConfig config = SinkConfig::fromMap(props);
    if (config.s3_endpoint.empty()) {
        throw ConfigException("store.url is required");
    }
    auto client = std::make_shared<MinioS3Client>(config.s3_endpoint,
                                                  config.s3_access_key,
                                                  config.s3_secret_key,
                                                  config.s3_region);
    start(props, client);
}

void S3SinkTask::start(const std::map<std::string, std::string>& props, std::shared_ptr<S3Client> client) {
    if (storage_) {
        throw std::logic_error("S3 sink task is already started");
    }

    SinkConfig config = SinkConfig::fromMap(props);
    auto storage = std::make_unique<S3Storage>(config, config.s3_endpoint, std::move(client));
    if (!storage->bucketExists()) {
        throw ConfigException("Non-existent S3 bucket: " + config.s3_bucket);
    }

    auto writer_provider = registry_.createFormat(config.format_class, *storage, config);
    auto partitioner = registry_.createPartitioner(config.partitioner_class);
    partitioner->configure(config.props);

    config_ = config;
    storage_ = std::move(storage);
    writer_provider_ = std::move(writer_provider);
    partitioner_ = std::move(partitioner);

    std::cout << "Started S3 sink task for bucket " << config_.s3_bucket
              << " (format: " << config_.format_class
              << ", partitioner: " << config_.partitioner_class
              << ", flush.size: " << config_.flush_size << ")" << std::endl;
}

void S3SinkTask::open(const std::vector<TopicPartition>& partitions) {
    ensureStarted();

    std::set<TopicPartition> incoming;
    for (const auto& tp : partitions) {
        if (assignment_.count(tp) > 0 || !incoming.insert(tp).second) {
            throw std::logic_error("Partition " + tp.toString() + " is already assigned");
        }
    }

    for (const auto& tp : incoming) {
        writers_[tp] = std::make_unique<TopicPartitionWriter>(
            tp, *storage_, *writer_provider_, *partitioner_, config_);
        assignment_.insert(tp);
        std::cout << "Partition " << tp.toString() << ": Created writer" << std::endl;
    }
}

void S3SinkTask::route(const std::vector<SinkRecord>& records) {
    for (const auto& record : records) {
        auto it = writers_.find(record.topicPartition());
        if (it == writers_.end()) {
            throw RoutingException("Record at offset " + std::to_string(record.kafka_offset) +
                                   " is for unassigned partition " + record.topicPartition().toString());
        }
        it->second->buffer(record);
    }
}

void S3SinkTask::flushAll() {
    for (const auto& tp : assignment_) {
        writers_.at(tp)->write();
    }
}

void S3SinkTask::put(const std::vector<SinkRecord>& records) {
    route(records);
    flushAll();
}

void S3SinkTask::forceFlushAll() {
    for (const auto& tp : assignment_) {
        writers_.at(tp)->forceWrite();
    }
}

std::map<TopicPartition, int64_t> S3SinkTask::preCommit() const {
    std::map<TopicPartition, int64_t> offsets;
    for (const auto& tp : assignment_) {
        int64_t offset = writers_.at(tp)->getOffsetToCommit();
        if (offset >= 0) {
            offsets[tp] = offset;
        }
    }
    return offsets;
}

void S3SinkTask::close(const std::vector<TopicPartition>& partitions) {
    if (!partitions.empty()) {
        std::cout << "Closing " << assignment_.size() << " writer(s) on revocation of "
                  << partitions.size() << " partition(s)" << std::endl;
    }

    for (const auto& tp : assignment_) {
        auto it = writers_.find(tp);
        if (it == writers_.end()) {
            continue;
        }
        try {
            it->second->close();
        } catch (const std::exception& e) {
            std::cerr << "Error closing writer for " << tp.toString() << ". Error: " << e.what() << std::endl;
        }
    }

    writers_.clear();
    assignment_.clear();
}

void S3SinkTask::stop() {
    if (!storage_) {
        return;
    }
    try {
        storage_->close();
    } catch (const std::exception& e) {
        throw SinkException(std::string("Failed to close storage: ") + e.what());
    }
    std::cout << "Stopped S3 sink task" << std::endl;
}

TopicPartitionWriter* S3SinkTask::getWriter(const TopicPartition& tp) {
    auto it = writers_.find(tp);
    return it == writers_.end() ? nullptr : it->second.get();
}

size_t S3SinkTask::getBufferedRecordCount() const {
    size_t total = 0;
    for (const auto& kv : writers_) {
        total += kv.second->getBufferedRecordCount();
    }
    return total;
}

void S3SinkTask::ensureStarted() const {
    if (!storage_) {
        throw std::logic_error("S3 sink task is not started");
    }
}
