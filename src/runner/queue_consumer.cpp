#include "queue_consumer.hpp"
#include "../sink/sink_errors.hpp"
#include <algorithm>
#include <iostream>
#include <random>
#include <thread>

QueueConsumer::QueueConsumer(const SinkConfig& config,
                             S3SinkTask& task,
                             std::atomic<bool>& running,
                             std::atomic<bool>& force_flush)
    : config_(config)
    , task_(task)
    , running_(running)
    , force_flush_(force_flush)
    , fatal_error_(false) {
}

QueueConsumer::~QueueConsumer() {
    stop();
}

bool QueueConsumer::initialize() {
    if (config_.queue_brokers.empty() || config_.queue_topics.empty()) {
        std::cerr << "bootstrap.servers and topics are required to consume" << std::endl;
        return false;
    }

    try {
        kafka_config_ = std::make_unique<cppkafka::Configuration>(cppkafka::Configuration{
            {"metadata.broker.list", config_.queue_brokers},
            {"group.id", config_.consumer_group},
            {"enable.auto.commit", "false"},  // Offsets follow committed objects
            {"auto.offset.reset", "earliest"},
            {"enable.partition.eof", "false"},
        });

        consumer_ = std::make_unique<cppkafka::Consumer>(*kafka_config_);

        consumer_->set_assignment_callback([this](cppkafka::TopicPartitionList& partitions) {
            onPartitionsAssigned(partitions);
        });

        consumer_->set_revocation_callback([this](const cppkafka::TopicPartitionList& partitions) {
            onPartitionsRevoked(partitions);
        });

        consumer_->subscribe(config_.queue_topics);

        std::cout << "QueueConsumer initialized with brokers: " << config_.queue_brokers
                  << ", topics: " << config_.queue_topics.size()
                  << ", group: " << config_.consumer_group << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize QueueConsumer: " << e.what() << std::endl;
        return false;
    }
}

void QueueConsumer::start() {
    if (!consumer_) {
        throw SinkException("Consumer not initialized. Call initialize() first.");
    }

    std::cout << "Starting queue consumer (max.poll.records=" << config_.max_poll_records
              << ", flush.size=" << config_.flush_size << ")..." << std::endl;

    const auto poll_timeout = std::chrono::milliseconds(config_.poll_timeout_ms);

    while (running_) {
        if (fatal_error_) {
            throw SinkException(fatal_message_);
        }

        std::vector<cppkafka::Message> messages = consumer_->poll_batch(config_.max_poll_records, poll_timeout);

        std::vector<SinkRecord> records;
        records.reserve(messages.size());
        for (const auto& msg : messages) {
            if (!msg) {
                continue;
            }
            if (msg.get_error()) {
                if (!msg.is_eof()) {
                    std::cerr << "Consumer error: " << msg.get_error() << std::endl;
                }
                continue;
            }
            records.push_back(toSinkRecord(msg));
        }

        // The rebalance may have happened inside poll_batch
        if (fatal_error_) {
            throw SinkException(fatal_message_);
        }

        if (!records.empty()) {
            // RoutingException is not retried
            task_.route(records);
            stats_.records_consumed += records.size();
            ++stats_.batches_consumed;
        }

        bool force = force_flush_.exchange(false);
        if (force) {
            std::cout << "Processing force flush request..." << std::endl;
        }
        flushWithRetry(force);
        commitOffsets();
        publishStats();
    }

    std::cout << "Queue consumer stopped" << std::endl;
}

void QueueConsumer::stop() {
    if (!consumer_) {
        return;
    }

    try {
        // Triggers the revocation callback, which flushes and closes writers
        consumer_->unsubscribe();
    } catch (const std::exception& e) {
        std::cerr << "Error during consumer shutdown: " << e.what() << std::endl;
    }
    consumer_.reset();
}

SinkRecord QueueConsumer::toSinkRecord(const cppkafka::Message& msg) {
    SinkRecord record;
    record.topic = msg.get_topic();
    record.kafka_partition = msg.get_partition();
    record.kafka_offset = msg.get_offset();
    record.key = static_cast<std::string>(msg.get_key());
    record.value = static_cast<std::string>(msg.get_payload());

    auto timestamp = msg.get_timestamp();
    if (timestamp) {
        record.timestamp = std::chrono::system_clock::time_point(timestamp->get_timestamp());
    } else {
        record.timestamp = std::chrono::system_clock::now();
    }

#if (RD_KAFKA_VERSION >= RD_KAFKA_HEADERS_SUPPORT_VERSION)
    const auto& headers = msg.get_header_list();
    if (headers) {
        for (const auto& header : headers) {
            record.headers[header.get_name()] = static_cast<std::string>(header.get_value());
        }
    }
#endif

    return record;
}

std::chrono::milliseconds QueueConsumer::calculateBackoff(int attempt, int base_backoff_ms, int max_backoff_ms) {
    // base * 2^attempt, capped
    int64_t delay = static_cast<int64_t>(base_backoff_ms) << std::min(attempt, 20);
    delay = std::min<int64_t>(delay, max_backoff_ms);

    // Add jitter (0-50% of delay)
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<int64_t> dist(0, delay / 2);
    delay += dist(gen);

    return std::chrono::milliseconds(delay);
}

void QueueConsumer::onPartitionsAssigned(const cppkafka::TopicPartitionList& partitions) {
    std::cout << "Partitions assigned: ";
    for (const auto& tp : partitions) {
        std::cout << tp.get_topic() << "-" << tp.get_partition() << " ";
    }
    std::cout << std::endl;

    try {
        task_.open(toTopicPartitions(partitions));
    } catch (const std::exception& e) {
        std::cerr << "Failed to open writers: " << e.what() << std::endl;
        fatal_error_ = true;
        fatal_message_ = std::string("Failed to open writers: ") + e.what();
    }
    stats_.assigned_partitions = task_.getAssignment().size();
}

void QueueConsumer::onPartitionsRevoked(const cppkafka::TopicPartitionList& partitions) {
    std::cout << "Partitions revoked: ";
    for (const auto& tp : partitions) {
        std::cout << tp.get_topic() << "-" << tp.get_partition() << " ";
    }
    std::cout << std::endl;

    try {
        task_.forceFlushAll();
    } catch (const std::exception& e) {
        std::cerr << "Forced flush before revocation failed: " << e.what() << std::endl;
    }

    commitOffsets();

    task_.close(toTopicPartitions(partitions));
    committed_offsets_.clear();
    stats_.assigned_partitions = 0;
    stats_.buffered_records = 0;
}

void QueueConsumer::flushWithRetry(bool force) {
    for (int attempt = 0;; ++attempt) {
        try {
            if (force) {
                task_.forceFlushAll();
            } else {
                task_.flushAll();
            }
            return;
        } catch (const ConfigException&) {
            throw;
        } catch (const SinkException& e) {
            if (attempt >= config_.max_retries) {
                std::cerr << "All " << (attempt + 1) << " flush attempts failed" << std::endl;
                throw;
            }
            auto delay = calculateBackoff(attempt, config_.retry_backoff_ms, config_.retry_max_backoff_ms);
            std::cerr << "Flush attempt " << (attempt + 1) << " failed: " << e.what()
                      << ". Retrying after " << delay.count() << "ms" << std::endl;
            ++stats_.flush_retries;
            std::this_thread::sleep_for(delay);
        }
    }
}

void QueueConsumer::commitOffsets() {
    if (!consumer_) {
        return;
    }

    cppkafka::TopicPartitionList to_commit;
    std::map<TopicPartition, int64_t> offsets = task_.preCommit();
    for (const auto& kv : offsets) {
        auto it = committed_offsets_.find(kv.first);
        if (it != committed_offsets_.end() && it->second >= kv.second) {
            continue;
        }
        to_commit.emplace_back(kv.first.topic, kv.first.partition, kv.second);
    }

    if (to_commit.empty()) {
        return;
    }

    try {
        consumer_->commit(to_commit);
        for (const auto& tp : to_commit) {
            committed_offsets_[TopicPartition(tp.get_topic(), tp.get_partition())] = tp.get_offset();
        }
        ++stats_.offset_commits;
        stats_.last_commit_epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        std::cout << "Committed offsets for " << to_commit.size() << " partition(s)" << std::endl;
    } catch (const cppkafka::HandleException& e) {
        // Objects are already written; redelivery overwrites them at the same keys
        std::cerr << "Warning: Failed to commit offsets: " << e.what() << std::endl;
    }
}

void QueueConsumer::publishStats() {
    stats_.buffered_records = task_.getBufferedRecordCount();
    stats_.assigned_partitions = task_.getAssignment().size();
}

std::vector<TopicPartition> QueueConsumer::toTopicPartitions(const cppkafka::TopicPartitionList& partitions) {
    std::vector<TopicPartition> result;
    result.reserve(partitions.size());
    for (const auto& tp : partitions) {
        result.emplace_back(tp.get_topic(), tp.get_partition());
    }
    return result;
}
