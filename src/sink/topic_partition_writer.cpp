#include "topic_partition_writer.hpp"
#include "sink_errors.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

TopicPartitionWriter::TopicPartitionWriter(const TopicPartition& tp,
                                           S3Storage& storage,
                                           RecordWriterProvider& writer_provider,
                                           Partitioner& partitioner,
                                           const SinkConfig& config)
    : tp_(tp)
    , storage_(storage)
    , writer_provider_(writer_provider)
    , partitioner_(partitioner)
    , config_(config)
    , rotation_(config.flush_size, config.rotate_interval_ms, config.rotate_schedule_interval_ms)
    , offset_to_commit_(-1)
    , committed_files_(0) {
    log_prefix_ = "Partition " + tp_.toString() + ": ";
}

void TopicPartitionWriter::buffer(const SinkRecord& record) {
    buffer_.push_back(record);
}

void TopicPartitionWriter::write() {
    if (buffer_.empty()) {
        return;
    }

    if (rotation_.shouldRotateBySchedule()) {
        std::cout << log_prefix_ << "Scheduled rotation after "
                  << rotation_.getTimeSinceReset().count() << "ms ("
                  << buffer_.size() << " records)" << std::endl;
        forceWrite();
        return;
    }

    while (!buffer_.empty() && shouldRotate()) {
        commitFile();
    }
}

void TopicPartitionWriter::forceWrite() {
    while (!buffer_.empty()) {
        commitFile();
    }
}

void TopicPartitionWriter::close() {
    try {
        forceWrite();
    } catch (const std::exception& e) {
        std::cerr << log_prefix_ << "Dropping " << buffer_.size()
                  << " buffered records after failed close: " << e.what() << std::endl;
        buffer_.clear();
        throw;
    }
    std::cout << log_prefix_ << "Writer closed after " << committed_files_ << " object(s)" << std::endl;
}

std::string TopicPartitionWriter::getCommitKey(const std::string& encoded_partition,
                                               int64_t start_offset) const {
    const std::string& delim = config_.directory_delim;
    const std::string& file_delim = config_.file_delim;

    std::ostringstream key;
    if (!config_.topics_dir.empty()) {
        key << config_.topics_dir << delim;
    }
    key << partitioner_.generatePartitionedPath(tp_.topic, encoded_partition) << delim
        << tp_.topic << file_delim << tp_.partition << file_delim
        << std::setfill('0') << std::setw(config_.filename_offset_zero_pad_width) << start_offset
        << writer_provider_.getExtension();
    return key.str();
}

bool TopicPartitionWriter::shouldRotate() const {
    if (rotation_.shouldRotateBySize(buffer_.size())) {
        return true;
    }
    return rotation_.shouldRotateByInterval(buffer_.front().timestamp, buffer_.back().timestamp);
}

size_t TopicPartitionWriter::nextChunkSize() const {
    const SinkRecord& first = buffer_.front();
    std::string encoded = partitioner_.encodePartition(first);
    int64_t interval_ms = rotation_.getRotateIntervalMs();

    size_t count = 1;
    while (count < buffer_.size() && count < rotation_.getFlushSize()) {
        const SinkRecord& record = buffer_[count];
        if (partitioner_.encodePartition(record) != encoded) {
            break;
        }
        if (interval_ms > 0) {
            auto span = std::chrono::duration_cast<std::chrono::milliseconds>(record.timestamp - first.timestamp);
            if (span.count() >= interval_ms) {
                break;
            }
        }
        ++count;
    }
    return count;
}

void TopicPartitionWriter::commitFile() {
    size_t count = nextChunkSize();
    const SinkRecord& first = buffer_.front();
    std::string key = getCommitKey(partitioner_.encodePartition(first), first.kafka_offset);

    auto writer = writer_provider_.getRecordWriter(key);
    try {
        for (size_t i = 0; i < count; ++i) {
            writer->write(buffer_[i]);
        }
        writer->commit();
    } catch (const SinkException& e) {
        std::cerr << log_prefix_ << "Failed to commit " << key << ": " << e.what() << std::endl;
        writer->close();
        throw;
    } catch (const std::exception& e) {
        std::cerr << log_prefix_ << "Failed to commit " << key << ": " << e.what() << std::endl;
        writer->close();
        throw SinkException("Failed to commit " + key + ": " + e.what());
    }

    offset_to_commit_ = buffer_[count - 1].kafka_offset + 1;
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(count));
    rotation_.reset();
    ++committed_files_;
    last_committed_key_ = key;

    std::cout << log_prefix_ << "Committed " << count << " records to s3://"
              << storage_.bucket() << "/" << key << ", next offset: " << offset_to_commit_ << std::endl;
}
