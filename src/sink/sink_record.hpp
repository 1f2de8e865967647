#ifndef SINK_RECORD_HPP
#define SINK_RECORD_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <tuple>

// Identity of one input partition. Used as the key for writer lookup.
struct TopicPartition {
    std::string topic;
    int32_t partition = 0;

    TopicPartition() = default;
    TopicPartition(std::string t, int32_t p) : topic(std::move(t)), partition(p) {}

    bool operator==(const TopicPartition& other) const {
        return partition == other.partition && topic == other.topic;
    }
    bool operator!=(const TopicPartition& other) const { return !(*this == other); }
    bool operator<(const TopicPartition& other) const {
        return std::tie(topic, partition) < std::tie(other.topic, other.partition);
    }

    std::string toString() const { return topic + "-" + std::to_string(partition); }
};

namespace std {
template <>
struct hash<TopicPartition> {
    size_t operator()(const TopicPartition& tp) const noexcept {
        size_t h = std::hash<std::string>()(tp.topic);
        return h ^ (std::hash<int32_t>()(tp.partition) + 0x9e3779b9 + (h << 6) + (h >> 2));
    }
};
}  // namespace std

// A single record delivered by the stream runtime
struct SinkRecord {
    std::string topic;
    int32_t kafka_partition = 0;
    int64_t kafka_offset = 0;
    std::chrono::system_clock::time_point timestamp;
    std::string key;    // raw bytes
    std::string value;  // raw bytes
    std::map<std::string, std::string> headers;

    TopicPartition topicPartition() const { return TopicPartition(topic, kafka_partition); }
};

#endif // SINK_RECORD_HPP
