#ifndef PARTITIONER_HPP
#define PARTITIONER_HPP

#include "sink_record.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <string>

// Maps a record to the directory its object is written under.
// configure() is called once at task start with the flat property map.
class Partitioner {
public:
    virtual ~Partitioner() = default;

    virtual void configure(const std::map<std::string, std::string>& props);

    // Path fragment for the record, e.g. "partition=3" or "year=2024/month=01"
    virtual std::string encodePartition(const SinkRecord& record) const = 0;

    virtual std::string generatePartitionedPath(const std::string& topic,
                                                const std::string& encoded_partition) const;

protected:
    std::string delim_ = "/";
};

// partition=<kafka partition>
class DefaultPartitioner : public Partitioner {
public:
    std::string encodePartition(const SinkRecord& record) const override;
};

// Buckets records by timestamp. Supports path.format tokens YYYY, MM, dd,
// HH, mm, ss and single-quoted literals, in UTC.
class TimeBasedPartitioner : public Partitioner {
public:
    enum class TimestampSource { Record, Wallclock };

    void configure(const std::map<std::string, std::string>& props) override;
    std::string encodePartition(const SinkRecord& record) const override;

    // Floor the timestamp to the partition duration and render it
    std::string encodeTimestamp(std::chrono::system_clock::time_point tp) const;

    int64_t getPartitionDurationMs() const { return partition_duration_ms_; }
    const std::string& getPathFormat() const { return path_format_; }

protected:
    int64_t partition_duration_ms_ = 0;
    std::string path_format_;
    TimestampSource timestamp_source_ = TimestampSource::Record;

    void configureTimeSettings(const std::map<std::string, std::string>& props,
                               int64_t duration_ms,
                               const std::string& path_format);
};

class HourlyPartitioner : public TimeBasedPartitioner {
public:
    void configure(const std::map<std::string, std::string>& props) override;
};

class DailyPartitioner : public TimeBasedPartitioner {
public:
    void configure(const std::map<std::string, std::string>& props) override;
};

#endif // PARTITIONER_HPP
