#include "partitioner.hpp"
#include "../config.hpp"
#include "sink_errors.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {

const char* const kHourlyPathFormat = "'year'=YYYY/'month'=MM/'day'=dd/'hour'=HH";
const char* const kDailyPathFormat = "'year'=YYYY/'month'=MM/'day'=dd";
const int64_t kHourMs = 60LL * 60 * 1000;
const int64_t kDayMs = 24 * kHourMs;

void appendField(std::ostringstream& out, int value, size_t width) {
    out << std::setfill('0') << std::setw(static_cast<int>(width)) << value;
}

// Render a Joda-style pattern for a UTC broken-down time
std::string formatPath(const std::string& pattern, const std::tm& tm) {
    std::ostringstream out;
    size_t i = 0;
    while (i < pattern.size()) {
        char c = pattern[i];
        if (c == '\'') {
            size_t end = pattern.find('\'', i + 1);
            if (end == std::string::npos) {
                throw ConfigException("Unterminated literal in path.format: " + pattern);
            }
            if (end == i + 1) {
                out << '\'';
            } else {
                out << pattern.substr(i + 1, end - i - 1);
            }
            i = end + 1;
            continue;
        }

        if (!std::isalpha(static_cast<unsigned char>(c))) {
            out << c;
            ++i;
            continue;
        }

        size_t run = 1;
        while (i + run < pattern.size() && pattern[i + run] == c) {
            ++run;
        }
        switch (c) {
            case 'Y':
            case 'y':
                appendField(out, tm.tm_year + 1900, run);
                break;
            case 'M':
                appendField(out, tm.tm_mon + 1, run);
                break;
            case 'd':
                appendField(out, tm.tm_mday, run);
                break;
            case 'H':
                appendField(out, tm.tm_hour, run);
                break;
            case 'm':
                appendField(out, tm.tm_min, run);
                break;
            case 's':
                appendField(out, tm.tm_sec, run);
                break;
            default:
                throw ConfigException(std::string("Unsupported path.format token '") + c + "' in " + pattern);
        }
        i += run;
    }
    return out.str();
}

}  // namespace

void Partitioner::configure(const std::map<std::string, std::string>& props) {
    delim_ = SinkConfig::getString(props, "directory.delim", delim_);
}

std::string Partitioner::generatePartitionedPath(const std::string& topic,
                                                 const std::string& encoded_partition) const {
    return topic + delim_ + encoded_partition;
}

std::string DefaultPartitioner::encodePartition(const SinkRecord& record) const {
    return "partition=" + std::to_string(record.kafka_partition);
}

void TimeBasedPartitioner::configure(const std::map<std::string, std::string>& props) {
    if (props.find("partition.duration.ms") == props.end()) {
        throw ConfigException("partition.duration.ms is required for the time partitioner");
    }
    std::string path_format = SinkConfig::getString(props, "path.format", "");
    if (path_format.empty()) {
        throw ConfigException("path.format is required for the time partitioner");
    }
    configureTimeSettings(props, SinkConfig::getInt(props, "partition.duration.ms", 0), path_format);
}

void TimeBasedPartitioner::configureTimeSettings(const std::map<std::string, std::string>& props,
                                                 int64_t duration_ms,
                                                 const std::string& path_format) {
    Partitioner::configure(props);

    if (duration_ms <= 0) {
        throw ConfigException("partition.duration.ms must be positive");
    }
    partition_duration_ms_ = duration_ms;
    path_format_ = path_format;

    std::string timezone = SinkConfig::getString(props, "timezone", "UTC");
    if (timezone != "UTC") {
        throw ConfigException("Only the UTC timezone is supported, got " + timezone);
    }

    std::string extractor = SinkConfig::getString(props, "timestamp.extractor", "Record");
    if (extractor == "Record") {
        timestamp_source_ = TimestampSource::Record;
    } else if (extractor == "Wallclock") {
        timestamp_source_ = TimestampSource::Wallclock;
    } else {
        throw ConfigException("Unsupported timestamp.extractor: " + extractor);
    }

    // Rejects unsupported path.format tokens
    encodeTimestamp(std::chrono::system_clock::time_point());
}

std::string TimeBasedPartitioner::encodePartition(const SinkRecord& record) const {
    if (timestamp_source_ == TimestampSource::Wallclock) {
        return encodeTimestamp(std::chrono::system_clock::now());
    }
    return encodeTimestamp(record.timestamp);
}

std::string TimeBasedPartitioner::encodeTimestamp(std::chrono::system_clock::time_point tp) const {
    int64_t ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    int64_t remainder = ((ms % partition_duration_ms_) + partition_duration_ms_) % partition_duration_ms_;
    int64_t floored_ms = ms - remainder;

    std::time_t seconds = static_cast<std::time_t>(floored_ms / 1000);
    if (floored_ms < 0 && floored_ms % 1000 != 0) {
        --seconds;
    }
    std::tm tm_val;
    gmtime_r(&seconds, &tm_val);
    return formatPath(path_format_, tm_val);
}

void HourlyPartitioner::configure(const std::map<std::string, std::string>& props) {
    configureTimeSettings(props, kHourMs, kHourlyPathFormat);
}

void DailyPartitioner::configure(const std::map<std::string, std::string>& props) {
    configureTimeSettings(props, kDayMs, kDailyPathFormat);
}
