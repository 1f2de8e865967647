#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "sink/sink_errors.hpp"
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <map>
#include <sstream>
#include <string>
#include <vector>

struct SinkConfig {
    // Object store
    std::string s3_bucket;
    std::string s3_endpoint;
    std::string s3_access_key;
    std::string s3_secret_key;
    std::string s3_region = "us-east-1";
    size_t s3_part_size = 25 * 1024 * 1024;
    size_t s3_list_max_keys = 1000;

    // Object layout
    std::string topics_dir = "topics";
    std::string directory_delim = "/";
    std::string file_delim = "+";
    int filename_offset_zero_pad_width = 10;

    // Pluggable components
    std::string format_class = "bytearray";
    std::string partitioner_class = "default";
    std::string bytearray_separator = "\n";
    std::string bytearray_extension = ".bin";
    std::string parquet_codec = "snappy";

    // Rotation
    size_t flush_size = 0;
    int64_t rotate_interval_ms = -1;
    int64_t rotate_schedule_interval_ms = -1;

    // Stream runtime
    std::string queue_brokers;
    std::vector<std::string> queue_topics;
    std::string consumer_group = "s3-sink";
    size_t max_poll_records = 500;
    int poll_timeout_ms = 1000;
    int max_retries = 5;
    int retry_backoff_ms = 500;
    int retry_max_backoff_ms = 30000;

    // Every key/value the config was built from; handed to the partitioner
    std::map<std::string, std::string> props;

    static constexpr size_t kMinPartSize = 5 * 1024 * 1024;

    static SinkConfig fromMap(const std::map<std::string, std::string>& props) {
        SinkConfig config;
        config.props = props;

        config.s3_bucket = getString(props, "s3.bucket.name", "");
        if (config.s3_bucket.empty()) {
            throw ConfigException("s3.bucket.name is required");
        }
        config.s3_endpoint = getString(props, "store.url", "");
        config.s3_access_key = getString(props, "aws.access.key.id", "");
        config.s3_secret_key = getString(props, "aws.secret.access.key", "");
        if (config.s3_access_key.empty() != config.s3_secret_key.empty()) {
            throw ConfigException("aws.access.key.id and aws.secret.access.key must be set together");
        }
        config.s3_region = getString(props, "s3.region", config.s3_region);

        int64_t part_size = getInt(props, "s3.part.size", static_cast<int64_t>(config.s3_part_size));
        if (part_size < static_cast<int64_t>(kMinPartSize)) {
            throw ConfigException("s3.part.size must be at least " + std::to_string(kMinPartSize) + " bytes");
        }
        config.s3_part_size = static_cast<size_t>(part_size);

        int64_t max_keys = getInt(props, "s3.list.max.keys", static_cast<int64_t>(config.s3_list_max_keys));
        if (max_keys <= 0) {
            throw ConfigException("s3.list.max.keys must be positive");
        }
        config.s3_list_max_keys = static_cast<size_t>(max_keys);

        config.topics_dir = getString(props, "topics.dir", config.topics_dir);
        config.directory_delim = getString(props, "directory.delim", config.directory_delim);
        config.file_delim = getString(props, "file.delim", config.file_delim);
        if (config.directory_delim.empty() || config.file_delim.empty()) {
            throw ConfigException("directory.delim and file.delim must not be empty");
        }
        config.filename_offset_zero_pad_width = static_cast<int>(
            getInt(props, "filename.offset.zero.pad.width", config.filename_offset_zero_pad_width));
        if (config.filename_offset_zero_pad_width < 0) {
            throw ConfigException("filename.offset.zero.pad.width must not be negative");
        }

        config.format_class = getString(props, "format.class", config.format_class);
        config.partitioner_class = getString(props, "partitioner.class", config.partitioner_class);
        config.bytearray_separator = getString(props, "format.bytearray.separator", config.bytearray_separator);
        config.bytearray_extension = getString(props, "format.bytearray.extension", config.bytearray_extension);
        config.parquet_codec = getString(props, "parquet.codec", config.parquet_codec);

        if (props.find("flush.size") == props.end()) {
            throw ConfigException("flush.size is required");
        }
        int64_t flush_size = getInt(props, "flush.size", 0);
        if (flush_size <= 0) {
            throw ConfigException("flush.size must be positive");
        }
        config.flush_size = static_cast<size_t>(flush_size);
        config.rotate_interval_ms = getInt(props, "rotate.interval.ms", config.rotate_interval_ms);
        config.rotate_schedule_interval_ms =
            getInt(props, "rotate.schedule.interval.ms", config.rotate_schedule_interval_ms);

        config.queue_brokers = getString(props, "bootstrap.servers", "");
        config.queue_topics = splitList(getString(props, "topics", ""));
        config.consumer_group = getString(props, "group.id", config.consumer_group);
        int64_t max_poll = getInt(props, "max.poll.records", static_cast<int64_t>(config.max_poll_records));
        if (max_poll <= 0) {
            throw ConfigException("max.poll.records must be positive");
        }
        config.max_poll_records = static_cast<size_t>(max_poll);
        config.poll_timeout_ms = static_cast<int>(getInt(props, "poll.timeout.ms", config.poll_timeout_ms));
        config.max_retries = static_cast<int>(getInt(props, "max.retries", config.max_retries));
        config.retry_backoff_ms = static_cast<int>(getInt(props, "retry.backoff.ms", config.retry_backoff_ms));
        config.retry_max_backoff_ms =
            static_cast<int>(getInt(props, "retry.max.backoff.ms", config.retry_max_backoff_ms));

        return config;
    }

    // Builds the property map from environment variables, then validates it
    // through fromMap. Partitioner settings use the same variable scheme.
    static SinkConfig fromEnv() {
        std::map<std::string, std::string> props;

        const char* brokers = std::getenv("KAFKA_BROKERS");
        if (!brokers || strlen(brokers) == 0) {
            throw ConfigException("KAFKA_BROKERS environment variable is required");
        }
        props["bootstrap.servers"] = brokers;

        const char* topics = std::getenv("KAFKA_TOPICS");
        if (!topics || strlen(topics) == 0) {
            throw ConfigException("KAFKA_TOPICS environment variable is required");
        }
        props["topics"] = topics;

        const char* s3_endpoint = std::getenv("S3_ENDPOINT");
        if (!s3_endpoint || strlen(s3_endpoint) == 0) {
            throw ConfigException("S3_ENDPOINT environment variable is required");
        }
        props["store.url"] = s3_endpoint;

        const char* s3_bucket = std::getenv("S3_BUCKET");
        if (!s3_bucket || strlen(s3_bucket) == 0) {
            throw ConfigException("S3_BUCKET environment variable is required");
        }
        props["s3.bucket.name"] = s3_bucket;

        const char* flush_size = std::getenv("FLUSH_SIZE");
        if (!flush_size || strlen(flush_size) == 0) {
            throw ConfigException("FLUSH_SIZE environment variable is required");
        }
        props["flush.size"] = flush_size;

        static const std::pair<const char*, const char*> optional_vars[] = {
            {"KAFKA_CONSUMER_GROUP", "group.id"},
            {"S3_ACCESS_KEY", "aws.access.key.id"},
            {"S3_SECRET_KEY", "aws.secret.access.key"},
            {"S3_REGION", "s3.region"},
            {"S3_PART_SIZE", "s3.part.size"},
            {"TOPICS_DIR", "topics.dir"},
            {"FORMAT_CLASS", "format.class"},
            {"PARTITIONER_CLASS", "partitioner.class"},
            {"PARTITION_DURATION_MS", "partition.duration.ms"},
            {"PATH_FORMAT", "path.format"},
            {"TIMEZONE", "timezone"},
            {"TIMESTAMP_EXTRACTOR", "timestamp.extractor"},
            {"ROTATE_INTERVAL_MS", "rotate.interval.ms"},
            {"ROTATE_SCHEDULE_INTERVAL_MS", "rotate.schedule.interval.ms"},
            {"PARQUET_CODEC", "parquet.codec"},
            {"MAX_POLL_RECORDS", "max.poll.records"},
            {"MAX_RETRIES", "max.retries"},
            {"RETRY_BACKOFF_MS", "retry.backoff.ms"},
        };
        for (const auto& var : optional_vars) {
            const char* value = std::getenv(var.first);
            if (value && strlen(value) > 0) {
                props[var.second] = value;
            }
        }

        return fromMap(props);
    }

    static std::string getString(const std::map<std::string, std::string>& props,
                                 const std::string& key,
                                 const std::string& default_value) {
        auto it = props.find(key);
        return it == props.end() ? default_value : it->second;
    }

    static int64_t getInt(const std::map<std::string, std::string>& props,
                          const std::string& key,
                          int64_t default_value) {
        auto it = props.find(key);
        if (it == props.end()) {
            return default_value;
        }
        try {
            size_t pos = 0;
            int64_t value = std::stoll(it->second, &pos);
            if (pos != it->second.size()) {
                throw ConfigException("Invalid integer for " + key + ": " + it->second);
            }
            return value;
        } catch (const std::logic_error&) {
            throw ConfigException("Invalid integer for " + key + ": " + it->second);
        }
    }

    static std::vector<std::string> splitList(const std::string& value) {
        std::vector<std::string> items;
        std::stringstream ss(value);
        std::string item;
        while (std::getline(ss, item, ',')) {
            size_t begin = item.find_first_not_of(" \t");
            size_t end = item.find_last_not_of(" \t");
            if (begin != std::string::npos) {
                items.push_back(item.substr(begin, end - begin + 1));
            }
        }
        return items;
    }
};

#endif // CONFIG_HPP
