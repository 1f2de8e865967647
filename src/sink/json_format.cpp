#include "json_format.hpp"
#include "crow/json.h"
#include <chrono>

JsonRecordWriter::JsonRecordWriter(std::unique_ptr<S3OutputStream> stream)
    : stream_(std::move(stream)) {
}

JsonRecordWriter::~JsonRecordWriter() {
    close();
}

void JsonRecordWriter::write(const SinkRecord& record) {
    stream_->write(toJson(record));
    stream_->write("\n", 1);
}

void JsonRecordWriter::commit() {
    stream_->close();
}

void JsonRecordWriter::close() {
    if (stream_ && !stream_->isClosed()) {
        stream_->abort();
    }
}

std::string JsonRecordWriter::toJson(const SinkRecord& record) {
    auto timestamp_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        record.timestamp.time_since_epoch()).count();

    crow::json::wvalue json;
    json["topic"] = record.topic;
    json["partition"] = record.kafka_partition;
    json["offset"] = static_cast<std::int64_t>(record.kafka_offset);
    json["timestamp"] = static_cast<std::int64_t>(timestamp_ms);
    json["key"] = record.key;
    json["value"] = record.value;
    for (const auto& header : record.headers) {
        json["headers"][header.first] = header.second;
    }
    return json.dump();
}

JsonRecordWriterProvider::JsonRecordWriterProvider(S3Storage& storage, const SinkConfig&)
    : storage_(storage) {
}

std::unique_ptr<RecordWriter> JsonRecordWriterProvider::getRecordWriter(const std::string& key) {
    return std::make_unique<JsonRecordWriter>(storage_.create(key, true));
}
