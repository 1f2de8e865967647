#include "component_registry.hpp"
#include "bytearray_format.hpp"
#include "json_format.hpp"
#include "parquet_format.hpp"
#include "sink_errors.hpp"

ComponentRegistry::ComponentRegistry() {
    registerFormat("bytearray", [](S3Storage& storage, const SinkConfig& config) {
        return std::make_unique<ByteArrayRecordWriterProvider>(storage, config);
    });
    registerFormat("json", [](S3Storage& storage, const SinkConfig& config) {
        return std::make_unique<JsonRecordWriterProvider>(storage, config);
    });
    registerFormat("parquet", [](S3Storage& storage, const SinkConfig& config) {
        return std::make_unique<ParquetRecordWriterProvider>(storage, config);
    });

    registerPartitioner("default", []() {
        return std::make_unique<DefaultPartitioner>();
    });
    registerPartitioner("time", []() {
        return std::make_unique<TimeBasedPartitioner>();
    });
    registerPartitioner("hourly", []() {
        return std::make_unique<HourlyPartitioner>();
    });
    registerPartitioner("daily", []() {
        return std::make_unique<DailyPartitioner>();
    });
}

void ComponentRegistry::registerFormat(const std::string& name, FormatFactory factory) {
    formats_[name] = std::move(factory);
}

void ComponentRegistry::registerPartitioner(const std::string& name, PartitionerFactory factory) {
    partitioners_[name] = std::move(factory);
}

std::unique_ptr<RecordWriterProvider> ComponentRegistry::createFormat(const std::string& name,
                                                                      S3Storage& storage,
                                                                      const SinkConfig& config) const {
    auto it = formats_.find(name);
    if (it == formats_.end()) {
        throw ConfigException("Unknown format.class: " + name);
    }
    return it->second(storage, config);
}

std::unique_ptr<Partitioner> ComponentRegistry::createPartitioner(const std::string& name) const {
    auto it = partitioners_.find(name);
    if (it == partitioners_.end()) {
        throw ConfigException("Unknown partitioner.class: " + name);
    }
    return it->second();
}

bool ComponentRegistry::hasFormat(const std::string& name) const {
    return formats_.find(name) != formats_.end();
}

bool ComponentRegistry::hasPartitioner(const std::string& name) const {
    return partitioners_.find(name) != partitioners_.end();
}

std::vector<std::string> ComponentRegistry::getFormatNames() const {
    std::vector<std::string> names;
    for (const auto& kv : formats_) {
        names.push_back(kv.first);
    }
    return names;
}

std::vector<std::string> ComponentRegistry::getPartitionerNames() const {
    std::vector<std::string> names;
    for (const auto& kv : partitioners_) {
        names.push_back(kv.first);
    }
    return names;
}
