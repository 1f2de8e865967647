#ifndef COMPONENT_REGISTRY_HPP
#define COMPONENT_REGISTRY_HPP

#include "../config.hpp"
#include "partitioner.hpp"
#include "record_writer.hpp"
#include "s3_storage.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

// Name -> factory tables for record formats and partitioners.
// Pre-populated with the built-in components.
class ComponentRegistry {
public:
    using FormatFactory =
        std::function<std::unique_ptr<RecordWriterProvider>(S3Storage&, const SinkConfig&)>;
    using PartitionerFactory = std::function<std::unique_ptr<Partitioner>()>;

    ComponentRegistry();

    // Replaces any existing entry with the same name
    void registerFormat(const std::string& name, FormatFactory factory);
    void registerPartitioner(const std::string& name, PartitionerFactory factory);

    // Throw ConfigException for an unknown name
    std::unique_ptr<RecordWriterProvider> createFormat(const std::string& name,
                                                       S3Storage& storage,
                                                       const SinkConfig& config) const;
    std::unique_ptr<Partitioner> createPartitioner(const std::string& name) const;

    bool hasFormat(const std::string& name) const;
    bool hasPartitioner(const std::string& name) const;
    std::vector<std::string> getFormatNames() const;
    std::vector<std::string> getPartitionerNames() const;

private:
    std::map<std::string, FormatFactory> formats_;
    std::map<std::string, PartitionerFactory> partitioners_;
};

#endif // COMPONENT_REGISTRY_HPP
