#ifndef JSON_FORMAT_HPP
#define JSON_FORMAT_HPP

#include "record_writer.hpp"
#include "s3_storage.hpp"
#include <memory>
#include <string>

// Newline-delimited JSON, one object per record
class JsonRecordWriter : public RecordWriter {
public:
    explicit JsonRecordWriter(std::unique_ptr<S3OutputStream> stream);
    ~JsonRecordWriter() override;

    void write(const SinkRecord& record) override;
    void commit() override;
    void close() override;

    // Render a single record as a JSON line (without the trailing newline)
    static std::string toJson(const SinkRecord& record);

private:
    std::unique_ptr<S3OutputStream> stream_;
};

class JsonRecordWriterProvider : public RecordWriterProvider {
public:
    JsonRecordWriterProvider(S3Storage& storage, const SinkConfig& config);

    std::string getExtension() const override { return ".json"; }
    std::unique_ptr<RecordWriter> getRecordWriter(const std::string& key) override;

private:
    S3Storage& storage_;
};

#endif // JSON_FORMAT_HPP
