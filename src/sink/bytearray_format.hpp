#ifndef BYTEARRAY_FORMAT_HPP
#define BYTEARRAY_FORMAT_HPP

#include "record_writer.hpp"
#include "s3_storage.hpp"
#include <memory>
#include <string>

// Writes each record value verbatim, followed by a separator
class ByteArrayRecordWriter : public RecordWriter {
public:
    ByteArrayRecordWriter(std::unique_ptr<S3OutputStream> stream, const std::string& separator);
    ~ByteArrayRecordWriter() override;

    void write(const SinkRecord& record) override;
    void commit() override;
    void close() override;

private:
    std::unique_ptr<S3OutputStream> stream_;
    std::string separator_;
};

class ByteArrayRecordWriterProvider : public RecordWriterProvider {
public:
    ByteArrayRecordWriterProvider(S3Storage& storage, const SinkConfig& config);

    std::string getExtension() const override { return extension_; }
    std::unique_ptr<RecordWriter> getRecordWriter(const std::string& key) override;

private:
    S3Storage& storage_;
    std::string separator_;
    std::string extension_;
};

#endif // BYTEARRAY_FORMAT_HPP
