#include "bytearray_format.hpp"

ByteArrayRecordWriter::ByteArrayRecordWriter(std::unique_ptr<S3OutputStream> stream,
                                             const std::string& separator)
    : stream_(std::move(stream))
    , separator_(separator) {
}

ByteArrayRecordWriter::~ByteArrayRecordWriter() {
    close();
}

void ByteArrayRecordWriter::write(const SinkRecord& record) {
    stream_->write(record.value);
    stream_->write(separator_);
}

void ByteArrayRecordWriter::commit() {
    stream_->close();
}

void ByteArrayRecordWriter::close() {
    if (stream_ && !stream_->isClosed()) {
        stream_->abort();
    }
}

ByteArrayRecordWriterProvider::ByteArrayRecordWriterProvider(S3Storage& storage, const SinkConfig& config)
    : storage_(storage)
    , separator_(config.bytearray_separator)
    , extension_(config.bytearray_extension) {
}

std::unique_ptr<RecordWriter> ByteArrayRecordWriterProvider::getRecordWriter(const std::string& key) {
    return std::make_unique<ByteArrayRecordWriter>(storage_.create(key, true), separator_);
}
