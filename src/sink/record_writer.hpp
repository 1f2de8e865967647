#ifndef RECORD_WRITER_HPP
#define RECORD_WRITER_HPP

#include "sink_record.hpp"
#include <memory>
#include <string>

// Serializes records into one remote object
class RecordWriter {
public:
    virtual ~RecordWriter() = default;

    virtual void write(const SinkRecord& record) = 0;

    // Make the object visible. Throws on failure; the object is then absent.
    virtual void commit() = 0;

    // Release resources without committing. Does not throw.
    virtual void close() = 0;
};

// Hands out a RecordWriter per object key. One provider is shared by every
// partition writer of a task.
class RecordWriterProvider {
public:
    virtual ~RecordWriterProvider() = default;

    virtual std::string getExtension() const = 0;
    virtual std::unique_ptr<RecordWriter> getRecordWriter(const std::string& key) = 0;
};

#endif // RECORD_WRITER_HPP
