#ifndef SINK_ERRORS_HPP
#define SINK_ERRORS_HPP

#include <stdexcept>
#include <string>

// Failure surfaced to the host runtime. The runtime decides whether to retry
// the batch or fail the task.
class SinkException : public std::runtime_error {
public:
    explicit SinkException(const std::string& message)
        : std::runtime_error(message) {}
};

// Invalid settings or a failed startup precondition (e.g. missing bucket).
// Never retried.
class ConfigException : public SinkException {
public:
    explicit ConfigException(const std::string& message)
        : SinkException(message) {}
};

// A remote object store call failed
class StorageException : public SinkException {
public:
    explicit StorageException(const std::string& message)
        : SinkException(message) {}
};

// A record arrived for a partition the task does not own
class RoutingException : public SinkException {
public:
    explicit RoutingException(const std::string& message)
        : SinkException(message) {}
};

// The object store cannot perform this operation (read, append, create without overwrite)
class UnsupportedOperationException : public std::logic_error {
public:
    explicit UnsupportedOperationException(const std::string& message)
        : std::logic_error(message) {}
};

#endif // SINK_ERRORS_HPP
