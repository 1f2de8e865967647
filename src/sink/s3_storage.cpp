#include "s3_storage.hpp"
#include "sink_errors.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

S3Storage::S3Storage(const SinkConfig& config, const std::string& url, std::shared_ptr<S3Client> client)
    : config_(config)
    , url_(url)
    , bucket_(config.s3_bucket)
    , client_(std::move(client)) {
    if (!client_) {
        throw std::invalid_argument("S3Storage requires a client");
    }
}

S3Storage::~S3Storage() {
    close();
}

bool S3Storage::exists(const std::string& name) {
    if (isBlank(name)) {
        return false;
    }
    return client()->objectExists(bucket_, name);
}

bool S3Storage::bucketExists() {
    if (isBlank(bucket_)) {
        return false;
    }
    return client()->bucketExists(bucket_);
}

ObjectListing S3Storage::list(const std::string& path_prefix) {
    return client()->listObjects(bucket_, path_prefix, config_.s3_list_max_keys);
}

void S3Storage::remove(const std::string& name) {
    if (name == bucket_) {
        // Removing the bucket is never done from the sink
        std::cout << "Ignoring delete of bucket " << bucket_ << std::endl;
        return;
    }
    client()->deleteObject(bucket_, name);
}

std::unique_ptr<S3OutputStream> S3Storage::create(const std::string& name, bool overwrite) {
    if (!overwrite) {
        throw UnsupportedOperationException(
            "Creating an object without overwriting is not supported by S3 storage");
    }
    if (isBlank(name)) {
        throw std::invalid_argument("Path can not be empty");
    }
    return std::make_unique<S3OutputStream>(client(), bucket_, name, config_.s3_part_size);
}

bool S3Storage::create(const std::string& name) {
    throw UnsupportedOperationException("Creating an empty object " + name + " is not supported by S3 storage");
}

void S3Storage::open(const std::string& path) {
    throw UnsupportedOperationException("Reading " + path + " is not supported by S3 storage");
}

void S3Storage::append(const std::string& path) {
    throw UnsupportedOperationException("Appending to " + path + " is not supported by S3 storage");
}

void S3Storage::close() {
    std::lock_guard<std::mutex> lock(client_mutex_);
    client_.reset();
}

bool S3Storage::isClosed() const {
    std::lock_guard<std::mutex> lock(client_mutex_);
    return client_ == nullptr;
}

std::shared_ptr<S3Client> S3Storage::client() const {
    std::lock_guard<std::mutex> lock(client_mutex_);
    if (!client_) {
        throw SinkException("S3 storage for bucket " + bucket_ + " is closed");
    }
    return client_;
}

bool S3Storage::isBlank(const std::string& value) {
    return std::all_of(value.begin(), value.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}
