#include "s3_output_stream.hpp"
#include "sink_errors.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

S3OutputStream::S3OutputStream(std::shared_ptr<S3Client> client,
                               const std::string& bucket,
                               const std::string& key,
                               size_t part_size)
    : client_(std::move(client))
    , bucket_(bucket)
    , key_(key)
    , part_size_(part_size)
    , bytes_written_(0)
    , closed_(false)
    , committed_(false) {
    if (!client_) {
        throw std::invalid_argument("S3OutputStream requires a client");
    }
    if (part_size_ == 0) {
        throw std::invalid_argument("Part size must be positive");
    }
    buffer_.reserve(std::min<size_t>(part_size_, 1024 * 1024));
}

S3OutputStream::~S3OutputStream() {
    if (!closed_) {
        abort();
    }
}

void S3OutputStream::write(const char* data, size_t size) {
    if (closed_) {
        throw std::logic_error("Stream for " + key_ + " is already closed");
    }
    if (data == nullptr || size == 0) {
        return;
    }

    while (size > 0) {
        size_t room = part_size_ - buffer_.size();
        size_t to_copy = std::min(size, room);
        buffer_.insert(buffer_.end(), data, data + to_copy);
        data += to_copy;
        size -= to_copy;
        bytes_written_ += to_copy;

        // Keep a full part buffered until more data arrives so that close()
        // always has a non-empty tail part to upload
        if (buffer_.size() == part_size_ && size > 0) {
            uploadPart();
        }
    }
}

void S3OutputStream::close() {
    if (closed_) {
        return;
    }

    try {
        if (isMultipartUpload()) {
            if (!buffer_.empty()) {
                uploadPart();
            }
            client_->completeMultipartUpload(bucket_, key_, upload_id_, parts_);
        } else {
            client_->putObject(bucket_, key_, buffer_.data(), buffer_.size());
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to commit object " << key_ << ": " << e.what() << std::endl;
        abort();
        throw;
    }

    committed_ = true;
    closed_ = true;
    buffer_.clear();
    buffer_.shrink_to_fit();
}

void S3OutputStream::abort() {
    if (isMultipartUpload()) {
        abortMultipartUpload();
    }
    closed_ = true;
    buffer_.clear();
    buffer_.shrink_to_fit();
    parts_.clear();
}

void S3OutputStream::uploadPart() {
    if (!isMultipartUpload()) {
        upload_id_ = client_->createMultipartUpload(bucket_, key_);
        if (upload_id_.empty()) {
            throw StorageException("Empty upload id for multipart upload of " + key_);
        }
    }

    UploadedPart part;
    part.number = static_cast<unsigned int>(parts_.size()) + 1;
    part.size = buffer_.size();
    try {
        part.etag = client_->uploadPart(bucket_, key_, upload_id_, part.number,
                                        buffer_.data(), buffer_.size());
    } catch (const std::exception&) {
        abort();
        throw;
    }
    parts_.push_back(part);
    buffer_.clear();
}

void S3OutputStream::abortMultipartUpload() {
    std::string upload_id = upload_id_;
    upload_id_.clear();
    try {
        client_->abortMultipartUpload(bucket_, key_, upload_id);
    } catch (const std::exception& e) {
        std::cerr << "Warning: Failed to abort multipart upload of " << key_
                  << " (upload " << upload_id << "): " << e.what() << std::endl;
    }
}
