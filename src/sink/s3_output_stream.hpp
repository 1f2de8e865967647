#ifndef S3_OUTPUT_STREAM_HPP
#define S3_OUTPUT_STREAM_HPP

#include "s3_client.hpp"
#include <memory>
#include <string>
#include <vector>

// Turns a sequence of writes into one remote object. Nothing is visible to
// readers until close() succeeds; on failure the multipart upload is aborted
// so the previous object at the key (if any) stays untouched.
//
// Small objects go out as a single PUT. Once more than one part worth of
// data has been written, the stream switches to a multipart upload and
// completes it on close().
class S3OutputStream {
public:
    S3OutputStream(std::shared_ptr<S3Client> client,
                   const std::string& bucket,
                   const std::string& key,
                   size_t part_size);
    ~S3OutputStream();

    S3OutputStream(const S3OutputStream&) = delete;
    S3OutputStream& operator=(const S3OutputStream&) = delete;

    void write(const char* data, size_t size);
    void write(const std::string& data) { write(data.data(), data.size()); }

    // Commit the object. A second call is a no-op.
    void close();

    // Discard everything written so far
    void abort();

    bool isClosed() const { return closed_; }
    bool isCommitted() const { return committed_; }
    size_t getBytesWritten() const { return bytes_written_; }
    size_t getPartCount() const { return parts_.size(); }
    const std::string& getKey() const { return key_; }

private:
    std::shared_ptr<S3Client> client_;
    std::string bucket_;
    std::string key_;
    size_t part_size_;

    std::vector<char> buffer_;
    std::string upload_id_;
    std::vector<UploadedPart> parts_;
    size_t bytes_written_;
    bool closed_;
    bool committed_;

    bool isMultipartUpload() const { return !upload_id_.empty(); }

    // Upload the buffered bytes as the next part, starting the upload if needed
    void uploadPart();

    // Abort the in-flight multipart upload, logging (not throwing) on failure
    void abortMultipartUpload();
};

#endif // S3_OUTPUT_STREAM_HPP
