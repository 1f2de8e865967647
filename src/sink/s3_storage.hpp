#ifndef S3_STORAGE_HPP
#define S3_STORAGE_HPP

#include "../config.hpp"
#include "s3_client.hpp"
#include "s3_output_stream.hpp"
#include <memory>
#include <mutex>
#include <string>

// Storage surface the sink writes through. Only what an overwrite-only
// object store can honour is supported; read-back, append and
// create-if-absent throw UnsupportedOperationException instead of being
// emulated.
class S3Storage {
public:
    S3Storage(const SinkConfig& config, const std::string& url, std::shared_ptr<S3Client> client);
    ~S3Storage();

    S3Storage(const S3Storage&) = delete;
    S3Storage& operator=(const S3Storage&) = delete;

    // False for a blank name without touching the store
    bool exists(const std::string& name);
    bool bucketExists();

    // At most s3.list.max.keys entries; check ObjectListing::truncated
    ObjectListing list(const std::string& path_prefix);

    // Deleting the bucket itself is a no-op
    void remove(const std::string& name);

    // Only overwrite == true is supported
    std::unique_ptr<S3OutputStream> create(const std::string& name, bool overwrite);

    bool create(const std::string& name);
    void open(const std::string& path);
    void append(const std::string& path);

    // Releases the client. Safe to call more than once.
    void close();
    bool isClosed() const;

    const std::string& url() const { return url_; }
    const std::string& bucket() const { return bucket_; }
    const SinkConfig& config() const { return config_; }

private:
    SinkConfig config_;
    std::string url_;
    std::string bucket_;
    std::shared_ptr<S3Client> client_;
    mutable std::mutex client_mutex_;

    std::shared_ptr<S3Client> client() const;

    static bool isBlank(const std::string& value);
};

#endif // S3_STORAGE_HPP
