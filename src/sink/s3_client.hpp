#ifndef S3_CLIENT_HPP
#define S3_CLIENT_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct ObjectSummary {
    std::string key;
    size_t size = 0;
    std::string etag;
};

// One page of a listing. truncated is set when the store holds more keys
// under the prefix than were returned.
struct ObjectListing {
    std::string bucket;
    std::string prefix;
    std::vector<ObjectSummary> objects;
    bool truncated = false;
};

struct UploadedPart {
    unsigned int number = 0;
    std::string etag;
    size_t size = 0;
};

// Raw object store calls. Implementations throw StorageException when the
// remote call fails and must be safe to share across partition writers.
class S3Client {
public:
    virtual ~S3Client() = default;

    virtual bool bucketExists(const std::string& bucket) = 0;
    virtual bool objectExists(const std::string& bucket, const std::string& key) = 0;
    virtual ObjectListing listObjects(const std::string& bucket,
                                      const std::string& prefix,
                                      size_t max_keys) = 0;
    virtual void deleteObject(const std::string& bucket, const std::string& key) = 0;

    // Single-request upload. Returns the etag.
    virtual std::string putObject(const std::string& bucket,
                                  const std::string& key,
                                  const char* data,
                                  size_t size) = 0;

    // Multipart upload. Parts stay invisible until completeMultipartUpload.
    virtual std::string createMultipartUpload(const std::string& bucket, const std::string& key) = 0;
    virtual std::string uploadPart(const std::string& bucket,
                                   const std::string& key,
                                   const std::string& upload_id,
                                   unsigned int part_number,
                                   const char* data,
                                   size_t size) = 0;
    virtual void completeMultipartUpload(const std::string& bucket,
                                         const std::string& key,
                                         const std::string& upload_id,
                                         const std::vector<UploadedPart>& parts) = 0;
    virtual void abortMultipartUpload(const std::string& bucket,
                                      const std::string& key,
                                      const std::string& upload_id) = 0;
};

#endif // S3_CLIENT_HPP
