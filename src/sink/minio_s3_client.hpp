#ifndef MINIO_S3_CLIENT_HPP
#define MINIO_S3_CLIENT_HPP

#include "s3_client.hpp"
#include <memory>
#include <string>

namespace minio {
namespace s3 {
class Client;
}
namespace creds {
class StaticProvider;
}
}  // namespace minio

// S3Client backed by minio-cpp. Works against MinIO and AWS S3.
class MinioS3Client : public S3Client {
public:
    MinioS3Client(const std::string& endpoint,
                  const std::string& access_key,
                  const std::string& secret_key,
                  const std::string& region);
    ~MinioS3Client() override;

    MinioS3Client(const MinioS3Client&) = delete;
    MinioS3Client& operator=(const MinioS3Client&) = delete;

    bool bucketExists(const std::string& bucket) override;
    bool objectExists(const std::string& bucket, const std::string& key) override;
    ObjectListing listObjects(const std::string& bucket,
                              const std::string& prefix,
                              size_t max_keys) override;
    void deleteObject(const std::string& bucket, const std::string& key) override;

    std::string putObject(const std::string& bucket,
                          const std::string& key,
                          const char* data,
                          size_t size) override;

    std::string createMultipartUpload(const std::string& bucket, const std::string& key) override;
    std::string uploadPart(const std::string& bucket,
                           const std::string& key,
                           const std::string& upload_id,
                           unsigned int part_number,
                           const char* data,
                           size_t size) override;
    void completeMultipartUpload(const std::string& bucket,
                                 const std::string& key,
                                 const std::string& upload_id,
                                 const std::vector<UploadedPart>& parts) override;
    void abortMultipartUpload(const std::string& bucket,
                              const std::string& key,
                              const std::string& upload_id) override;

private:
    std::string endpoint_;
    std::unique_ptr<minio::creds::StaticProvider> provider_;
    std::unique_ptr<minio::s3::Client> client_;
};

#endif // MINIO_S3_CLIENT_HPP
