#include "minio_s3_client.hpp"
#include "sink_errors.hpp"

#include <miniocpp/client.h>
#include <miniocpp/utils.h>

#include <iostream>
#include <istream>
#include <list>
#include <string_view>

namespace {

template <typename Response>
void throwIfFailed(const Response& response, const std::string& what) {
    if (!response) {
        throw StorageException(what + ": " + response.Error().String());
    }
}

}  // namespace

MinioS3Client::MinioS3Client(const std::string& endpoint,
                             const std::string& access_key,
                             const std::string& secret_key,
                             const std::string& region)
    : endpoint_(endpoint) {
    std::string host = endpoint;
    bool https = true;
    if (host.rfind("https://", 0) == 0) {
        host = host.substr(8);
    } else if (host.rfind("http://", 0) == 0) {
        host = host.substr(7);
        https = false;
    }
    if (host.empty()) {
        throw ConfigException("S3 endpoint must not be empty");
    }

    minio::s3::BaseUrl url(host, https, region);

    if (!access_key.empty()) {
        provider_ = std::make_unique<minio::creds::StaticProvider>(access_key, secret_key);
    }
    client_ = std::make_unique<minio::s3::Client>(url, provider_.get());

    std::cout << "S3 client created for endpoint " << endpoint_
              << " (region " << region << ")" << std::endl;
}

MinioS3Client::~MinioS3Client() = default;

bool MinioS3Client::bucketExists(const std::string& bucket) {
    minio::s3::BucketExistsArgs args;
    args.bucket = bucket;

    auto response = client_->BucketExists(args);
    throwIfFailed(response, "Failed to check bucket " + bucket);
    return response.exist;
}

bool MinioS3Client::objectExists(const std::string& bucket, const std::string& key) {
    minio::s3::StatObjectArgs args;
    args.bucket = bucket;
    args.object = key;

    auto response = client_->StatObject(args);
    if (response) {
        return true;
    }
    // A missing object is an answer, not a failure
    if (response.status_code == 404 || response.code == "NoSuchKey") {
        return false;
    }
    throw StorageException("Failed to stat object " + key + " in bucket " + bucket + ": " +
                           response.Error().String());
}

ObjectListing MinioS3Client::listObjects(const std::string& bucket,
                                         const std::string& prefix,
                                         size_t max_keys) {
    ObjectListing listing;
    listing.bucket = bucket;
    listing.prefix = prefix;

    minio::s3::ListObjectsArgs args;
    args.bucket = bucket;
    args.prefix = prefix;
    args.recursive = true;
    args.max_keys = static_cast<unsigned int>(max_keys);

    minio::s3::ListObjectsResult result = client_->ListObjects(args);
    for (; result; result++) {
        minio::s3::Item item = *result;
        throwIfFailed(item, "Failed to list objects under " + prefix + " in bucket " + bucket);
        if (item.is_prefix) {
            continue;
        }
        if (listing.objects.size() == max_keys) {
            listing.truncated = true;
            break;
        }

        ObjectSummary summary;
        summary.key = item.name;
        summary.size = item.size;
        summary.etag = item.etag;
        listing.objects.push_back(std::move(summary));
    }

    return listing;
}

void MinioS3Client::deleteObject(const std::string& bucket, const std::string& key) {
    minio::s3::RemoveObjectArgs args;
    args.bucket = bucket;
    args.object = key;

    auto response = client_->RemoveObject(args);
    throwIfFailed(response, "Failed to delete object " + key + " from bucket " + bucket);
}

std::string MinioS3Client::putObject(const std::string& bucket,
                                     const std::string& key,
                                     const char* data,
                                     size_t size) {
    minio::utils::CharBuffer buffer(const_cast<char*>(data), size);
    std::istream stream(&buffer);

    minio::s3::PutObjectArgs args(stream, static_cast<long>(size), 0);
    args.bucket = bucket;
    args.object = key;

    auto response = client_->PutObject(args);
    throwIfFailed(response, "Failed to put object " + key + " in bucket " + bucket);
    return response.etag;
}

std::string MinioS3Client::createMultipartUpload(const std::string& bucket, const std::string& key) {
    minio::s3::CreateMultipartUploadArgs args;
    args.bucket = bucket;
    args.object = key;

    auto response = client_->CreateMultipartUpload(args);
    throwIfFailed(response, "Failed to create multipart upload for " + key + " in bucket " + bucket);
    return response.upload_id;
}

std::string MinioS3Client::uploadPart(const std::string& bucket,
                                      const std::string& key,
                                      const std::string& upload_id,
                                      unsigned int part_number,
                                      const char* data,
                                      size_t size) {
    minio::s3::UploadPartArgs args;
    args.bucket = bucket;
    args.object = key;
    args.upload_id = upload_id;
    args.part_number = part_number;
    args.data = std::string_view(data, size);

    auto response = client_->UploadPart(args);
    throwIfFailed(response, "Failed to upload part " + std::to_string(part_number) + " of " + key);
    return response.etag;
}

void MinioS3Client::completeMultipartUpload(const std::string& bucket,
                                            const std::string& key,
                                            const std::string& upload_id,
                                            const std::vector<UploadedPart>& parts) {
    std::list<minio::s3::Part> minio_parts;
    for (const auto& uploaded : parts) {
        minio::s3::Part part;
        part.number = uploaded.number;
        part.etag = uploaded.etag;
        part.size = uploaded.size;
        minio_parts.push_back(part);
    }

    minio::s3::CompleteMultipartUploadArgs args;
    args.bucket = bucket;
    args.object = key;
    args.upload_id = upload_id;
    args.parts = minio_parts;

    auto response = client_->CompleteMultipartUpload(args);
    throwIfFailed(response, "Failed to complete multipart upload of " + key + " in bucket " + bucket);
}

void MinioS3Client::abortMultipartUpload(const std::string& bucket,
                                         const std::string& key,
                                         const std::string& upload_id) {
    minio::s3::AbortMultipartUploadArgs args;
    args.bucket = bucket;
    args.object = key;
    args.upload_id = upload_id;

    auto response = client_->AbortMultipartUpload(args);
    throwIfFailed(response, "Failed to abort multipart upload of " + key + " in bucket " + bucket);
}
