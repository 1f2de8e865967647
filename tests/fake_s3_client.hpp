#ifndef FAKE_S3_CLIENT_HPP
#define FAKE_S3_CLIENT_HPP

#include "../src/sink/s3_client.hpp"
#include "../src/sink/sink_errors.hpp"
#include <map>
#include <mutex>
#include <string>
#include <vector>

// In-memory object store for tests. Multipart uploads stay invisible until
// completed. Counts every call and can be told to fail uploads whose key
// contains a given substring.
class FakeS3Client : public S3Client {
public:
    struct Upload {
        std::string bucket;
        std::string key;
        std::map<unsigned int, std::string> parts;
    };

    explicit FakeS3Client(const std::string& bucket = "test-bucket") {
        buckets_.push_back(bucket);
    }

    bool bucketExists(const std::string& bucket) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++bucket_exists_calls;
        for (const auto& b : buckets_) {
            if (b == bucket) {
                return true;
            }
        }
        return false;
    }

    bool objectExists(const std::string& bucket, const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++object_exists_calls;
        return objects_.count(bucket + "/" + key) > 0;
    }

    ObjectListing listObjects(const std::string& bucket, const std::string& prefix, size_t max_keys) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++list_calls;
        ObjectListing listing;
        listing.bucket = bucket;
        listing.prefix = prefix;
        std::string full_prefix = bucket + "/" + prefix;
        for (const auto& kv : objects_) {
            if (kv.first.compare(0, full_prefix.size(), full_prefix) != 0) {
                continue;
            }
            if (listing.objects.size() == max_keys) {
                listing.truncated = true;
                break;
            }
            ObjectSummary summary;
            summary.key = kv.first.substr(bucket.size() + 1);
            summary.size = kv.second.size();
            summary.etag = "etag";
            listing.objects.push_back(summary);
        }
        return listing;
    }

    void deleteObject(const std::string& bucket, const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++delete_calls;
        objects_.erase(bucket + "/" + key);
    }

    std::string putObject(const std::string& bucket,
                          const std::string& key,
                          const char* data,
                          size_t size) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++put_calls;
        failIfRequested(key);
        objects_[bucket + "/" + key] = size > 0 ? std::string(data, size) : std::string();
        return "etag-" + std::to_string(put_calls);
    }

    std::string createMultipartUpload(const std::string& bucket, const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++create_upload_calls;
        failIfRequested(key);
        std::string id = "upload-" + std::to_string(create_upload_calls);
        uploads_[id] = Upload{bucket, key, {}};
        return id;
    }

    std::string uploadPart(const std::string& bucket,
                           const std::string& key,
                           const std::string& upload_id,
                           unsigned int part_number,
                           const char* data,
                           size_t size) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++upload_part_calls;
        if (fail_upload_part_number != 0 && part_number == fail_upload_part_number) {
            throw StorageException("Injected failure uploading part " + std::to_string(part_number) + " of " + key);
        }
        auto it = uploads_.find(upload_id);
        if (it == uploads_.end() || it->second.bucket != bucket || it->second.key != key) {
            throw StorageException("NoSuchUpload: " + upload_id);
        }
        it->second.parts[part_number] = std::string(data, size);
        return "part-etag-" + std::to_string(part_number);
    }

    void completeMultipartUpload(const std::string& bucket,
                                 const std::string& key,
                                 const std::string& upload_id,
                                 const std::vector<UploadedPart>& parts) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++complete_calls;
        failIfRequested(key);
        auto it = uploads_.find(upload_id);
        if (it == uploads_.end()) {
            throw StorageException("NoSuchUpload: " + upload_id);
        }
        std::string content;
        for (const auto& part : parts) {
            content += it->second.parts.at(part.number);
        }
        objects_[bucket + "/" + key] = content;
        uploads_.erase(it);
    }

    void abortMultipartUpload(const std::string& bucket,
                              const std::string& key,
                              const std::string& upload_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++abort_calls;
        (void)bucket;
        (void)key;
        uploads_.erase(upload_id);
    }

    // Test helpers
    void addBucket(const std::string& bucket) {
        std::lock_guard<std::mutex> lock(mutex_);
        buckets_.push_back(bucket);
    }

    void putRaw(const std::string& bucket, const std::string& key, const std::string& content) {
        std::lock_guard<std::mutex> lock(mutex_);
        objects_[bucket + "/" + key] = content;
    }

    bool hasObject(const std::string& bucket, const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return objects_.count(bucket + "/" + key) > 0;
    }

    std::string getObject(const std::string& bucket, const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = objects_.find(bucket + "/" + key);
        return it == objects_.end() ? std::string() : it->second;
    }

    // Keys (without bucket) of every visible object, sorted
    std::vector<std::string> getKeys(const std::string& bucket) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> keys;
        for (const auto& kv : objects_) {
            if (kv.first.compare(0, bucket.size() + 1, bucket + "/") == 0) {
                keys.push_back(kv.first.substr(bucket.size() + 1));
            }
        }
        return keys;
    }

    size_t getObjectCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return objects_.size();
    }

    size_t getOpenUploadCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return uploads_.size();
    }

    size_t totalCalls() const {
        return bucket_exists_calls + object_exists_calls + list_calls + delete_calls + put_calls +
               create_upload_calls + upload_part_calls + complete_calls + abort_calls;
    }

    // Failure injection
    std::string fail_key_substring;
    unsigned int fail_upload_part_number = 0;

    // Call counters
    size_t bucket_exists_calls = 0;
    size_t object_exists_calls = 0;
    size_t list_calls = 0;
    size_t delete_calls = 0;
    size_t put_calls = 0;
    size_t create_upload_calls = 0;
    size_t upload_part_calls = 0;
    size_t complete_calls = 0;
    size_t abort_calls = 0;

private:
    mutable std::mutex mutex_;
    std::vector<std::string> buckets_;
    std::map<std::string, std::string> objects_;
    std::map<std::string, Upload> uploads_;

    void failIfRequested(const std::string& key) {
        if (!fail_key_substring.empty() && key.find(fail_key_substring) != std::string::npos) {
            throw StorageException("Injected failure writing " + key);
        }
    }
};

#endif // FAKE_S3_CLIENT_HPP
