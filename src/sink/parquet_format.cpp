#include "parquet_format.hpp"
#include "duckdb_utils.hpp"
#include "sink_errors.hpp"
#include <atomic>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <unistd.h>

namespace {

// Flush pending rows to DuckDB once this many bytes are queued
const size_t kMaxPendingBytes = 1024 * 1024;

const size_t kUploadChunkSize = 1024 * 1024;

// Shared by every provider in the process so local export files never collide
std::atomic<uint64_t> g_next_local_file_id(0);

}  // namespace

ParquetRecordWriter::ParquetRecordWriter(DuckDB& db,
                                         S3Storage& storage,
                                         const std::string& key,
                                         const std::string& table_name,
                                         const std::string& codec)
    : storage_(storage)
    , key_(key)
    , table_name_(table_name)
    , codec_(codec)
    , pending_bytes_(0)
    , staged_records_(0)
    , closed_(false) {
    conn_ = std::make_unique<Connection>(db);

    std::filesystem::path tmp = std::filesystem::temp_directory_path() /
        ("s3sink-" + std::to_string(::getpid()) + "-" + std::to_string(g_next_local_file_id.fetch_add(1)) +
         "-" + table_name_ + ".parquet");
    local_path_ = tmp.string();

    if (!DuckDBUtils::createBufferTable(*conn_, table_name_)) {
        throw SinkException("Failed to create staging table " + table_name_ + " for " + key_);
    }
}

ParquetRecordWriter::~ParquetRecordWriter() {
    close();
}

void ParquetRecordWriter::write(const SinkRecord& record) {
    if (closed_) {
        throw std::logic_error("Parquet writer for " + key_ + " is already closed");
    }
    pending_.push_back(record);
    pending_bytes_ += DuckDBUtils::estimateRecordsSize({record});
    if (pending_bytes_ >= kMaxPendingBytes) {
        insertPending();
    }
}

void ParquetRecordWriter::commit() {
    if (closed_) {
        throw std::logic_error("Parquet writer for " + key_ + " is already closed");
    }
    insertPending();

    auto result = conn_->Query(DuckDBUtils::buildCopyToParquetSQL(table_name_, local_path_, codec_));
    if (result->HasError()) {
        throw SinkException("Failed to export " + table_name_ + " to parquet: " + result->GetError());
    }

    uploadLocalFile();

    std::cout << "Committed " << staged_records_ << " records as parquet object " << key_ << std::endl;
    close();
}

void ParquetRecordWriter::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    pending_.clear();
    DuckDBUtils::dropBufferTable(*conn_, table_name_);
    removeLocalFile();
}

void ParquetRecordWriter::insertPending() {
    if (pending_.empty()) {
        return;
    }

    auto result = conn_->Query(DuckDBUtils::buildInsertSQL(pending_, table_name_));
    if (result->HasError()) {
        throw SinkException("Error inserting to staging table " + table_name_ + ": " + result->GetError());
    }

    staged_records_ += pending_.size();
    pending_.clear();
    pending_bytes_ = 0;
}

void ParquetRecordWriter::uploadLocalFile() {
    std::ifstream file(local_path_, std::ios::binary);
    if (!file.is_open()) {
        throw SinkException("Failed to open exported parquet file " + local_path_);
    }

    auto stream = storage_.create(key_, true);
    std::vector<char> chunk(kUploadChunkSize);
    while (file) {
        file.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        std::streamsize n = file.gcount();
        if (n > 0) {
            stream->write(chunk.data(), static_cast<size_t>(n));
        }
    }
    if (file.bad()) {
        throw SinkException("Failed to read exported parquet file " + local_path_);
    }
    stream->close();
}

void ParquetRecordWriter::removeLocalFile() {
    std::error_code ec;
    std::filesystem::remove(local_path_, ec);
    if (ec) {
        std::cerr << "Warning: Failed to remove " << local_path_ << ": " << ec.message() << std::endl;
    }
}

ParquetRecordWriterProvider::ParquetRecordWriterProvider(S3Storage& storage, const SinkConfig& config)
    : storage_(storage)
    , codec_(config.parquet_codec)
    , next_table_id_(0) {
    // In-memory database; only staging tables live here
    db_ = std::make_unique<DuckDB>(nullptr);
}

std::unique_ptr<RecordWriter> ParquetRecordWriterProvider::getRecordWriter(const std::string& key) {
    std::string table_name = "staging_" + std::to_string(next_table_id_.fetch_add(1));
    return std::make_unique<ParquetRecordWriter>(*db_, storage_, key, table_name, codec_);
}
