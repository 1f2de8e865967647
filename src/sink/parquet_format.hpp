#ifndef PARQUET_FORMAT_HPP
#define PARQUET_FORMAT_HPP

#include "record_writer.hpp"
#include "s3_storage.hpp"
#include "duckdb.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <vector>

using duckdb::DuckDB;
using duckdb::Connection;

// Stages records in a DuckDB table and exports them as one parquet object
// on commit. Each writer has its own connection and staging table.
class ParquetRecordWriter : public RecordWriter {
public:
    ParquetRecordWriter(DuckDB& db,
                        S3Storage& storage,
                        const std::string& key,
                        const std::string& table_name,
                        const std::string& codec);
    ~ParquetRecordWriter() override;

    void write(const SinkRecord& record) override;
    void commit() override;
    void close() override;

    size_t getStagedRecordCount() const { return staged_records_; }
    const std::string& getLocalPath() const { return local_path_; }

private:
    S3Storage& storage_;
    std::string key_;
    std::string table_name_;
    std::string codec_;
    std::string local_path_;
    std::unique_ptr<Connection> conn_;

    std::vector<SinkRecord> pending_;
    size_t pending_bytes_;
    size_t staged_records_;
    bool closed_;

    // Insert pending records into the staging table
    void insertPending();

    // Stream the exported parquet file into the object store
    void uploadLocalFile();

    void removeLocalFile();
};

class ParquetRecordWriterProvider : public RecordWriterProvider {
public:
    ParquetRecordWriterProvider(S3Storage& storage, const SinkConfig& config);

    std::string getExtension() const override { return ".parquet"; }
    std::unique_ptr<RecordWriter> getRecordWriter(const std::string& key) override;

private:
    S3Storage& storage_;
    std::string codec_;

    // Shared in-memory instance; connections are per-writer
    std::unique_ptr<DuckDB> db_;
    std::atomic<uint64_t> next_table_id_;
};

#endif // PARQUET_FORMAT_HPP
