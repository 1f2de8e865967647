#ifndef DUCKDB_UTILS_HPP
#define DUCKDB_UTILS_HPP

#include "sink_record.hpp"
#include "duckdb.hpp"
#include <chrono>
#include <map>
#include <string>
#include <vector>

using duckdb::Connection;

// SQL helpers for staging records in DuckDB before they are exported
class DuckDBUtils {
public:
    // SQL string escaping
    static std::string escapeSqlString(const std::string& str);

    // Format timestamp for SQL
    static std::string formatTimestamp(const std::chrono::system_clock::time_point& tp);

    // Lowercase hex encoding of raw bytes, for from_hex()
    static std::string bytesToHex(const std::string& bytes);

    // Format headers map for SQL
    static std::string formatHeadersMap(const std::map<std::string, std::string>& headers);

    // Create a staging table with the record layout
    static bool createBufferTable(Connection& conn, const std::string& table_name);

    // Drop a staging table
    static bool dropBufferTable(Connection& conn, const std::string& table_name);

    // Build INSERT statement for records into a staging table
    static std::string buildInsertSQL(const std::vector<SinkRecord>& records,
                                      const std::string& table_name);

    // Build COPY statement exporting a staging table to a parquet file
    static std::string buildCopyToParquetSQL(const std::string& table_name,
                                             const std::string& path,
                                             const std::string& codec);

    // Estimate size of records in bytes
    static size_t estimateRecordsSize(const std::vector<SinkRecord>& records);
};

#endif // DUCKDB_UTILS_HPP
