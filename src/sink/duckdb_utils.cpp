#include "duckdb_utils.hpp"
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

std::string DuckDBUtils::escapeSqlString(const std::string& str) {
    std::string result;
    result.reserve(str.size() * 1.2);
    for (char c : str) {
        if (c == '\'') {
            result += "''";  // Escape single quotes
        } else {
            result += c;
        }
    }
    return result;
}

std::string DuckDBUtils::formatTimestamp(const std::chrono::system_clock::time_point& tp) {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_val;
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string DuckDBUtils::bytesToHex(const std::string& bytes) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(bytes.size() * 2);
    for (unsigned char c : bytes) {
        result += hex_chars[(c >> 4) & 0x0F];
        result += hex_chars[c & 0x0F];
    }
    return result;
}

std::string DuckDBUtils::formatHeadersMap(const std::map<std::string, std::string>& headers) {
    if (headers.empty()) {
        return "MAP([]::VARCHAR[], []::VARCHAR[])";
    }

    std::ostringstream keys, values;
    keys << "[";
    values << "[";

    bool first = true;
    for (const auto& kv : headers) {
        if (!first) {
            keys << ", ";
            values << ", ";
        }
        first = false;
        keys << "'" << escapeSqlString(kv.first) << "'";
        values << "'" << escapeSqlString(kv.second) << "'";
    }

    keys << "]";
    values << "]";

    return "MAP(" + keys.str() + ", " + values.str() + ")";
}

bool DuckDBUtils::createBufferTable(Connection& conn, const std::string& table_name) {
    try {
        std::ostringstream create_sql;
        create_sql << "CREATE TABLE IF NOT EXISTS " << table_name << " (\n"
                   << "  _kafka_topic VARCHAR,\n"
                   << "  _kafka_partition INTEGER,\n"
                   << "  _kafka_offset BIGINT,\n"
                   << "  timestamp TIMESTAMP,\n"
                   << "  record_key BLOB,\n"
                   << "  record_value BLOB,\n"
                   << "  headers MAP(VARCHAR, VARCHAR)\n"
                   << ");";

        auto result = conn.Query(create_sql.str());
        if (result->HasError()) {
            std::cerr << "Error creating buffer table " << table_name << ": " << result->GetError() << std::endl;
            return false;
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error creating buffer table " << table_name << ": " << e.what() << std::endl;
        return false;
    }
}

bool DuckDBUtils::dropBufferTable(Connection& conn, const std::string& table_name) {
    try {
        auto result = conn.Query("DROP TABLE IF EXISTS " + table_name + ";");
        if (result->HasError()) {
            std::cerr << "Warning: Failed to drop buffer table " << table_name << ": "
                      << result->GetError() << std::endl;
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Warning: Failed to drop buffer table " << table_name << ": " << e.what() << std::endl;
        return false;
    }
}

std::string DuckDBUtils::buildInsertSQL(const std::vector<SinkRecord>& records,
                                        const std::string& table_name) {
    std::ostringstream sql;
    sql << "INSERT INTO " << table_name << " VALUES ";

    bool first = true;
    for (const auto& record : records) {
        if (!first) {
            sql << ", ";
        }
        first = false;

        sql << "("
            << "'" << escapeSqlString(record.topic) << "', "
            << record.kafka_partition << ", "
            << record.kafka_offset << ", "
            << "'" << formatTimestamp(record.timestamp) << "', "
            << "from_hex('" << bytesToHex(record.key) << "'), "
            << "from_hex('" << bytesToHex(record.value) << "'), "
            << formatHeadersMap(record.headers)
            << ")";
    }
    sql << ";";

    return sql.str();
}

std::string DuckDBUtils::buildCopyToParquetSQL(const std::string& table_name,
                                               const std::string& path,
                                               const std::string& codec) {
    std::ostringstream sql;
    sql << "COPY " << table_name
        << " TO '" << escapeSqlString(path) << "'"
        << " (FORMAT PARQUET, COMPRESSION '" << escapeSqlString(codec) << "');";
    return sql.str();
}

size_t DuckDBUtils::estimateRecordsSize(const std::vector<SinkRecord>& records) {
    size_t estimated_size = 0;
    for (const auto& record : records) {
        estimated_size += record.topic.size() + sizeof(record.kafka_partition) +
                          sizeof(record.kafka_offset) + record.key.size() + record.value.size();
        for (const auto& header : record.headers) {
            estimated_size += header.first.size() + header.second.size();
        }
        estimated_size += 64; // overhead
    }
    return estimated_size;
}
