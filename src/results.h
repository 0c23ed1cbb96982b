#pragma once

#include <arrow/api.h>

#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

/**
 * Result and error types of the store.
 *
 * Expected outcomes (no data yet, nothing to write, no source table) are
 * alternatives of a std::variant. Unexpected failures raise StoreError.
 */
namespace playledger {

enum class ErrorKind {
    NotFound,
    SchemaConflict,
    MissingSourceTable,
    MalformedRecord,
    Io,
    InvalidArgument
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound:           return "NotFound";
        case ErrorKind::SchemaConflict:     return "SchemaConflict";
        case ErrorKind::MissingSourceTable: return "MissingSourceTable";
        case ErrorKind::MalformedRecord:    return "MalformedRecord";
        case ErrorKind::Io:                 return "Io";
        case ErrorKind::InvalidArgument:    return "InvalidArgument";
    }
    return "Unknown";
}

/**
 * Exception for conditions that abort an operation.
 */
class StoreError : public std::runtime_error {
public:
    StoreError(ErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(error_kind_name(kind)) + ": " + message),
          kind_(kind), detail_(message) {}

    ErrorKind kind() const { return kind_; }
    const std::string& detail() const { return detail_; }

private:
    ErrorKind kind_;
    std::string detail_;
};

/**
 * Throw StoreError{Io} if an Arrow status is not OK.
 */
inline void check_status(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw StoreError(ErrorKind::Io, what + " - " + status.ToString());
    }
}

/**
 * Unwrap an Arrow Result or throw StoreError{Io}.
 */
template <typename T>
T unwrap(arrow::Result<T> result, const std::string& what) {
    if (!result.ok()) {
        throw StoreError(ErrorKind::Io, what + " - " + result.status().ToString());
    }
    return std::move(result).ValueOrDie();
}

using TablePtr = std::shared_ptr<arrow::Table>;

// ---------------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------------

/**
 * The table has no data files (never written, or emptied).
 */
struct NotFound {
    std::string table;
};

using ReadResult = std::variant<TablePtr, NotFound>;

inline bool found(const ReadResult& result) {
    return std::holds_alternative<TablePtr>(result);
}

struct TableInfo {
    bool exists = false;
    int64_t record_count = 0;
    std::vector<std::string> columns;
    std::map<std::string, std::string> schema;  // column -> Arrow type name
    size_t file_count = 0;
    std::vector<uint64_t> file_sizes;
};

// ---------------------------------------------------------------------------
// Writes
// ---------------------------------------------------------------------------

enum class WriteMode { Overwrite, Append, Merge };

inline const char* write_mode_name(WriteMode mode) {
    switch (mode) {
        case WriteMode::Overwrite: return "overwrite";
        case WriteMode::Append:    return "append";
        case WriteMode::Merge:     return "merge";
    }
    return "unknown";
}

/**
 * Parse "overwrite", "append" or "merge". Throws std::invalid_argument.
 */
inline WriteMode parse_write_mode(const std::string& name) {
    if (name == "overwrite") return WriteMode::Overwrite;
    if (name == "append") return WriteMode::Append;
    if (name == "merge") return WriteMode::Merge;
    throw std::invalid_argument("Unsupported write mode: " + name);
}

struct WriteSuccess {
    WriteMode mode = WriteMode::Overwrite;
    int64_t records_written = 0;   // rows of the incoming batch that were stored
    int64_t total_records = 0;     // rows in the table after the write
    int64_t records_dropped = 0;   // malformed rows removed under the drop policy
    std::string file_path;
};

struct NoUpdates {
    std::string message;
};

struct WriteError {
    ErrorKind kind = ErrorKind::Io;
    std::string message;
};

using WriteResult = std::variant<WriteSuccess, NoUpdates, WriteError>;

/**
 * "success", "no_updates" or "error".
 */
inline const char* status_name(const WriteResult& result) {
    return std::visit([](const auto& r) -> const char* {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, WriteSuccess>) {
            return "success";
        } else if constexpr (std::is_same_v<T, NoUpdates>) {
            return "no_updates";
        } else {
            return "error";
        }
    }, result);
}

inline bool succeeded(const WriteResult& result) {
    return !std::holds_alternative<WriteError>(result);
}

// ---------------------------------------------------------------------------
// Gap queries
// ---------------------------------------------------------------------------

/**
 * Entities known to the source table but missing from the target.
 * rows holds the key column, context columns and optional play count in
 * the query's order.
 */
struct GapResult {
    std::string entity_type;
    std::string key_column;
    TablePtr rows;

    int64_t size() const { return rows ? rows->num_rows() : 0; }
};

struct MissingSourceTable {
    std::string table;
};

using GapQueryResult = std::variant<GapResult, MissingSourceTable>;
using CountResult = std::variant<int64_t, MissingSourceTable>;

} // namespace playledger
