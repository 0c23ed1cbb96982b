#pragma once

#include <arrow/api.h>

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include "results.h"

/**
 * Typed row access to single-chunk Arrow columns, and the canonical byte
 * encoding of cells used for merge keys and dedup identities.
 */
namespace playledger {

/**
 * Read-only view over one column of a table whose chunks were combined.
 */
class ColumnView {
public:
    ColumnView() = default;

    explicit ColumnView(std::shared_ptr<arrow::Array> array)
        : array_(std::move(array)) {}

    /**
     * View of a named column of a combined table, or an absent view.
     */
    static ColumnView of(const arrow::Table& table, const std::string& name) {
        auto column = table.GetColumnByName(name);
        if (!column) {
            return ColumnView();
        }
        if (column->num_chunks() == 0) {
            return ColumnView(unwrap(arrow::MakeEmptyArray(column->type()),
                                     "Failed to build empty column " + name));
        }
        if (column->num_chunks() == 1) {
            return ColumnView(column->chunk(0));
        }
        auto combined = unwrap(arrow::Concatenate(column->chunks()),
                               "Failed to combine column " + name);
        return ColumnView(combined);
    }

    bool present() const { return array_ != nullptr; }

    /**
     * Absent columns read as null.
     */
    bool is_null(int64_t row) const {
        return !array_ || array_->IsNull(row);
    }

    /**
     * Null or empty string.
     */
    bool is_blank(int64_t row) const {
        if (is_null(row)) return true;
        if (array_->type_id() == arrow::Type::STRING) {
            return static_cast<const arrow::StringArray&>(*array_).value_length(row) == 0;
        }
        if (array_->type_id() == arrow::Type::LARGE_STRING) {
            return static_cast<const arrow::LargeStringArray&>(*array_).value_length(row) == 0;
        }
        return false;
    }

    /**
     * Cell rendered as text (strings verbatim, numbers in decimal).
     */
    std::string string_at(int64_t row) const {
        if (is_null(row)) return std::string();
        switch (array_->type_id()) {
            case arrow::Type::STRING:
                return static_cast<const arrow::StringArray&>(*array_).GetString(row);
            case arrow::Type::LARGE_STRING:
                return static_cast<const arrow::LargeStringArray&>(*array_).GetString(row);
            default: {
                auto scalar = unwrap(array_->GetScalar(row), "Failed to read cell");
                return scalar->ToString();
            }
        }
    }

    /**
     * Numeric cell as double (integers widened). Non-numeric -> 0.
     */
    double double_at(int64_t row) const {
        if (is_null(row)) return 0.0;
        switch (array_->type_id()) {
            case arrow::Type::DOUBLE:
                return static_cast<const arrow::DoubleArray&>(*array_).Value(row);
            case arrow::Type::FLOAT:
                return static_cast<const arrow::FloatArray&>(*array_).Value(row);
            case arrow::Type::INT64:
                return static_cast<double>(static_cast<const arrow::Int64Array&>(*array_).Value(row));
            case arrow::Type::INT32:
                return static_cast<const arrow::Int32Array&>(*array_).Value(row);
            case arrow::Type::UINT32:
                return static_cast<const arrow::UInt32Array&>(*array_).Value(row);
            case arrow::Type::UINT64:
                return static_cast<double>(static_cast<const arrow::UInt64Array&>(*array_).Value(row));
            default:
                return 0.0;
        }
    }

    /**
     * Timestamp cell in microseconds since epoch, whatever the unit.
     */
    int64_t timestamp_us_at(int64_t row) const {
        if (is_null(row) || array_->type_id() != arrow::Type::TIMESTAMP) return 0;
        int64_t raw = static_cast<const arrow::TimestampArray&>(*array_).Value(row);
        const auto& type = static_cast<const arrow::TimestampType&>(*array_->type());
        switch (type.unit()) {
            case arrow::TimeUnit::SECOND: return raw * 1000000;
            case arrow::TimeUnit::MILLI:  return raw * 1000;
            case arrow::TimeUnit::MICRO:  return raw;
            case arrow::TimeUnit::NANO:   return raw / 1000;
        }
        return raw;
    }

    bool is_timestamp() const {
        return array_ && array_->type_id() == arrow::Type::TIMESTAMP;
    }

    /**
     * Append a self-delimiting, type-tagged encoding of one cell.
     * Equal values of the same Arrow type encode to equal bytes.
     */
    void encode(int64_t row, std::string& out) const {
        if (is_null(row)) {
            out += "N;";
            return;
        }
        switch (array_->type_id()) {
            case arrow::Type::STRING:
            case arrow::Type::LARGE_STRING: {
                std::string value = string_at(row);
                out += 's';
                out += std::to_string(value.size());
                out += ':';
                out += value;
                break;
            }
            case arrow::Type::INT8:
            case arrow::Type::INT16:
            case arrow::Type::INT32:
            case arrow::Type::INT64:
            case arrow::Type::UINT8:
            case arrow::Type::UINT16:
            case arrow::Type::UINT32:
            case arrow::Type::UINT64:
                out += 'i';
                out += string_at(row);
                break;
            case arrow::Type::FLOAT:
            case arrow::Type::DOUBLE: {
                char buf[40];
                std::snprintf(buf, sizeof(buf), "%.17g", double_at(row));
                out += 'd';
                out += buf;
                break;
            }
            case arrow::Type::BOOL:
                out += static_cast<const arrow::BooleanArray&>(*array_).Value(row) ? "b1" : "b0";
                break;
            case arrow::Type::TIMESTAMP:
                out += 't';
                out += std::to_string(timestamp_us_at(row));
                break;
            default: {
                std::string value = string_at(row);
                out += 'x';
                out += std::to_string(value.size());
                out += ':';
                out += value;
                break;
            }
        }
        out += ';';
    }

    const std::shared_ptr<arrow::Array>& array() const { return array_; }

private:
    std::shared_ptr<arrow::Array> array_;
};

/**
 * Encodes a fixed list of columns of each row into one key string.
 */
class RowKeyEncoder {
public:
    RowKeyEncoder(const arrow::Table& table, const std::vector<std::string>& columns) {
        for (const auto& name : columns) {
            views_.push_back(ColumnView::of(table, name));
        }
    }

    /**
     * Encoder over every column of the table, in schema order.
     */
    static RowKeyEncoder all_columns(const arrow::Table& table) {
        return RowKeyEncoder(table, table.schema()->field_names());
    }

    std::string encode(int64_t row) const {
        std::string key;
        key.reserve(views_.size() * 16);
        for (const auto& view : views_) {
            view.encode(row, key);
        }
        return key;
    }

    /**
     * True if any of the key columns is null at row.
     */
    bool has_null(int64_t row) const {
        for (const auto& view : views_) {
            if (view.is_null(row)) {
                return true;
            }
        }
        return false;
    }

private:
    std::vector<ColumnView> views_;
};

} // namespace playledger
