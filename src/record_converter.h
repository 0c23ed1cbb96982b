#pragma once

#include <arrow/api.h>

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "column_view.h"
#include "record.h"
#include "results.h"

/**
 * Conversion between collaborator Records and Arrow tables.
 */
namespace playledger {

/**
 * Arrow type used for timestamps written by the store.
 */
inline std::shared_ptr<arrow::DataType> store_timestamp_type() {
    return arrow::timestamp(arrow::TimeUnit::MICRO, "UTC");
}

namespace detail {

enum KindBit : unsigned {
    kString = 1u << 0,
    kInt = 1u << 1,
    kDouble = 1u << 2,
    kBool = 1u << 3,
    kTimestamp = 1u << 4
};

inline unsigned kind_of(const Value& value) {
    switch (value.index()) {
        case 1: return kString;
        case 2: return kInt;
        case 3: return kDouble;
        case 4: return kBool;
        case 5: return kTimestamp;
        default: return 0;
    }
}

/**
 * Arrow type for a column given the kinds of its non-null values.
 * int64 + double widens to double; all-null columns become utf8.
 */
inline std::shared_ptr<arrow::DataType> infer_type(const std::string& column, unsigned kinds) {
    if (kinds == 0 || kinds == kString) return arrow::utf8();
    if (kinds == kInt) return arrow::int64();
    if (kinds == kDouble || kinds == (kInt | kDouble)) return arrow::float64();
    if (kinds == kBool) return arrow::boolean();
    if (kinds == kTimestamp) return store_timestamp_type();
    throw StoreError(ErrorKind::SchemaConflict,
                     "Column '" + column + "' mixes incompatible value types within one batch");
}

} // namespace detail

/**
 * Build an Arrow table from records.
 *
 * Columns appear in first-seen order across the batch; a record missing a
 * column contributes a null. Throws StoreError{SchemaConflict} if a column
 * mixes incompatible value types.
 */
inline TablePtr records_to_table(const std::vector<Record>& records) {
    std::vector<std::string> columns;
    std::set<std::string> seen;
    for (const auto& record : records) {
        for (const auto& field : record.fields()) {
            if (seen.insert(field.first).second) {
                columns.push_back(field.first);
            }
        }
    }

    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;

    for (const auto& column : columns) {
        unsigned kinds = 0;
        for (const auto& record : records) {
            kinds |= detail::kind_of(record.get(column));
        }
        auto type = detail::infer_type(column, kinds);

        std::unique_ptr<arrow::ArrayBuilder> builder;
        check_status(arrow::MakeBuilder(arrow::default_memory_pool(), type, &builder),
                     "Failed to create builder for " + column);
        check_status(builder->Reserve(static_cast<int64_t>(records.size())),
                     "Failed to reserve builder for " + column);

        for (const auto& record : records) {
            const Value& value = record.get(column);
            arrow::Status status;
            if (is_null(value)) {
                status = builder->AppendNull();
            } else if (type->id() == arrow::Type::STRING) {
                status = static_cast<arrow::StringBuilder&>(*builder).Append(std::get<std::string>(value));
            } else if (type->id() == arrow::Type::INT64) {
                status = static_cast<arrow::Int64Builder&>(*builder).Append(std::get<int64_t>(value));
            } else if (type->id() == arrow::Type::DOUBLE) {
                double d = std::holds_alternative<double>(value)
                    ? std::get<double>(value)
                    : static_cast<double>(std::get<int64_t>(value));
                status = static_cast<arrow::DoubleBuilder&>(*builder).Append(d);
            } else if (type->id() == arrow::Type::BOOL) {
                status = static_cast<arrow::BooleanBuilder&>(*builder).Append(std::get<bool>(value));
            } else {
                status = static_cast<arrow::TimestampBuilder&>(*builder).Append(std::get<Timestamp>(value).micros);
            }
            check_status(status, "Arrow append failed for column " + column);
        }

        std::shared_ptr<arrow::Array> array;
        check_status(builder->Finish(&array), "Failed to finish column " + column);
        fields.push_back(arrow::field(column, type));
        arrays.push_back(array);
    }

    return arrow::Table::Make(arrow::schema(fields), arrays,
                              static_cast<int64_t>(records.size()));
}

/**
 * Read one cell back into a Value.
 */
inline Value cell_value(const ColumnView& view, int64_t row) {
    if (view.is_null(row)) {
        return std::monostate{};
    }
    const auto& array = *view.array();
    switch (array.type_id()) {
        case arrow::Type::STRING:
        case arrow::Type::LARGE_STRING:
            return view.string_at(row);
        case arrow::Type::INT64:
            return static_cast<const arrow::Int64Array&>(array).Value(row);
        case arrow::Type::INT8:
        case arrow::Type::INT16:
        case arrow::Type::INT32:
        case arrow::Type::UINT8:
        case arrow::Type::UINT16:
        case arrow::Type::UINT32:
            return static_cast<int64_t>(view.double_at(row));
        case arrow::Type::UINT64:
            return static_cast<int64_t>(static_cast<const arrow::UInt64Array&>(array).Value(row));
        case arrow::Type::FLOAT:
        case arrow::Type::DOUBLE:
            return view.double_at(row);
        case arrow::Type::BOOL:
            return static_cast<const arrow::BooleanArray&>(array).Value(row);
        case arrow::Type::TIMESTAMP:
            return Timestamp{view.timestamp_us_at(row)};
        default:
            return view.string_at(row);
    }
}

/**
 * Materialize a table as records (columns in schema order; nulls kept).
 */
inline std::vector<Record> table_to_records(const arrow::Table& table) {
    std::vector<std::string> names = table.schema()->field_names();
    std::vector<ColumnView> views;
    views.reserve(names.size());
    for (const auto& name : names) {
        views.push_back(ColumnView::of(table, name));
    }

    std::vector<Record> records;
    records.reserve(static_cast<size_t>(table.num_rows()));
    for (int64_t row = 0; row < table.num_rows(); ++row) {
        Record record;
        for (size_t c = 0; c < names.size(); ++c) {
            record.set(names[c], cell_value(views[c], row));
        }
        records.push_back(std::move(record));
    }
    return records;
}

} // namespace playledger
