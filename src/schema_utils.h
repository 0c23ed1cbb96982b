#pragma once

#include <arrow/api.h>
#include <arrow/compute/api.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "results.h"

/**
 * Schema union for tables written at different times.
 *
 * The stored schema only ever grows: a column missing on one side is
 * null-filled, numeric columns widen (int -> int64 -> float64), an all-null
 * column adopts the other side's type, and anything else is a
 * SchemaConflict.
 */
namespace playledger {

namespace detail {

inline bool is_integer_type(const arrow::DataType& type) {
    return arrow::is_integer(type.id());
}

inline bool is_floating_type(const arrow::DataType& type) {
    return arrow::is_floating(type.id());
}

inline bool is_string_type(const arrow::DataType& type) {
    return type.id() == arrow::Type::STRING || type.id() == arrow::Type::LARGE_STRING;
}

inline bool all_null(const arrow::ChunkedArray& column) {
    return column.type()->id() == arrow::Type::NA || column.null_count() == column.length();
}

/**
 * Common type of two columns, or nullptr when they are incompatible.
 */
inline std::shared_ptr<arrow::DataType> common_type(const arrow::ChunkedArray& left,
                                                     const arrow::ChunkedArray& right) {
    const auto& lt = left.type();
    const auto& rt = right.type();

    if (lt->Equals(*rt)) return lt;

    // Empty or all-null side takes the other side's type; prefer the left
    // (stored) type when both are null.
    if (all_null(left) && right.type()->id() != arrow::Type::NA) return rt;
    if (all_null(right)) return lt;

    if (is_integer_type(*lt) && is_integer_type(*rt)) return arrow::int64();
    if ((is_integer_type(*lt) || is_floating_type(*lt)) &&
        (is_integer_type(*rt) || is_floating_type(*rt))) {
        return arrow::float64();
    }
    if (is_string_type(*lt) && is_string_type(*rt)) return arrow::utf8();
    if (lt->id() == arrow::Type::TIMESTAMP && rt->id() == arrow::Type::TIMESTAMP) {
        return arrow::timestamp(arrow::TimeUnit::MICRO, "UTC");
    }
    return nullptr;
}

inline std::shared_ptr<arrow::ChunkedArray> cast_column(const std::shared_ptr<arrow::ChunkedArray>& column,
                                                        const std::shared_ptr<arrow::DataType>& type,
                                                        const std::string& name) {
    if (column->type()->Equals(*type)) {
        return column;
    }
    if (all_null(*column)) {
        auto nulls = unwrap(arrow::MakeArrayOfNull(type, column->length()),
                            "Failed to null-fill column " + name);
        return std::make_shared<arrow::ChunkedArray>(arrow::ArrayVector{nulls}, type);
    }
    auto cast = arrow::compute::Cast(arrow::Datum(column), type);
    if (!cast.ok()) {
        throw StoreError(ErrorKind::SchemaConflict,
                         "Cannot convert column '" + name + "' from " + column->type()->ToString() +
                         " to " + type->ToString() + ": " + cast.status().ToString());
    }
    return cast.ValueOrDie().chunked_array();
}

inline std::shared_ptr<arrow::ChunkedArray> null_column(const std::shared_ptr<arrow::DataType>& type,
                                                        int64_t length,
                                                        const std::string& name) {
    auto nulls = unwrap(arrow::MakeArrayOfNull(type, length),
                        "Failed to null-fill column " + name);
    return std::make_shared<arrow::ChunkedArray>(arrow::ArrayVector{nulls}, type);
}

} // namespace detail

/**
 * Two tables rewritten onto one schema.
 */
struct HarmonizedPair {
    TablePtr left;
    TablePtr right;
};

/**
 * Put left (stored) and right (incoming) on the union schema.
 * Column order: left's columns, then right-only columns in right's order.
 * Throws StoreError{SchemaConflict} on incompatible shared columns.
 */
inline HarmonizedPair harmonize(const TablePtr& left, const TablePtr& right) {
    std::vector<std::string> names = left->schema()->field_names();
    for (const auto& name : right->schema()->field_names()) {
        if (!left->GetColumnByName(name)) {
            names.push_back(name);
        }
    }

    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::ChunkedArray>> left_columns;
    std::vector<std::shared_ptr<arrow::ChunkedArray>> right_columns;

    for (const auto& name : names) {
        auto lc = left->GetColumnByName(name);
        auto rc = right->GetColumnByName(name);

        std::shared_ptr<arrow::DataType> type;
        if (lc && rc) {
            type = detail::common_type(*lc, *rc);
            if (!type) {
                throw StoreError(ErrorKind::SchemaConflict,
                                 "Column '" + name + "' is " + lc->type()->ToString() +
                                 " in the table but " + rc->type()->ToString() + " in the batch");
            }
        } else {
            type = lc ? lc->type() : rc->type();
        }
        // Never persist the untyped null type
        if (type->id() == arrow::Type::NA) {
            type = arrow::utf8();
        }

        left_columns.push_back(lc ? detail::cast_column(lc, type, name)
                                  : detail::null_column(type, left->num_rows(), name));
        right_columns.push_back(rc ? detail::cast_column(rc, type, name)
                                   : detail::null_column(type, right->num_rows(), name));
        fields.push_back(arrow::field(name, type));
    }

    auto schema = arrow::schema(fields);
    return HarmonizedPair{
        arrow::Table::Make(schema, left_columns, left->num_rows()),
        arrow::Table::Make(schema, right_columns, right->num_rows())
    };
}

/**
 * Harmonize and concatenate tables in order.
 */
inline TablePtr concat_tables(const std::vector<TablePtr>& tables) {
    if (tables.empty()) {
        throw StoreError(ErrorKind::InvalidArgument, "concat_tables needs at least one table");
    }
    TablePtr acc = tables.front();
    for (size_t i = 1; i < tables.size(); ++i) {
        HarmonizedPair pair = harmonize(acc, tables[i]);
        acc = unwrap(arrow::ConcatenateTables({pair.left, pair.right}),
                     "Failed to concatenate tables");
    }
    if (tables.size() == 1) {
        // Still normalize the schema (drop file metadata, fix null type)
        HarmonizedPair pair = harmonize(acc, acc->Slice(0, 0));
        acc = pair.left;
    }
    return acc;
}

/**
 * Select rows of a table by index (in the given order).
 */
inline TablePtr take_rows(const TablePtr& table, const std::vector<int64_t>& indices) {
    arrow::Int64Builder builder;
    check_status(builder.AppendValues(indices), "Failed to build row indices");
    std::shared_ptr<arrow::Array> index_array;
    check_status(builder.Finish(&index_array), "Failed to finish row indices");

    auto taken = unwrap(arrow::compute::Take(arrow::Datum(table), arrow::Datum(index_array)),
                        "Failed to select rows");
    return taken.table();
}

} // namespace playledger
