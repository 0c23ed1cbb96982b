#pragma once

#include <arrow/acero/exec_plan.h>
#include <arrow/acero/options.h>
#include <arrow/api.h>
#include <arrow/compute/api.h>
#include <arrow/compute/expression.h>
#include <arrow/dataset/api.h>
#include <arrow/dataset/plan.h>
#include <arrow/filesystem/localfs.h>

#include <algorithm>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "column_view.h"
#include "config.h"
#include "file_utils.h"
#include "results.h"
#include "run_context.h"
#include "table_store.h"
#include "time_utils.h"

/**
 * "Which entities still need enrichment" queries over stored tables.
 *
 * Each query runs as one Acero plan over Dataset scans of the Parquet files:
 *
 *   scan(source) -> filter -> project ---\
 *                                         hashjoin(LEFT_ANTI) -> aggregate -> order_by -> fetch
 *   scan(target) -> filter -> project ---/
 *
 * The join is skipped when the target table has no data.
 */
namespace playledger {

namespace ac = arrow::acero;
namespace ds = arrow::dataset;
namespace cp = arrow::compute;

class GapDetector {
public:
    GapDetector(const TableStore& store, std::map<std::string, GapQuery> queries)
        : store_(store), queries_(std::move(queries)) {
        ds::internal::Initialize();
    }

    GapDetector(const TableStore& store, const StoreConfig& config)
        : GapDetector(store, config.gap_queries()) {}

    /**
     * Names of the configured entity types.
     */
    std::vector<std::string> entity_types() const {
        std::vector<std::string> names;
        for (const auto& entry : queries_) {
            names.push_back(entry.first);
        }
        return names;
    }

    /**
     * Throws std::invalid_argument for an unknown entity type.
     */
    const GapQuery& query(const std::string& entity_type) const {
        auto it = queries_.find(entity_type);
        if (it == queries_.end()) {
            throw std::invalid_argument("Unknown entity type: " + entity_type);
        }
        return it->second;
    }

    /**
     * One page of missing entities.
     */
    GapQueryResult get_batch(RunContext& ctx, const std::string& entity_type,
                             int64_t batch_size, int64_t offset = 0) const {
        if (batch_size < 0 || offset < 0) {
            throw std::invalid_argument("batch_size and offset must not be negative");
        }
        return get_missing(ctx, entity_type, batch_size, offset);
    }

    /**
     * Missing entities in stable order, optionally paged.
     */
    GapQueryResult get_missing(RunContext& ctx, const std::string& entity_type,
                               std::optional<int64_t> limit = std::nullopt,
                               int64_t offset = 0) const {
        const GapQuery& q = query(entity_type);
        StageTimer timer(ctx, "gap_query");

        std::vector<std::string> source_files = files_of(q.source_table);
        if (source_files.empty()) {
            PLAYLEDGER_LOG_WARNING(ctx, "Source table " + q.source_table + " for " + entity_type +
                                        " does not exist");
            return MissingSourceTable{q.source_table};
        }

        ac::Declaration plan = missing_keys(ctx, q, source_files);

        // One row per key; context columns reduce to their minimum
        std::vector<cp::Aggregate> aggregates;
        std::vector<std::string> output;
        output.push_back(q.source_key);
        for (const auto& column : context_columns(q)) {
            aggregates.emplace_back("hash_min", column, column);
            output.push_back(column);
        }
        if (!q.count_column.empty()) {
            aggregates.emplace_back("hash_count",
                                    std::make_shared<cp::CountOptions>(cp::CountOptions::ONLY_VALID),
                                    q.source_key, q.count_column);
            output.push_back(q.count_column);
        }
        if (aggregates.empty()) {
            // Distinct keys only
            aggregates.emplace_back("hash_count",
                                    std::make_shared<cp::CountOptions>(cp::CountOptions::ONLY_VALID),
                                    q.source_key, "__rows");
        }
        plan = ac::Declaration{"aggregate", {std::move(plan)},
                               ac::AggregateNodeOptions{aggregates, {cp::FieldRef(q.source_key)}}};

        std::vector<cp::Expression> select;
        for (const auto& column : output) {
            select.push_back(cp::field_ref(column));
        }
        plan = ac::Declaration{"project", {std::move(plan)}, ac::ProjectNodeOptions{select, output}};

        // Total order: count desc, configured columns, key
        std::vector<cp::SortKey> sort_keys;
        if (!q.count_column.empty()) {
            sort_keys.emplace_back(cp::FieldRef(q.count_column), cp::SortOrder::Descending);
        }
        for (const auto& column : q.order_by) {
            if (column != q.source_key) {
                sort_keys.emplace_back(cp::FieldRef(column), cp::SortOrder::Ascending);
            }
        }
        sort_keys.emplace_back(cp::FieldRef(q.source_key), cp::SortOrder::Ascending);
        plan = ac::Declaration{"order_by", {std::move(plan)},
                               ac::OrderByNodeOptions{cp::Ordering{sort_keys, cp::NullPlacement::AtEnd}}};

        if (limit.has_value() || offset > 0) {
            int64_t count = limit.value_or(std::numeric_limits<int64_t>::max());
            plan = ac::Declaration{"fetch", {std::move(plan)}, ac::FetchNodeOptions{offset, count}};
        }

        TablePtr rows = run(std::move(plan), "gap query " + entity_type);

        GapResult result;
        result.entity_type = entity_type;
        result.key_column = q.source_key;
        result.rows = rows;
        PLAYLEDGER_LOG_INFO(ctx, "Found " + std::to_string(result.size()) + " missing " + entity_type +
                                 " (offset " + std::to_string(offset) + ")");
        return result;
    }

    /**
     * Number of distinct missing keys, computed inside the plan.
     */
    CountResult count_missing(RunContext& ctx, const std::string& entity_type) const {
        const GapQuery& q = query(entity_type);
        StageTimer timer(ctx, "gap_count");

        std::vector<std::string> source_files = files_of(q.source_table);
        if (source_files.empty()) {
            PLAYLEDGER_LOG_WARNING(ctx, "Source table " + q.source_table + " for " + entity_type +
                                        " does not exist");
            return MissingSourceTable{q.source_table};
        }

        ac::Declaration plan = missing_keys(ctx, q, source_files);
        std::vector<cp::Aggregate> aggregates;
        aggregates.emplace_back("count_distinct",
                                std::make_shared<cp::CountOptions>(cp::CountOptions::ONLY_VALID),
                                q.source_key, "missing");
        plan = ac::Declaration{"aggregate", {std::move(plan)}, ac::AggregateNodeOptions{aggregates}};

        TablePtr counted = run(std::move(plan), "gap count " + entity_type);
        ColumnView missing = ColumnView::of(*counted, "missing");
        int64_t count = counted->num_rows() > 0 ? static_cast<int64_t>(missing.double_at(0)) : 0;
        PLAYLEDGER_LOG_INFO(ctx, std::to_string(count) + " " + entity_type + " missing");
        return count;
    }

    /**
     * Which of ids appear in key_column of table. Absent table -> none.
     */
    std::map<std::string, bool> check_exists(RunContext& ctx,
                                             const std::string& table,
                                             const std::string& key_column,
                                             const std::vector<std::string>& ids) const {
        std::map<std::string, bool> exists;
        for (const auto& id : ids) {
            exists[id] = false;
        }
        std::vector<std::string> files = files_of(table);
        if (files.empty() || ids.empty()) {
            return exists;
        }

        auto dataset = open_dataset(files, table);
        auto key_type = column_type(*dataset->schema(), key_column, table);

        ac::Declaration plan = scan(dataset, {key_column});
        plan = ac::Declaration{"filter", {std::move(plan)},
                               ac::FilterNodeOptions{cp::call("is_in", {cp::field_ref(key_column)},
                                   cp::SetLookupOptions(value_set(ids, key_type)))}};
        plan = ac::Declaration{"project", {std::move(plan)},
                               ac::ProjectNodeOptions{{cp::field_ref(key_column)}, {key_column}}};

        TablePtr present = run(std::move(plan), "existence check on " + table);
        ColumnView keys = ColumnView::of(*present, key_column);
        for (int64_t row = 0; row < present->num_rows(); ++row) {
            if (!keys.is_null(row)) {
                exists[keys.string_at(row)] = true;
            }
        }
        PLAYLEDGER_LOG_DEBUG(ctx, "Checked " + std::to_string(ids.size()) + " ids against " + table);
        return exists;
    }

private:
    std::vector<std::string> files_of(const std::string& table) const {
        return file_utils::list_parquet_files(store_.table_path(table));
    }

    static std::vector<std::string> context_columns(const GapQuery& q) {
        std::vector<std::string> columns;
        for (const auto& column : q.context_columns) {
            if (column != q.source_key) {
                columns.push_back(column);
            }
        }
        for (const auto& column : q.order_by) {
            if (column != q.source_key &&
                std::find(columns.begin(), columns.end(), column) == columns.end()) {
                columns.push_back(column);
            }
        }
        return columns;
    }

    /**
     * Source rows that pass the query filters and whose key has no
     * (complete) row in the target.
     */
    ac::Declaration missing_keys(RunContext& ctx, const GapQuery& q,
                                 const std::vector<std::string>& source_files) const {
        auto source = open_dataset(source_files, q.source_table);
        const arrow::Schema& source_schema = *source->schema();
        auto key_type = column_type(source_schema, q.source_key, q.source_table);

        std::vector<std::string> needed{q.source_key};
        auto need = [&needed](const std::string& column) {
            if (!column.empty() && std::find(needed.begin(), needed.end(), column) == needed.end()) {
                needed.push_back(column);
            }
        };
        for (const auto& column : context_columns(q)) need(column);
        for (const auto& column : q.source_required_columns) need(column);
        need(q.recency_column);
        need(q.exclude_column);
        for (const auto& column : needed) {
            column_type(source_schema, column, q.source_table);
        }

        std::vector<cp::Expression> conditions;
        conditions.push_back(cp::call("is_valid", {cp::field_ref(q.source_key)}));
        if (q.skip_empty_keys && is_string(*key_type)) {
            conditions.push_back(cp::not_equal(cp::field_ref(q.source_key), cp::literal(std::string())));
        }
        for (const auto& column : q.source_required_columns) {
            conditions.push_back(cp::call("is_valid", {cp::field_ref(column)}));
        }
        if (!q.recency_column.empty() && q.recency_window_seconds.has_value()) {
            int64_t cutoff_us = ctx.now_us() - *q.recency_window_seconds * time_utils::kMicrosPerSecond;
            conditions.push_back(cp::greater_equal(cp::field_ref(q.recency_column),
                cp::literal(timestamp_scalar(source_schema, q.recency_column, q.source_table, cutoff_us))));
        }
        if (!q.exclude_column.empty() && !q.exclude_values.empty()) {
            auto exclude_type = column_type(source_schema, q.exclude_column, q.source_table);
            conditions.push_back(cp::not_(cp::call("is_in", {cp::field_ref(q.exclude_column)},
                cp::SetLookupOptions(value_set(q.exclude_values, exclude_type)))));
        }

        ac::Declaration source_plan = scan(source, needed);
        source_plan = ac::Declaration{"filter", {std::move(source_plan)},
                                      ac::FilterNodeOptions{cp::and_(conditions)}};
        std::vector<cp::Expression> source_columns;
        for (const auto& column : needed) {
            source_columns.push_back(cp::field_ref(column));
        }
        source_plan = ac::Declaration{"project", {std::move(source_plan)},
                                      ac::ProjectNodeOptions{source_columns, needed}};

        std::vector<std::string> target_files = files_of(q.target_table);
        if (target_files.empty()) {
            PLAYLEDGER_LOG_DEBUG(ctx, "Target table " + q.target_table +
                                      " has no data, every source key is missing");
            return source_plan;
        }

        auto target = open_dataset(target_files, q.target_table);
        const arrow::Schema& target_schema = *target->schema();
        auto target_key_type = column_type(target_schema, q.target_key, q.target_table);

        std::vector<std::string> target_needed{q.target_key};
        for (const auto& column : q.target_required_columns) {
            if (column != q.target_key) {
                target_needed.push_back(column);
            }
        }

        ac::Declaration target_plan = scan(target, target_needed);
        if (!q.target_required_columns.empty()) {
            std::vector<cp::Expression> complete;
            for (const auto& column : q.target_required_columns) {
                complete.push_back(cp::call("is_valid", {cp::field_ref(column)}));
                if (is_string(*column_type(target_schema, column, q.target_table))) {
                    complete.push_back(cp::not_equal(cp::field_ref(column), cp::literal(std::string())));
                    for (const auto& placeholder : q.target_incomplete_values) {
                        complete.push_back(cp::not_equal(cp::field_ref(column), cp::literal(placeholder)));
                    }
                }
            }
            target_plan = ac::Declaration{"filter", {std::move(target_plan)},
                                          ac::FilterNodeOptions{cp::and_(complete)}};
        }

        cp::Expression target_key = cp::field_ref(q.target_key);
        if (!target_key_type->Equals(*key_type)) {
            target_key = cp::call("cast", {target_key}, cp::CastOptions::Safe(key_type));
        }
        target_plan = ac::Declaration{"project", {std::move(target_plan)},
                                      ac::ProjectNodeOptions{{target_key}, {kTargetKey}}};

        ac::HashJoinNodeOptions join{ac::JoinType::LEFT_ANTI,
                                     {cp::FieldRef(q.source_key)},
                                     {cp::FieldRef(kTargetKey)}};
        return ac::Declaration{"hashjoin", {std::move(source_plan), std::move(target_plan)}, join};
    }

    static std::shared_ptr<ds::Dataset> open_dataset(const std::vector<std::string>& files,
                                                     const std::string& table) {
        auto filesystem = std::make_shared<arrow::fs::LocalFileSystem>();
        auto format = std::make_shared<ds::ParquetFileFormat>();
        ds::FileSystemFactoryOptions options;
        auto factory = unwrap(ds::FileSystemDatasetFactory::Make(filesystem, files, format, options),
                              "Failed to open dataset for " + table);
        ds::FinishOptions finish;
        finish.inspect_options.fragments = ds::InspectOptions::kInspectAllFragments;
        return unwrap(factory->Finish(finish), "Failed to inspect dataset for " + table);
    }

    /**
     * Scan materializing only the given columns.
     */
    static ac::Declaration scan(const std::shared_ptr<ds::Dataset>& dataset,
                                const std::vector<std::string>& columns) {
        auto options = std::make_shared<ds::ScanOptions>();
        std::vector<cp::Expression> fields;
        for (const auto& column : columns) {
            fields.push_back(cp::field_ref(column));
        }
        options->projection = cp::project(fields, columns);
        return ac::Declaration{"scan", ds::ScanNodeOptions{dataset, options}};
    }

    static TablePtr run(ac::Declaration plan, const std::string& what) {
        // Single-threaded so ordered output is emitted in order
        return unwrap(ac::DeclarationToTable(std::move(plan), /*use_threads=*/false),
                      "Failed to run " + what);
    }

    static std::shared_ptr<arrow::DataType> column_type(const arrow::Schema& schema,
                                                        const std::string& column,
                                                        const std::string& table) {
        auto field = schema.GetFieldByName(column);
        if (!field) {
            throw StoreError(ErrorKind::SchemaConflict,
                             "Table '" + table + "' has no column '" + column + "'");
        }
        return field->type();
    }

    static bool is_string(const arrow::DataType& type) {
        return type.id() == arrow::Type::STRING || type.id() == arrow::Type::LARGE_STRING;
    }

    /**
     * Lookup set of the column's type built from text values.
     */
    static std::shared_ptr<arrow::Array> value_set(const std::vector<std::string>& values,
                                                   const std::shared_ptr<arrow::DataType>& type) {
        arrow::StringBuilder builder;
        check_status(builder.AppendValues(values), "Failed to build lookup values");
        std::shared_ptr<arrow::Array> strings;
        check_status(builder.Finish(&strings), "Failed to finish lookup values");
        if (type->id() == arrow::Type::STRING) {
            return strings;
        }
        auto cast = cp::Cast(arrow::Datum(strings), type);
        if (!cast.ok()) {
            throw StoreError(ErrorKind::SchemaConflict,
                             "Lookup values cannot be cast to " + type->ToString() + ": " +
                             cast.status().ToString());
        }
        return cast->make_array();
    }

    /**
     * Timestamp literal in the unit and zone of the column.
     */
    static std::shared_ptr<arrow::Scalar> timestamp_scalar(const arrow::Schema& schema,
                                                           const std::string& column,
                                                           const std::string& table,
                                                           int64_t micros) {
        auto type = column_type(schema, column, table);
        if (type->id() != arrow::Type::TIMESTAMP) {
            throw StoreError(ErrorKind::SchemaConflict,
                             "Recency column '" + column + "' of '" + table + "' is " +
                             type->ToString() + ", not a timestamp");
        }
        int64_t value = micros;
        switch (static_cast<const arrow::TimestampType&>(*type).unit()) {
            case arrow::TimeUnit::SECOND: value = micros / time_utils::kMicrosPerSecond; break;
            case arrow::TimeUnit::MILLI:  value = micros / time_utils::kMicrosPerMilli; break;
            case arrow::TimeUnit::MICRO:  break;
            case arrow::TimeUnit::NANO:   value = micros * 1000; break;
        }
        return std::make_shared<arrow::TimestampScalar>(value, type);
    }

    static constexpr const char* kTargetKey = "__target_key";

    const TableStore& store_;
    std::map<std::string, GapQuery> queries_;
};

} // namespace playledger
