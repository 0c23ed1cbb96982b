#pragma once

#include <algorithm>
#include <map>
#include <string>
#include <system_error>
#include <vector>

#include "config.h"
#include "file_utils.h"
#include "merge_engine.h"
#include "parquet_reader.h"
#include "parquet_writer.h"
#include "record.h"
#include "record_converter.h"
#include "results.h"
#include "run_context.h"
#include "schema_utils.h"
#include "string_utils.h"

/**
 * Named Parquet tables under one base directory:
 *   <base_path>/<table>/part-0000.parquet
 *
 * Every write produces the complete new contents of the table in
 * <table>.inprogress/ and then swaps it in for the live directory.
 */
namespace playledger {

class TableStore {
public:
    explicit TableStore(const StoreConfig& config)
        : base_path_(config.base_path()),
          compression_(config.compression()),
          row_group_size_(config.row_group_size()),
          engine_(config.merge_keys(), config.malformed_policy()) {}

    const fs::path& base_path() const { return base_path_; }
    const MergeEngine& merge_engine() const { return engine_; }

    fs::path table_path(const std::string& name) const {
        validate_name(name);
        return base_path_ / name;
    }

    /**
     * Load every data file of the table, in file name order.
     * Missing or empty directory -> NotFound.
     */
    ReadResult read_table(RunContext& ctx, const std::string& name) const {
        std::vector<std::string> files = file_utils::list_parquet_files(table_path(name));
        if (files.empty()) {
            PLAYLEDGER_LOG_DEBUG(ctx, "Table not found: " + name);
            return NotFound{name};
        }

        StageTimer timer(ctx, "read_table");
        std::vector<TablePtr> parts;
        parts.reserve(files.size());
        for (const auto& file : files) {
            ParquetReader reader(file);
            parts.push_back(reader.read_all());
        }
        TablePtr table = concat_tables(parts);
        PLAYLEDGER_LOG_DEBUG(ctx, "Read " + std::to_string(table->num_rows()) + " rows from " +
                                  name + " (" + std::to_string(files.size()) + " file(s))");
        return table;
    }

    /**
     * Write records to a table. A batch whose records disagree on a
     * column's type is a SchemaConflict.
     */
    WriteResult write_table(RunContext& ctx,
                            const std::string& name,
                            const std::vector<Record>& records,
                            WriteMode mode) {
        if (records.empty()) {
            return NoUpdates{"No records to write to " + name};
        }
        TablePtr batch;
        try {
            batch = records_to_table(records);
        } catch (const StoreError& e) {
            PLAYLEDGER_LOG_ERROR(ctx, "Rejected batch for " + name + ": " + e.detail());
            return WriteError{e.kind(), e.detail()};
        }
        return write_table(ctx, name, batch, mode);
    }

    /**
     * Write an Arrow table in the given mode.
     *
     * On any failure the live table directory is left as it was and a
     * WriteError is returned.
     */
    WriteResult write_table(RunContext& ctx,
                            const std::string& name,
                            const TablePtr& batch,
                            WriteMode mode) {
        if (!batch || batch->num_rows() == 0) {
            return NoUpdates{"No records to write to " + name};
        }

        try {
            StageTimer timer(ctx, "write_table");

            TablePtr existing;
            if (mode != WriteMode::Overwrite) {
                ReadResult current = read_table(ctx, name);
                if (found(current)) {
                    existing = std::get<TablePtr>(current);
                }
            }

            MergeOutcome outcome = engine_.apply(ctx, name, existing, batch, mode);
            if (outcome.records_written == 0) {
                return NoUpdates{"No valid records to write to " + name + " (" +
                                 std::to_string(outcome.records_dropped) + " malformed)"};
            }

            std::string file_path = replace_contents(name, outcome.table);

            ctx.metrics().add("records_written", outcome.records_written);
            PLAYLEDGER_LOG_INFO(ctx, std::string(write_mode_name(mode)) + " " + name + ": " +
                                     std::to_string(outcome.records_written) + " written, " +
                                     std::to_string(outcome.records_replaced) + " replaced, " +
                                     std::to_string(outcome.table->num_rows()) + " total");

            WriteSuccess success;
            success.mode = mode;
            success.records_written = outcome.records_written;
            success.total_records = outcome.table->num_rows();
            success.records_dropped = outcome.records_dropped;
            success.file_path = file_path;
            return success;
        } catch (const StoreError& e) {
            PLAYLEDGER_LOG_ERROR(ctx, "Failed to write " + name + ": " + e.detail());
            return WriteError{e.kind(), e.detail()};
        } catch (const fs::filesystem_error& e) {
            PLAYLEDGER_LOG_ERROR(ctx, "Failed to write " + name + ": " + e.what());
            return WriteError{ErrorKind::Io, e.what()};
        } catch (const std::runtime_error& e) {
            PLAYLEDGER_LOG_ERROR(ctx, "Failed to write " + name + ": " + e.what());
            return WriteError{ErrorKind::Io, e.what()};
        }
    }

    /**
     * True iff the table directory holds at least one data file.
     */
    bool table_exists(const std::string& name) const {
        return !file_utils::list_parquet_files(table_path(name)).empty();
    }

    /**
     * Row count, columns and file sizes from Parquet footers.
     */
    TableInfo table_info(RunContext& ctx, const std::string& name) const {
        TableInfo info;
        std::vector<std::string> files = file_utils::list_parquet_files(table_path(name));
        if (files.empty()) {
            return info;
        }

        info.exists = true;
        info.file_count = files.size();
        for (const auto& file : files) {
            ParquetReader reader(file);
            info.record_count += reader.num_rows();
            info.file_sizes.push_back(static_cast<uint64_t>(fs::file_size(file)));
            for (const auto& field : reader.schema()->fields()) {
                if (info.schema.emplace(field->name(), field->type()->ToString()).second) {
                    info.columns.push_back(field->name());
                }
            }
        }
        PLAYLEDGER_LOG_DEBUG(ctx, "Table " + name + ": " + std::to_string(info.record_count) +
                                  " rows in " + std::to_string(info.file_count) + " file(s)");
        return info;
    }

    /**
     * Remove all but the newest keep_latest data files (by modification
     * time). Returns the number of files removed.
     */
    size_t cleanup_old_files(RunContext& ctx, const std::string& name, size_t keep_latest) {
        std::vector<std::string> files = file_utils::list_parquet_files(table_path(name));
        if (files.size() <= keep_latest) {
            return 0;
        }

        std::vector<std::pair<fs::file_time_type, std::string>> by_age;
        for (const auto& file : files) {
            by_age.emplace_back(fs::last_write_time(file), file);
        }
        // Newest first; name breaks ties so the result is deterministic
        std::sort(by_age.begin(), by_age.end(), [](const auto& a, const auto& b) {
            if (a.first != b.first) {
                return a.first > b.first;
            }
            return a.second > b.second;
        });

        size_t removed = 0;
        for (size_t i = keep_latest; i < by_age.size(); ++i) {
            fs::remove(by_age[i].second);
            PLAYLEDGER_LOG_INFO(ctx, "Removed old data file " + by_age[i].second);
            ++removed;
        }
        ctx.metrics().add("files_removed", static_cast<int64_t>(removed));
        return removed;
    }

    /**
     * Names of tables that currently hold data, sorted.
     */
    std::vector<std::string> list_tables() const {
        std::vector<std::string> names;
        std::error_code ec;
        if (!fs::is_directory(base_path_, ec)) {
            return names;
        }
        for (const auto& entry : fs::directory_iterator(base_path_)) {
            if (!entry.is_directory()) {
                continue;
            }
            std::string name = entry.path().filename().string();
            if (is_staging_name(name)) {
                continue;
            }
            if (!file_utils::list_parquet_files(entry.path()).empty()) {
                names.push_back(name);
            }
        }
        std::sort(names.begin(), names.end());
        return names;
    }

private:
    static bool is_staging_name(const std::string& name) {
        return string_utils::ends_with(name, ".inprogress") || string_utils::ends_with(name, ".old");
    }

    static void validate_name(const std::string& name) {
        if (name.empty() || name == "." || name == ".." ||
            name.find('/') != std::string::npos || name.find('\\') != std::string::npos ||
            is_staging_name(name)) {
            throw StoreError(ErrorKind::InvalidArgument, "Invalid table name: '" + name + "'");
        }
    }

    /**
     * Write the full table into a staging directory and swap it in.
     * Returns the path of the live data file.
     */
    std::string replace_contents(const std::string& name, const TablePtr& table) {
        fs::path target = table_path(name);
        fs::path staging = base_path_ / (name + ".inprogress");

        file_utils::remove_directory(staging);
        file_utils::create_directories(staging);

        try {
            ParquetWriter writer((staging / kDataFileName).string(), table->schema(),
                                 compression_, row_group_size_);
            writer.write_table(*table);
            writer.close();
            file_utils::replace_directory(staging, target);
        } catch (const std::exception&) {
            std::error_code ec;
            fs::remove_all(staging, ec);
            throw;
        }
        return (target / kDataFileName).string();
    }

    static constexpr const char* kDataFileName = "part-0000.parquet";

    fs::path base_path_;
    parquet::Compression::type compression_;
    int64_t row_group_size_;
    MergeEngine engine_;
};

} // namespace playledger
