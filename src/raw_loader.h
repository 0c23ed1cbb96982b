#pragma once

#include <chrono>
#include <map>
#include <set>
#include <string>
#include <system_error>
#include <vector>

#include "csv_reader.h"
#include "file_utils.h"
#include "json_parser.h"
#include "record.h"
#include "run_context.h"
#include "string_utils.h"
#include "time_utils.h"

/**
 * Loads raw play exports dropped by the fetchers:
 *
 *   <raw_dir>/detail/*.json      array of flat objects
 *   <raw_dir>/detail/*.csv[.gz]  header row + one play per line
 *
 * and archives them under <raw_dir>/processed/ once stored.
 */
namespace playledger {

class RawPlayLoader {
public:
    RawPlayLoader()
        : renames_{{"uri", "track_uri"}, {"request_after", "request_cursor"}},
          timestamp_columns_{"played_at"},
          integer_columns_{"duration_ms", "popularity", "request_cursor"} {}

    RawPlayLoader(std::map<std::string, std::string> renames,
                  std::set<std::string> timestamp_columns,
                  std::set<std::string> integer_columns)
        : renames_(std::move(renames)),
          timestamp_columns_(std::move(timestamp_columns)),
          integer_columns_(std::move(integer_columns)) {}

    /**
     * Loader for hand-made record files: no renames, only played_at is
     * read as a timestamp.
     */
    static RawPlayLoader plain() {
        return RawPlayLoader({}, {"played_at"}, {});
    }

    /**
     * Raw files waiting in <raw_dir>/detail, sorted by name.
     */
    std::vector<std::string> discover(const fs::path& raw_dir) const {
        return file_utils::list_files(raw_dir / "detail", {".json", ".csv", ".csv.gz"});
    }

    /**
     * Parse one raw file. Throws std::runtime_error on unreadable or
     * malformed input.
     */
    std::vector<Record> load_file(RunContext& ctx, const std::string& path) const {
        std::vector<Record> records = string_utils::ends_with(path, ".json")
            ? load_json(ctx, path) : load_csv(path);
        PLAYLEDGER_LOG_DEBUG(ctx, "Loaded " + std::to_string(records.size()) + " records from " + path);
        return records;
    }

    /**
     * Move a processed file to <raw_dir>/processed.
     */
    fs::path archive(const std::string& path, const fs::path& raw_dir) const {
        return file_utils::move_into(path, raw_dir / "processed");
    }

    /**
     * Delete archived files last modified more than retention_days ago.
     * Returns the number of files removed.
     */
    size_t prune_processed(RunContext& ctx, const fs::path& raw_dir, int64_t retention_days) const {
        fs::path processed = raw_dir / "processed";
        std::error_code ec;
        if (retention_days < 0 || !fs::is_directory(processed, ec)) {
            return 0;
        }

        auto cutoff = fs::file_time_type::clock::now() - std::chrono::hours(24 * retention_days);
        size_t removed = 0;
        for (const auto& entry : fs::directory_iterator(processed)) {
            if (!entry.is_regular_file()) {
                continue;
            }
            if (entry.last_write_time() < cutoff) {
                fs::remove(entry.path());
                PLAYLEDGER_LOG_DEBUG(ctx, "Pruned archived raw file " + entry.path().string());
                ++removed;
            }
        }
        if (removed > 0) {
            PLAYLEDGER_LOG_INFO(ctx, "Pruned " + std::to_string(removed) +
                                     " archived raw file(s) older than " +
                                     std::to_string(retention_days) + " days");
        }
        return removed;
    }

private:
    std::vector<Record> load_json(RunContext& ctx, const std::string& path) const {
        json::Value root = json::parse_file(path);
        if (!root.is_array()) {
            throw std::runtime_error(path + ": expected a JSON array of play objects");
        }

        std::vector<Record> records;
        records.reserve(root.array.size());
        size_t skipped_values = 0;
        for (size_t i = 0; i < root.array.size(); ++i) {
            const json::Value& item = root.array[i];
            if (!item.is_object()) {
                throw std::runtime_error(path + ": element " + std::to_string(i) + " is not an object");
            }
            Record record;
            for (const auto& [raw_name, value] : item.object) {
                std::string name = column_name(raw_name);
                if (value.is_object() || value.is_array()) {
                    ++skipped_values;
                    continue;
                }
                record.set(name, json_cell(name, value));
            }
            records.push_back(std::move(record));
        }
        if (skipped_values > 0) {
            PLAYLEDGER_LOG_DEBUG(ctx, "Ignored " + std::to_string(skipped_values) +
                                      " nested value(s) in " + path);
        }
        return records;
    }

    std::vector<Record> load_csv(const std::string& path) const {
        CsvReader reader(path);
        std::vector<std::string> names;
        for (const auto& header : reader.headers()) {
            names.push_back(column_name(string_utils::trim(header)));
        }

        std::vector<Record> records;
        std::vector<std::string> row;
        while (reader.next_row(row)) {
            if (row.size() > names.size()) {
                throw std::runtime_error(path + ": row " + std::to_string(reader.rows_read()) + " has " +
                                         std::to_string(row.size()) + " fields, header has " +
                                         std::to_string(names.size()));
            }
            Record record;
            for (size_t i = 0; i < names.size(); ++i) {
                // Short rows and empty fields are nulls
                if (i >= row.size() || row[i].empty()) {
                    record.set(names[i], Value());
                    continue;
                }
                record.set(names[i], text_cell(names[i], row[i]));
            }
            records.push_back(std::move(record));
        }
        return records;
    }

    std::string column_name(const std::string& raw) const {
        auto it = renames_.find(raw);
        return it == renames_.end() ? raw : it->second;
    }

    bool is_timestamp_column(const std::string& name) const {
        return timestamp_columns_.count(name) > 0;
    }

    Value json_cell(const std::string& name, const json::Value& value) const {
        switch (value.type) {
            case json::Value::STRING:
                return is_timestamp_column(name) ? timestamp_cell(value.string) : Value(value.string);
            case json::Value::NUMBER:
                if (is_timestamp_column(name)) {
                    // Epoch milliseconds
                    int64_t ms = value.number_is_integer ? value.integer : static_cast<int64_t>(value.number);
                    return Timestamp{ms * time_utils::kMicrosPerMilli};
                }
                if (value.number_is_integer) {
                    return value.integer;
                }
                return value.number;
            case json::Value::BOOLEAN:
                return value.boolean;
            default:
                return Value();
        }
    }

    Value text_cell(const std::string& name, const std::string& text) const {
        if (is_timestamp_column(name)) {
            return timestamp_cell(text);
        }
        if (integer_columns_.count(name) > 0 && text.size() <= 18 && string_utils::is_integer(text)) {
            return static_cast<int64_t>(std::stoll(text));
        }
        return text;
    }

    /**
     * Unparseable timestamps become null; the record is kept.
     */
    static Value timestamp_cell(const std::string& text) {
        auto micros = time_utils::parse_timestamp_us(text);
        if (!micros) {
            return Value();
        }
        return Timestamp{*micros};
    }

    std::map<std::string, std::string> renames_;
    std::set<std::string> timestamp_columns_;
    std::set<std::string> integer_columns_;
};

} // namespace playledger
