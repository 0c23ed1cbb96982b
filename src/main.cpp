/**
 * playledger command line
 *
 * Thin front end over the store for orchestration scripts. Each command
 * prints one JSON line with the structured result and exits 0 on success
 * or "no updates", 1 on error.
 *
 * Usage:
 *   ./playledger --config store.json info --table artists
 *   ./playledger --config store.json batch --entity artists --size 50
 *   ./playledger --config store.json ingest --raw data/raw/recently_played
 */

#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "config.h"
#include "event_deduplicator.h"
#include "gap_detector.h"
#include "history_ingestor.h"
#include "logger.h"
#include "raw_loader.h"
#include "record_converter.h"
#include "results.h"
#include "run_context.h"
#include "string_utils.h"
#include "table_store.h"
#include "time_utils.h"

using namespace playledger;

/**
 * Command-line arguments.
 */
struct Arguments {
    std::string config_file;           // Path to JSON config file (optional)
    std::string base_path;             // Overrides config base_path
    std::string command;               // info, tables, count, batch, merge, ingest, dedup, cleanup
    std::string table;
    std::string entity;
    std::string input_file;            // merge: JSON array of records
    std::string mode = "merge";        // merge: overwrite, append or merge
    fs::path raw_dir;                  // ingest: directory holding detail/
    int64_t size = 50;                 // batch: page size
    int64_t offset = 0;                // batch: rows to skip
    int64_t keep = 1;                  // cleanup: data files to keep
    bool verbose = false;              // Debug logging and metrics summary
};

/**
 * Print usage information.
 */
void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [--config FILE] [--base-path DIR] [--verbose] COMMAND [OPTIONS]\n\n"
              << "Commands:\n"
              << "  info    --table T                     Row count, columns and files of a table\n"
              << "  tables                                Tables that hold data\n"
              << "  count   --entity E                    Number of entities missing enrichment\n"
              << "  batch   --entity E [--size N] [--offset K]\n"
              << "                                        One page of missing entities (default size 50)\n"
              << "  merge   --table T --input FILE.json [--mode overwrite|append|merge]\n"
              << "                                        Write records into a table (default merge)\n"
              << "  ingest  --raw DIR                     Ingest raw play files from DIR/detail\n"
              << "  dedup   --table T                     Deduplicate a play event table in place\n"
              << "  cleanup --table T [--keep N]          Remove all but the newest N data files\n"
              << "\n"
              << "Example:\n"
              << "  " << program_name << " --config store.json batch --entity mbz_artists --size 25\n";
}

/**
 * Parse command-line arguments.
 */
Arguments parse_arguments(int argc, char** argv) {
    Arguments args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto get_next_arg = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("Missing value for argument: " + arg);
            }
            return argv[++i];
        };
        auto get_next_int = [&]() -> int64_t {
            std::string value = get_next_arg();
            if (!string_utils::is_integer(value)) {
                throw std::invalid_argument("Expected an integer for " + arg + ", got: " + value);
            }
            return std::stoll(value);
        };

        if (arg == "--config") {
            args.config_file = get_next_arg();
        } else if (arg == "--base-path") {
            args.base_path = get_next_arg();
        } else if (arg == "--table") {
            args.table = get_next_arg();
        } else if (arg == "--entity") {
            args.entity = get_next_arg();
        } else if (arg == "--input") {
            args.input_file = get_next_arg();
        } else if (arg == "--mode") {
            args.mode = get_next_arg();
        } else if (arg == "--raw") {
            args.raw_dir = get_next_arg();
        } else if (arg == "--size") {
            args.size = get_next_int();
        } else if (arg == "--offset") {
            args.offset = get_next_int();
        } else if (arg == "--keep") {
            args.keep = get_next_int();
        } else if (arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (!arg.empty() && arg[0] != '-' && args.command.empty()) {
            args.command = arg;
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }

    if (args.command.empty()) {
        throw std::invalid_argument("Missing command");
    }
    return args;
}

void require(const std::string& value, const std::string& flag, const std::string& command) {
    if (value.empty()) {
        throw std::invalid_argument("Command '" + command + "' requires " + flag);
    }
}

// ---------------------------------------------------------------------------
// JSON output
// ---------------------------------------------------------------------------

std::string quoted(const std::string& text) {
    return "\"" + string_utils::json_escape(text) + "\"";
}

std::string json_cell(const Value& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return quoted(v);
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, Timestamp>) {
            return quoted(time_utils::to_rfc3339_utc(v.micros));
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream out;
            out.precision(17);
            out << v;
            return out.str();
        } else {
            return std::to_string(v);
        }
    }, value);
}

std::string json_rows(const TablePtr& table) {
    std::string out = "[";
    std::vector<Record> records = table_to_records(*table);
    for (size_t i = 0; i < records.size(); ++i) {
        if (i > 0) out += ",";
        out += "{";
        const auto& fields = records[i].fields();
        for (size_t f = 0; f < fields.size(); ++f) {
            if (f > 0) out += ",";
            out += quoted(fields[f].first) + ":" + json_cell(fields[f].second);
        }
        out += "}";
    }
    return out + "]";
}

std::string json_write_result(const WriteResult& result) {
    std::string out = "{\"status\":" + quoted(status_name(result));
    if (auto success = std::get_if<WriteSuccess>(&result)) {
        out += ",\"mode\":" + quoted(write_mode_name(success->mode)) +
               ",\"records_written\":" + std::to_string(success->records_written) +
               ",\"total_records\":" + std::to_string(success->total_records) +
               ",\"records_dropped\":" + std::to_string(success->records_dropped) +
               ",\"file_path\":" + quoted(success->file_path);
    } else if (auto none = std::get_if<NoUpdates>(&result)) {
        out += ",\"message\":" + quoted(none->message);
    } else if (auto error = std::get_if<WriteError>(&result)) {
        out += ",\"error\":" + quoted(error_kind_name(error->kind)) +
               ",\"message\":" + quoted(error->message);
    }
    return out + "}";
}

std::string json_missing_source(const MissingSourceTable& missing) {
    return "{\"status\":\"no_updates\",\"message\":" +
           quoted("Source table " + missing.table + " does not exist") + "}";
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

/**
 * Run one command, print its result line, return the exit code.
 */
int run_command(const Arguments& args, const StoreConfig& config, RunContext& ctx) {
    TableStore store(config);

    if (args.command == "info") {
        require(args.table, "--table", args.command);
        TableInfo info = store.table_info(ctx, args.table);
        std::string columns;
        for (const auto& column : info.columns) {
            if (!columns.empty()) columns += ",";
            columns += quoted(column);
        }
        std::cout << "{\"status\":\"success\",\"table\":" << quoted(args.table)
                  << ",\"exists\":" << (info.exists ? "true" : "false")
                  << ",\"record_count\":" << info.record_count
                  << ",\"file_count\":" << info.file_count
                  << ",\"columns\":[" << columns << "]}\n";
        return 0;
    }

    if (args.command == "tables") {
        std::string names;
        for (const auto& name : store.list_tables()) {
            if (!names.empty()) names += ",";
            names += quoted(name);
        }
        std::cout << "{\"status\":\"success\",\"tables\":[" << names << "]}\n";
        return 0;
    }

    if (args.command == "count") {
        require(args.entity, "--entity", args.command);
        GapDetector detector(store, config);
        CountResult result = detector.count_missing(ctx, args.entity);
        if (auto missing = std::get_if<MissingSourceTable>(&result)) {
            std::cout << json_missing_source(*missing) << "\n";
            return 0;
        }
        std::cout << "{\"status\":\"success\",\"entity\":" << quoted(args.entity)
                  << ",\"missing\":" << std::get<int64_t>(result) << "}\n";
        return 0;
    }

    if (args.command == "batch") {
        require(args.entity, "--entity", args.command);
        GapDetector detector(store, config);
        GapQueryResult result = detector.get_batch(ctx, args.entity, args.size, args.offset);
        if (auto missing = std::get_if<MissingSourceTable>(&result)) {
            std::cout << json_missing_source(*missing) << "\n";
            return 0;
        }
        const GapResult& gaps = std::get<GapResult>(result);
        std::cout << "{\"status\":\"success\",\"entity\":" << quoted(args.entity)
                  << ",\"key\":" << quoted(gaps.key_column)
                  << ",\"count\":" << gaps.size()
                  << ",\"offset\":" << args.offset
                  << ",\"rows\":" << json_rows(gaps.rows) << "}\n";
        return 0;
    }

    if (args.command == "merge") {
        require(args.table, "--table", args.command);
        require(args.input_file, "--input", args.command);
        WriteMode mode = parse_write_mode(args.mode);
        std::vector<Record> records = RawPlayLoader::plain().load_file(ctx, args.input_file);
        WriteResult result = store.write_table(ctx, args.table, records, mode);
        std::cout << json_write_result(result) << "\n";
        return succeeded(result) ? 0 : 1;
    }

    if (args.command == "ingest") {
        require(args.raw_dir.string(), "--raw", args.command);
        HistoryIngestor ingestor(store, config);
        IngestOutcome outcome = ingestor.ingest(ctx, args.raw_dir);
        std::string result = json_write_result(outcome.write);
        result.pop_back();
        std::cout << result
                  << ",\"files_processed\":" << outcome.files_processed.size()
                  << ",\"files_failed\":" << outcome.files_failed.size()
                  << ",\"files_pruned\":" << outcome.files_pruned
                  << ",\"exact_duplicates\":" << outcome.dedup.exact_duplicates
                  << ",\"window_duplicates\":" << outcome.dedup.window_duplicates << "}\n";
        return succeeded(outcome.write) ? 0 : 1;
    }

    if (args.command == "dedup") {
        require(args.table, "--table", args.command);
        ReadResult current = store.read_table(ctx, args.table);
        if (!found(current)) {
            std::cout << json_write_result(NoUpdates{"Table " + args.table + " does not exist"}) << "\n";
            return 0;
        }
        EventDeduplicator deduplicator(config.dedup_columns());
        DedupOutcome deduped = deduplicator.deduplicate(ctx, std::get<TablePtr>(current));
        WriteResult result = deduped.report.output_rows == deduped.report.input_rows
            ? WriteResult(NoUpdates{"No duplicates in " + args.table})
            : store.write_table(ctx, args.table, deduped.table, WriteMode::Overwrite);
        std::cout << json_write_result(result) << "\n";
        return succeeded(result) ? 0 : 1;
    }

    if (args.command == "cleanup") {
        require(args.table, "--table", args.command);
        if (args.keep < 0) {
            throw std::invalid_argument("--keep must not be negative");
        }
        size_t removed = store.cleanup_old_files(ctx, args.table, static_cast<size_t>(args.keep));
        std::cout << "{\"status\":" << quoted(removed > 0 ? "success" : "no_updates")
                  << ",\"files_removed\":" << removed << "}\n";
        return 0;
    }

    throw std::invalid_argument("Unknown command: " + args.command);
}

int main(int argc, char** argv) {
    Arguments args;
    try {
        args = parse_arguments(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        StoreConfig config = args.config_file.empty()
            ? StoreConfig()
            : StoreConfig::load_from_file(args.config_file);
        if (!args.base_path.empty()) {
            config.set_base_path(args.base_path);
        }

        RunContext ctx(&std::cerr, args.verbose ? LogLevel::DEBUG : config.log_level());
        PLAYLEDGER_LOG_DEBUG(ctx, "Base path: " + config.base_path());

        int code = run_command(args, config, ctx);
        if (args.verbose) {
            PLAYLEDGER_LOG_INFO(ctx, ctx.metrics().summary());
        }
        return code;

    } catch (const StoreError& e) {
        std::cout << "{\"status\":\"error\",\"error\":" << quoted(error_kind_name(e.kind()))
                  << ",\"message\":" << quoted(e.detail()) << "}\n";
        return 1;
    } catch (const std::exception& e) {
        std::cout << "{\"status\":\"error\",\"message\":" << quoted(e.what()) << "}\n";
        return 1;
    }
}
