#pragma once

#include <string>
#include <vector>

#include "config.h"
#include "event_deduplicator.h"
#include "raw_loader.h"
#include "record.h"
#include "record_converter.h"
#include "results.h"
#include "run_context.h"
#include "schema_utils.h"
#include "table_store.h"

/**
 * One ingestion cycle for the play history:
 *   load raw files -> union with stored history -> deduplicate -> overwrite
 *   -> archive raw files -> prune old archives
 */
namespace playledger {

struct IngestOutcome {
    WriteResult write = NoUpdates{};
    DedupReport dedup;
    std::vector<std::string> files_processed;  // archived after a successful write
    std::vector<std::string> files_failed;     // left in place for the next run
    size_t files_pruned = 0;
};

class HistoryIngestor {
public:
    HistoryIngestor(TableStore& store, const StoreConfig& config)
        : store_(store),
          history_table_(config.history_table()),
          retention_days_(config.raw_retention_days()),
          deduplicator_(config.dedup_columns()) {}

    /**
     * Ingest every raw file under <raw_dir>/detail.
     *
     * A file that cannot be parsed is logged, reported in files_failed and
     * left in place; the other files are still ingested.
     */
    IngestOutcome ingest(RunContext& ctx, const fs::path& raw_dir) {
        StageTimer timer(ctx, "ingest");
        IngestOutcome outcome;

        std::vector<std::string> files = loader_.discover(raw_dir);
        PLAYLEDGER_LOG_INFO(ctx, "Found " + std::to_string(files.size()) + " raw file(s) in " +
                                 (raw_dir / "detail").string());

        std::vector<Record> records;
        std::vector<std::string> loaded;
        for (const auto& file : files) {
            try {
                std::vector<Record> batch = loader_.load_file(ctx, file);
                records.insert(records.end(), batch.begin(), batch.end());
                loaded.push_back(file);
            } catch (const std::runtime_error& e) {
                PLAYLEDGER_LOG_ERROR(ctx, "Skipping raw file " + file + ": " + e.what());
                ctx.metrics().add("raw_files_failed", 1);
                outcome.files_failed.push_back(file);
            }
        }

        if (records.empty()) {
            outcome.write = NoUpdates{"No new play events in " + raw_dir.string()};
        } else {
            IngestOutcome stored = ingest_records(ctx, records);
            outcome.write = std::move(stored.write);
            outcome.dedup = stored.dedup;
        }

        // Unchanged history still means the files were fully accounted for
        if (succeeded(outcome.write)) {
            for (const auto& file : loaded) {
                loader_.archive(file, raw_dir);
                outcome.files_processed.push_back(file);
            }
            ctx.metrics().add("raw_files_processed", static_cast<int64_t>(loaded.size()));
        }

        outcome.files_pruned = loader_.prune_processed(ctx, raw_dir, retention_days_);
        return outcome;
    }

    /**
     * Union in-memory play events with the stored history and rewrite it.
     */
    IngestOutcome ingest_records(RunContext& ctx, const std::vector<Record>& records) {
        IngestOutcome outcome;
        if (records.empty()) {
            outcome.write = NoUpdates{"No new play events"};
            return outcome;
        }

        try {
            TablePtr incoming = records_to_table(records);

            TablePtr history;
            ReadResult current = store_.read_table(ctx, history_table_);
            if (found(current)) {
                history = std::get<TablePtr>(current);
            }

            TablePtr combined = history ? concat_tables({history, incoming}) : concat_tables({incoming});
            DedupOutcome deduped = deduplicator_.deduplicate(ctx, combined);
            outcome.dedup = deduped.report;

            if (history && deduped.table->Equals(*history, /*check_metadata=*/false)) {
                outcome.write = NoUpdates{"No new play events for " + history_table_};
                PLAYLEDGER_LOG_INFO(ctx, "History " + history_table_ + " unchanged");
                return outcome;
            }

            int64_t before = history ? history->num_rows() : 0;
            outcome.write = store_.write_table(ctx, history_table_, deduped.table, WriteMode::Overwrite);
            if (succeeded(outcome.write)) {
                PLAYLEDGER_LOG_INFO(ctx, "History " + history_table_ + ": " + std::to_string(before) +
                                         " -> " + std::to_string(deduped.table->num_rows()) + " plays");
            }
        } catch (const StoreError& e) {
            PLAYLEDGER_LOG_ERROR(ctx, "Failed to ingest play events: " + e.detail());
            outcome.write = WriteError{e.kind(), e.detail()};
        }
        return outcome;
    }

    const std::string& history_table() const { return history_table_; }

private:
    TableStore& store_;
    std::string history_table_;
    int64_t retention_days_;
    RawPlayLoader loader_;
    EventDeduplicator deduplicator_;
};

} // namespace playledger
