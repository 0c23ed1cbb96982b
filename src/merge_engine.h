#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "column_view.h"
#include "config.h"
#include "results.h"
#include "run_context.h"
#include "schema_utils.h"
#include "string_utils.h"

/**
 * Reconciles an incoming batch with the stored contents of a table.
 *
 * overwrite: the batch becomes the table.
 * append:    stored rows followed by the batch, no deduplication.
 * merge:     stored rows whose key is not in the batch, followed by the
 *            batch (last write wins). Without a declared key the whole row
 *            is the key.
 */
namespace playledger {

/**
 * New table contents produced by one write.
 */
struct MergeOutcome {
    TablePtr table;                // full table to persist
    int64_t records_written = 0;   // incoming rows kept
    int64_t records_dropped = 0;   // malformed incoming rows removed
    int64_t records_replaced = 0;  // stored rows superseded by the batch
};

class MergeEngine {
public:
    MergeEngine(MergeKeyPolicy policy, MalformedRecordPolicy malformed_policy)
        : policy_(std::move(policy)), malformed_policy_(malformed_policy) {}

    /**
     * Compute the table that results from writing batch in the given mode.
     *
     * @param existing Stored contents, or nullptr if the table has no data
     * @param batch Incoming rows (non-empty)
     * Throws StoreError{SchemaConflict} or StoreError{MalformedRecord}; nothing
     * has been written at that point.
     */
    MergeOutcome apply(RunContext& ctx,
                       const std::string& table_name,
                       const TablePtr& existing,
                       const TablePtr& batch,
                       WriteMode mode) const {
        switch (mode) {
            case WriteMode::Overwrite:
                return overwrite(batch);
            case WriteMode::Append:
                return append(existing, batch);
            case WriteMode::Merge:
                return merge(ctx, table_name, existing, batch);
        }
        throw StoreError(ErrorKind::InvalidArgument, "Unknown write mode");
    }

    const MergeKeyPolicy& policy() const { return policy_; }
    MalformedRecordPolicy malformed_policy() const { return malformed_policy_; }

private:
    MergeOutcome overwrite(const TablePtr& batch) const {
        MergeOutcome outcome;
        outcome.table = concat_tables({batch});
        outcome.records_written = batch->num_rows();
        return outcome;
    }

    MergeOutcome append(const TablePtr& existing, const TablePtr& batch) const {
        if (!existing) {
            return overwrite(batch);
        }
        MergeOutcome outcome;
        outcome.table = concat_tables({existing, batch});
        outcome.records_written = batch->num_rows();
        return outcome;
    }

    MergeOutcome merge(RunContext& ctx,
                       const std::string& table_name,
                       const TablePtr& existing,
                       const TablePtr& batch) const {
        std::vector<std::string> keys = policy_.key_for(table_name);
        if (keys.empty()) {
            return merge_whole_rows(existing, batch);
        }

        MergeOutcome outcome;

        // Harmonize first so key columns are encoded with the same type on both sides
        TablePtr stored;
        TablePtr incoming;
        if (existing) {
            HarmonizedPair pair = harmonize(existing, batch);
            stored = pair.left;
            incoming = pair.right;
        } else {
            incoming = concat_tables({batch});
        }

        // Drop or reject records with a null (or absent) key, then keep the
        // last occurrence of every key within the batch.
        RowKeyEncoder incoming_keys(*incoming, keys);
        std::unordered_map<std::string, int64_t> last_row;
        std::vector<std::string> encoded(static_cast<size_t>(incoming->num_rows()));
        for (int64_t row = 0; row < incoming->num_rows(); ++row) {
            if (incoming_keys.has_null(row)) {
                if (malformed_policy_ == MalformedRecordPolicy::Reject) {
                    throw StoreError(ErrorKind::MalformedRecord,
                                     "Record " + std::to_string(row) + " of batch for '" + table_name +
                                     "' has a null merge key (" + string_utils::join(keys, ", ") + ")");
                }
                ++outcome.records_dropped;
                continue;
            }
            encoded[static_cast<size_t>(row)] = incoming_keys.encode(row);
            last_row[encoded[static_cast<size_t>(row)]] = row;
        }

        if (outcome.records_dropped > 0) {
            PLAYLEDGER_LOG_WARNING(ctx, "Dropped " + std::to_string(outcome.records_dropped) +
                                   " record(s) with null merge key from batch for " + table_name);
            ctx.metrics().add("malformed_records_dropped", outcome.records_dropped);
        }

        std::vector<int64_t> keep;
        keep.reserve(last_row.size());
        for (int64_t row = 0; row < incoming->num_rows(); ++row) {
            if (incoming_keys.has_null(row)) {
                continue;
            }
            if (last_row[encoded[static_cast<size_t>(row)]] == row) {
                keep.push_back(row);
            }
        }
        if (static_cast<int64_t>(keep.size()) != incoming->num_rows()) {
            incoming = take_rows(incoming, keep);
        }
        outcome.records_written = incoming->num_rows();

        if (!stored) {
            outcome.table = incoming;
            return outcome;
        }

        // Anti-join: stored rows whose key is not in the batch are retained
        RowKeyEncoder stored_keys(*stored, keys);
        std::vector<int64_t> retained;
        retained.reserve(static_cast<size_t>(stored->num_rows()));
        for (int64_t row = 0; row < stored->num_rows(); ++row) {
            if (last_row.find(stored_keys.encode(row)) == last_row.end()) {
                retained.push_back(row);
            }
        }
        outcome.records_replaced = stored->num_rows() - static_cast<int64_t>(retained.size());

        TablePtr kept = static_cast<int64_t>(retained.size()) == stored->num_rows()
            ? stored : take_rows(stored, retained);
        // Outputs of harmonize share one schema; concat only re-checks it
        outcome.table = unwrap(arrow::ConcatenateTables({kept, incoming}),
                               "Failed to combine retained and incoming rows of " + table_name);
        return outcome;
    }

    /**
     * Merge without a key: append and remove exact duplicate rows,
     * keeping the first occurrence.
     */
    MergeOutcome merge_whole_rows(const TablePtr& existing, const TablePtr& batch) const {
        TablePtr combined = existing ? concat_tables({existing, batch}) : concat_tables({batch});
        int64_t stored_rows = existing ? existing->num_rows() : 0;

        RowKeyEncoder encoder = RowKeyEncoder::all_columns(*combined);
        std::unordered_set<std::string> seen;
        std::vector<int64_t> keep;
        int64_t new_rows_kept = 0;
        for (int64_t row = 0; row < combined->num_rows(); ++row) {
            if (seen.insert(encoder.encode(row)).second) {
                keep.push_back(row);
                if (row >= stored_rows) {
                    ++new_rows_kept;
                }
            }
        }

        MergeOutcome outcome;
        outcome.table = static_cast<int64_t>(keep.size()) == combined->num_rows()
            ? combined : take_rows(combined, keep);
        outcome.records_written = new_rows_kept;
        return outcome;
    }

    MergeKeyPolicy policy_;
    MalformedRecordPolicy malformed_policy_;
};

} // namespace playledger
