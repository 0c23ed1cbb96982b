#pragma once

#include <algorithm>
#include <string>
#include <unordered_map>
#include <vector>

#include "column_view.h"
#include "config.h"
#include "record.h"
#include "record_converter.h"
#include "results.h"
#include "run_context.h"
#include "schema_utils.h"
#include "string_utils.h"
#include "time_utils.h"

/**
 * Collapse overlapping play event reports into one canonical history.
 *
 * Phase 1 removes repeated observations: rows sharing track identity and
 * played_at. Phase 2 removes the same listen reported with shifted
 * timestamps: within a (track_name, artist) group sorted by played_at, a row
 * that starts within the duration of the previous kept listen is dropped.
 */
namespace playledger {

struct DedupReport {
    int64_t input_rows = 0;
    int64_t exact_duplicates = 0;   // removed by phase 1
    int64_t window_duplicates = 0;  // removed by phase 2
    int64_t sparse_rows = 0;        // kept without phase 2 (missing name, artist or played_at)
    int64_t output_rows = 0;
};

struct DedupOutcome {
    TablePtr table;
    DedupReport report;
};

class EventDeduplicator {
public:
    explicit EventDeduplicator(DedupColumns columns = DedupColumns())
        : columns_(std::move(columns)) {}

    const DedupColumns& columns() const { return columns_; }

    DedupOutcome deduplicate(RunContext& ctx, const std::vector<Record>& events) const {
        if (events.empty()) {
            DedupOutcome outcome;
            outcome.table = arrow::Table::Make(arrow::schema({}), std::vector<std::shared_ptr<arrow::Array>>{}, 0);
            return outcome;
        }
        return deduplicate(ctx, records_to_table(events));
    }

    /**
     * Deduplicate a table of play events. The result holds a subset of the
     * input rows in canonical order, so the output never depends on input
     * order and deduplicating it again changes nothing.
     *
     * Throws StoreError{SchemaConflict} if played_at is not a timestamp column.
     */
    DedupOutcome deduplicate(RunContext& ctx, const TablePtr& events) const {
        StageTimer timer(ctx, "deduplicate");

        TablePtr table = concat_tables({events});
        DedupOutcome outcome;
        outcome.report.input_rows = table->num_rows();

        ColumnView track_id = ColumnView::of(*table, columns_.track_id);
        ColumnView track_name = ColumnView::of(*table, columns_.track_name);
        ColumnView artist = ColumnView::of(*table, columns_.artist);
        ColumnView played_at = ColumnView::of(*table, columns_.played_at);
        ColumnView duration = ColumnView::of(*table, columns_.duration_ms);
        ColumnView priority = ColumnView::of(*table, columns_.priority);
        RowKeyEncoder whole_row = RowKeyEncoder::all_columns(*table);

        if (played_at.present() && !played_at.is_timestamp()) {
            throw StoreError(ErrorKind::SchemaConflict,
                             "Column '" + columns_.played_at + "' must be a timestamp, got " +
                             played_at.array()->type()->ToString());
        }

        std::vector<Event> events_in;
        events_in.reserve(static_cast<size_t>(table->num_rows()));
        for (int64_t row = 0; row < table->num_rows(); ++row) {
            Event e;
            e.row = row;
            e.row_key = whole_row.encode(row);
            e.has_played_at = !played_at.is_null(row);
            e.played_at_us = played_at.timestamp_us_at(row);
            e.identity = identity_of(track_id, track_name, artist, row, e.row_key);
            events_in.push_back(std::move(e));
        }

        // Phase 1: one representative per (identity, played_at). Without a
        // timestamp only byte-identical rows are repeats.
        std::unordered_map<std::string, size_t> best;
        for (size_t i = 0; i < events_in.size(); ++i) {
            std::string group;
            if (events_in[i].has_played_at) {
                group = events_in[i].identity;
                played_at.encode(events_in[i].row, group);
            } else {
                group = "R" + events_in[i].row_key;
            }
            auto it = best.find(group);
            if (it == best.end()) {
                best.emplace(std::move(group), i);
            } else if (preferred(priority, events_in[i], events_in[it->second])) {
                it->second = i;
            }
        }
        outcome.report.exact_duplicates =
            static_cast<int64_t>(events_in.size()) - static_cast<int64_t>(best.size());

        std::vector<const Event*> survivors;
        survivors.reserve(best.size());
        for (const auto& entry : best) {
            survivors.push_back(&events_in[entry.second]);
        }

        // Phase 2: duration window within (track_name, artist)
        std::unordered_map<std::string, std::vector<const Event*>> listen_groups;
        std::vector<const Event*> kept;
        kept.reserve(survivors.size());
        for (const Event* e : survivors) {
            if (!e->has_played_at || track_name.is_null(e->row) || artist.is_null(e->row)) {
                ++outcome.report.sparse_rows;
                kept.push_back(e);
                continue;
            }
            std::string group;
            track_name.encode(e->row, group);
            artist.encode(e->row, group);
            listen_groups[group].push_back(e);
        }

        for (auto& entry : listen_groups) {
            auto& group = entry.second;
            std::sort(group.begin(), group.end(), canonical_less);

            const Event* previous = nullptr;
            for (const Event* e : group) {
                if (previous) {
                    int64_t gap_us = e->played_at_us - previous->played_at_us;
                    int64_t window_us = duration_us(duration, previous->row);
                    if (gap_us <= window_us) {
                        ++outcome.report.window_duplicates;
                        continue;
                    }
                }
                kept.push_back(e);
                previous = e;
            }
        }

        std::sort(kept.begin(), kept.end(), canonical_less);
        std::vector<int64_t> rows;
        rows.reserve(kept.size());
        for (const Event* e : kept) {
            rows.push_back(e->row);
        }

        outcome.table = take_rows(table, rows);
        outcome.report.output_rows = outcome.table->num_rows();

        ctx.metrics().add("dedup_exact_duplicates", outcome.report.exact_duplicates);
        ctx.metrics().add("dedup_window_duplicates", outcome.report.window_duplicates);
        PLAYLEDGER_LOG_INFO(ctx, "Deduplicated " + std::to_string(outcome.report.input_rows) +
                                 " play events -> " + std::to_string(outcome.report.output_rows) +
                                 " (" + std::to_string(outcome.report.exact_duplicates) + " exact, " +
                                 std::to_string(outcome.report.window_duplicates) + " within duration, " +
                                 std::to_string(outcome.report.sparse_rows) + " sparse)");
        return outcome;
    }

private:
    struct Event {
        int64_t row = 0;
        bool has_played_at = false;
        int64_t played_at_us = 0;
        std::string identity;
        std::string row_key;
    };

    /**
     * track_id when present, else (track_name, artist). Rows with neither
     * only collapse with identical rows.
     */
    static std::string identity_of(const ColumnView& track_id,
                                   const ColumnView& track_name,
                                   const ColumnView& artist,
                                   int64_t row,
                                   const std::string& row_key) {
        std::string identity;
        if (!track_id.is_blank(row)) {
            identity = "I";
            track_id.encode(row, identity);
        } else if (!track_name.is_null(row) && !artist.is_null(row)) {
            identity = "P";
            track_name.encode(row, identity);
            artist.encode(row, identity);
        } else {
            identity = "R" + row_key;
        }
        return identity;
    }

    /**
     * Duration of a listen in microseconds; null or negative -> 0.
     */
    static int64_t duration_us(const ColumnView& duration, int64_t row) {
        if (duration.is_null(row)) {
            return 0;
        }
        double ms = duration.double_at(row);
        return ms > 0 ? static_cast<int64_t>(ms * time_utils::kMicrosPerMilli) : 0;
    }

    /**
     * Order by played_at (nulls last), identity, then whole-row encoding.
     */
    static bool canonical_less(const Event* a, const Event* b) {
        if (a->has_played_at != b->has_played_at) {
            return a->has_played_at;
        }
        if (a->has_played_at && a->played_at_us != b->played_at_us) {
            return a->played_at_us < b->played_at_us;
        }
        if (a->identity != b->identity) {
            return a->identity < b->identity;
        }
        return a->row_key < b->row_key;
    }

    /**
     * True if candidate should replace current as group representative:
     * higher priority value wins (nulls last), then the smaller row encoding.
     */
    static bool preferred(const ColumnView& priority, const Event& candidate, const Event& current) {
        int cmp = compare_priority(priority, candidate.row, current.row);
        if (cmp != 0) {
            return cmp > 0;
        }
        return candidate.row_key < current.row_key;
    }

    static int compare_priority(const ColumnView& priority, int64_t a, int64_t b) {
        bool a_null = priority.is_null(a);
        bool b_null = priority.is_null(b);
        if (a_null || b_null) {
            return a_null == b_null ? 0 : (a_null ? -1 : 1);
        }
        switch (priority.array()->type_id()) {
            case arrow::Type::STRING:
            case arrow::Type::LARGE_STRING: {
                std::string sa = priority.string_at(a);
                std::string sb = priority.string_at(b);
                // Numeric cursors stored as text compare by value
                if (string_utils::is_integer(sa) && string_utils::is_integer(sb)) {
                    return compare_integer_text(sa, sb);
                }
                return sa < sb ? -1 : (sa > sb ? 1 : 0);
            }
            case arrow::Type::TIMESTAMP: {
                int64_t ta = priority.timestamp_us_at(a);
                int64_t tb = priority.timestamp_us_at(b);
                return ta < tb ? -1 : (ta > tb ? 1 : 0);
            }
            default: {
                double da = priority.double_at(a);
                double db = priority.double_at(b);
                return da < db ? -1 : (da > db ? 1 : 0);
            }
        }
    }

    /**
     * Compare two decimal integers of any length given as text.
     */
    static int compare_integer_text(const std::string& a, const std::string& b) {
        bool a_neg = a[0] == '-';
        bool b_neg = b[0] == '-';
        std::string ma = strip_leading_zeros(a.substr(a_neg || a[0] == '+' ? 1 : 0));
        std::string mb = strip_leading_zeros(b.substr(b_neg || b[0] == '+' ? 1 : 0));
        if (ma == "0") a_neg = false;
        if (mb == "0") b_neg = false;
        if (a_neg != b_neg) {
            return a_neg ? -1 : 1;
        }
        int magnitude = ma.size() != mb.size() ? (ma.size() < mb.size() ? -1 : 1)
                                               : (ma < mb ? -1 : (ma > mb ? 1 : 0));
        return a_neg ? -magnitude : magnitude;
    }

    static std::string strip_leading_zeros(const std::string& digits) {
        size_t first = digits.find_first_not_of('0');
        return first == std::string::npos ? std::string("0") : digits.substr(first);
    }

    DedupColumns columns_;
};

} // namespace playledger
