#include <gtest/gtest.h>

#include <algorithm>
#include <random>

#include "test_helpers.h"
#include "../src/event_deduplicator.h"
#include "../src/record_converter.h"

using namespace playledger;
using namespace playledger::test;

class EventDeduplicatorTest : public ::testing::Test {
protected:
    static Record play(const std::string& track, const std::string& artist,
                       int64_t offset_seconds, int64_t duration_seconds) {
        return Record{
            {"track_name", track},
            {"artist", artist},
            {"played_at", Timestamp{kBase + offset_seconds * time_utils::kMicrosPerSecond}},
            {"duration_ms", duration_seconds * 1000},
        };
    }

    std::vector<Record> dedup(const std::vector<Record>& events) {
        return table_to_records(*deduplicator_.deduplicate(ctx_, events).table);
    }

    static constexpr int64_t kBase = 1700000000LL * 1000000LL;

    RunContext ctx_{nullptr};
    EventDeduplicator deduplicator_;
};

TEST_F(EventDeduplicatorTest, SecondReportWithinDurationIsDropped) {
    DedupOutcome outcome = deduplicator_.deduplicate(ctx_, std::vector<Record>{
        play("X", "Y", 0, 180),
        play("X", "Y", 90, 180),
        play("X", "Y", 400, 180),
    });

    EXPECT_EQ(outcome.table->num_rows(), 2);
    EXPECT_EQ(outcome.report.input_rows, 3);
    EXPECT_EQ(outcome.report.window_duplicates, 1);
    EXPECT_EQ(outcome.report.output_rows, 2);

    std::vector<Record> rows = table_to_records(*outcome.table);
    EXPECT_EQ(rows[0].get_timestamp("played_at")->micros, kBase);
    EXPECT_EQ(rows[1].get_timestamp("played_at")->micros, kBase + 400 * time_utils::kMicrosPerSecond);
}

TEST_F(EventDeduplicatorTest, ExactRepeatsCollapse) {
    DedupOutcome outcome = deduplicator_.deduplicate(ctx_, std::vector<Record>{
        play("X", "Y", 0, 180),
        play("X", "Y", 0, 180),
        play("X", "Y", 0, 180),
    });
    EXPECT_EQ(outcome.table->num_rows(), 1);
    EXPECT_EQ(outcome.report.exact_duplicates, 2);
    EXPECT_EQ(outcome.report.window_duplicates, 0);
}

TEST_F(EventDeduplicatorTest, GapEqualToDurationIsSameListen) {
    EXPECT_EQ(dedup({play("X", "Y", 0, 180), play("X", "Y", 180, 180)}).size(), 1u);
    EXPECT_EQ(dedup({play("X", "Y", 0, 180), play("X", "Y", 181, 180)}).size(), 2u);
}

TEST_F(EventDeduplicatorTest, WindowUsesPreviousKeptListen) {
    // 100 falls in the first listen, 250 is after it ends even though it
    // is within 200s of the dropped report
    std::vector<Record> rows = dedup({
        play("X", "Y", 0, 200),
        play("X", "Y", 100, 200),
        play("X", "Y", 250, 200),
    });
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[1].get_timestamp("played_at")->micros, kBase + 250 * time_utils::kMicrosPerSecond);
}

TEST_F(EventDeduplicatorTest, DifferentTracksAreIndependent) {
    std::vector<Record> rows = dedup({
        play("X", "Y", 0, 180),
        play("Z", "Y", 10, 180),
        play("X", "W", 20, 180),
    });
    EXPECT_EQ(rows.size(), 3u);
}

TEST_F(EventDeduplicatorTest, DistinctListensSurvive) {
    std::vector<Record> events;
    for (int i = 0; i < 10; ++i) {
        events.push_back(play("X", "Y", i * 200, 180));
    }
    EXPECT_EQ(dedup(events).size(), 10u);
}

TEST_F(EventDeduplicatorTest, SparseRecordsAreKept) {
    std::vector<Record> events = {
        play("X", "Y", 0, 180),
        Record{{"track_name", "X"}, {"artist", "Y"}, {"played_at", nullptr}, {"duration_ms", 180000}},
        Record{{"track_name", "X"}, {"artist", nullptr},
               {"played_at", Timestamp{kBase + 10 * time_utils::kMicrosPerSecond}}, {"duration_ms", 180000}},
    };
    DedupOutcome outcome = deduplicator_.deduplicate(ctx_, events);
    EXPECT_EQ(outcome.table->num_rows(), 3);
    EXPECT_EQ(outcome.report.sparse_rows, 2);

    // Null played_at sorts last
    std::vector<Record> rows = table_to_records(*outcome.table);
    EXPECT_TRUE(is_null(rows.back().get("played_at")));
}

TEST_F(EventDeduplicatorTest, UntimedPlaysOfOneTrackAreNotMerged) {
    std::vector<Record> events = {
        Record{{"track_id", "t1"}, {"played_at", nullptr}, {"source", "api"}},
        Record{{"track_id", "t1"}, {"played_at", nullptr}, {"source", "export"}, {"duration_ms", 200000}},
        Record{{"track_name", "X"}, {"artist", "Y"}, {"played_at", nullptr}, {"source", "api"}},
        Record{{"track_name", "X"}, {"artist", "Y"}, {"played_at", nullptr}, {"source", "api"}},
        play("Z", "W", 0, 60),
    };
    DedupOutcome outcome = deduplicator_.deduplicate(ctx_, events);

    // Only the byte-identical pair collapses
    EXPECT_EQ(outcome.table->num_rows(), 4);
    EXPECT_EQ(outcome.report.exact_duplicates, 1);
    EXPECT_EQ(outcome.report.sparse_rows, 3);

    std::vector<Record> rows = table_to_records(*outcome.table);
    int t1_rows = 0;
    for (const auto& row : rows) {
        if (row.get_string("track_id") == std::optional<std::string>("t1")) {
            ++t1_rows;
        }
    }
    EXPECT_EQ(t1_rows, 2);
}

TEST_F(EventDeduplicatorTest, TrackIdIdentifiesExactRepeats) {
    std::vector<Record> events = {
        Record{{"track_id", "t1"}, {"track_name", "X"}, {"artist", "Y"},
               {"played_at", Timestamp{kBase}}, {"duration_ms", 180000}, {"source", "api"}},
        Record{{"track_id", "t1"}, {"track_name", "X (Remastered)"}, {"artist", "Y"},
               {"played_at", Timestamp{kBase}}, {"duration_ms", 180000}, {"source", "export"}},
    };
    DedupOutcome outcome = deduplicator_.deduplicate(ctx_, events);
    EXPECT_EQ(outcome.table->num_rows(), 1);
    EXPECT_EQ(outcome.report.exact_duplicates, 1);
}

TEST_F(EventDeduplicatorTest, HighestCursorWinsAmongRepeats) {
    std::vector<Record> events = {
        Record{{"track_id", "t1"}, {"track_name", "X"}, {"artist", "Y"},
               {"played_at", Timestamp{kBase}}, {"request_cursor", 5}, {"popularity", 40}},
        Record{{"track_id", "t1"}, {"track_name", "X"}, {"artist", "Y"},
               {"played_at", Timestamp{kBase}}, {"request_cursor", 9}, {"popularity", 41}},
        Record{{"track_id", "t1"}, {"track_name", "X"}, {"artist", "Y"},
               {"played_at", Timestamp{kBase}}, {"request_cursor", nullptr}, {"popularity", 42}},
    };
    std::vector<Record> rows = dedup(events);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].get_int("request_cursor"), 9);
    EXPECT_EQ(rows[0].get_int("popularity"), 41);
}

TEST_F(EventDeduplicatorTest, TextCursorsCompareAsNumbers) {
    std::vector<Record> events = {
        Record{{"track_id", "t1"}, {"played_at", Timestamp{kBase}}, {"request_cursor", "999"}, {"popularity", 1}},
        Record{{"track_id", "t1"}, {"played_at", Timestamp{kBase}}, {"request_cursor", "0010"}, {"popularity", 2}},
        Record{{"track_id", "t1"}, {"played_at", Timestamp{kBase}}, {"request_cursor", "-5000"}, {"popularity", 3}},
    };
    std::vector<Record> rows = dedup(events);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].get_string("request_cursor"), "999");
    EXPECT_EQ(rows[0].get_int("popularity"), 1);

    std::vector<Record> long_cursors = {
        Record{{"track_id", "t2"}, {"played_at", Timestamp{kBase}}, {"request_cursor", "000123456789012345678901"}},
        Record{{"track_id", "t2"}, {"played_at", Timestamp{kBase}}, {"request_cursor", "99999999999999999999"}},
    };
    rows = dedup(long_cursors);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].get_string("request_cursor"), "000123456789012345678901");
}

TEST_F(EventDeduplicatorTest, ResultDoesNotDependOnInputOrder) {
    std::vector<Record> events = {
        play("X", "Y", 0, 180),
        play("X", "Y", 90, 180),
        play("X", "Y", 170, 180),
        play("X", "Y", 400, 180),
        play("A", "B", 0, 60),
        play("A", "B", 30, 60),
        play("A", "B", 61, 60),
        Record{{"track_name", "A"}, {"artist", "B"}, {"played_at", Timestamp{kBase}},
               {"duration_ms", 60000}, {"request_cursor", 3}},
    };
    TablePtr expected = deduplicator_.deduplicate(ctx_, events).table;

    std::mt19937 rng(42);
    for (int i = 0; i < 5; ++i) {
        std::shuffle(events.begin(), events.end(), rng);
        TablePtr shuffled = deduplicator_.deduplicate(ctx_, events).table;
        EXPECT_TRUE(shuffled->Equals(*expected)) << "permutation " << i;
    }
}

TEST_F(EventDeduplicatorTest, DeduplicatingTwiceChangesNothing) {
    std::vector<Record> events = {
        play("X", "Y", 0, 100),
        play("X", "Y", 60, 10),
        play("X", "Y", 105, 100),
        play("X", "Y", 150, 100),
        play("X", "Y", 220, 100),
        play("Q", "R", 5, 0),
        play("Q", "R", 5, 0),
    };
    TablePtr once = deduplicator_.deduplicate(ctx_, events).table;
    DedupOutcome twice = deduplicator_.deduplicate(ctx_, once);

    EXPECT_TRUE(twice.table->Equals(*once));
    EXPECT_EQ(twice.report.exact_duplicates, 0);
    EXPECT_EQ(twice.report.window_duplicates, 0);
}

TEST_F(EventDeduplicatorTest, CustomColumnNames) {
    DedupColumns columns;
    columns.track_name = "title";
    columns.artist = "performer";
    columns.played_at = "ts";
    columns.duration_ms = "length_ms";
    EventDeduplicator custom(columns);

    std::vector<Record> events = {
        Record{{"title", "X"}, {"performer", "Y"}, {"ts", Timestamp{kBase}}, {"length_ms", 180000}},
        Record{{"title", "X"}, {"performer", "Y"},
               {"ts", Timestamp{kBase + 60 * time_utils::kMicrosPerSecond}}, {"length_ms", 180000}},
    };
    EXPECT_EQ(custom.deduplicate(ctx_, events).table->num_rows(), 1);
}

TEST_F(EventDeduplicatorTest, NonTimestampPlayedAtIsRejected) {
    std::vector<Record> events = {
        Record{{"track_name", "X"}, {"artist", "Y"}, {"played_at", "yesterday"}},
    };
    EXPECT_THROW(deduplicator_.deduplicate(ctx_, events), StoreError);
}

TEST_F(EventDeduplicatorTest, EmptyInput) {
    DedupOutcome outcome = deduplicator_.deduplicate(ctx_, std::vector<Record>{});
    EXPECT_EQ(outcome.table->num_rows(), 0);
    EXPECT_EQ(outcome.report.output_rows, 0);
}
