#include <gtest/gtest.h>

#include "test_helpers.h"
#include "../src/history_ingestor.h"
#include "../src/record_converter.h"
#include "../src/table_store.h"

using namespace playledger;
using namespace playledger::test;

class HistoryIngestorTest : public StoreTest {
protected:
    void SetUp() override {
        StoreTest::SetUp();
        store_ = std::make_unique<TableStore>(config_);
        ingestor_ = std::make_unique<HistoryIngestor>(*store_, config_);
    }

    fs::path raw() const { return tmp_.path() / "raw"; }

    std::vector<Record> history() {
        ReadResult result = store_->read_table(ctx_, "play_history");
        EXPECT_TRUE(found(result));
        if (!found(result)) return {};
        return table_to_records(*std::get<TablePtr>(result));
    }

    // Two reports of one listen (90s apart, 180s long) and another track
    static constexpr const char* kJsonPlays = R"([
        {"track_name": "X", "artist": "Y", "played_at": "2024-01-01T00:00:00Z", "duration_ms": 180000},
        {"track_name": "X", "artist": "Y", "played_at": "2024-01-01T00:01:30Z", "duration_ms": 180000},
        {"track_name": "Z", "artist": "W", "played_at": "2024-01-01T00:00:10Z", "duration_ms": 120000}
    ])";

    // A later listen plus an exact repeat of the first JSON play
    static constexpr const char* kCsvPlays =
        "track_name,artist,played_at,duration_ms\n"
        "X,Y,2024-01-01T00:06:40Z,180000\n"
        "X,Y,2024-01-01T00:00:00Z,180000\n";

    std::unique_ptr<TableStore> store_;
    std::unique_ptr<HistoryIngestor> ingestor_;
};

TEST_F(HistoryIngestorTest, IngestsDeduplicatesAndArchives) {
    write_file(raw() / "detail" / "2024-01-01.json", kJsonPlays);
    write_file(raw() / "detail" / "2024-01-02.csv", kCsvPlays);

    IngestOutcome outcome = ingestor_->ingest(ctx_, raw());
    ASSERT_TRUE(std::holds_alternative<WriteSuccess>(outcome.write));
    EXPECT_EQ(outcome.files_processed.size(), 2u);
    EXPECT_TRUE(outcome.files_failed.empty());
    EXPECT_EQ(outcome.dedup.input_rows, 5);
    EXPECT_EQ(outcome.dedup.exact_duplicates, 1);
    EXPECT_EQ(outcome.dedup.window_duplicates, 1);

    std::vector<Record> rows = history();
    ASSERT_EQ(rows.size(), 3u);
    // Canonical order: played_at ascending
    EXPECT_EQ(rows[0].get_string("track_name"), "X");
    EXPECT_EQ(rows[1].get_string("track_name"), "Z");
    EXPECT_EQ(rows[2].get_timestamp("played_at")->micros, *time_utils::parse_timestamp_us("2024-01-01T00:06:40Z"));

    EXPECT_TRUE(fs::exists(raw() / "processed" / "2024-01-01.json"));
    EXPECT_TRUE(fs::exists(raw() / "processed" / "2024-01-02.csv"));
    EXPECT_TRUE(ingestor_->ingest(ctx_, raw()).files_processed.empty());
}

TEST_F(HistoryIngestorTest, ReingestingTheSameExportIsNoUpdates) {
    write_file(raw() / "detail" / "a.json", kJsonPlays);
    ASSERT_TRUE(std::holds_alternative<WriteSuccess>(ingestor_->ingest(ctx_, raw()).write));
    std::vector<Record> before = history();

    write_file(raw() / "detail" / "a-again.json", kJsonPlays);
    IngestOutcome again = ingestor_->ingest(ctx_, raw());
    EXPECT_TRUE(std::holds_alternative<NoUpdates>(again.write));
    EXPECT_EQ(again.files_processed.size(), 1u);
    EXPECT_FALSE(fs::exists(raw() / "detail" / "a-again.json"));
    EXPECT_EQ(history(), before);
}

TEST_F(HistoryIngestorTest, OverlappingBatchesMergeWithHistory) {
    ASSERT_TRUE(std::holds_alternative<WriteSuccess>(ingestor_->ingest_records(ctx_, {
        Record{{"track_name", "X"}, {"artist", "Y"}, {"played_at", ts("2024-01-01T00:00:00Z")},
               {"duration_ms", 180000}},
    }).write));

    // Second fetch re-reports the same listen a minute later and adds a column
    IngestOutcome outcome = ingestor_->ingest_records(ctx_, {
        Record{{"track_name", "X"}, {"artist", "Y"}, {"played_at", ts("2024-01-01T00:01:00Z")},
               {"duration_ms", 180000}, {"popularity", 50}},
        Record{{"track_name", "X"}, {"artist", "Y"}, {"played_at", ts("2024-01-01T01:00:00Z")},
               {"duration_ms", 180000}, {"popularity", 51}},
    });
    ASSERT_TRUE(std::holds_alternative<WriteSuccess>(outcome.write));
    EXPECT_EQ(outcome.dedup.window_duplicates, 1);

    std::vector<Record> rows = history();
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_TRUE(is_null(rows[0].get("popularity")));
    EXPECT_EQ(rows[1].get_int("popularity"), 51);
}

TEST_F(HistoryIngestorTest, UnreadableFileIsLeftForNextRun) {
    write_file(raw() / "detail" / "good.json", kJsonPlays);
    write_file(raw() / "detail" / "bad.json", "{not json");

    IngestOutcome outcome = ingestor_->ingest(ctx_, raw());
    ASSERT_TRUE(std::holds_alternative<WriteSuccess>(outcome.write));
    ASSERT_EQ(outcome.files_failed.size(), 1u);
    EXPECT_EQ(fs::path(outcome.files_failed[0]).filename().string(), "bad.json");
    EXPECT_EQ(ctx_.metrics().get("raw_files_failed"), 1);
    EXPECT_TRUE(fs::exists(raw() / "detail" / "bad.json"));
    EXPECT_TRUE(fs::exists(raw() / "processed" / "good.json"));
    EXPECT_EQ(history().size(), 2u);
}

TEST_F(HistoryIngestorTest, EmptyRawDirectoryIsNoUpdates) {
    IngestOutcome outcome = ingestor_->ingest(ctx_, raw());
    EXPECT_TRUE(std::holds_alternative<NoUpdates>(outcome.write));
    EXPECT_FALSE(store_->table_exists("play_history"));
}

TEST_F(HistoryIngestorTest, ConflictingHistoryIsAnError) {
    ASSERT_TRUE(std::holds_alternative<WriteSuccess>(ingestor_->ingest_records(ctx_, {
        Record{{"track_name", "X"}, {"artist", "Y"}, {"played_at", ts("2024-01-01T00:00:00Z")},
               {"duration_ms", 180000}},
    }).write));

    write_file(raw() / "detail" / "odd.json",
               R"([{"track_name": "X", "artist": "Y", "played_at": "2024-01-02T00:00:00Z", "duration_ms": "long"}])");
    IngestOutcome outcome = ingestor_->ingest(ctx_, raw());
    ASSERT_TRUE(std::holds_alternative<WriteError>(outcome.write));
    EXPECT_EQ(std::get<WriteError>(outcome.write).kind, ErrorKind::SchemaConflict);
    // Nothing archived when the write failed
    EXPECT_TRUE(fs::exists(raw() / "detail" / "odd.json"));
    EXPECT_EQ(history().size(), 1u);
}
