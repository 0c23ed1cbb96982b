#include <gtest/gtest.h>

#include "test_helpers.h"
#include "../src/config.h"

using namespace playledger;
using namespace playledger::test;

TEST(ConfigTest, DefaultsCoverEnrichmentTables) {
    StoreConfig config;
    EXPECT_EQ(config.base_path(), "data/src");
    EXPECT_EQ(config.history_table(), "play_history");
    EXPECT_EQ(config.malformed_policy(), MalformedRecordPolicy::Drop);
    EXPECT_EQ(config.compression(), parquet::Compression::SNAPPY);

    const MergeKeyPolicy& keys = config.merge_keys();
    EXPECT_EQ(keys.key_for("artists"), (std::vector<std::string>{"artist_id"}));
    EXPECT_EQ(keys.key_for("artist_genre"), (std::vector<std::string>{"artist_id", "genre"}));
    EXPECT_EQ(keys.key_for("coordinates"), (std::vector<std::string>{"location_params"}));
    EXPECT_FALSE(keys.has_key("play_history"));
    EXPECT_FALSE(keys.has_key("never_declared"));

    for (const char* entity : {"artists", "albums", "mbz_artists", "cities", "areas_without_continent"}) {
        EXPECT_NO_THROW(config.gap_query(entity)) << entity;
    }
    EXPECT_THROW(config.gap_query("podcasts"), std::invalid_argument);
}

TEST(ConfigTest, LoadsOverrides) {
    StoreConfig config = StoreConfig::load_from_string(R"({
        "base_path": "/srv/ledger",
        "compression": "zstd",
        "row_group_size": 500,
        "malformed_records": "Reject",
        "log_level": "debug",
        "raw_retention_days": 3,
        "merge_keys": {"artists": ["spotify_id"], "play_history": []},
        "dedup": {"played_at": "ts", "priority": "cursor"}
    })");

    EXPECT_EQ(config.base_path(), "/srv/ledger");
    EXPECT_EQ(config.compression(), parquet::Compression::ZSTD);
    EXPECT_EQ(config.row_group_size(), 500);
    EXPECT_EQ(config.malformed_policy(), MalformedRecordPolicy::Reject);
    EXPECT_EQ(config.log_level(), LogLevel::DEBUG);
    EXPECT_EQ(config.raw_retention_days(), 3);
    EXPECT_EQ(config.merge_keys().key_for("artists"), (std::vector<std::string>{"spotify_id"}));
    EXPECT_EQ(config.merge_keys().key_for("albums"), (std::vector<std::string>{"album_id"}));
    EXPECT_EQ(config.dedup_columns().played_at, "ts");
    EXPECT_EQ(config.dedup_columns().priority, "cursor");
    EXPECT_EQ(config.dedup_columns().artist, "artist");
}

TEST(ConfigTest, HistoryTableRedirectsBuiltInQueries) {
    StoreConfig config = StoreConfig::load_from_string(R"({"history_table": "listens"})");
    EXPECT_EQ(config.gap_query("artists").source_table, "listens");
    EXPECT_EQ(config.gap_query("cities").source_table, "area_hierarchy");
}

TEST(ConfigTest, CustomGapQuery) {
    StoreConfig config = StoreConfig::load_from_string(R"({
        "gap_queries": {
            "tracks": {
                "source_table": "play_history",
                "source_key": "track_id",
                "target_table": "track_details",
                "context_columns": ["track_name"],
                "recency_column": "played_at",
                "recency_window_seconds": 3600,
                "exclude_column": "source",
                "exclude_values": ["local"],
                "target_required_columns": ["isrc"],
                "target_incomplete_values": ["n/a", "Unknown"]
            }
        }
    })");

    const GapQuery& q = config.gap_query("tracks");
    EXPECT_EQ(q.target_key, "track_id");
    EXPECT_EQ(q.context_columns, (std::vector<std::string>{"track_name"}));
    ASSERT_TRUE(q.recency_window_seconds.has_value());
    EXPECT_EQ(*q.recency_window_seconds, 3600);
    EXPECT_EQ(q.exclude_values, (std::vector<std::string>{"local"}));
    EXPECT_EQ(q.target_incomplete_values, (std::vector<std::string>{"n/a", "Unknown"}));
    EXPECT_TRUE(q.skip_empty_keys);
    EXPECT_NO_THROW(config.gap_query("artists"));
    EXPECT_EQ(config.gap_query("areas_without_continent").target_incomplete_values,
              (std::vector<std::string>{"Unknown"}));
}

TEST(ConfigTest, RejectsInvalidDocuments) {
    EXPECT_THROW(StoreConfig::load_from_string("[]"), std::runtime_error);
    EXPECT_THROW(StoreConfig::load_from_string(R"({"compression": "brotli"})"), std::runtime_error);
    EXPECT_THROW(StoreConfig::load_from_string(R"({"row_group_size": 0})"), std::runtime_error);
    EXPECT_THROW(StoreConfig::load_from_string(R"({"malformed_records": "fix"})"), std::runtime_error);
    EXPECT_THROW(StoreConfig::load_from_string(R"({"merge_keys": ["artists"]})"), std::runtime_error);
    EXPECT_THROW(StoreConfig::load_from_string(
        R"({"gap_queries": {"x": {"source_table": "a"}}})"), std::runtime_error);
    EXPECT_THROW(StoreConfig::load_from_string(
        R"({"gap_queries": {"x": {"source_table": "a", "source_key": "k", "target_table": "b",
                                  "recency_window_seconds": 10}}})"), std::runtime_error);
}

TEST(ConfigTest, LoadsFromFile) {
    TempDir tmp;
    fs::path path = tmp.path() / "playledger.json";
    write_file(path, R"({"base_path": "elsewhere"})");
    EXPECT_EQ(StoreConfig::load_from_file(path.string()).base_path(), "elsewhere");
    EXPECT_THROW(StoreConfig::load_from_file((tmp.path() / "missing.json").string()), std::runtime_error);
}
