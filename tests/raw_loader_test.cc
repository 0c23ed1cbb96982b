#include <gtest/gtest.h>

#include <zlib.h>

#include <cstdint>

#include "test_helpers.h"
#include "../src/raw_loader.h"

using namespace playledger;
using namespace playledger::test;

namespace {

void write_gz(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    gzFile gz = gzopen(path.string().c_str(), "wb");
    ASSERT_NE(gz, nullptr);
    ASSERT_EQ(gzwrite(gz, content.data(), static_cast<unsigned>(content.size())),
              static_cast<int>(content.size()));
    ASSERT_EQ(gzclose(gz), Z_OK);
}

const char* kCsvPlays =
    "track_name,artist,played_at,duration_ms,uri\n"
    "Song A,Band,2024-01-01T00:00:00Z,180000,spotify:track:a\n"
    "\"Song, With Comma\",Band,2024-01-01 00:05:00,,spotify:track:b\n"
    "Song C,Band,not-a-time,200000,spotify:track:c\n";

} // namespace

class RawPlayLoaderTest : public ::testing::Test {
protected:
    fs::path detail() const { return tmp_.path() / "detail"; }

    TempDir tmp_;
    RunContext ctx_{nullptr};
    RawPlayLoader loader_;
};

TEST_F(RawPlayLoaderTest, DiscoversSupportedFilesInNameOrder) {
    write_file(detail() / "b.json", "[]");
    write_file(detail() / "a.csv", "x\n");
    write_gz(detail() / "c.csv.gz", "x\n");
    write_file(detail() / "notes.txt", "ignore me");
    write_file(tmp_.path() / "top.json", "[]");

    std::vector<std::string> files = loader_.discover(tmp_.path());
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(fs::path(files[0]).filename().string(), "a.csv");
    EXPECT_EQ(fs::path(files[1]).filename().string(), "b.json");
    EXPECT_EQ(fs::path(files[2]).filename().string(), "c.csv.gz");
}

TEST_F(RawPlayLoaderTest, MissingDetailDirectoryIsEmpty) {
    EXPECT_TRUE(loader_.discover(tmp_.path() / "nowhere").empty());
}

TEST_F(RawPlayLoaderTest, LoadsJsonExport) {
    write_file(detail() / "plays.json", R"([
        {"track_name": "Song A", "artist": "Band", "played_at": "2024-01-01T00:00:00.000Z",
         "duration_ms": 180000, "uri": "spotify:track:a", "request_after": 1704067100000,
         "explicit": false, "album": {"id": "al1"}},
        {"track_name": "Song B", "artist": "Band", "played_at": 1704067500000, "popularity": null}
    ])");

    std::vector<Record> records = loader_.load_file(ctx_, (detail() / "plays.json").string());
    ASSERT_EQ(records.size(), 2u);

    const Record& first = records[0];
    EXPECT_EQ(first.get_timestamp("played_at")->micros, 1704067200LL * time_utils::kMicrosPerSecond);
    EXPECT_EQ(first.get_int("duration_ms"), 180000);
    EXPECT_EQ(first.get_string("track_uri"), "spotify:track:a");
    EXPECT_FALSE(first.has("uri"));
    EXPECT_EQ(first.get_int("request_cursor"), 1704067100000LL);
    EXPECT_EQ(std::get<bool>(first.get("explicit")), false);
    EXPECT_FALSE(first.has("album"));

    const Record& second = records[1];
    EXPECT_EQ(second.get_timestamp("played_at")->micros, 1704067500LL * time_utils::kMicrosPerSecond);
    EXPECT_TRUE(second.has("popularity"));
    EXPECT_TRUE(is_null(second.get("popularity")));
}

TEST_F(RawPlayLoaderTest, OversizedJsonIntegerBecomesDouble) {
    write_file(detail() / "big.json", R"([
        {"track_name": "Song A", "external_id": 123456789012345678901234, "popularity": 9223372036854775807}
    ])");

    std::vector<Record> records = loader_.load_file(ctx_, (detail() / "big.json").string());
    ASSERT_EQ(records.size(), 1u);
    ASSERT_TRUE(std::holds_alternative<double>(records[0].get("external_id")));
    EXPECT_DOUBLE_EQ(std::get<double>(records[0].get("external_id")), 1.23456789012345678901234e23);
    EXPECT_EQ(records[0].get_int("popularity"), INT64_MAX);
}

TEST_F(RawPlayLoaderTest, JsonMustBeArrayOfObjects) {
    write_file(detail() / "object.json", R"({"track_name": "x"})");
    write_file(detail() / "scalars.json", "[1, 2]");
    write_file(detail() / "broken.json", "[{\"track_name\": ");

    EXPECT_THROW(loader_.load_file(ctx_, (detail() / "object.json").string()), std::runtime_error);
    EXPECT_THROW(loader_.load_file(ctx_, (detail() / "scalars.json").string()), std::runtime_error);
    EXPECT_THROW(loader_.load_file(ctx_, (detail() / "broken.json").string()), std::runtime_error);
}

TEST_F(RawPlayLoaderTest, LoadsCsvExport) {
    write_file(detail() / "plays.csv", kCsvPlays);
    std::vector<Record> records = loader_.load_file(ctx_, (detail() / "plays.csv").string());
    ASSERT_EQ(records.size(), 3u);

    EXPECT_EQ(records[0].get_string("track_uri"), "spotify:track:a");
    EXPECT_EQ(records[0].get_int("duration_ms"), 180000);
    EXPECT_EQ(records[0].get_timestamp("played_at")->micros, 1704067200LL * time_utils::kMicrosPerSecond);

    EXPECT_EQ(records[1].get_string("track_name"), "Song, With Comma");
    EXPECT_TRUE(is_null(records[1].get("duration_ms")));
    EXPECT_EQ(records[1].get_timestamp("played_at")->micros, 1704067500LL * time_utils::kMicrosPerSecond);

    // Unparseable timestamp: the record stays, the value is null
    EXPECT_TRUE(records[2].has("played_at"));
    EXPECT_TRUE(is_null(records[2].get("played_at")));
}

TEST_F(RawPlayLoaderTest, LoadsGzippedCsv) {
    write_gz(detail() / "plays.csv.gz", kCsvPlays);
    std::vector<Record> records = loader_.load_file(ctx_, (detail() / "plays.csv.gz").string());
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[1].get_string("track_name"), "Song, With Comma");
}

TEST_F(RawPlayLoaderTest, CsvRowWiderThanHeaderIsRejected) {
    write_file(detail() / "wide.csv", "track_name,artist\nA,B,C\n");
    EXPECT_THROW(loader_.load_file(ctx_, (detail() / "wide.csv").string()), std::runtime_error);
}

TEST_F(RawPlayLoaderTest, PlainLoaderKeepsColumnNamesAndText) {
    write_file(detail() / "rows.csv", "uri,duration_ms,played_at\nspotify:x,1000,2024-01-01T00:00:00Z\n");
    std::vector<Record> records =
        RawPlayLoader::plain().load_file(ctx_, (detail() / "rows.csv").string());
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].get_string("uri"), "spotify:x");
    EXPECT_EQ(records[0].get_string("duration_ms"), "1000");
    EXPECT_TRUE(records[0].get_timestamp("played_at").has_value());
}

TEST_F(RawPlayLoaderTest, ArchiveMovesIntoProcessed) {
    write_file(detail() / "plays.json", "[]");
    fs::path archived = loader_.archive((detail() / "plays.json").string(), tmp_.path());
    EXPECT_EQ(archived.string(), (tmp_.path() / "processed" / "plays.json").string());
    EXPECT_TRUE(fs::exists(archived));
    EXPECT_FALSE(fs::exists(detail() / "plays.json"));
}

TEST_F(RawPlayLoaderTest, PrunesOnlyExpiredArchives) {
    fs::path processed = tmp_.path() / "processed";
    write_file(processed / "old.json", "[]");
    write_file(processed / "fresh.json", "[]");
    fs::last_write_time(processed / "old.json",
                        fs::file_time_type::clock::now() - std::chrono::hours(24 * 10));

    EXPECT_EQ(loader_.prune_processed(ctx_, tmp_.path(), 7), 1u);
    EXPECT_FALSE(fs::exists(processed / "old.json"));
    EXPECT_TRUE(fs::exists(processed / "fresh.json"));

    EXPECT_EQ(loader_.prune_processed(ctx_, tmp_.path() / "nowhere", 7), 0u);
}
