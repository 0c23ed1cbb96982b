#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <parquet/types.h>

#include "json_parser.h"
#include "logger.h"
#include "string_utils.h"

/**
 * Configuration of the table store.
 *
 * The config file is a JSON object; every key is optional:
 * - base_path: directory holding one sub-directory per table
 * - compression / row_group_size: Parquet write options
 * - malformed_records: "drop" or "reject"
 * - history_table, raw_retention_days, log_level
 * - merge_keys: {table: [columns]} (an empty list means "no key")
 * - dedup: column names of play events
 * - gap_queries: {entity_type: {...}} overriding or adding gap queries
 */
namespace playledger {

/**
 * What to do with a record whose merge key is null.
 */
enum class MalformedRecordPolicy {
    Drop,    // remove the record, count it, warn
    Reject   // fail the whole write
};

inline MalformedRecordPolicy parse_malformed_policy(const std::string& name) {
    std::string lower = string_utils::to_lower(name);
    if (lower == "drop") return MalformedRecordPolicy::Drop;
    if (lower == "reject") return MalformedRecordPolicy::Reject;
    throw std::runtime_error("Config: malformed_records must be 'drop' or 'reject', got: " + name);
}

/**
 * Convert compression string to Parquet compression type.
 */
inline parquet::Compression::type parse_compression(const std::string& str) {
    std::string lower = string_utils::to_lower(str);

    if (lower == "none" || lower == "uncompressed") {
        return parquet::Compression::UNCOMPRESSED;
    } else if (lower == "snappy") {
        return parquet::Compression::SNAPPY;
    } else if (lower == "gzip" || lower == "gz") {
        return parquet::Compression::GZIP;
    } else if (lower == "lz4") {
        return parquet::Compression::LZ4;
    } else if (lower == "zstd") {
        return parquet::Compression::ZSTD;
    }
    throw std::runtime_error("Unknown compression type: " + str +
                             " (valid: none, snappy, gzip, lz4, zstd)");
}

/**
 * Table name -> ordered merge-key columns.
 * Tables without an entry (or with an empty list) merge by whole-row identity.
 */
class MergeKeyPolicy {
public:
    /**
     * Keys of the original enrichment tables.
     */
    static MergeKeyPolicy defaults() {
        MergeKeyPolicy policy;
        policy.set("artists", {"artist_id"});
        policy.set("spotify_artists", {"artist_id"});
        policy.set("albums", {"album_id"});
        policy.set("spotify_albums", {"album_id"});
        policy.set("artist_genre", {"artist_id", "genre"});
        policy.set("spotify_artist_genre", {"artist_id", "genre"});
        policy.set("album_genre", {"album_id", "genre"});
        policy.set("mbz_artist_info", {"id"});
        policy.set("area_hierarchy", {"area_id"});
        policy.set("mbz_area_hierarchy", {"area_id"});
        policy.set("coordinates", {"location_params"});
        policy.set("cities_with_lat_long", {"location_params"});
        policy.set("play_history", {});
        return policy;
    }

    void set(const std::string& table, std::vector<std::string> keys) {
        keys_[table] = std::move(keys);
    }

    /**
     * Key columns for a table; empty when the table has no declared key.
     */
    std::vector<std::string> key_for(const std::string& table) const {
        auto it = keys_.find(table);
        if (it == keys_.end()) {
            return {};
        }
        return it->second;
    }

    bool has_key(const std::string& table) const {
        return !key_for(table).empty();
    }

    const std::map<std::string, std::vector<std::string>>& entries() const { return keys_; }

private:
    std::map<std::string, std::vector<std::string>> keys_;
};

/**
 * Column names of play events.
 */
struct DedupColumns {
    std::string track_id = "track_id";
    std::string track_name = "track_name";
    std::string artist = "artist";
    std::string played_at = "played_at";
    std::string duration_ms = "duration_ms";
    std::string priority = "request_cursor";  // higher wins among exact duplicates
};

/**
 * One "what still needs enrichment" query: distinct source keys with no
 * (complete) row in the target table.
 */
struct GapQuery {
    std::string entity_type;

    std::string source_table;
    std::string source_key;
    std::string target_table;
    std::string target_key;

    std::vector<std::string> context_columns;   // carried along, min value per key
    std::vector<std::string> order_by;          // ascending; key is the final tie-breaker
    std::string count_column;                   // if set: rows per key, ordered descending first

    std::string recency_column;                 // source timestamp column
    std::optional<int64_t> recency_window_seconds;

    std::string exclude_column;                 // source column checked against exclude_values
    std::vector<std::string> exclude_values;

    std::vector<std::string> source_required_columns;  // must be non-null in source
    std::vector<std::string> target_required_columns;  // target row counts only if non-blank
    std::vector<std::string> target_incomplete_values; // placeholders that also count as blank
    bool skip_empty_keys = true;
};

/**
 * Complete store configuration.
 */
class StoreConfig {
public:
    StoreConfig()
        : merge_keys_(MergeKeyPolicy::defaults()),
          gap_queries_(default_gap_queries("play_history")) {}

    static StoreConfig load_from_file(const std::string& config_path) {
        return from_json(json::parse_file(config_path));
    }

    static StoreConfig load_from_string(const std::string& document) {
        return from_json(json::parse(document));
    }

    static StoreConfig from_json(const json::Value& root) {
        if (!root.is_object()) {
            throw std::runtime_error("Config: root must be a JSON object");
        }

        StoreConfig config;
        config.base_path_ = root.get_string("base_path", config.base_path_);
        if (root.has_key("compression")) {
            config.compression_ = parse_compression(root.get_string("compression"));
        }
        config.row_group_size_ = root.get_int("row_group_size", config.row_group_size_);
        if (config.row_group_size_ <= 0) {
            throw std::runtime_error("Config: row_group_size must be positive");
        }
        if (root.has_key("malformed_records")) {
            config.malformed_policy_ = parse_malformed_policy(root.get_string("malformed_records"));
        }
        config.raw_retention_days_ = root.get_int("raw_retention_days", config.raw_retention_days_);
        if (root.has_key("log_level")) {
            config.log_level_ = parse_log_level(root.get_string("log_level"));
        }

        std::string history = root.get_string("history_table", config.history_table_);
        if (history != config.history_table_) {
            config.history_table_ = history;
            config.gap_queries_ = default_gap_queries(history);
        }

        if (root.has_key("merge_keys")) {
            const json::Value& keys = root["merge_keys"];
            if (!keys.is_object()) {
                throw std::runtime_error("Config: 'merge_keys' must be an object");
            }
            for (const auto& [table, _] : keys.object) {
                config.merge_keys_.set(table, keys.get_string_list(table));
            }
        }

        if (root.has_key("dedup")) {
            const json::Value& d = root["dedup"];
            if (!d.is_object()) {
                throw std::runtime_error("Config: 'dedup' must be an object");
            }
            DedupColumns& cols = config.dedup_columns_;
            cols.track_id = d.get_string("track_id", cols.track_id);
            cols.track_name = d.get_string("track_name", cols.track_name);
            cols.artist = d.get_string("artist", cols.artist);
            cols.played_at = d.get_string("played_at", cols.played_at);
            cols.duration_ms = d.get_string("duration_ms", cols.duration_ms);
            cols.priority = d.get_string("priority", cols.priority);
        }

        if (root.has_key("gap_queries")) {
            const json::Value& queries = root["gap_queries"];
            if (!queries.is_object()) {
                throw std::runtime_error("Config: 'gap_queries' must be an object");
            }
            for (const auto& [name, value] : queries.object) {
                config.gap_queries_[name] = parse_gap_query(name, value);
            }
        }

        return config;
    }

    const std::string& base_path() const { return base_path_; }
    parquet::Compression::type compression() const { return compression_; }
    int64_t row_group_size() const { return row_group_size_; }
    MalformedRecordPolicy malformed_policy() const { return malformed_policy_; }
    const std::string& history_table() const { return history_table_; }
    int64_t raw_retention_days() const { return raw_retention_days_; }
    LogLevel log_level() const { return log_level_; }
    const MergeKeyPolicy& merge_keys() const { return merge_keys_; }
    const DedupColumns& dedup_columns() const { return dedup_columns_; }
    const std::map<std::string, GapQuery>& gap_queries() const { return gap_queries_; }

    /**
     * Gap query by entity type. Throws std::invalid_argument if unknown.
     */
    const GapQuery& gap_query(const std::string& entity_type) const {
        auto it = gap_queries_.find(entity_type);
        if (it == gap_queries_.end()) {
            throw std::invalid_argument("Unknown entity_type: " + entity_type);
        }
        return it->second;
    }

    void set_base_path(const std::string& path) { base_path_ = path; }
    void set_malformed_policy(MalformedRecordPolicy policy) { malformed_policy_ = policy; }
    void set_merge_keys(MergeKeyPolicy policy) { merge_keys_ = std::move(policy); }
    void set_gap_query(GapQuery query) { gap_queries_[query.entity_type] = std::move(query); }

    /**
     * Built-in gap queries over the play history and area tables.
     */
    static std::map<std::string, GapQuery> default_gap_queries(const std::string& history_table) {
        std::map<std::string, GapQuery> queries;

        GapQuery artists;
        artists.entity_type = "artists";
        artists.source_table = history_table;
        artists.source_key = "artist_id";
        artists.target_table = "artists";
        artists.target_key = "artist_id";
        artists.context_columns = {"artist"};
        artists.order_by = {"artist"};
        queries[artists.entity_type] = artists;

        GapQuery albums;
        albums.entity_type = "albums";
        albums.source_table = history_table;
        albums.source_key = "album_id";
        albums.target_table = "albums";
        albums.target_key = "album_id";
        albums.count_column = "play_count";
        queries[albums.entity_type] = albums;

        GapQuery mbz;
        mbz.entity_type = "mbz_artists";
        mbz.source_table = history_table;
        mbz.source_key = "artist_id";
        mbz.target_table = "mbz_artist_info";
        mbz.target_key = "spotify_id";
        mbz.context_columns = {"artist", "track_isrc"};
        mbz.order_by = {"artist"};
        mbz.source_required_columns = {"track_isrc"};
        mbz.recency_column = "played_at";
        mbz.recency_window_seconds = 48 * 3600;
        queries[mbz.entity_type] = mbz;

        GapQuery cities;
        cities.entity_type = "cities";
        cities.source_table = "area_hierarchy";
        cities.source_key = "location_params";
        cities.target_table = "coordinates";
        cities.target_key = "location_params";
        cities.context_columns = {"city_name", "country_code", "country_name"};
        cities.order_by = {"city_name"};
        queries[cities.entity_type] = cities;

        GapQuery continents;
        continents.entity_type = "areas_without_continent";
        continents.source_table = "area_hierarchy";
        continents.source_key = "area_id";
        continents.target_table = "area_hierarchy";
        continents.target_key = "area_id";
        continents.context_columns = {"area_name"};
        continents.order_by = {"area_name"};
        continents.target_required_columns = {"continent"};
        continents.target_incomplete_values = {"Unknown"};
        queries[continents.entity_type] = continents;

        return queries;
    }

private:
    static GapQuery parse_gap_query(const std::string& name, const json::Value& v) {
        if (!v.is_object()) {
            throw std::runtime_error("Config: gap query '" + name + "' must be an object");
        }
        GapQuery q;
        q.entity_type = name;
        q.source_table = v.get_string("source_table");
        q.source_key = v.get_string("source_key");
        q.target_table = v.get_string("target_table");
        q.target_key = v.get_string("target_key", q.source_key);
        q.context_columns = v.get_string_list("context_columns");
        q.order_by = v.get_string_list("order_by");
        q.count_column = v.get_string("count_column");
        q.recency_column = v.get_string("recency_column");
        if (v.has_key("recency_window_seconds")) {
            q.recency_window_seconds = v.get_int("recency_window_seconds", 0);
        }
        q.exclude_column = v.get_string("exclude_column");
        q.exclude_values = v.get_string_list("exclude_values");
        q.source_required_columns = v.get_string_list("source_required_columns");
        q.target_required_columns = v.get_string_list("target_required_columns");
        q.target_incomplete_values = v.get_string_list("target_incomplete_values");
        q.skip_empty_keys = v.get_bool("skip_empty_keys", true);

        if (q.source_table.empty() || q.source_key.empty() || q.target_table.empty()) {
            throw std::runtime_error("Config: gap query '" + name +
                                     "' needs 'source_table', 'source_key' and 'target_table'");
        }
        if (q.recency_window_seconds && q.recency_column.empty()) {
            throw std::runtime_error("Config: gap query '" + name +
                                     "' has a recency window but no 'recency_column'");
        }
        return q;
    }

    std::string base_path_ = "data/src";
    parquet::Compression::type compression_ = parquet::Compression::SNAPPY;
    int64_t row_group_size_ = 10000;
    MalformedRecordPolicy malformed_policy_ = MalformedRecordPolicy::Drop;
    std::string history_table_ = "play_history";
    int64_t raw_retention_days_ = 7;
    LogLevel log_level_ = LogLevel::INFO;
    MergeKeyPolicy merge_keys_;
    DedupColumns dedup_columns_;
    std::map<std::string, GapQuery> gap_queries_;
};

} // namespace playledger
