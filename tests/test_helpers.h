#pragma once

#include <gtest/gtest.h>

#include <atomic>
#include <fstream>
#include <string>
#include <unistd.h>

#include "../src/column_view.h"
#include "../src/config.h"
#include "../src/file_utils.h"
#include "../src/record.h"
#include "../src/run_context.h"
#include "../src/time_utils.h"

namespace playledger {
namespace test {

/**
 * Unique directory under the system temp dir, removed on destruction.
 */
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = fs::temp_directory_path() /
                ("playledger_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        fs::remove_all(path_);
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

/**
 * Base fixture: a store config rooted in a fresh temp dir and a quiet context.
 */
class StoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.set_base_path((tmp_.path() / "src").string());
    }

    TempDir tmp_;
    StoreConfig config_;
    RunContext ctx_{nullptr};
};

inline void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

inline Timestamp ts(const std::string& text) {
    auto micros = time_utils::parse_timestamp_us(text);
    if (!micros) {
        throw std::runtime_error("bad test timestamp: " + text);
    }
    return Timestamp{*micros};
}

/**
 * Column values rendered as text, in row order ("" for null).
 */
inline std::vector<std::string> column_strings(const arrow::Table& table, const std::string& column) {
    ColumnView view = ColumnView::of(table, column);
    std::vector<std::string> out;
    for (int64_t row = 0; row < table.num_rows(); ++row) {
        out.push_back(view.string_at(row));
    }
    return out;
}

} // namespace test
} // namespace playledger
