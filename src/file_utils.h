#pragma once

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "string_utils.h"

namespace fs = std::filesystem;

/**
 * File system helpers for table directories and raw input folders.
 */
namespace playledger {
namespace file_utils {

/**
 * List regular files directly under dir whose name ends with one of the
 * suffixes. Sorted by file name. Missing directory -> empty list.
 */
inline std::vector<std::string> list_files(const fs::path& dir,
                                           const std::vector<std::string>& suffixes) {
    std::vector<std::string> files;

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return files;
    }

    for (const auto& entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        std::string name = entry.path().filename().string();
        for (const auto& suffix : suffixes) {
            if (string_utils::ends_with(name, suffix)) {
                files.push_back(entry.path().string());
                break;
            }
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

/**
 * Parquet data files of a table directory.
 */
inline std::vector<std::string> list_parquet_files(const fs::path& dir) {
    return list_files(dir, {".parquet"});
}

/**
 * Create a directory and all parent directories if they don't exist.
 */
inline void create_directories(const fs::path& path) {
    fs::create_directories(path);
}

/**
 * Remove a directory and all its contents; missing directory is fine.
 */
inline void remove_directory(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec && fs::exists(path)) {
        throw std::runtime_error("Failed to remove directory: " + path.string() +
                                 " - " + ec.message());
    }
}

/**
 * Swap a fully written staging directory into place of target.
 *
 * The previous target (if any) is first renamed aside, then the staging
 * directory is renamed to target, and only then is the old copy removed.
 * A crash leaves either the old or the new directory readable under
 * target, plus a stale ".old" sibling.
 */
inline void replace_directory(const fs::path& staging, const fs::path& target) {
    fs::path old_dir = target;
    old_dir += ".old";
    remove_directory(old_dir);

    std::error_code ec;
    bool had_target = fs::exists(target, ec);
    if (had_target) {
        fs::rename(target, old_dir);
    }
    try {
        fs::rename(staging, target);
    } catch (const fs::filesystem_error&) {
        if (had_target) {
            fs::rename(old_dir, target);
        }
        throw;
    }
    if (had_target) {
        remove_directory(old_dir);
    }
}

/**
 * Move a file into dest_dir (created if needed), keeping its name.
 */
inline fs::path move_into(const fs::path& file, const fs::path& dest_dir) {
    file_utils::create_directories(dest_dir);
    fs::path dest = dest_dir / file.filename();
    std::error_code ec;
    fs::rename(file, dest, ec);
    if (ec) {
        // Cross-device: copy then remove
        fs::copy_file(file, dest, fs::copy_options::overwrite_existing);
        fs::remove(file);
    }
    return dest;
}

} // namespace file_utils
} // namespace playledger
