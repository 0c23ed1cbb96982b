#pragma once

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#include <parquet/file_reader.h>
#include <parquet/metadata.h>
#include <memory>
#include <string>

#include "results.h"

namespace playledger {

/**
 * Read Parquet files written by the store (or dropped in by hand).
 */
class ParquetReader {
public:
    explicit ParquetReader(const std::string& path) : path_(path) {
        auto maybe_file = arrow::io::ReadableFile::Open(path);
        if (!maybe_file.ok()) {
            throw StoreError(ErrorKind::Io, "Failed to open Parquet file for reading: " + path +
                                            " - " + maybe_file.status().ToString());
        }
        file_ = *maybe_file;

        parquet::arrow::FileReaderBuilder builder;
        check_status(builder.Open(file_), "Failed to open Parquet reader for " + path);
        builder.memory_pool(arrow::default_memory_pool());
        check_status(builder.Build(&reader_), "Failed to build Parquet reader for " + path);
    }

    /**
     * Decode the whole file.
     */
    TablePtr read_all() {
        TablePtr table;
        check_status(reader_->ReadTable(&table), "Failed to read Parquet file " + path_);
        return table;
    }

    /**
     * Row count from the file footer (no data pages decoded).
     */
    int64_t num_rows() const {
        return reader_->parquet_reader()->metadata()->num_rows();
    }

    std::shared_ptr<arrow::Schema> schema() const {
        std::shared_ptr<arrow::Schema> schema;
        check_status(reader_->GetSchema(&schema), "Failed to read Parquet schema of " + path_);
        return schema;
    }

    const std::string& path() const { return path_; }

    ~ParquetReader() {
        if (file_) {
            (void)file_->Close();
        }
    }

    // No copying
    ParquetReader(const ParquetReader&) = delete;
    ParquetReader& operator=(const ParquetReader&) = delete;

private:
    std::string path_;
    std::shared_ptr<arrow::io::ReadableFile> file_;
    std::unique_ptr<parquet::arrow::FileReader> reader_;
};

} // namespace playledger
