#pragma once

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#include <parquet/properties.h>
#include <memory>
#include <string>

#include "results.h"

namespace playledger {

/**
 * Write Arrow tables to one Parquet file.
 *
 * The Arrow schema is stored in the file metadata so timestamp units and
 * time zones survive a round trip.
 */
class ParquetWriter {
public:
    /**
     * Open a Parquet file for writing.
     *
     * @param path Output file path
     * @param schema Schema of every table passed to write_table
     * @param compression Compression codec (UNCOMPRESSED, SNAPPY, GZIP, LZ4, ZSTD)
     * @param row_group_size Max rows per row group
     */
    ParquetWriter(const std::string& path,
                  std::shared_ptr<arrow::Schema> schema,
                  parquet::Compression::type compression = parquet::Compression::SNAPPY,
                  int64_t row_group_size = 10000)
        : path_(path), schema_(std::move(schema)), row_group_size_(row_group_size), rows_written_(0) {

        auto maybe_file = arrow::io::FileOutputStream::Open(path);
        if (!maybe_file.ok()) {
            throw StoreError(ErrorKind::Io, "Failed to open Parquet file for writing: " + path +
                                            " - " + maybe_file.status().ToString());
        }
        file_ = *maybe_file;

        parquet::WriterProperties::Builder props_builder;
        props_builder.compression(compression);
        props_builder.version(parquet::ParquetVersion::PARQUET_2_6);
        props_builder.max_row_group_length(row_group_size);
        auto props = props_builder.build();

        auto arrow_props = parquet::ArrowWriterProperties::Builder().store_schema()->build();

        auto status_writer = parquet::arrow::FileWriter::Open(
            *schema_,
            arrow::default_memory_pool(),
            file_,
            props,
            arrow_props
        );

        if (!status_writer.ok()) {
            throw StoreError(ErrorKind::Io, "Failed to create Parquet writer: " +
                                            status_writer.status().ToString());
        }
        writer_ = std::move(*status_writer);
    }

    /**
     * Append all rows of a table (schema must equal the writer's).
     */
    void write_table(const arrow::Table& table) {
        if (table.num_rows() == 0) {
            return;
        }
        if (!table.schema()->Equals(*schema_, /*check_metadata=*/false)) {
            throw StoreError(ErrorKind::SchemaConflict,
                             "Table schema does not match Parquet writer schema for " + path_);
        }
        check_status(writer_->WriteTable(table, row_group_size_),
                     "Failed to write Parquet table " + path_);
        rows_written_ += table.num_rows();
    }

    /**
     * Close the Parquet file and finalize. Throws on failure so a half-written
     * file is never mistaken for a complete one.
     */
    void close() {
        if (writer_) {
            auto status = writer_->Close();
            writer_.reset();
            check_status(status, "Failed to close Parquet writer " + path_);
        }

        if (file_) {
            auto status = file_->Close();
            file_.reset();
            check_status(status, "Failed to close Parquet file " + path_);
        }
    }

    int64_t rows_written() const { return rows_written_; }
    const std::string& path() const { return path_; }

    ~ParquetWriter() {
        // Best effort on the error path; close() reports failures when called explicitly
        if (writer_) {
            (void)writer_->Close();
        }
        if (file_) {
            (void)file_->Close();
        }
    }

    // No copying
    ParquetWriter(const ParquetWriter&) = delete;
    ParquetWriter& operator=(const ParquetWriter&) = delete;

private:
    std::string path_;
    std::shared_ptr<arrow::Schema> schema_;
    int64_t row_group_size_;
    std::shared_ptr<arrow::io::FileOutputStream> file_;
    std::unique_ptr<parquet::arrow::FileWriter> writer_;
    int64_t rows_written_;
};

} // namespace playledger
