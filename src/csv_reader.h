#pragma once

#include <cstdint>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <zlib.h>

#include "string_utils.h"

/**
 * Reader for raw play exports in CSV form, plain or gzip-compressed
 * (chosen by the ".gz" extension).
 */
namespace playledger {

/**
 * Block-buffered line reader over a gzip stream.
 */
class GzLineReader {
public:
    explicit GzLineReader(gzFile gz) : gz_(gz), buffer_pos_(0), buffer_end_(0), eof_(false) {
        buffer_.resize(kBufferSize);
    }

    /**
     * Read the next line without its terminator. Returns false at EOF.
     * Throws on a corrupt stream.
     */
    bool read_line(std::string& out) {
        out.clear();
        if (!gz_ || eof_) {
            return false;
        }

        while (true) {
            for (size_t i = buffer_pos_; i < buffer_end_; ++i) {
                if (buffer_[i] == '\n') {
                    out.append(&buffer_[buffer_pos_], i - buffer_pos_);
                    buffer_pos_ = i + 1;
                    if (!out.empty() && out.back() == '\r') {
                        out.pop_back();
                    }
                    return true;
                }
            }

            out.append(&buffer_[buffer_pos_], buffer_end_ - buffer_pos_);

            int bytes_read = gzread(gz_, buffer_.data(), static_cast<unsigned>(kBufferSize));
            if (bytes_read < 0) {
                int errnum = 0;
                const char* message = gzerror(gz_, &errnum);
                throw std::runtime_error(std::string("Failed to decompress CSV: ") +
                                         (message ? message : "unknown zlib error"));
            }
            if (bytes_read == 0) {
                eof_ = true;
                // Last line without newline
                return !out.empty();
            }

            buffer_pos_ = 0;
            buffer_end_ = static_cast<size_t>(bytes_read);
        }
    }

private:
    static constexpr size_t kBufferSize = 1024 * 1024;
    gzFile gz_;
    std::vector<char> buffer_;
    size_t buffer_pos_;
    size_t buffer_end_;
    bool eof_;
};

/**
 * RFC 4180 CSV reader. Quoted fields may contain commas, doubled quotes
 * and line breaks.
 *
 *   CsvReader reader("plays.csv.gz");
 *   std::vector<std::string> row;
 *   while (reader.next_row(row)) { ... }
 */
class CsvReader {
public:
    explicit CsvReader(const std::string& path, bool has_header = true)
        : path_(path), is_gzipped_(string_utils::ends_with(path, ".gz")) {

        if (is_gzipped_) {
            gz_file_ = gzopen(path.c_str(), "rb");
            if (!gz_file_) {
                throw std::runtime_error("Failed to open gzipped file: " + path);
            }
            gz_reader_ = std::make_unique<GzLineReader>(gz_file_);
        } else {
            plain_file_.open(path);
            if (!plain_file_) {
                throw std::runtime_error("Failed to open file: " + path);
            }
        }

        if (has_header) {
            if (!next_row(headers_)) {
                throw std::runtime_error("Empty CSV file: " + path);
            }
            // Excel exports start with a UTF-8 byte order mark
            if (!headers_.empty() && string_utils::starts_with(headers_[0], "\xEF\xBB\xBF")) {
                headers_[0] = headers_[0].substr(3);
            }
            rows_read_ = 0;
        }
    }

    ~CsvReader() {
        gz_reader_.reset();
        if (gz_file_) {
            gzclose(gz_file_);
        }
    }

    CsvReader(const CsvReader&) = delete;
    CsvReader& operator=(const CsvReader&) = delete;

    const std::vector<std::string>& headers() const { return headers_; }
    const std::string& path() const { return path_; }
    int64_t rows_read() const { return rows_read_; }

    /**
     * Read the next record into row (reused). Blank lines are skipped.
     * Returns false at EOF; throws on an unterminated quoted field.
     */
    bool next_row(std::vector<std::string>& row) {
        std::string line;
        do {
            if (!read_line(line)) {
                return false;
            }
        } while (line.empty());

        // A quoted field may span lines
        while (!parse_csv_line_into(line, row)) {
            std::string continuation;
            if (!read_line(continuation)) {
                throw std::runtime_error("Unterminated quoted field in " + path_ +
                                         " after row " + std::to_string(rows_read_));
            }
            line += '\n';
            line += continuation;
        }
        ++rows_read_;
        return true;
    }

    static std::vector<std::string> parse_csv_line(const std::string& line) {
        std::vector<std::string> fields;
        if (!parse_csv_line_into(line, fields)) {
            throw std::runtime_error("Unterminated quoted field in CSV line");
        }
        return fields;
    }

    /**
     * Split one record into fields (reusing the vector).
     * Returns false if the record ends inside a quoted field.
     */
    static bool parse_csv_line_into(const std::string& line, std::vector<std::string>& fields) {
        fields.clear();

        std::string current_field;
        current_field.reserve(64);
        bool in_quotes = false;

        for (size_t i = 0; i < line.size(); ++i) {
            char c = line[i];

            if (in_quotes) {
                if (c == '"') {
                    if (i + 1 < line.size() && line[i + 1] == '"') {
                        current_field.push_back('"');
                        ++i;
                    } else {
                        in_quotes = false;
                    }
                } else {
                    current_field.push_back(c);
                }
            } else if (c == ',') {
                fields.push_back(std::move(current_field));
                current_field.clear();
            } else if (c == '"') {
                in_quotes = true;
            } else {
                current_field.push_back(c);
            }
        }

        fields.push_back(std::move(current_field));
        return !in_quotes;
    }

private:
    bool read_line(std::string& line) {
        if (is_gzipped_) {
            return gz_reader_->read_line(line);
        }
        if (!std::getline(plain_file_, line)) {
            return false;
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        return true;
    }

    std::string path_;
    bool is_gzipped_;
    std::ifstream plain_file_;
    gzFile gz_file_ = nullptr;
    std::unique_ptr<GzLineReader> gz_reader_;
    std::vector<std::string> headers_;
    int64_t rows_read_ = 0;
};

/**
 * Index of a column in the header row, or SIZE_MAX.
 */
inline size_t find_column_index(const std::vector<std::string>& headers,
                                const std::string& column_name) {
    for (size_t i = 0; i < headers.size(); ++i) {
        if (headers[i] == column_name) {
            return i;
        }
    }
    return SIZE_MAX;
}

} // namespace playledger
