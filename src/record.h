#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

/**
 * Row-oriented representation of table data as handed in by collaborators.
 */
namespace playledger {

/**
 * Point in time, microseconds since Unix epoch (UTC).
 */
struct Timestamp {
    int64_t micros = 0;

    bool operator==(const Timestamp& other) const { return micros == other.micros; }
    bool operator<(const Timestamp& other) const { return micros < other.micros; }
};

/**
 * A single cell. monostate is null.
 */
using Value = std::variant<std::monostate, std::string, int64_t, double, bool, Timestamp>;

inline bool is_null(const Value& value) {
    return std::holds_alternative<std::monostate>(value);
}

/**
 * Column/value pair for brace-initialized records. Spelled-out overloads so
 * that literals land on the intended alternative ("x" is a string, 10 is an
 * int64, nullptr is null).
 */
struct Field {
    std::string name;
    Value value;

    Field(std::string n, const char* v) : name(std::move(n)), value(std::string(v)) {}
    Field(std::string n, std::string v) : name(std::move(n)), value(std::move(v)) {}
    Field(std::string n, int v) : name(std::move(n)), value(static_cast<int64_t>(v)) {}
    Field(std::string n, int64_t v) : name(std::move(n)), value(v) {}
    Field(std::string n, double v) : name(std::move(n)), value(v) {}
    Field(std::string n, bool v) : name(std::move(n)), value(v) {}
    Field(std::string n, Timestamp v) : name(std::move(n)), value(v) {}
    Field(std::string n, std::nullptr_t) : name(std::move(n)), value(std::monostate{}) {}
    Field(std::string n, Value v) : name(std::move(n)), value(std::move(v)) {}
};

/**
 * Record is one row: an ordered mapping of column name to value.
 *
 * Column order is the insertion order and is what the table schema uses
 * when the record introduces a column. Lookups are linear; records are
 * narrow (tens of columns).
 */
class Record {
public:
    Record() = default;

    Record(std::initializer_list<Field> fields) {
        for (const auto& field : fields) {
            set(field.name, field.value);
        }
    }

    /**
     * Set a column, replacing an existing value of the same name.
     */
    Record& set(const std::string& column, Value value) {
        for (auto& field : fields_) {
            if (field.first == column) {
                field.second = std::move(value);
                return *this;
            }
        }
        fields_.emplace_back(column, std::move(value));
        return *this;
    }

    /**
     * Value of a column, or null when the column is absent.
     */
    const Value& get(const std::string& column) const {
        static const Value kNull;
        for (const auto& field : fields_) {
            if (field.first == column) {
                return field.second;
            }
        }
        return kNull;
    }

    bool has(const std::string& column) const {
        for (const auto& field : fields_) {
            if (field.first == column) {
                return true;
            }
        }
        return false;
    }

    /**
     * Rename a column in place; no-op when from is absent or to exists.
     */
    void rename(const std::string& from, const std::string& to) {
        if (has(to)) {
            return;
        }
        for (auto& field : fields_) {
            if (field.first == from) {
                field.first = to;
                return;
            }
        }
    }

    std::optional<std::string> get_string(const std::string& column) const {
        const Value& v = get(column);
        if (auto s = std::get_if<std::string>(&v)) return *s;
        return std::nullopt;
    }

    std::optional<int64_t> get_int(const std::string& column) const {
        const Value& v = get(column);
        if (auto i = std::get_if<int64_t>(&v)) return *i;
        if (auto d = std::get_if<double>(&v)) return static_cast<int64_t>(*d);
        return std::nullopt;
    }

    std::optional<double> get_double(const std::string& column) const {
        const Value& v = get(column);
        if (auto d = std::get_if<double>(&v)) return *d;
        if (auto i = std::get_if<int64_t>(&v)) return static_cast<double>(*i);
        return std::nullopt;
    }

    std::optional<Timestamp> get_timestamp(const std::string& column) const {
        const Value& v = get(column);
        if (auto t = std::get_if<Timestamp>(&v)) return *t;
        return std::nullopt;
    }

    const std::vector<std::pair<std::string, Value>>& fields() const { return fields_; }
    size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }

    /**
     * Equality ignores column order.
     */
    bool operator==(const Record& other) const {
        if (fields_.size() != other.fields_.size()) {
            return false;
        }
        for (const auto& field : fields_) {
            if (!other.has(field.first) || !(other.get(field.first) == field.second)) {
                return false;
            }
        }
        return true;
    }

private:
    std::vector<std::pair<std::string, Value>> fields_;
};

} // namespace playledger
