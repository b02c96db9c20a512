#pragma once

#include <cstdint>
#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace pantry {

// Blob payload
using blob_t = std::vector<uint8_t>;

// Value stored in or bound to a SQLite column
using value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    blob_t
>;

// One result row. Columns keep the order SQLite reports them in.
using row_t = std::vector<std::pair<std::string, value_t>>;

/// SQL text plus the values bound positionally to its `?` placeholders.
struct statement {
    std::string sql;
    std::vector<value_t> bind;

    statement() = default;
    statement(std::string s, std::vector<value_t> b = {})
        : sql(std::move(s)), bind(std::move(b)) {}

    bool operator==(const statement&) const = default;
};

/// Receives diagnostic trace lines. An empty trace_fn drops them.
using trace_fn = std::function<void(const std::string& message)>;

/// Look up a column by name in a row. Returns nullptr if the row has no such column.
inline const value_t* find_column(const row_t& row, const std::string& name) {
    for (const auto& [column, value] : row) {
        if (column == name) return &value;
    }
    return nullptr;
}

} // namespace pantry
