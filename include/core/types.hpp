#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sqlgate {

// ============================================================================
// Scalar Cell Values
// ============================================================================

struct Null {
    bool operator==(const Null&) const = default;
};

using Blob = std::vector<uint8_t>;

/**
 * @brief One result cell: null, integer, float, text, or binary
 *
 * Alternatives are ordered to match SQLite's storage classes.
 */
using ScalarValue = std::variant<Null, int64_t, double, std::string, Blob>;

enum class ScalarKind : uint8_t { NUL, INTEGER, FLOAT, TEXT, BINARY };

[[nodiscard]] inline ScalarKind kind_of(const ScalarValue& v) {
    return static_cast<ScalarKind>(v.index());
}

[[nodiscard]] inline bool is_null(const ScalarValue& v) {
    return std::holds_alternative<Null>(v);
}

using Row = std::vector<ScalarValue>;

// ============================================================================
// Result Shapes
// ============================================================================

/**
 * @brief Canonical tabular result: columns, rows, count
 *
 * count always equals rows.size(); it is never computed by a separate query.
 */
struct ResultSet {
    std::vector<std::string> columns;
    std::vector<Row> rows;
    size_t count = 0;
};

/**
 * @brief ResultSet plus the effective (post-defaulting) page that produced it
 */
struct PagedResultSet {
    ResultSet result;
    int64_t limit = 0;
    int64_t offset = 0;
};

// ============================================================================
// Table Introspection
// ============================================================================

struct ColumnInfo {
    int64_t cid = 0;                         // Ordinal position
    std::string name;
    std::string type;                        // Declared type (may be empty)
    bool not_null = false;
    std::optional<std::string> default_value; // Default expression text, if any
    bool primary_key = false;
};

struct TableInfo {
    std::string table_name;
    std::vector<ColumnInfo> columns;
    size_t column_count = 0;
};

} // namespace sqlgate
