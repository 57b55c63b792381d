#include "executor/result_shaper.hpp"
#include "core/base64.hpp"

#include <cmath>
#include <type_traits>
#include <variant>

namespace sqlgate {

namespace {

std::string cell_text(const ScalarValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Null>) {
            return {};
        } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, double>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            return std::string(v.begin(), v.end());
        }
    }, value);
}

int64_t cell_int(const ScalarValue& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) return *i;
    if (const auto* d = std::get_if<double>(&value)) return static_cast<int64_t>(*d);
    return 0;
}

} // anonymous namespace

// ============================================================================
// Typed shapes
// ============================================================================

ResultSet ResultShaper::shape(DbResultSet&& raw) {
    ResultSet result;
    result.columns = std::move(raw.column_names);
    result.rows = std::move(raw.rows);
    result.count = result.rows.size();
    return result;
}

PagedResultSet ResultShaper::shape_page(DbResultSet&& raw, const PageRequest& page) {
    PagedResultSet paged;
    paged.result = shape(std::move(raw));
    paged.limit = page.limit();
    paged.offset = page.offset();
    return paged;
}

std::vector<std::string> ResultShaper::shape_name_list(DbResultSet&& raw) {
    std::vector<std::string> names;
    names.reserve(raw.rows.size());
    for (auto& row : raw.rows) {
        if (row.empty()) continue;
        names.push_back(cell_text(row.front()));
    }
    return names;
}

TableInfo ResultShaper::shape_table_info(std::string table_name, DbResultSet&& raw) {
    TableInfo info;
    info.table_name = std::move(table_name);
    info.columns.reserve(raw.rows.size());

    for (const auto& row : raw.rows) {
        if (row.size() < 6) continue;

        ColumnInfo col;
        col.cid = cell_int(row[0]);
        col.name = cell_text(row[1]);
        col.type = cell_text(row[2]);
        col.not_null = cell_int(row[3]) != 0;
        if (!is_null(row[4])) {
            col.default_value = cell_text(row[4]);
        }
        // pk is the 1-based position within the primary key, 0 if not a member
        col.primary_key = cell_int(row[5]) != 0;
        info.columns.push_back(std::move(col));
    }

    info.column_count = info.columns.size();
    return info;
}

// ============================================================================
// JSON envelopes
// ============================================================================

nlohmann::json ResultShaper::to_json(const ScalarValue& value) {
    return std::visit([](const auto& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Null>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(v)) return nullptr;
            return v;
        } else if constexpr (std::is_same_v<T, Blob>) {
            return base64::encode(v);
        } else {
            return v;
        }
    }, value);
}

nlohmann::json ResultShaper::to_json(const ResultSet& result) {
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& row : result.rows) {
        nlohmann::json cells = nlohmann::json::array();
        for (const auto& cell : row) {
            cells.push_back(to_json(cell));
        }
        rows.push_back(std::move(cells));
    }

    return {
        {"columns", result.columns},
        {"rows", std::move(rows)},
        {"count", result.count}
    };
}

nlohmann::json ResultShaper::to_json(const PagedResultSet& page) {
    auto j = to_json(page.result);
    j["offset"] = page.offset;
    j["limit"] = page.limit;
    return j;
}

nlohmann::json ResultShaper::to_json(const TableInfo& info) {
    nlohmann::json columns = nlohmann::json::array();
    for (const auto& col : info.columns) {
        nlohmann::json c = {
            {"cid", col.cid},
            {"name", col.name},
            {"type", col.type},
            {"notnull", col.not_null},
            {"pk", col.primary_key}
        };
        c["default_value"] = col.default_value.has_value()
            ? nlohmann::json(*col.default_value) : nlohmann::json(nullptr);
        columns.push_back(std::move(c));
    }

    return {
        {"table_name", info.table_name},
        {"columns", std::move(columns)},
        {"column_count", info.column_count}
    };
}

nlohmann::json ResultShaper::to_json(const std::vector<std::string>& tables) {
    return {
        {"tables", tables},
        {"count", tables.size()}
    };
}

} // namespace sqlgate
