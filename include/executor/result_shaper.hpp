#pragma once

#include "core/page_request.hpp"
#include "core/types.hpp"
#include "db/idb_connection.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace sqlgate {

/**
 * @brief Converts materialized engine output into the response envelope
 *
 * count is always rows.size() of what is returned; no COUNT(*) query is
 * ever issued, so it cannot disagree with the rows the caller receives.
 *
 * JSON encoding of cells:
 *   null -> null, integer -> number, float -> number (NaN/Inf -> null),
 *   text -> string, binary -> base64 string
 */
class ResultShaper {
public:
    // ── Typed shapes ────────────────────────────────────────────────────
    [[nodiscard]] static ResultSet shape(DbResultSet&& raw);

    /** @brief Shape plus echo of the effective limit/offset */
    [[nodiscard]] static PagedResultSet shape_page(DbResultSet&& raw, const PageRequest& page);

    /** @brief First column of every row, as text */
    [[nodiscard]] static std::vector<std::string> shape_name_list(DbResultSet&& raw);

    /**
     * @brief Shape pragma_table_info rows (cid, name, type, notnull, dflt_value, pk)
     */
    [[nodiscard]] static TableInfo shape_table_info(std::string table_name, DbResultSet&& raw);

    // ── JSON envelopes ──────────────────────────────────────────────────
    [[nodiscard]] static nlohmann::json to_json(const ScalarValue& value);
    [[nodiscard]] static nlohmann::json to_json(const ResultSet& result);
    [[nodiscard]] static nlohmann::json to_json(const PagedResultSet& page);
    [[nodiscard]] static nlohmann::json to_json(const TableInfo& info);
    [[nodiscard]] static nlohmann::json to_json(const std::vector<std::string>& tables);
};

} // namespace sqlgate
