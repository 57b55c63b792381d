#pragma once

#include "core/error.hpp"

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace sqlgate {

/**
 * @brief A query that passed QueryValidator
 *
 * Holds the caller's ORIGINAL text (comments included). Once built, the
 * text is known to start with SELECT or WITH after comment stripping and
 * to contain no prohibited keyword outside comments and string literals.
 */
class ValidatedQuery {
public:
    [[nodiscard]] const std::string& sql() const { return sql_; }

private:
    friend class QueryValidator;

    explicit ValidatedQuery(std::string sql) : sql_(std::move(sql)) {}

    std::string sql_;
};

/**
 * @brief Lexical read-only gate for caller SQL
 *
 * Built on the two-pass SqlScanner:
 *   1. strip comments, blank single-quoted literal contents
 *   2. split into words, then
 *      - shape: the first word must be SELECT or WITH
 *      - denylist: no word may equal a prohibited keyword
 *
 * This is best-effort, not a SQL parser. It cannot catch a SELECT that
 * calls a side-effecting function, or write syntax outside the denylist.
 * The SQLite connection adds engine-level checks on top (read-only open,
 * sqlite3_stmt_readonly, single statement).
 */
class QueryValidator {
public:
    struct Config {
        size_t max_query_length = 102400;  // 0 = unlimited
    };

    static constexpr std::array<std::string_view, 11> kProhibitedKeywords = {
        "INSERT", "UPDATE", "DELETE", "DROP", "CREATE", "ALTER",
        "TRUNCATE", "REPLACE", "ATTACH", "DETACH", "PRAGMA"
    };

    QueryValidator() : QueryValidator(Config{}) {}
    explicit QueryValidator(Config config);

    /**
     * @brief Accept or reject raw caller SQL
     * @return ValidatedQuery, or VALIDATION_ERROR ("not a read query",
     *         "prohibited keyword 'X'", or length violation)
     */
    [[nodiscard]] Result<ValidatedQuery> validate(std::string_view raw) const;

    /**
     * @brief Case-insensitive membership test against kProhibitedKeywords
     * @return The canonical keyword, or empty view if word is allowed
     */
    [[nodiscard]] static std::string_view prohibited_keyword(std::string_view word);

private:
    Config config_;
};

} // namespace sqlgate
