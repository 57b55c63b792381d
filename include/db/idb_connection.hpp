#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <string>
#include <vector>

namespace sqlgate {

/**
 * @brief Materialized output of one statement
 *
 * Returned by IDbConnection::execute(). Owns the result data (copied out of
 * the native statement before it is finalized).
 */
struct DbResultSet {
    bool success = false;
    ErrorKind error_kind = ErrorKind::NONE;  // ENGINE_ERROR or VALIDATION_ERROR on failure
    std::string error_message;

    std::vector<std::string> column_names;
    std::vector<Row> rows;
};

/**
 * @brief Abstract read-only database connection
 *
 * Wraps a single native handle. Not thread-safe; each request opens its own
 * connection and closes it before returning. Native handles are never
 * exposed.
 *
 * execute() refuses any statement the engine reports as writing, and any
 * text holding more than one statement (VALIDATION_ERROR in both cases).
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute one read-only statement
     * @param sql SQL text (exactly one statement)
     * @param params Values bound to ?1..?N, in order
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql,
                                              const std::vector<ScalarValue>& params = {}) = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Close the connection and release resources (idempotent)
     */
    virtual void close() = 0;
};

} // namespace sqlgate
