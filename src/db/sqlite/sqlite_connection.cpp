#include "db/sqlite/sqlite_connection.hpp"
#include "core/utils.hpp"
#include "parser/sql_scanner.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <limits>
#include <type_traits>
#include <variant>

namespace sqlgate {

namespace {

// Finalizes on every exit path out of execute()
using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

} // anonymous namespace

// ============================================================================
// SqliteConnection
// ============================================================================

SqliteConnection::SqliteConnection(sqlite3* db)
    : db_(db) {}

SqliteConnection::~SqliteConnection() {
    close();
}

DbResultSet SqliteConnection::execute(const std::string& sql,
                                      const std::vector<ScalarValue>& params) {
    if (!db_) {
        return {false, ErrorKind::ENGINE_ERROR, "Connection is closed", {}, {}};
    }

    sqlite3_stmt* raw_stmt = nullptr;
    const char* tail = nullptr;
    const int prepare_rc = sqlite3_prepare_v2(db_, sql.c_str(),
        static_cast<int>(sql.size()), &raw_stmt, &tail);
    StatementPtr stmt(raw_stmt, &sqlite3_finalize);

    if (prepare_rc != SQLITE_OK) {
        return engine_error("prepare");
    }

    // Empty or comment-only text compiles to no statement at all
    if (!stmt) {
        return {false, ErrorKind::VALIDATION_ERROR, "Query contains no statement", {}, {}};
    }

    const size_t consumed = static_cast<size_t>(tail - sql.c_str());
    if (consumed < sql.size() &&
        !SqlScanner::is_blank(std::string_view(sql).substr(consumed))) {
        return {false, ErrorKind::VALIDATION_ERROR,
                "Multiple statements are not supported; submit exactly one SELECT", {}, {}};
    }

    if (!sqlite3_stmt_readonly(stmt.get())) {
        return {false, ErrorKind::VALIDATION_ERROR,
                "Statement would modify the database; only read-only queries are allowed",
                {}, {}};
    }

    if (bind_params(stmt.get(), params) != SQLITE_OK) {
        return engine_error("bind");
    }

    DbResultSet result;
    const int ncols = sqlite3_column_count(stmt.get());
    result.column_names.reserve(static_cast<size_t>(ncols));
    for (int i = 0; i < ncols; ++i) {
        const char* name = sqlite3_column_name(stmt.get(), i);
        result.column_names.emplace_back(name ? name : "");
    }

    for (;;) {
        const int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_ROW) {
            result.rows.push_back(read_row(stmt.get(), ncols));
            continue;
        }
        if (rc == SQLITE_DONE) {
            break;
        }
        return engine_error("step");
    }

    result.success = true;
    return result;
}

bool SqliteConnection::is_connected() const {
    return db_ != nullptr;
}

void SqliteConnection::close() {
    if (db_) {
        // All statements are finalized inside execute(), so close cannot be busy
        const int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK) {
            utils::log::error(std::format("sqlite3_close failed: {}", sqlite3_errstr(rc)));
        }
        db_ = nullptr;
    }
}

int SqliteConnection::bind_params(sqlite3_stmt* stmt, const std::vector<ScalarValue>& params) {
    for (size_t i = 0; i < params.size(); ++i) {
        const int idx = static_cast<int>(i) + 1;
        const int rc = std::visit([stmt, idx](const auto& v) -> int {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Null>) {
                return sqlite3_bind_null(stmt, idx);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return sqlite3_bind_int64(stmt, idx, static_cast<sqlite3_int64>(v));
            } else if constexpr (std::is_same_v<T, double>) {
                return sqlite3_bind_double(stmt, idx, v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return sqlite3_bind_text(stmt, idx, v.data(), static_cast<int>(v.size()),
                                         SQLITE_TRANSIENT);
            } else {
                return sqlite3_bind_blob(stmt, idx, v.data(), static_cast<int>(v.size()),
                                         SQLITE_TRANSIENT);
            }
        }, params[i]);
        if (rc != SQLITE_OK) return rc;
    }
    return SQLITE_OK;
}

Row SqliteConnection::read_row(sqlite3_stmt* stmt, int ncols) {
    Row row;
    row.reserve(static_cast<size_t>(ncols));

    for (int i = 0; i < ncols; ++i) {
        switch (sqlite3_column_type(stmt, i)) {
            case SQLITE_INTEGER:
                row.emplace_back(static_cast<int64_t>(sqlite3_column_int64(stmt, i)));
                break;
            case SQLITE_FLOAT:
                row.emplace_back(sqlite3_column_double(stmt, i));
                break;
            case SQLITE_TEXT: {
                const auto* text = sqlite3_column_text(stmt, i);
                const int bytes = sqlite3_column_bytes(stmt, i);
                row.emplace_back(text ? std::string(reinterpret_cast<const char*>(text),
                                                    static_cast<size_t>(bytes))
                                      : std::string());
                break;
            }
            case SQLITE_BLOB: {
                const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, i));
                const int bytes = sqlite3_column_bytes(stmt, i);
                row.emplace_back(data ? Blob(data, data + bytes) : Blob{});
                break;
            }
            default:
                row.emplace_back(Null{});
                break;
        }
    }

    return row;
}

DbResultSet SqliteConnection::engine_error(const std::string& context) const {
    const std::string message = sqlite3_errmsg(db_);
    utils::log::debug(std::format("sqlite {} failed: {}", context, message));
    return {false, ErrorKind::ENGINE_ERROR, message, {}, {}};
}

// ============================================================================
// SqliteConnectionFactory
// ============================================================================

SqliteConnectionFactory::SqliteConnectionFactory(std::chrono::milliseconds busy_timeout)
    : busy_timeout_(busy_timeout) {}

Result<std::unique_ptr<IDbConnection>> SqliteConnectionFactory::open(
    const ResolvedDbPath& path) {

    using OpenResult = Result<std::unique_ptr<IDbConnection>>;

    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(path.str().c_str(), &db, SQLITE_OPEN_READONLY, nullptr);

    if (rc != SQLITE_OK) {
        std::string message = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close(db);
        const auto kind = ((rc & 0xFF) == SQLITE_CANTOPEN) ? ErrorKind::NOT_FOUND
                                                          : ErrorKind::ENGINE_ERROR;
        utils::log::error(std::format("Failed to open {}: {}", path.str(), message));
        return OpenResult::error(kind,
            std::format("Cannot open database {}: {}", path.str(), message));
    }

    const auto busy_ms = std::clamp<int64_t>(busy_timeout_.count(), 0, std::numeric_limits<int>::max());
    sqlite3_busy_timeout(db, static_cast<int>(busy_ms));

    return OpenResult::ok(std::make_unique<SqliteConnection>(db));
}

} // namespace sqlgate
