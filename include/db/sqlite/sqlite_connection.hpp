#pragma once

#include "db/iconnection_factory.hpp"
#include "db/idb_connection.hpp"

#include <sqlite3.h>

#include <chrono>
#include <memory>
#include <string>

namespace sqlgate {

/**
 * @brief SQLite connection implementing IDbConnection
 *
 * Wraps sqlite3* opened with SQLITE_OPEN_READONLY. All sqlite3 calls are
 * encapsulated here. Every statement is prepared, checked, stepped to
 * completion and finalized inside execute().
 */
class SqliteConnection : public IDbConnection {
public:
    /**
     * @brief Construct from an open sqlite3* (takes ownership)
     */
    explicit SqliteConnection(sqlite3* db);

    ~SqliteConnection() override;

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    DbResultSet execute(const std::string& sql,
                        const std::vector<ScalarValue>& params = {}) override;
    bool is_connected() const override;
    void close() override;

private:
    /**
     * @brief Bind params to ?1..?N
     * @return SQLITE_OK or the first failing bind code
     */
    int bind_params(sqlite3_stmt* stmt, const std::vector<ScalarValue>& params);

    /**
     * @brief Copy the current row out of a stepped statement
     */
    static Row read_row(sqlite3_stmt* stmt, int ncols);

    DbResultSet engine_error(const std::string& context) const;

    sqlite3* db_;
};

/**
 * @brief SQLite connection factory
 *
 * Opens read-only (no SQLITE_OPEN_CREATE, no URI filenames) and applies the
 * configured busy timeout.
 */
class SqliteConnectionFactory : public IConnectionFactory {
public:
    explicit SqliteConnectionFactory(
        std::chrono::milliseconds busy_timeout = std::chrono::milliseconds{5000});

    Result<std::unique_ptr<IDbConnection>> open(const ResolvedDbPath& path) override;

private:
    std::chrono::milliseconds busy_timeout_;
};

} // namespace sqlgate
