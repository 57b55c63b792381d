#pragma once

#include "config/path_resolver.hpp"
#include "core/error.hpp"
#include "core/identifier.hpp"
#include "core/page_request.hpp"
#include "core/types.hpp"
#include "db/iconnection_factory.hpp"
#include "security/query_validator.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlgate {

/**
 * @brief Request pipeline for the four read-only operations
 *
 * Flow for each call:
 *   (sanitize identifier | validate query | build page) -> open connection
 *   -> catalog check -> execute -> shape -> close connection
 *
 * Input checks run before anything is opened. The connection is a scoped
 * unique_ptr owned by the call, so it is closed on every exit path,
 * including engine errors. The pipeline holds no per-request state and no
 * database path: the resolved path is passed into every call.
 *
 * Thread-safe: concurrent calls share only immutable config and the
 * (stateless) factory.
 */
class ExecutionPipeline {
public:
    struct Config {
        PaginationConfig pagination;
        QueryValidator::Config validator;
    };

    explicit ExecutionPipeline(std::shared_ptr<IConnectionFactory> factory)
        : ExecutionPipeline(std::move(factory), Config{}) {}
    ExecutionPipeline(std::shared_ptr<IConnectionFactory> factory, Config config);

    /**
     * @brief User table names in catalog (rowid) order
     *
     * Order is creation order in practice but not alphabetical, and may
     * change after VACUUM. Engine-internal sqlite_* tables are excluded.
     */
    [[nodiscard]] Result<std::vector<std::string>> list_tables(const ResolvedDbPath& db) const;

    /**
     * @brief SELECT * FROM <table> LIMIT ? OFFSET ? with bound integers
     * @return Rows plus the effective limit/offset; VALIDATION_ERROR,
     *         BOUNDS_ERROR or NOT_FOUND ("table not found") on rejection
     */
    [[nodiscard]] Result<PagedResultSet> read_rows(const ResolvedDbPath& db,
                                                   std::string_view table_name,
                                                   std::optional<int64_t> limit = std::nullopt,
                                                   std::optional<int64_t> offset = std::nullopt) const;

    /**
     * @brief Validate and run caller SQL as-is (no implicit LIMIT)
     *
     * Without a LIMIT clause the full result is materialized; row count is
     * bounded only by memory.
     */
    [[nodiscard]] Result<ResultSet> execute_select(const ResolvedDbPath& db,
                                                   std::string_view query) const;

    /**
     * @brief Column metadata in catalog column order
     */
    [[nodiscard]] Result<TableInfo> get_table_info(const ResolvedDbPath& db,
                                                   std::string_view table_name) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    using ConnectionResult = Result<std::unique_ptr<IDbConnection>>;

    [[nodiscard]] ConnectionResult open(const ResolvedDbPath& db) const;

    /**
     * @brief Explicit catalog lookup so a missing table never surfaces the
     *        engine's own "no such table" text
     * @return ok(true) when present, otherwise NOT_FOUND or ENGINE_ERROR
     */
    [[nodiscard]] Result<bool> require_table(IDbConnection& conn, const TableName& table) const;

    std::shared_ptr<IConnectionFactory> factory_;
    Config config_;
    QueryValidator validator_;
};

} // namespace sqlgate
