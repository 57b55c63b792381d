#include "executor/execution_pipeline.hpp"
#include "core/utils.hpp"
#include "executor/result_shaper.hpp"

#include <format>

namespace sqlgate {

namespace {

// User tables only; LIKE needs the escape because _ is a wildcard
constexpr const char* kListTablesSql =
    "SELECT name FROM sqlite_master "
    "WHERE type = 'table' AND name NOT LIKE 'sqlite\\_%' ESCAPE '\\' "
    "ORDER BY rowid";

constexpr const char* kTableExistsSql =
    "SELECT name FROM sqlite_master "
    "WHERE type = 'table' AND name NOT LIKE 'sqlite\\_%' ESCAPE '\\' "
    "AND name = ?1 COLLATE NOCASE";

constexpr const char* kTableInfoSql =
    "SELECT cid, name, type, \"notnull\", dflt_value, pk FROM pragma_table_info(?1)";

template<typename T>
Result<T> rejected(const char* op, ErrorKind kind, std::string message) {
    if (kind == ErrorKind::ENGINE_ERROR) {
        utils::log::error(std::format("{}: {}", op, message));
    } else {
        utils::log::warn(std::format("{} rejected ({}): {}", op, error_kind_to_string(kind), message));
    }
    return Result<T>::error(kind, std::move(message));
}

template<typename T, typename U>
Result<T> rejected(const char* op, const Result<U>& cause) {
    return rejected<T>(op, cause.error_kind(), cause.error_message());
}

} // anonymous namespace

ExecutionPipeline::ExecutionPipeline(std::shared_ptr<IConnectionFactory> factory, Config config)
    : factory_(std::move(factory)),
      config_(std::move(config)),
      validator_(config_.validator) {}

ExecutionPipeline::ConnectionResult ExecutionPipeline::open(const ResolvedDbPath& db) const {
    if (!factory_) {
        return ConnectionResult::error(ErrorKind::CONFIGURATION_ERROR,
            "No connection factory configured");
    }
    return factory_->open(db);
}

Result<bool> ExecutionPipeline::require_table(IDbConnection& conn, const TableName& table) const {
    auto raw = conn.execute(kTableExistsSql, {ScalarValue{table.str()}});
    if (!raw.success) {
        return Result<bool>::error(raw.error_kind, std::move(raw.error_message));
    }
    if (raw.rows.empty()) {
        return Result<bool>::error(ErrorKind::NOT_FOUND,
            std::format("Table '{}' does not exist", table.str()));
    }
    return Result<bool>::ok(true);
}

// ============================================================================
// list_tables
// ============================================================================

Result<std::vector<std::string>> ExecutionPipeline::list_tables(const ResolvedDbPath& db) const {
    using R = Result<std::vector<std::string>>;
    const utils::Timer timer;

    auto conn = open(db);
    if (conn.is_error()) return rejected<std::vector<std::string>>("list_tables", conn);

    auto raw = conn.value()->execute(kListTablesSql);
    if (!raw.success) {
        return rejected<std::vector<std::string>>("list_tables", raw.error_kind,
                                                  std::move(raw.error_message));
    }

    auto tables = ResultShaper::shape_name_list(std::move(raw));
    utils::log::debug(std::format("list_tables: {} tables in {}us",
        tables.size(), timer.elapsed_us().count()));
    return R::ok(std::move(tables));
}

// ============================================================================
// read_rows
// ============================================================================

Result<PagedResultSet> ExecutionPipeline::read_rows(const ResolvedDbPath& db,
                                                    std::string_view table_name,
                                                    std::optional<int64_t> limit,
                                                    std::optional<int64_t> offset) const {
    const utils::Timer timer;

    auto table = sanitize(table_name);
    if (table.is_error()) return rejected<PagedResultSet>("read_rows", table);

    auto page = PageRequest::make(limit, offset, config_.pagination);
    if (page.is_error()) return rejected<PagedResultSet>("read_rows", page);

    auto conn = open(db);
    if (conn.is_error()) return rejected<PagedResultSet>("read_rows", conn);

    const auto exists = require_table(*conn.value(), table.value());
    if (exists.is_error()) return rejected<PagedResultSet>("read_rows", exists);

    // Identifier is allowlisted; limit/offset are bound, never spliced into the text
    const std::string sql = std::format("SELECT * FROM {} LIMIT ?1 OFFSET ?2",
                                        table.value().quoted());
    auto raw = conn.value()->execute(sql, {ScalarValue{page.value().limit()},
                                           ScalarValue{page.value().offset()}});
    if (!raw.success) {
        return rejected<PagedResultSet>("read_rows", raw.error_kind, std::move(raw.error_message));
    }

    auto paged = ResultShaper::shape_page(std::move(raw), page.value());
    utils::log::debug(std::format("read_rows {}: {} rows (limit={}, offset={}) in {}us",
        table.value().str(), paged.result.count, paged.limit, paged.offset,
        timer.elapsed_us().count()));
    return Result<PagedResultSet>::ok(std::move(paged));
}

// ============================================================================
// execute_select
// ============================================================================

Result<ResultSet> ExecutionPipeline::execute_select(const ResolvedDbPath& db,
                                                    std::string_view query) const {
    const utils::Timer timer;

    auto validated = validator_.validate(query);
    if (validated.is_error()) return rejected<ResultSet>("execute_select", validated);

    auto conn = open(db);
    if (conn.is_error()) return rejected<ResultSet>("execute_select", conn);

    auto raw = conn.value()->execute(validated.value().sql());
    if (!raw.success) {
        return rejected<ResultSet>("execute_select", raw.error_kind, std::move(raw.error_message));
    }

    auto result = ResultShaper::shape(std::move(raw));
    utils::log::debug(std::format("execute_select: {} rows in {}us",
        result.count, timer.elapsed_us().count()));
    return Result<ResultSet>::ok(std::move(result));
}

// ============================================================================
// get_table_info
// ============================================================================

Result<TableInfo> ExecutionPipeline::get_table_info(const ResolvedDbPath& db,
                                                    std::string_view table_name) const {
    const utils::Timer timer;

    auto table = sanitize(table_name);
    if (table.is_error()) return rejected<TableInfo>("get_table_info", table);

    auto conn = open(db);
    if (conn.is_error()) return rejected<TableInfo>("get_table_info", conn);

    const auto exists = require_table(*conn.value(), table.value());
    if (exists.is_error()) return rejected<TableInfo>("get_table_info", exists);

    auto raw = conn.value()->execute(kTableInfoSql, {ScalarValue{table.value().str()}});
    if (!raw.success) {
        return rejected<TableInfo>("get_table_info", raw.error_kind, std::move(raw.error_message));
    }

    auto info = ResultShaper::shape_table_info(table.value().str(), std::move(raw));
    utils::log::debug(std::format("get_table_info {}: {} columns in {}us",
        info.table_name, info.column_count, timer.elapsed_us().count()));
    return Result<TableInfo>::ok(std::move(info));
}

} // namespace sqlgate
