#pragma once

#include "config/path_resolver.hpp"
#include "core/error.hpp"
#include "executor/execution_pipeline.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace sqlgate {

/**
 * @brief Transport-independent response: HTTP status plus JSON envelope
 */
struct DispatchResponse {
    int status = 200;
    nlohmann::json body;

    /// Serialized body. Invalid UTF-8 in TEXT cells becomes U+FFFD.
    [[nodiscard]] std::string dump() const;
};

/**
 * @brief Maps an operation name and JSON request body onto the pipeline
 *
 * Operations and body fields:
 *   list_tables     {database?}
 *   read_rows       {table_name, limit?, offset?, database?}
 *   execute_select  {query, database?}
 *   get_table_info  {table_name, database?}
 *
 * "database" is the explicit per-call path; when absent the path resolved
 * at startup is used. If none was resolved at startup the configured path
 * and environment variable are consulted per request.
 *
 * Success:  {"success": true, ...shape}
 * Failure:  {"success": false, "error": msg, "error_kind": kind}
 */
class RequestDispatcher {
public:
    struct PathSettings {
        std::optional<std::string> configured_path;
        std::string env_var = PathResolver::kDefaultEnvVar;
    };

    RequestDispatcher(std::shared_ptr<const ExecutionPipeline> pipeline,
                      std::optional<ResolvedDbPath> startup_path)
        : RequestDispatcher(std::move(pipeline), std::move(startup_path), PathSettings{}) {}
    RequestDispatcher(std::shared_ptr<const ExecutionPipeline> pipeline,
                      std::optional<ResolvedDbPath> startup_path,
                      PathSettings paths);

    [[nodiscard]] DispatchResponse dispatch(std::string_view operation,
                                            std::string_view body) const;

    [[nodiscard]] static int status_for(ErrorKind kind);

    [[nodiscard]] static bool is_known_operation(std::string_view operation);

private:
    [[nodiscard]] Result<ResolvedDbPath> resolve_path(const nlohmann::json& request) const;

    DispatchResponse handle_list_tables(const nlohmann::json& request) const;
    DispatchResponse handle_read_rows(const nlohmann::json& request) const;
    DispatchResponse handle_execute_select(const nlohmann::json& request) const;
    DispatchResponse handle_get_table_info(const nlohmann::json& request) const;

    std::shared_ptr<const ExecutionPipeline> pipeline_;
    std::optional<ResolvedDbPath> startup_path_;
    PathSettings paths_;
};

} // namespace sqlgate
