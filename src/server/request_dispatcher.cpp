#include "server/request_dispatcher.hpp"
#include "core/utils.hpp"
#include "executor/result_shaper.hpp"

#include <array>
#include <format>

namespace sqlgate {

// ============================================================================
// Anonymous namespace helpers
// ============================================================================

namespace {

constexpr std::array<std::string_view, 4> kOperations = {
    "list_tables", "read_rows", "execute_select", "get_table_info"
};

DispatchResponse error_response(ErrorKind kind, std::string message) {
    DispatchResponse res;
    res.status = RequestDispatcher::status_for(kind);
    res.body = {
        {"success", false},
        {"error", std::move(message)},
        {"error_kind", error_kind_to_string(kind)}
    };
    return res;
}

template<typename T>
DispatchResponse error_response(const Result<T>& result) {
    return error_response(result.error_kind(), result.error_message());
}

DispatchResponse success_response(nlohmann::json payload) {
    DispatchResponse res;
    res.status = 200;
    res.body = nlohmann::json::object();
    res.body["success"] = true;
    for (auto it = payload.begin(); it != payload.end(); ++it) {
        res.body[it.key()] = std::move(it.value());
    }
    return res;
}

Result<std::string> required_string(const nlohmann::json& request, const char* field) {
    const auto it = request.find(field);
    if (it == request.end() || it->is_null()) {
        return Result<std::string>::error(ErrorKind::VALIDATION_ERROR,
            std::format("Missing required field: {}", field));
    }
    if (!it->is_string()) {
        return Result<std::string>::error(ErrorKind::VALIDATION_ERROR,
            std::format("Field '{}' must be a string", field));
    }
    return Result<std::string>::ok(it->get<std::string>());
}

// Absent/null -> nullopt; non-integers are a validation error, not a default
Result<std::optional<int64_t>> optional_integer(const nlohmann::json& request, const char* field) {
    using R = Result<std::optional<int64_t>>;
    const auto it = request.find(field);
    if (it == request.end() || it->is_null()) {
        return R::ok(std::nullopt);
    }
    if (!it->is_number_integer()) {
        return R::error(ErrorKind::VALIDATION_ERROR,
            std::format("Field '{}' must be an integer", field));
    }
    return R::ok(it->get<int64_t>());
}

} // anonymous namespace

// ============================================================================
// DispatchResponse
// ============================================================================

std::string DispatchResponse::dump() const {
    return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// ============================================================================
// RequestDispatcher
// ============================================================================

RequestDispatcher::RequestDispatcher(std::shared_ptr<const ExecutionPipeline> pipeline,
                                     std::optional<ResolvedDbPath> startup_path,
                                     PathSettings paths)
    : pipeline_(std::move(pipeline)),
      startup_path_(std::move(startup_path)),
      paths_(std::move(paths)) {}

int RequestDispatcher::status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:                return 200;
        case ErrorKind::VALIDATION_ERROR:    return 400;
        case ErrorKind::BOUNDS_ERROR:        return 400;
        case ErrorKind::NOT_FOUND:           return 404;
        case ErrorKind::ENGINE_ERROR:        return 422;
        case ErrorKind::CONFIGURATION_ERROR: return 503;
    }
    return 500;
}

bool RequestDispatcher::is_known_operation(std::string_view operation) {
    for (const auto op : kOperations) {
        if (op == operation) return true;
    }
    return false;
}

DispatchResponse RequestDispatcher::dispatch(std::string_view operation,
                                             std::string_view body) const {
    if (!is_known_operation(operation)) {
        return error_response(ErrorKind::NOT_FOUND,
            std::format("Unknown operation: {}", operation));
    }

    // An empty body is an empty request object (list_tables takes no fields)
    nlohmann::json request = nlohmann::json::object();
    if (!utils::trim(std::string(body)).empty()) {
        request = nlohmann::json::parse(body, nullptr, false);
        if (request.is_discarded() || !request.is_object()) {
            return error_response(ErrorKind::VALIDATION_ERROR,
                "Invalid JSON: request body must be an object");
        }
    }

    if (operation == "list_tables")    return handle_list_tables(request);
    if (operation == "read_rows")      return handle_read_rows(request);
    if (operation == "execute_select") return handle_execute_select(request);
    return handle_get_table_info(request);
}

Result<ResolvedDbPath> RequestDispatcher::resolve_path(const nlohmann::json& request) const {
    const auto it = request.find("database");
    if (it != request.end() && !it->is_null()) {
        if (!it->is_string()) {
            return Result<ResolvedDbPath>::error(ErrorKind::VALIDATION_ERROR,
                "Field 'database' must be a string");
        }
        return PathResolver::resolve(it->get<std::string>(), paths_.configured_path, paths_.env_var);
    }
    if (startup_path_) {
        return Result<ResolvedDbPath>::ok(*startup_path_);
    }
    return PathResolver::resolve(std::nullopt, paths_.configured_path, paths_.env_var);
}

// ---- Handlers --------------------------------------------------------------

DispatchResponse RequestDispatcher::handle_list_tables(const nlohmann::json& request) const {
    const auto db = resolve_path(request);
    if (db.is_error()) return error_response(db);

    const auto tables = pipeline_->list_tables(db.value());
    if (tables.is_error()) return error_response(tables);
    return success_response(ResultShaper::to_json(tables.value()));
}

DispatchResponse RequestDispatcher::handle_read_rows(const nlohmann::json& request) const {
    const auto table = required_string(request, "table_name");
    if (table.is_error()) return error_response(table);
    const auto limit = optional_integer(request, "limit");
    if (limit.is_error()) return error_response(limit);
    const auto offset = optional_integer(request, "offset");
    if (offset.is_error()) return error_response(offset);

    const auto db = resolve_path(request);
    if (db.is_error()) return error_response(db);

    const auto page = pipeline_->read_rows(db.value(), table.value(), limit.value(), offset.value());
    if (page.is_error()) return error_response(page);
    return success_response(ResultShaper::to_json(page.value()));
}

DispatchResponse RequestDispatcher::handle_execute_select(const nlohmann::json& request) const {
    const auto query = required_string(request, "query");
    if (query.is_error()) return error_response(query);

    const auto db = resolve_path(request);
    if (db.is_error()) return error_response(db);

    const auto result = pipeline_->execute_select(db.value(), query.value());
    if (result.is_error()) return error_response(result);
    return success_response(ResultShaper::to_json(result.value()));
}

DispatchResponse RequestDispatcher::handle_get_table_info(const nlohmann::json& request) const {
    const auto table = required_string(request, "table_name");
    if (table.is_error()) return error_response(table);

    const auto db = resolve_path(request);
    if (db.is_error()) return error_response(db);

    const auto info = pipeline_->get_table_info(db.value(), table.value());
    if (info.is_error()) return error_response(info);
    return success_response(ResultShaper::to_json(info.value()));
}

} // namespace sqlgate
