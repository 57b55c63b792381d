#include "server/http_server.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

// cpp-httplib is header-only; suppress its internal deprecation warnings
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <array>
#include <format>
#include <stdexcept>

namespace sqlgate {

namespace {

constexpr std::array<const char*, 4> kRoutedOperations = {
    "list_tables", "read_rows", "execute_select", "get_table_info"
};

} // anonymous namespace

HttpServer::HttpServer(std::shared_ptr<const RequestDispatcher> dispatcher, ServerConfig config)
    : dispatcher_(std::move(dispatcher)),
      config_(std::move(config)),
      server_(std::make_unique<httplib::Server>()) {}

HttpServer::~HttpServer() = default;

void HttpServer::start() {
    auto& svr = *server_;

    const size_t pool_size = config_.thread_pool_size;
    svr.new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    register_routes(svr);

    utils::log::info(std::format("Starting sqlite-read-gate on {}:{} ({} threads)",
        config_.host, config_.port, config_.thread_pool_size));

    if (!svr.listen(config_.host, config_.port)) {
        throw std::runtime_error(std::format("Failed to bind {}:{}", config_.host, config_.port));
    }
}

void HttpServer::stop() {
    if (server_->is_running()) {
        server_->stop();
    }
    utils::log::info("Server stopped");
}

// ============================================================================
// Routes
// ============================================================================

void HttpServer::register_routes(httplib::Server& svr) {
    for (const char* op : kRoutedOperations) {
        const std::string operation = op;
        svr.Post(std::string(http::kApiPrefix) + operation,
            [this, operation](const httplib::Request& req, httplib::Response& res) {
                handle_operation(operation, req, res);
            });
    }

    svr.Get(http::kHealthPath, [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"status":"healthy","service":"sqlite-read-gate"})",
                        http::kJsonContentType);
    });
}

void HttpServer::handle_operation(const std::string& operation,
                                  const httplib::Request& req, httplib::Response& res) {
    const auto content_type = req.get_header_value("Content-Type");
    if (!req.body.empty() && !content_type.contains(http::kJsonContentType)) {
        res.status = httplib::StatusCode::BadRequest_400;
        res.set_content(
            R"({"success":false,"error":"Content-Type must be application/json","error_kind":"validation_error"})",
            http::kJsonContentType);
        return;
    }

    const auto response = dispatcher_->dispatch(operation, req.body);
    res.status = response.status;
    res.set_content(response.dump(), http::kJsonContentType);
}

} // namespace sqlgate
