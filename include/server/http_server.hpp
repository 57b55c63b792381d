#pragma once

#include "config/config_types.hpp"
#include "server/request_dispatcher.hpp"

#include <memory>
#include <string>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace sqlgate {

/**
 * @brief HTTP front end for the read-only gate
 *
 * Routes:
 *   POST /api/v1/{list_tables,read_rows,execute_select,get_table_info}
 *   GET  /health
 *
 * Every POST is forwarded to RequestDispatcher; the server itself holds no
 * database state.
 */
class HttpServer {
public:
    HttpServer(std::shared_ptr<const RequestDispatcher> dispatcher, ServerConfig config);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Bind and serve until stop() is called
     * @throws std::runtime_error if the listen socket cannot be bound
     */
    void start();
    void stop();

private:
    void register_routes(httplib::Server& svr);
    void handle_operation(const std::string& operation,
                          const httplib::Request& req, httplib::Response& res);

    std::shared_ptr<const RequestDispatcher> dispatcher_;
    ServerConfig config_;
    std::unique_ptr<httplib::Server> server_;
};

} // namespace sqlgate
