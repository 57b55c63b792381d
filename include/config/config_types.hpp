#pragma once

#include "core/page_request.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace sqlgate {

// ============================================================================
// Configuration Types
// ============================================================================

struct ServerConfig {
    std::string host;
    uint16_t port;
    size_t thread_pool_size;
    size_t max_sql_length;    // Max SQL query size in bytes (0 = unlimited)

    ServerConfig()
        : host("127.0.0.1"),
          port(8080),
          thread_pool_size(4),
          max_sql_length(102400) {}  // 100KB
};

struct LoggingConfig {
    std::string level = "info";
};

struct DatabaseConfig {
    std::optional<std::string> path;                  // Startup-configured database file
    std::string env_var = "SQLITE_DATABASE_PATH";     // Fallback environment variable
    std::chrono::milliseconds busy_timeout{5000};
};

struct GateConfig {
    ServerConfig server;
    LoggingConfig logging;
    DatabaseConfig database;
    PaginationConfig pagination;
};

} // namespace sqlgate
