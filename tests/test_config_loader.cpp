#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"
#include "mocks/temp_database.hpp"

#include <cstdlib>

using namespace sqlgate;

TEST_CASE("ConfigLoader: empty config uses defaults", "[config]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    const auto& cfg = result.config;
    CHECK(cfg.server.host == "127.0.0.1");
    CHECK(cfg.server.port == 8080);
    CHECK(cfg.server.thread_pool_size == 4);
    CHECK(cfg.server.max_sql_length == 102400);
    CHECK(cfg.logging.level == "info");
    CHECK_FALSE(cfg.database.path.has_value());
    CHECK(cfg.database.env_var == "SQLITE_DATABASE_PATH");
    CHECK(cfg.database.busy_timeout.count() == 5000);
    CHECK(cfg.pagination.default_limit == 100);
    CHECK(cfg.pagination.max_limit == 10000);
    CHECK(cfg.pagination.bounds_policy == BoundsPolicy::REJECT);
}

TEST_CASE("ConfigLoader: all sections parse", "[config]") {
    const std::string toml = R"(
[server]
host = "0.0.0.0"
port = 9090
threads = 8
max_sql_length = 4096

[logging]
level = "debug"

[database]
path = "/data/app.db"
env_var = "APP_DB"
busy_timeout_ms = 250

[pagination]
default_limit = 20
max_limit = 500
bounds_policy = "clamp"
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& cfg = result.config;
    CHECK(cfg.server.host == "0.0.0.0");
    CHECK(cfg.server.port == 9090);
    CHECK(cfg.server.thread_pool_size == 8);
    CHECK(cfg.server.max_sql_length == 4096);
    CHECK(cfg.logging.level == "debug");
    CHECK(cfg.database.path == "/data/app.db");
    CHECK(cfg.database.env_var == "APP_DB");
    CHECK(cfg.database.busy_timeout.count() == 250);
    CHECK(cfg.pagination.default_limit == 20);
    CHECK(cfg.pagination.max_limit == 500);
    CHECK(cfg.pagination.bounds_policy == BoundsPolicy::CLAMP);
}

TEST_CASE("ConfigLoader: env var expansion in database path", "[config][env]") {
    ::setenv("SQLGATE_TEST_DATA_DIR", "/srv/data", 1);
    auto result = ConfigLoader::load_from_string(R"(
[database]
path = "${SQLGATE_TEST_DATA_DIR}/app.db"
)");
    ::unsetenv("SQLGATE_TEST_DATA_DIR");

    REQUIRE(result.success);
    CHECK(result.config.database.path == "/srv/data/app.db");
}

TEST_CASE("ConfigLoader: path expanding to empty is unset", "[config][env]") {
    ::unsetenv("SQLGATE_TEST_UNSET_VAR");
    auto result = ConfigLoader::load_from_string(R"(
[database]
path = "${SQLGATE_TEST_UNSET_VAR}"
)");
    REQUIRE(result.success);
    CHECK_FALSE(result.config.database.path.has_value());
}

TEST_CASE("ConfigLoader: unclosed ${ is a parse error", "[config][env]") {
    auto result = ConfigLoader::load_from_string(R"(
[database]
path = "${OOPS"
)");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Unclosed") != std::string::npos);
}

TEST_CASE("ConfigLoader: malformed TOML is reported", "[config]") {
    auto result = ConfigLoader::load_from_string("[server\nport = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
}

TEST_CASE("ConfigLoader: load_from_file", "[config]") {
    sqlgate::testing::TmpDir tmp;

    SECTION("existing file") {
        const auto path = tmp.file("gate.toml", "[server]\nport = 7000\n");
        auto result = ConfigLoader::load_from_file(path);
        REQUIRE(result.success);
        CHECK(result.config.server.port == 7000);
    }
    SECTION("missing file") {
        auto result = ConfigLoader::load_from_file((tmp.path / "absent.toml").string());
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("Failed to load config") != std::string::npos);
    }
}

TEST_CASE("ConfigValidation: invalid values are all reported", "[config][validation]") {
    const std::string toml = R"(
[server]
port = 70000
threads = 0

[logging]
level = "verbose"

[pagination]
default_limit = 0
max_limit = 0
bounds_policy = "wrap"
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE_FALSE(result.success);
    const auto& msg = result.error_message;
    CHECK(msg.find("Config validation failed") != std::string::npos);
    CHECK(msg.find("server.port") != std::string::npos);
    CHECK(msg.find("server.threads") != std::string::npos);
    CHECK(msg.find("logging.level") != std::string::npos);
    CHECK(msg.find("pagination.max_limit") != std::string::npos);
    CHECK(msg.find("pagination.default_limit") != std::string::npos);
    CHECK(msg.find("pagination.bounds_policy") != std::string::npos);
}

TEST_CASE("ConfigValidation: default_limit above max_limit fails", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(R"(
[pagination]
default_limit = 200
max_limit = 100
)");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("default_limit") != std::string::npos);
}

TEST_CASE("ConfigValidation: negative threads fails", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(R"(
[server]
threads = -1
)");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("server.threads must be 1-1024, got -1") != std::string::npos);
}

TEST_CASE("ConfigValidation: negative max_sql_length fails", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(R"(
[server]
max_sql_length = -1
)");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("server.max_sql_length must be >= 0, got -1") != std::string::npos);
}

TEST_CASE("ConfigValidation: max_sql_length zero means unlimited", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(R"(
[server]
max_sql_length = 0
)");
    REQUIRE(result.success);
    CHECK(result.config.server.max_sql_length == 0);
}

TEST_CASE("ConfigValidation: busy_timeout_ms outside int range fails", "[config][validation]") {
    SECTION("above INT_MAX") {
        auto result = ConfigLoader::load_from_string(R"(
[database]
busy_timeout_ms = 3000000000
)");
        REQUIRE_FALSE(result.success);
        CHECK(result.error_message.find("database.busy_timeout_ms") != std::string::npos);
        CHECK(result.error_message.find("3000000000") != std::string::npos);
    }
    SECTION("negative") {
        auto result = ConfigLoader::load_from_string(R"(
[database]
busy_timeout_ms = -5
)");
        REQUIRE_FALSE(result.success);
        CHECK(result.error_message.find("database.busy_timeout_ms") != std::string::npos);
    }
    SECTION("INT_MAX is accepted") {
        auto result = ConfigLoader::load_from_string(R"(
[database]
busy_timeout_ms = 2147483647
)");
        REQUIRE(result.success);
        CHECK(result.config.database.busy_timeout.count() == 2147483647);
    }
}

TEST_CASE("ConfigValidation: directly built config is range-checked", "[config][validation]") {
    GateConfig cfg;
    cfg.server.thread_pool_size = 0;
    cfg.database.busy_timeout = std::chrono::milliseconds{int64_t{3000000000}};
    const auto errors = ConfigLoader::validate_config(cfg);
    CHECK(errors.size() == 2);
}

TEST_CASE("ConfigValidation: port 0 fails", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[server]\nport = 0\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("server.port") != std::string::npos);
}

TEST_CASE("ConfigLoader: parse_bounds_policy", "[config]") {
    CHECK(ConfigLoader::parse_bounds_policy("reject") == BoundsPolicy::REJECT);
    CHECK(ConfigLoader::parse_bounds_policy(" CLAMP ") == BoundsPolicy::CLAMP);
    CHECK_FALSE(ConfigLoader::parse_bounds_policy("saturate").has_value());
}
