#include "config/config_loader.hpp"
#include "config/path_resolver.hpp"
#include "core/utils.hpp"
#include "db/sqlite/sqlite_connection.hpp"
#include "executor/execution_pipeline.hpp"
#include "server/http_server.hpp"
#include "server/request_dispatcher.hpp"

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace sqlgate;

// Global instance for signal handling
std::shared_ptr<HttpServer> g_server;

namespace {

constexpr const char* kDefaultConfigFile = "config/gate.toml";

struct CommandLine {
    std::optional<std::string> config_file;
    std::optional<std::string> database;
    std::optional<std::string> env_var;
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    bool help = false;
};

void print_usage(const char* argv0) {
    std::cout << std::format(
        "Usage: {} [config.toml] [options]\n"
        "\n"
        "Read-only SQL gateway over a SQLite database file.\n"
        "\n"
        "Options:\n"
        "  -d, --database PATH   Database file (overrides [database].path)\n"
        "      --env-var NAME    Environment variable holding the database path\n"
        "                        (default: {})\n"
        "      --host HOST       Listen address (overrides [server].host)\n"
        "      --port PORT       Listen port (overrides [server].port)\n"
        "  -h, --help            Show this message\n",
        argv0, PathResolver::kDefaultEnvVar);
}

Result<CommandLine> parse_command_line(int argc, char* argv[]) {
    CommandLine cli;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto next_value = [&](const std::string& flag) -> Result<std::string> {
            if (i + 1 >= argc) {
                return Result<std::string>::error(ErrorKind::CONFIGURATION_ERROR,
                    std::format("Missing value for {}", flag));
            }
            return Result<std::string>::ok(argv[++i]);
        };

        if (arg == "-h" || arg == "--help") {
            cli.help = true;
        } else if (arg == "-d" || arg == "--database" || arg == "--env-var" || arg == "--host") {
            auto value = next_value(arg);
            if (value.is_error()) return Result<CommandLine>::error_from(value);
            if (arg == "--env-var") {
                cli.env_var = value.value();
            } else if (arg == "--host") {
                cli.host = value.value();
            } else {
                cli.database = value.value();
            }
        } else if (arg == "--port") {
            auto value = next_value(arg);
            if (value.is_error()) return Result<CommandLine>::error_from(value);
            const auto port = utils::try_parse_int<int>(value.value());
            if (!port || !utils::in_range<1, 65535>(*port)) {
                return Result<CommandLine>::error(ErrorKind::CONFIGURATION_ERROR,
                    std::format("--port must be 1-65535, got '{}'", value.value()));
            }
            cli.port = static_cast<uint16_t>(*port);
        } else if (!arg.empty() && arg[0] == '-') {
            return Result<CommandLine>::error(ErrorKind::CONFIGURATION_ERROR,
                std::format("Unknown option: {}", arg));
        } else if (!cli.config_file) {
            cli.config_file = arg;
        } else {
            return Result<CommandLine>::error(ErrorKind::CONFIGURATION_ERROR,
                std::format("Unexpected argument: {}", arg));
        }
    }
    return Result<CommandLine>::ok(std::move(cli));
}

} // anonymous namespace

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));
    if (g_server) {
        g_server->stop();
    }
}

int main(int argc, char* argv[]) {
    try {
        auto cli_result = parse_command_line(argc, argv);
        if (cli_result.is_error()) {
            std::cerr << cli_result.error_message() << "\n";
            print_usage(argv[0]);
            return 2;
        }
        const auto& cli = cli_result.value();
        if (cli.help) {
            print_usage(argv[0]);
            return 0;
        }

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // [1/4] Configuration: a missing file means defaults, a broken one is fatal
        GateConfig config;
        const std::string config_file = cli.config_file.value_or(kDefaultConfigFile);
        if (std::filesystem::exists(config_file)) {
            utils::log::info(std::format("[1/4] Loading configuration from {}", config_file));
            auto loaded = ConfigLoader::load_from_file(config_file);
            if (!loaded.success) {
                utils::log::error(loaded.error_message);
                return 1;
            }
            config = std::move(loaded.config);
        } else {
            const auto msg = std::format("[1/4] No config file at {}, using defaults", config_file);
            if (cli.config_file) {
                utils::log::warn(msg);
            } else {
                utils::log::info(msg);
            }
        }

        if (cli.database) config.database.path = *cli.database;
        if (cli.env_var) config.database.env_var = *cli.env_var;
        if (cli.host) config.server.host = *cli.host;
        if (cli.port) config.server.port = *cli.port;

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        // [2/4] Database path: resolved once, failure is fatal
        utils::log::info("[2/4] Resolving database path");
        auto db_path = PathResolver::resolve(std::nullopt, config.database.path,
                                             config.database.env_var);
        if (db_path.is_error()) {
            utils::log::error(std::format("{} ({})", db_path.error_message(),
                error_kind_to_string(db_path.error_kind())));
            return 1;
        }
        utils::log::info(std::format("Database: {} (from {})",
            db_path.value().str(), db_path.value().source()));

        // [3/4] Pipeline
        utils::log::info("[3/4] Initializing execution pipeline");
        auto factory = std::make_shared<SqliteConnectionFactory>(config.database.busy_timeout);

        ExecutionPipeline::Config pipeline_config;
        pipeline_config.pagination = config.pagination;
        pipeline_config.validator.max_query_length = config.server.max_sql_length;
        auto pipeline = std::make_shared<const ExecutionPipeline>(factory, pipeline_config);

        utils::log::info(std::format("Pagination: default_limit={}, max_limit={}, bounds_policy={}",
            config.pagination.default_limit, config.pagination.max_limit,
            bounds_policy_to_string(config.pagination.bounds_policy)));

        RequestDispatcher::PathSettings paths;
        paths.configured_path = config.database.path;
        paths.env_var = config.database.env_var;
        auto dispatcher = std::make_shared<const RequestDispatcher>(
            pipeline, std::move(db_path.value()), std::move(paths));

        // [4/4] Transport (blocking)
        utils::log::info("[4/4] Starting HTTP server");
        g_server = std::make_shared<HttpServer>(dispatcher, config.server);
        g_server->start();

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
