#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <limits>
#include <stdexcept>

using namespace std::string_literals;

namespace sqlgate {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

std::optional<BoundsPolicy> ConfigLoader::parse_bounds_policy(const std::string& name) {
    const std::string lower = utils::to_lower(utils::trim(name));
    if (lower == "reject") return BoundsPolicy::REJECT;
    if (lower == "clamp") return BoundsPolicy::CLAMP;
    return std::nullopt;
}

// ---- Section extractors ----------------------------------------------------

ServerConfig ConfigLoader::extract_server(const toml::table& root,
                                          std::vector<std::string>& errors) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or(cfg.host);

    // Integers stay int64_t until range-checked; out-of-range values keep the default
    const auto port = s["port"].value_or(int64_t{cfg.port});
    if (utils::in_range<1, 65535>(port)) {
        cfg.port = static_cast<uint16_t>(port);
    } else {
        errors.push_back(std::format("server.port must be 1-65535, got {}", port));
    }

    const auto threads = s["threads"].value_or(static_cast<int64_t>(cfg.thread_pool_size));
    if (utils::in_range<1, kMaxThreads>(threads)) {
        cfg.thread_pool_size = static_cast<size_t>(threads);
    } else {
        errors.push_back(std::format("server.threads must be 1-{}, got {}", kMaxThreads, threads));
    }

    const auto max_sql = s["max_sql_length"].value_or(static_cast<int64_t>(cfg.max_sql_length));
    if (max_sql >= 0) {
        cfg.max_sql_length = static_cast<size_t>(max_sql);
    } else {
        errors.push_back(std::format("server.max_sql_length must be >= 0, got {}", max_sql));
    }
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

DatabaseConfig ConfigLoader::extract_database(const toml::table& root,
                                              std::vector<std::string>& errors) {
    DatabaseConfig cfg;
    const auto* database = root["database"].as_table();
    if (!database) return cfg;
    const auto& d = *database;

    // Empty after ${VAR} expansion means "not configured"
    if (const auto* path = d["path"].as_string()) {
        const std::string trimmed = utils::trim(path->get());
        if (!trimmed.empty()) cfg.path = trimmed;
    }
    cfg.env_var = d["env_var"].value_or(cfg.env_var);

    // sqlite3_busy_timeout takes an int
    const auto busy_ms = d["busy_timeout_ms"].value_or(static_cast<int64_t>(cfg.busy_timeout.count()));
    if (utils::in_range<0, std::numeric_limits<int>::max()>(busy_ms)) {
        cfg.busy_timeout = std::chrono::milliseconds(busy_ms);
    } else {
        errors.push_back(std::format("database.busy_timeout_ms must be 0-{}, got {}",
            std::numeric_limits<int>::max(), busy_ms));
    }
    return cfg;
}

PaginationConfig ConfigLoader::extract_pagination(const toml::table& root,
                                                  std::vector<std::string>& errors) {
    PaginationConfig cfg;
    const auto* pagination = root["pagination"].as_table();
    if (!pagination) return cfg;
    const auto& p = *pagination;

    cfg.default_limit = p["default_limit"].value_or(cfg.default_limit);
    cfg.max_limit = p["max_limit"].value_or(cfg.max_limit);

    if (const auto* policy = p["bounds_policy"].as_string()) {
        const auto parsed = parse_bounds_policy(policy->get());
        if (parsed) {
            cfg.bounds_policy = *parsed;
        } else {
            errors.push_back(std::format(
                "pagination.bounds_policy must be \"reject\" or \"clamp\", got \"{}\"",
                policy->get()));
        }
    }
    return cfg;
}

GateConfig ConfigLoader::extract_all_sections(const toml::table& tbl,
                                              std::vector<std::string>& errors) {
    GateConfig config;
    config.server = extract_server(tbl, errors);
    config.logging = extract_logging(tbl);
    config.database = extract_database(tbl, errors);
    config.pagination = extract_pagination(tbl, errors);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(GateConfig config,
                                                           std::vector<std::string> errors) {
    auto semantic = validate_config(config);
    errors.insert(errors.end(), semantic.begin(), semantic.end());
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        std::vector<std::string> errors;
        auto config = extract_all_sections(tbl, errors);
        return validate_and_return(std::move(config), std::move(errors));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        std::vector<std::string> errors;
        auto config = extract_all_sections(tbl, errors);
        return validate_and_return(std::move(config), std::move(errors));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const GateConfig& config) {
    std::vector<std::string> errors;

    if (config.server.port == 0) {
        errors.emplace_back("server.port must be 1-65535");
    }
    if (!utils::in_range<1, kMaxThreads>(config.server.thread_pool_size)) {
        errors.push_back(std::format("server.threads must be 1-{}, got {}",
            kMaxThreads, config.server.thread_pool_size));
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error; got \"{}\"",
            config.logging.level));
    }

    const auto busy_ms = config.database.busy_timeout.count();
    if (!utils::in_range<0, std::numeric_limits<int>::max()>(busy_ms)) {
        errors.push_back(std::format("database.busy_timeout_ms must be 0-{}, got {}",
            std::numeric_limits<int>::max(), busy_ms));
    }

    const auto& p = config.pagination;
    if (p.max_limit < 1) {
        errors.push_back(std::format("pagination.max_limit must be >= 1, got {}", p.max_limit));
    }
    if (p.default_limit < 1 || p.default_limit > p.max_limit) {
        errors.push_back(std::format(
            "pagination.default_limit must be between 1 and max_limit ({}), got {}",
            p.max_limit, p.default_limit));
    }

    return errors;
}

} // namespace sqlgate
