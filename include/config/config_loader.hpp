#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sqlgate {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads sqlite-read-gate TOML config
 *
 * String values may reference environment variables as ${VAR}; unset
 * variables expand to the empty string. Every section is optional and falls
 * back to the defaults in config_types.hpp.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        GateConfig config;

        static LoadResult ok(GateConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to gate.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Collect every semantic problem in a config
     * @return One message per problem; empty when the config is usable
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const GateConfig& config);

    static std::optional<BoundsPolicy> parse_bounds_policy(const std::string& name);

    static constexpr int64_t kMaxThreads = 1024;

private:
    static GateConfig extract_all_sections(const toml::table& tbl, std::vector<std::string>& errors);
    static ServerConfig extract_server(const toml::table& root, std::vector<std::string>& errors);
    static LoggingConfig extract_logging(const toml::table& root);
    static DatabaseConfig extract_database(const toml::table& root, std::vector<std::string>& errors);
    static PaginationConfig extract_pagination(const toml::table& root, std::vector<std::string>& errors);
    static LoadResult validate_and_return(GateConfig config, std::vector<std::string> errors);
};

} // namespace sqlgate
