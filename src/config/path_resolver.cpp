#include "config/path_resolver.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <system_error>
#include <unistd.h>

namespace sqlgate {

namespace {

std::optional<std::string> present(const std::optional<std::string>& candidate) {
    if (!candidate.has_value()) return std::nullopt;
    std::string trimmed = utils::trim(*candidate);
    if (trimmed.empty()) return std::nullopt;
    return trimmed;
}

} // anonymous namespace

Result<ResolvedDbPath> PathResolver::validate(const std::string& path,
                                              std::string_view source) {
    namespace fs = std::filesystem;
    std::error_code ec;

    const auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return Result<ResolvedDbPath>::error(ErrorKind::NOT_FOUND,
            std::format("Database file does not exist: {} (from {})", path, source));
    }

    if (!fs::is_regular_file(status)) {
        return Result<ResolvedDbPath>::error(ErrorKind::CONFIGURATION_ERROR,
            std::format("Database path is not a regular file: {} (from {})", path, source));
    }

    if (::access(path.c_str(), R_OK) != 0) {
        return Result<ResolvedDbPath>::error(ErrorKind::CONFIGURATION_ERROR,
            std::format("Database file is not readable: {} (from {})", path, source));
    }

    return Result<ResolvedDbPath>::ok(ResolvedDbPath(path, std::string(source)));
}

Result<ResolvedDbPath> PathResolver::resolve(
    const std::optional<std::string>& explicit_path,
    const std::optional<std::string>& configured_path,
    const std::string& env_var_name) {

    if (const auto path = present(explicit_path)) {
        return validate(*path, "explicit");
    }

    if (const auto path = present(configured_path)) {
        return validate(*path, "configured");
    }

    if (!env_var_name.empty()) {
        const char* env_val = std::getenv(env_var_name.c_str());
        if (env_val) {
            if (const auto path = present(std::string(env_val))) {
                return validate(*path, env_var_name);
            }
        }
    }

    if (env_var_name.empty()) {
        return Result<ResolvedDbPath>::error(ErrorKind::CONFIGURATION_ERROR,
            "No database path configured. Provide it via --database or "
            "[database].path in the config file.");
    }
    return Result<ResolvedDbPath>::error(ErrorKind::CONFIGURATION_ERROR,
        std::format("No database path configured. Provide it via --database, "
                    "[database].path in the config file, or the {} environment variable.",
                    env_var_name));
}

} // namespace sqlgate
