#pragma once

#include "core/error.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace sqlgate {

/**
 * @brief A database path checked to exist, be a regular file, and be readable
 *
 * Produced only by PathResolver; immutable afterwards. The check is a
 * snapshot: the file can still vanish before it is opened, in which case the
 * open fails with NOT_FOUND.
 */
class ResolvedDbPath {
public:
    [[nodiscard]] const std::string& str() const { return path_; }

    /** @brief Which tier supplied the path ("explicit", "configured", env var name) */
    [[nodiscard]] const std::string& source() const { return source_; }

private:
    friend class PathResolver;

    ResolvedDbPath(std::string path, std::string source)
        : path_(std::move(path)), source_(std::move(source)) {}

    std::string path_;
    std::string source_;
};

/**
 * @brief Layered database path resolution
 *
 * Precedence (highest first):
 *   1. explicit per-call path
 *   2. path configured at startup ([database].path or --database)
 *   3. value of the named environment variable
 *   4. CONFIGURATION_ERROR (no implicit default location)
 *
 * The first PRESENT candidate (non-empty after trimming) is validated. If it
 * is invalid the resolver rejects immediately instead of trying the next
 * tier, so a typo'd setting is never masked by a lower one.
 */
class PathResolver {
public:
    static constexpr const char* kDefaultEnvVar = "SQLITE_DATABASE_PATH";

    [[nodiscard]] static Result<ResolvedDbPath> resolve(
        const std::optional<std::string>& explicit_path,
        const std::optional<std::string>& configured_path,
        const std::string& env_var_name);

    /**
     * @brief Validate a single candidate
     * @return NOT_FOUND if missing, CONFIGURATION_ERROR if not a regular
     *         file or not readable
     */
    [[nodiscard]] static Result<ResolvedDbPath> validate(const std::string& path,
                                                         std::string_view source);
};

} // namespace sqlgate
