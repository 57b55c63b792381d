#pragma once

#include "config/path_resolver.hpp"
#include "core/error.hpp"
#include "db/idb_connection.hpp"

#include <memory>

namespace sqlgate {

/**
 * @brief Abstract factory for opening database connections
 *
 * Each engine provides its own factory wrapping the native open call.
 * Tests substitute a counting factory to observe handle lifetimes.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Open a read-only connection to a resolved database file
     * @return Connection, or NOT_FOUND / ENGINE_ERROR
     */
    [[nodiscard]] virtual Result<std::unique_ptr<IDbConnection>> open(
        const ResolvedDbPath& path) = 0;
};

} // namespace sqlgate
