#pragma once

#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace codeauditor {

/**
 * @brief Abstract factory for creating database connections
 *
 * Lets the pool be exercised with in-process fakes in tests.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Create a new database connection
     * @param connection_string Backend-specific connection string
     * @return New connection, or nullptr on failure
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(
        const std::string& connection_string) = 0;
};

} // namespace codeauditor
