#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace codeauditor {

/// Query parameter or result cell; nullopt is SQL NULL.
using DbValue = std::optional<std::string>;

/**
 * @brief Result set from a query execution
 *
 * Returned by IDbConnection::execute() / execute_params().
 * Owns the result data (copied from native result handles).
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;

    // For SELECT
    std::vector<std::string> column_names;
    std::vector<std::vector<DbValue>> rows;

    // For DML
    uint64_t affected_rows = 0;

    // SELECT vs DML/DDL
    bool has_rows = false;

    static DbResultSet failure(std::string message) {
        DbResultSet r;
        r.error_message = std::move(message);
        return r;
    }
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (PGconn*).
 * Implementations are not thread-safe; thread safety comes from the pool.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a SQL statement with no parameters (DDL, health checks)
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql) = 0;

    /**
     * @brief Execute a parameterized statement ($1, $2, ... placeholders)
     * @param params Text-format parameter values; nullopt binds NULL
     */
    [[nodiscard]] virtual DbResultSet execute_params(
        const std::string& sql, const std::vector<DbValue>& params) = 0;

    /**
     * @brief Check if the connection is healthy
     * @param health_check_query SQL to run (e.g., "SELECT 1")
     */
    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    /**
     * @brief Check if connection is in a valid state (connected)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace codeauditor
