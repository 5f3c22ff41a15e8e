#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace pgtenant {

/**
 * @brief Outcome of one statement, copied out of the native result
 *
 * Values are text; SQL NULL reads as an empty string.
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;
    std::string sqlstate;   // Five-character SQLSTATE on failure, empty otherwise

    bool has_rows = false;  // Row-returning statement
    std::vector<std::string> column_names;
    std::vector<std::vector<std::string>> rows;

    uint64_t affected_rows = 0;
};

/**
 * @brief One database session
 *
 * The session carries state (the search path), so a connection serves one
 * logical operation at a time. Not thread-safe.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Run SQL text as is; may contain several statements
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql) = 0;

    /**
     * @brief Run one statement with text parameters bound to $1, $2, ...
     */
    [[nodiscard]] virtual DbResultSet execute_params(
        const std::string& sql, const std::vector<std::string>& params) = 0;

    /**
     * @brief Round trip `health_check_query`; false when the session is unusable
     */
    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief True while a transaction block is open, failed ones included
     *
     * SET inside a block is undone by its ROLLBACK, so the search path is only
     * reliable once this returns false.
     */
    [[nodiscard]] virtual bool in_transaction() const = 0;

    virtual void close() = 0;
};

} // namespace pgtenant
