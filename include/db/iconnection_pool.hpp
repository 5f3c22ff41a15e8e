#pragma once

#include "core/error.hpp"
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace pgtenant {

class PooledConnection;

/**
 * @brief Pool sizing and connection upkeep
 */
struct PoolConfig {
    std::string connection_string;
    size_t min_connections = 1;                     // Opened eagerly at construction
    size_t max_connections = 4;
    std::chrono::milliseconds connection_timeout{5000};
    std::chrono::milliseconds idle_timeout{300000}; // Idle longer than this: health check before reuse
    std::string health_check_query{"SELECT 1"};
    std::chrono::seconds max_lifetime{3600};        // 0 = disabled
};

struct PoolStats {
    size_t total_connections = 0;
    size_t idle_connections = 0;
    size_t active_connections = 0;
    size_t total_acquires = 0;
    size_t total_releases = 0;
    size_t failed_acquires = 0;
    size_t health_check_failures = 0;
    size_t connections_recycled = 0;    // replaced after max_lifetime
    size_t connections_discarded = 0;   // dropped on return (broken or reset failed)
};

/**
 * @brief Source of connections bound to a schema context
 *
 * Every handed-out connection carries its own context, starting on the public
 * schema, so a tenant switch on one checkout never leaks into another.
 */
class IConnectionPool {
public:
    using Handle = std::unique_ptr<PooledConnection>;

    virtual ~IConnectionPool() = default;

    /**
     * @brief Borrow a connection on the public schema
     * @return nullptr when the pool is exhausted for `timeout` or draining
     */
    [[nodiscard]] virtual Handle acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) = 0;

    /**
     * @brief Borrow a connection already switched to `schema_name`
     *
     * CONNECTION_ERROR when no connection could be borrowed; errors of the
     * switch itself (invalid or missing schema) are passed through and the
     * connection goes straight back to the pool.
     */
    [[nodiscard]] virtual Result<Handle> acquire_schema(
        std::string_view schema_name, bool check_exists = false,
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) = 0;

    [[nodiscard]] virtual PoolStats get_stats() const = 0;

    /**
     * @brief Close idle connections and refuse further acquires
     */
    virtual void drain() = 0;

    [[nodiscard]] virtual const std::string& name() const = 0;
};

} // namespace pgtenant
