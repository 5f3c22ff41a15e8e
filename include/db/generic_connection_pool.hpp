#pragma once

#include "db/iconnection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include "db/pooled_connection.hpp"
#include "schema/schema_ddl.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <unordered_map>

namespace pgtenant {

/**
 * @brief Bounded pool of schema-aware connections
 *
 * A counting_semaphore caps checkouts at max_connections; connections are
 * opened lazily past min_connections. Each new session gets the public search
 * path before it is first handed out, and PooledConnection puts it back there
 * on return. A connection that comes back closed is dropped, not re-queued.
 */
class GenericConnectionPool : public IConnectionPool {
public:
    /**
     * @param db_name Label used in log lines
     * @param ddl Statement builder shared by every connection's context;
     *            its validator names the public schema
     */
    GenericConnectionPool(
        std::string db_name,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory,
        SchemaDdl ddl = SchemaDdl{});

    ~GenericConnectionPool() override;

    Handle acquire(std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) override;

    Result<Handle> acquire_schema(
        std::string_view schema_name, bool check_exists = false,
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) override;

    PoolStats get_stats() const override;

    void drain() override;

    const std::string& name() const override { return db_name_; }

private:
    /**
     * @brief Open a session and pin it to the public schema
     * @return nullptr when either step fails
     */
    std::unique_ptr<IDbConnection> create_connection();

    /**
     * @brief Pop the first reusable idle connection, dropping expired and unhealthy ones
     */
    std::unique_ptr<IDbConnection> take_idle();

    void track(IDbConnection* conn);
    void discard_connection(std::unique_ptr<IDbConnection> conn);

    /**
     * @brief Called by PooledConnection after its context was reset
     */
    void return_connection(std::unique_ptr<IDbConnection> conn);

    std::string db_name_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;
    SchemaDdl ddl_;

    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    mutable std::mutex mutex_;
    std::counting_semaphore<> semaphore_;

    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> connections_recycled_{0};
    std::atomic<size_t> connections_discarded_{0};

    std::atomic<bool> shutdown_{false};

    // Guarded by mutex_
    std::unordered_map<IDbConnection*, std::chrono::steady_clock::time_point> created_at_;
    std::unordered_map<IDbConnection*, std::chrono::steady_clock::time_point> last_used_;
};

} // namespace pgtenant
