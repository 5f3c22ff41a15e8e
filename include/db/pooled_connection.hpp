#pragma once

#include "db/idb_connection.hpp"
#include "schema/schema_context.hpp"
#include <functional>
#include <memory>

namespace pgtenant {

/**
 * @brief Checked-out connection together with its schema context
 *
 * Releasing the handle rolls back any transaction left open, then puts the
 * session back on the public schema before it returns to the pool. If either
 * step fails the session is closed, so the pool drops it rather than lend out
 * a connection still pointing at a tenant.
 */
class PooledConnection {
public:
    using ReturnFunc = std::function<void(std::unique_ptr<IDbConnection>)>;

    /**
     * @param conn Open session, not null
     * @param return_fn Receives the session on release
     */
    PooledConnection(std::unique_ptr<IDbConnection> conn, SchemaDdl ddl, ReturnFunc return_fn);

    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }

    SchemaContext& context() { return context_; }
    const SchemaContext& context() const { return context_; }

    bool is_valid() const { return conn_ != nullptr && conn_->is_connected(); }

private:
    void release();

    std::unique_ptr<IDbConnection> conn_;
    SchemaContext context_;
    ReturnFunc return_fn_;
};

} // namespace pgtenant
