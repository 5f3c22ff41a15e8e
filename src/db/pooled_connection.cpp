#include "db/pooled_connection.hpp"
#include "core/utils.hpp"

#include <format>

namespace pgtenant {

PooledConnection::PooledConnection(std::unique_ptr<IDbConnection> conn, SchemaDdl ddl,
                                   ReturnFunc return_fn)
    : conn_(std::move(conn)),
      context_(*conn_, std::move(ddl)),
      return_fn_(std::move(return_fn)) {}

PooledConnection::~PooledConnection() {
    release();
}

// The context points at the IDbConnection object, which unique_ptr moves
// without relocating, so moving both members keeps them paired.
PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : conn_(std::move(other.conn_)),
      context_(std::move(other.context_)),
      return_fn_(std::move(other.return_fn_)) {}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        // Return current connection before taking new one
        release();
        conn_ = std::move(other.conn_);
        context_ = std::move(other.context_);
        return_fn_ = std::move(other.return_fn_);
    }
    return *this;
}

void PooledConnection::release() {
    if (!conn_) {
        return;
    }

    // A ROLLBACK may bring back a search path set before BEGIN, whatever the
    // context says, so the reset below must run unconditionally afterwards.
    bool rolled_back = false;
    if (conn_->in_transaction()) {
        const auto rs = conn_->execute("ROLLBACK");
        if (!rs.success || conn_->in_transaction()) {
            utils::log::warn(std::format("Discarding connection returned inside a transaction: {}",
                utils::trim(rs.error_message)));
            conn_->close();
        } else {
            utils::log::debug("Rolled back transaction left open on a returned connection");
            rolled_back = true;
        }
    }

    if (conn_->is_connected() && (rolled_back || !context_.is_public())) {
        const std::string previous = context_.current_schema();
        auto reset = context_.set_to_public();
        if (reset.is_error()) {
            utils::log::warn(std::format(
                "Discarding connection left in schema '{}': {}", previous, reset.error_message()));
            conn_->close();
        }
    }

    if (return_fn_) {
        return_fn_(std::move(conn_));
    }
    conn_.reset();
}

} // namespace pgtenant
