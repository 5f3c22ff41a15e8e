#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"
#include <format>

namespace pgtenant {

GenericConnectionPool::GenericConnectionPool(
    std::string db_name,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory,
    SchemaDdl ddl)
    : db_name_(std::move(db_name)),
      config_(config),
      factory_(std::move(factory)),
      ddl_(std::move(ddl)),
      semaphore_(static_cast<std::ptrdiff_t>(config.max_connections)) {

    for (size_t i = 0; i < config_.min_connections; ++i) {
        auto conn = create_connection();
        if (!conn) {
            utils::log::warn(std::format("Pool '{}': could not open connection {} of {} at startup",
                db_name_, i + 1, config_.min_connections));
            continue;
        }
        track(conn.get());
        std::lock_guard lock(mutex_);
        idle_connections_.emplace_back(std::move(conn));
    }

    utils::log::info(std::format("Pool '{}' ready: {} connection(s) open (min={}, max={})",
        db_name_, total_connections_.load(), config_.min_connections, config_.max_connections));
}

GenericConnectionPool::~GenericConnectionPool() {
    drain();
}

IConnectionPool::Handle GenericConnectionPool::acquire(std::chrono::milliseconds timeout) {
    if (shutdown_.load(std::memory_order_acquire)) {
        return nullptr;
    }

    // Blocks while max_connections are checked out
    if (!semaphore_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    // drain() may have run while we waited
    if (shutdown_.load(std::memory_order_acquire)) {
        semaphore_.release();
        return nullptr;
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    auto conn = take_idle();
    if (!conn) {
        conn = create_connection();
        if (!conn) {
            semaphore_.release();
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            return nullptr;
        }
        track(conn.get());
    }

    return std::make_unique<PooledConnection>(std::move(conn), ddl_,
        [this](std::unique_ptr<IDbConnection> c) { return_connection(std::move(c)); });
}

std::unique_ptr<IDbConnection> GenericConnectionPool::take_idle() {
    const auto now = std::chrono::steady_clock::now();

    while (true) {
        std::unique_ptr<IDbConnection> conn;
        std::chrono::steady_clock::time_point birth{};
        std::chrono::steady_clock::time_point last_used{};
        {
            std::lock_guard lock(mutex_);
            if (idle_connections_.empty()) {
                return nullptr;
            }
            conn = std::move(idle_connections_.front());
            idle_connections_.pop_front();
            birth = created_at_[conn.get()];
            last_used = last_used_[conn.get()];
        }

        if (config_.max_lifetime.count() > 0 && now - birth > config_.max_lifetime) {
            connections_recycled_.fetch_add(1, std::memory_order_relaxed);
            discard_connection(std::move(conn));
            continue;
        }
        // Only connections idle past idle_timeout pay for a health check round trip
        if (now - last_used > config_.idle_timeout && !conn->is_healthy(config_.health_check_query)) {
            health_check_failures_.fetch_add(1, std::memory_order_relaxed);
            discard_connection(std::move(conn));
            continue;
        }
        return conn;
    }
}

void GenericConnectionPool::track(IDbConnection* conn) {
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard lock(mutex_);
    created_at_[conn] = now;
    last_used_[conn] = now;
}

Result<IConnectionPool::Handle> GenericConnectionPool::acquire_schema(
    std::string_view schema_name, bool check_exists, std::chrono::milliseconds timeout) {

    auto conn = acquire(timeout);
    if (!conn) {
        return Result<Handle>::error(ErrorCode::CONNECTION_ERROR,
            std::format("No connection available from pool '{}' within {}ms", db_name_, timeout.count()));
    }

    // On failure the handle goes back to the pool still on the public schema
    if (auto status = conn->context().set_schema(schema_name, check_exists); status.is_error()) {
        return Result<Handle>::propagate(status);
    }
    return Result<Handle>::ok(std::move(conn));
}

PoolStats GenericConnectionPool::get_stats() const {
    std::lock_guard lock(mutex_);

    PoolStats stats;
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.idle_connections = idle_connections_.size();
    stats.active_connections = stats.total_connections - stats.idle_connections;
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.total_releases = total_releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    stats.connections_recycled = connections_recycled_.load(std::memory_order_relaxed);
    stats.connections_discarded = connections_discarded_.load(std::memory_order_relaxed);
    return stats;
}

void GenericConnectionPool::drain() {
    shutdown_.store(true, std::memory_order_release);

    // Checked-out connections are closed as they come back
    std::lock_guard lock(mutex_);
    const size_t closed = idle_connections_.size();
    for (auto& conn : idle_connections_) {
        conn->close();
    }
    total_connections_.fetch_sub(closed, std::memory_order_relaxed);
    idle_connections_.clear();
    created_at_.clear();
    last_used_.clear();

    utils::log::debug(std::format("Pool '{}' drained, {} idle connection(s) closed", db_name_, closed));
}

std::unique_ptr<IDbConnection> GenericConnectionPool::create_connection() {
    auto conn = factory_->create(config_.connection_string);
    if (!conn) {
        return nullptr;
    }

    // Server default is "$user", public; pin new sessions to public
    const auto sql = ddl_.search_path(ddl_.validator().public_schema_name());
    if (sql.is_error()) {
        utils::log::error(sql.error_message());
        conn->close();
        return nullptr;
    }
    const auto rs = conn->execute(sql.value());
    if (!rs.success) {
        utils::log::error(std::format("Failed to initialise search path for database '{}': {}",
            db_name_, utils::trim(rs.error_message)));
        conn->close();
        return nullptr;
    }

    total_connections_.fetch_add(1, std::memory_order_relaxed);
    return conn;
}

void GenericConnectionPool::discard_connection(std::unique_ptr<IDbConnection> conn) {
    {
        std::lock_guard lock(mutex_);
        created_at_.erase(conn.get());
        last_used_.erase(conn.get());
    }
    conn->close();
    total_connections_.fetch_sub(1, std::memory_order_relaxed);
}

void GenericConnectionPool::return_connection(std::unique_ptr<IDbConnection> conn) {
    if (!conn) {
        return;
    }

    total_releases_.fetch_add(1, std::memory_order_relaxed);

    // Closed by PooledConnection after a failed reset, or dropped by the server
    const bool broken = !conn->is_connected();
    if (broken || shutdown_.load(std::memory_order_acquire)) {
        if (broken) {
            connections_discarded_.fetch_add(1, std::memory_order_relaxed);
        }
        discard_connection(std::move(conn));
        semaphore_.release();
        return;
    }

    {
        std::lock_guard lock(mutex_);
        last_used_[conn.get()] = std::chrono::steady_clock::now();
        idle_connections_.emplace_back(std::move(conn));
    }

    semaphore_.release();
}

} // namespace pgtenant
