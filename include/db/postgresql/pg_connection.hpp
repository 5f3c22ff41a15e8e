#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <libpq-fe.h>
#include <string>
#include <vector>

namespace pgtenant {

/**
 * @brief libpq session implementing IDbConnection
 *
 * Owns the PGconn*. Failed statements carry the server's SQLSTATE so callers
 * can tell a duplicate schema from a missing one. Server notices (for example
 * the objects a DROP SCHEMA ... CASCADE removed) go to the debug log.
 */
class PgConnection : public IDbConnection {
public:
    /**
     * @brief Take ownership of an established connection
     */
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    DbResultSet execute_params(const std::string& sql,
                               const std::vector<std::string>& params) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    bool in_transaction() const override;
    void close() override;

private:
    static void log_notice(void* arg, const char* message);

    DbResultSet consume_result(PGresult* res);
    DbResultSet rows_from(const PGresult* res) const;
    DbResultSet command_from(PGresult* res) const;
    DbResultSet error_from(const PGresult* res) const;

    PGconn* conn_;
};

/**
 * @brief Opens PgConnection sessions with PQconnectdbParams
 *
 * The connection string may be a keyword/value string or a postgresql:// URI.
 * application_name is applied unless the string sets its own.
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    explicit PgConnectionFactory(std::string application_name = "pgtenant");

    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;

private:
    std::string application_name_;
};

} // namespace pgtenant
