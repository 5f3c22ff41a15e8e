#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"
#include <format>

namespace pgtenant {

namespace {

DbResultSet null_connection() {
    DbResultSet result;
    result.error_message = "Connection is closed";
    result.sqlstate = "08003";  // connection_does_not_exist
    return result;
}

} // anonymous namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {
    if (conn_) {
        PQsetNoticeProcessor(conn_, &PgConnection::log_notice, nullptr);
    }
}

PgConnection::~PgConnection() {
    close();
}

void PgConnection::log_notice(void* /*arg*/, const char* message) {
    utils::log::debug(std::format("server: {}", utils::trim(message ? message : "")));
}

DbResultSet PgConnection::execute(const std::string& sql) {
    if (!conn_) {
        return null_connection();
    }
    // Simple query protocol: migration files may hold several statements
    return consume_result(PQexec(conn_, sql.c_str()));
}

DbResultSet PgConnection::execute_params(const std::string& sql,
                                         const std::vector<std::string>& params) {
    if (!conn_) {
        return null_connection();
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p.c_str());
    }

    // Text-format parameters, server infers types from the statement
    return consume_result(PQexecParams(conn_, sql.c_str(),
        static_cast<int>(values.size()), nullptr, values.data(), nullptr, nullptr, 0));
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    if (!is_connected()) {
        return false;
    }
    // A session stuck in a failed transaction rejects everything until ROLLBACK
    if (PQtransactionStatus(conn_) == PQTRANS_INERROR) {
        return false;
    }
    return execute(health_check_query).success;
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::in_transaction() const {
    if (!is_connected()) {
        return false;
    }
    const auto status = PQtransactionStatus(conn_);
    return status == PQTRANS_INTRANS || status == PQTRANS_INERROR || status == PQTRANS_ACTIVE;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::consume_result(PGresult* res) {
    if (!res) {
        DbResultSet result;
        result.error_message = PQerrorMessage(conn_);
        if (PQstatus(conn_) != CONNECTION_OK) {
            result.sqlstate = "08006";  // connection_failure
        }
        return result;
    }

    DbResultSet result;
    switch (PQresultStatus(res)) {
        case PGRES_TUPLES_OK:  result = rows_from(res); break;
        case PGRES_COMMAND_OK: result = command_from(res); break;
        default:               result = error_from(res); break;
    }
    PQclear(res);
    return result;
}

DbResultSet PgConnection::rows_from(const PGresult* res) const {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const int ncols = PQnfields(res);
    result.column_names.reserve(static_cast<size_t>(ncols));
    for (int i = 0; i < ncols; ++i) {
        result.column_names.emplace_back(PQfname(res, i));
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(static_cast<size_t>(nrows));
    for (int i = 0; i < nrows; ++i) {
        std::vector<std::string> row;
        row.reserve(static_cast<size_t>(ncols));
        for (int j = 0; j < ncols; ++j) {
            // SQL NULL comes back as an empty string
            row.emplace_back(PQgetisnull(res, i, j) ? "" : PQgetvalue(res, i, j));
        }
        result.rows.push_back(std::move(row));
    }
    return result;
}

DbResultSet PgConnection::command_from(PGresult* res) const {
    DbResultSet result;
    result.success = true;

    // Empty for DDL and SET
    const auto affected = utils::try_parse_int<uint64_t>(PQcmdTuples(res));
    if (affected) {
        result.affected_rows = *affected;
    }
    return result;
}

DbResultSet PgConnection::error_from(const PGresult* res) const {
    DbResultSet result;
    const char* message = PQresultErrorMessage(res);
    result.error_message = (message && *message) ? message : PQerrorMessage(conn_);
    if (const char* state = PQresultErrorField(res, PG_DIAG_SQLSTATE)) {
        result.sqlstate = state;
    }
    return result;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

PgConnectionFactory::PgConnectionFactory(std::string application_name)
    : application_name_(std::move(application_name)) {}

std::unique_ptr<IDbConnection> PgConnectionFactory::create(const std::string& connection_string) {
    // expand_dbname: "dbname" is parsed as a full connection string, later keys
    // only fill in what it leaves unset
    const char* keywords[] = {"dbname", "fallback_application_name", nullptr};
    const char* values[] = {connection_string.c_str(), application_name_.c_str(), nullptr};

    PGconn* conn = PQconnectdbParams(keywords, values, 1);
    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        return nullptr;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        utils::log::error(std::format("Failed to connect: {}", utils::trim(PQerrorMessage(conn))));
        PQfinish(conn);
        return nullptr;
    }

    return std::make_unique<PgConnection>(conn);
}

} // namespace pgtenant
