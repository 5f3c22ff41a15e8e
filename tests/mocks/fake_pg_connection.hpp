#pragma once

#include "db/idb_connection.hpp"
#include "schema/schema_context.hpp"
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace pgtenant::testing {

/**
 * @brief In-memory stand-in for a PostgreSQL session
 *
 * Understands just enough SQL to exercise schema switching: SET search_path,
 * CREATE SCHEMA, DROP SCHEMA ... CASCADE, the pg_namespace existence query and
 * transaction control. As on the server, ROLLBACK restores the search path
 * that was in effect at BEGIN. Everything else succeeds with no rows unless a
 * scripted response matches first.
 */
class FakePgConnection : public IDbConnection {
public:
    struct Statement {
        std::string sql;
        std::vector<std::string> params;
    };

    FakePgConnection() : schemas_{"public", "pg_catalog", "information_schema"} {}

    DbResultSet execute(const std::string& sql) override {
        return execute_params(sql, {});
    }

    DbResultSet execute_params(const std::string& sql, const std::vector<std::string>& params) override {
        statements_.push_back({sql, params});

        for (const auto& [needle, response] : scripted_) {
            if (sql.find(needle) != std::string::npos) {
                return response;
            }
        }

        if (sql.starts_with("SET search_path")) {
            search_path_ = first_identifier(sql);
            return ok();
        }
        if (sql.starts_with("CREATE SCHEMA")) {
            const auto name = first_identifier(sql);
            if (!schemas_.insert(name).second) {
                return failure("42P06", "ERROR:  schema \"" + name + "\" already exists\n");
            }
            return ok();
        }
        if (sql.starts_with("DROP SCHEMA")) {
            const auto name = first_identifier(sql);
            if (schemas_.erase(name) == 0) {
                return failure("3F000", "ERROR:  schema \"" + name + "\" does not exist\n");
            }
            return ok();
        }
        if (sql == SchemaContext::kSchemaExistsQuery) {
            DbResultSet rs = ok();
            rs.has_rows = true;
            rs.column_names = {"exists"};
            rs.rows = {{schemas_.contains(params.at(0)) ? "t" : "f"}};
            return rs;
        }
        if (sql == "BEGIN") {
            ++begins_;
            if (!in_transaction_) {
                in_transaction_ = true;
                path_at_begin_ = search_path_;
            }
            return ok();
        }
        if (sql == "COMMIT") { ++commits_; in_transaction_ = false; return ok(); }
        if (sql == "ROLLBACK") {
            ++rollbacks_;
            if (in_transaction_) {
                in_transaction_ = false;
                search_path_ = path_at_begin_;
            }
            return ok();
        }
        return ok();
    }

    bool is_healthy(const std::string&) override { return connected_; }
    bool is_connected() const override { return connected_; }
    bool in_transaction() const override { return connected_ && in_transaction_; }
    void close() override { connected_ = false; }

    // ---- Scripting --------------------------------------------------------

    /**
     * @brief Answer every statement containing `needle` with `response`
     */
    void respond(std::string needle, DbResultSet response) {
        scripted_.emplace_back(std::move(needle), std::move(response));
    }

    void fail_on(std::string needle, std::string sqlstate = "XX000",
                 std::string message = "ERROR:  scripted failure\n") {
        respond(std::move(needle), failure(std::move(sqlstate), std::move(message)));
    }

    void clear_script() { scripted_.clear(); }

    void add_schema(const std::string& name) { schemas_.insert(name); }

    // ---- Inspection -------------------------------------------------------

    [[nodiscard]] bool has_schema(const std::string& name) const { return schemas_.contains(name); }
    [[nodiscard]] const std::string& search_path() const { return search_path_; }
    [[nodiscard]] const std::vector<Statement>& statements() const { return statements_; }
    [[nodiscard]] int begins() const { return begins_; }
    [[nodiscard]] int commits() const { return commits_; }
    [[nodiscard]] int rollbacks() const { return rollbacks_; }

    [[nodiscard]] size_t count_containing(const std::string& needle) const {
        size_t n = 0;
        for (const auto& st : statements_) {
            if (st.sql.find(needle) != std::string::npos) ++n;
        }
        return n;
    }

    [[nodiscard]] const Statement* last_containing(const std::string& needle) const {
        for (auto it = statements_.rbegin(); it != statements_.rend(); ++it) {
            if (it->sql.find(needle) != std::string::npos) return &*it;
        }
        return nullptr;
    }

    static DbResultSet ok() {
        DbResultSet rs;
        rs.success = true;
        return rs;
    }

    static DbResultSet rows(std::vector<std::vector<std::string>> data) {
        DbResultSet rs = ok();
        rs.has_rows = true;
        rs.rows = std::move(data);
        return rs;
    }

    static DbResultSet failure(std::string sqlstate, std::string message) {
        DbResultSet rs;
        rs.success = false;
        rs.sqlstate = std::move(sqlstate);
        rs.error_message = std::move(message);
        return rs;
    }

private:
    // Text between the first pair of double quotes
    static std::string first_identifier(const std::string& sql) {
        const auto open = sql.find('"');
        if (open == std::string::npos) return {};
        const auto close = sql.find('"', open + 1);
        return sql.substr(open + 1, close - open - 1);
    }

    std::set<std::string> schemas_;
    std::string search_path_{"public"};
    std::string path_at_begin_;
    bool in_transaction_ = false;
    std::vector<std::pair<std::string, DbResultSet>> scripted_;
    std::vector<Statement> statements_;
    bool connected_ = true;
    int begins_ = 0;
    int commits_ = 0;
    int rollbacks_ = 0;
};

} // namespace pgtenant::testing
