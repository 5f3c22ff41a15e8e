#pragma once

#include "core/error.hpp"
#include "db/idb_connection.hpp"
#include "schema/schema_ddl.hpp"
#include <string>
#include <string_view>

namespace pgtenant {

struct Tenant;

/**
 * @brief Tracks and switches the active schema of one database connection
 *
 * The search path is session state: once set_schema() succeeds, every
 * statement on the connection resolves unqualified names against that
 * schema (then public) until the next switch. Nothing is restored
 * automatically; callers reset to public when their operation ends.
 *
 * A failed switch leaves current_schema() untouched.
 *
 * Not thread-safe. One context per checked-out connection.
 */
class SchemaContext {
public:
    static constexpr const char* kSchemaExistsQuery =
        "SELECT EXISTS(SELECT 1 FROM pg_catalog.pg_namespace WHERE nspname = $1)";

    /**
     * @param conn Connection whose search path this context drives (not owned)
     * @param ddl Statement builder carrying the public schema name
     */
    SchemaContext(IDbConnection& conn, SchemaDdl ddl);

    SchemaContext(SchemaContext&&) noexcept = default;
    SchemaContext& operator=(SchemaContext&&) noexcept = default;

    SchemaContext(const SchemaContext&) = delete;
    SchemaContext& operator=(const SchemaContext&) = delete;

    /**
     * @brief Switch the search path to a schema
     * @param name Tenant schema name, or the public schema name
     * @param check_exists Fail with SCHEMA_DOES_NOT_EXIST if the schema is absent
     */
    [[nodiscard]] Status set_schema(std::string_view name, bool check_exists = false);

    [[nodiscard]] Status set_tenant(const Tenant& tenant, bool check_exists = false);

    /**
     * @brief Reset to the public schema (idempotent)
     */
    [[nodiscard]] Status set_to_public();

    [[nodiscard]] const std::string& current_schema() const { return current_schema_; }
    [[nodiscard]] bool is_public() const { return current_schema_ == ddl_.validator().public_schema_name(); }
    [[nodiscard]] const std::string& public_schema_name() const { return ddl_.validator().public_schema_name(); }

    /**
     * @brief Look up a schema in pg_namespace
     */
    [[nodiscard]] Result<bool> schema_exists(std::string_view name);

    [[nodiscard]] IDbConnection& connection() const { return *conn_; }
    [[nodiscard]] const SchemaDdl& ddl() const { return ddl_; }

private:
    IDbConnection* conn_;
    SchemaDdl ddl_;
    std::string current_schema_;
};

} // namespace pgtenant
