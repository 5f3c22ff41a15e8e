#pragma once

#include "core/error.hpp"
#include "schema/imigration_runner.hpp"
#include "schema/schema_context.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace pgtenant {

struct Tenant;

/**
 * @brief Owns CREATE SCHEMA / DROP SCHEMA for tenant schemas
 *
 * No other component issues schema DDL. Statements run on the connection
 * behind the given context; the context is left on the public schema after
 * every create_schema() call that got as far as issuing the CREATE.
 */
class SchemaLifecycle {
public:
    /**
     * @param context Context of the connection DDL runs on (not owned)
     * @param migrations Runner applied to new schemas; may be null to skip migrations
     */
    SchemaLifecycle(SchemaContext& context, std::shared_ptr<IMigrationRunner> migrations);

    /**
     * @brief Create the tenant's schema and optionally migrate it
     * @param check_if_exists Return false without error when the schema already exists
     * @param apply_migrations Run the migration collaborator inside the new schema
     * @return true when a schema was created
     *
     * A migration failure leaves the created schema in place; the caller
     * decides whether to drop it.
     */
    [[nodiscard]] Result<bool> create_schema(const Tenant& tenant, bool check_if_exists = false,
                                             bool apply_migrations = true, int verbosity = 1);

    /**
     * @brief DROP SCHEMA ... CASCADE for the tenant's schema
     */
    [[nodiscard]] Status drop_schema(const Tenant& tenant);

    [[nodiscard]] Result<bool> schema_exists(std::string_view name);

    /**
     * @brief Apply pending migrations to an existing tenant schema, then reset to public
     */
    [[nodiscard]] Status migrate(const Tenant& tenant, int verbosity = 1);

    [[nodiscard]] SchemaContext& context() { return context_; }
    [[nodiscard]] bool has_migrations() const { return migrations_ != nullptr; }

private:
    Result<bool> create_and_migrate(const std::string& schema_name, bool check_if_exists,
                                    bool apply_migrations, int verbosity);

    Status run_migrations(const std::string& schema_name, int verbosity);

    // Reset after DDL; a reset failure only surfaces when the primary result is ok
    template<typename T>
    Result<T> restore_public(Result<T> primary);

    SchemaContext& context_;
    std::shared_ptr<IMigrationRunner> migrations_;
};

} // namespace pgtenant
