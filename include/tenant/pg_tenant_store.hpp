#pragma once

#include "db/idb_connection.hpp"
#include "tenant/itenant_store.hpp"
#include <string>

namespace pgtenant {

/**
 * @brief Names of the shared tables holding tenants and domains
 */
struct TenantTables {
    std::string schema = "public";
    std::string tenant_table = "tenants";
    std::string domain_table = "domains";
};

/**
 * @brief ITenantStore backed by two tables in the public schema
 *
 * Table names are schema-qualified in every statement so the store works
 * regardless of the connection's current search path. All values travel as
 * bound parameters.
 */
class PgTenantStore : public ITenantStore {
public:
    PgTenantStore(IDbConnection& conn, const TenantTables& tables = TenantTables{});

    /**
     * @brief Create both tables if they do not exist yet
     */
    [[nodiscard]] Status ensure_tables();

    Result<Tenant> insert_tenant(const Tenant& tenant) override;
    Status update_tenant(const Tenant& tenant) override;
    Status delete_tenant(int64_t tenant_id) override;

    Result<Tenant> find_tenant(int64_t tenant_id) override;
    Result<Tenant> find_tenant_by_schema(const std::string& schema_name) override;
    Result<Tenant> find_tenant_by_domain(const std::string& domain) override;
    Result<std::vector<Tenant>> list_tenants() override;

    Result<Domain> add_domain(int64_t tenant_id, const std::string& domain) override;
    Result<size_t> remove_domain(int64_t tenant_id, const std::string& domain) override;
    Result<std::vector<std::string>> list_domains(int64_t tenant_id) override;

private:
    Result<Tenant> find_one(const std::string& sql, const std::vector<std::string>& params,
                            const std::string& what);

    static Result<Tenant> tenant_from_row(const std::vector<std::string>& row);

    IDbConnection& conn_;
    std::string tenant_table_;  // quoted, schema-qualified
    std::string domain_table_;  // quoted, schema-qualified
};

} // namespace pgtenant
