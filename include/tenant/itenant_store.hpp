#pragma once

#include "core/error.hpp"
#include "tenant/tenant.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pgtenant {

/**
 * @brief Persistence for tenant and domain rows in the shared schema
 *
 * Pure row storage: no context checks and no schema DDL. Those belong to
 * TenantService. Domain strings are lowercased on every write and lookup.
 *
 * Uniqueness of schema_name and domain is enforced here and reported as
 * INTEGRITY_VIOLATION; missing rows are NOT_FOUND.
 */
class ITenantStore {
public:
    virtual ~ITenantStore() = default;

    /**
     * @brief Insert a new tenant row
     * @return The stored tenant with id and created_on filled in
     */
    [[nodiscard]] virtual Result<Tenant> insert_tenant(const Tenant& tenant) = 0;

    /**
     * @brief Update schema_name and name of an existing row (created_on is immutable)
     */
    [[nodiscard]] virtual Status update_tenant(const Tenant& tenant) = 0;

    /**
     * @brief Delete a tenant row and every domain that points at it
     */
    [[nodiscard]] virtual Status delete_tenant(int64_t tenant_id) = 0;

    [[nodiscard]] virtual Result<Tenant> find_tenant(int64_t tenant_id) = 0;
    [[nodiscard]] virtual Result<Tenant> find_tenant_by_schema(const std::string& schema_name) = 0;
    [[nodiscard]] virtual Result<Tenant> find_tenant_by_domain(const std::string& domain) = 0;

    /**
     * @brief All tenants ordered by id
     */
    [[nodiscard]] virtual Result<std::vector<Tenant>> list_tenants() = 0;

    /**
     * @brief Get-or-create a domain for a tenant
     *
     * Returns the existing row when the domain already belongs to the tenant,
     * INTEGRITY_VIOLATION when it belongs to another tenant.
     */
    [[nodiscard]] virtual Result<Domain> add_domain(int64_t tenant_id, const std::string& domain) = 0;

    /**
     * @return Number of rows removed (0 when the tenant did not own the domain)
     */
    [[nodiscard]] virtual Result<size_t> remove_domain(int64_t tenant_id, const std::string& domain) = 0;

    /**
     * @brief Domains of a tenant ordered by id
     */
    [[nodiscard]] virtual Result<std::vector<std::string>> list_domains(int64_t tenant_id) = 0;
};

} // namespace pgtenant
