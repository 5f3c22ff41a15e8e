#pragma once

#include "core/error.hpp"
#include "schema/schema_lifecycle.hpp"
#include "tenant/itenant_store.hpp"
#include "tenant/tenant.hpp"
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace pgtenant {

/**
 * @brief Defaults for the non-persisted policy flags of loaded tenants
 */
struct TenantPolicy {
    bool auto_create_schema = true;
    bool auto_drop_schema = false;
};

/**
 * @brief Couples tenant rows to their physical schemas
 *
 * Every mutation checks the connection context first and is rejected with
 * CONTEXT_VIOLATION before touching anything when the connection points at
 * an unrelated schema. Creating a tenant runs from the public context only.
 *
 * The store and the lifecycle must share one connection.
 */
class TenantService {
public:
    /**
     * @brief Called once after a new tenant's schema is created and migrated.
     * An error fails the save and triggers the same rollback as a migration failure.
     */
    using SchemaSyncedHook = std::function<Status(const Tenant&)>;

    TenantService(ITenantStore& store, SchemaLifecycle& lifecycle, TenantPolicy policy = TenantPolicy{});

    /**
     * @brief Insert or update a tenant
     *
     * New tenants: the schema name is normalized and validated, the row is
     * inserted and, with auto_create_schema, the schema is created, migrated
     * and the synced hook fires. Any failure after the insert removes the row
     * and the schema again and returns the original error.
     */
    [[nodiscard]] Status save(Tenant& tenant, int verbosity = 1);

    /**
     * @brief Delete a tenant row, dropping its schema first when
     * auto_drop_schema or force_drop is set and the schema exists
     */
    [[nodiscard]] Status remove(Tenant& tenant, bool force_drop = false);

    [[nodiscard]] Result<std::vector<std::string>> get_domains(const Tenant& tenant);
    [[nodiscard]] Result<Domain> add_domain(const Tenant& tenant, const std::string& domain);
    [[nodiscard]] Result<size_t> remove_domain(const Tenant& tenant, const std::string& domain);

    /**
     * @brief The tenant whose schema is the public schema
     */
    [[nodiscard]] Result<Tenant> get_public();

    /**
     * @brief Owner of a domain (case-insensitive), else the public tenant
     */
    [[nodiscard]] Result<Tenant> get_for_domain(const std::string& domain);

    [[nodiscard]] Result<Tenant> get_by_schema(const std::string& schema_name);
    [[nodiscard]] Result<std::vector<Tenant>> list();

    /**
     * @brief Apply pending migrations to every tenant schema, public excluded.
     * Stops at the first failing schema.
     */
    [[nodiscard]] Status migrate_all(int verbosity = 1);

    void on_schema_synced(SchemaSyncedHook hook) { schema_synced_ = std::move(hook); }

    /**
     * @brief Build an unsaved tenant carrying the configured policy flags
     */
    [[nodiscard]] Tenant make_tenant(const std::string& schema_name, const std::string& name) const;

    [[nodiscard]] const TenantPolicy& policy() const { return policy_; }

private:
    Status insert(Tenant& tenant, int verbosity);
    Status update(const Tenant& tenant);
    Status check_context(const Tenant& tenant, std::string_view action) const;
    Result<Tenant> with_policy(Result<Tenant> loaded) const;

    ITenantStore& store_;
    SchemaLifecycle& lifecycle_;
    TenantPolicy policy_;
    SchemaSyncedHook schema_synced_;
};

} // namespace pgtenant
