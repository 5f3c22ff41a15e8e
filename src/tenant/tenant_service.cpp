#include "tenant/tenant_service.hpp"
#include "core/utils.hpp"

#include <format>

namespace pgtenant {

TenantService::TenantService(ITenantStore& store, SchemaLifecycle& lifecycle, TenantPolicy policy)
    : store_(store), lifecycle_(lifecycle), policy_(policy) {}

Tenant TenantService::make_tenant(const std::string& schema_name, const std::string& name) const {
    Tenant tenant;
    tenant.schema_name = SchemaNameValidator::normalize(schema_name);
    tenant.name = name;
    tenant.auto_create_schema = policy_.auto_create_schema;
    tenant.auto_drop_schema = policy_.auto_drop_schema;
    return tenant;
}

Result<Tenant> TenantService::with_policy(Result<Tenant> loaded) const {
    if (loaded.is_ok()) {
        loaded.value().auto_create_schema = policy_.auto_create_schema;
        loaded.value().auto_drop_schema = policy_.auto_drop_schema;
    }
    return loaded;
}

Status TenantService::check_context(const Tenant& tenant, std::string_view action) const {
    const auto& context = lifecycle_.context();
    if (context.is_public() ||
        context.current_schema() == SchemaNameValidator::normalize(tenant.schema_name)) {
        return Status::ok();
    }
    return Status::error(ErrorCode::CONTEXT_VIOLATION,
        std::format("Cannot {} tenant '{}' while the connection is set to schema '{}'",
            action, tenant.schema_name, context.current_schema()));
}

// ============================================================================
// Save
// ============================================================================

Status TenantService::save(Tenant& tenant, int verbosity) {
    if (tenant.is_saved()) {
        return update(tenant);
    }
    return insert(tenant, verbosity);
}

Status TenantService::insert(Tenant& tenant, int verbosity) {
    const auto& context = lifecycle_.context();
    if (!context.is_public()) {
        return Status::error(ErrorCode::CONTEXT_VIOLATION,
            std::format("Tenants can only be created from the '{}' schema, connection is set to '{}'",
                context.public_schema_name(), context.current_schema()));
    }

    tenant.schema_name = SchemaNameValidator::normalize(tenant.schema_name);
    const bool is_public = context.ddl().is_public(tenant.schema_name);
    if (!is_public) {
        if (auto status = context.ddl().validator().validate(tenant.schema_name); status.is_error()) {
            return status;
        }
    }

    auto stored = store_.insert_tenant(tenant);
    if (stored.is_error()) {
        return Status::propagate(stored);
    }
    tenant.id = stored.value().id;
    tenant.created_on = stored.value().created_on;

    // The public schema always exists and is never created or migrated here
    if (!tenant.auto_create_schema || is_public) {
        return Status::ok();
    }

    Status synced = Status::ok();
    auto created = lifecycle_.create_schema(tenant, true, lifecycle_.has_migrations(), verbosity);
    if (created.is_error()) {
        synced = Status::propagate(created);
    } else if (schema_synced_) {
        synced = schema_synced_(tenant);
    }

    if (synced.is_ok()) {
        return synced;
    }

    utils::log::warn(std::format("Creating schema for tenant '{}' failed, rolling back: {}",
        tenant.schema_name, synced.error_message()));
    if (auto rollback = remove(tenant, true); rollback.is_error()) {
        utils::log::error(std::format("Rollback of tenant '{}' failed: {}",
            tenant.schema_name, rollback.error_message()));
    }
    return synced;
}

Status TenantService::update(const Tenant& tenant) {
    if (auto status = check_context(tenant, "update"); status.is_error()) {
        return status;
    }

    Tenant normalized = tenant;
    normalized.schema_name = SchemaNameValidator::normalize(tenant.schema_name);
    const auto& ddl = lifecycle_.context().ddl();
    if (!ddl.is_public(normalized.schema_name)) {
        if (auto status = ddl.validator().validate(normalized.schema_name); status.is_error()) {
            return status;
        }
    }
    return store_.update_tenant(normalized);
}

// ============================================================================
// Remove
// ============================================================================

Status TenantService::remove(Tenant& tenant, bool force_drop) {
    if (!tenant.is_saved()) {
        return Status::error(ErrorCode::TENANT_NOT_SAVED,
            std::format("Tenant '{}' has not been saved", tenant.schema_name));
    }
    if (auto status = check_context(tenant, "delete"); status.is_error()) {
        return status;
    }

    const bool is_public = lifecycle_.context().ddl().is_public(tenant.schema_name);
    if (!is_public && (tenant.auto_drop_schema || force_drop)) {
        auto exists = lifecycle_.schema_exists(tenant.schema_name);
        if (exists.is_error()) {
            return Status::propagate(exists);
        }
        if (exists.value()) {
            if (auto dropped = lifecycle_.drop_schema(tenant); dropped.is_error()) {
                return dropped;
            }
        }
    }

    if (auto deleted = store_.delete_tenant(*tenant.id); deleted.is_error()) {
        return deleted;
    }
    tenant.id.reset();
    return Status::ok();
}

// ============================================================================
// Domains
// ============================================================================

Result<std::vector<std::string>> TenantService::get_domains(const Tenant& tenant) {
    if (!tenant.is_saved()) {
        return Result<std::vector<std::string>>::error(ErrorCode::TENANT_NOT_SAVED,
            std::format("Tenant '{}' has not been saved", tenant.schema_name));
    }
    return store_.list_domains(*tenant.id);
}

Result<Domain> TenantService::add_domain(const Tenant& tenant, const std::string& domain) {
    if (!tenant.is_saved()) {
        return Result<Domain>::error(ErrorCode::TENANT_NOT_SAVED,
            std::format("Tenant '{}' has not been saved", tenant.schema_name));
    }
    const std::string normalized = normalize_domain(domain);
    if (normalized.empty()) {
        return Result<Domain>::error(ErrorCode::INTEGRITY_VIOLATION, "Domain must not be empty");
    }
    return store_.add_domain(*tenant.id, normalized);
}

Result<size_t> TenantService::remove_domain(const Tenant& tenant, const std::string& domain) {
    if (!tenant.is_saved()) {
        return Result<size_t>::error(ErrorCode::TENANT_NOT_SAVED,
            std::format("Tenant '{}' has not been saved", tenant.schema_name));
    }
    return store_.remove_domain(*tenant.id, normalize_domain(domain));
}

// ============================================================================
// Lookups
// ============================================================================

Result<Tenant> TenantService::get_public() {
    return with_policy(store_.find_tenant_by_schema(lifecycle_.context().public_schema_name()));
}

Result<Tenant> TenantService::get_for_domain(const std::string& domain) {
    auto owner = store_.find_tenant_by_domain(normalize_domain(domain));
    if (owner.is_ok() || owner.error_code() != ErrorCode::NOT_FOUND) {
        return with_policy(std::move(owner));
    }
    return get_public();
}

Result<Tenant> TenantService::get_by_schema(const std::string& schema_name) {
    return with_policy(store_.find_tenant_by_schema(SchemaNameValidator::normalize(schema_name)));
}

Result<std::vector<Tenant>> TenantService::list() {
    auto tenants = store_.list_tenants();
    if (tenants.is_ok()) {
        for (auto& tenant : tenants.value()) {
            tenant.auto_create_schema = policy_.auto_create_schema;
            tenant.auto_drop_schema = policy_.auto_drop_schema;
        }
    }
    return tenants;
}

Status TenantService::migrate_all(int verbosity) {
    const auto& context = lifecycle_.context();
    if (!context.is_public()) {
        return Status::error(ErrorCode::CONTEXT_VIOLATION,
            std::format("Migrations must start from the '{}' schema", context.public_schema_name()));
    }

    auto tenants = list();
    if (tenants.is_error()) {
        return Status::propagate(tenants);
    }

    size_t migrated = 0;
    for (const auto& tenant : tenants.value()) {
        if (context.ddl().is_public(tenant.schema_name)) {
            continue;
        }
        if (verbosity >= 1) {
            utils::log::info(std::format("=== Running migrations for schema '{}'", tenant.schema_name));
        }
        if (auto status = lifecycle_.migrate(tenant, verbosity); status.is_error()) {
            return status;
        }
        ++migrated;
    }

    utils::log::info(std::format("Migrated {} tenant schema(s)", migrated));
    return Status::ok();
}

} // namespace pgtenant
