#include "tenant/pg_tenant_store.hpp"
#include "core/utils.hpp"
#include "db/sqlstate.hpp"
#include "schema/schema_ddl.hpp"

#include <format>

namespace pgtenant {

namespace {

// id, schema_name, name, created_on
constexpr const char* kTenantColumns =
    "id, schema_name, name, to_char(created_on, 'YYYY-MM-DD')";

constexpr int COL_ID      = 0;
constexpr int COL_SCHEMA  = 1;
constexpr int COL_NAME    = 2;
constexpr int COL_CREATED = 3;

std::string qualified(const std::string& schema, const std::string& table) {
    return std::format("{}.{}", SchemaDdl::quote_identifier(schema), SchemaDdl::quote_identifier(table));
}

} // anonymous namespace

PgTenantStore::PgTenantStore(IDbConnection& conn, const TenantTables& tables)
    : conn_(conn),
      tenant_table_(qualified(tables.schema, tables.tenant_table)),
      domain_table_(qualified(tables.schema, tables.domain_table)) {}

Status PgTenantStore::ensure_tables() {
    const std::string tenants_ddl = std::format(
        "CREATE TABLE IF NOT EXISTS {} ("
        "id BIGSERIAL PRIMARY KEY, "
        "schema_name VARCHAR(63) NOT NULL UNIQUE, "
        "name VARCHAR(100) NOT NULL, "
        "created_on DATE NOT NULL DEFAULT CURRENT_DATE)", tenant_table_);

    const std::string domains_ddl = std::format(
        "CREATE TABLE IF NOT EXISTS {} ("
        "id BIGSERIAL PRIMARY KEY, "
        "domain VARCHAR(128) NOT NULL UNIQUE, "
        "tenant_id BIGINT NOT NULL REFERENCES {}(id) ON DELETE CASCADE)",
        domain_table_, tenant_table_);

    for (const auto* sql : {&tenants_ddl, &domains_ddl}) {
        const auto rs = conn_.execute(*sql);
        if (!rs.success) {
            return sqlstate::failure(rs, "Failed to create tenancy tables");
        }
    }
    return Status::ok();
}

// ============================================================================
// Tenants
// ============================================================================

Result<Tenant> PgTenantStore::tenant_from_row(const std::vector<std::string>& row) {
    if (row.size() <= COL_CREATED) {
        return Result<Tenant>::error(ErrorCode::DATABASE_ERROR, "Unexpected tenant row shape");
    }
    const auto id = utils::try_parse_int<int64_t>(row[COL_ID]);
    if (!id) {
        return Result<Tenant>::error(ErrorCode::DATABASE_ERROR,
            std::format("Invalid tenant id '{}'", row[COL_ID]));
    }

    Tenant tenant;
    tenant.id = *id;
    tenant.schema_name = row[COL_SCHEMA];
    tenant.name = row[COL_NAME];
    tenant.created_on = row[COL_CREATED];
    return Result<Tenant>::ok(std::move(tenant));
}

Result<Tenant> PgTenantStore::insert_tenant(const Tenant& tenant) {
    const std::string sql = std::format(
        "INSERT INTO {} (schema_name, name) VALUES ($1, $2) "
        "RETURNING id, to_char(created_on, 'YYYY-MM-DD')", tenant_table_);

    const auto rs = conn_.execute_params(sql, {tenant.schema_name, tenant.name});
    if (!rs.success) {
        return sqlstate::failure<Tenant>(rs,
            std::format("Failed to insert tenant '{}'", tenant.schema_name));
    }
    if (rs.rows.empty() || rs.rows[0].size() < 2) {
        return Result<Tenant>::error(ErrorCode::DATABASE_ERROR, "INSERT returned no row");
    }

    const auto id = utils::try_parse_int<int64_t>(rs.rows[0][0]);
    if (!id) {
        return Result<Tenant>::error(ErrorCode::DATABASE_ERROR,
            std::format("Invalid tenant id '{}'", rs.rows[0][0]));
    }

    Tenant stored = tenant;
    stored.id = *id;
    stored.created_on = rs.rows[0][1];
    return Result<Tenant>::ok(std::move(stored));
}

Status PgTenantStore::update_tenant(const Tenant& tenant) {
    if (!tenant.is_saved()) {
        return Status::error(ErrorCode::TENANT_NOT_SAVED, "Cannot update a tenant that was never saved");
    }

    const std::string sql = std::format(
        "UPDATE {} SET schema_name = $1, name = $2 WHERE id = $3", tenant_table_);

    const auto rs = conn_.execute_params(sql,
        {tenant.schema_name, tenant.name, std::to_string(*tenant.id)});
    if (!rs.success) {
        return sqlstate::failure(rs, std::format("Failed to update tenant {}", *tenant.id));
    }
    if (rs.affected_rows == 0) {
        return Status::error(ErrorCode::NOT_FOUND, std::format("Tenant {} not found", *tenant.id));
    }
    return Status::ok();
}

Status PgTenantStore::delete_tenant(int64_t tenant_id) {
    const std::string id = std::to_string(tenant_id);

    auto begin = conn_.execute("BEGIN");
    if (!begin.success) {
        return sqlstate::failure(begin, "Failed to start transaction");
    }

    const auto domains = conn_.execute_params(
        std::format("DELETE FROM {} WHERE tenant_id = $1", domain_table_), {id});
    const auto tenants = domains.success
        ? conn_.execute_params(std::format("DELETE FROM {} WHERE id = $1", tenant_table_), {id})
        : DbResultSet{};

    if (!domains.success || !tenants.success) {
        const auto& failed = domains.success ? tenants : domains;
        const auto rollback = conn_.execute("ROLLBACK");
        if (!rollback.success) {
            utils::log::error(std::format("ROLLBACK failed after tenant delete error: {}",
                utils::trim(rollback.error_message)));
        }
        return sqlstate::failure(failed, std::format("Failed to delete tenant {}", tenant_id));
    }

    const auto commit = conn_.execute("COMMIT");
    if (!commit.success) {
        return sqlstate::failure(commit, std::format("Failed to commit delete of tenant {}", tenant_id));
    }
    if (tenants.affected_rows == 0) {
        return Status::error(ErrorCode::NOT_FOUND, std::format("Tenant {} not found", tenant_id));
    }
    return Status::ok();
}

Result<Tenant> PgTenantStore::find_one(const std::string& sql,
                                       const std::vector<std::string>& params,
                                       const std::string& what) {
    const auto rs = conn_.execute_params(sql, params);
    if (!rs.success) {
        return sqlstate::failure<Tenant>(rs, std::format("Failed to look up {}", what));
    }
    if (rs.rows.empty()) {
        return Result<Tenant>::error(ErrorCode::NOT_FOUND, std::format("No tenant for {}", what));
    }
    return tenant_from_row(rs.rows[0]);
}

Result<Tenant> PgTenantStore::find_tenant(int64_t tenant_id) {
    return find_one(
        std::format("SELECT {} FROM {} WHERE id = $1", kTenantColumns, tenant_table_),
        {std::to_string(tenant_id)}, std::format("id {}", tenant_id));
}

Result<Tenant> PgTenantStore::find_tenant_by_schema(const std::string& schema_name) {
    return find_one(
        std::format("SELECT {} FROM {} WHERE schema_name = $1", kTenantColumns, tenant_table_),
        {schema_name}, std::format("schema '{}'", schema_name));
}

Result<Tenant> PgTenantStore::find_tenant_by_domain(const std::string& domain) {
    const std::string normalized = normalize_domain(domain);
    return find_one(
        std::format("SELECT t.id, t.schema_name, t.name, to_char(t.created_on, 'YYYY-MM-DD') "
                    "FROM {} t JOIN {} d ON d.tenant_id = t.id WHERE d.domain = $1",
                    tenant_table_, domain_table_),
        {normalized}, std::format("domain '{}'", normalized));
}

Result<std::vector<Tenant>> PgTenantStore::list_tenants() {
    const auto rs = conn_.execute(
        std::format("SELECT {} FROM {} ORDER BY id", kTenantColumns, tenant_table_));
    if (!rs.success) {
        return sqlstate::failure<std::vector<Tenant>>(rs, "Failed to list tenants");
    }

    std::vector<Tenant> tenants;
    tenants.reserve(rs.rows.size());
    for (const auto& row : rs.rows) {
        auto tenant = tenant_from_row(row);
        if (tenant.is_error()) {
            return Result<std::vector<Tenant>>::propagate(tenant);
        }
        tenants.push_back(std::move(tenant.value()));
    }
    return Result<std::vector<Tenant>>::ok(std::move(tenants));
}

// ============================================================================
// Domains
// ============================================================================

Result<Domain> PgTenantStore::add_domain(int64_t tenant_id, const std::string& domain) {
    const std::string normalized = normalize_domain(domain);
    const std::string owner = std::to_string(tenant_id);

    const auto existing = conn_.execute_params(
        std::format("SELECT id, tenant_id FROM {} WHERE domain = $1", domain_table_), {normalized});
    if (!existing.success) {
        return sqlstate::failure<Domain>(existing, std::format("Failed to look up domain '{}'", normalized));
    }

    if (!existing.rows.empty()) {
        const auto& row = existing.rows[0];
        if (row.size() < 2 || row[1] != owner) {
            return Result<Domain>::error(ErrorCode::INTEGRITY_VIOLATION,
                std::format("Domain '{}' already belongs to another tenant", normalized));
        }
        Domain found;
        found.id = utils::try_parse_int<int64_t>(row[0]).value_or(0);
        found.domain = normalized;
        found.tenant_id = tenant_id;
        return Result<Domain>::ok(std::move(found));
    }

    const auto inserted = conn_.execute_params(
        std::format("INSERT INTO {} (domain, tenant_id) VALUES ($1, $2) RETURNING id", domain_table_),
        {normalized, owner});
    if (!inserted.success) {
        return sqlstate::failure<Domain>(inserted, std::format("Failed to add domain '{}'", normalized));
    }

    Domain created;
    if (!inserted.rows.empty() && !inserted.rows[0].empty()) {
        created.id = utils::try_parse_int<int64_t>(inserted.rows[0][0]).value_or(0);
    }
    created.domain = normalized;
    created.tenant_id = tenant_id;
    return Result<Domain>::ok(std::move(created));
}

Result<size_t> PgTenantStore::remove_domain(int64_t tenant_id, const std::string& domain) {
    const auto rs = conn_.execute_params(
        std::format("DELETE FROM {} WHERE tenant_id = $1 AND domain = $2", domain_table_),
        {std::to_string(tenant_id), normalize_domain(domain)});
    if (!rs.success) {
        return sqlstate::failure<size_t>(rs, "Failed to remove domain");
    }
    return Result<size_t>::ok(static_cast<size_t>(rs.affected_rows));
}

Result<std::vector<std::string>> PgTenantStore::list_domains(int64_t tenant_id) {
    const auto rs = conn_.execute_params(
        std::format("SELECT domain FROM {} WHERE tenant_id = $1 ORDER BY id", domain_table_),
        {std::to_string(tenant_id)});
    if (!rs.success) {
        return sqlstate::failure<std::vector<std::string>>(rs, "Failed to list domains");
    }

    std::vector<std::string> domains;
    domains.reserve(rs.rows.size());
    for (const auto& row : rs.rows) {
        if (!row.empty()) domains.push_back(row[0]);
    }
    return Result<std::vector<std::string>>::ok(std::move(domains));
}

} // namespace pgtenant
