#include "schema/schema_context.hpp"
#include "core/utils.hpp"
#include "db/sqlstate.hpp"
#include "tenant/tenant.hpp"

#include <format>

namespace pgtenant {

SchemaContext::SchemaContext(IDbConnection& conn, SchemaDdl ddl)
    : conn_(&conn),
      ddl_(std::move(ddl)),
      current_schema_(ddl_.validator().public_schema_name()) {}

Status SchemaContext::set_schema(std::string_view name, bool check_exists) {
    auto sql = ddl_.search_path(name);
    if (sql.is_error()) {
        return Status::propagate(sql);
    }

    const std::string normalized = SchemaNameValidator::normalize(name);

    if (check_exists && !ddl_.is_public(normalized)) {
        auto exists = schema_exists(normalized);
        if (exists.is_error()) {
            return Status::propagate(exists);
        }
        if (!exists.value()) {
            return Status::error(ErrorCode::SCHEMA_DOES_NOT_EXIST,
                std::format("Schema '{}' does not exist", normalized));
        }
    }

    const auto rs = conn_->execute(sql.value());
    if (!rs.success) {
        return sqlstate::failure(rs, std::format("Failed to set search path to '{}'", normalized));
    }

    current_schema_ = normalized;
    utils::log::debug(std::format("search_path -> {}", current_schema_));
    return Status::ok();
}

Status SchemaContext::set_tenant(const Tenant& tenant, bool check_exists) {
    return set_schema(tenant.schema_name, check_exists);
}

Status SchemaContext::set_to_public() {
    return set_schema(ddl_.validator().public_schema_name());
}

Result<bool> SchemaContext::schema_exists(std::string_view name) {
    const auto rs = conn_->execute_params(kSchemaExistsQuery,
        {SchemaNameValidator::normalize(name)});
    if (!rs.success) {
        return sqlstate::failure<bool>(rs, "Schema existence check failed");
    }
    const bool exists = !rs.rows.empty() && !rs.rows[0].empty() && rs.rows[0][0] == "t";
    return Result<bool>::ok(exists);
}

} // namespace pgtenant
