#include "schema/schema_lifecycle.hpp"
#include "core/utils.hpp"
#include "db/sqlstate.hpp"
#include "tenant/tenant.hpp"

#include <format>

namespace pgtenant {

SchemaLifecycle::SchemaLifecycle(SchemaContext& context, std::shared_ptr<IMigrationRunner> migrations)
    : context_(context), migrations_(std::move(migrations)) {}

template<typename T>
Result<T> SchemaLifecycle::restore_public(Result<T> primary) {
    auto reset = context_.set_to_public();
    if (reset.is_ok()) {
        return primary;
    }
    if (primary.is_error()) {
        utils::log::error(std::format("Failed to reset search path after error: {}",
            reset.error_message()));
        return primary;
    }
    return Result<T>::propagate(reset);
}

// ============================================================================
// Create
// ============================================================================

Result<bool> SchemaLifecycle::create_schema(const Tenant& tenant, bool check_if_exists,
                                            bool apply_migrations, int verbosity) {
    const std::string schema_name = SchemaNameValidator::normalize(tenant.schema_name);
    if (auto status = context_.ddl().validator().validate(schema_name); status.is_error()) {
        return Result<bool>::propagate(status);
    }
    return restore_public(create_and_migrate(schema_name, check_if_exists, apply_migrations, verbosity));
}

Result<bool> SchemaLifecycle::create_and_migrate(const std::string& schema_name, bool check_if_exists,
                                                 bool apply_migrations, int verbosity) {
    if (check_if_exists) {
        auto exists = schema_exists(schema_name);
        if (exists.is_error()) {
            return Result<bool>::propagate(exists);
        }
        if (exists.value()) {
            utils::log::debug(std::format("Schema '{}' already exists, not creating", schema_name));
            return Result<bool>::ok(false);
        }
    }

    auto sql = context_.ddl().create_schema(schema_name);
    if (sql.is_error()) {
        return Result<bool>::propagate(sql);
    }

    const auto rs = context_.connection().execute(sql.value());
    if (!rs.success) {
        return sqlstate::failure<bool>(rs, std::format("Failed to create schema '{}'", schema_name));
    }
    if (verbosity >= 1) {
        utils::log::info(std::format("Created schema '{}'", schema_name));
    }

    if (apply_migrations) {
        if (auto migrated = run_migrations(schema_name, verbosity); migrated.is_error()) {
            return Result<bool>::propagate(migrated);
        }
    }
    return Result<bool>::ok(true);
}

Status SchemaLifecycle::run_migrations(const std::string& schema_name, int verbosity) {
    if (!migrations_) {
        return Status::ok();
    }
    auto applied = migrations_->apply(context_, schema_name, verbosity);
    if (applied.is_error()) {
        if (applied.error_code() == ErrorCode::MIGRATION_FAILURE) {
            return applied;
        }
        return Status::error(ErrorCode::MIGRATION_FAILURE,
            std::format("Migrating schema '{}' failed: {}", schema_name, applied.error_message()));
    }
    return Status::ok();
}

// ============================================================================
// Drop / inspect / migrate
// ============================================================================

Status SchemaLifecycle::drop_schema(const Tenant& tenant) {
    auto sql = context_.ddl().drop_schema(tenant.schema_name);
    if (sql.is_error()) {
        return Status::propagate(sql);
    }

    const std::string schema_name = SchemaNameValidator::normalize(tenant.schema_name);

    // Dropping the schema the connection points at leaves a dangling search path
    if (context_.current_schema() == schema_name) {
        if (auto reset = context_.set_to_public(); reset.is_error()) {
            return reset;
        }
    }

    const auto rs = context_.connection().execute(sql.value());
    if (!rs.success) {
        return sqlstate::failure(rs, std::format("Failed to drop schema '{}'", schema_name));
    }
    utils::log::info(std::format("Dropped schema '{}'", schema_name));
    return Status::ok();
}

Result<bool> SchemaLifecycle::schema_exists(std::string_view name) {
    return context_.schema_exists(name);
}

Status SchemaLifecycle::migrate(const Tenant& tenant, int verbosity) {
    const std::string schema_name = SchemaNameValidator::normalize(tenant.schema_name);
    if (auto status = context_.ddl().validator().validate(schema_name); status.is_error()) {
        return status;
    }

    auto exists = schema_exists(schema_name);
    if (exists.is_error()) {
        return Status::propagate(exists);
    }
    if (!exists.value()) {
        return Status::error(ErrorCode::SCHEMA_DOES_NOT_EXIST,
            std::format("Schema '{}' does not exist", schema_name));
    }
    return restore_public(run_migrations(schema_name, verbosity));
}

} // namespace pgtenant
