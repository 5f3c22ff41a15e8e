#include "schema/schema_ddl.hpp"

#include <format>

namespace pgtenant {

SchemaDdl::SchemaDdl(SchemaNameValidator validator)
    : validator_(std::move(validator)) {}

std::string SchemaDdl::quote_identifier(std::string_view name) {
    std::string quoted;
    quoted.reserve(name.size() + 2);
    quoted += '"';
    for (const char c : name) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

bool SchemaDdl::is_public(std::string_view name) const {
    return SchemaNameValidator::normalize(name) == validator_.public_schema_name();
}

Result<std::string> SchemaDdl::create_schema(std::string_view name) const {
    if (auto status = validator_.validate(name); status.is_error()) {
        return Result<std::string>::propagate(status);
    }
    return Result<std::string>::ok(std::format("CREATE SCHEMA {}",
        quote_identifier(SchemaNameValidator::normalize(name))));
}

Result<std::string> SchemaDdl::drop_schema(std::string_view name) const {
    if (auto status = validator_.validate(name); status.is_error()) {
        return Result<std::string>::propagate(status);
    }
    return Result<std::string>::ok(std::format("DROP SCHEMA {} CASCADE",
        quote_identifier(SchemaNameValidator::normalize(name))));
}

Result<std::string> SchemaDdl::search_path(std::string_view name) const {
    const auto& public_name = validator_.public_schema_name();
    if (is_public(name)) {
        return Result<std::string>::ok(std::format("SET search_path = {}",
            quote_identifier(public_name)));
    }
    if (auto status = validator_.validate(name); status.is_error()) {
        return Result<std::string>::propagate(status);
    }
    return Result<std::string>::ok(std::format("SET search_path = {}, {}",
        quote_identifier(SchemaNameValidator::normalize(name)),
        quote_identifier(public_name)));
}

} // namespace pgtenant
