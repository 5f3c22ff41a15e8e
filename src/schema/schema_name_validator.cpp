#include "schema/schema_name_validator.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace pgtenant {

SchemaNameValidator::SchemaNameValidator(std::string public_schema_name,
                                         std::vector<std::string> extra_reserved)
    : public_schema_name_(normalize(public_schema_name)) {
    extra_reserved_.reserve(extra_reserved.size());
    for (const auto& name : extra_reserved) {
        extra_reserved_.push_back(normalize(name));
    }
}

std::string SchemaNameValidator::normalize(std::string_view name) {
    return utils::to_lower(name);
}

Status SchemaNameValidator::check_identifier(std::string_view name) {
    if (name.empty()) {
        return Status::error(ErrorCode::INVALID_SCHEMA_NAME, "Schema name must not be empty");
    }
    if (name.size() > kMaxSchemaNameLength) {
        return Status::error(ErrorCode::INVALID_SCHEMA_NAME,
            std::format("Schema name exceeds {} bytes ({} given)", kMaxSchemaNameLength, name.size()));
    }

    const std::string lower = normalize(name);
    for (const char c : lower) {
        const bool allowed = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
        if (!allowed) {
            return Status::error(ErrorCode::INVALID_SCHEMA_NAME,
                std::format("Invalid character in schema name '{}'", name));
        }
    }
    if (lower.front() >= '0' && lower.front() <= '9') {
        return Status::error(ErrorCode::INVALID_SCHEMA_NAME,
            std::format("Schema name '{}' must not start with a digit", name));
    }
    return Status::ok();
}

bool SchemaNameValidator::is_reserved(std::string_view name) const {
    const std::string lower = normalize(name);
    // PostgreSQL's own public schema stays off limits under a renamed shared schema
    if (lower == public_schema_name_ || lower == kDefaultPublicSchema || lower == kInformationSchema) {
        return true;
    }
    if (lower.starts_with(kSystemSchemaPrefix)) {
        return true;
    }
    return std::find(extra_reserved_.begin(), extra_reserved_.end(), lower) != extra_reserved_.end();
}

Status SchemaNameValidator::validate(std::string_view name) const {
    auto syntax = check_identifier(name);
    if (syntax.is_error()) {
        return syntax;
    }
    if (is_reserved(name)) {
        return Status::error(ErrorCode::INVALID_SCHEMA_NAME,
            std::format("Schema name '{}' is reserved", name));
    }
    return Status::ok();
}

} // namespace pgtenant
