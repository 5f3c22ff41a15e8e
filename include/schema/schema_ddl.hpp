#pragma once

#include "core/error.hpp"
#include "schema/schema_name_validator.hpp"
#include <string>
#include <string_view>

namespace pgtenant {

/**
 * @brief Builds every statement that splices a schema identifier
 *
 * This is the only place in the codebase where a schema name is
 * interpolated into SQL text. Each builder validates the name first and
 * returns INVALID_SCHEMA_NAME without producing SQL when it fails.
 */
class SchemaDdl {
public:
    explicit SchemaDdl(SchemaNameValidator validator = SchemaNameValidator{});

    /** @brief CREATE SCHEMA "<name>" */
    [[nodiscard]] Result<std::string> create_schema(std::string_view name) const;

    /** @brief DROP SCHEMA "<name>" CASCADE */
    [[nodiscard]] Result<std::string> drop_schema(std::string_view name) const;

    /**
     * @brief SET search_path for a schema
     *
     * Tenant schemas get "<name>", "<public>" so shared tables stay visible;
     * the public schema gets itself alone.
     */
    [[nodiscard]] Result<std::string> search_path(std::string_view name) const;

    [[nodiscard]] bool is_public(std::string_view name) const;

    [[nodiscard]] const SchemaNameValidator& validator() const { return validator_; }

    /**
     * @brief Double-quote an identifier, doubling embedded quotes
     */
    [[nodiscard]] static std::string quote_identifier(std::string_view name);

private:
    SchemaNameValidator validator_;
};

} // namespace pgtenant
