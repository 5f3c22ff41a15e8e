#pragma once

#include "core/error.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace pgtenant {

inline constexpr size_t kMaxSchemaNameLength = 63;  // NAMEDATALEN - 1
inline constexpr std::string_view kDefaultPublicSchema = "public";
inline constexpr std::string_view kInformationSchema = "information_schema";
inline constexpr std::string_view kSystemSchemaPrefix = "pg_";

/**
 * @brief Validates tenant schema identifiers
 *
 * Schema names are spliced into DDL text (identifiers cannot be bound as
 * parameters), so every name must pass here before it reaches a statement.
 *
 * Accepted: 1-63 bytes of [a-z0-9_] after lowercasing, not starting with a
 * digit. Rejected as reserved: the configured public schema, the literal
 * "public" even when another shared schema is configured, information_schema,
 * anything starting with pg_, and any configured extra names.
 */
class SchemaNameValidator {
public:
    explicit SchemaNameValidator(std::string public_schema_name = std::string{kDefaultPublicSchema},
                                 std::vector<std::string> extra_reserved = {});

    /**
     * @brief Full validation for a tenant schema (syntax + reserved list)
     */
    [[nodiscard]] Status validate(std::string_view name) const;

    [[nodiscard]] bool is_valid(std::string_view name) const { return validate(name).is_ok(); }

    /**
     * @brief True if the (normalized) name collides with a reserved schema
     */
    [[nodiscard]] bool is_reserved(std::string_view name) const;

    [[nodiscard]] const std::string& public_schema_name() const { return public_schema_name_; }

    /**
     * @brief Syntax-only check, used for the public schema name itself
     */
    [[nodiscard]] static Status check_identifier(std::string_view name);

    [[nodiscard]] static std::string normalize(std::string_view name);

private:
    std::string public_schema_name_;
    std::vector<std::string> extra_reserved_;
};

} // namespace pgtenant
