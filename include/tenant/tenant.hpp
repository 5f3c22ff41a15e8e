#pragma once

#include "core/utils.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pgtenant {

/**
 * @brief A tenant row mapping a customer to its PostgreSQL schema
 *
 * auto_create_schema / auto_drop_schema are policy flags, not columns:
 * they control what TenantService does on save and remove.
 */
struct Tenant {
    std::optional<int64_t> id;      // Unset until the row is inserted
    std::string schema_name;        // Unique, validated, lowercase
    std::string name;               // Display label
    std::string created_on;         // YYYY-MM-DD, set by the store on insert

    bool auto_create_schema = true;
    bool auto_drop_schema = false;  // Use with caution: drops all tenant data

    [[nodiscard]] bool is_saved() const { return id.has_value(); }
};

/**
 * @brief A hostname routed to a tenant. Stored lowercase, unique system-wide.
 */
struct Domain {
    int64_t id = 0;
    std::string domain;
    int64_t tenant_id = 0;
};

/**
 * @brief Case-fold a domain for storage and lookup
 */
[[nodiscard]] inline std::string normalize_domain(std::string_view domain) {
    return utils::to_lower(utils::trim(std::string(domain)));
}

} // namespace pgtenant
