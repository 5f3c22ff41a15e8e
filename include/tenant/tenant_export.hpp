#pragma once

#include "core/error.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace pgtenant {

class ITenantStore;

inline constexpr std::string_view kDomainSeparator = ", ";

/**
 * @brief One exported tenant: schema name and its domains in insertion order
 */
struct TenantListingRow {
    std::string schema_name;
    std::vector<std::string> domains;

    [[nodiscard]] std::string joined_domains() const;
};

/**
 * @brief Read every tenant (ordered by id) with its domains
 */
[[nodiscard]] Result<std::vector<TenantListingRow>> collect_tenant_listing(ITenantStore& store);

/**
 * @brief Tab-separated (schema_name, joined_domains) rows, CRLF terminated. Fields containing a tab, a
 * quote or a line break are double-quoted with embedded quotes doubled.
 */
void write_tenant_listing_tsv(std::ostream& out, const std::vector<TenantListingRow>& rows);

/**
 * @brief [{"schema_name": "...", "domains": ["...", ...]}, ...]
 */
[[nodiscard]] nlohmann::json tenant_listing_to_json(const std::vector<TenantListingRow>& rows);

} // namespace pgtenant
