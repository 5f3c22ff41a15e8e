#pragma once

#include "core/error.hpp"
#include "tenant/tenant.hpp"
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace pgtenant {

class ITenantStore;

/**
 * @brief In-memory host to tenant routing table
 *
 * Readers take a snapshot under a shared lock and look up without holding
 * it; writers copy, modify and swap the whole table.
 */
class TenantResolver {
public:
    using DomainMap = std::unordered_map<std::string, std::shared_ptr<const Tenant>>;

    TenantResolver();

    /**
     * @brief Tenant for a request host (case-insensitive, port ignored)
     * @return Owning tenant, else the public tenant, else nullptr
     */
    [[nodiscard]] std::shared_ptr<const Tenant> resolve(std::string_view host) const;

    void register_domain(const std::string& domain, std::shared_ptr<const Tenant> tenant);
    bool remove_domain(const std::string& domain);
    void set_public_tenant(std::shared_ptr<const Tenant> tenant);

    /**
     * @brief Replace the whole table at once
     */
    void reload(DomainMap domains, std::shared_ptr<const Tenant> public_tenant);

    /**
     * @brief Rebuild the table from every tenant and domain in the store
     * @param public_schema_name Schema name of the fallback tenant
     */
    [[nodiscard]] Status reload_from(ITenantStore& store, const std::string& public_schema_name);

    [[nodiscard]] size_t domain_count() const;

    /**
     * @brief Lowercase, trim and strip a trailing :port or dot from a host
     */
    [[nodiscard]] static std::string normalize_host(std::string_view host);

private:
    struct Snapshot {
        DomainMap domains;
        std::shared_ptr<const Tenant> public_tenant;
    };

    [[nodiscard]] std::shared_ptr<const Snapshot> snapshot() const;

    // RCU: readers get shared_ptr snapshot, writers swap the entire table
    std::shared_ptr<const Snapshot> table_;
    mutable std::shared_mutex mutex_;
};

} // namespace pgtenant
