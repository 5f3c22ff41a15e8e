#include "tenant/tenant_resolver.hpp"
#include "core/utils.hpp"
#include "tenant/itenant_store.hpp"

#include <format>
#include <mutex>

namespace pgtenant {

TenantResolver::TenantResolver()
    : table_(std::make_shared<const Snapshot>()) {}

std::string TenantResolver::normalize_host(std::string_view host) {
    std::string result = normalize_domain(host);

    if (!result.empty() && result.front() == '[') {
        // [v6-address]:port
        const auto close = result.find(']');
        if (close != std::string::npos) {
            result.resize(close + 1);
        }
        return result;
    }

    const auto colon = result.find(':');
    if (colon != std::string::npos && result.find(':', colon + 1) == std::string::npos) {
        result.resize(colon);
    }
    if (!result.empty() && result.back() == '.') {
        result.pop_back();
    }
    return result;
}

std::shared_ptr<const TenantResolver::Snapshot> TenantResolver::snapshot() const {
    std::shared_lock lock(mutex_);
    return table_;
}

std::shared_ptr<const Tenant> TenantResolver::resolve(std::string_view host) const {
    const auto table = snapshot();

    const auto it = table->domains.find(normalize_host(host));
    if (it != table->domains.end()) {
        return it->second;
    }
    return table->public_tenant;
}

void TenantResolver::register_domain(const std::string& domain, std::shared_ptr<const Tenant> tenant) {
    std::unique_lock lock(mutex_);
    auto next = std::make_shared<Snapshot>(*table_);
    next->domains[normalize_domain(domain)] = std::move(tenant);
    table_ = std::move(next);
}

bool TenantResolver::remove_domain(const std::string& domain) {
    std::unique_lock lock(mutex_);
    auto next = std::make_shared<Snapshot>(*table_);
    const bool erased = next->domains.erase(normalize_domain(domain)) > 0;
    if (erased) {
        table_ = std::move(next);
    }
    return erased;
}

void TenantResolver::set_public_tenant(std::shared_ptr<const Tenant> tenant) {
    std::unique_lock lock(mutex_);
    auto next = std::make_shared<Snapshot>(*table_);
    next->public_tenant = std::move(tenant);
    table_ = std::move(next);
}

void TenantResolver::reload(DomainMap domains, std::shared_ptr<const Tenant> public_tenant) {
    auto next = std::make_shared<Snapshot>();
    for (auto& [domain, tenant] : domains) {
        next->domains.emplace(normalize_domain(domain), std::move(tenant));
    }
    next->public_tenant = std::move(public_tenant);

    std::unique_lock lock(mutex_);
    table_ = std::move(next);
}

Status TenantResolver::reload_from(ITenantStore& store, const std::string& public_schema_name) {
    auto tenants = store.list_tenants();
    if (tenants.is_error()) {
        return Status::propagate(tenants);
    }

    DomainMap domains;
    std::shared_ptr<const Tenant> public_tenant;
    for (auto& tenant : tenants.value()) {
        auto owned = store.list_domains(*tenant.id);
        if (owned.is_error()) {
            return Status::propagate(owned);
        }
        auto shared = std::make_shared<const Tenant>(std::move(tenant));
        if (shared->schema_name == public_schema_name) {
            public_tenant = shared;
        }
        for (const auto& domain : owned.value()) {
            domains.emplace(domain, shared);
        }
    }

    const size_t count = domains.size();
    reload(std::move(domains), std::move(public_tenant));
    utils::log::debug(std::format("Tenant resolver loaded {} domain(s)", count));
    return Status::ok();
}

size_t TenantResolver::domain_count() const {
    return snapshot()->domains.size();
}

} // namespace pgtenant
