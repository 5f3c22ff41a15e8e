#pragma once

#include "tenant/itenant_store.hpp"
#include <algorithm>
#include <format>

namespace pgtenant::testing {

/**
 * @brief ITenantStore over plain vectors, with the same uniqueness rules as the tables
 */
class InMemoryTenantStore : public ITenantStore {
public:
    Result<Tenant> insert_tenant(const Tenant& tenant) override {
        if (find_row(tenant.schema_name)) {
            return Result<Tenant>::error(ErrorCode::INTEGRITY_VIOLATION,
                std::format("duplicate schema_name '{}'", tenant.schema_name));
        }
        Tenant stored = tenant;
        stored.id = next_tenant_id_++;
        stored.created_on = created_on_;
        tenants_.push_back(stored);
        return Result<Tenant>::ok(std::move(stored));
    }

    Status update_tenant(const Tenant& tenant) override {
        if (!tenant.is_saved()) {
            return Status::error(ErrorCode::TENANT_NOT_SAVED, "not saved");
        }
        auto it = std::find_if(tenants_.begin(), tenants_.end(),
            [&](const Tenant& t) { return t.id == tenant.id; });
        if (it == tenants_.end()) {
            return Status::error(ErrorCode::NOT_FOUND, "no such tenant");
        }
        const auto* clash = find_row(tenant.schema_name);
        if (clash && clash->id != tenant.id) {
            return Status::error(ErrorCode::INTEGRITY_VIOLATION, "duplicate schema_name");
        }
        it->schema_name = tenant.schema_name;
        it->name = tenant.name;
        ++updates_;
        return Status::ok();
    }

    Status delete_tenant(int64_t tenant_id) override {
        if (fail_deletes_) {
            return Status::error(ErrorCode::DATABASE_ERROR, "scripted delete failure");
        }
        const auto before = tenants_.size();
        std::erase_if(tenants_, [&](const Tenant& t) { return t.id == tenant_id; });
        if (tenants_.size() == before) {
            return Status::error(ErrorCode::NOT_FOUND, "no such tenant");
        }
        std::erase_if(domains_, [&](const Domain& d) { return d.tenant_id == tenant_id; });
        return Status::ok();
    }

    Result<Tenant> find_tenant(int64_t tenant_id) override {
        for (const auto& t : tenants_) {
            if (t.id == tenant_id) return Result<Tenant>::ok(t);
        }
        return Result<Tenant>::error(ErrorCode::NOT_FOUND, "no such tenant");
    }

    Result<Tenant> find_tenant_by_schema(const std::string& schema_name) override {
        if (const auto* t = find_row(schema_name)) return Result<Tenant>::ok(*t);
        return Result<Tenant>::error(ErrorCode::NOT_FOUND, "no such schema");
    }

    Result<Tenant> find_tenant_by_domain(const std::string& domain) override {
        const auto normalized = normalize_domain(domain);
        for (const auto& d : domains_) {
            if (d.domain == normalized) return find_tenant(d.tenant_id);
        }
        return Result<Tenant>::error(ErrorCode::NOT_FOUND, "no such domain");
    }

    Result<std::vector<Tenant>> list_tenants() override {
        return Result<std::vector<Tenant>>::ok(tenants_);
    }

    Result<Domain> add_domain(int64_t tenant_id, const std::string& domain) override {
        const auto normalized = normalize_domain(domain);
        for (const auto& d : domains_) {
            if (d.domain != normalized) continue;
            if (d.tenant_id != tenant_id) {
                return Result<Domain>::error(ErrorCode::INTEGRITY_VIOLATION, "domain taken");
            }
            return Result<Domain>::ok(d);
        }
        Domain created{next_domain_id_++, normalized, tenant_id};
        domains_.push_back(created);
        return Result<Domain>::ok(std::move(created));
    }

    Result<size_t> remove_domain(int64_t tenant_id, const std::string& domain) override {
        const auto normalized = normalize_domain(domain);
        const auto removed = std::erase_if(domains_, [&](const Domain& d) {
            return d.tenant_id == tenant_id && d.domain == normalized;
        });
        return Result<size_t>::ok(static_cast<size_t>(removed));
    }

    Result<std::vector<std::string>> list_domains(int64_t tenant_id) override {
        std::vector<std::string> result;
        for (const auto& d : domains_) {
            if (d.tenant_id == tenant_id) result.push_back(d.domain);
        }
        return Result<std::vector<std::string>>::ok(std::move(result));
    }

    // ---- Test helpers -----------------------------------------------------

    [[nodiscard]] size_t tenant_count() const { return tenants_.size(); }
    [[nodiscard]] bool has_tenant(const std::string& schema_name) const { return find_row(schema_name) != nullptr; }
    [[nodiscard]] const std::vector<Domain>& domains() const { return domains_; }
    [[nodiscard]] int updates() const { return updates_; }
    void fail_deletes(bool v) { fail_deletes_ = v; }

private:
    const Tenant* find_row(const std::string& schema_name) const {
        for (const auto& t : tenants_) {
            if (t.schema_name == schema_name) return &t;
        }
        return nullptr;
    }

    std::vector<Tenant> tenants_;
    std::vector<Domain> domains_;
    int64_t next_tenant_id_ = 1;
    int64_t next_domain_id_ = 1;
    std::string created_on_{"2024-01-15"};
    int updates_ = 0;
    bool fail_deletes_ = false;
};

} // namespace pgtenant::testing
