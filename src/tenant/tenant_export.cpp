#include "tenant/tenant_export.hpp"
#include "core/utils.hpp"
#include "tenant/itenant_store.hpp"

namespace pgtenant {

namespace {

constexpr char kFieldSeparator = '\t';
constexpr std::string_view kLineEnd = "\r\n";

void write_field(std::ostream& out, const std::string& field) {
    if (field.find_first_of("\t\"\r\n") == std::string::npos) {
        out << field;
        return;
    }
    out << '"';
    for (const char c : field) {
        if (c == '"') out << '"';
        out << c;
    }
    out << '"';
}

} // anonymous namespace

std::string TenantListingRow::joined_domains() const {
    return utils::join(domains, kDomainSeparator);
}

Result<std::vector<TenantListingRow>> collect_tenant_listing(ITenantStore& store) {
    auto tenants = store.list_tenants();
    if (tenants.is_error()) {
        return Result<std::vector<TenantListingRow>>::propagate(tenants);
    }

    std::vector<TenantListingRow> rows;
    rows.reserve(tenants.value().size());
    for (const auto& tenant : tenants.value()) {
        auto domains = store.list_domains(*tenant.id);
        if (domains.is_error()) {
            return Result<std::vector<TenantListingRow>>::propagate(domains);
        }
        rows.push_back({tenant.schema_name, std::move(domains.value())});
    }
    return Result<std::vector<TenantListingRow>>::ok(std::move(rows));
}

void write_tenant_listing_tsv(std::ostream& out, const std::vector<TenantListingRow>& rows) {
    for (const auto& row : rows) {
        write_field(out, row.schema_name);
        out << kFieldSeparator;
        write_field(out, row.joined_domains());
        out << kLineEnd;
    }
}

nlohmann::json tenant_listing_to_json(const std::vector<TenantListingRow>& rows) {
    auto result = nlohmann::json::array();
    for (const auto& row : rows) {
        result.push_back({{"schema_name", row.schema_name}, {"domains", row.domains}});
    }
    return result;
}

} // namespace pgtenant
