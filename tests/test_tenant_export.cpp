#include <catch2/catch_test_macros.hpp>
#include "tenant/tenant_export.hpp"
#include "mocks/in_memory_tenant_store.hpp"
#include <sstream>

using namespace pgtenant;
using namespace pgtenant::testing;

namespace {

int64_t add_tenant(InMemoryTenantStore& store, const std::string& schema) {
    Tenant tenant;
    tenant.schema_name = schema;
    tenant.name = schema;
    auto stored = store.insert_tenant(tenant);
    REQUIRE(stored.is_ok());
    return *stored.value().id;
}

} // anonymous namespace

TEST_CASE("TenantExport: collect keeps tenant and domain order", "[export]") {
    InMemoryTenantStore store;
    const auto pub = add_tenant(store, "public");
    const auto acme = add_tenant(store, "acme");
    REQUIRE(store.add_domain(acme, "acme.com").is_ok());
    REQUIRE(store.add_domain(acme, "www.acme.com").is_ok());
    (void)pub;

    auto rows = collect_tenant_listing(store);
    REQUIRE(rows.is_ok());
    REQUIRE(rows.value().size() == 2);
    CHECK(rows.value()[0].schema_name == "public");
    CHECK(rows.value()[0].domains.empty());
    CHECK(rows.value()[1].schema_name == "acme");
    CHECK(rows.value()[1].domains == std::vector<std::string>{"acme.com", "www.acme.com"});
    CHECK(rows.value()[1].joined_domains() == "acme.com, www.acme.com");
}

TEST_CASE("TenantExport: TSV uses tabs and CRLF", "[export]") {
    std::vector<TenantListingRow> rows{
        {"public", {}},
        {"acme", {"acme.com", "www.acme.com"}},
    };

    std::ostringstream out;
    write_tenant_listing_tsv(out, rows);
    CHECK(out.str() == "public\t\r\nacme\tacme.com, www.acme.com\r\n");
}

TEST_CASE("TenantExport: TSV quotes fields that need it", "[export]") {
    std::ostringstream out;

    SECTION("embedded quote") {
        write_tenant_listing_tsv(out, {{"acme", {"say\"hi\".com"}}});
        CHECK(out.str() == "acme\t\"say\"\"hi\"\".com\"\r\n");
    }

    SECTION("embedded tab") {
        write_tenant_listing_tsv(out, {{"acme", {"a\tb"}}});
        CHECK(out.str() == "acme\t\"a\tb\"\r\n");
    }

    SECTION("embedded newline") {
        write_tenant_listing_tsv(out, {{"acme", {"a\nb"}}});
        CHECK(out.str() == "acme\t\"a\nb\"\r\n");
    }
}

TEST_CASE("TenantExport: empty listing writes nothing", "[export]") {
    std::ostringstream out;
    write_tenant_listing_tsv(out, {});
    CHECK(out.str().empty());
    CHECK(tenant_listing_to_json({}).dump() == "[]");
}

TEST_CASE("TenantExport: JSON keeps domains as an array", "[export]") {
    std::vector<TenantListingRow> rows{
        {"public", {}},
        {"acme", {"acme.com", "www.acme.com"}},
    };

    const auto json = tenant_listing_to_json(rows);
    REQUIRE(json.is_array());
    REQUIRE(json.size() == 2);
    CHECK(json[0]["schema_name"] == "public");
    CHECK(json[0]["domains"].is_array());
    CHECK(json[0]["domains"].empty());
    CHECK(json[1]["domains"].size() == 2);
    CHECK(json[1]["domains"][1] == "www.acme.com");
}
