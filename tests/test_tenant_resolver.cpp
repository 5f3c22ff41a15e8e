#include <catch2/catch_test_macros.hpp>
#include "tenant/tenant_resolver.hpp"
#include "mocks/in_memory_tenant_store.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace pgtenant;
using namespace pgtenant::testing;

namespace {

std::shared_ptr<const Tenant> make(int64_t id, const std::string& schema) {
    auto tenant = std::make_shared<Tenant>();
    tenant->id = id;
    tenant->schema_name = schema;
    tenant->name = schema;
    return tenant;
}

} // anonymous namespace

TEST_CASE("TenantResolver: normalize_host", "[resolver]") {
    CHECK(TenantResolver::normalize_host("Shop.Acme.COM") == "shop.acme.com");
    CHECK(TenantResolver::normalize_host("  shop.acme.com  ") == "shop.acme.com");
    CHECK(TenantResolver::normalize_host("shop.acme.com:8443") == "shop.acme.com");
    CHECK(TenantResolver::normalize_host("shop.acme.com.") == "shop.acme.com");
    CHECK(TenantResolver::normalize_host("[::1]:8080") == "[::1]");
    CHECK(TenantResolver::normalize_host("::1") == "::1");
    CHECK(TenantResolver::normalize_host("") == "");
}

TEST_CASE("TenantResolver: empty table resolves to nothing", "[resolver]") {
    TenantResolver resolver;
    CHECK(resolver.resolve("acme.com") == nullptr);
    CHECK(resolver.domain_count() == 0);
}

TEST_CASE("TenantResolver: registered domains win over the public tenant", "[resolver]") {
    TenantResolver resolver;
    const auto pub = make(1, "public");
    const auto acme = make(2, "acme");
    resolver.set_public_tenant(pub);
    resolver.register_domain("Acme.com", acme);

    CHECK(resolver.resolve("acme.com") == acme);
    CHECK(resolver.resolve("ACME.COM:443") == acme);
    CHECK(resolver.resolve("globex.com") == pub);

    SECTION("removing a domain falls back to public") {
        CHECK(resolver.remove_domain("ACME.com"));
        CHECK_FALSE(resolver.remove_domain("acme.com"));
        CHECK(resolver.resolve("acme.com") == pub);
    }

    SECTION("re-registering moves the domain") {
        const auto globex = make(3, "globex");
        resolver.register_domain("acme.com", globex);
        CHECK(resolver.resolve("acme.com") == globex);
        CHECK(resolver.domain_count() == 1);
    }
}

TEST_CASE("TenantResolver: snapshots survive a reload", "[resolver]") {
    TenantResolver resolver;
    const auto acme = make(2, "acme");
    resolver.register_domain("acme.com", acme);

    const auto before = resolver.resolve("acme.com");
    resolver.reload({}, nullptr);

    CHECK(before == acme);
    CHECK(before->schema_name == "acme");
    CHECK(resolver.resolve("acme.com") == nullptr);
}

TEST_CASE("TenantResolver: reload_from reads every tenant and domain", "[resolver]") {
    InMemoryTenantStore store;

    Tenant pub;
    pub.schema_name = "public";
    pub.name = "Public";
    auto stored_pub = store.insert_tenant(pub);
    REQUIRE(stored_pub.is_ok());

    Tenant acme;
    acme.schema_name = "acme";
    acme.name = "Acme";
    auto stored_acme = store.insert_tenant(acme);
    REQUIRE(stored_acme.is_ok());

    REQUIRE(store.add_domain(*stored_acme.value().id, "acme.com").is_ok());
    REQUIRE(store.add_domain(*stored_acme.value().id, "www.acme.com").is_ok());
    REQUIRE(store.add_domain(*stored_pub.value().id, "example.com").is_ok());

    TenantResolver resolver;
    REQUIRE(resolver.reload_from(store, "public").is_ok());

    CHECK(resolver.domain_count() == 3);
    REQUIRE(resolver.resolve("www.acme.com") != nullptr);
    CHECK(resolver.resolve("www.acme.com")->schema_name == "acme");
    CHECK(resolver.resolve("www.acme.com") == resolver.resolve("acme.com"));
    REQUIRE(resolver.resolve("unknown.org") != nullptr);
    CHECK(resolver.resolve("unknown.org")->schema_name == "public");
}

TEST_CASE("TenantResolver: concurrent readers see whole tables", "[resolver]") {
    TenantResolver resolver;
    const auto acme = make(2, "acme");
    const auto globex = make(3, "globex");
    resolver.register_domain("shop.example.com", acme);

    std::atomic<bool> stop{false};
    std::atomic<int> misses{0};

    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            while (!stop.load()) {
                const auto tenant = resolver.resolve("shop.example.com");
                if (tenant != acme && tenant != globex) misses.fetch_add(1);
            }
        });
    }

    for (int i = 0; i < 200; ++i) {
        resolver.reload(TenantResolver::DomainMap{{"shop.example.com", (i % 2) ? acme : globex}}, nullptr);
    }
    stop.store(true);
    for (auto& t : readers) t.join();

    CHECK(misses.load() == 0);
}
