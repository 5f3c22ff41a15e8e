#include <catch2/catch_test_macros.hpp>
#include "tenant/pg_tenant_store.hpp"
#include "mocks/fake_pg_connection.hpp"

using namespace pgtenant;
using namespace pgtenant::testing;

namespace {

constexpr const char* kTenants = "\"public\".\"tenants\"";
constexpr const char* kDomains = "\"public\".\"domains\"";

DbResultSet affected(uint64_t n) {
    auto rs = FakePgConnection::ok();
    rs.affected_rows = n;
    return rs;
}

Tenant stored_tenant(int64_t id, const std::string& schema) {
    Tenant tenant;
    tenant.id = id;
    tenant.schema_name = schema;
    tenant.name = schema + " Inc.";
    return tenant;
}

} // anonymous namespace

TEST_CASE("PgTenantStore: ensure_tables creates both tables", "[tenant_store]") {
    FakePgConnection conn;
    PgTenantStore store(conn);

    REQUIRE(store.ensure_tables().is_ok());
    REQUIRE(conn.statements().size() == 2);
    CHECK(conn.statements()[0].sql.starts_with(std::string("CREATE TABLE IF NOT EXISTS ") + kTenants));
    CHECK(conn.statements()[1].sql.starts_with(std::string("CREATE TABLE IF NOT EXISTS ") + kDomains));
    CHECK(conn.statements()[1].sql.find("ON DELETE CASCADE") != std::string::npos);
}

TEST_CASE("PgTenantStore: table names are configurable and quoted", "[tenant_store]") {
    FakePgConnection conn;
    PgTenantStore store(conn, TenantTables{"shared", "Customers", "hosts"});

    REQUIRE(store.ensure_tables().is_ok());
    CHECK(conn.count_containing("\"shared\".\"Customers\"") == 2);
    CHECK(conn.count_containing("\"shared\".\"hosts\"") == 1);
}

TEST_CASE("PgTenantStore: ensure_tables reports failures", "[tenant_store]") {
    FakePgConnection conn;
    conn.fail_on(kDomains, "42501", "ERROR:  permission denied for schema public\n");
    PgTenantStore store(conn);

    auto status = store.ensure_tables();
    REQUIRE(status.is_error());
    CHECK(status.error_code() == ErrorCode::DATABASE_ERROR);
    CHECK(status.error_message().find("permission denied") != std::string::npos);
}

TEST_CASE("PgTenantStore: insert binds values and reads back id", "[tenant_store]") {
    FakePgConnection conn;
    conn.respond("INSERT INTO", FakePgConnection::rows({{"7", "2024-01-15"}}));
    PgTenantStore store(conn);

    Tenant tenant;
    tenant.schema_name = "acme";
    tenant.name = "Robert'); DROP TABLE tenants;--";

    auto stored = store.insert_tenant(tenant);
    REQUIRE(stored.is_ok());
    CHECK(stored.value().id == 7);
    CHECK(stored.value().created_on == "2024-01-15");
    CHECK(stored.value().name == tenant.name);

    const auto* insert = conn.last_containing("INSERT INTO");
    REQUIRE(insert != nullptr);
    CHECK(insert->params == std::vector<std::string>{"acme", tenant.name});
    CHECK(insert->sql.find("DROP TABLE") == std::string::npos);
}

TEST_CASE("PgTenantStore: duplicate schema is an integrity violation", "[tenant_store]") {
    FakePgConnection conn;
    conn.fail_on("INSERT INTO", "23505",
        "ERROR:  duplicate key value violates unique constraint \"tenants_schema_name_key\"\n");
    PgTenantStore store(conn);

    Tenant tenant;
    tenant.schema_name = "acme";
    tenant.name = "Acme";

    auto stored = store.insert_tenant(tenant);
    REQUIRE(stored.is_error());
    CHECK(stored.error_code() == ErrorCode::INTEGRITY_VIOLATION);
}

TEST_CASE("PgTenantStore: insert without RETURNING row fails", "[tenant_store]") {
    FakePgConnection conn;
    PgTenantStore store(conn);

    Tenant tenant;
    tenant.schema_name = "acme";
    auto stored = store.insert_tenant(tenant);
    REQUIRE(stored.is_error());
    CHECK(stored.error_code() == ErrorCode::DATABASE_ERROR);
}

TEST_CASE("PgTenantStore: update", "[tenant_store]") {
    FakePgConnection conn;
    PgTenantStore store(conn);

    SECTION("unsaved tenant is rejected without a statement") {
        Tenant tenant;
        tenant.schema_name = "acme";
        auto status = store.update_tenant(tenant);
        REQUIRE(status.is_error());
        CHECK(status.error_code() == ErrorCode::TENANT_NOT_SAVED);
        CHECK(conn.statements().empty());
    }

    SECTION("missing row is NOT_FOUND") {
        auto status = store.update_tenant(stored_tenant(3, "acme"));
        REQUIRE(status.is_error());
        CHECK(status.error_code() == ErrorCode::NOT_FOUND);
    }

    SECTION("existing row") {
        conn.respond("UPDATE", affected(1));
        REQUIRE(store.update_tenant(stored_tenant(3, "acme")).is_ok());
        const auto* update = conn.last_containing("UPDATE");
        REQUIRE(update != nullptr);
        CHECK(update->params == std::vector<std::string>{"acme", "acme Inc.", "3"});
    }
}

TEST_CASE("PgTenantStore: delete removes domains and row in one transaction", "[tenant_store]") {
    FakePgConnection conn;
    conn.respond(std::string("DELETE FROM ") + kTenants, affected(1));
    PgTenantStore store(conn);

    REQUIRE(store.delete_tenant(4).is_ok());
    CHECK(conn.begins() == 1);
    CHECK(conn.commits() == 1);
    CHECK(conn.rollbacks() == 0);

    const auto& statements = conn.statements();
    REQUIRE(statements.size() == 4);
    CHECK(statements[1].sql.find(kDomains) != std::string::npos);
    CHECK(statements[1].params == std::vector<std::string>{"4"});
    CHECK(statements[2].sql.find(kTenants) != std::string::npos);
}

TEST_CASE("PgTenantStore: delete of a missing tenant", "[tenant_store]") {
    FakePgConnection conn;
    PgTenantStore store(conn);

    auto status = store.delete_tenant(99);
    REQUIRE(status.is_error());
    CHECK(status.error_code() == ErrorCode::NOT_FOUND);
}

TEST_CASE("PgTenantStore: failed delete rolls back", "[tenant_store]") {
    FakePgConnection conn;
    conn.fail_on(std::string("DELETE FROM ") + kTenants, "40P01", "ERROR:  deadlock detected\n");
    PgTenantStore store(conn);

    auto status = store.delete_tenant(4);
    REQUIRE(status.is_error());
    CHECK(status.error_code() == ErrorCode::DATABASE_ERROR);
    CHECK(conn.rollbacks() == 1);
    CHECK(conn.commits() == 0);
}

TEST_CASE("PgTenantStore: lookups", "[tenant_store]") {
    FakePgConnection conn;
    PgTenantStore store(conn);

    SECTION("no row is NOT_FOUND") {
        auto found = store.find_tenant_by_schema("acme");
        REQUIRE(found.is_error());
        CHECK(found.error_code() == ErrorCode::NOT_FOUND);
    }

    SECTION("row is mapped to a tenant") {
        conn.respond("WHERE schema_name = $1",
            FakePgConnection::rows({{"5", "acme", "Acme Inc.", "2024-01-15"}}));
        auto found = store.find_tenant_by_schema("acme");
        REQUIRE(found.is_ok());
        CHECK(found.value().id == 5);
        CHECK(found.value().schema_name == "acme");
        CHECK(found.value().name == "Acme Inc.");
        CHECK(found.value().created_on == "2024-01-15");
    }

    SECTION("domain lookup is case-insensitive") {
        conn.respond("d.domain = $1",
            FakePgConnection::rows({{"5", "acme", "Acme Inc.", "2024-01-15"}}));
        auto found = store.find_tenant_by_domain("  WWW.Acme.COM ");
        REQUIRE(found.is_ok());
        CHECK(conn.last_containing("d.domain = $1")->params == std::vector<std::string>{"www.acme.com"});
    }

    SECTION("malformed id is a database error") {
        conn.respond("WHERE id = $1", FakePgConnection::rows({{"five", "acme", "Acme", "2024-01-15"}}));
        auto found = store.find_tenant(5);
        REQUIRE(found.is_error());
        CHECK(found.error_code() == ErrorCode::DATABASE_ERROR);
    }
}

TEST_CASE("PgTenantStore: list_tenants keeps row order", "[tenant_store]") {
    FakePgConnection conn;
    conn.respond("ORDER BY id", FakePgConnection::rows({
        {"1", "public", "Public", "2024-01-01"},
        {"2", "acme", "Acme", "2024-01-15"},
    }));
    PgTenantStore store(conn);

    auto tenants = store.list_tenants();
    REQUIRE(tenants.is_ok());
    REQUIRE(tenants.value().size() == 2);
    CHECK(tenants.value()[0].schema_name == "public");
    CHECK(tenants.value()[1].id == 2);
}

TEST_CASE("PgTenantStore: add_domain", "[tenant_store]") {
    FakePgConnection conn;
    PgTenantStore store(conn);

    SECTION("new domain is inserted lowercase") {
        conn.respond("RETURNING id", FakePgConnection::rows({{"11"}}));
        auto added = store.add_domain(5, "Shop.Acme.COM");
        REQUIRE(added.is_ok());
        CHECK(added.value().id == 11);
        CHECK(added.value().domain == "shop.acme.com");
        CHECK(added.value().tenant_id == 5);
        CHECK(conn.last_containing("RETURNING id")->params ==
              std::vector<std::string>{"shop.acme.com", "5"});
    }

    SECTION("domain already owned by the tenant is returned") {
        conn.respond("SELECT id, tenant_id", FakePgConnection::rows({{"11", "5"}}));
        auto added = store.add_domain(5, "shop.acme.com");
        REQUIRE(added.is_ok());
        CHECK(added.value().id == 11);
        CHECK(conn.count_containing("INSERT INTO") == 0);
    }

    SECTION("domain owned by another tenant is rejected") {
        conn.respond("SELECT id, tenant_id", FakePgConnection::rows({{"11", "6"}}));
        auto added = store.add_domain(5, "shop.acme.com");
        REQUIRE(added.is_error());
        CHECK(added.error_code() == ErrorCode::INTEGRITY_VIOLATION);
        CHECK(conn.count_containing("INSERT INTO") == 0);
    }
}

TEST_CASE("PgTenantStore: remove_domain reports affected rows", "[tenant_store]") {
    FakePgConnection conn;
    PgTenantStore store(conn);

    auto none = store.remove_domain(5, "shop.acme.com");
    REQUIRE(none.is_ok());
    CHECK(none.value() == 0);

    conn.respond("AND domain = $2", affected(1));
    auto removed = store.remove_domain(5, "SHOP.acme.com");
    REQUIRE(removed.is_ok());
    CHECK(removed.value() == 1);
    CHECK(conn.last_containing("AND domain = $2")->params ==
          std::vector<std::string>{"5", "shop.acme.com"});
}

TEST_CASE("PgTenantStore: list_domains", "[tenant_store]") {
    FakePgConnection conn;
    conn.respond("SELECT domain FROM", FakePgConnection::rows({{"acme.com"}, {"www.acme.com"}}));
    PgTenantStore store(conn);

    auto domains = store.list_domains(5);
    REQUIRE(domains.is_ok());
    CHECK(domains.value() == std::vector<std::string>{"acme.com", "www.acme.com"});
}
