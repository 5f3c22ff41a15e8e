#include <catch2/catch_test_macros.hpp>
#include "schema/schema_ddl.hpp"

using namespace pgtenant;

TEST_CASE("SchemaDdl: CREATE and DROP quote the normalized name", "[ddl]") {
    SchemaDdl ddl;

    auto create = ddl.create_schema("Acme");
    REQUIRE(create.is_ok());
    CHECK(create.value() == "CREATE SCHEMA \"acme\"");

    auto drop = ddl.drop_schema("acme");
    REQUIRE(drop.is_ok());
    CHECK(drop.value() == "DROP SCHEMA \"acme\" CASCADE");
}

TEST_CASE("SchemaDdl: invalid names never produce SQL", "[ddl]") {
    SchemaDdl ddl;

    for (const char* bad : {"", "a b", "x\"; DROP SCHEMA public CASCADE; --", "pg_temp", "public"}) {
        auto create = ddl.create_schema(bad);
        REQUIRE(create.is_error());
        CHECK(create.error_code() == ErrorCode::INVALID_SCHEMA_NAME);
        CHECK(ddl.drop_schema(bad).is_error());
    }
}

TEST_CASE("SchemaDdl: search path puts the tenant first and public second", "[ddl]") {
    SchemaDdl ddl;

    auto tenant = ddl.search_path("acme");
    REQUIRE(tenant.is_ok());
    CHECK(tenant.value() == "SET search_path = \"acme\", \"public\"");

    auto pub = ddl.search_path("public");
    REQUIRE(pub.is_ok());
    CHECK(pub.value() == "SET search_path = \"public\"");

    CHECK(ddl.search_path("no way").error_code() == ErrorCode::INVALID_SCHEMA_NAME);
}

TEST_CASE("SchemaDdl: custom public schema", "[ddl]") {
    SchemaDdl ddl(SchemaNameValidator("shared"));

    CHECK(ddl.is_public("SHARED"));
    CHECK(ddl.search_path("shared").value() == "SET search_path = \"shared\"");
    CHECK(ddl.search_path("acme").value() == "SET search_path = \"acme\", \"shared\"");
}

TEST_CASE("SchemaDdl: quote_identifier doubles embedded quotes", "[ddl]") {
    CHECK(SchemaDdl::quote_identifier("plain") == "\"plain\"");
    CHECK(SchemaDdl::quote_identifier("a\"b") == "\"a\"\"b\"");
}
