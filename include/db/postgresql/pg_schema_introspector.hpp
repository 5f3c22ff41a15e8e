#pragma once

#include "db/ischema_introspector.hpp"
#include <string>
#include <unordered_set>
#include <vector>

namespace pgtenant {

class SchemaContext;

/**
 * @brief PostgreSQL introspector over information_schema and pg_catalog
 *
 * get_constraints() merges three fetches by name: key-column constraints
 * (PRIMARY KEY, UNIQUE, FOREIGN KEY), CHECK constraints and indexes. An
 * index backing a constraint shares its name and lands on the same entry:
 * boolean flags are OR-ed and the first non-empty column list is kept.
 * Expression columns of an index have no name and are skipped.
 */
class PgSchemaIntrospector : public ISchemaIntrospector {
public:
    /**
     * @param context Context of the connection to inspect (not owned)
     * @param ignored_tables Table names never reported by list_tables()
     */
    explicit PgSchemaIntrospector(SchemaContext& context, std::vector<std::string> ignored_tables = {});

    [[nodiscard]] Result<std::vector<TableInfo>> list_tables() override;
    [[nodiscard]] Result<ConstraintMap> get_constraints(const std::string& table_name) override;

    static constexpr const char* kTableListQuery =
        "SELECT c.relname, c.relkind "
        "FROM pg_catalog.pg_class c "
        "JOIN pg_catalog.pg_namespace n ON n.oid = c.relnamespace "
        "WHERE c.relkind IN ('r', 'p', 'f', 'v', 'm') "
        "  AND n.nspname = $1 "
        "  AND pg_catalog.pg_table_is_visible(c.oid) "
        "ORDER BY c.relname";

    static constexpr const char* kKeyConstraintQuery =
        "SELECT kc.constraint_name, kc.column_name, tc.constraint_type, "
        "       fk.table_name, fk.column_name "
        "FROM information_schema.key_column_usage kc "
        "JOIN information_schema.table_constraints tc "
        "  ON tc.constraint_schema = kc.constraint_schema "
        " AND tc.constraint_name = kc.constraint_name "
        " AND tc.table_name = kc.table_name "
        "LEFT JOIN information_schema.referential_constraints rc "
        "  ON rc.constraint_schema = kc.constraint_schema "
        " AND rc.constraint_name = kc.constraint_name "
        "LEFT JOIN information_schema.key_column_usage fk "
        "  ON fk.constraint_schema = rc.unique_constraint_schema "
        " AND fk.constraint_name = rc.unique_constraint_name "
        " AND fk.ordinal_position = kc.position_in_unique_constraint "
        "WHERE kc.table_schema = $1 AND kc.table_name = $2 "
        "ORDER BY kc.constraint_name, kc.ordinal_position";

    static constexpr const char* kCheckConstraintQuery =
        "SELECT con.conname, a.attname "
        "FROM pg_catalog.pg_constraint con "
        "JOIN pg_catalog.pg_class c ON c.oid = con.conrelid "
        "JOIN pg_catalog.pg_namespace n ON n.oid = c.relnamespace "
        "LEFT JOIN pg_catalog.pg_attribute a "
        "  ON a.attrelid = c.oid AND a.attnum = ANY(con.conkey) "
        "WHERE con.contype = 'c' AND n.nspname = $1 AND c.relname = $2 "
        "ORDER BY con.conname, array_position(con.conkey, a.attnum)";

    static constexpr const char* kIndexQuery =
        "SELECT ic.relname, a.attname, i.indisunique, i.indisprimary "
        "FROM pg_catalog.pg_index i "
        "JOIN pg_catalog.pg_class c ON c.oid = i.indrelid "
        "JOIN pg_catalog.pg_namespace n ON n.oid = c.relnamespace "
        "JOIN pg_catalog.pg_class ic ON ic.oid = i.indexrelid "
        "CROSS JOIN LATERAL unnest(i.indkey::int2[]) WITH ORDINALITY AS k(attnum, ord) "
        "LEFT JOIN pg_catalog.pg_attribute a "
        "  ON a.attrelid = c.oid AND a.attnum = k.attnum "
        "WHERE n.nspname = $1 AND c.relname = $2 "
        "ORDER BY ic.relname, k.ord";

private:
    Status fetch_key_constraints(const std::string& table_name, ConstraintMap& out);
    Status fetch_check_constraints(const std::string& table_name, ConstraintMap& out);
    Status fetch_indexes(const std::string& table_name, ConstraintMap& out);

    static void merge(ConstraintMap& into, ConstraintMap&& from);

    SchemaContext& context_;
    std::unordered_set<std::string> ignored_tables_;
};

} // namespace pgtenant
