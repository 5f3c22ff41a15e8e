#pragma once

#include "core/error.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pgtenant {

enum class TableKind { TABLE, VIEW };

struct TableInfo {
    std::string name;
    TableKind kind = TableKind::TABLE;
};

/**
 * @brief Column referenced by one foreign key
 */
struct ForeignKeyTarget {
    std::string table;
    std::string column;

    bool operator==(const ForeignKeyTarget&) const = default;
};

struct ConstraintInfo {
    std::vector<std::string> columns;   // Ordered as declared
    bool primary_key = false;
    bool unique = false;
    std::optional<ForeignKeyTarget> foreign_key;
    bool check = false;
    bool index = false;
};

// Keyed by constraint or index name
using ConstraintMap = std::map<std::string, ConstraintInfo>;

/**
 * @brief Catalog discovery scoped to a connection's current schema
 *
 * Implementations never take a schema name: callers scope the connection
 * through SchemaContext first.
 */
class ISchemaIntrospector {
public:
    virtual ~ISchemaIntrospector() = default;

    /**
     * @brief Tables and views of the current schema, ignore list excluded, ordered by name
     */
    [[nodiscard]] virtual Result<std::vector<TableInfo>> list_tables() = 0;

    /**
     * @brief Constraints and indexes of one table in the current schema
     * @return Empty map for a table without constraints or indexes
     */
    [[nodiscard]] virtual Result<ConstraintMap> get_constraints(const std::string& table_name) = 0;
};

} // namespace pgtenant
