#include "db/postgresql/pg_schema_introspector.hpp"
#include "core/utils.hpp"
#include "db/sqlstate.hpp"
#include "schema/schema_context.hpp"

#include <format>

namespace pgtenant {

namespace {

constexpr std::string_view kPrimaryKey = "PRIMARY KEY";
constexpr std::string_view kUnique     = "UNIQUE";
constexpr std::string_view kForeignKey = "FOREIGN KEY";

bool pg_bool(const std::string& value) {
    return value == "t";
}

// One row per key position, so repeated columns such as an index on (a, a)
// are kept. Expression positions come back with no name and are skipped.
void append_column(ConstraintInfo& info, const std::string& column) {
    if (!column.empty()) {
        info.columns.push_back(column);
    }
}

} // anonymous namespace

PgSchemaIntrospector::PgSchemaIntrospector(SchemaContext& context, std::vector<std::string> ignored_tables)
    : context_(context),
      ignored_tables_(std::make_move_iterator(ignored_tables.begin()),
                      std::make_move_iterator(ignored_tables.end())) {}

// ============================================================================
// Tables
// ============================================================================

Result<std::vector<TableInfo>> PgSchemaIntrospector::list_tables() {
    const auto rs = context_.connection().execute_params(kTableListQuery, {context_.current_schema()});
    if (!rs.success) {
        return sqlstate::failure<std::vector<TableInfo>>(rs,
            std::format("Failed to list tables of '{}'", context_.current_schema()));
    }

    std::vector<TableInfo> tables;
    tables.reserve(rs.rows.size());
    for (const auto& row : rs.rows) {
        if (row.size() < 2 || ignored_tables_.contains(row[0])) {
            continue;
        }
        TableInfo info;
        info.name = row[0];
        info.kind = (row[1] == "v" || row[1] == "m") ? TableKind::VIEW : TableKind::TABLE;
        tables.push_back(std::move(info));
    }
    return Result<std::vector<TableInfo>>::ok(std::move(tables));
}

// ============================================================================
// Constraints
// ============================================================================

Result<ConstraintMap> PgSchemaIntrospector::get_constraints(const std::string& table_name) {
    ConstraintMap constraints;

    if (auto status = fetch_key_constraints(table_name, constraints); status.is_error()) {
        return Result<ConstraintMap>::propagate(status);
    }
    if (auto status = fetch_check_constraints(table_name, constraints); status.is_error()) {
        return Result<ConstraintMap>::propagate(status);
    }
    if (auto status = fetch_indexes(table_name, constraints); status.is_error()) {
        return Result<ConstraintMap>::propagate(status);
    }

    utils::log::debug(std::format("{}.{}: {} constraint(s)",
        context_.current_schema(), table_name, constraints.size()));
    return Result<ConstraintMap>::ok(std::move(constraints));
}

void PgSchemaIntrospector::merge(ConstraintMap& into, ConstraintMap&& from) {
    for (auto& [name, incoming] : from) {
        auto [it, inserted] = into.try_emplace(name, std::move(incoming));
        if (inserted) continue;

        auto& existing = it->second;
        if (existing.columns.empty()) {
            existing.columns = std::move(incoming.columns);
        }
        existing.primary_key = existing.primary_key || incoming.primary_key;
        existing.unique = existing.unique || incoming.unique;
        existing.check = existing.check || incoming.check;
        existing.index = existing.index || incoming.index;
        if (!existing.foreign_key) {
            existing.foreign_key = std::move(incoming.foreign_key);
        }
    }
}

Status PgSchemaIntrospector::fetch_key_constraints(const std::string& table_name, ConstraintMap& out) {
    // Columns: constraint, column, type, referenced table, referenced column
    const auto rs = context_.connection().execute_params(kKeyConstraintQuery,
        {context_.current_schema(), table_name});
    if (!rs.success) {
        return sqlstate::failure(rs, std::format("Failed to read key constraints of '{}'", table_name));
    }

    ConstraintMap found;
    for (const auto& row : rs.rows) {
        if (row.size() < 5) continue;
        auto& info = found[row[0]];
        append_column(info, row[1]);

        const std::string_view type = row[2];
        if (type == kPrimaryKey) {
            info.primary_key = true;
            info.unique = true;
        } else if (type == kUnique) {
            info.unique = true;
        } else if (type == kForeignKey && !info.foreign_key && !row[3].empty()) {
            info.foreign_key = ForeignKeyTarget{row[3], row[4]};
        }
    }
    merge(out, std::move(found));
    return Status::ok();
}

Status PgSchemaIntrospector::fetch_check_constraints(const std::string& table_name, ConstraintMap& out) {
    const auto rs = context_.connection().execute_params(kCheckConstraintQuery,
        {context_.current_schema(), table_name});
    if (!rs.success) {
        return sqlstate::failure(rs, std::format("Failed to read check constraints of '{}'", table_name));
    }

    ConstraintMap found;
    for (const auto& row : rs.rows) {
        if (row.size() < 2) continue;
        auto& info = found[row[0]];
        info.check = true;
        append_column(info, row[1]);
    }
    merge(out, std::move(found));
    return Status::ok();
}

Status PgSchemaIntrospector::fetch_indexes(const std::string& table_name, ConstraintMap& out) {
    const auto rs = context_.connection().execute_params(kIndexQuery,
        {context_.current_schema(), table_name});
    if (!rs.success) {
        return sqlstate::failure(rs, std::format("Failed to read indexes of '{}'", table_name));
    }

    ConstraintMap found;
    for (const auto& row : rs.rows) {
        if (row.size() < 4) continue;
        auto& info = found[row[0]];
        info.index = true;
        info.unique = info.unique || pg_bool(row[2]);
        info.primary_key = info.primary_key || pg_bool(row[3]);
        append_column(info, row[1]);
    }
    merge(out, std::move(found));
    return Status::ok();
}

} // namespace pgtenant
