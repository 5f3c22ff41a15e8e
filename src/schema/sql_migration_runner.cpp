#include "schema/sql_migration_runner.hpp"
#include "core/utils.hpp"
#include "db/sqlstate.hpp"
#include "schema/schema_context.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <unordered_set>

namespace pgtenant {

SqlMigrationRunner::SqlMigrationRunner(Config config)
    : config_(std::move(config)) {}

Result<std::vector<std::string>> SqlMigrationRunner::migration_files() const {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::is_directory(config_.directory, ec)) {
        return Result<std::vector<std::string>>::error(ErrorCode::MIGRATION_FAILURE,
            std::format("Migration directory '{}' not found", config_.directory.string()));
    }

    std::vector<std::string> files;
    for (fs::directory_iterator it(config_.directory, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file() && it->path().extension() == ".sql") {
            files.push_back(it->path().filename().string());
        }
    }
    if (ec) {
        return Result<std::vector<std::string>>::error(ErrorCode::MIGRATION_FAILURE,
            std::format("Cannot read migration directory '{}': {}",
                config_.directory.string(), ec.message()));
    }

    std::sort(files.begin(), files.end());
    return Result<std::vector<std::string>>::ok(std::move(files));
}

Status SqlMigrationRunner::apply(SchemaContext& context, const std::string& schema_name,
                                 int verbosity) {
    auto files = migration_files();
    if (files.is_error()) {
        return Status::propagate(files);
    }

    // Unqualified names in migration files must land in the tenant schema
    if (auto switched = context.set_schema(schema_name); switched.is_error()) {
        return switched;
    }

    auto& conn = context.connection();
    const std::string table = std::format("{}.{}",
        SchemaDdl::quote_identifier(context.current_schema()),
        SchemaDdl::quote_identifier(config_.table));

    const auto created = conn.execute(std::format(
        "CREATE TABLE IF NOT EXISTS {} ("
        "name VARCHAR(255) PRIMARY KEY, "
        "applied_at TIMESTAMPTZ NOT NULL DEFAULT now())", table));
    if (!created.success) {
        return sqlstate::failure(created, std::format("Failed to create migration table in '{}'", schema_name));
    }

    const auto applied_rs = conn.execute(std::format("SELECT name FROM {}", table));
    if (!applied_rs.success) {
        return sqlstate::failure(applied_rs, std::format("Failed to read applied migrations in '{}'", schema_name));
    }
    std::unordered_set<std::string> applied;
    for (const auto& row : applied_rs.rows) {
        if (!row.empty()) applied.insert(row[0]);
    }

    size_t count = 0;
    for (const auto& file : files.value()) {
        if (applied.contains(file)) {
            if (verbosity >= 2) {
                utils::log::info(std::format("  [{}] {} already applied", schema_name, file));
            }
            continue;
        }

        std::ifstream in(config_.directory / file);
        if (!in.is_open()) {
            return Status::error(ErrorCode::MIGRATION_FAILURE,
                std::format("Cannot open migration '{}'", file));
        }
        const std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

        const auto begin = conn.execute("BEGIN");
        if (!begin.success) {
            return sqlstate::failure(begin, "Failed to start migration transaction");
        }

        auto result = conn.execute(body);
        if (result.success) {
            result = conn.execute_params(std::format("INSERT INTO {} (name) VALUES ($1)", table), {file});
        }
        if (!result.success) {
            const auto rollback = conn.execute("ROLLBACK");
            if (!rollback.success) {
                utils::log::error(std::format("ROLLBACK failed for migration '{}': {}",
                    file, utils::trim(rollback.error_message)));
            }
            return Status::error(ErrorCode::MIGRATION_FAILURE,
                std::format("Migration '{}' failed in schema '{}': {}",
                    file, schema_name, utils::trim(result.error_message)));
        }

        const auto commit = conn.execute("COMMIT");
        if (!commit.success) {
            return Status::error(ErrorCode::MIGRATION_FAILURE,
                std::format("Commit of migration '{}' failed in schema '{}': {}",
                    file, schema_name, utils::trim(commit.error_message)));
        }

        ++count;
        if (verbosity >= 1) {
            utils::log::info(std::format("  [{}] applied {}", schema_name, file));
        }
    }

    utils::log::debug(std::format("Schema '{}': {} migration(s) applied", schema_name, count));
    return Status::ok();
}

} // namespace pgtenant
