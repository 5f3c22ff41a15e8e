#pragma once

#include "schema/imigration_runner.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace pgtenant {

/**
 * @brief Runs plain .sql migration files inside a tenant schema
 *
 * Files in `directory` ending in .sql are applied in lexical filename order.
 * Each applied file is recorded in `<schema>.<table>` so reruns are no-ops.
 * Every file runs in its own transaction together with its bookkeeping row;
 * the first failure rolls back that file and stops.
 */
class SqlMigrationRunner : public IMigrationRunner {
public:
    struct Config {
        std::filesystem::path directory = "migrations";
        std::string table = "schema_migrations";
    };

    explicit SqlMigrationRunner(Config config);

    Status apply(SchemaContext& context, const std::string& schema_name, int verbosity) override;

    /**
     * @brief Migration file names in application order
     */
    [[nodiscard]] Result<std::vector<std::string>> migration_files() const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    Config config_;
};

} // namespace pgtenant
