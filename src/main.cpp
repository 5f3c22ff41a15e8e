#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "db/generic_connection_pool.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_schema_introspector.hpp"
#include "schema/schema_lifecycle.hpp"
#include "schema/sql_migration_runner.hpp"
#include "tenant/pg_tenant_store.hpp"
#include "tenant/tenant_export.hpp"
#include "tenant/tenant_resolver.hpp"
#include "tenant/tenant_service.hpp"

#include <algorithm>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace pgtenant;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

constexpr const char* kUsage =
    "Usage: pgtenant [--config FILE] [-v LEVEL] <command> [args]\n"
    "\n"
    "Commands:\n"
    "  init                                  Create tenant tables and the public tenant\n"
    "  list-tenants [--json]                 Print schema name and domains of every tenant\n"
    "  create-tenant SCHEMA NAME [DOMAIN...] Create a tenant, its schema and domains\n"
    "  delete-tenant SCHEMA [--drop]         Delete a tenant, optionally dropping its schema\n"
    "  add-domain SCHEMA DOMAIN              Route a domain to a tenant\n"
    "  remove-domain SCHEMA DOMAIN           Stop routing a domain to a tenant\n"
    "  migrate [SCHEMA]                      Apply pending migrations (all tenants by default)\n"
    "  tables SCHEMA                         List tables and views of a schema\n"
    "  constraints SCHEMA TABLE              List constraints and indexes of a table\n"
    "  resolve HOST                          Print the schema serving a request host\n";

struct CommandLine {
    std::string config_file = "config/pgtenant.toml";
    int verbosity = 1;
    std::string command;
    std::vector<std::string> args;
};

std::optional<CommandLine> parse_command_line(int argc, char* argv[]) {
    CommandLine cl;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (cl.command.empty() && (arg == "--config" || arg == "-c") && i + 1 < argc) {
            cl.config_file = argv[++i];
        } else if (cl.command.empty() && arg == "-v" && i + 1 < argc) {
            const auto level = utils::try_parse_int<int>(argv[++i]);
            if (!level) return std::nullopt;
            cl.verbosity = *level;
        } else if (cl.command.empty()) {
            cl.command = arg;
        } else {
            cl.args.push_back(arg);
        }
    }
    if (cl.command.empty()) return std::nullopt;
    return cl;
}

bool has_flag(const std::vector<std::string>& args, std::string_view flag) {
    return std::find(args.begin(), args.end(), flag) != args.end();
}

std::vector<std::string> positional(const std::vector<std::string>& args) {
    std::vector<std::string> result;
    for (const auto& arg : args) {
        if (!arg.starts_with("--")) result.push_back(arg);
    }
    return result;
}

int report(const Status& status) {
    if (status.is_ok()) return kExitOk;
    utils::log::error(std::format("[{}] {}", error_code_name(status.error_code()), status.error_message()));
    return kExitError;
}

template<typename T>
int report(const Result<T>& result) {
    if (result.is_ok()) return kExitOk;
    return report(Status::propagate(result));
}

std::string constraint_flags(const ConstraintInfo& info) {
    std::vector<std::string> flags;
    if (info.primary_key) flags.emplace_back("primary_key");
    if (info.unique) flags.emplace_back("unique");
    if (info.check) flags.emplace_back("check");
    if (info.index) flags.emplace_back("index");
    if (info.foreign_key) {
        flags.push_back(std::format("foreign_key->{}.{}", info.foreign_key->table, info.foreign_key->column));
    }
    return utils::join(flags, ",");
}

// ============================================================================
// Commands
// ============================================================================

class Commands {
public:
    Commands(const AppConfig& config, PooledConnection& conn, int verbosity)
        : config_(config),
          verbosity_(verbosity),
          store_(*conn.get(), TenantTables{config.tenancy.public_schema_name,
                                           config.tenancy.tenant_table,
                                           config.tenancy.domain_table}),
          lifecycle_(conn.context(), make_runner(config)),
          service_(store_, lifecycle_, TenantPolicy{config.tenancy.auto_create_schema,
                                                    config.tenancy.auto_drop_schema}) {}

    int run(const std::string& command, const std::vector<std::string>& args) {
        const auto pos = positional(args);
        if (command == "init") return init();
        if (command == "list-tenants") return list_tenants(has_flag(args, "--json"));
        if (command == "create-tenant" && pos.size() >= 2) return create_tenant(pos);
        if (command == "delete-tenant" && pos.size() == 1) return delete_tenant(pos[0], has_flag(args, "--drop"));
        if (command == "add-domain" && pos.size() == 2) return add_domain(pos[0], pos[1]);
        if (command == "remove-domain" && pos.size() == 2) return remove_domain(pos[0], pos[1]);
        if (command == "migrate" && pos.size() <= 1) return migrate(pos.empty() ? "" : pos[0]);
        if (command == "tables" && pos.size() == 1) return tables(pos[0]);
        if (command == "constraints" && pos.size() == 2) return constraints(pos[0], pos[1]);
        if (command == "resolve" && pos.size() == 1) return resolve(pos[0]);

        std::cerr << kUsage;
        return kExitUsage;
    }

private:
    static std::shared_ptr<IMigrationRunner> make_runner(const AppConfig& config) {
        if (!config.migrations.enabled) return nullptr;
        return std::make_shared<SqlMigrationRunner>(
            SqlMigrationRunner::Config{config.migrations.directory, config.migrations.table});
    }

    int init() {
        if (auto status = store_.ensure_tables(); status.is_error()) {
            return report(status);
        }

        auto existing = service_.get_public();
        if (existing.is_ok()) {
            utils::log::info("Public tenant already registered");
            return kExitOk;
        }
        if (existing.error_code() != ErrorCode::NOT_FOUND) {
            return report(existing);
        }

        auto tenant = service_.make_tenant(config_.tenancy.public_schema_name, "Public");
        if (auto status = service_.save(tenant, verbosity_); status.is_error()) {
            return report(status);
        }
        utils::log::info(std::format("Registered public tenant (id {})", *tenant.id));
        return kExitOk;
    }

    int list_tenants(bool as_json) {
        auto rows = collect_tenant_listing(store_);
        if (rows.is_error()) return report(rows);

        if (as_json) {
            std::cout << tenant_listing_to_json(rows.value()).dump(2) << '\n';
        } else {
            write_tenant_listing_tsv(std::cout, rows.value());
        }
        return kExitOk;
    }

    int create_tenant(const std::vector<std::string>& pos) {
        auto tenant = service_.make_tenant(pos[0], pos[1]);
        if (auto status = service_.save(tenant, verbosity_); status.is_error()) {
            return report(status);
        }
        for (size_t i = 2; i < pos.size(); ++i) {
            if (auto domain = service_.add_domain(tenant, pos[i]); domain.is_error()) {
                return report(domain);
            }
        }
        utils::log::info(std::format("Created tenant '{}' (id {})", tenant.schema_name, *tenant.id));
        return kExitOk;
    }

    int delete_tenant(const std::string& schema, bool drop) {
        auto tenant = service_.get_by_schema(schema);
        if (tenant.is_error()) return report(tenant);
        if (auto status = service_.remove(tenant.value(), drop); status.is_error()) {
            return report(status);
        }
        utils::log::info(std::format("Deleted tenant '{}'", tenant.value().schema_name));
        return kExitOk;
    }

    int add_domain(const std::string& schema, const std::string& domain) {
        auto tenant = service_.get_by_schema(schema);
        if (tenant.is_error()) return report(tenant);
        auto added = service_.add_domain(tenant.value(), domain);
        if (added.is_error()) return report(added);
        utils::log::info(std::format("'{}' -> {}", added.value().domain, tenant.value().schema_name));
        return kExitOk;
    }

    int remove_domain(const std::string& schema, const std::string& domain) {
        auto tenant = service_.get_by_schema(schema);
        if (tenant.is_error()) return report(tenant);
        auto removed = service_.remove_domain(tenant.value(), domain);
        if (removed.is_error()) return report(removed);
        if (removed.value() == 0) {
            utils::log::warn(std::format("Tenant '{}' does not own '{}'", tenant.value().schema_name, domain));
        }
        return kExitOk;
    }

    int migrate(const std::string& schema) {
        if (!lifecycle_.has_migrations()) {
            utils::log::warn("Migrations are disabled in the configuration");
            return kExitOk;
        }
        if (schema.empty()) {
            return report(service_.migrate_all(verbosity_));
        }
        auto tenant = service_.get_by_schema(schema);
        if (tenant.is_error()) return report(tenant);
        return report(lifecycle_.migrate(tenant.value(), verbosity_));
    }

    int tables(const std::string& schema) {
        auto& context = lifecycle_.context();
        if (auto status = context.set_schema(schema, true); status.is_error()) {
            return report(status);
        }

        PgSchemaIntrospector introspector(context, config_.tenancy.ignored_tables);
        auto listed = introspector.list_tables();
        auto reset = context.set_to_public();
        if (listed.is_error()) return report(listed);
        if (reset.is_error()) return report(reset);

        for (const auto& table : listed.value()) {
            std::cout << table.name << '\t' << (table.kind == TableKind::VIEW ? "view" : "table") << '\n';
        }
        return kExitOk;
    }

    int constraints(const std::string& schema, const std::string& table) {
        auto& context = lifecycle_.context();
        if (auto status = context.set_schema(schema, true); status.is_error()) {
            return report(status);
        }

        PgSchemaIntrospector introspector(context, config_.tenancy.ignored_tables);
        auto found = introspector.get_constraints(table);
        auto reset = context.set_to_public();
        if (found.is_error()) return report(found);
        if (reset.is_error()) return report(reset);

        for (const auto& [name, info] : found.value()) {
            std::cout << name << '\t' << utils::join(info.columns, ",") << '\t'
                      << constraint_flags(info) << '\n';
        }
        return kExitOk;
    }

    int resolve(const std::string& host) {
        TenantResolver resolver;
        if (auto status = resolver.reload_from(store_, config_.tenancy.public_schema_name); status.is_error()) {
            return report(status);
        }

        const auto tenant = resolver.resolve(host);
        if (!tenant) {
            utils::log::error(std::format("No tenant serves '{}' and no public tenant is registered", host));
            return kExitError;
        }
        std::cout << tenant->schema_name << '\n';
        return kExitOk;
    }

    const AppConfig& config_;
    int verbosity_;
    PgTenantStore store_;
    SchemaLifecycle lifecycle_;
    TenantService service_;
};

} // anonymous namespace

int main(int argc, char* argv[]) {
    const auto cl = parse_command_line(argc, argv);
    if (!cl) {
        std::cerr << kUsage;
        return kExitUsage;
    }

    auto config_result = ConfigLoader::load_from_file(cl->config_file);
    if (!config_result.success) {
        utils::log::error(config_result.error_message);
        return kExitError;
    }
    const auto& cfg = config_result.config;
    if (const auto level = utils::log::parse_level(cfg.logging.level)) {
        utils::log::set_level(*level);
    }

    PoolConfig pool_config;
    pool_config.connection_string = cfg.database.connection_string;
    pool_config.min_connections = static_cast<size_t>(cfg.database.min_connections);
    pool_config.max_connections = static_cast<size_t>(cfg.database.max_connections);
    pool_config.connection_timeout = cfg.database.connection_timeout;
    pool_config.idle_timeout = std::chrono::milliseconds{cfg.database.idle_timeout_seconds * 1000};
    pool_config.health_check_query = cfg.database.health_check_query;

    SchemaDdl ddl(SchemaNameValidator(cfg.tenancy.public_schema_name, cfg.tenancy.reserved_schema_names));
    GenericConnectionPool pool("pgtenant", pool_config, std::make_shared<PgConnectionFactory>(cfg.database.application_name), ddl);

    auto conn = pool.acquire(cfg.database.connection_timeout);
    if (!conn) {
        utils::log::error("Could not obtain a database connection");
        return kExitError;
    }

    Commands commands(cfg, *conn, cl->verbosity);
    return commands.run(cl->command, cl->args);
}
