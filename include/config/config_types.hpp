#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pgtenant {

// ============================================================================
// Configuration Types
// ============================================================================

struct DatabaseConfig {
    std::string connection_string;
    // Signed so that a negative value in the file is caught by validation
    int64_t min_connections = 1;
    int64_t max_connections = 4;
    std::chrono::milliseconds connection_timeout{5000};
    int idle_timeout_seconds = 300;
    std::string health_check_query{"SELECT 1"};
    std::string application_name{"pgtenant"};
};

struct TenancyConfig {
    std::string public_schema_name{"public"};
    std::string tenant_table{"tenants"};
    std::string domain_table{"domains"};
    bool auto_create_schema = true;
    bool auto_drop_schema = false;              // Drops all tenant data on delete
    std::vector<std::string> reserved_schema_names;
    std::vector<std::string> ignored_tables;    // Hidden from table listings
};

struct MigrationsConfig {
    bool enabled = true;
    std::string directory{"migrations"};
    std::string table{"schema_migrations"};
};

struct LoggingConfig {
    std::string level = "info";
};

struct AppConfig {
    DatabaseConfig database;
    TenancyConfig tenancy;
    MigrationsConfig migrations;
    LoggingConfig logging;
};

} // namespace pgtenant
