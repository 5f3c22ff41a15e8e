#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "schema/schema_name_validator.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace pgtenant {

namespace {

// Replaces each ${NAME} with the value of the environment variable NAME.
// Unset variables expand to nothing; a "${" without a closing brace throws.
std::string substitute_env(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    for (;;) {
        const size_t open = text.find("${", pos);
        out.append(text.substr(pos, open == std::string_view::npos ? text.npos : open - pos));
        if (open == std::string_view::npos) break;

        const size_t close = text.find('}', open + 2);
        if (close == std::string_view::npos) {
            throw std::runtime_error(
                std::format("Unclosed env var substitution at position {}", open));
        }
        const std::string name(text.substr(open + 2, close - open - 2));
        if (const char* value = std::getenv(name.c_str())) out += value;
        pos = close + 1;
    }
    return out;
}

// Walks every string leaf of a parsed document, nested tables and arrays included.
void substitute_env_in(toml::node& node) {
    if (auto* str = node.as_string()) {
        str->get() = substitute_env(str->get());
    } else if (auto* tbl = node.as_table()) {
        for (auto&& [key, child] : *tbl) substitute_env_in(child);
    } else if (auto* arr = node.as_array()) {
        for (auto& child : *arr) substitute_env_in(child);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto doc = toml::parse(content);
    substitute_env_in(doc);
    return doc;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto doc = toml::parse_file(file_path);
    substitute_env_in(doc);
    return doc;
}

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// Section extractors
// ============================================================================

DatabaseConfig ConfigLoader::extract_database(const toml::table& root) {
    DatabaseConfig cfg;
    const auto* database = root["database"].as_table();
    if (!database) return cfg;
    const auto& d = *database;

    cfg.connection_string = d["connection_string"].value_or(""s);
    cfg.min_connections = d["min_connections"].value_or(int64_t{1});
    cfg.max_connections = d["max_connections"].value_or(int64_t{4});
    cfg.connection_timeout = std::chrono::milliseconds(d["connection_timeout_ms"].value_or(5000));
    cfg.idle_timeout_seconds = d["idle_timeout_seconds"].value_or(300);
    cfg.health_check_query = d["health_check_query"].value_or("SELECT 1"s);
    cfg.application_name = d["application_name"].value_or("pgtenant"s);
    return cfg;
}

TenancyConfig ConfigLoader::extract_tenancy(const toml::table& root) {
    TenancyConfig cfg;
    const auto* tenancy = root["tenancy"].as_table();
    if (!tenancy) return cfg;
    const auto& t = *tenancy;

    cfg.public_schema_name = utils::to_lower(t["public_schema_name"].value_or("public"s));
    cfg.tenant_table = t["tenant_table"].value_or("tenants"s);
    cfg.domain_table = t["domain_table"].value_or("domains"s);
    cfg.auto_create_schema = t["auto_create_schema"].value_or(true);
    cfg.auto_drop_schema = t["auto_drop_schema"].value_or(false);
    cfg.reserved_schema_names = toml_string_array(t, "reserved_schema_names");
    cfg.ignored_tables = toml_string_array(t, "ignored_tables");
    return cfg;
}

MigrationsConfig ConfigLoader::extract_migrations(const toml::table& root) {
    MigrationsConfig cfg;
    const auto* migrations = root["migrations"].as_table();
    if (!migrations) return cfg;
    const auto& m = *migrations;

    cfg.enabled = m["enabled"].value_or(true);
    cfg.directory = m["directory"].value_or("migrations"s);
    cfg.table = m["table"].value_or("schema_migrations"s);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    const auto& l = *logging;

    cfg.level = l["level"].value_or("info"s);
    return cfg;
}

AppConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    AppConfig config;
    config.database = extract_database(tbl);
    config.tenancy = extract_tenancy(tbl);
    config.migrations = extract_migrations(tbl);
    config.logging = extract_logging(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AppConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AppConfig& config) {
    std::vector<std::string> errors;

    const auto& db = config.database;
    if (db.connection_string.empty()) {
        errors.push_back("database.connection_string must not be empty");
    }
    if (db.min_connections < 0) {
        errors.push_back(std::format("database.min_connections must be >= 0, got {}",
            db.min_connections));
    }
    if (db.max_connections <= 0) {
        errors.push_back("database.max_connections must be > 0");
    }
    if (db.idle_timeout_seconds < 0) {
        errors.push_back("database.idle_timeout_seconds must be >= 0");
    }
    if (db.max_connections > 0 && db.min_connections > db.max_connections) {
        errors.push_back(std::format("database.min_connections ({}) > max_connections ({})",
            db.min_connections, db.max_connections));
    }
    if (db.connection_timeout.count() <= 0) {
        errors.push_back("database.connection_timeout_ms must be > 0");
    }

    const auto& tenancy = config.tenancy;
    if (auto status = SchemaNameValidator::check_identifier(tenancy.public_schema_name);
        status.is_error()) {
        errors.push_back(std::format("tenancy.public_schema_name: {}", status.error_message()));
    }
    if (tenancy.tenant_table.empty()) {
        errors.push_back("tenancy.tenant_table must not be empty");
    }
    if (tenancy.domain_table.empty()) {
        errors.push_back("tenancy.domain_table must not be empty");
    }
    if (!tenancy.tenant_table.empty() && tenancy.tenant_table == tenancy.domain_table) {
        errors.push_back("tenancy.tenant_table and tenancy.domain_table must differ");
    }

    if (config.migrations.enabled) {
        if (config.migrations.directory.empty()) {
            errors.push_back("migrations.directory required when migrations are enabled");
        }
        if (config.migrations.table.empty()) {
            errors.push_back("migrations.table must not be empty");
        }
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got '{}'",
            config.logging.level));
    }

    return errors;
}

} // namespace pgtenant
