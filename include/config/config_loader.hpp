#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace pgtenant {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        AppConfig config;

        static LoadResult ok(AppConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to pgtenant.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check cross-field constraints
     * @return One message per problem, empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const AppConfig& config);

private:
    static AppConfig extract_all_sections(const toml::table& root);
    static DatabaseConfig extract_database(const toml::table& root);
    static TenancyConfig extract_tenancy(const toml::table& root);
    static MigrationsConfig extract_migrations(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);

    static LoadResult validate_and_return(AppConfig config);
};

} // namespace pgtenant
