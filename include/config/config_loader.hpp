#pragma once

#include "config/config_types.hpp"
#include "sandbox/sandbox_config.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace codeauditor {

// ============================================================================
// AuditorConfig - Complete parsed configuration
// ============================================================================

struct AuditorConfig {
    ServerConfig server;
    LoggingConfig logging;
    SandboxConfig sandbox;
    DiagnosticsConfig diagnostics;
    ValidationConfig validation;
    StorageConfig storage;
    GraphQLConfig graphql;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        AuditorConfig config;

        static LoadResult ok(AuditorConfig cfg) {
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
     * @param config_path Path to auditor.toml
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
     * @brief Collect every validation problem in a config
     * @return Empty vector when the config is usable
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const AuditorConfig& config);

private:
    static AuditorConfig extract_all_sections(const toml::table& root);
    static ServerConfig extract_server(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static SandboxConfig extract_sandbox(const toml::table& root);
    static DiagnosticsConfig extract_diagnostics(const toml::table& root);
    static ValidationConfig extract_validation(const toml::table& root);
    static StorageConfig extract_storage(const toml::table& root);
    static GraphQLConfig extract_graphql(const toml::table& root);

    static LoadResult validate_and_return(AuditorConfig config);
};

} // namespace codeauditor
