#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <format>
#include <limits>
#include <stdexcept>

using namespace std::string_literals;

namespace codeauditor {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

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

// Integer setting that must not be negative. Missing key -> default.
uint64_t toml_unsigned(const toml::table& tbl, const std::string_view section,
                       const std::string_view key, const uint64_t default_value) {
    const auto v = tbl[key].value<int64_t>();
    if (!v) return default_value;
    if (*v < 0) {
        throw std::runtime_error(
            std::format("{}.{} must not be negative, got {}", section, key, *v));
    }
    return static_cast<uint64_t>(*v);
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or(cfg.host);
    const int64_t port = s["port"].value_or(int64_t{cfg.port});
    // Values that survive the narrowing are range-checked in validate_config()
    if (port < std::numeric_limits<int>::min() || port > std::numeric_limits<int>::max()) {
        throw std::runtime_error(std::format("server.port must be 1-65535, got {}", port));
    }
    cfg.port = static_cast<int>(port);
    cfg.thread_pool_size = static_cast<size_t>(toml_unsigned(s, "server", "threads", cfg.thread_pool_size));
    cfg.max_body_bytes = static_cast<size_t>(toml_unsigned(s, "server", "max_body_bytes", cfg.max_body_bytes));
    cfg.shutdown_timeout_ms = static_cast<uint32_t>(
        toml_unsigned(s, "server", "shutdown_timeout_ms", cfg.shutdown_timeout_ms));
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or(cfg.level);
    return cfg;
}

SandboxConfig ConfigLoader::extract_sandbox(const toml::table& root) {
    SandboxConfig cfg;
    const auto* sandbox = root["sandbox"].as_table();
    if (!sandbox) return cfg;
    const auto& s = *sandbox;

    if (s["command"].is_array()) {
        cfg.command = toml_string_array(s, "command");
    }
    if (s["version_command"].is_array()) {
        cfg.version_command = toml_string_array(s, "version_command");
    }
    if (s["env_passthrough"].is_array()) {
        cfg.env_passthrough = toml_string_array(s, "env_passthrough");
    }

    cfg.source_file = s["source_file"].value_or(cfg.source_file);
    cfg.scratch_root = s["scratch_root"].value_or(cfg.scratch_root);
    cfg.path = s["path"].value_or(cfg.path);

    cfg.timeout = std::chrono::milliseconds(
        s["timeout_ms"].value_or(static_cast<int64_t>(cfg.timeout.count())));
    cfg.memory_limit_mb = toml_unsigned(s, "sandbox", "memory_limit_mb", cfg.memory_limit_mb);
    cfg.cpu_limit_seconds = toml_unsigned(s, "sandbox", "cpu_limit_seconds", cfg.cpu_limit_seconds);
    cfg.max_file_size_mb = toml_unsigned(s, "sandbox", "max_file_size_mb", cfg.max_file_size_mb);
    cfg.max_open_files = toml_unsigned(s, "sandbox", "max_open_files", cfg.max_open_files);
    cfg.max_output_bytes = static_cast<size_t>(
        toml_unsigned(s, "sandbox", "max_output_bytes", cfg.max_output_bytes));
    cfg.toolchain_recheck_interval = std::chrono::milliseconds(toml_unsigned(
        s, "sandbox", "toolchain_recheck_ms", static_cast<uint64_t>(cfg.toolchain_recheck_interval.count())));

    if (const auto mode = s["network_isolation"].value<std::string>()) {
        const auto parsed = parse_network_isolation(*mode);
        if (!parsed) {
            throw std::runtime_error(std::format(
                "sandbox.network_isolation must be one of off|best_effort|required, got '{}'", *mode));
        }
        cfg.network_isolation = *parsed;
    }
    return cfg;
}

DiagnosticsConfig ConfigLoader::extract_diagnostics(const toml::table& root) {
    DiagnosticsConfig cfg;
    const auto* diag = root["diagnostics"].as_table();
    if (!diag) return cfg;

    cfg.max_length = static_cast<size_t>(
        toml_unsigned(*diag, "diagnostics", "max_length", cfg.max_length));
    return cfg;
}

ValidationConfig ConfigLoader::extract_validation(const toml::table& root) {
    ValidationConfig cfg;
    const auto* val = root["validation"].as_table();
    if (!val) return cfg;

    cfg.max_prompt_bytes = static_cast<size_t>(
        toml_unsigned(*val, "validation", "max_prompt_bytes", cfg.max_prompt_bytes));
    cfg.max_code_bytes = static_cast<size_t>(
        toml_unsigned(*val, "validation", "max_code_bytes", cfg.max_code_bytes));
    return cfg;
}

StorageConfig ConfigLoader::extract_storage(const toml::table& root) {
    StorageConfig cfg;
    const auto* storage = root["storage"].as_table();
    if (!storage) return cfg;
    const auto& s = *storage;

    cfg.backend = s["backend"].value_or(cfg.backend);
    cfg.connection_string = s["connection_string"].value_or(""s);
    cfg.min_connections = static_cast<size_t>(
        toml_unsigned(s, "storage", "min_connections", cfg.min_connections));
    cfg.max_connections = static_cast<size_t>(
        toml_unsigned(s, "storage", "max_connections", cfg.max_connections));
    cfg.connection_timeout = std::chrono::milliseconds(
        toml_unsigned(s, "storage", "connection_timeout_ms",
                      static_cast<uint64_t>(cfg.connection_timeout.count())));
    cfg.auto_migrate = s["auto_migrate"].value_or(cfg.auto_migrate);
    cfg.common_diagnostics_limit = static_cast<size_t>(
        toml_unsigned(s, "storage", "common_diagnostics_limit", cfg.common_diagnostics_limit));
    return cfg;
}

GraphQLConfig ConfigLoader::extract_graphql(const toml::table& root) {
    GraphQLConfig cfg;
    const auto* graphql = root["graphql"].as_table();
    if (!graphql) return cfg;
    const auto& g = *graphql;

    cfg.enabled = g["enabled"].value_or(cfg.enabled);
    cfg.endpoint = g["endpoint"].value_or(cfg.endpoint);
    cfg.playground = g["playground"].value_or(cfg.playground);
    cfg.mutations_enabled = g["mutations_enabled"].value_or(cfg.mutations_enabled);
    cfg.max_query_depth = static_cast<uint32_t>(
        toml_unsigned(g, "graphql", "max_query_depth", cfg.max_query_depth));
    return cfg;
}

AuditorConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    AuditorConfig config;
    config.server = extract_server(root);
    config.logging = extract_logging(root);
    config.sandbox = extract_sandbox(root);
    config.diagnostics = extract_diagnostics(root);
    config.validation = extract_validation(root);
    config.storage = extract_storage(root);
    config.graphql = extract_graphql(root);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AuditorConfig config) {
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

std::vector<std::string> ConfigLoader::validate_config(const AuditorConfig& config) {
    std::vector<std::string> errors;

    if (config.server.port < 1 || config.server.port > 65535) {
        errors.push_back(std::format("server.port must be 1-65535, got {}", config.server.port));
    }
    if (config.server.thread_pool_size == 0) {
        errors.push_back("server.threads must be > 0");
    }
    if (config.server.max_body_bytes == 0) {
        errors.push_back("server.max_body_bytes must be > 0");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug|info|warn|error, got '{}'", config.logging.level));
    }

    const auto& sb = config.sandbox;
    if (sb.command.empty() || sb.command.front().empty()) {
        errors.push_back("sandbox.command must name a compiler executable");
    } else {
        const bool has_source = std::any_of(sb.command.begin(), sb.command.end(),
            [](const std::string& arg) { return arg.find("{source}") != std::string::npos; });
        if (!has_source) {
            errors.push_back("sandbox.command must reference the {source} placeholder");
        }
    }
    if (sb.source_file.empty() || sb.source_file.find('/') != std::string::npos ||
        sb.source_file == "." || sb.source_file == "..") {
        errors.push_back(std::format(
            "sandbox.source_file must be a plain file name, got '{}'", sb.source_file));
    }
    if (sb.scratch_root.empty()) {
        errors.push_back("sandbox.scratch_root must not be empty");
    }
    if (sb.timeout.count() <= 0) {
        errors.push_back(std::format("sandbox.timeout_ms must be > 0, got {}", sb.timeout.count()));
    }
    if (sb.max_output_bytes == 0) {
        errors.push_back("sandbox.max_output_bytes must be > 0");
    }
    if (sb.max_open_files != 0 && sb.max_open_files < 16) {
        errors.push_back(std::format(
            "sandbox.max_open_files must be 0 (unlimited) or >= 16, got {}", sb.max_open_files));
    }

    if (config.diagnostics.max_length < 64) {
        errors.push_back(std::format(
            "diagnostics.max_length must be >= 64, got {}", config.diagnostics.max_length));
    }

    if (config.validation.max_prompt_bytes == 0) {
        errors.push_back("validation.max_prompt_bytes must be > 0");
    }
    if (config.validation.max_code_bytes == 0) {
        errors.push_back("validation.max_code_bytes must be > 0");
    }

    const auto& st = config.storage;
    if (st.backend != "postgresql" && st.backend != "memory") {
        errors.push_back(std::format(
            "storage.backend must be 'postgresql' or 'memory', got '{}'", st.backend));
    }
    if (st.backend == "postgresql") {
        if (st.connection_string.empty()) {
            errors.push_back("storage.connection_string must not be empty for the postgresql backend");
        }
        if (st.max_connections == 0) {
            errors.push_back("storage.max_connections must be > 0");
        }
        if (st.min_connections > st.max_connections) {
            errors.push_back(std::format(
                "storage.min_connections ({}) must be <= max_connections ({})",
                st.min_connections, st.max_connections));
        }
    }
    if (st.common_diagnostics_limit == 0) {
        errors.push_back("storage.common_diagnostics_limit must be > 0");
    }

    const auto& gql = config.graphql;
    if (gql.enabled) {
        if (!gql.endpoint.starts_with('/')) {
            errors.push_back(std::format("graphql.endpoint must start with '/', got '{}'", gql.endpoint));
        } else if (gql.endpoint == "/audit" || gql.endpoint == "/stats" || gql.endpoint.starts_with("/audits")) {
            errors.push_back(std::format("graphql.endpoint '{}' collides with a REST route", gql.endpoint));
        }
        if (gql.max_query_depth < 2) {
            errors.push_back(std::format(
                "graphql.max_query_depth must be >= 2, got {}", gql.max_query_depth));
        }
    }

    return errors;
}

} // namespace codeauditor
