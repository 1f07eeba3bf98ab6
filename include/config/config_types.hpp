#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace codeauditor {

// ============================================================================
// Configuration Types
// ============================================================================

struct ServerConfig {
    std::string host;
    int port;
    size_t thread_pool_size;
    size_t max_body_bytes;
    uint32_t shutdown_timeout_ms = 30000;  // Graceful shutdown timeout

    ServerConfig()
        : host("0.0.0.0"),
          port(3000),
          thread_pool_size(8),
          max_body_bytes(1024 * 1024) {}
};

struct LoggingConfig {
    std::string level = "info";
};

struct DiagnosticsConfig {
    size_t max_length = 4096;
};

struct ValidationConfig {
    size_t max_prompt_bytes = 64 * 1024;
    size_t max_code_bytes = 256 * 1024;
};

struct StorageConfig {
    std::string backend = "postgresql";     // "postgresql" | "memory"
    std::string connection_string;
    size_t min_connections = 1;
    size_t max_connections = 8;
    std::chrono::milliseconds connection_timeout{5000};
    bool auto_migrate = true;
    size_t common_diagnostics_limit = 10;
};

struct GraphQLConfig {
    bool enabled = true;
    std::string endpoint = "/graphql";
    bool playground = true;                 // GET <endpoint> serves GraphiQL
    bool mutations_enabled = true;
    uint32_t max_query_depth = 5;
};

} // namespace codeauditor
