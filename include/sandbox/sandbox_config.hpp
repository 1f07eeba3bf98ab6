#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace codeauditor {

/**
 * @brief How the compiler process is cut off from the network
 *
 * OFF:         no namespace is created
 * BEST_EFFORT: a fresh network namespace is attempted; failure is tolerated
 * REQUIRED:    failure to create the namespace is an infrastructure error
 */
enum class NetworkIsolation {
    OFF,
    BEST_EFFORT,
    REQUIRED
};

[[nodiscard]] inline std::optional<NetworkIsolation> parse_network_isolation(std::string_view s) {
    if (s == "off") return NetworkIsolation::OFF;
    if (s == "best_effort") return NetworkIsolation::BEST_EFFORT;
    if (s == "required") return NetworkIsolation::REQUIRED;
    return std::nullopt;
}

[[nodiscard]] inline constexpr const char* network_isolation_to_string(NetworkIsolation n) {
    switch (n) {
        case NetworkIsolation::OFF:         return "off";
        case NetworkIsolation::BEST_EFFORT: return "best_effort";
        case NetworkIsolation::REQUIRED:    return "required";
    }
    return "unknown";
}

/**
 * @brief Compiler invocation and resource ceilings for one sandbox run
 *
 * `command` and `version_command` are argv vectors. Each element may contain
 * the placeholders {source} (absolute path of the written snippet) and
 * {workdir} (the run's scratch directory).
 */
struct SandboxConfig {
    std::vector<std::string> command{
        "rustc", "--crate-type", "lib", "--emit=metadata",
        "--color=never", "--out-dir", "{workdir}", "{source}"};
    std::vector<std::string> version_command{"rustc", "--version"};
    std::string source_file = "snippet.rs";
    std::string scratch_root = "/tmp/code-auditor";

    std::chrono::milliseconds timeout{5000};
    uint64_t memory_limit_mb = 2048;        // RLIMIT_AS, 0 = unlimited
    uint64_t cpu_limit_seconds = 0;         // RLIMIT_CPU, 0 = timeout + 1s
    uint64_t max_file_size_mb = 64;         // RLIMIT_FSIZE, 0 = unlimited
    uint64_t max_open_files = 256;          // RLIMIT_NOFILE, 0 = inherited
    size_t max_output_bytes = 65536;        // Per stream, rest is discarded
    std::chrono::milliseconds toolchain_recheck_interval{30000};   // Recheck cadence while the toolchain is missing

    NetworkIsolation network_isolation = NetworkIsolation::BEST_EFFORT;
    std::string path = "/usr/local/bin:/usr/bin:/bin";
    std::vector<std::string> env_passthrough;   // Variable names copied from the service env
};

} // namespace codeauditor
