#pragma once

#include "core/error.hpp"
#include "sandbox/sandbox_config.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace codeauditor {

enum class SandboxStatus {
    COMPILED,               // Compiler exited 0
    COMPILE_FAILED,         // Non-zero exit or killed by a resource ceiling
    TIMED_OUT,              // Process group killed at the wall-clock deadline
    INFRASTRUCTURE_ERROR    // Could not run the compiler at all
};

[[nodiscard]] inline constexpr const char* sandbox_status_to_string(SandboxStatus s) {
    switch (s) {
        case SandboxStatus::COMPILED:             return "compiled";
        case SandboxStatus::COMPILE_FAILED:       return "compile_failed";
        case SandboxStatus::TIMED_OUT:            return "timed_out";
        case SandboxStatus::INFRASTRUCTURE_ERROR: return "infrastructure_error";
    }
    return "unknown";
}

/**
 * @brief Result of one sandboxed compiler invocation
 *
 * `output` is the captured stderr (stdout when stderr was empty), capped at
 * SandboxConfig::max_output_bytes. `workdir` is the scratch directory the run
 * used; it no longer exists when the outcome is returned but is kept so that
 * host paths can be redacted from diagnostics.
 */
struct SandboxOutcome {
    SandboxStatus status = SandboxStatus::INFRASTRUCTURE_ERROR;
    std::string output;
    std::string error_message;              // INFRASTRUCTURE_ERROR only
    std::optional<int> exit_code;
    std::optional<int> signal;
    std::chrono::milliseconds wall_time{0};
    std::string workdir;

    static SandboxOutcome infrastructure_error(std::string message) {
        SandboxOutcome o;
        o.status = SandboxStatus::INFRASTRUCTURE_ERROR;
        o.error_message = std::move(message);
        return o;
    }
};

/**
 * @brief Compile-only execution of untrusted source text
 *
 * Implementations must be safe to call concurrently from any number of
 * threads. Each call is fully isolated from every other call.
 */
class ISandboxRunner {
public:
    virtual ~ISandboxRunner() = default;

    /**
     * @brief Compile `source` once
     * @param run_id Unique identifier of this run (names the scratch directory)
     */
    [[nodiscard]] virtual SandboxOutcome run(std::string_view source, std::string_view run_id) = 0;
};

/**
 * @brief ISandboxRunner that forks the configured compiler under rlimits
 *
 * Per run: fresh scratch directory, own process group, no network namespace
 * (per NetworkIsolation), sanitized env, stdin from /dev/null, stdout/stderr
 * captured via poll() against a wall-clock deadline.
 */
class ProcessSandboxRunner final : public ISandboxRunner {
public:
    explicit ProcessSandboxRunner(SandboxConfig config);

    /**
     * @brief Compile `source` once
     *
     * While the last probe_compiler() failed, returns INFRASTRUCTURE_ERROR
     * without compiling. The version check is repeated at most once per
     * SandboxConfig::toolchain_recheck_interval; a passing recheck re-enables runs.
     */
    [[nodiscard]] SandboxOutcome run(std::string_view source, std::string_view run_id) override;

    /**
     * @brief Run version_command under the same limits and remember the result
     * @return First line of the version output, or INFRASTRUCTURE_ERROR
     */
    [[nodiscard]] Result<std::string> probe_compiler();

    /// Failure text of the last version check; nullopt when it passed or never ran.
    [[nodiscard]] std::optional<std::string> toolchain_failure() const;

    [[nodiscard]] const SandboxConfig& config() const { return config_; }

private:
    [[nodiscard]] Result<std::string> check_toolchain() const;
    void record_toolchain_check(const Result<std::string>& result);

    /// Rechecks when due; returns the failure that still blocks runs, if any.
    [[nodiscard]] std::optional<std::string> blocking_failure();

    SandboxConfig config_;

    mutable std::mutex toolchain_mutex_;
    std::optional<std::string> toolchain_failure_;
    std::chrono::steady_clock::time_point checked_at_{};
};

} // namespace codeauditor
