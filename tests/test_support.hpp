#pragma once

#include "core/types.hpp"
#include "core/utils.hpp"
#include "sandbox/sandbox_config.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <unistd.h>

namespace codeauditor::testing {

/// Per-test directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
            ("code-auditor-test-" + std::to_string(::getpid()) + "-" +
             std::to_string(counter.fetch_add(1)));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    /// Number of entries directly inside the directory.
    [[nodiscard]] size_t entry_count() const {
        size_t n = 0;
        for ([[maybe_unused]] const auto& entry : std::filesystem::directory_iterator(path_)) ++n;
        return n;
    }

private:
    std::filesystem::path path_;
};

/**
 * Sandbox whose "compiler" is a /bin/sh script. The script sees the snippet
 * path as $1 and runs inside the scratch directory.
 */
inline SandboxConfig sh_sandbox(const std::string& script, const std::filesystem::path& root) {
    SandboxConfig cfg;
    cfg.command = {"/bin/sh", "-c", script, "sh", "{source}"};
    cfg.version_command = {"/bin/sh", "-c", "echo 'sh-compiler 1.0'; echo second line"};
    cfg.source_file = "snippet.rs";
    cfg.scratch_root = root.string();
    cfg.timeout = std::chrono::milliseconds(5000);
    cfg.memory_limit_mb = 0;
    cfg.network_isolation = NetworkIsolation::OFF;
    cfg.path = "/usr/bin:/bin";
    return cfg;
}

/// Well-formed record with a fresh UUID; `diagnostic` decides validity.
inline AuditRecord make_record(std::optional<std::string> diagnostic = std::nullopt,
                               std::chrono::system_clock::time_point created_at =
                                   std::chrono::system_clock::now()) {
    AuditRecord r;
    r.id = utils::generate_uuid();
    r.prompt = "write a function";
    r.generated_code = "fn f() {}";
    r.is_valid = !diagnostic.has_value();
    r.diagnostic = std::move(diagnostic);
    r.created_at = created_at;
    return r;
}

} // namespace codeauditor::testing
