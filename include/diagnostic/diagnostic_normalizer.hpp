#pragma once

#include "sandbox/sandbox_runner.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace codeauditor {

/**
 * @brief Turns raw compiler output into a bounded, printable diagnostic
 *
 * Pipeline: strip terminal escape sequences -> normalize line endings ->
 * drop control bytes (keeps \n and \t) -> redact the scratch directory ->
 * trim -> truncate on a UTF-8 boundary.
 *
 * Stateless; safe to share between threads.
 */
class DiagnosticNormalizer {
public:
    static constexpr std::string_view kTruncationMarker = "\n... [truncated]";
    static constexpr std::string_view kTimedOut = "compilation timed out";
    static constexpr std::string_view kRedactedWorkdir = "<workdir>";

    explicit DiagnosticNormalizer(size_t max_length = 4096);

    /**
     * @brief Diagnostic for a sandbox outcome
     * @return nullopt for COMPILED, non-empty text for COMPILE_FAILED and
     *         TIMED_OUT. Must not be called for INFRASTRUCTURE_ERROR.
     */
    [[nodiscard]] std::optional<std::string> diagnose(const SandboxOutcome& outcome) const;

    /**
     * @brief Normalize arbitrary compiler output
     * @param workdir Host path to redact (may be empty)
     */
    [[nodiscard]] std::string normalize(std::string_view raw, std::string_view workdir = {}) const;

    [[nodiscard]] size_t max_length() const { return max_length_; }

    // Individual passes, exposed for testing
    [[nodiscard]] static std::string strip_escape_sequences(std::string_view in);
    [[nodiscard]] static std::string normalize_line_endings(std::string_view in);
    [[nodiscard]] static std::string drop_control_bytes(std::string_view in);
    [[nodiscard]] static std::string redact(std::string_view in, std::string_view needle,
                                            std::string_view replacement);
    [[nodiscard]] static std::string truncate_utf8(std::string text, size_t max_length);

private:
    size_t max_length_;
};

} // namespace codeauditor
