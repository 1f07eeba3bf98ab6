#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace codeauditor {

// ============================================================================
// Audit Record
// ============================================================================

/**
 * @brief Immutable outcome of one code-validation attempt
 *
 * Invariant: is_valid == !diagnostic.has_value(). When is_valid is false the
 * diagnostic is non-empty. Records are created once by the ValidationPipeline
 * and never modified afterwards.
 */
struct AuditRecord {
    std::string id;                     // UUID v4, server-assigned
    std::string prompt;
    std::string generated_code;
    bool is_valid = false;
    std::optional<std::string> diagnostic;
    std::chrono::system_clock::time_point created_at{};

    [[nodiscard]] bool is_consistent() const {
        if (is_valid) return !diagnostic.has_value();
        return diagnostic.has_value() && !diagnostic->empty();
    }
};

// ============================================================================
// Aggregates
// ============================================================================

struct ValidityCounts {
    uint64_t valid = 0;
    uint64_t invalid = 0;
};

struct DiagnosticFrequency {
    std::string diagnostic;             // Leading 200 characters of the diagnostic text
    uint64_t count = 0;
};

struct AuditSummary {
    uint64_t total = 0;
    uint64_t valid = 0;
    uint64_t invalid = 0;
    double validity_rate = 0.0;         // 0.0 when total == 0
    std::vector<DiagnosticFrequency> common_diagnostics;
};

} // namespace codeauditor
