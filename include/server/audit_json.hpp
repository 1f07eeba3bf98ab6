#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace codeauditor::http {

/// Body of POST /audit. Any other members (is_valid, diagnostic, ...) are ignored.
struct AuditSubmission {
    std::string prompt;
    std::string generated_code;
};

/**
 * @brief Parse a POST /audit body
 * @return INVALID_INPUT for malformed JSON, a non-object body, or a missing
 *         or non-string field. Emptiness is checked by the pipeline.
 */
[[nodiscard]] Result<AuditSubmission> parse_submission(const std::string& body);

[[nodiscard]] std::string error_json(std::string_view message);

[[nodiscard]] std::string audit_record_json(const AuditRecord& record);

[[nodiscard]] std::string audit_page_json(const std::vector<AuditRecord>& records,
                                          size_t limit, size_t offset);

[[nodiscard]] std::string summary_json(const AuditSummary& summary);

/// HTTP status for a failed operation, per error category.
[[nodiscard]] int status_for(ErrorCategory category);

} // namespace codeauditor::http
