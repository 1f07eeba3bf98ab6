#include "server/audit_json.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <format>

namespace codeauditor::http {

Result<AuditSubmission> parse_submission(const std::string& body) {
    JsonValue doc;
    try {
        doc = JsonValue::parse(body);
    } catch (const JsonValue::parse_error&) {
        return Result<AuditSubmission>::error(ErrorCategory::INVALID_INPUT, "Invalid JSON body");
    }
    if (!doc.is_object()) {
        return Result<AuditSubmission>::error(ErrorCategory::INVALID_INPUT, "Request body must be a JSON object");
    }

    auto prompt = doc.string_field("prompt");
    if (!prompt) {
        return Result<AuditSubmission>::error(ErrorCategory::INVALID_INPUT,
            "Missing required string field: prompt");
    }
    auto code = doc.string_field("generated_code");
    if (!code) {
        return Result<AuditSubmission>::error(ErrorCategory::INVALID_INPUT,
            "Missing required string field: generated_code");
    }
    return Result<AuditSubmission>::ok({std::move(*prompt), std::move(*code)});
}

std::string error_json(std::string_view message) {
    return std::format(R"({{"error":"{}"}})", utils::escape_json(message));
}

std::string audit_record_json(const AuditRecord& record) {
    const std::string diagnostic = record.diagnostic
        ? std::format("\"{}\"", utils::escape_json(*record.diagnostic))
        : "null";
    return std::format(
        R"({{"id":"{}","prompt":"{}","generated_code":"{}","is_valid":{},"diagnostic":{},"created_at":"{}"}})",
        record.id,
        utils::escape_json(record.prompt),
        utils::escape_json(record.generated_code),
        utils::booltostr(record.is_valid),
        diagnostic,
        utils::format_timestamp_utc(record.created_at));
}

std::string audit_page_json(const std::vector<AuditRecord>& records, size_t limit, size_t offset) {
    std::string json = R"({"audits":[)";
    for (size_t i = 0; i < records.size(); ++i) {
        if (i > 0) json += ',';
        json += audit_record_json(records[i]);
    }
    json += std::format(R"(],"limit":{},"offset":{},"count":{}}})", limit, offset, records.size());
    return json;
}

std::string summary_json(const AuditSummary& summary) {
    std::string json = std::format(
        R"({{"total":{},"valid":{},"invalid":{},"validity_rate":{},"common_diagnostics":[)",
        summary.total, summary.valid, summary.invalid, summary.validity_rate);
    for (size_t i = 0; i < summary.common_diagnostics.size(); ++i) {
        if (i > 0) json += ',';
        const auto& d = summary.common_diagnostics[i];
        json += std::format(R"({{"diagnostic":"{}","count":{}}})", utils::escape_json(d.diagnostic), d.count);
    }
    json += "]}";
    return json;
}

int status_for(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::INVALID_INPUT:        return 400;
        case ErrorCategory::NOT_FOUND:            return 404;
        case ErrorCategory::INFRASTRUCTURE_ERROR: return 503;
        case ErrorCategory::STORAGE_ERROR:        return 500;
        case ErrorCategory::INTERNAL_ERROR:       return 500;
        case ErrorCategory::NONE:                 break;
    }
    return 500;
}

} // namespace codeauditor::http
