#include "validation/validation_pipeline.hpp"
#include "core/utils.hpp"

#include <format>

namespace codeauditor {

ValidationPipeline::ValidationPipeline(std::shared_ptr<ISandboxRunner> sandbox,
                                       DiagnosticNormalizer normalizer,
                                       std::shared_ptr<IAuditStore> store,
                                       ValidationConfig limits)
    : sandbox_(std::move(sandbox)),
      normalizer_(std::move(normalizer)),
      store_(std::move(store)),
      limits_(limits) {}

Result<AuditRecord> ValidationPipeline::check_input(const std::string& prompt,
                                                    const std::string& generated_code) const {
    if (utils::is_blank(prompt)) {
        return Result<AuditRecord>::error(ErrorCategory::INVALID_INPUT, "prompt must not be empty");
    }
    if (utils::is_blank(generated_code)) {
        return Result<AuditRecord>::error(ErrorCategory::INVALID_INPUT, "generated_code must not be empty");
    }
    // libpq takes text parameters as C strings; an embedded NUL would cut the stored row short
    if (prompt.find('\0') != std::string::npos) {
        return Result<AuditRecord>::error(ErrorCategory::INVALID_INPUT, "prompt must not contain NUL bytes");
    }
    if (generated_code.find('\0') != std::string::npos) {
        return Result<AuditRecord>::error(ErrorCategory::INVALID_INPUT, "generated_code must not contain NUL bytes");
    }
    if (prompt.size() > limits_.max_prompt_bytes) {
        return Result<AuditRecord>::error(ErrorCategory::INVALID_INPUT,
            std::format("prompt exceeds {} bytes", limits_.max_prompt_bytes));
    }
    if (generated_code.size() > limits_.max_code_bytes) {
        return Result<AuditRecord>::error(ErrorCategory::INVALID_INPUT,
            std::format("generated_code exceeds {} bytes", limits_.max_code_bytes));
    }
    return Result<AuditRecord>::ok({});
}

Result<AuditRecord> ValidationPipeline::validate(const std::string& prompt,
                                                 const std::string& generated_code) const {
    if (auto rejected = check_input(prompt, generated_code); rejected.is_error()) {
        return rejected;
    }

    const std::string run_id = utils::generate_uuid();
    const SandboxOutcome outcome = sandbox_->run(generated_code, run_id);

    if (outcome.status == SandboxStatus::INFRASTRUCTURE_ERROR) {
        utils::log::error(std::format("Sandbox run {} failed: {}", run_id, outcome.error_message));
        return Result<AuditRecord>::error(ErrorCategory::INFRASTRUCTURE_ERROR,
            std::format("code validation unavailable: {}", outcome.error_message));
    }

    AuditRecord record;
    record.prompt = prompt;
    record.generated_code = generated_code;
    record.diagnostic = normalizer_.diagnose(outcome);
    record.is_valid = !record.diagnostic.has_value();
    record.id = utils::generate_uuid();
    record.created_at = utils::now();

    utils::log::info(std::format("Verdict {}: valid={} status={} wall={}ms",
        record.id, utils::booltostr(record.is_valid),
        sandbox_status_to_string(outcome.status), outcome.wall_time.count()));
    if (record.diagnostic) {
        utils::log::debug(std::format("Diagnostic for {}: {}", record.id, *record.diagnostic));
    }

    auto stored = store_->append(record);
    if (stored.is_error()) {
        utils::log::error(std::format("Failed to store audit {}: {}", record.id, stored.error_message()));
    }
    return stored;
}

} // namespace codeauditor
