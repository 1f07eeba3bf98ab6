#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "diagnostic/diagnostic_normalizer.hpp"
#include "sandbox/sandbox_runner.hpp"
#include "store/iaudit_store.hpp"

#include <memory>
#include <string>

namespace codeauditor {

/**
 * @brief Validates one submission and records the verdict
 *
 * validate():
 *   1. Rejects blank or oversized input (INVALID_INPUT), before any sandbox work
 *   2. Compiles the code in the sandbox under a fresh run id
 *   3. INFRASTRUCTURE_ERROR aborts: nothing is stored
 *   4. Otherwise assigns id + created_at and appends the record
 *
 * Stateless across calls and safe to call concurrently.
 */
class ValidationPipeline {
public:
    ValidationPipeline(std::shared_ptr<ISandboxRunner> sandbox,
                       DiagnosticNormalizer normalizer,
                       std::shared_ptr<IAuditStore> store,
                       ValidationConfig limits = {});

    [[nodiscard]] Result<AuditRecord> validate(const std::string& prompt,
                                               const std::string& generated_code) const;

private:
    [[nodiscard]] Result<AuditRecord> check_input(const std::string& prompt,
                                                  const std::string& generated_code) const;

    std::shared_ptr<ISandboxRunner> sandbox_;
    DiagnosticNormalizer normalizer_;
    std::shared_ptr<IAuditStore> store_;
    ValidationConfig limits_;
};

} // namespace codeauditor
