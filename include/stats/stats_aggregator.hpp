#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "store/iaudit_store.hpp"

#include <memory>

namespace codeauditor {

/**
 * @brief Derives AuditSummary from an IAuditStore on demand
 *
 * Two bounded queries per call: one aggregate count and one top-N group-by.
 * validity_rate is valid / total, and 0.0 for an empty store.
 */
class StatsAggregator {
public:
    explicit StatsAggregator(std::shared_ptr<IAuditStore> store, size_t common_diagnostics_limit = 10);

    [[nodiscard]] Result<AuditSummary> summary() const;

private:
    std::shared_ptr<IAuditStore> store_;
    size_t common_diagnostics_limit_;
};

} // namespace codeauditor
