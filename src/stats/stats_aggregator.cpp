#include "stats/stats_aggregator.hpp"

namespace codeauditor {

StatsAggregator::StatsAggregator(std::shared_ptr<IAuditStore> store, size_t common_diagnostics_limit)
    : store_(std::move(store)), common_diagnostics_limit_(common_diagnostics_limit) {}

Result<AuditSummary> StatsAggregator::summary() const {
    const auto counts = store_->count_by_validity();
    if (counts.is_error()) {
        return Result<AuditSummary>::error(counts.error_category(), counts.error_message());
    }

    auto top = store_->top_diagnostics(common_diagnostics_limit_);
    if (top.is_error()) {
        return Result<AuditSummary>::error(top.error_category(), top.error_message());
    }

    AuditSummary s;
    s.valid = counts.value().valid;
    s.invalid = counts.value().invalid;
    s.total = s.valid + s.invalid;
    s.validity_rate = s.total > 0
        ? static_cast<double>(s.valid) / static_cast<double>(s.total)
        : 0.0;
    s.common_diagnostics = std::move(top.value());
    return Result<AuditSummary>::ok(std::move(s));
}

} // namespace codeauditor
