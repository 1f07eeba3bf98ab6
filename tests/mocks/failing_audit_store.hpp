#pragma once

#include "store/memory_audit_store.hpp"
#include <atomic>

namespace codeauditor::testing {

/**
 * @brief MemoryAuditStore whose writes and/or reads can be switched to fail
 */
class FailingAuditStore : public IAuditStore {
public:
    void set_fail_writes(bool v) { fail_writes_ = v; }
    void set_fail_reads(bool v) { fail_reads_ = v; }

    Result<AuditRecord> append(const AuditRecord& record) override {
        if (fail_writes_) return fail<AuditRecord>();
        return inner_.append(record);
    }

    Result<std::vector<AuditRecord>> list_recent(size_t limit, size_t offset) override {
        if (fail_reads_) return fail<std::vector<AuditRecord>>();
        return inner_.list_recent(limit, offset);
    }

    Result<std::optional<AuditRecord>> find_by_id(const std::string& id) override {
        if (fail_reads_) return fail<std::optional<AuditRecord>>();
        return inner_.find_by_id(id);
    }

    Result<ValidityCounts> count_by_validity() override {
        if (fail_reads_) return fail<ValidityCounts>();
        return inner_.count_by_validity();
    }

    Result<std::vector<DiagnosticFrequency>> top_diagnostics(size_t limit) override {
        if (fail_reads_) return fail<std::vector<DiagnosticFrequency>>();
        return inner_.top_diagnostics(limit);
    }

    [[nodiscard]] size_t size() const { return inner_.size(); }

private:
    template<typename T>
    static Result<T> fail() {
        return Result<T>::error(ErrorCategory::STORAGE_ERROR, "database unavailable");
    }

    MemoryAuditStore inner_;
    std::atomic<bool> fail_writes_{false};
    std::atomic<bool> fail_reads_{false};
};

} // namespace codeauditor::testing
