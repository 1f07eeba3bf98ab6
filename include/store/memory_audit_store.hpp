#pragma once

#include "store/iaudit_store.hpp"

#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace codeauditor {

/**
 * @brief In-process IAuditStore guarded by a shared_mutex
 *
 * Used by tests and by storage.backend = "memory". Contents are lost on exit.
 */
class MemoryAuditStore final : public IAuditStore {
public:
    MemoryAuditStore() = default;

    Result<AuditRecord> append(const AuditRecord& record) override;
    Result<std::vector<AuditRecord>> list_recent(size_t limit, size_t offset) override;
    Result<std::optional<AuditRecord>> find_by_id(const std::string& id) override;
    Result<ValidityCounts> count_by_validity() override;
    Result<std::vector<DiagnosticFrequency>> top_diagnostics(size_t limit) override;

    [[nodiscard]] size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::vector<AuditRecord> records_;                  // Insertion order
    std::unordered_map<std::string, size_t> by_id_;     // id -> index into records_
    ValidityCounts counts_;
};

} // namespace codeauditor
