#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace codeauditor {

/// Characters (code points) of a diagnostic used as its grouping key.
inline constexpr size_t kDiagnosticGroupPrefix = 200;

/**
 * @brief Append-only store of AuditRecords
 *
 * append() is the only mutation and is atomic: a record is either fully
 * visible or not at all. Reads observe a read-committed snapshot.
 * All methods are thread-safe. Failures surface as STORAGE_ERROR.
 */
class IAuditStore {
public:
    virtual ~IAuditStore() = default;

    /**
     * @brief Persist a fully-formed record (id and created_at already set)
     * @return The stored record
     */
    [[nodiscard]] virtual Result<AuditRecord> append(const AuditRecord& record) = 0;

    /// Newest first (created_at DESC, id DESC on ties).
    [[nodiscard]] virtual Result<std::vector<AuditRecord>> list_recent(size_t limit, size_t offset) = 0;

    /// nullopt value when no record has this id.
    [[nodiscard]] virtual Result<std::optional<AuditRecord>> find_by_id(const std::string& id) = 0;

    [[nodiscard]] virtual Result<ValidityCounts> count_by_validity() = 0;

    /**
     * @brief Most frequent diagnostics, grouped by their first
     *        kDiagnosticGroupPrefix characters, highest count first
     */
    [[nodiscard]] virtual Result<std::vector<DiagnosticFrequency>> top_diagnostics(size_t limit) = 0;
};

} // namespace codeauditor
