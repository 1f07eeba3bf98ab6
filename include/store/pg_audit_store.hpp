#pragma once

#include "db/iconnection_pool.hpp"
#include "store/iaudit_store.hpp"

#include <chrono>
#include <memory>
#include <string_view>

namespace codeauditor {

/**
 * @brief IAuditStore backed by the PostgreSQL table `ai_audits`
 *
 * Every statement is parameterized and runs on a pooled connection. append()
 * is a single INSERT, so it is atomic without an explicit transaction.
 */
class PgAuditStore final : public IAuditStore {
public:
    /// DDL applied by ensure_schema(); also shipped as migrations/001_create_ai_audits.sql
    static constexpr std::string_view kSchemaSql =
        "CREATE TABLE IF NOT EXISTS ai_audits ("
        " id UUID PRIMARY KEY,"
        " prompt TEXT NOT NULL,"
        " generated_code TEXT NOT NULL,"
        " is_valid BOOLEAN NOT NULL,"
        " diagnostic TEXT,"
        " created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),"
        " CONSTRAINT ai_audits_validity_diagnostic CHECK ("
        "(is_valid AND diagnostic IS NULL) OR"
        " (NOT is_valid AND diagnostic IS NOT NULL AND diagnostic <> ''))"
        ");"
        "CREATE INDEX IF NOT EXISTS idx_ai_audits_created_at ON ai_audits (created_at DESC);";

    PgAuditStore(std::shared_ptr<IConnectionPool> pool,
                 std::chrono::milliseconds acquire_timeout = std::chrono::milliseconds{5000});

    /**
     * @brief Create table and index if missing
     * @return STORAGE_ERROR if the DDL cannot be applied
     */
    [[nodiscard]] Result<bool> ensure_schema();

    Result<AuditRecord> append(const AuditRecord& record) override;
    Result<std::vector<AuditRecord>> list_recent(size_t limit, size_t offset) override;
    Result<std::optional<AuditRecord>> find_by_id(const std::string& id) override;
    Result<ValidityCounts> count_by_validity() override;
    Result<std::vector<DiagnosticFrequency>> top_diagnostics(size_t limit) override;

private:
    std::shared_ptr<IConnectionPool> pool_;
    std::chrono::milliseconds acquire_timeout_;
};

} // namespace codeauditor
