#include "store/pg_audit_store.hpp"
#include "db/pooled_connection.hpp"
#include "core/utils.hpp"

#include <format>

namespace codeauditor {

namespace {

constexpr const char* kSelectColumns =
    "id::text, prompt, generated_code, is_valid, diagnostic,"
    " (EXTRACT(EPOCH FROM created_at) * 1000)::bigint";

constexpr const char* kInsertSql =
    "INSERT INTO ai_audits (id, prompt, generated_code, is_valid, diagnostic, created_at)"
    " VALUES ($1::uuid, $2, $3, $4::boolean, $5, $6::timestamptz)";

constexpr const char* kCountSql =
    "SELECT COUNT(*) FILTER (WHERE is_valid), COUNT(*) FILTER (WHERE NOT is_valid)"
    " FROM ai_audits";

constexpr const char* kTopDiagnosticsSql =
    "SELECT LEFT(diagnostic, 200) AS prefix, COUNT(*) AS occurrences"
    " FROM ai_audits WHERE diagnostic IS NOT NULL"
    " GROUP BY prefix ORDER BY occurrences DESC, prefix ASC LIMIT $1";

/**
 * Run `fn` on a pooled connection. Pool exhaustion or an unreachable
 * database becomes STORAGE_ERROR.
 */
template<typename T, typename Fn>
Result<T> with_connection(IConnectionPool& pool, std::chrono::milliseconds timeout,
                          std::string_view operation, Fn&& fn) {
    auto conn = pool.acquire(timeout);
    if (!conn || !conn->is_valid()) {
        utils::log::error(std::format("{}: no database connection available", operation));
        return Result<T>::error(ErrorCategory::STORAGE_ERROR, "database unavailable");
    }
    return fn(*conn->get());
}

template<typename T>
Result<T> query_failed(std::string_view operation, const DbResultSet& rs) {
    utils::log::error(std::format("{} failed: {}", operation, rs.error_message));
    return Result<T>::error(ErrorCategory::STORAGE_ERROR,
                            std::format("{} failed: {}", operation, rs.error_message));
}

uint64_t to_count(const DbValue& v) {
    return v ? utils::try_parse_int<uint64_t>(*v).value_or(0) : 0;
}

AuditRecord row_to_record(const std::vector<DbValue>& row) {
    AuditRecord r;
    r.id = row.at(0).value_or("");
    r.prompt = row.at(1).value_or("");
    r.generated_code = row.at(2).value_or("");
    r.is_valid = row.at(3).value_or("f") == "t";
    r.diagnostic = row.at(4);
    const auto millis = row.at(5) ? utils::try_parse_int<int64_t>(*row.at(5)) : std::nullopt;
    r.created_at = utils::from_epoch_millis(millis.value_or(0));
    return r;
}

} // anonymous namespace

PgAuditStore::PgAuditStore(std::shared_ptr<IConnectionPool> pool,
                           std::chrono::milliseconds acquire_timeout)
    : pool_(std::move(pool)), acquire_timeout_(acquire_timeout) {}

Result<bool> PgAuditStore::ensure_schema() {
    return with_connection<bool>(*pool_, acquire_timeout_, "ensure_schema",
        [](IDbConnection& conn) {
            const auto rs = conn.execute(std::string(kSchemaSql));
            if (!rs.success) return query_failed<bool>("ensure_schema", rs);
            return Result<bool>::ok(true);
        });
}

Result<AuditRecord> PgAuditStore::append(const AuditRecord& record) {
    return with_connection<AuditRecord>(*pool_, acquire_timeout_, "append",
        [&record](IDbConnection& conn) {
            const auto rs = conn.execute_params(kInsertSql, {
                record.id,
                record.prompt,
                record.generated_code,
                std::string(utils::booltostr(record.is_valid)),
                record.diagnostic,
                utils::format_timestamp_utc(record.created_at),
            });
            if (!rs.success) return query_failed<AuditRecord>("append", rs);
            return Result<AuditRecord>::ok(record);
        });
}

Result<std::vector<AuditRecord>> PgAuditStore::list_recent(size_t limit, size_t offset) {
    using R = Result<std::vector<AuditRecord>>;
    return with_connection<std::vector<AuditRecord>>(*pool_, acquire_timeout_, "list_recent",
        [limit, offset](IDbConnection& conn) {
            const auto rs = conn.execute_params(
                std::format("SELECT {} FROM ai_audits ORDER BY created_at DESC, id DESC"
                            " LIMIT $1::bigint OFFSET $2::bigint", kSelectColumns),
                {std::to_string(limit), std::to_string(offset)});
            if (!rs.success) return query_failed<std::vector<AuditRecord>>("list_recent", rs);

            std::vector<AuditRecord> records;
            records.reserve(rs.rows.size());
            for (const auto& row : rs.rows) {
                records.push_back(row_to_record(row));
            }
            return R::ok(std::move(records));
        });
}

Result<std::optional<AuditRecord>> PgAuditStore::find_by_id(const std::string& id) {
    using R = Result<std::optional<AuditRecord>>;
    // Not a UUID: cannot exist, and would be a cast error server-side
    if (!utils::is_uuid(id)) {
        return R::ok(std::nullopt);
    }
    return with_connection<std::optional<AuditRecord>>(*pool_, acquire_timeout_, "find_by_id",
        [&id](IDbConnection& conn) {
            const auto rs = conn.execute_params(
                std::format("SELECT {} FROM ai_audits WHERE id = $1::uuid", kSelectColumns), {id});
            if (!rs.success) return query_failed<std::optional<AuditRecord>>("find_by_id", rs);
            if (rs.rows.empty()) return R::ok(std::nullopt);
            return R::ok(row_to_record(rs.rows.front()));
        });
}

Result<ValidityCounts> PgAuditStore::count_by_validity() {
    return with_connection<ValidityCounts>(*pool_, acquire_timeout_, "count_by_validity",
        [](IDbConnection& conn) {
            const auto rs = conn.execute(kCountSql);
            if (!rs.success || rs.rows.empty() || rs.rows.front().size() < 2) {
                return query_failed<ValidityCounts>("count_by_validity", rs);
            }
            ValidityCounts counts;
            counts.valid = to_count(rs.rows.front()[0]);
            counts.invalid = to_count(rs.rows.front()[1]);
            return Result<ValidityCounts>::ok(counts);
        });
}

Result<std::vector<DiagnosticFrequency>> PgAuditStore::top_diagnostics(size_t limit) {
    using R = Result<std::vector<DiagnosticFrequency>>;
    return with_connection<std::vector<DiagnosticFrequency>>(*pool_, acquire_timeout_, "top_diagnostics",
        [limit](IDbConnection& conn) {
            const auto rs = conn.execute_params(kTopDiagnosticsSql, {std::to_string(limit)});
            if (!rs.success) return query_failed<std::vector<DiagnosticFrequency>>("top_diagnostics", rs);

            std::vector<DiagnosticFrequency> top;
            top.reserve(rs.rows.size());
            for (const auto& row : rs.rows) {
                top.push_back({row.at(0).value_or(""), to_count(row.at(1))});
            }
            return R::ok(std::move(top));
        });
}

} // namespace codeauditor
