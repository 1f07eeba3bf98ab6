#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"
#include <cstring>
#include <format>

namespace codeauditor {

namespace {

std::string trimmed_error(const char* msg) {
    return utils::trim(msg ? msg : "unknown libpq error");
}

} // anonymous namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql) {
    if (!conn_) {
        return DbResultSet::failure("Connection is null");
    }
    return consume_result(PQexec(conn_, sql.c_str()));
}

DbResultSet PgConnection::execute_params(const std::string& sql, const std::vector<DbValue>& params) {
    if (!conn_) {
        return DbResultSet::failure("Connection is null");
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p ? p->c_str() : nullptr);
    }

    // paramTypes = nullptr lets the server infer types; all text format
    PGresult* res = PQexecParams(conn_, sql.c_str(), static_cast<int>(values.size()),
                                 nullptr, values.data(), nullptr, nullptr, 0);
    return consume_result(res);
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    if (!is_connected()) {
        return false;
    }

    PGresult* res = PQexec(conn_, health_check_query.c_str());
    if (!res) {
        return false;
    }

    const ExecStatusType status = PQresultStatus(res);
    PQclear(res);

    return status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK;
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::consume_result(PGresult* res) {
    if (!res) {
        return DbResultSet::failure(trimmed_error(PQerrorMessage(conn_)));
    }

    DbResultSet result;
    const ExecStatusType status = PQresultStatus(res);

    if (status == PGRES_TUPLES_OK) {
        result.success = true;
        result.has_rows = true;

        const int ncols = PQnfields(res);
        result.column_names.reserve(static_cast<size_t>(ncols));
        for (int c = 0; c < ncols; ++c) {
            result.column_names.emplace_back(PQfname(res, c));
        }

        const int nrows = PQntuples(res);
        result.rows.reserve(static_cast<size_t>(nrows));
        for (int r = 0; r < nrows; ++r) {
            std::vector<DbValue> row;
            row.reserve(static_cast<size_t>(ncols));
            for (int c = 0; c < ncols; ++c) {
                if (PQgetisnull(res, r, c)) {
                    row.emplace_back(std::nullopt);
                } else {
                    row.emplace_back(std::string(PQgetvalue(res, r, c),
                                                 static_cast<size_t>(PQgetlength(res, r, c))));
                }
            }
            result.rows.push_back(std::move(row));
        }
    } else if (status == PGRES_COMMAND_OK) {
        result.success = true;
        const char* affected = PQcmdTuples(res);
        if (affected && std::strlen(affected) > 0) {
            result.affected_rows = utils::try_parse_int<uint64_t>(affected).value_or(0);
        }
    } else {
        result.error_message = trimmed_error(PQresultErrorMessage(res));
    }

    PQclear(res);
    return result;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> PgConnectionFactory::create(
    const std::string& connection_string) {

    PGconn* conn = PQconnectdb(connection_string.c_str());

    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        return nullptr;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        utils::log::error(std::format("Failed to connect to PostgreSQL: {}",
                                      trimmed_error(PQerrorMessage(conn))));
        PQfinish(conn);
        return nullptr;
    }

    return std::make_unique<PgConnection>(conn);
}

} // namespace codeauditor
