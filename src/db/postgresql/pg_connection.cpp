#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"
#include <cstring>
#include <format>

namespace querydesk {

namespace {

DbResultSet failure(std::string message) {
    DbResultSet r;
    r.success = false;
    r.error_message = utils::trim(message);
    return r;
}

Row read_row(PGresult* res, int row, int ncols) {
    Row out;
    out.reserve(static_cast<size_t>(ncols));
    for (int j = 0; j < ncols; j++) {
        if (PQgetisnull(res, row, j)) {
            out.emplace_back(std::nullopt);
        } else {
            out.emplace_back(std::string(PQgetvalue(res, row, j),
                                         static_cast<size_t>(PQgetlength(res, row, j))));
        }
    }
    return out;
}

} // namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn), cancel_(conn ? PQgetCancel(conn) : nullptr) {}

PgConnection::~PgConnection() {
    close();
}

std::string PgConnection::last_error() const {
    return conn_ ? PQerrorMessage(conn_) : "Connection is closed";
}

DbResultSet PgConnection::execute(const std::string& sql, size_t max_rows) {
    if (!conn_) {
        return failure("Connection is closed");
    }

    if (max_rows > 0) {
        return execute_bounded(sql, max_rows);
    }

    PGresult* res = PQexec(conn_, sql.c_str());

    if (!res) {
        return failure(last_error());
    }

    const ExecStatusType status = PQresultStatus(res);

    if (status == PGRES_TUPLES_OK) {
        auto result = process_tuples_result(res);
        PQclear(res);
        return result;
    }

    if (status == PGRES_COMMAND_OK || status == PGRES_EMPTY_QUERY) {
        auto result = process_command_result(res);
        PQclear(res);
        return result;
    }

    // Error case
    std::string error = PQresultErrorMessage(res);
    PQclear(res);
    return failure(error.empty() ? last_error() : error);
}

DbResultSet PgConnection::execute_bounded(const std::string& sql, size_t max_rows) {
    if (!PQsendQuery(conn_, sql.c_str())) {
        return failure(last_error());
    }
    const bool single_row = PQsetSingleRowMode(conn_) == 1;

    DbResultSet result;
    result.success = true;
    std::string error;

    // Every result must be consumed before the connection accepts another query
    while (PGresult* res = PQgetResult(conn_)) {
        const ExecStatusType status = PQresultStatus(res);
        if (status == PGRES_SINGLE_TUPLE || status == PGRES_TUPLES_OK) {
            result.has_rows = true;
            const int ncols = PQnfields(res);
            if (result.column_names.empty()) {
                for (int i = 0; i < ncols; i++) {
                    result.column_names.emplace_back(PQfname(res, i));
                }
            }
            const int nrows = PQntuples(res);
            for (int i = 0; i < nrows && result.rows.size() < max_rows; i++) {
                result.rows.push_back(read_row(res, i, ncols));
            }
        } else if (status == PGRES_COMMAND_OK || status == PGRES_EMPTY_QUERY) {
            const char* affected = PQcmdTuples(res);
            if (affected && std::strlen(affected) > 0) {
                result.affected_rows = utils::parse_int<uint64_t>(affected);
            }
        } else if (error.empty()) {
            error = PQresultErrorMessage(res);
        }
        PQclear(res);
    }

    if (!error.empty()) {
        return failure(error);
    }
    if (!single_row && result.rows.size() > max_rows) {
        result.rows.resize(max_rows);
    }
    return result;
}

DbResultSet PgConnection::execute_params(const std::string& sql, const std::vector<Cell>& params) {
    if (!conn_) {
        return failure("Connection is closed");
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p ? p->c_str() : nullptr);
    }

    PGresult* res = PQexecParams(conn_, sql.c_str(), static_cast<int>(values.size()),
                                 nullptr, values.data(), nullptr, nullptr, 0);
    if (!res) {
        return failure(last_error());
    }

    DbResultSet result;
    const ExecStatusType status = PQresultStatus(res);
    if (status == PGRES_TUPLES_OK) {
        result = process_tuples_result(res);
    } else if (status == PGRES_COMMAND_OK) {
        result = process_command_result(res);
    } else {
        result = failure(PQresultErrorMessage(res));
    }
    PQclear(res);
    return result;
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_) {
        return false;
    }

    if (PQstatus(conn_) != CONNECTION_OK) {
        return false;
    }

    PGresult* res = PQexec(conn_, health_check_query.c_str());
    if (!res) {
        return false;
    }

    const ExecStatusType status = PQresultStatus(res);
    PQclear(res);

    return (status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK);
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!conn_) {
        return false;
    }

    const std::string timeout_sql = std::format("SET statement_timeout = {}", timeout_ms);

    PGresult* res = PQexec(conn_, timeout_sql.c_str());
    if (!res) {
        return false;
    }

    const bool success = (PQresultStatus(res) == PGRES_COMMAND_OK);
    PQclear(res);
    return success;
}

void PgConnection::interrupt() {
    std::lock_guard lock(cancel_mutex_);
    if (!cancel_) return;

    char errbuf[256] = {0};
    if (!PQcancel(cancel_, errbuf, sizeof(errbuf))) {
        utils::log::debug(std::format("PQcancel failed: {}", errbuf));
    }
}

void PgConnection::close() {
    {
        std::lock_guard lock(cancel_mutex_);
        if (cancel_) {
            PQfreeCancel(cancel_);
            cancel_ = nullptr;
        }
    }
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

std::string PgConnection::quote_identifier(std::string_view ident) const {
    std::string out = "\"";
    for (const char c : ident) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string PgConnection::placeholder(size_t n) const {
    return std::format("${}", n);
}

DbResultSet PgConnection::process_tuples_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const int ncols = PQnfields(res);
    for (int i = 0; i < ncols; i++) {
        result.column_names.emplace_back(PQfname(res, i));
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(static_cast<size_t>(nrows));
    for (int i = 0; i < nrows; i++) {
        result.rows.push_back(read_row(res, i, ncols));
    }

    return result;
}

DbResultSet PgConnection::process_command_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = false;

    const char* affected = PQcmdTuples(res);
    if (affected && std::strlen(affected) > 0) {
        result.affected_rows = utils::parse_int<uint64_t>(affected);
    }

    return result;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

Result<std::unique_ptr<IDbConnection>> PgConnectionFactory::create(
    const std::string& connection_string) {

    using R = Result<std::unique_ptr<IDbConnection>>;

    PGconn* conn = PQconnectdb(connection_string.c_str());

    if (!conn) {
        return R::error(ErrorCategory::UNAVAILABLE, "Failed to allocate PGconn");
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        std::string message = utils::trim(PQerrorMessage(conn));
        PQfinish(conn);
        utils::log::debug(std::format("PostgreSQL connect failed: {}", message));
        return R::error(ErrorCategory::UNAVAILABLE, std::move(message));
    }

    return R::ok(std::make_unique<PgConnection>(conn));
}

} // namespace querydesk
