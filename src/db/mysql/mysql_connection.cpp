#include "db/mysql/mysql_connection.hpp"
#include "registry/descriptor_parser.hpp"
#include "core/utils.hpp"
#include <cstring>
#include <format>
#include <memory>
#include <vector>

namespace querydesk {

namespace {

DbResultSet failure(std::string message) {
    DbResultSet r;
    r.success = false;
    r.error_message = std::move(message);
    return r;
}

} // namespace

MysqlConnection::MysqlConnection(MYSQL* conn, MysqlConnParams params)
    : conn_(conn),
      params_(std::move(params)),
      thread_id_(conn ? mysql_thread_id(conn) : 0) {}

MysqlConnection::~MysqlConnection() {
    close();
}

DbResultSet MysqlConnection::execute(const std::string& sql, size_t max_rows) {
    if (!conn_) {
        return failure("Connection is closed");
    }

    if (mysql_real_query(conn_, sql.c_str(), static_cast<unsigned long>(sql.size())) != 0) {
        return failure(mysql_error(conn_));
    }

    // Bounded reads stream rows instead of buffering the whole result
    MYSQL_RES* res = (max_rows > 0) ? mysql_use_result(conn_) : mysql_store_result(conn_);
    if (res) {
        auto result = process_result_set(res, max_rows);
        // Frees the result and discards rows that were not fetched
        mysql_free_result(res);
        return result;
    }

    // No result set: either DML/DDL or error
    if (mysql_field_count(conn_) == 0) {
        return process_affected_rows();
    }
    return failure(mysql_error(conn_));
}

DbResultSet MysqlConnection::execute_params(const std::string& sql, const std::vector<Cell>& params) {
    if (!conn_) {
        return failure("Connection is closed");
    }

    MYSQL_STMT* stmt = mysql_stmt_init(conn_);
    if (!stmt) {
        return failure(mysql_error(conn_));
    }
    // Closes the statement on every return path
    const std::unique_ptr<MYSQL_STMT, decltype(&mysql_stmt_close)> guard(stmt, &mysql_stmt_close);

    if (mysql_stmt_prepare(stmt, sql.c_str(), static_cast<unsigned long>(sql.size())) != 0) {
        return failure(mysql_stmt_error(stmt));
    }

    const unsigned long expected = mysql_stmt_param_count(stmt);
    if (expected != params.size()) {
        return failure(std::format("Statement uses {} placeholders but {} values were bound",
                                   expected, params.size()));
    }

    // Values travel as MYSQL_TYPE_STRING; the server converts to the column type
    std::vector<MYSQL_BIND> binds(params.size());
    std::vector<unsigned long> lengths(params.size(), 0);
    auto nulls = std::make_unique<MysqlBindFlag[]>(params.size());
    for (size_t i = 0; i < params.size(); ++i) {
        std::memset(&binds[i], 0, sizeof(MYSQL_BIND));
        binds[i].buffer_type = MYSQL_TYPE_STRING;
        if (params[i]) {
            binds[i].buffer = const_cast<char*>(params[i]->data());
            binds[i].buffer_length = static_cast<unsigned long>(params[i]->size());
            lengths[i] = static_cast<unsigned long>(params[i]->size());
        } else {
            nulls[i] = 1;
        }
        binds[i].length = &lengths[i];
        binds[i].is_null = &nulls[i];
    }
    if (!binds.empty() && mysql_stmt_bind_param(stmt, binds.data()) != 0) {
        return failure(mysql_stmt_error(stmt));
    }

    if (mysql_stmt_execute(stmt) != 0) {
        return failure(mysql_stmt_error(stmt));
    }

    MYSQL_RES* meta = mysql_stmt_result_metadata(stmt);
    if (!meta) {
        if (mysql_stmt_field_count(stmt) != 0) {
            return failure(mysql_stmt_error(stmt));
        }
        DbResultSet result;
        result.success = true;
        result.affected_rows = static_cast<uint64_t>(mysql_stmt_affected_rows(stmt));
        return result;
    }
    auto result = process_statement_rows(stmt, meta);
    mysql_free_result(meta);
    return result;
}

DbResultSet MysqlConnection::process_statement_rows(MYSQL_STMT* stmt, MYSQL_RES* meta) {
    static constexpr unsigned long kInitialCellBuffer = 256;

    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const unsigned int num_fields = mysql_num_fields(meta);
    MYSQL_FIELD* fields = mysql_fetch_fields(meta);
    result.column_names.reserve(num_fields);
    for (unsigned int i = 0; i < num_fields; ++i) {
        result.column_names.emplace_back(fields[i].name);
    }

    // Every column is fetched as text; long cells are re-read after truncation
    std::vector<std::string> buffers(num_fields, std::string(kInitialCellBuffer, '\0'));
    std::vector<unsigned long> lengths(num_fields, 0);
    auto nulls = std::make_unique<MysqlBindFlag[]>(num_fields);
    std::vector<MYSQL_BIND> binds(num_fields);
    for (unsigned int i = 0; i < num_fields; ++i) {
        std::memset(&binds[i], 0, sizeof(MYSQL_BIND));
        binds[i].buffer_type = MYSQL_TYPE_STRING;
        binds[i].buffer = buffers[i].data();
        binds[i].buffer_length = kInitialCellBuffer;
        binds[i].length = &lengths[i];
        binds[i].is_null = &nulls[i];
    }
    if (num_fields > 0 && mysql_stmt_bind_result(stmt, binds.data()) != 0) {
        return failure(mysql_stmt_error(stmt));
    }

    while (true) {
        const int rc = mysql_stmt_fetch(stmt);
        if (rc == MYSQL_NO_DATA) {
            break;
        }
        if (rc == 1) {
            return failure(mysql_stmt_error(stmt));
        }

        Row row_data;
        row_data.reserve(num_fields);
        for (unsigned int i = 0; i < num_fields; ++i) {
            if (nulls[i]) {
                row_data.emplace_back(std::nullopt);
                continue;
            }
            if (lengths[i] <= binds[i].buffer_length) {
                row_data.emplace_back(std::string(buffers[i].data(), lengths[i]));
                continue;
            }
            std::string full(lengths[i], '\0');
            MYSQL_BIND column{};
            unsigned long column_length = 0;
            column.buffer_type = MYSQL_TYPE_STRING;
            column.buffer = full.data();
            column.buffer_length = lengths[i];
            column.length = &column_length;
            if (mysql_stmt_fetch_column(stmt, &column, i, 0) != 0) {
                return failure(mysql_stmt_error(stmt));
            }
            full.resize(column_length);
            row_data.emplace_back(std::move(full));
        }
        result.rows.push_back(std::move(row_data));
    }
    return result;
}

DbResultSet MysqlConnection::process_result_set(MYSQL_RES* res, size_t max_rows) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const unsigned int num_fields = mysql_num_fields(res);
    MYSQL_FIELD* fields = mysql_fetch_fields(res);

    result.column_names.reserve(num_fields);
    for (unsigned int i = 0; i < num_fields; ++i) {
        result.column_names.emplace_back(fields[i].name);
    }

    MYSQL_ROW row;
    while ((max_rows == 0 || result.rows.size() < max_rows) &&
           (row = mysql_fetch_row(res)) != nullptr) {
        const unsigned long* lengths = mysql_fetch_lengths(res);
        Row row_data;
        row_data.reserve(num_fields);

        for (unsigned int i = 0; i < num_fields; ++i) {
            if (row[i]) {
                row_data.emplace_back(std::string(row[i], lengths[i]));
            } else {
                row_data.emplace_back(std::nullopt);
            }
        }

        result.rows.push_back(std::move(row_data));
    }

    // mysql_use_result reports fetch errors only through errno
    if (mysql_errno(conn_) != 0) {
        return failure(mysql_error(conn_));
    }
    return result;
}

DbResultSet MysqlConnection::process_affected_rows() {
    DbResultSet result;
    result.success = true;
    result.has_rows = false;
    result.affected_rows = static_cast<uint64_t>(mysql_affected_rows(conn_));
    return result;
}

bool MysqlConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_) {
        return false;
    }

    // Fast ping check
    if (mysql_ping(conn_) != 0) {
        return false;
    }

    if (!health_check_query.empty()) {
        if (mysql_query(conn_, health_check_query.c_str()) != 0) {
            return false;
        }
        MYSQL_RES* res = mysql_store_result(conn_);
        if (res) {
            mysql_free_result(res);
        }
    }

    return true;
}

bool MysqlConnection::is_connected() const {
    return conn_ != nullptr;
}

bool MysqlConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!conn_) {
        return false;
    }

    // MySQL 5.7.8+; MariaDB rejects the variable and keeps running without it
    const std::string sql = std::format("SET SESSION max_execution_time = {}", timeout_ms);
    return mysql_query(conn_, sql.c_str()) == 0;
}

void MysqlConnection::interrupt() {
    if (thread_id_ == 0) return;

    std::string error;
    MYSQL* side = MysqlConnectionFactory::open(params_, error);
    if (!side) {
        utils::log::debug(std::format("KILL QUERY side connection failed: {}", error));
        return;
    }
    const std::string sql = std::format("KILL QUERY {}", thread_id_);
    if (mysql_query(side, sql.c_str()) != 0) {
        utils::log::debug(std::format("KILL QUERY {} failed: {}", thread_id_, mysql_error(side)));
    }
    mysql_close(side);
}

void MysqlConnection::close() {
    if (conn_) {
        mysql_close(conn_);
        conn_ = nullptr;
    }
}

std::string MysqlConnection::quote_identifier(std::string_view ident) const {
    std::string out = "`";
    for (const char c : ident) {
        if (c == '`') out += '`';
        out += c;
    }
    out += '`';
    return out;
}

std::string MysqlConnection::placeholder(size_t) const {
    return "?";
}

// ============================================================================
// MysqlConnectionFactory
// ============================================================================

MYSQL* MysqlConnectionFactory::open(const MysqlConnParams& params, std::string& error) {
    MYSQL* conn = mysql_init(nullptr);
    if (!conn) {
        error = "mysql_init failed";
        return nullptr;
    }

    unsigned int timeout = params.connect_timeout_s;
    mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);
    mysql_options(conn, MYSQL_SET_CHARSET_NAME, params.charset.c_str());

    MYSQL* result = mysql_real_connect(
        conn,
        params.host.c_str(),
        params.user.c_str(),
        params.password.c_str(),
        params.database.empty() ? nullptr : params.database.c_str(),
        params.port,
        nullptr,  // unix socket
        0         // client flags
    );

    if (!result) {
        error = mysql_error(conn);
        mysql_close(conn);
        return nullptr;
    }
    return conn;
}

Result<std::unique_ptr<IDbConnection>> MysqlConnectionFactory::create(
    const std::string& connection_string) {

    using R = Result<std::unique_ptr<IDbConnection>>;

    auto parsed = parse_connection_string(connection_string);
    if (parsed.is_error()) {
        return R::error_from(parsed);
    }

    std::string error;
    MYSQL* conn = open(parsed.value(), error);
    if (!conn) {
        utils::log::debug(std::format("MySQL connection failed: {}", error));
        return R::error(ErrorCategory::UNAVAILABLE, std::move(error));
    }

    return R::ok(std::make_unique<MysqlConnection>(conn, std::move(parsed.value())));
}

Result<MysqlConnParams> MysqlConnectionFactory::parse_connection_string(const std::string& conn_str) {
    auto fields = DescriptorParser::parse_uri(conn_str);
    if (fields.is_error()) {
        return Result<MysqlConnParams>::error_from(fields);
    }
    auto& f = fields.value();

    MysqlConnParams params;
    if (!f.host.empty()) params.host = f.host;
    if (f.port) params.port = *f.port;
    params.user = f.user.value_or("");
    params.password = f.password.value_or("");
    params.database = f.database;
    if (auto t = f.params.get("connect_timeout")) {
        params.connect_timeout_s = utils::parse_int<unsigned int>(*t, params.connect_timeout_s);
    }
    if (auto cs = f.params.get("charset")) params.charset = *cs;
    return Result<MysqlConnParams>::ok(std::move(params));
}

} // namespace querydesk
