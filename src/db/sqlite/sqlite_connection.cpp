#include "db/sqlite/sqlite_connection.hpp"
#include "core/utils.hpp"
#include <filesystem>
#include <format>

namespace querydesk {

namespace {

DbResultSet failure(std::string message) {
    DbResultSet r;
    r.success = false;
    r.error_message = std::move(message);
    return r;
}

Cell read_cell(sqlite3_stmt* stmt, int col) {
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_NULL:
            return std::nullopt;
        case SQLITE_BLOB: {
            const auto* data = static_cast<const char*>(sqlite3_column_blob(stmt, col));
            const int len = sqlite3_column_bytes(stmt, col);
            return std::string(data ? data : "", static_cast<size_t>(len));
        }
        default: {
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
            const int len = sqlite3_column_bytes(stmt, col);
            return std::string(text ? text : "", static_cast<size_t>(len));
        }
    }
}

bool blank(const char* tail) {
    return tail == nullptr || utils::trim(tail).empty();
}

} // namespace

// ============================================================================
// SqliteConnection
// ============================================================================

SqliteConnection::SqliteConnection(sqlite3* db) : db_(db) {}

SqliteConnection::~SqliteConnection() {
    close();
}

DbResultSet SqliteConnection::run_statement(sqlite3_stmt* stmt, size_t max_rows) {
    DbResultSet result;
    const int ncols = sqlite3_column_count(stmt);
    result.has_rows = ncols > 0;
    for (int i = 0; i < ncols; ++i) {
        const char* name = sqlite3_column_name(stmt, i);
        result.column_names.emplace_back(name ? name : "");
    }

    // sqlite3_changes keeps the previous DML count across DDL statements
    const int changes_before = sqlite3_total_changes(db_);

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Row row;
        row.reserve(static_cast<size_t>(ncols));
        for (int i = 0; i < ncols; ++i) {
            row.push_back(read_cell(stmt, i));
        }
        result.rows.push_back(std::move(row));
        if (max_rows > 0 && result.rows.size() >= max_rows) {
            rc = SQLITE_DONE;
            break;
        }
    }

    if (rc != SQLITE_DONE) {
        return failure(sqlite3_errmsg(db_));
    }
    result.success = true;
    if (!result.has_rows && sqlite3_total_changes(db_) != changes_before) {
        result.affected_rows = static_cast<uint64_t>(sqlite3_changes(db_));
    }
    return result;
}

DbResultSet SqliteConnection::execute(const std::string& sql, size_t max_rows) {
    if (!db_) {
        return failure("Connection is closed");
    }

    DbResultSet last;
    last.success = true;
    const char* cursor = sql.c_str();
    while (!blank(cursor)) {
        sqlite3_stmt* stmt = nullptr;
        const char* tail = nullptr;
        if (sqlite3_prepare_v2(db_, cursor, -1, &stmt, &tail) != SQLITE_OK) {
            return failure(sqlite3_errmsg(db_));
        }
        if (!stmt) {
            // Comment or whitespace only
            cursor = tail;
            continue;
        }
        last = run_statement(stmt, max_rows);
        sqlite3_finalize(stmt);
        if (!last.success) {
            return last;
        }
        cursor = tail;
    }
    return last;
}

DbResultSet SqliteConnection::execute_params(const std::string& sql, const std::vector<Cell>& params) {
    if (!db_) {
        return failure("Connection is closed");
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return failure(sqlite3_errmsg(db_));
    }

    const int expected = sqlite3_bind_parameter_count(stmt);
    if (static_cast<size_t>(expected) != params.size()) {
        sqlite3_finalize(stmt);
        return failure(std::format("Statement uses {} placeholders but {} values were bound",
                                   expected, params.size()));
    }

    for (size_t i = 0; i < params.size(); ++i) {
        const int idx = static_cast<int>(i) + 1;
        const int rc = params[i]
            ? sqlite3_bind_text(stmt, idx, params[i]->c_str(),
                                static_cast<int>(params[i]->size()), SQLITE_TRANSIENT)
            : sqlite3_bind_null(stmt, idx);
        if (rc != SQLITE_OK) {
            auto error = failure(sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return error;
        }
    }

    auto result = run_statement(stmt, 0);
    sqlite3_finalize(stmt);
    return result;
}

bool SqliteConnection::is_healthy(const std::string& health_check_query) {
    if (!db_) {
        return false;
    }
    if (health_check_query.empty()) {
        return true;
    }
    return execute(health_check_query).success;
}

bool SqliteConnection::is_connected() const {
    std::lock_guard<std::mutex> lock(handle_mutex_);
    return db_ != nullptr;
}

bool SqliteConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!db_) {
        return false;
    }
    return sqlite3_busy_timeout(db_, static_cast<int>(timeout_ms)) == SQLITE_OK;
}

void SqliteConnection::interrupt() {
    std::lock_guard<std::mutex> lock(handle_mutex_);
    if (db_) {
        sqlite3_interrupt(db_);
    }
}

void SqliteConnection::close() {
    std::lock_guard<std::mutex> lock(handle_mutex_);
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

std::string SqliteConnection::quote_identifier(std::string_view ident) const {
    std::string out = "\"";
    for (const char c : ident) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string SqliteConnection::placeholder(size_t) const {
    return "?";
}

// ============================================================================
// SqliteConnectionFactory
// ============================================================================

Result<std::unique_ptr<IDbConnection>> SqliteConnectionFactory::create(
    const std::string& connection_string) {

    using R = Result<std::unique_ptr<IDbConnection>>;

    std::error_code ec;
    if (!std::filesystem::exists(connection_string, ec)) {
        return R::error(ErrorCategory::NOT_FOUND,
            std::format("Database file not found: {}", connection_string));
    }

    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(connection_string.c_str(), &db,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close_v2(db);
        utils::log::debug(std::format("SQLite open failed for {}: {}", connection_string, error));
        return R::error(ErrorCategory::UNAVAILABLE, std::move(error));
    }

    // sqlite3_open_v2 accepts any existing file; the header is read lazily
    char* header_error = nullptr;
    if (sqlite3_exec(db, "PRAGMA schema_version", nullptr, nullptr, &header_error) != SQLITE_OK) {
        std::string error = header_error ? header_error : sqlite3_errmsg(db);
        sqlite3_free(header_error);
        sqlite3_close_v2(db);
        utils::log::debug(std::format("SQLite file {} is not usable: {}", connection_string, error));
        return R::error(ErrorCategory::UNAVAILABLE, std::move(error));
    }

    return R::ok(std::make_unique<SqliteConnection>(db));
}

} // namespace querydesk
