#include <citestream/storage/database.h>

#include <spdlog/spdlog.h>

namespace citestream::storage {

namespace {

constexpr int kBusyTimeoutMs = 5000;

Error sqliteError(sqlite3* db, const std::string& what) {
    return Error{ErrorCode::DatabaseError,
                 what + ": " + (db ? sqlite3_errmsg(db) : "no connection")};
}

} // namespace

// ---------------------------------------------------------------------------
// Statement
// ---------------------------------------------------------------------------

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept : stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

Result<void> Statement::check(int rc, const char* what) const {
    if (rc == SQLITE_OK) {
        return {};
    }
    return Error{ErrorCode::DatabaseError, std::string(what) + ": " + sqlite3_errstr(rc)};
}

Result<void> Statement::bind(int index, std::nullptr_t) {
    return check(sqlite3_bind_null(stmt_, index), "bind null");
}

Result<void> Statement::bind(int index, int64_t value) {
    return check(sqlite3_bind_int64(stmt_, index, value), "bind integer");
}

Result<void> Statement::bind(int index, double value) {
    return check(sqlite3_bind_double(stmt_, index, value), "bind real");
}

Result<void> Statement::bind(int index, std::string_view value) {
    return check(sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                                   SQLITE_TRANSIENT),
                 "bind text");
}

Result<void> Statement::run() {
    auto row = next();
    if (!row) {
        return row.error();
    }
    if (row.value()) {
        return Error{ErrorCode::DatabaseError, "Statement returned rows"};
    }
    return {};
}

Result<bool> Statement::next() {
    if (!stmt_) {
        return Error{ErrorCode::InvalidState, "Statement not prepared"};
    }
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    return sqliteError(sqlite3_db_handle(stmt_), "step");
}

Result<void> Statement::rewind() {
    if (!stmt_) {
        return Error{ErrorCode::InvalidState, "Statement not prepared"};
    }
    // sqlite3_reset reports the error of the last step, which the caller already saw
    sqlite3_reset(stmt_);
    return check(sqlite3_clear_bindings(stmt_), "clear bindings");
}

int64_t Statement::columnInt(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

double Statement::columnDouble(int column) const {
    return sqlite3_column_double(stmt_, column);
}

std::string Statement::columnText(int column) const {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, column));
    if (!text) {
        return {};
    }
    return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

std::optional<std::string> Statement::columnOptionalText(int column) const {
    if (sqlite3_column_type(stmt_, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    return columnText(column);
}

// ---------------------------------------------------------------------------
// Database
// ---------------------------------------------------------------------------

Result<Database> Database::open(const std::string& path) {
    const bool inMemory = path.empty() || path == ":memory:";
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    if (inMemory) {
        flags |= SQLITE_OPEN_MEMORY;
    }

    Database db;
    db.path_ = inMemory ? ":memory:" : path;
    const int rc = sqlite3_open_v2(db.path_.c_str(), &db.db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        auto error = sqliteError(db.db_, "open " + db.path_);
        db.close();
        return error;
    }
    sqlite3_busy_timeout(db.db_, kBusyTimeoutMs);

    if (!inMemory) {
        if (auto wal = db.exec("PRAGMA journal_mode=WAL"); !wal) {
            spdlog::warn("[Database] WAL not enabled for {}: {}", db.path_, wal.error().message);
        }
    }
    return db;
}

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)), inTransaction_(other.inTransaction_) {
    other.db_ = nullptr;
    other.inTransaction_ = false;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        path_ = std::move(other.path_);
        inTransaction_ = other.inTransaction_;
        other.db_ = nullptr;
        other.inTransaction_ = false;
    }
    return *this;
}

void Database::close() noexcept {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
    inTransaction_ = false;
}

Result<void> Database::exec(const char* sql) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }
    char* message = nullptr;
    const int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &message);
    if (rc != SQLITE_OK) {
        std::string error = message ? message : sqlite3_errstr(rc);
        sqlite3_free(message);
        return Error{ErrorCode::DatabaseError, error};
    }
    return {};
}

Result<void> Database::executeScript(const std::string& sql) {
    auto result = exec(sql.c_str());
    if (!result) {
        spdlog::error("[Database] script failed on {}: {}", path_, result.error().message);
    }
    return result;
}

Result<Statement> Database::prepare(std::string_view sql) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }
    sqlite3_stmt* stmt = nullptr;
    const int rc =
        sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return sqliteError(db_, "prepare");
    }
    return Statement(stmt);
}

void Database::rollback() {
    inTransaction_ = false;
    if (auto rb = exec("ROLLBACK"); !rb) {
        spdlog::warn("[Database] rollback failed on {}: {}", path_, rb.error().message);
    }
}

int64_t Database::lastInsertRowId() const {
    return db_ ? sqlite3_last_insert_rowid(db_) : 0;
}

} // namespace citestream::storage
