#pragma once

#include <citestream/core/types.h>

#include <sqlite3.h>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace citestream::storage {

/**
 * @brief Prepared SQLite statement, finalized on destruction.
 *
 * Parameters are 1-based and columns 0-based, as in SQLite. A statement is reused across rows
 * with rewind().
 */
class Statement {
public:
    Statement() = default;
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int value) { return bind(index, static_cast<int64_t>(value)); }
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, double value);
    Result<void> bind(int index, std::string_view value);

    /// Binds NULL for an empty optional
    template <typename T> Result<void> bind(int index, const std::optional<T>& value) {
        if (!value) {
            return bind(index, nullptr);
        }
        return bind(index, *value);
    }

    /// Binds `args` to parameters 1..N, stopping at the first failure
    template <typename... Args> Result<void> bindAll(const Args&... args) {
        int index = 0;
        Result<void> result;
        (void)((result = bind(++index, args), static_cast<bool>(result)) && ...);
        return result;
    }

    /// Run a statement that returns no rows
    Result<void> run();

    /// Advance to the next row; false once the result set is exhausted
    Result<bool> next();

    /// Rewind and clear every binding
    Result<void> rewind();

    int64_t columnInt(int column) const;
    double columnDouble(int column) const;
    std::string columnText(int column) const;
    std::optional<std::string> columnOptionalText(int column) const;

private:
    friend class Database;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}

    Result<void> check(int rc, const char* what) const;

    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief Single SQLite connection.
 *
 * Not thread-safe; callers serialise access (the citation store holds a mutex).
 */
class Database {
public:
    /**
     * @brief Open `path`, creating the file if needed.
     *
     * ":memory:" opens a private in-memory database. File databases run in WAL mode with a
     * busy timeout so readers in other processes do not block writes.
     */
    static Result<Database> open(const std::string& path);

    Database() = default;
    ~Database();

    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    [[nodiscard]] bool isOpen() const { return db_ != nullptr; }
    [[nodiscard]] const std::string& path() const { return path_; }

    /// Run one or more `;`-separated statements (schema setup)
    Result<void> executeScript(const std::string& sql);

    Result<Statement> prepare(std::string_view sql);

    /**
     * @brief Run `func` inside BEGIN IMMEDIATE / COMMIT.
     *
     * Rolled back when `func` returns an error or throws; the exception is rethrown.
     */
    template <typename Func> Result<void> transaction(Func&& func) {
        if (inTransaction_) {
            return Error{ErrorCode::InvalidState, "Transaction already open"};
        }
        if (auto begin = exec("BEGIN IMMEDIATE"); !begin) {
            return begin;
        }
        inTransaction_ = true;

        Result<void> result;
        try {
            result = func();
        } catch (...) {
            rollback();
            throw;
        }
        if (!result) {
            rollback();
            return result;
        }
        auto committed = exec("COMMIT");
        if (!committed) {
            rollback();
            return committed;
        }
        inTransaction_ = false;
        return {};
    }

    int64_t lastInsertRowId() const;

private:
    Result<void> exec(const char* sql);
    void rollback();
    void close() noexcept;

    sqlite3* db_ = nullptr;
    std::string path_;
    bool inTransaction_ = false;
};

} // namespace citestream::storage
