#pragma once

#include "core/result.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>

namespace ledmark::storage {

/**
 * Map an SQLite result code onto an ErrorKind. Lock contention becomes
 * ResourceBusy; file-level failures become IOFailure.
 */
[[nodiscard]] ErrorKind error_kind_for(int sqlite_rc);

/**
 * SQLite statement wrapper with RAII.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt, sqlite3* db)
        : stmt_(stmt, sqlite3_finalize), db_(db) {}

    // Bind helpers
    Result<void, Error> bind_text(int index, std::string_view text);
    Result<void, Error> bind_int64(int index, int64_t value);
    Result<void, Error> bind_null(int index);

    /**
     * Bind positional parameters 1..N, stopping at the first failure.
     * Integral values bind as int64, nullopt/nullptr as NULL.
     */
    template<typename... Args>
    Result<void, Error> bind_all(const Args&... args) {
        int index = 0;
        auto result = Result<void, Error>::ok();
        ((result.is_ok() ? (result = bind_value(++index, args), 0) : 0), ...);
        return result;
    }

    // Column getters
    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;

    // Execute
    Result<bool, Error> step();  // Returns true if there's a row

private:
    Result<void, Error> bind_value(int index, std::nullptr_t) { return bind_null(index); }
    Result<void, Error> bind_value(int index, std::string_view text) { return bind_text(index, text); }
    Result<void, Error> bind_value(int index, const std::string& text) { return bind_text(index, text); }
    Result<void, Error> bind_value(int index, const char* text) { return bind_text(index, text); }

    template<typename T>
        requires std::is_integral_v<T>
    Result<void, Error> bind_value(int index, T value) {
        return bind_int64(index, static_cast<int64_t>(value));
    }

    template<typename T>
    Result<void, Error> bind_value(int index, const std::optional<T>& value) {
        if (!value) return bind_null(index);
        return bind_value(index, *value);
    }

    std::shared_ptr<sqlite3_stmt> stmt_;
    sqlite3* db_ = nullptr;
};

/**
 * Database - connection to an existing places database.
 *
 * Connections never wait for locks: busy_timeout is 0, so contention with a
 * running browser surfaces immediately as ResourceBusy.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    /**
     * Open an existing database read-write. A missing file is an IOFailure,
     * never silently created.
     */
    [[nodiscard]] static Result<Database, Error> open(const std::string& path);

    /**
     * Open or create a database (test fixtures).
     */
    [[nodiscard]] static Result<Database, Error> create(const std::string& path);

    void close();

    [[nodiscard]] Result<Statement, Error> prepare(const std::string& sql);
    [[nodiscard]] Result<void, Error> execute(const std::string& sql);

    /**
     * Take the write lock up front (BEGIN IMMEDIATE).
     */
    [[nodiscard]] Result<void, Error> begin_immediate();
    [[nodiscard]] Result<void, Error> commit();
    [[nodiscard]] Result<void, Error> rollback();

    /**
     * Column names of `table`; empty when the table does not exist.
     */
    [[nodiscard]] Result<std::set<std::string>, Error> table_columns(const std::string& table);

    [[nodiscard]] int64_t last_insert_rowid() const;
    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    [[nodiscard]] static Result<Database, Error> open_with_flags(const std::string& path, int flags);

    sqlite3* db_ = nullptr;
};

/**
 * Transaction RAII guard (BEGIN IMMEDIATE).
 * Automatically rolls back if not explicitly committed.
 */
class TransactionGuard {
public:
    explicit TransactionGuard(Database& db);
    ~TransactionGuard();

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    /**
     * Error from BEGIN, if the transaction could not be started.
     */
    [[nodiscard]] const Result<void, Error>& begin_result() const { return begin_; }

    [[nodiscard]] Result<void, Error> commit();
    void rollback();

private:
    Database& db_;
    Result<void, Error> begin_;
    bool active_ = false;
};

} // namespace ledmark::storage
