#include "storage/database.hpp"

#include <QLoggingCategory>

namespace ledmark::storage {
namespace {

Q_LOGGING_CATEGORY(lmDatabaseLog, "ledmark.store")

Error sqlite_error(std::string message, int rc) {
    return Error{error_kind_for(rc), std::move(message), rc};
}

} // namespace

ErrorKind error_kind_for(int sqlite_rc) {
    switch (sqlite_rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return ErrorKind::ResourceBusy;
        case SQLITE_CANTOPEN:
        case SQLITE_IOERR:
        case SQLITE_READONLY:
        case SQLITE_PERM:
        case SQLITE_FULL:
        case SQLITE_NOTADB:
        case SQLITE_CORRUPT:
            return ErrorKind::IOFailure;
        default:
            return ErrorKind::Unknown;
    }
}

// ============================================================================
// Statement implementation
// ============================================================================

Result<void, Error> Statement::bind_text(int index, std::string_view text) {
    int rc = sqlite3_bind_text(stmt_.get(), index, text.data(),
                               static_cast<int>(text.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(sqlite_error("Failed to bind text", rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Statement::bind_int64(int index, int64_t value) {
    int rc = sqlite3_bind_int64(stmt_.get(), index, value);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(sqlite_error("Failed to bind int64", rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Statement::bind_null(int index) {
    int rc = sqlite3_bind_null(stmt_.get(), index);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(sqlite_error("Failed to bind null", rc));
    }
    return Result<void, Error>::ok();
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return "";
    return reinterpret_cast<const char*>(text);
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

Result<bool, Error> Statement::step() {
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Result<bool, Error>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool, Error>::ok(false);
    }
    std::string message = db_ ? sqlite3_errmsg(db_) : "Step failed";
    return Result<bool, Error>::err(sqlite_error(message, rc));
}

// ============================================================================
// Database implementation
// ============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        other.db_ = nullptr;
    }
    return *this;
}

Result<Database, Error> Database::open_with_flags(const std::string& path, int flags) {
    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db ? sqlite3_errmsg(db) : "Unknown error";
        if (db) sqlite3_close(db);
        return Result<Database, Error>::err(sqlite_error("Cannot open " + path + ": " + error, rc));
    }

    sqlite3_extended_result_codes(db, 0);
    sqlite3_busy_timeout(db, 0);

    return Result<Database, Error>::ok(Database(db));
}

Result<Database, Error> Database::open(const std::string& path) {
    return open_with_flags(path, SQLITE_OPEN_READWRITE);
}

Result<Database, Error> Database::create(const std::string& path) {
    return open_with_flags(path, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Result<Statement, Error> Database::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(),
                                static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(sqlite_error(last_error(), rc));
    }
    return Result<Statement, Error>::ok(Statement(stmt, db_));
}

Result<void, Error> Database::execute(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "Unknown error";
        sqlite3_free(error_msg);
        return Result<void, Error>::err(sqlite_error(error, rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Database::begin_immediate() {
    return execute("BEGIN IMMEDIATE;");
}

Result<void, Error> Database::commit() {
    return execute("COMMIT;");
}

Result<void, Error> Database::rollback() {
    return execute("ROLLBACK;");
}

Result<std::set<std::string>, Error> Database::table_columns(const std::string& table) {
    using R = Result<std::set<std::string>, Error>;

    auto stmt_result = prepare("SELECT name FROM pragma_table_info(?);");
    if (stmt_result.is_err()) return R::err(stmt_result.unwrap_err());

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_all(table);
    if (bound.is_err()) return R::err(bound.unwrap_err());

    std::set<std::string> columns;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) return R::err(step_result.unwrap_err());
        if (!step_result.unwrap()) break;
        columns.insert(stmt.column_text(0));
    }
    return R::ok(std::move(columns));
}

int64_t Database::last_insert_rowid() const {
    return sqlite3_last_insert_rowid(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

// ============================================================================
// TransactionGuard implementation
// ============================================================================

TransactionGuard::TransactionGuard(Database& db)
    : db_(db)
    , begin_(db.begin_immediate())
{
    active_ = begin_.is_ok();
}

TransactionGuard::~TransactionGuard() {
    if (active_) {
        rollback();
    }
}

Result<void, Error> TransactionGuard::commit() {
    if (!active_) {
        return Result<void, Error>::err(Error{"No active transaction"});
    }
    auto result = db_.commit();
    if (result.is_ok()) {
        active_ = false;
    }
    return result;
}

void TransactionGuard::rollback() {
    if (!active_) return;
    active_ = false;
    auto result = db_.rollback();
    if (result.is_err()) {
        qCWarning(lmDatabaseLog) << "Rollback failed:" << result.unwrap_err().message.c_str();
    }
}

} // namespace ledmark::storage
