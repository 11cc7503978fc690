#include "store/sqlite_handle.hpp"
#include "common/errors.hpp"
#include "logging/log.hpp"

#include <sqlite3.h>

namespace pairank {

void checkSqlite(int rc, sqlite3* db, const std::string& context) {
    if (rc == SQLITE_OK || rc == SQLITE_ROW || rc == SQLITE_DONE) return;

    std::string detail = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    std::string message = context + ": " + detail;

    switch (rc & 0xff) {  // primary result code
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
        case SQLITE_CANTOPEN:
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_PROTOCOL:
        case SQLITE_READONLY:
            throw StoreUnavailableError(message);
        default:
            throw RankingError(message);
    }
}

// ─── Database ──────────────────────────────────────────────────

Database::Database(const std::string& path, int busy_timeout_ms) : path_(path) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string detail = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreUnavailableError("Cannot open store '" + path + "': " + detail);
    }
    sqlite3_busy_timeout(db_, busy_timeout_ms);
}

Database::~Database() {
    if (db_) sqlite3_close(db_);
}

void Database::exec(const std::string& sql) {
    char* error = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error);
    if (rc != SQLITE_OK) {
        std::string detail = error ? error : sqlite3_errstr(rc);
        sqlite3_free(error);
        // Re-dispatch on the code; errmsg may already be gone.
        switch (rc & 0xff) {
            case SQLITE_BUSY:
            case SQLITE_LOCKED:
            case SQLITE_IOERR:
            case SQLITE_FULL:
            case SQLITE_READONLY:
                throw StoreUnavailableError(sql + ": " + detail);
            default:
                throw RankingError(sql + ": " + detail);
        }
    }
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

int64_t Database::lastInsertId() const {
    return static_cast<int64_t>(sqlite3_last_insert_rowid(db_));
}

// ─── Statement ─────────────────────────────────────────────────

Statement::Statement(Database& db, const std::string& sql) : db_(db), sql_(sql) {
    int rc = sqlite3_prepare_v2(db_.handle(), sql.c_str(), -1, &stmt_, nullptr);
    checkSqlite(rc, db_.handle(), "prepare");
}

Statement::~Statement() {
    sqlite3_finalize(stmt_);
}

void Statement::bind(int index, const std::string& value) {
    int rc = sqlite3_bind_text(stmt_, index, value.c_str(),
                               static_cast<int>(value.size()), SQLITE_TRANSIENT);
    checkSqlite(rc, db_.handle(), "bind");
}

void Statement::bind(int index, double value) {
    checkSqlite(sqlite3_bind_double(stmt_, index, value), db_.handle(), "bind");
}

void Statement::bind(int index, int64_t value) {
    checkSqlite(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)),
                db_.handle(), "bind");
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    checkSqlite(rc, db_.handle(), "step");
    return false;
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

std::string Statement::columnText(int column) const {
    const unsigned char* text = sqlite3_column_text(stmt_, column);
    if (!text) return {};
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

double Statement::columnDouble(int column) const {
    return sqlite3_column_double(stmt_, column);
}

bool Statement::columnIsNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

int64_t Statement::columnInt64(int column) const {
    return static_cast<int64_t>(sqlite3_column_int64(stmt_, column));
}

// ─── Transaction ───────────────────────────────────────────────

Transaction::Transaction(Database& db, Mode mode) : db_(db) {
    db_.exec(mode == Mode::Immediate ? "BEGIN IMMEDIATE" : "BEGIN DEFERRED");
    open_ = true;
}

Transaction::~Transaction() {
    if (!open_) return;
    // Destructors must not throw; a failed rollback only leaves a log line.
    int rc = sqlite3_exec(db_.handle(), "ROLLBACK", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        PAIRANK_LOG_ERROR("rollback failed on {}: {}", db_.path(), sqlite3_errstr(rc));
    }
}

void Transaction::commit() {
    db_.exec("COMMIT");
    open_ = false;
}

} // namespace pairank
