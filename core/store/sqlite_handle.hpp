#pragma once

#include <cstdint>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace pairank {

// ─── SQLite Wrappers ───────────────────────────────────────────
// Thin RAII layer over the sqlite3 C API. Every failing call throws:
// lock/IO/open failures as StoreUnavailableError, anything else as
// RankingError.

/// Throw the matching pairank error when rc is not a success code.
void checkSqlite(int rc, sqlite3* db, const std::string& context);

class Database {
public:
    Database(const std::string& path, int busy_timeout_ms);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /// Run one or more statements without results.
    void exec(const std::string& sql);

    /// Rows changed by the most recent INSERT/UPDATE/DELETE.
    int changes() const;

    /// Rowid of the most recent successful INSERT.
    int64_t lastInsertId() const;

    sqlite3* handle() const { return db_; }
    const std::string& path() const { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
};

class Statement {
public:
    Statement(Database& db, const std::string& sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    // Parameters are 1-based, as in sqlite3_bind_*.
    void bind(int index, const std::string& value);
    void bind(int index, double value);
    void bind(int index, int64_t value);
    void bind(int index, int value) { bind(index, static_cast<int64_t>(value)); }

    /// Advance. Returns true while a row is available.
    bool step();

    /// Clear bindings and rewind for another execution.
    void reset();

    // Columns are 0-based, as in sqlite3_column_*.
    std::string columnText(int column) const;
    double columnDouble(int column) const;
    int64_t columnInt64(int column) const;
    int columnInt(int column) const { return static_cast<int>(columnInt64(column)); }
    bool columnIsNull(int column) const;

private:
    Database& db_;
    sqlite3_stmt* stmt_ = nullptr;
    std::string sql_;
};

/// Scoped transaction: rolled back on destruction unless committed.
class Transaction {
public:
    enum class Mode {
        Deferred,    // read snapshot
        Immediate    // takes the write lock up front
    };

    Transaction(Database& db, Mode mode);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    Database& db_;
    bool open_ = false;
};

} // namespace pairank
