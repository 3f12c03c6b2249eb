#pragma once

#include <cstdint>
#include <mutex>
#include <sqlite3.h>
#include <string>

namespace netledger::infra {

/**
 * @brief RAII wrapper for an SQLite prepared statement.
 *
 * @note Non-copyable, moveable.
 */
class Statement {
public:
    explicit Statement(sqlite3_stmt* stmt);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    /// Parameter indices are 1-based.
    void bind(int index, int value);
    void bind(int index, int64_t value);
    void bind(int index, const std::string& value);

    /**
     * @brief Advances to the next row.
     * @return True if a row is available, false when done.
     * @throws std::runtime_error on an SQLite error.
     */
    bool step();

    /// Column indices are 0-based.
    int columnInt(int index) const;
    int64_t columnInt64(int index) const;
    std::string columnText(int index) const;
    bool columnIsNull(int index) const;

private:
    sqlite3_stmt* stmt_{nullptr};
};

/**
 * @brief SQLite connection with WAL mode and versioned schema migrations.
 *
 * @note Non-copyable. Statements prepared from one Database must not outlive it.
 */
class Database {
public:
    /**
     * @brief Opens or creates a database. ":memory:" opens a private in-memory one.
     * @throws std::runtime_error if the database cannot be opened.
     */
    explicit Database(const std::string& path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * @throws std::runtime_error on SQL error.
     */
    void execute(const std::string& sql);

    /**
     * @throws std::runtime_error if preparation fails.
     */
    Statement prepare(const std::string& sql);

    int64_t lastInsertRowId() const;
    int changes() const;

    /**
     * @brief Runs func inside a transaction, rolling back if it throws.
     */
    template <typename Func>
    void transaction(Func&& func) {
        std::lock_guard lock(mutex_);
        execute("BEGIN TRANSACTION");
        try {
            func();
            execute("COMMIT");
        } catch (...) {
            execute("ROLLBACK");
            throw;
        }
    }

    /**
     * @brief Applies every migration newer than the stored schema version.
     */
    void runMigrations();

    /**
     * @brief Current schema version (0 for a fresh database).
     */
    int schemaVersion();

private:
    void setSchemaVersion(int version);

    sqlite3* db_{nullptr};
    std::recursive_mutex mutex_;
};

} // namespace netledger::infra
