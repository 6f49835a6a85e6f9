#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>

namespace beamstate::infra {

/**
 * @brief RAII wrapper for SQLite prepared statements.
 *
 * Binding errors throw std::runtime_error. Optional values bind as NULL when
 * empty, and the optional column getters map NULL back to nullopt.
 *
 * @note This class is non-copyable but moveable.
 */
class Statement {
public:
    /**
     * @brief Takes ownership of a prepared statement handle.
     * @param stmt Handle returned by sqlite3_prepare_v2; finalized by the destructor.
     */
    explicit Statement(sqlite3_stmt* stmt);

    /**
     * @brief Finalizes the statement.
     */
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    /**
     * @brief Takes over other's handle; other is left empty.
     */
    Statement(Statement&& other) noexcept;

    /**
     * @brief Finalizes the current handle and takes over other's.
     * @return Reference to this Statement.
     */
    Statement& operator=(Statement&& other) noexcept;

    /**
     * @brief Binds an integer parameter.
     * @param index Parameter index (1-based).
     * @param value Value to bind.
     * @throws std::runtime_error if the index is out of range.
     */
    void bind(int index, int value);

    /**
     * @brief Binds a 64-bit integer parameter, e.g. a row id or epoch milliseconds.
     * @param index Parameter index (1-based).
     * @param value Value to bind.
     */
    void bind(int index, int64_t value);

    /**
     * @brief Binds a floating point parameter.
     * @param index Parameter index (1-based).
     * @param value Value to bind.
     */
    void bind(int index, double value);

    /**
     * @brief Binds a boolean as 0 or 1.
     */
    void bind(int index, bool value) { bind(index, value ? 1 : 0); }

    /**
     * @brief Binds a text parameter. SQLite copies the value.
     * @param index Parameter index (1-based).
     * @param value Text to bind.
     */
    void bind(int index, const std::string& value);
    void bind(int index, const char* value) { bind(index, std::string(value)); }

    /**
     * @brief Binds NULL to a parameter.
     * @param index Parameter index (1-based).
     */
    void bindNull(int index);

    /**
     * @brief Binds the contained value, or NULL when value is empty.
     */
    template <typename T>
    void bind(int index, const std::optional<T>& value) {
        if (value) {
            bind(index, *value);
        } else {
            bindNull(index);
        }
    }

    /**
     * @brief Executes the statement and advances to the next row.
     * @return True if a row is available, false if done.
     * @throws std::runtime_error on a database error (including constraint violations).
     */
    bool step();

    /**
     * @brief Resets the statement for re-execution and clears its bindings.
     */
    void reset();

    /**
     * @brief Retrieves an integer column value.
     * @param index Column index (0-based).
     * @return The value; 0 for NULL.
     */
    int columnInt(int index) const;

    /**
     * @brief Retrieves a 64-bit integer column value.
     * @param index Column index (0-based).
     * @return The value; 0 for NULL.
     */
    int64_t columnInt64(int index) const;

    /**
     * @brief Retrieves a floating point column value.
     * @param index Column index (0-based).
     * @return The value; 0.0 for NULL.
     */
    double columnDouble(int index) const;

    bool columnBool(int index) const { return columnInt(index) != 0; }

    /**
     * @brief Retrieves a text column value.
     * @param index Column index (0-based).
     * @return The text; empty for NULL.
     */
    std::string columnText(int index) const;

    /**
     * @brief Checks if a column value is NULL.
     * @param index Column index (0-based).
     * @return True if NULL, false otherwise.
     */
    bool columnIsNull(int index) const;

    /**
     * @brief Nullable column getters: nullopt for NULL, the value otherwise.
     * @param index Column index (0-based).
     */
    std::optional<int> columnOptionalInt(int index) const;
    std::optional<double> columnOptionalDouble(int index) const;
    std::optional<std::string> columnOptionalText(int index) const;

private:
    sqlite3_stmt* stmt_{nullptr};
};

/**
 * @brief SQLite connection with WAL mode, foreign keys and versioned migrations.
 *
 * @note This class is non-copyable.
 */
class Database {
public:
    /**
     * @brief Opens or creates a database; ":memory:" gives a private in-memory database.
     * @throws std::runtime_error if the database cannot be opened.
     */
    explicit Database(const std::string& path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * @brief Executes one or more SQL statements that return no rows.
     * @param sql Statements separated by semicolons.
     * @throws std::runtime_error on SQL error.
     */
    void execute(const std::string& sql);

    /**
     * @brief Prepares a single statement for binding and stepping.
     * @param sql Statement text with ? placeholders.
     * @return The prepared statement.
     * @throws std::runtime_error if preparation fails.
     */
    Statement prepare(const std::string& sql);

    /**
     * @brief Returns the row id of the most recent successful INSERT on this connection.
     */
    int64_t lastInsertRowId() const;

    /**
     * @brief Returns the number of rows changed by the most recent statement.
     */
    int changes() const;

    /**
     * @brief Runs func inside a transaction; commits on success, rolls back and rethrows on exception.
     *
     * Holds the transaction lock for the whole call, so transactions from
     * different threads never interleave.
     */
    template <typename Func>
    void transaction(Func&& func) {
        std::lock_guard lock(transactionMutex_);
        execute("BEGIN IMMEDIATE");
        try {
            func();
            execute("COMMIT");
        } catch (...) {
            execute("ROLLBACK");
            throw;
        }
    }

    /**
     * @brief Applies all pending schema migrations.
     *
     * Each migration runs in its own transaction and is recorded in
     * schema_migrations, so running this again is a no-op.
     * @throws std::runtime_error if a migration fails; it is rolled back.
     */
    void runMigrations();

    /**
     * @brief Returns the highest applied migration version, 0 for a fresh database.
     */
    [[nodiscard]] int schemaVersion();

private:
    void configure();
    void createMigrationsTable();
    void setVersion(int version, const std::string& description);

    sqlite3* db_{nullptr};
    mutable std::mutex mutex_;
    std::recursive_mutex transactionMutex_;
};

} // namespace beamstate::infra
