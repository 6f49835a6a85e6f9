#include "infrastructure/database/Database.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <vector>

namespace beamstate::infra {

namespace {

struct Migration {
    int version;
    const char* description;
    std::vector<const char*> statements;
};

const std::vector<Migration>& migrations() {
    static const std::vector<Migration> all{
        {1,
         "Inventory schema",
         {R"(
            CREATE TABLE IF NOT EXISTS node_groups (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                name TEXT NOT NULL UNIQUE,
                interval_seconds INTEGER NOT NULL DEFAULT 60,
                packet_count INTEGER NOT NULL DEFAULT 1,
                snmp_community TEXT NOT NULL DEFAULT 'public',
                snmp_port INTEGER NOT NULL DEFAULT 161,
                enabled INTEGER NOT NULL DEFAULT 1,
                monitor_ping INTEGER NOT NULL DEFAULT 1,
                monitor_snmp INTEGER NOT NULL DEFAULT 0
            )
          )",
          R"(
            CREATE TABLE IF NOT EXISTS nodes (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                name TEXT NOT NULL,
                ip TEXT NOT NULL UNIQUE,
                group_id INTEGER NOT NULL REFERENCES node_groups(id),
                interval_seconds INTEGER,
                packet_count INTEGER,
                snmp_community TEXT,
                snmp_port INTEGER,
                monitor_ping INTEGER,
                monitor_snmp INTEGER,
                enabled INTEGER NOT NULL DEFAULT 1,
                notification_priority INTEGER
            )
          )",
          "CREATE INDEX IF NOT EXISTS idx_nodes_group ON nodes(group_id)",
          R"(
            CREATE TABLE IF NOT EXISTS metric_definitions (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                name TEXT NOT NULL UNIQUE,
                oid TEXT NOT NULL,
                requires_index INTEGER NOT NULL DEFAULT 0,
                category TEXT NOT NULL DEFAULT 'system',
                kind TEXT NOT NULL DEFAULT 'gauge',
                unit TEXT NOT NULL DEFAULT '',
                device_type TEXT NOT NULL DEFAULT 'generic',
                description TEXT NOT NULL DEFAULT ''
            )
          )",
          R"(
            CREATE TABLE IF NOT EXISTS node_metrics (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                node_id INTEGER NOT NULL REFERENCES nodes(id) ON DELETE CASCADE,
                metric_id INTEGER NOT NULL REFERENCES metric_definitions(id) ON DELETE CASCADE,
                interface_index INTEGER,
                interface_name TEXT NOT NULL DEFAULT '',
                interval_seconds INTEGER,
                enabled INTEGER NOT NULL DEFAULT 1,
                alert_condition TEXT NOT NULL DEFAULT 'gt',
                warning_threshold REAL,
                critical_threshold REAL
            )
          )",
          "CREATE INDEX IF NOT EXISTS idx_node_metrics_node ON node_metrics(node_id)"}},
        {2,
         "Metric samples",
         {R"(
            CREATE TABLE IF NOT EXISTS metric_samples (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                node_id INTEGER NOT NULL,
                metric_id INTEGER NOT NULL,
                interface_index INTEGER,
                value REAL NOT NULL,
                rate REAL,
                unit TEXT NOT NULL DEFAULT '',
                timestamp_ms INTEGER NOT NULL
            )
          )",
          "CREATE INDEX IF NOT EXISTS idx_metric_samples_series "
          "ON metric_samples(node_id, metric_id, interface_index, timestamp_ms)",
          "CREATE INDEX IF NOT EXISTS idx_metric_samples_time ON metric_samples(timestamp_ms)"}},
    };
    return all;
}

} // namespace

// Statement implementation
Statement::Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}

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

void Statement::bind(int index, int value) {
    if (sqlite3_bind_int(stmt_, index, value) != SQLITE_OK) {
        throw std::runtime_error("Failed to bind int parameter " + std::to_string(index));
    }
}

void Statement::bind(int index, int64_t value) {
    if (sqlite3_bind_int64(stmt_, index, value) != SQLITE_OK) {
        throw std::runtime_error("Failed to bind int64 parameter " + std::to_string(index));
    }
}

void Statement::bind(int index, double value) {
    if (sqlite3_bind_double(stmt_, index, value) != SQLITE_OK) {
        throw std::runtime_error("Failed to bind double parameter " + std::to_string(index));
    }
}

void Statement::bind(int index, const std::string& value) {
    if (sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                          SQLITE_TRANSIENT) != SQLITE_OK) {
        throw std::runtime_error("Failed to bind text parameter " + std::to_string(index));
    }
}

void Statement::bindNull(int index) {
    if (sqlite3_bind_null(stmt_, index) != SQLITE_OK) {
        throw std::runtime_error("Failed to bind null parameter " + std::to_string(index));
    }
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw std::runtime_error(std::string("SQLite step failed: ") +
                             sqlite3_errmsg(sqlite3_db_handle(stmt_)));
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

int Statement::columnInt(int index) const {
    return sqlite3_column_int(stmt_, index);
}

int64_t Statement::columnInt64(int index) const {
    return sqlite3_column_int64(stmt_, index);
}

double Statement::columnDouble(int index) const {
    return sqlite3_column_double(stmt_, index);
}

std::string Statement::columnText(int index) const {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
    return text ? text : "";
}

bool Statement::columnIsNull(int index) const {
    return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

std::optional<int> Statement::columnOptionalInt(int index) const {
    if (columnIsNull(index)) {
        return std::nullopt;
    }
    return columnInt(index);
}

std::optional<double> Statement::columnOptionalDouble(int index) const {
    if (columnIsNull(index)) {
        return std::nullopt;
    }
    return columnDouble(index);
}

std::optional<std::string> Statement::columnOptionalText(int index) const {
    if (columnIsNull(index)) {
        return std::nullopt;
    }
    return columnText(index);
}

// Database implementation
Database::Database(const std::string& path) {
    spdlog::info("Opening database: {}", path);

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + error);
    }

    configure();
    createMigrationsTable();
}

Database::~Database() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void Database::configure() {
    execute("PRAGMA journal_mode=WAL");
    execute("PRAGMA synchronous=NORMAL");
    execute("PRAGMA foreign_keys=ON");
    sqlite3_busy_timeout(db_, 5000);
}

void Database::execute(const std::string& sql) {
    std::lock_guard lock(mutex_);
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        throw std::runtime_error("SQL execution failed: " + error);
    }
}

Statement Database::prepare(const std::string& sql) {
    std::lock_guard lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("Failed to prepare statement: ") +
                                 sqlite3_errmsg(db_));
    }
    return Statement(stmt);
}

int64_t Database::lastInsertRowId() const {
    return sqlite3_last_insert_rowid(db_);
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

void Database::createMigrationsTable() {
    execute(R"(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            description TEXT NOT NULL DEFAULT '',
            applied_at TEXT DEFAULT CURRENT_TIMESTAMP
        )
    )");
}

int Database::schemaVersion() {
    auto stmt = prepare("SELECT MAX(version) FROM schema_migrations");
    if (stmt.step() && !stmt.columnIsNull(0)) {
        return stmt.columnInt(0);
    }
    return 0;
}

void Database::setVersion(int version, const std::string& description) {
    auto stmt = prepare("INSERT INTO schema_migrations (version, description) VALUES (?, ?)");
    stmt.bind(1, version);
    stmt.bind(2, description);
    stmt.step();
}

void Database::runMigrations() {
    const int current = schemaVersion();
    spdlog::info("Current schema version: {}", current);

    for (const auto& migration : migrations()) {
        if (migration.version <= current) {
            continue;
        }
        spdlog::info("Applying migration {}: {}", migration.version, migration.description);
        transaction([&]() {
            for (const char* sql : migration.statements) {
                execute(sql);
            }
            setVersion(migration.version, migration.description);
        });
    }

    spdlog::info("Database migrations complete. Version: {}", schemaVersion());
}

} // namespace beamstate::infra
