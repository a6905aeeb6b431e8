// Database.cpp — соединение с журналом загрузок

#include "cloudannex/Database.h"
#include <spdlog/spdlog.h>

namespace CloudAnnex {

Database::Database(const std::string& dbPath) : m_dbPath(dbPath) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(dbPath.c_str(), &m_db, flags, nullptr) != SQLITE_OK) {
        std::string error = m_db ? sqlite3_errmsg(m_db) : "out of memory";
        sqlite3_close(m_db);
        m_db = nullptr;
        throw DatabaseException("Cannot open upload journal " + dbPath + ": " + error);
    }

    // Offset фиксируется после каждого чанка и должен пережить падение процесса
    execute("PRAGMA journal_mode = DELETE");
    execute("PRAGMA synchronous = FULL");
    execute("PRAGMA busy_timeout = 5000");

    spdlog::info("Upload journal opened: {}", dbPath);
}

Database::~Database() {
    sqlite3_close(m_db);
    spdlog::debug("Upload journal closed: {}", m_dbPath);
}

void Database::initialize() {
    applyMigrations();
}

void Database::execute(const std::string& sql) {
    char* errorMsg = nullptr;
    if (sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errorMsg) != SQLITE_OK) {
        std::string error = errorMsg ? errorMsg : sqlite3_errmsg(m_db);
        sqlite3_free(errorMsg);
        throw DatabaseException(error + " (SQL: " + sql + ")");
    }
}

int Database::changesCount() const {
    return sqlite3_changes(m_db);
}

Database::Statement Database::prepare(const std::string& sql) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        throw DatabaseException(std::string(sqlite3_errmsg(m_db)) + " (SQL: " + sql + ")");
    }
    return Statement(raw);
}

bool Database::stepRow(sqlite3_stmt* stmt) {
    switch (sqlite3_step(stmt)) {
        case SQLITE_ROW:  return true;
        case SQLITE_DONE: return false;
        default:
            throw DatabaseException(sqlite3_errmsg(m_db));
    }
}

// ═══════════════════════════════════════════════════════════
// Параметры и столбцы
// ═══════════════════════════════════════════════════════════

void Database::bind(sqlite3_stmt* stmt, int index, int64_t value) {
    sqlite3_bind_int64(stmt, index, value);
}

void Database::bind(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void Database::bind(sqlite3_stmt* stmt, int index, const char* value) {
    sqlite3_bind_text(stmt, index, value, -1, SQLITE_TRANSIENT);
}

int64_t Database::getInt64(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_int64(stmt, col);
}

std::string Database::getString(sqlite3_stmt* stmt, int col) {
    auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt, col))) : std::string();
}

} // namespace CloudAnnex
