// Migrations.cpp — версии схемы журнала загрузок

#include "cloudannex/Database.h"
#include <spdlog/spdlog.h>
#include <array>

namespace CloudAnnex {

struct Migration {
    int64_t version;
    const char* description;
    const char* sql;
};

// ═══════════════════════════════════════════════════════════
// Схема журнала
// ═══════════════════════════════════════════════════════════

static const std::array MIGRATIONS = {
    Migration{1, "Upload sessions", R"SQL(
CREATE TABLE IF NOT EXISTS schema_version (
    version INTEGER PRIMARY KEY,
    applied_at INTEGER DEFAULT (strftime('%s', 'now')),
    description TEXT
);

-- Незавершённые резюмируемые загрузки; ключ — (файл, папка, имя)
CREATE TABLE IF NOT EXISTS upload_sessions (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    local_path TEXT NOT NULL,
    file_size INTEGER NOT NULL,
    modified_at INTEGER NOT NULL,
    parent_id TEXT NOT NULL,
    name TEXT NOT NULL,
    session_uri TEXT NOT NULL,
    confirmed_offset INTEGER NOT NULL DEFAULT 0,
    chunk_size INTEGER NOT NULL,
    created_at INTEGER DEFAULT (strftime('%s', 'now')),
    updated_at INTEGER DEFAULT (strftime('%s', 'now')),

    UNIQUE(local_path, parent_id, name)
);

CREATE INDEX IF NOT EXISTS idx_upload_sessions_updated ON upload_sessions(updated_at);
    )SQL"}
};

int64_t Database::currentVersion() {
    auto hasTable = queryOne<int64_t>(
        "SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' AND name = 'schema_version'",
        [](sqlite3_stmt* stmt) { return getInt64(stmt, 0); });
    if (hasTable.value_or(0) == 0) {
        return 0;
    }

    return queryOne<int64_t>(
               "SELECT COALESCE(MAX(version), 0) FROM schema_version",
               [](sqlite3_stmt* stmt) { return getInt64(stmt, 0); })
        .value_or(0);
}

void Database::applyMigrations() {
    int64_t version = currentVersion();
    spdlog::debug("Journal schema version: {}, latest: {}", version, MIGRATIONS.back().version);

    for (const auto& migration : MIGRATIONS) {
        if (migration.version <= version) {
            continue;
        }

        spdlog::info("Applying journal migration {}: {}", migration.version, migration.description);

        execute("BEGIN EXCLUSIVE TRANSACTION");
        try {
            execute(migration.sql);
            execute("INSERT INTO schema_version (version, description) VALUES (?, ?)",
                    migration.version, migration.description);
            execute("COMMIT");
        } catch (const DatabaseException& e) {
            spdlog::error("Journal migration {} failed: {}", migration.version, e.what());
            execute("ROLLBACK");
            throw;
        }
    }
}

} // namespace CloudAnnex
