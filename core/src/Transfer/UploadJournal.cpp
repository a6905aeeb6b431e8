#include "cloudannex/Transfer/UploadJournal.h"
#include <spdlog/spdlog.h>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace CloudAnnex {

namespace {
int64_t nowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

constexpr const char* SESSION_SELECT_SQL = R"SQL(
    SELECT id, local_path, file_size, modified_at, parent_id, name,
           session_uri, confirmed_offset, chunk_size, created_at, updated_at
    FROM upload_sessions
)SQL";
} // namespace

UploadJournal::UploadJournal(std::shared_ptr<Database> db)
    : m_db(std::move(db)) {
    if (!m_db) {
        throw std::invalid_argument("Database instance is required");
    }
}

UploadJournal::~UploadJournal() = default;

std::optional<UploadSessionRecord> UploadJournal::find(const std::string& localPath,
                                                       const std::string& parentId,
                                                       const std::string& name) const {
    return m_db->queryOne<UploadSessionRecord>(
        std::string(SESSION_SELECT_SQL) + " WHERE local_path = ? AND parent_id = ? AND name = ?",
        mapRecord,
        localPath,
        parentId,
        name);
}

UploadSessionRecord UploadJournal::save(const UploadSessionRecord& record) {
    if (record.localPath.empty() || record.parentId.empty() || record.name.empty()) {
        throw std::invalid_argument("Upload session key (path, parent, name) is incomplete");
    }
    if (record.sessionUri.empty()) {
        throw std::invalid_argument("Upload session URI is required");
    }

    int64_t now = nowSeconds();
    m_db->execute(
        R"SQL(
        INSERT INTO upload_sessions (local_path, file_size, modified_at, parent_id, name,
                                     session_uri, confirmed_offset, chunk_size,
                                     created_at, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(local_path, parent_id, name) DO UPDATE SET
            file_size = excluded.file_size,
            modified_at = excluded.modified_at,
            session_uri = excluded.session_uri,
            confirmed_offset = excluded.confirmed_offset,
            chunk_size = excluded.chunk_size,
            created_at = excluded.created_at,
            updated_at = excluded.updated_at
        )SQL",
        record.localPath,
        record.fileSize,
        record.modifiedAt,
        record.parentId,
        record.name,
        record.sessionUri,
        record.confirmedOffset,
        record.chunkSize,
        now,
        now);

    auto saved = find(record.localPath, record.parentId, record.name);
    if (!saved) {
        throw DatabaseException("Failed to fetch saved upload session");
    }

    spdlog::debug("Upload session saved: {} -> {}/{}", record.localPath, record.parentId, record.name);
    return *saved;
}

bool UploadJournal::updateOffset(int64_t recordId, int64_t confirmedOffset) {
    m_db->execute(
        R"SQL(
        UPDATE upload_sessions
        SET confirmed_offset = MAX(confirmed_offset, ?), updated_at = ?
        WHERE id = ?
        )SQL",
        confirmedOffset,
        nowSeconds(),
        recordId);
    return m_db->changesCount() > 0;
}

bool UploadJournal::remove(int64_t recordId) {
    m_db->execute("DELETE FROM upload_sessions WHERE id = ?", recordId);
    bool removed = m_db->changesCount() > 0;
    if (removed) {
        spdlog::debug("Upload session {} removed", recordId);
    }
    return removed;
}

std::vector<UploadSessionRecord> UploadJournal::list() const {
    return m_db->query<UploadSessionRecord>(
        std::string(SESSION_SELECT_SQL) + " ORDER BY updated_at DESC, id DESC",
        mapRecord);
}

int UploadJournal::purgeOlderThan(int64_t maxAgeSec) {
    if (maxAgeSec < 0) {
        throw std::invalid_argument("maxAgeSec must be non-negative");
    }
    m_db->execute("DELETE FROM upload_sessions WHERE updated_at < ?", nowSeconds() - maxAgeSec);
    int purged = m_db->changesCount();
    if (purged > 0) {
        spdlog::info("Purged {} stale upload sessions", purged);
    }
    return purged;
}

UploadSessionRecord UploadJournal::mapRecord(sqlite3_stmt* stmt) {
    UploadSessionRecord record;
    record.id = Database::getInt64(stmt, 0);
    record.localPath = Database::getString(stmt, 1);
    record.fileSize = Database::getInt64(stmt, 2);
    record.modifiedAt = Database::getInt64(stmt, 3);
    record.parentId = Database::getString(stmt, 4);
    record.name = Database::getString(stmt, 5);
    record.sessionUri = Database::getString(stmt, 6);
    record.confirmedOffset = Database::getInt64(stmt, 7);
    record.chunkSize = Database::getInt64(stmt, 8);
    record.createdAt = Database::getInt64(stmt, 9);
    record.updatedAt = Database::getInt64(stmt, 10);
    return record;
}

} // namespace CloudAnnex
