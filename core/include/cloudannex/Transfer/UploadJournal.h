// UploadJournal.h — сохранение резюмируемых сессий загрузки между перезапусками
// Ключ: локальный путь + папка назначения + имя. Размер и mtime файла
// хранятся, чтобы отличить изменённый файл от прерванной загрузки.

#pragma once

#include "../export.h"
#include "../Database.h"
#include "../Models.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace CloudAnnex {

class CA_API UploadJournal {
public:
    explicit UploadJournal(std::shared_ptr<Database> db);
    ~UploadJournal();

    std::optional<UploadSessionRecord> find(const std::string& localPath,
                                            const std::string& parentId,
                                            const std::string& name) const;

    /// Вставить или заменить запись с тем же ключом
    UploadSessionRecord save(const UploadSessionRecord& record);

    /// Сдвинуть подтверждённую позицию. Позиция не уменьшается.
    bool updateOffset(int64_t recordId, int64_t confirmedOffset);

    bool remove(int64_t recordId);

    std::vector<UploadSessionRecord> list() const;

    /// Удалить записи, не обновлявшиеся дольше maxAgeSec
    int purgeOlderThan(int64_t maxAgeSec);

private:
    std::shared_ptr<Database> m_db;

    static UploadSessionRecord mapRecord(sqlite3_stmt* stmt);
};

} // namespace CloudAnnex
