// DriveApi.h — операции хранилища поверх Google Drive v3 REST API
// Только формирование запросов и разбор ответов; протокол передачи — в Transfer/

#pragma once

#include "../export.h"
#include "../Models.h"
#include "../Http/HttpTransport.h"
#include <memory>
#include <string>
#include <vector>

namespace CloudAnnex {

/// Заголовок, в котором сервер возвращает MD5 (hex) всех принятых байт загрузки
constexpr const char* UPLOAD_DIGEST_HEADER = "X-Upload-Content-MD5";

struct DriveEndpoints {
    std::string apiBaseUrl = "https://www.googleapis.com/drive/v3";
    std::string uploadBaseUrl = "https://www.googleapis.com/upload/drive/v3";
};

/// Результат поиска по имени: не больше двух записей и признак следующей страницы
struct ChildLookup {
    std::vector<RemoteEntry> entries;
    bool hasMore = false;

    bool isAmbiguous() const { return hasMore || entries.size() > 1; }
};

class CA_API DriveApi {
public:
    explicit DriveApi(std::shared_ptr<HttpTransport> transport, DriveEndpoints endpoints = {});
    ~DriveApi();

    DriveApi(const DriveApi&) = delete;
    DriveApi& operator=(const DriveApi&) = delete;

    // ═══════════════════════════════════════════════════════════
    // Метаданные
    // ═══════════════════════════════════════════════════════════

    /// Элементы папки parentId с точным именем name
    ChildLookup findChildren(const std::string& parentId, const std::string& name);

    RemoteEntry createFolder(const std::string& parentId, const std::string& name);

    void deleteEntry(const std::string& id);

    /// Авторитетный размер содержимого
    int64_t getSize(const std::string& id);

    // ═══════════════════════════════════════════════════════════
    // Содержимое (ответы возвращаются без проверки статуса)
    // ═══════════════════════════════════════════════════════════

    /// GET ?alt=media с Range: bytes=first-last
    HttpResponse fetchRange(const std::string& id, int64_t first, int64_t last);

    /// Открыть резюмируемую сессию, вернуть URI сессии (заголовок Location)
    std::string initiateUpload(const UploadTarget& target, int64_t totalSize);

    /// PUT чанка [offset, offset + data.size()) из totalSize
    HttpResponse putChunk(const std::string& sessionUri, int64_t offset,
                          const std::string& data, int64_t totalSize);

    /// PUT без тела с Content-Range: bytes */totalSize
    HttpResponse probeUpload(const std::string& sessionUri, int64_t totalSize);

    /// Разобрать JSON-ресурс файла
    static RemoteEntry parseEntry(const std::string& json);

    /// Экранирование строкового литерала для параметра q
    static std::string escapeQueryLiteral(const std::string& value);

    const DriveEndpoints& endpoints() const { return m_endpoints; }

private:
    std::shared_ptr<HttpTransport> m_transport;
    DriveEndpoints m_endpoints;

    HttpResponse send(HttpRequest request);
};

} // namespace CloudAnnex
