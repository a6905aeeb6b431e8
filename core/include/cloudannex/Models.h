#pragma once

#include "Types.h"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace CloudAnnex {

constexpr int64_t DEFAULT_CHUNK_SIZE = 10000000;   // 10 MB
constexpr const char* FOLDER_MIME_TYPE = "application/vnd.google-apps.folder";

/// Вызывается после каждого принятого чанка с накопленным числом байт
using ProgressCallback = std::function<void(int64_t bytesTransferred)>;

// ═══════════════════════════════════════════════════════════
// Элемент удалённого хранилища (ответ files.list / files.create)
// ═══════════════════════════════════════════════════════════

struct RemoteEntry {
    std::string id;
    std::string name;
    std::string mimeType;
    std::optional<int64_t> size;
    std::optional<std::string> md5Checksum;
    std::optional<std::string> parentId;

    bool isFolder() const { return mimeType == FOLDER_MIME_TYPE; }
    NodeKind kind() const { return isFolder() ? NodeKind::Folder : NodeKind::Leaf; }
};

// ═══════════════════════════════════════════════════════════
// Куда загружать файл
// ═══════════════════════════════════════════════════════════

struct UploadTarget {
    std::string parentId;
    std::string name;
    std::optional<std::string> mimeType;
};

// ═══════════════════════════════════════════════════════════
// Сохранённая сессия резюмируемой загрузки (таблица upload_sessions)
// ═══════════════════════════════════════════════════════════

struct UploadSessionRecord {
    int64_t id = 0;
    std::string localPath;
    int64_t fileSize = 0;
    int64_t modifiedAt = 0;
    std::string parentId;
    std::string name;
    std::string sessionUri;
    int64_t confirmedOffset = 0;
    int64_t chunkSize = DEFAULT_CHUNK_SIZE;
    int64_t createdAt = 0;
    int64_t updatedAt = 0;
};

// ═══════════════════════════════════════════════════════════
// Состояние передачи, которое узел держит только пока она идёт
// ═══════════════════════════════════════════════════════════

struct TransferState {
    TransferDirection direction = TransferDirection::Download;
    std::string localPath;
    int64_t totalSize = 0;
    int64_t bytesConfirmed = 0;

    double progress() const {
        return totalSize > 0 ? static_cast<double>(bytesConfirmed) / totalSize : 0.0;
    }
};

} // namespace CloudAnnex
