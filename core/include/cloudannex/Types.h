#pragma once

#include <cstdint>
#include <string>

namespace CloudAnnex {

// ═══════════════════════════════════════════════════════════
// Вид узла в удалённом дереве
// ═══════════════════════════════════════════════════════════

enum class NodeKind : int32_t {
    Folder = 0,
    Leaf = 1
};

const char* nodeKindToString(NodeKind kind);
NodeKind nodeKindFromString(const std::string& str);

// ═══════════════════════════════════════════════════════════
// Состояние резюмируемой загрузки
// ═══════════════════════════════════════════════════════════

enum class UploadState : int32_t {
    Uninitiated = 0,
    SessionEstablished = 1,
    Transferring = 2,
    Committed = 3,
    Failed = 4
};

const char* uploadStateToString(UploadState state);

// ═══════════════════════════════════════════════════════════
// Направление передачи
// ═══════════════════════════════════════════════════════════

enum class TransferDirection : int32_t {
    Download = 0,
    Upload = 1
};

const char* transferDirectionToString(TransferDirection direction);

// ═══════════════════════════════════════════════════════════
// Категории ошибок
// ═══════════════════════════════════════════════════════════

enum class ErrorKind : int32_t {
    Ambiguous = 1,
    TypeConflict = 2,
    AlreadyExists = 3,
    ChecksumMismatch = 4,
    Transport = 5,
    UnsupportedOperation = 6,
    LocalIo = 7
};

const char* errorKindToString(ErrorKind kind);

} // namespace CloudAnnex
