#include "cloudannex/Types.h"
#include <algorithm>
#include <cctype>

namespace CloudAnnex {

// ═══════════════════════════════════════════════════════════
// NodeKind
// ═══════════════════════════════════════════════════════════

const char* nodeKindToString(NodeKind kind) {
    switch (kind) {
        case NodeKind::Folder: return "folder";
        case NodeKind::Leaf:   return "leaf";
        default:               return "leaf";
    }
}

NodeKind nodeKindFromString(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "folder") return NodeKind::Folder;
    return NodeKind::Leaf;
}

// ═══════════════════════════════════════════════════════════
// UploadState
// ═══════════════════════════════════════════════════════════

const char* uploadStateToString(UploadState state) {
    switch (state) {
        case UploadState::Uninitiated:        return "uninitiated";
        case UploadState::SessionEstablished: return "session_established";
        case UploadState::Transferring:       return "transferring";
        case UploadState::Committed:          return "committed";
        case UploadState::Failed:             return "failed";
        default:                              return "unknown";
    }
}

const char* transferDirectionToString(TransferDirection direction) {
    return direction == TransferDirection::Upload ? "upload" : "download";
}

// ═══════════════════════════════════════════════════════════
// ErrorKind
// ═══════════════════════════════════════════════════════════

const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Ambiguous:            return "ambiguous";
        case ErrorKind::TypeConflict:         return "type_conflict";
        case ErrorKind::AlreadyExists:        return "already_exists";
        case ErrorKind::ChecksumMismatch:     return "checksum_mismatch";
        case ErrorKind::Transport:            return "transport";
        case ErrorKind::UnsupportedOperation: return "unsupported_operation";
        case ErrorKind::LocalIo:              return "local_io";
        default:                              return "unknown";
    }
}

} // namespace CloudAnnex
