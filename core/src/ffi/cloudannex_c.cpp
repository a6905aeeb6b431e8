// cloudannex_c.cpp — общая часть C API: ошибки, строки, логирование

#include "ffi_internal.h"
#include "cloudannex/cloudannex_c.h"
#include "cloudannex/core.h"
#include "cloudannex/Errors.h"

#include <spdlog/spdlog.h>
#include <cstdlib>
#include <stdexcept>

using namespace CloudAnnex;

// ═══════════════════════════════════════════════════════════
// Thread-local error state for proper C API error handling
// ═══════════════════════════════════════════════════════════

thread_local CAError g_lastError = CA_OK;
thread_local std::string g_lastErrorMessage;

void setLastError(CAError error, const std::string& message) {
    g_lastError = error;
    g_lastErrorMessage = message;
    if (error != CA_OK) {
        spdlog::error("FFI error (code {}): {}", static_cast<int>(error), message);
    }
}

CAError errorFromException(const std::exception& ex) {
    if (auto* annex = dynamic_cast<const CloudAnnexException*>(&ex)) {
        switch (annex->kind()) {
            case ErrorKind::Ambiguous:            return CA_ERROR_AMBIGUOUS;
            case ErrorKind::TypeConflict:         return CA_ERROR_TYPE_CONFLICT;
            case ErrorKind::AlreadyExists:        return CA_ERROR_ALREADY_EXISTS;
            case ErrorKind::ChecksumMismatch:     return CA_ERROR_CHECKSUM_MISMATCH;
            case ErrorKind::Transport:            return CA_ERROR_NETWORK;
            case ErrorKind::UnsupportedOperation: return CA_ERROR_UNSUPPORTED;
            case ErrorKind::LocalIo:              return CA_ERROR_IO;
        }
        return CA_ERROR_INTERNAL;
    }
    if (dynamic_cast<const DatabaseException*>(&ex)) {
        return CA_ERROR_DATABASE;
    }
    if (dynamic_cast<const std::invalid_argument*>(&ex)) {
        return CA_ERROR_INVALID_ARGUMENT;
    }
    return CA_ERROR_INTERNAL;
}

char* alloc_string(const std::string& str) {
    return ca_strdup(str.c_str());
}

extern "C" {

const char* ca_version(void) {
    return CloudAnnex::VERSION;
}

const char* ca_error_message(CAError error) {
    switch (error) {
        case CA_OK: return "Success";
        case CA_ERROR_INVALID_ARGUMENT: return "Invalid argument";
        case CA_ERROR_DATABASE: return "Database error";
        case CA_ERROR_IO: return "I/O error";
        case CA_ERROR_NOT_FOUND: return "Not found";
        case CA_ERROR_ALREADY_EXISTS: return "Already exists";
        case CA_ERROR_AMBIGUOUS: return "Ambiguous name";
        case CA_ERROR_TYPE_CONFLICT: return "Type conflict";
        case CA_ERROR_CHECKSUM_MISMATCH: return "Checksum mismatch";
        case CA_ERROR_NETWORK: return "Network error";
        case CA_ERROR_UNSUPPORTED: return "Unsupported operation";
        case CA_ERROR_INTERNAL:
        default: return "Internal error";
    }
}

CAError ca_last_error(void) {
    return g_lastError;
}

const char* ca_last_error_message(void) {
    return g_lastErrorMessage.c_str();
}

void ca_clear_error(void) {
    g_lastError = CA_OK;
    g_lastErrorMessage.clear();
}

void ca_free_string(char* str) {
    std::free(str);
}

CAError ca_set_log_level(const char* level) {
    if (!level) {
        setLastError(CA_ERROR_INVALID_ARGUMENT, "Log level is required");
        return CA_ERROR_INVALID_ARGUMENT;
    }
    applyLogLevel(level);
    clearLastError();
    return CA_OK;
}

} // extern "C"
