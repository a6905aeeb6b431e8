// ffi_internal.h — Internal shared declarations for FFI implementation

#ifndef FFI_INTERNAL_H
#define FFI_INTERNAL_H

#include "cloudannex/cloudannex_c.h"
#include "cloudannex/Config.h"
#include "cloudannex/Database.h"
#include "cloudannex/Drive/DriveApi.h"
#include "cloudannex/Transfer/UploadJournal.h"
#include "cloudannex/Tree/RemoteNode.h"
#include <string>
#include <memory>
#include <exception>
#include <cstring>

#ifdef _WIN32
    #define ca_strdup _strdup
#else
    #define ca_strdup strdup
#endif

// Thread-local error state
extern thread_local CAError g_lastError;
extern thread_local std::string g_lastErrorMessage;

// Error handling functions (defined in cloudannex_c.cpp)
// Note: default argument only in declaration, not in definition
void setLastError(CAError error, const std::string& message = "");
inline void clearLastError() { setLastError(CA_OK); }

/// Код ошибки по типу исключения (CloudAnnexException::kind, DatabaseException, ...)
CAError errorFromException(const std::exception& ex);

inline void setLastErrorFromException(const std::exception& ex) {
    setLastError(errorFromException(ex), ex.what());
}

// String allocation (defined in cloudannex_c.cpp)
char* alloc_string(const std::string& str);

// ═══════════════════════════════════════════════════════════
// DriveHolder — всё, что живёт между ca_drive_open и ca_drive_close
// ═══════════════════════════════════════════════════════════

struct DriveHolder {
    CloudAnnex::DriveConfig config;
    std::shared_ptr<CloudAnnex::Database> database;        // nullptr без журнала
    std::shared_ptr<CloudAnnex::UploadJournal> journal;    // nullptr без журнала
    std::shared_ptr<CloudAnnex::DriveApi> api;
    std::shared_ptr<CloudAnnex::RemoteRoot> root;
};

#endif // FFI_INTERNAL_H
