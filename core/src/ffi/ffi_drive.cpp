#include "ffi_internal.h"
#include "cloudannex/Http/BeastTransport.h"
#include "cloudannex/Tree/PathResolver.h"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;
using namespace CloudAnnex;

namespace {

DriveHolder* holderOf(CADrive drive) {
    return reinterpret_cast<DriveHolder*>(drive);
}

json nodeToJson(const RemoteNode& node) {
    json j;
    j["name"] = node.name();
    j["id"] = node.id() ? json(*node.id()) : json(nullptr);
    j["kind"] = nodeKindToString(node.kind());
    return j;
}

json sessionRecordToJson(const UploadSessionRecord& record) {
    return {
        {"id", record.id},
        {"localPath", record.localPath},
        {"fileSize", record.fileSize},
        {"parentId", record.parentId},
        {"name", record.name},
        {"confirmedOffset", record.confirmedOffset},
        {"chunkSize", record.chunkSize},
        {"createdAt", record.createdAt},
        {"updatedAt", record.updatedAt}
    };
}

ProgressCallback wrapProgress(CAProgressCallback cb, void* userData) {
    if (!cb) {
        return nullptr;
    }
    return [cb, userData](int64_t bytes) { cb(bytes, userData); };
}

} // namespace

extern "C" {

CADrive ca_drive_open(const char* config_json, CAError* out_error) {
    if (!config_json) {
        setLastError(CA_ERROR_INVALID_ARGUMENT, "Config JSON is required");
        if (out_error) *out_error = CA_ERROR_INVALID_ARGUMENT;
        return nullptr;
    }

    try {
        auto holder = std::make_unique<DriveHolder>();
        holder->config = DriveConfig::fromJson(config_json);
        applyLogLevel(holder->config.logLevel);

        std::string token = holder->config.accessToken;
        auto transport = std::make_shared<BeastTransport>(
            [token]() { return token; },
            holder->config.timeoutSec,
            holder->config.verifyTls);

        DriveEndpoints endpoints;
        endpoints.apiBaseUrl = holder->config.apiBaseUrl;
        endpoints.uploadBaseUrl = holder->config.uploadBaseUrl;
        holder->api = std::make_shared<DriveApi>(transport, endpoints);

        if (holder->config.journalPath) {
            holder->database = std::make_shared<Database>(*holder->config.journalPath);
            holder->database->initialize();
            holder->journal = std::make_shared<UploadJournal>(holder->database);
        }

        holder->root = RemoteRoot::create(holder->api, holder->journal, holder->config.rootId);

        spdlog::info("Drive opened (root {}, journal {})", holder->config.rootId,
                     holder->config.journalPath.value_or("disabled"));
        clearLastError();
        if (out_error) *out_error = CA_OK;
        return reinterpret_cast<CADrive>(holder.release());
    } catch (const std::exception& ex) {
        setLastErrorFromException(ex);
        if (out_error) *out_error = g_lastError;
        return nullptr;
    }
}

void ca_drive_close(CADrive drive) {
    delete holderOf(drive);
}

char* ca_drive_stat(CADrive drive, const char* path) {
    if (!drive || !path) {
        setLastError(CA_ERROR_INVALID_ARGUMENT, "Drive handle and path are required");
        return nullptr;
    }

    try {
        auto node = holderOf(drive)->root->resolvePath(path);
        if (!node) {
            setLastError(CA_ERROR_NOT_FOUND, std::string("No entry at ") + path);
            return nullptr;
        }
        clearLastError();
        return alloc_string(nodeToJson(*node).dump());
    } catch (const std::exception& ex) {
        setLastErrorFromException(ex);
        return nullptr;
    }
}

char* ca_drive_mkdir(CADrive drive, const char* path) {
    if (!drive || !path) {
        setLastError(CA_ERROR_INVALID_ARGUMENT, "Drive handle and path are required");
        return nullptr;
    }

    try {
        auto* holder = holderOf(drive);
        std::shared_ptr<RemoteFolder> folder = holder->root;
        for (const auto& segment : PathResolver::split(path)) {
            folder = folder->mkdir(segment);
        }
        clearLastError();
        return alloc_string(nodeToJson(*folder).dump());
    } catch (const std::exception& ex) {
        setLastErrorFromException(ex);
        return nullptr;
    }
}

char* ca_drive_upload(CADrive drive,
                      const char* local_path,
                      const char* remote_folder,
                      const char* name,
                      CAProgressCallback cb,
                      void* user_data) {
    if (!drive || !local_path || !remote_folder || !name) {
        setLastError(CA_ERROR_INVALID_ARGUMENT, "Drive handle, local path, folder and name are required");
        return nullptr;
    }

    try {
        auto* holder = holderOf(drive);
        auto node = holder->root->resolvePath(remote_folder);
        if (!node) {
            setLastError(CA_ERROR_NOT_FOUND, std::string("No folder at ") + remote_folder);
            return nullptr;
        }
        auto leaf = node->asFolder()->uploadLeaf(name, local_path, holder->config.chunkSize,
                                                 wrapProgress(cb, user_data));
        clearLastError();
        return alloc_string(nodeToJson(*leaf).dump());
    } catch (const std::exception& ex) {
        setLastErrorFromException(ex);
        return nullptr;
    }
}

int64_t ca_drive_download(CADrive drive,
                          const char* remote_path,
                          const char* local_path,
                          CAProgressCallback cb,
                          void* user_data) {
    if (!drive || !remote_path || !local_path) {
        setLastError(CA_ERROR_INVALID_ARGUMENT, "Drive handle, remote path and local path are required");
        return -1;
    }

    try {
        auto* holder = holderOf(drive);
        auto node = holder->root->resolvePath(remote_path);
        if (!node) {
            setLastError(CA_ERROR_NOT_FOUND, std::string("No entry at ") + remote_path);
            return -1;
        }
        int64_t size = node->asLeaf()->receive(local_path, holder->config.chunkSize,
                                               wrapProgress(cb, user_data));
        clearLastError();
        return size;
    } catch (const std::exception& ex) {
        setLastErrorFromException(ex);
        return -1;
    }
}

CAError ca_drive_remove(CADrive drive, const char* remote_path) {
    if (!drive || !remote_path) {
        setLastError(CA_ERROR_INVALID_ARGUMENT, "Drive handle and path are required");
        return CA_ERROR_INVALID_ARGUMENT;
    }

    try {
        auto node = holderOf(drive)->root->resolvePath(remote_path);
        if (!node) {
            setLastError(CA_ERROR_NOT_FOUND, std::string("No entry at ") + remote_path);
            return CA_ERROR_NOT_FOUND;
        }
        node->remove();
        clearLastError();
        return CA_OK;
    } catch (const std::exception& ex) {
        setLastErrorFromException(ex);
        return g_lastError;
    }
}

char* ca_drive_pending_uploads(CADrive drive) {
    if (!drive) {
        setLastError(CA_ERROR_INVALID_ARGUMENT, "Null drive handle");
        return nullptr;
    }

    try {
        auto* holder = holderOf(drive);
        json arr = json::array();
        if (holder->journal) {
            for (const auto& record : holder->journal->list()) {
                arr.push_back(sessionRecordToJson(record));
            }
        }
        clearLastError();
        return alloc_string(arr.dump());
    } catch (const std::exception& ex) {
        setLastErrorFromException(ex);
        return nullptr;
    }
}

CAError ca_drive_abandon_upload(CADrive drive, int64_t session_id) {
    if (!drive) {
        setLastError(CA_ERROR_INVALID_ARGUMENT, "Null drive handle");
        return CA_ERROR_INVALID_ARGUMENT;
    }

    try {
        auto* holder = holderOf(drive);
        if (!holder->journal) {
            setLastError(CA_ERROR_UNSUPPORTED, "Upload journal is disabled");
            return CA_ERROR_UNSUPPORTED;
        }
        if (!holder->journal->remove(session_id)) {
            setLastError(CA_ERROR_NOT_FOUND, "Upload session not found: " + std::to_string(session_id));
            return CA_ERROR_NOT_FOUND;
        }
        clearLastError();
        return CA_OK;
    } catch (const std::exception& ex) {
        setLastErrorFromException(ex);
        return g_lastError;
    }
}

} // extern "C"
