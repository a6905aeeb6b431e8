// DriveApi.cpp — Google Drive v3: запросы и разбор ответов

#include "cloudannex/Drive/DriveApi.h"
#include "cloudannex/Errors.h"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace CloudAnnex {

using json = nlohmann::json;

namespace {

constexpr const char* ENTRY_FIELDS = "id,name,mimeType,size,md5Checksum,parents";

std::optional<int64_t> sizeFromJson(const json& value) {
    // Drive отдаёт int64 строкой
    if (value.is_string()) {
        try {
            return static_cast<int64_t>(std::stoll(value.get<std::string>()));
        } catch (const std::logic_error&) {
            return std::nullopt;
        }
    }
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    return std::nullopt;
}

RemoteEntry entryFromJson(const json& j) {
    if (!j.is_object() || !j.contains("id") || !j["id"].is_string()) {
        throw TransportError(0, "Malformed file resource: " + j.dump());
    }

    RemoteEntry entry;
    entry.id = j["id"].get<std::string>();
    entry.name = j.value("name", std::string());
    entry.mimeType = j.value("mimeType", std::string());
    if (j.contains("size")) {
        entry.size = sizeFromJson(j["size"]);
    }
    if (j.contains("md5Checksum") && j["md5Checksum"].is_string()) {
        entry.md5Checksum = j["md5Checksum"].get<std::string>();
    }
    if (j.contains("parents") && j["parents"].is_array() && !j["parents"].empty()) {
        entry.parentId = j["parents"][0].get<std::string>();
    }
    return entry;
}

json parseBody(const HttpResponse& response) {
    try {
        return json::parse(response.body);
    } catch (const json::parse_error& e) {
        throw TransportError(response.status, std::string("Invalid JSON in response: ") + e.what(),
                             response.body);
    }
}

[[noreturn]] void throwUnexpected(const HttpResponse& response, const std::string& operation) {
    std::string message = operation + " failed";
    auto body = json::parse(response.body, nullptr, false);
    if (!body.is_discarded() && body.contains("error") && body["error"].is_object()) {
        message += ": " + body["error"].value("message", std::string());
    }
    throw TransportError(response.status, message, response.body);
}

} // namespace

DriveApi::DriveApi(std::shared_ptr<HttpTransport> transport, DriveEndpoints endpoints)
    : m_transport(std::move(transport)), m_endpoints(std::move(endpoints)) {
    if (!m_transport) {
        throw std::invalid_argument("HttpTransport instance is required");
    }
}

DriveApi::~DriveApi() = default;

// ═══════════════════════════════════════════════════════════
// Метаданные
// ═══════════════════════════════════════════════════════════

ChildLookup DriveApi::findChildren(const std::string& parentId, const std::string& name) {
    std::string q = "'" + escapeQueryLiteral(parentId) + "' in parents and name='" +
                    escapeQueryLiteral(name) + "' and trashed=false";

    HttpRequest request;
    request.method = "GET";
    request.url = m_endpoints.apiBaseUrl + "/files?" +
                  buildQuery({{"q", q},
                              {"pageSize", "2"},
                              {"fields", std::string("nextPageToken,files(") + ENTRY_FIELDS + ")"}});

    auto response = send(std::move(request));
    if (response.status != HTTP_OK) {
        throwUnexpected(response, "files.list");
    }

    auto body = parseBody(response);
    ChildLookup lookup;
    lookup.hasMore = body.contains("nextPageToken") && !body["nextPageToken"].is_null();
    if (body.contains("files") && body["files"].is_array()) {
        for (const auto& file : body["files"]) {
            lookup.entries.push_back(entryFromJson(file));
        }
    }
    return lookup;
}

RemoteEntry DriveApi::createFolder(const std::string& parentId, const std::string& name) {
    json metadata;
    metadata["name"] = name;
    metadata["mimeType"] = FOLDER_MIME_TYPE;
    metadata["parents"] = json::array({parentId});

    HttpRequest request;
    request.method = "POST";
    request.url = m_endpoints.apiBaseUrl + "/files?" + buildQuery({{"fields", ENTRY_FIELDS}});
    request.headers["Content-Type"] = "application/json; charset=UTF-8";
    request.body = metadata.dump();

    auto response = send(std::move(request));
    if (response.status != HTTP_OK && response.status != HTTP_CREATED) {
        throwUnexpected(response, "files.create (folder)");
    }

    auto entry = entryFromJson(parseBody(response));
    if (entry.mimeType.empty()) {
        entry.mimeType = FOLDER_MIME_TYPE;
    }
    spdlog::info("Created folder '{}' ({}) in {}", entry.name, entry.id, parentId);
    return entry;
}

void DriveApi::deleteEntry(const std::string& id) {
    HttpRequest request;
    request.method = "DELETE";
    request.url = m_endpoints.apiBaseUrl + "/files/" + urlEncode(id);

    auto response = send(std::move(request));
    if (response.status != HTTP_NO_CONTENT && response.status != HTTP_OK) {
        throwUnexpected(response, "files.delete");
    }
    spdlog::info("Deleted remote entry {}", id);
}

int64_t DriveApi::getSize(const std::string& id) {
    HttpRequest request;
    request.method = "GET";
    request.url = m_endpoints.apiBaseUrl + "/files/" + urlEncode(id) + "?" +
                  buildQuery({{"fields", "size"}});

    auto response = send(std::move(request));
    if (response.status != HTTP_OK) {
        throwUnexpected(response, "files.get (size)");
    }

    auto body = parseBody(response);
    std::optional<int64_t> size;
    if (body.contains("size")) {
        size = sizeFromJson(body["size"]);
    }
    if (!size) {
        throw UnsupportedOperationError("Remote entry " + id + " has no binary content");
    }
    return *size;
}

// ═══════════════════════════════════════════════════════════
// Содержимое
// ═══════════════════════════════════════════════════════════

HttpResponse DriveApi::fetchRange(const std::string& id, int64_t first, int64_t last) {
    HttpRequest request;
    request.method = "GET";
    request.url = m_endpoints.apiBaseUrl + "/files/" + urlEncode(id) + "?alt=media";
    request.headers["Range"] = formatByteRange(first, last);
    return send(std::move(request));
}

std::string DriveApi::initiateUpload(const UploadTarget& target, int64_t totalSize) {
    json metadata;
    metadata["name"] = target.name;
    metadata["parents"] = json::array({target.parentId});
    if (target.mimeType) {
        metadata["mimeType"] = *target.mimeType;
    }

    HttpRequest request;
    request.method = "POST";
    request.url = m_endpoints.uploadBaseUrl + "/files?" +
                  buildQuery({{"uploadType", "resumable"}, {"fields", ENTRY_FIELDS}});
    request.headers["Content-Type"] = "application/json; charset=UTF-8";
    request.headers["X-Upload-Content-Length"] = std::to_string(totalSize);
    if (target.mimeType) {
        request.headers["X-Upload-Content-Type"] = *target.mimeType;
    }
    request.body = metadata.dump();

    auto response = send(std::move(request));
    if (response.status != HTTP_OK) {
        throwUnexpected(response, "resumable upload initiation");
    }

    auto location = response.header("Location");
    if (!location || location->empty()) {
        throw TransportError(response.status, "Resumable upload initiation returned no Location",
                             response.body);
    }

    spdlog::info("Upload session opened for '{}' in {} ({} bytes)",
                 target.name, target.parentId, totalSize);
    return *location;
}

HttpResponse DriveApi::putChunk(const std::string& sessionUri, int64_t offset,
                                const std::string& data, int64_t totalSize) {
    HttpRequest request;
    request.method = "PUT";
    request.url = sessionUri;
    request.headers["Content-Range"] = formatContentRange(
        offset, offset + static_cast<int64_t>(data.size()) - 1, totalSize);
    request.body = data;
    return send(std::move(request));
}

HttpResponse DriveApi::probeUpload(const std::string& sessionUri, int64_t totalSize) {
    HttpRequest request;
    request.method = "PUT";
    request.url = sessionUri;
    request.headers["Content-Range"] = formatProbeRange(totalSize);
    return send(std::move(request));
}

RemoteEntry DriveApi::parseEntry(const std::string& text) {
    auto j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        throw TransportError(0, "Invalid JSON file resource", text);
    }
    return entryFromJson(j);
}

std::string DriveApi::escapeQueryLiteral(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        if (c == '\\' || c == '\'') {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }
    return escaped;
}

HttpResponse DriveApi::send(HttpRequest request) {
    return m_transport->request(request);
}

} // namespace CloudAnnex
