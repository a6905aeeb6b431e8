// ChunkedDownload.cpp — докачка по Range-запросам

#include "cloudannex/Transfer/ChunkedDownload.h"
#include "cloudannex/Errors.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace CloudAnnex {

namespace {

int64_t existingSize(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return 0;
    }
    auto size = fs::file_size(path, ec);
    if (ec) {
        throw LocalIoError("Cannot stat " + path + ": " + ec.message());
    }
    return static_cast<int64_t>(size);
}

int64_t advanceFrom(const HttpResponse& response) {
    if (auto length = response.header("Content-Length")) {
        try {
            return static_cast<int64_t>(std::stoll(*length));
        } catch (const std::logic_error&) {
            throw TransportError(response.status, "Invalid Content-Length: " + *length);
        }
    }
    return static_cast<int64_t>(response.body.size());
}

} // namespace

ChunkedDownload::ChunkedDownload(std::shared_ptr<DriveApi> drive)
    : m_drive(std::move(drive)) {
    if (!m_drive) {
        throw std::invalid_argument("DriveApi instance is required");
    }
}

int64_t ChunkedDownload::receive(const std::string& remoteId,
                                 const std::string& localDestination,
                                 int64_t chunkSize,
                                 const ProgressCallback& progress) {
    if (chunkSize <= 0) {
        throw std::invalid_argument("chunkSize must be positive");
    }

    int64_t localSize = existingSize(localDestination);
    int64_t remoteSize = m_drive->getSize(remoteId);

    if (localSize > remoteSize) {
        spdlog::warn("Local file {} ({} bytes) is larger than remote {} ({} bytes), skipping",
                     localDestination, localSize, remoteId, remoteSize);
        return localSize;
    }

    // Открываем до проверки полноты: пустой удалённый файл тоже создаётся локально
    std::ofstream out(localDestination, std::ios::binary | std::ios::app);
    if (!out) {
        throw LocalIoError("Cannot open " + localDestination + " for writing");
    }

    if (localSize == remoteSize) {
        spdlog::debug("{} already complete ({} bytes)", localDestination, localSize);
        return localSize;
    }

    spdlog::info("Downloading {} -> {} from offset {} of {}",
                 remoteId, localDestination, localSize, remoteSize);

    while (localSize < remoteSize) {
        int64_t last = localSize + std::min(chunkSize, remoteSize - localSize) - 1;
        auto response = m_drive->fetchRange(remoteId, localSize, last);

        if (response.status != HTTP_PARTIAL_CONTENT) {
            throw TransportError(response.status,
                                 "Ranged download of " + remoteId + " at offset " +
                                     std::to_string(localSize) + " was not served as partial content",
                                 response.body);
        }

        int64_t advance = advanceFrom(response);
        if (advance <= 0 || response.body.empty()) {
            throw TransportError(response.status,
                                 "Empty partial content for " + remoteId + " at offset " +
                                     std::to_string(localSize));
        }

        out.write(response.body.data(), static_cast<std::streamsize>(response.body.size()));
        out.flush();
        if (!out) {
            throw LocalIoError("Write to " + localDestination + " failed");
        }

        localSize += advance;
        spdlog::debug("{}: {}/{} bytes", localDestination, localSize, remoteSize);
        if (progress) {
            progress(localSize);
        }
    }

    spdlog::info("Download of {} complete ({} bytes)", remoteId, localSize);
    return localSize;
}

} // namespace CloudAnnex
