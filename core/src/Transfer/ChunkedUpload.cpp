// ChunkedUpload.cpp — резюмируемая загрузка с проверкой MD5 на каждом чанке

#include "cloudannex/Transfer/ChunkedUpload.h"
#include "cloudannex/Errors.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace CloudAnnex {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

bool isFinished(const HttpResponse& response) {
    return response.status == HTTP_OK || response.status == HTTP_CREATED;
}

/// Конец принятого диапазона из 308. Нет заголовка — fallback.
int64_t acceptedEndOf(const HttpResponse& response, int64_t fallback) {
    auto range = response.header("Range");
    if (!range) {
        return fallback;
    }
    auto accepted = parseAcceptedRange(*range);
    if (!accepted) {
        throw TransportError(response.status, "Malformed Range header: " + *range);
    }
    return *accepted;
}

} // namespace

ChunkedUpload::ChunkedUpload(std::shared_ptr<DriveApi> drive, std::shared_ptr<UploadJournal> journal)
    : m_drive(std::move(drive)), m_journal(std::move(journal)) {
    if (!m_drive) {
        throw std::invalid_argument("DriveApi instance is required");
    }
}

ChunkedUpload::~ChunkedUpload() = default;

RemoteEntry ChunkedUpload::send(const std::string& localSource,
                                const UploadTarget& target,
                                int64_t chunkSize,
                                const ProgressCallback& progress) {
    if (chunkSize <= 0) {
        throw std::invalid_argument("chunkSize must be positive");
    }
    if (target.parentId.empty() || target.name.empty()) {
        throw std::invalid_argument("Upload target requires parentId and name");
    }

    auto source = identify(localSource);

    try {
        prepareSession(source, target, chunkSize);
        return transfer(source, progress);
    } catch (...) {
        // Сессия остаётся: следующий send() зондирует её заново
        m_state = UploadState::Failed;
        if (m_session) {
            m_session->offsetKnown = false;
        }
        throw;
    }
}

void ChunkedUpload::abandon() {
    if (m_session) {
        forgetJournalRecord();
    } else if (m_journal && m_source && m_target) {
        if (auto record = m_journal->find(m_source->path, m_target->parentId, m_target->name)) {
            m_journal->remove(record->id);
        }
    }
    m_session.reset();
    m_state = UploadState::Uninitiated;
    spdlog::info("Upload session abandoned");
}

// ═══════════════════════════════════════════════════════════
// Сессия
// ═══════════════════════════════════════════════════════════

ChunkedUpload::LocalIdentity ChunkedUpload::identify(const std::string& localSource) {
    std::error_code ec;
    if (!fs::is_regular_file(localSource, ec)) {
        throw LocalIoError("Local source is not a regular file: " + localSource);
    }

    LocalIdentity identity;
    identity.path = localSource;
    identity.size = static_cast<int64_t>(fs::file_size(localSource, ec));
    if (ec) {
        throw LocalIoError("Cannot stat " + localSource + ": " + ec.message());
    }
    auto mtime = fs::last_write_time(localSource, ec);
    if (ec) {
        throw LocalIoError("Cannot read mtime of " + localSource + ": " + ec.message());
    }
    identity.modifiedAt = std::chrono::duration_cast<std::chrono::seconds>(
        mtime.time_since_epoch()).count();
    return identity;
}

void ChunkedUpload::prepareSession(const LocalIdentity& source,
                                   const UploadTarget& target,
                                   int64_t chunkSize) {
    bool sameUpload = m_session && m_source && m_target &&
                      m_source->path == source.path &&
                      m_source->size == source.size &&
                      m_source->modifiedAt == source.modifiedAt &&
                      m_target->parentId == target.parentId &&
                      m_target->name == target.name;

    if (!sameUpload) {
        if (m_session) {
            spdlog::debug("Dropping in-memory session for a different upload");
        }
        m_session.reset();
        m_committed.reset();

        if (m_journal) {
            auto record = m_journal->find(source.path, target.parentId, target.name);
            if (record && (record->fileSize != source.size || record->modifiedAt != source.modifiedAt)) {
                spdlog::info("Stale upload session for {} (file changed), discarding", source.path);
                m_journal->remove(record->id);
            } else if (record) {
                ChunkSession session;
                session.sessionUri = record->sessionUri;
                session.totalSize = source.size;
                session.confirmedOffset = record->confirmedOffset;
                session.chunkSize = chunkSize;
                session.offsetKnown = false;
                session.journalId = record->id;
                m_session = std::move(session);
                m_state = UploadState::SessionEstablished;
                spdlog::info("Resuming upload of {} from journal (offset {})",
                             source.path, record->confirmedOffset);
            }
        }
    }

    m_source = source;
    m_target = target;

    if (!m_session) {
        establishSession(source, target, chunkSize);
    }
    m_session->chunkSize = chunkSize;
}

void ChunkedUpload::establishSession(const LocalIdentity& source,
                                     const UploadTarget& target,
                                     int64_t chunkSize) {
    ChunkSession session;
    session.sessionUri = m_drive->initiateUpload(target, source.size);
    session.totalSize = source.size;
    session.confirmedOffset = 0;
    session.chunkSize = chunkSize;
    session.offsetKnown = true;

    if (m_journal) {
        UploadSessionRecord record;
        record.localPath = source.path;
        record.fileSize = source.size;
        record.modifiedAt = source.modifiedAt;
        record.parentId = target.parentId;
        record.name = target.name;
        record.sessionUri = session.sessionUri;
        record.confirmedOffset = 0;
        record.chunkSize = chunkSize;
        session.journalId = m_journal->save(record).id;
    }

    m_session = std::move(session);
    m_state = UploadState::SessionEstablished;
}

ChunkedUpload::ProbeOutcome ChunkedUpload::probe(const LocalIdentity& source) {
    auto response = m_drive->probeUpload(m_session->sessionUri, m_session->totalSize);

    if (response.status == HTTP_RESUME_INCOMPLETE) {
        int64_t accepted = acceptedEndOf(response, 0);
        if (accepted > m_session->totalSize) {
            throw TransportError(response.status, "Server reports more bytes than the file holds");
        }

        auto rebuilt = RunningDigest::ofFilePrefix(source.path, accepted);
        verifyRemoteDigest(response, rebuilt);
        acceptBytes(accepted, rebuilt);
        m_session->offsetKnown = true;
        spdlog::info("Upload session probed: {} of {} bytes accepted", accepted, m_session->totalSize);
        return ProbeOutcome::Resumable;
    }

    if (isFinished(response)) {
        m_committed = commit(response, RunningDigest::ofFilePrefix(source.path, source.size));
        return ProbeOutcome::Completed;
    }

    if (response.status == HTTP_NOT_FOUND || response.status == HTTP_GONE) {
        spdlog::warn("Upload session for {} expired (HTTP {}), starting over",
                     source.path, response.status);
        forgetJournalRecord();
        m_session.reset();
        return ProbeOutcome::Expired;
    }

    throw TransportError(response.status, "Unexpected response to upload probe", response.body);
}

// ═══════════════════════════════════════════════════════════
// Передача
// ═══════════════════════════════════════════════════════════

RemoteEntry ChunkedUpload::transfer(const LocalIdentity& source, const ProgressCallback& progress) {
    if (!m_session->offsetKnown) {
        int64_t chunkSize = m_session->chunkSize;
        switch (probe(source)) {
            case ProbeOutcome::Completed:
                return *m_committed;
            case ProbeOutcome::Expired:
                establishSession(source, *m_target, chunkSize);
                break;
            case ProbeOutcome::Resumable:
                break;
        }
    }

    m_state = UploadState::Transferring;
    const int64_t total = m_session->totalSize;

    if (total == 0) {
        auto response = m_drive->probeUpload(m_session->sessionUri, 0);
        if (!isFinished(response)) {
            throw TransportError(response.status, "Empty upload was not finalized", response.body);
        }
        return commit(response, RunningDigest());
    }

    std::ifstream in(source.path, std::ios::binary);
    if (!in) {
        throw LocalIoError("Cannot open " + source.path + " for reading");
    }

    while (m_session->confirmedOffset < total) {
        const int64_t offset = m_session->confirmedOffset;
        const int64_t length = std::min(m_session->chunkSize, total - offset);

        std::string data(static_cast<size_t>(length), '\0');
        in.seekg(offset);
        in.read(&data[0], static_cast<std::streamsize>(length));
        if (in.gcount() != length) {
            throw LocalIoError("File " + source.path + " changed during upload");
        }

        auto response = m_drive->putChunk(m_session->sessionUri, offset, data, total);

        if (response.status == HTTP_RESUME_INCOMPLETE) {
            int64_t acceptedEnd = acceptedEndOf(response, offset + length);
            if (acceptedEnd < offset || acceptedEnd > offset + length) {
                throw TransportError(response.status,
                                     "Accepted range " + std::to_string(acceptedEnd) +
                                         " outside of sent chunk at " + std::to_string(offset));
            }
            if (acceptedEnd == offset) {
                throw TransportError(response.status,
                                     "Server accepted no bytes at offset " + std::to_string(offset));
            }

            RunningDigest candidate(m_session->runningDigest);
            candidate.update(data.data(), static_cast<size_t>(acceptedEnd - offset));
            verifyRemoteDigest(response, candidate);
            acceptBytes(acceptedEnd, candidate);

            spdlog::debug("{}: {}/{} bytes confirmed", source.path, acceptedEnd, total);
            if (progress) {
                progress(acceptedEnd);
            }
            continue;
        }

        if (isFinished(response)) {
            RunningDigest full(m_session->runningDigest);
            full.update(data);
            if (offset + length != total) {
                full = RunningDigest::ofFilePrefix(source.path, total);
            }
            auto entry = commit(response, full);
            if (progress) {
                progress(total);
            }
            return entry;
        }

        throw TransportError(response.status,
                             "Chunk at offset " + std::to_string(offset) + " rejected",
                             response.body);
    }

    // Все байты приняты, но финального ответа не было
    if (probe(source) == ProbeOutcome::Completed) {
        return *m_committed;
    }
    throw TransportError(HTTP_RESUME_INCOMPLETE, "Upload accepted all bytes but was not finalized");
}

RemoteEntry ChunkedUpload::commit(const HttpResponse& response, const RunningDigest& fullDigest) {
    auto entry = DriveApi::parseEntry(response.body);

    if (entry.md5Checksum) {
        std::string local = fullDigest.hexDigest();
        if (toLower(*entry.md5Checksum) != local) {
            int64_t offset = m_session ? m_session->confirmedOffset : 0;
            spdlog::error("Committed upload {} has md5 {}, local {}", entry.id, *entry.md5Checksum, local);
            throw ChecksumMismatchError(*entry.md5Checksum, local, offset);
        }
    }

    forgetJournalRecord();
    m_session.reset();
    m_state = UploadState::Committed;
    m_committed = entry;

    spdlog::info("Upload committed: '{}' ({})", entry.name, entry.id);
    return entry;
}

void ChunkedUpload::acceptBytes(int64_t acceptedEnd, const RunningDigest& candidate) {
    m_session->runningDigest = candidate;
    m_session->confirmedOffset = acceptedEnd;
    if (m_journal && m_session->journalId) {
        m_journal->updateOffset(*m_session->journalId, acceptedEnd);
    }
}

void ChunkedUpload::forgetJournalRecord() {
    if (m_journal && m_session && m_session->journalId) {
        m_journal->remove(*m_session->journalId);
        m_session->journalId.reset();
    }
}

void ChunkedUpload::verifyRemoteDigest(const HttpResponse& response,
                                       const RunningDigest& candidate) const {
    auto remote = response.header(UPLOAD_DIGEST_HEADER);
    if (!remote) {
        spdlog::debug("No {} in response, digest at {} not verified",
                      UPLOAD_DIGEST_HEADER, candidate.bytesHashed());
        return;
    }

    std::string local = candidate.hexDigest();
    if (toLower(*remote) != local) {
        int64_t offset = m_session ? m_session->confirmedOffset : 0;
        spdlog::error("Digest mismatch after {} bytes: remote {}, local {}",
                      candidate.bytesHashed(), *remote, local);
        throw ChecksumMismatchError(*remote, local, offset);
    }
}

} // namespace CloudAnnex
