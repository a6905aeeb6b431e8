// ChunkedUpload.h — машина состояний резюмируемой загрузки одного объекта
//
// Uninitiated -> SessionEstablished -> Transferring -> Committed
//                                   \-> Failed (сессия и offset остаются валидны)
//
// Повторный send() после Failed (или в новом процессе, через UploadJournal)
// зондирует сессию и продолжает с подтверждённой сервером позиции.

#pragma once

#include "../export.h"
#include "../Models.h"
#include "../Drive/DriveApi.h"
#include "RunningDigest.h"
#include "UploadJournal.h"
#include <memory>
#include <optional>
#include <string>

namespace CloudAnnex {

struct ChunkSession {
    std::string sessionUri;
    int64_t totalSize = 0;
    int64_t confirmedOffset = 0;
    int64_t chunkSize = DEFAULT_CHUNK_SIZE;
    RunningDigest runningDigest;
    bool offsetKnown = false;              // confirmedOffset проверен в этом процессе
    std::optional<int64_t> journalId;
};

class CA_API ChunkedUpload {
public:
    /// @param journal может быть nullptr — тогда сессия живёт только в памяти
    ChunkedUpload(std::shared_ptr<DriveApi> drive, std::shared_ptr<UploadJournal> journal);
    ~ChunkedUpload();

    ChunkedUpload(const ChunkedUpload&) = delete;
    ChunkedUpload& operator=(const ChunkedUpload&) = delete;

    /// Загрузить localSource в target.
    /// @return созданный элемент; entry.id — окончательный идентификатор
    /// @throws TransportError, ChecksumMismatchError, LocalIoError
    RemoteEntry send(const std::string& localSource,
                     const UploadTarget& target,
                     int64_t chunkSize = DEFAULT_CHUNK_SIZE,
                     const ProgressCallback& progress = nullptr);

    /// Забыть сессию (в памяти и в журнале)
    void abandon();

    UploadState state() const { return m_state; }
    const std::optional<ChunkSession>& session() const { return m_session; }

private:
    struct LocalIdentity {
        std::string path;
        int64_t size = 0;
        int64_t modifiedAt = 0;
    };

    enum class ProbeOutcome { Resumable, Completed, Expired };

    std::shared_ptr<DriveApi> m_drive;
    std::shared_ptr<UploadJournal> m_journal;
    UploadState m_state = UploadState::Uninitiated;
    std::optional<ChunkSession> m_session;
    std::optional<LocalIdentity> m_source;
    std::optional<UploadTarget> m_target;
    std::optional<RemoteEntry> m_committed;

    static LocalIdentity identify(const std::string& localSource);

    void prepareSession(const LocalIdentity& source, const UploadTarget& target, int64_t chunkSize);
    void establishSession(const LocalIdentity& source, const UploadTarget& target, int64_t chunkSize);
    ProbeOutcome probe(const LocalIdentity& source);
    RemoteEntry transfer(const LocalIdentity& source, const ProgressCallback& progress);
    RemoteEntry commit(const HttpResponse& response, const RunningDigest& fullDigest);
    void acceptBytes(int64_t acceptedEnd, const RunningDigest& candidate);
    void forgetJournalRecord();

    void verifyRemoteDigest(const HttpResponse& response, const RunningDigest& candidate) const;
};

} // namespace CloudAnnex
