// ChunkedDownload.h — резюмируемое скачивание по диапазонам байт

#pragma once

#include "../export.h"
#include "../Models.h"
#include "../Drive/DriveApi.h"
#include <memory>
#include <string>

namespace CloudAnnex {

class CA_API ChunkedDownload {
public:
    explicit ChunkedDownload(std::shared_ptr<DriveApi> drive);

    /// Докачать remoteId в localDestination.
    /// Существующий файл считается уже скачанным префиксом; отсутствующий — нулевым.
    /// Любой ответ кроме 206 прерывает передачу, записанные байты остаются на диске.
    /// @return итоговый размер локального файла
    /// @throws TransportError, LocalIoError
    int64_t receive(const std::string& remoteId,
                    const std::string& localDestination,
                    int64_t chunkSize = DEFAULT_CHUNK_SIZE,
                    const ProgressCallback& progress = nullptr);

private:
    std::shared_ptr<DriveApi> m_drive;
};

} // namespace CloudAnnex
