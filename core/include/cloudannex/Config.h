// Config.h — настройки подключения к хранилищу

#pragma once

#include "export.h"
#include "Models.h"
#include <optional>
#include <string>

namespace CloudAnnex {

struct CA_API DriveConfig {
    std::string apiBaseUrl = "https://www.googleapis.com/drive/v3";
    std::string uploadBaseUrl = "https://www.googleapis.com/upload/drive/v3";
    std::string accessToken;
    std::string rootId = "root";
    int64_t chunkSize = DEFAULT_CHUNK_SIZE;
    std::optional<std::string> journalPath;   // nullopt — сессии не сохраняются
    int timeoutSec = 60;
    bool verifyTls = true;
    std::string logLevel = "info";

    /// Разобрать JSON. Неизвестные ключи игнорируются.
    /// @throws std::invalid_argument при некорректном JSON или значениях
    static DriveConfig fromJson(const std::string& json);

    /// Прочитать JSON-файл конфигурации
    static DriveConfig loadFromFile(const std::string& path);

    std::string toJson() const;
};

/// Применить уровень логирования spdlog ("trace" ... "off")
CA_API void applyLogLevel(const std::string& level);

} // namespace CloudAnnex
