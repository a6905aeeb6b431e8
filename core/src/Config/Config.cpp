#include "cloudannex/Config.h"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace CloudAnnex {

using json = nlohmann::json;

DriveConfig DriveConfig::fromJson(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::invalid_argument(std::string("Invalid config JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw std::invalid_argument("Config must be a JSON object");
    }

    DriveConfig config;
    try {
        config.apiBaseUrl = j.value("apiBaseUrl", config.apiBaseUrl);
        config.uploadBaseUrl = j.value("uploadBaseUrl", config.uploadBaseUrl);
        config.accessToken = j.value("accessToken", config.accessToken);
        config.rootId = j.value("rootId", config.rootId);
        config.chunkSize = j.value("chunkSize", config.chunkSize);
        config.timeoutSec = j.value("timeoutSec", config.timeoutSec);
        config.verifyTls = j.value("verifyTls", config.verifyTls);
        config.logLevel = j.value("logLevel", config.logLevel);
        if (j.contains("journalPath") && !j["journalPath"].is_null()) {
            config.journalPath = j["journalPath"].get<std::string>();
        }
    } catch (const json::type_error& e) {
        throw std::invalid_argument(std::string("Invalid config value: ") + e.what());
    }

    if (config.chunkSize <= 0) {
        throw std::invalid_argument("chunkSize must be positive");
    }
    if (config.rootId.empty()) {
        throw std::invalid_argument("rootId is required");
    }
    if (config.apiBaseUrl.empty() || config.uploadBaseUrl.empty()) {
        throw std::invalid_argument("API base URLs are required");
    }
    return config;
}

DriveConfig DriveConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::invalid_argument("Cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(buffer.str());
}

std::string DriveConfig::toJson() const {
    json j;
    j["apiBaseUrl"] = apiBaseUrl;
    j["uploadBaseUrl"] = uploadBaseUrl;
    j["rootId"] = rootId;
    j["chunkSize"] = chunkSize;
    j["journalPath"] = journalPath ? json(*journalPath) : json(nullptr);
    j["timeoutSec"] = timeoutSec;
    j["verifyTls"] = verifyTls;
    j["logLevel"] = logLevel;
    // accessToken не сериализуется
    return j.dump();
}

void applyLogLevel(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str возвращает off для неизвестных строк
    if (parsed == spdlog::level::off && level != "off") {
        spdlog::warn("Unknown log level '{}', keeping current", level);
        return;
    }
    spdlog::set_level(parsed);
}

} // namespace CloudAnnex
