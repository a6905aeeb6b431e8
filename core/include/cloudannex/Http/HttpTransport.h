// HttpTransport.h — синхронный HTTP-транспорт, через который идут все запросы к хранилищу

#pragma once

#include "../export.h"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace CloudAnnex {

// ═══════════════════════════════════════════════════════════
// Коды статуса, которые различает движок передачи
// ═══════════════════════════════════════════════════════════

constexpr int HTTP_OK = 200;
constexpr int HTTP_CREATED = 201;
constexpr int HTTP_NO_CONTENT = 204;
constexpr int HTTP_PARTIAL_CONTENT = 206;
constexpr int HTTP_RESUME_INCOMPLETE = 308;
constexpr int HTTP_NOT_FOUND = 404;
constexpr int HTTP_GONE = 410;

/// Сравнение имён заголовков без учёта регистра
struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

using HttpHeaders = std::map<std::string, std::string, CaseInsensitiveLess>;

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    HttpHeaders headers;
    std::string body;
};

struct CA_API HttpResponse {
    int status = 0;
    HttpHeaders headers;
    std::string body;

    std::optional<std::string> header(const std::string& name) const;
    bool isSuccess() const { return status >= 200 && status < 300; }
};

// ═══════════════════════════════════════════════════════════
// HttpTransport — абстракция транспорта
// ═══════════════════════════════════════════════════════════

/// Реализация должна вернуть любой HTTP-ответ как есть (включая 206 и 308)
/// и бросать TransportError (status 0) только если ответа нет вообще.
class CA_API HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse request(const HttpRequest& request) = 0;
};

// ═══════════════════════════════════════════════════════════
// Хелперы
// ═══════════════════════════════════════════════════════════

struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;   // путь + query, всегда начинается с '/'
};

/// @throws std::invalid_argument если URL не http(s)
CA_API ParsedUrl parseUrl(const std::string& url);

CA_API std::string urlEncode(const std::string& value);
CA_API std::string urlDecode(const std::string& value);

/// Собрать query string из пар ключ/значение (значения кодируются)
CA_API std::string buildQuery(const std::map<std::string, std::string>& params);

/// Разобрать "bytes=0-1023" (заголовок Range в ответе 308).
/// @return число подтверждённых байт (последний байт + 1) или nullopt
CA_API std::optional<int64_t> parseAcceptedRange(const std::string& rangeHeader);

/// "bytes 100-199/1000" — Content-Range для чанка
CA_API std::string formatContentRange(int64_t first, int64_t last, int64_t total);

/// "bytes */1000" — Content-Range для зонда
CA_API std::string formatProbeRange(int64_t total);

/// "bytes=100-199" — Range для ранжированного чтения
CA_API std::string formatByteRange(int64_t first, int64_t last);

} // namespace CloudAnnex
