#include "cloudannex/Http/HttpTransport.h"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace CloudAnnex {

bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
}

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    auto it = headers.find(name);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ═══════════════════════════════════════════════════════════
// URL
// ═══════════════════════════════════════════════════════════

ParsedUrl parseUrl(const std::string& url) {
    ParsedUrl result;

    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("URL without scheme: " + url);
    }
    result.scheme = url.substr(0, schemeEnd);
    std::transform(result.scheme.begin(), result.scheme.end(), result.scheme.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (result.scheme != "http" && result.scheme != "https") {
        throw std::invalid_argument("Unsupported URL scheme: " + result.scheme);
    }

    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find_first_of("/?", hostStart);
    std::string authority = url.substr(hostStart, pathStart == std::string::npos
                                                      ? std::string::npos
                                                      : pathStart - hostStart);
    if (authority.empty()) {
        throw std::invalid_argument("URL without host: " + url);
    }

    auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        result.host = authority.substr(0, colon);
        result.port = authority.substr(colon + 1);
    } else {
        result.host = authority;
        result.port = result.scheme == "https" ? "443" : "80";
    }

    if (pathStart == std::string::npos) {
        result.target = "/";
    } else if (url[pathStart] == '?') {
        result.target = "/" + url.substr(pathStart);
    } else {
        result.target = url.substr(pathStart);
    }
    return result;
}

std::string urlEncode(const std::string& value) {
    static const char* HEX = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(HEX[c >> 4]);
            out.push_back(HEX[c & 0x0F]);
        }
    }
    return out;
}

std::string urlDecode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '%' && i + 2 < value.size() &&
            std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
            out.push_back(static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else if (c == '+') {
            out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string buildQuery(const std::map<std::string, std::string>& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        if (!query.empty()) {
            query += '&';
        }
        query += urlEncode(key) + "=" + urlEncode(value);
    }
    return query;
}

// ═══════════════════════════════════════════════════════════
// Range / Content-Range
// ═══════════════════════════════════════════════════════════

std::optional<int64_t> parseAcceptedRange(const std::string& rangeHeader) {
    // "bytes=0-1023"
    auto eq = rangeHeader.find('=');
    auto dash = rangeHeader.find('-', eq == std::string::npos ? 0 : eq);
    if (eq == std::string::npos || dash == std::string::npos) {
        return std::nullopt;
    }

    try {
        size_t consumed = 0;
        std::string lastStr = rangeHeader.substr(dash + 1);
        long long last = std::stoll(lastStr, &consumed);
        if (consumed == 0 || last < 0) {
            return std::nullopt;
        }
        return static_cast<int64_t>(last) + 1;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

std::string formatContentRange(int64_t first, int64_t last, int64_t total) {
    return "bytes " + std::to_string(first) + "-" + std::to_string(last) + "/" +
           std::to_string(total);
}

std::string formatProbeRange(int64_t total) {
    return "bytes */" + std::to_string(total);
}

std::string formatByteRange(int64_t first, int64_t last) {
    return "bytes=" + std::to_string(first) + "-" + std::to_string(last);
}

} // namespace CloudAnnex
