#include "cloudannex/Tree/PathResolver.h"

namespace CloudAnnex {

std::string PathResolver::normalize(const std::string& path) {
    return join(split(path));
}

std::pair<std::string, std::string> PathResolver::splitFirst(const std::string& path) {
    auto normalized = normalize(path);
    auto sep = normalized.find('/');
    if (sep == std::string::npos) {
        return {normalized, ""};
    }
    return {normalized.substr(0, sep), normalized.substr(sep + 1)};
}

std::vector<std::string> PathResolver::split(const std::string& path) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= path.size()) {
        auto end = path.find('/', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        if (end > start) {
            segments.push_back(path.substr(start, end - start));
        }
        start = end + 1;
    }
    return segments;
}

std::string PathResolver::join(const std::vector<std::string>& segments) {
    std::string result;
    for (const auto& segment : segments) {
        if (segment.empty()) {
            continue;
        }
        if (!result.empty()) {
            result += '/';
        }
        result += segment;
    }
    return result;
}

} // namespace CloudAnnex
