#pragma once

#include "../export.h"
#include <string>
#include <utility>
#include <vector>

namespace CloudAnnex {

/// Разбор путей вида "a/b/c". Ведущие и хвостовые '/' отбрасываются,
/// пустые сегменты схлопываются, имена сравниваются точно.
class CA_API PathResolver {
public:
    /// Путь без ведущих и хвостовых разделителей
    static std::string normalize(const std::string& path);

    /// Первый сегмент и остаток ("a/b/c" -> {"a", "b/c"}, "a" -> {"a", ""})
    static std::pair<std::string, std::string> splitFirst(const std::string& path);

    static std::vector<std::string> split(const std::string& path);

    static std::string join(const std::vector<std::string>& segments);
};

} // namespace CloudAnnex
