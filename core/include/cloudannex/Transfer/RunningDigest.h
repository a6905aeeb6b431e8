#pragma once

#include "../export.h"
#include <cstddef>
#include <cstdint>
#include <string>

#include <openssl/evp.h>

namespace CloudAnnex {

/// Инкрементальный MD5 (OpenSSL EVP). Копируется вместе с состоянием,
/// поэтому hexDigest() можно брать на любом шаге, не теряя накопленное.
class CA_API RunningDigest {
public:
    RunningDigest();
    ~RunningDigest();

    RunningDigest(const RunningDigest& other);
    RunningDigest& operator=(const RunningDigest& other);

    void update(const char* data, size_t size);
    void update(const std::string& data) { update(data.data(), data.size()); }

    /// MD5 накопленных байт, lower-case hex
    std::string hexDigest() const;

    int64_t bytesHashed() const { return m_bytes; }

    void reset();

    /// MD5 первых length байт файла
    /// @throws LocalIoError если файл короче или не читается
    static RunningDigest ofFilePrefix(const std::string& path, int64_t length);

private:
    EVP_MD_CTX* m_ctx = nullptr;
    int64_t m_bytes = 0;
};

} // namespace CloudAnnex
