#include "cloudannex/Transfer/RunningDigest.h"
#include "cloudannex/Errors.h"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <new>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace CloudAnnex {

namespace {

constexpr size_t READ_BUFFER_SIZE = 1024 * 1024;

EVP_MD_CTX* newMd5Context() {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::bad_alloc();
    }
    if (EVP_DigestInit_ex(ctx, EVP_md5(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("EVP_DigestInit_ex(md5) failed");
    }
    return ctx;
}

} // namespace

RunningDigest::RunningDigest() : m_ctx(newMd5Context()) {}

RunningDigest::~RunningDigest() {
    if (m_ctx) {
        EVP_MD_CTX_free(m_ctx);
    }
}

RunningDigest::RunningDigest(const RunningDigest& other) : m_ctx(EVP_MD_CTX_new()), m_bytes(other.m_bytes) {
    if (!m_ctx) {
        throw std::bad_alloc();
    }
    if (EVP_MD_CTX_copy_ex(m_ctx, other.m_ctx) != 1) {
        EVP_MD_CTX_free(m_ctx);
        throw std::runtime_error("EVP_MD_CTX_copy_ex failed");
    }
}

RunningDigest& RunningDigest::operator=(const RunningDigest& other) {
    if (this != &other) {
        if (EVP_MD_CTX_copy_ex(m_ctx, other.m_ctx) != 1) {
            throw std::runtime_error("EVP_MD_CTX_copy_ex failed");
        }
        m_bytes = other.m_bytes;
    }
    return *this;
}

void RunningDigest::update(const char* data, size_t size) {
    if (size == 0) {
        return;
    }
    if (EVP_DigestUpdate(m_ctx, data, size) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    m_bytes += static_cast<int64_t>(size);
}

std::string RunningDigest::hexDigest() const {
    // Финализируем копию, чтобы исходный контекст можно было продолжать
    RunningDigest snapshot(*this);

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (EVP_DigestFinal_ex(snapshot.m_ctx, digest, &digestLen) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }

    std::ostringstream ss;
    for (unsigned int i = 0; i < digestLen; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return ss.str();
}

void RunningDigest::reset() {
    if (EVP_DigestInit_ex(m_ctx, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex(md5) failed");
    }
    m_bytes = 0;
}

RunningDigest RunningDigest::ofFilePrefix(const std::string& path, int64_t length) {
    RunningDigest digest;
    if (length <= 0) {
        return digest;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw LocalIoError("Cannot open file for hashing: " + path);
    }

    std::vector<char> buffer(READ_BUFFER_SIZE);
    int64_t remaining = length;
    while (remaining > 0) {
        auto want = static_cast<std::streamsize>(
            std::min<int64_t>(remaining, static_cast<int64_t>(buffer.size())));
        file.read(buffer.data(), want);
        auto got = file.gcount();
        if (got <= 0) {
            throw LocalIoError("File " + path + " is shorter than " + std::to_string(length) +
                               " bytes");
        }
        digest.update(buffer.data(), static_cast<size_t>(got));
        remaining -= got;
    }
    return digest;
}

} // namespace CloudAnnex
