// BeastTransport.h — HttpTransport поверх Boost.Beast (HTTPS через OpenSSL)

#pragma once

#include "HttpTransport.h"
#include <functional>
#include <memory>
#include <string>

namespace CloudAnnex {

class CA_API BeastTransport : public HttpTransport {
public:
    /// Возвращает актуальный bearer-токен; пустая строка — без Authorization
    using TokenProvider = std::function<std::string()>;

    BeastTransport(TokenProvider tokenProvider, int timeoutSec = 60, bool verifyTls = true);
    ~BeastTransport() override;

    BeastTransport(const BeastTransport&) = delete;
    BeastTransport& operator=(const BeastTransport&) = delete;

    HttpResponse request(const HttpRequest& request) override;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace CloudAnnex
