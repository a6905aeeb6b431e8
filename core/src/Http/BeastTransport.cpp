// BeastTransport.cpp — HTTPS-клиент на Boost.Beast
// Одно соединение на запрос: пул соединений здесь не нужен, передача
// идёт последовательно чанк за чанком.

#include "cloudannex/Http/BeastTransport.h"
#include "cloudannex/Errors.h"
#include "cloudannex/core.h"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <limits>
#include <stdexcept>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace CloudAnnex {

namespace {

// Синхронные операции tcp_stream не учитывают expires_after, поэтому каждая
// операция запускается асинхронно и io_context прокручивается до её завершения.
template<typename Initiate>
void runOperation(asio::io_context& ioc, Initiate&& initiate) {
    beast::error_code result;
    initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
    ioc.restart();
    ioc.run();
    if (result) {
        throw boost::system::system_error(result);
    }
}

template<typename Stream>
HttpResponse exchange(asio::io_context& ioc,
                      Stream& stream,
                      beast::tcp_stream& lowest,
                      http::request<http::string_body>& message,
                      std::chrono::seconds timeout) {
    lowest.expires_after(timeout);
    runOperation(ioc, [&](auto handler) {
        http::async_write(stream, message, std::move(handler));
    });

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    // Чанк по умолчанию 10 MB, лимит Beast по умолчанию — 8 MB
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());

    lowest.expires_after(timeout);
    runOperation(ioc, [&](auto handler) {
        http::async_read(stream, buffer, parser, std::move(handler));
    });

    auto& res = parser.get();
    HttpResponse response;
    response.status = static_cast<int>(res.result_int());
    for (const auto& field : res) {
        response.headers[std::string(field.name_string())] = std::string(field.value());
    }
    response.body = std::move(res.body());
    return response;
}

} // namespace

// ═══════════════════════════════════════════════════════════
// BeastTransport::Impl
// ═══════════════════════════════════════════════════════════

class BeastTransport::Impl {
public:
    Impl(TokenProvider tokenProvider, int timeoutSec, bool verifyTls)
        : m_tokenProvider(std::move(tokenProvider))
        , m_timeout(timeoutSec > 0 ? timeoutSec : 60)
        , m_verifyTls(verifyTls)
        , m_sslContext(ssl::context::tls_client) {
        if (m_verifyTls) {
            m_sslContext.set_default_verify_paths();
            m_sslContext.set_verify_mode(ssl::verify_peer);
        } else {
            spdlog::warn("BeastTransport: TLS certificate verification disabled");
            m_sslContext.set_verify_mode(ssl::verify_none);
        }
    }

    HttpResponse request(const HttpRequest& req) {
        ParsedUrl url;
        try {
            url = parseUrl(req.url);
        } catch (const std::invalid_argument& e) {
            throw TransportError(0, e.what());
        }

        auto message = buildMessage(req, url);

        try {
            asio::io_context ioc;
            tcp::resolver resolver(ioc);
            auto endpoints = resolver.resolve(url.host, url.port);

            HttpResponse response;
            if (url.scheme == "https") {
                beast::ssl_stream<beast::tcp_stream> stream(ioc, m_sslContext);
                if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
                    throw TransportError(0, "Failed to set TLS SNI host name: " + url.host);
                }
                if (m_verifyTls) {
                    stream.set_verify_callback(ssl::host_name_verification(url.host));
                }

                auto& lowest = beast::get_lowest_layer(stream);
                lowest.expires_after(m_timeout);
                runOperation(ioc, [&](auto handler) {
                    lowest.async_connect(endpoints, std::move(handler));
                });
                lowest.expires_after(m_timeout);
                runOperation(ioc, [&](auto handler) {
                    stream.async_handshake(ssl::stream_base::client, std::move(handler));
                });

                response = exchange(ioc, stream, lowest, message, m_timeout);

                beast::error_code ec;
                lowest.socket().shutdown(tcp::socket::shutdown_both, ec);
            } else {
                beast::tcp_stream stream(ioc);
                stream.expires_after(m_timeout);
                runOperation(ioc, [&](auto handler) {
                    stream.async_connect(endpoints, std::move(handler));
                });

                response = exchange(ioc, stream, stream, message, m_timeout);

                beast::error_code ec;
                stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            }

            spdlog::debug("HTTP {} {}{} -> {}", req.method, url.host, url.target, response.status);
            return response;
        } catch (const boost::system::system_error& e) {
            spdlog::warn("HTTP {} {} failed: {}", req.method, url.host, e.what());
            throw TransportError(0, std::string("Request to ") + url.host + " failed: " + e.what());
        }
    }

private:
    TokenProvider m_tokenProvider;
    std::chrono::seconds m_timeout;
    bool m_verifyTls;
    ssl::context m_sslContext;

    http::request<http::string_body> buildMessage(const HttpRequest& req, const ParsedUrl& url) {
        http::verb verb = http::string_to_verb(req.method);
        if (verb == http::verb::unknown) {
            throw TransportError(0, "Unsupported HTTP method: " + req.method);
        }

        http::request<http::string_body> message{verb, url.target, 11};
        message.set(http::field::host, url.host);
        message.set(http::field::user_agent, std::string("cloudannex/") + VERSION);

        for (const auto& [name, value] : req.headers) {
            message.set(name, value);
        }

        if (req.headers.find("Authorization") == req.headers.end() && m_tokenProvider) {
            std::string token = m_tokenProvider();
            if (!token.empty()) {
                message.set(http::field::authorization, "Bearer " + token);
            }
        }

        message.body() = req.body;
        message.prepare_payload();
        return message;
    }
};

// ═══════════════════════════════════════════════════════════
// BeastTransport
// ═══════════════════════════════════════════════════════════

BeastTransport::BeastTransport(TokenProvider tokenProvider, int timeoutSec, bool verifyTls)
    : m_impl(std::make_unique<Impl>(std::move(tokenProvider), timeoutSec, verifyTls)) {}

BeastTransport::~BeastTransport() = default;

HttpResponse BeastTransport::request(const HttpRequest& request) {
    return m_impl->request(request);
}

} // namespace CloudAnnex
