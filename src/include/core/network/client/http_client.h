#pragma once

#include "connection_pool.h"
#include "http_connection.h"
#include "url.h"
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http.hpp>
#include <core/model/transfer_options.h>
#include <memory>

namespace streamfetch::core {

/**
 * @brief Connection factory shared by transfers
 *
 * Holds the TLS client context and, when pooled, the idle keep-alive connections. The only
 * mutable state transfers share.
 */
class HttpClient {
public:
    using Clock = HttpConnection::Clock;

    explicit HttpClient(bool pooled = true, bool verify_peer = true);
    ~HttpClient() = default;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Pooled connection for url's origin when one is idle, a new one otherwise.
    // Connection failures are thrown as TransferError (kNetwork or kTimeout).
    net::awaitable<std::unique_ptr<HttpConnection>> Open(const Url& url,
                                                         Clock::time_point deadline);

    // Always a new connection
    net::awaitable<std::unique_ptr<HttpConnection>> OpenFresh(const Url& url,
                                                              Clock::time_point deadline);

    // Pools the connection when keep_alive allows it, closes it otherwise
    void Release(std::unique_ptr<HttpConnection> conn, bool keep_alive);

    ConnectionPool* pool() { return pool_.get(); }

    template<typename Body>
    static http::request<Body> CreateRequest(http::verb method,
                                             const Url& url,
                                             const TransferOptions& options);

private:
    ssl::context ssl_ctx_;
    std::unique_ptr<ConnectionPool> pool_;
};

template<typename Body>
http::request<Body> HttpClient::CreateRequest(http::verb method,
                                              const Url& url,
                                              const TransferOptions& options) {
    http::request<Body> req{method, url.target, 11};

    req.set(http::field::host, url.host_header());
    if (!options.user_agent.empty()) {
        req.set(http::field::user_agent, options.user_agent);
    }
    for (const auto& [name, value] : options.headers) {
        req.set(name, value);
    }

    req.keep_alive(true);

    return req;
}

} // namespace streamfetch::core
