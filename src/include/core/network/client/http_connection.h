#pragma once

#include "url.h"
#include <boost/asio/any_io_executor.hpp>
#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <variant>

namespace streamfetch::core {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;

/**
 * @brief One HTTP/1.1 connection over plain TCP or TLS
 *
 * All awaitable operations throw boost::system::system_error, the transfer layer maps them to
 * TransferError. The deadline set through ExpiresAt() bounds every operation on the connection.
 */
class HttpConnection {
public:
    using Clock = std::chrono::steady_clock;
    using PlainStream = beast::tcp_stream;
    using TlsStream = beast::ssl_stream<beast::tcp_stream>;

    HttpConnection(const Url& url, const net::any_io_executor& executor);
    HttpConnection(const Url& url, const net::any_io_executor& executor, ssl::context& ssl_ctx);
    ~HttpConnection();

    HttpConnection(const HttpConnection&) = delete;
    HttpConnection& operator=(const HttpConnection&) = delete;

    // Resolve, connect and handshake (https), all before deadline
    static net::awaitable<std::unique_ptr<HttpConnection>> Connect(const Url& url,
                                                                   ssl::context& ssl_ctx,
                                                                   Clock::time_point deadline);

    void ExpiresAt(Clock::time_point deadline);

    void ExpiresNever();

    net::awaitable<void> WriteRequest(http::request<http::empty_body>& req);

    net::awaitable<void> WriteRequestHeader(http::request_serializer<http::empty_body>& sr);

    net::awaitable<void> WriteBody(net::const_buffer data);

    net::awaitable<void> ReadHeader(http::response_parser<http::buffer_body>& parser);

    // Reads whatever body bytes are available into [data, data + size), returns how many were
    // placed there (possibly 0)
    net::awaitable<std::size_t> ReadSome(http::response_parser<http::buffer_body>& parser,
                                         char* data,
                                         std::size_t size);

    net::awaitable<void> ReadResponse(http::response_parser<http::string_body>& parser);

    void Close();

    bool IsOpen();

    const std::string& origin() const { return origin_; }

    // True when the connection came out of a ConnectionPool
    bool reused() const { return reused_; }
    void set_reused(bool reused) { reused_ = reused; }

    Clock::time_point idle_since() const { return idle_since_; }
    void set_idle_since(Clock::time_point time) { idle_since_ = time; }

private:
    PlainStream& lowestLayer();

    template<typename Operation>
    auto visit(Operation&& operation) {
        return std::visit(std::forward<Operation>(operation), stream_);
    }

    std::string origin_;
    std::string host_;
    std::variant<PlainStream, TlsStream> stream_;
    beast::flat_buffer buffer_; // Kept across responses, may hold bytes of the next one
    bool reused_ = false;
    Clock::time_point idle_since_{};
};

// How a keep-alive connection the server already closed fails on first use
bool IsStaleConnectionError(const boost::system::error_code& ec);

} // namespace streamfetch::core
