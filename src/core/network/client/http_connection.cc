#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/ssl.hpp>
#include <core/network/client/http_connection.h>
#include <core/security/open_ssl_provider.h>
#include <spdlog/spdlog.h>

namespace streamfetch::core {

using tcp = net::ip::tcp;

HttpConnection::HttpConnection(const Url& url, const net::any_io_executor& executor)
    : origin_(url.origin())
    , host_(url.host)
    , stream_(std::in_place_type<PlainStream>, executor) {}

HttpConnection::HttpConnection(const Url& url,
                               const net::any_io_executor& executor,
                               ssl::context& ssl_ctx)
    : origin_(url.origin())
    , host_(url.host)
    , stream_(std::in_place_type<TlsStream>, executor, ssl_ctx) {}

HttpConnection::~HttpConnection() = default;

net::awaitable<std::unique_ptr<HttpConnection>> HttpConnection::Connect(
    const Url& url, ssl::context& ssl_ctx, Clock::time_point deadline) {
    auto executor = co_await net::this_coro::executor;

    std::unique_ptr<HttpConnection> conn;
    if (url.is_https()) {
        conn = std::make_unique<HttpConnection>(url, executor, ssl_ctx);
    } else {
        conn = std::make_unique<HttpConnection>(url, executor);
    }

    // The resolver has no deadline of its own, a timer cancels it instead
    struct ResolveState {
        explicit ResolveState(const net::any_io_executor& ex)
            : resolver(ex)
            , timer(ex) {}
        tcp::resolver resolver;
        net::steady_timer timer;
        bool timed_out = false;
    };
    auto state = std::make_shared<ResolveState>(executor);
    state->timer.expires_at(deadline);
    state->timer.async_wait([state](const boost::system::error_code& ec) {
        if (!ec) {
            state->timed_out = true;
            state->resolver.cancel();
        }
    });

    boost::system::error_code ec;
    auto results = co_await state->resolver.async_resolve(url.host,
                                                          std::to_string(url.port),
                                                          net::redirect_error(net::use_awaitable,
                                                                              ec));
    state->timer.cancel();
    if (state->timed_out) {
        throw boost::system::system_error(beast::error::timeout);
    }
    if (ec) {
        throw boost::system::system_error(ec);
    }

    conn->ExpiresAt(deadline);
    co_await conn->lowestLayer().async_connect(results, net::use_awaitable);

    if (auto* tls = std::get_if<TlsStream>(&conn->stream_)) {
        if (!OpenSSLProvider::SetHostname(tls->native_handle(), url.host)) {
            boost::system::error_code ssl_ec{static_cast<int>(::ERR_get_error()),
                                             net::error::get_ssl_category()};
            throw boost::system::system_error(ssl_ec, "Failed to set SNI Hostname");
        }
        co_await tls->async_handshake(ssl::stream_base::client, net::use_awaitable);
    }

    spdlog::debug("Connected to {}", conn->origin());
    co_return conn;
}

void HttpConnection::ExpiresAt(Clock::time_point deadline) {
    lowestLayer().expires_at(deadline);
}

void HttpConnection::ExpiresNever() {
    lowestLayer().expires_never();
}

net::awaitable<void> HttpConnection::WriteRequest(http::request<http::empty_body>& req) {
    co_await visit([&](auto& stream) { return http::async_write(stream, req, net::use_awaitable); });
}

net::awaitable<void> HttpConnection::WriteRequestHeader(
    http::request_serializer<http::empty_body>& sr) {
    co_await visit(
        [&](auto& stream) { return http::async_write_header(stream, sr, net::use_awaitable); });
}

net::awaitable<void> HttpConnection::WriteBody(net::const_buffer data) {
    co_await visit([&](auto& stream) { return net::async_write(stream, data, net::use_awaitable); });
}

net::awaitable<void> HttpConnection::ReadHeader(http::response_parser<http::buffer_body>& parser) {
    co_await visit([&](auto& stream) {
        return http::async_read_header(stream, buffer_, parser, net::use_awaitable);
    });
}

net::awaitable<std::size_t> HttpConnection::ReadSome(
    http::response_parser<http::buffer_body>& parser, char* data, std::size_t size) {
    auto& body = parser.get().body();
    body.data = data;
    body.size = size;

    boost::system::error_code ec;
    co_await visit([&](auto& stream) {
        return http::async_read_some(stream,
                                     buffer_,
                                     parser,
                                     net::redirect_error(net::use_awaitable, ec));
    });
    // need_buffer only means our chunk is full
    if (ec == http::error::need_buffer) {
        ec = {};
    }
    if (ec) {
        throw boost::system::system_error(ec);
    }
    co_return size - parser.get().body().size;
}

net::awaitable<void> HttpConnection::ReadResponse(
    http::response_parser<http::string_body>& parser) {
    co_await visit(
        [&](auto& stream) { return http::async_read(stream, buffer_, parser, net::use_awaitable); });
}

void HttpConnection::Close() {
    auto& stream = lowestLayer();
    if (!stream.socket().is_open()) {
        return;
    }
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
        spdlog::debug("Socket shutdown notice: {}", ec.message());
    }
    stream.close();
    spdlog::debug("Disconnected from {}", origin_);
}

bool HttpConnection::IsOpen() {
    return lowestLayer().socket().is_open();
}

bool IsStaleConnectionError(const boost::system::error_code& ec) {
    return ec == net::error::eof || ec == net::error::connection_reset
           || ec == net::error::broken_pipe || ec == http::error::end_of_stream;
}

HttpConnection::PlainStream& HttpConnection::lowestLayer() {
    return std::visit([](auto& stream) -> PlainStream& { return beast::get_lowest_layer(stream); },
                      stream_);
}

} // namespace streamfetch::core
