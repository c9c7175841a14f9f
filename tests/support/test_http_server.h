#pragma once

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace streamfetch::test {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;

using StringRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

// Builds the whole response
using ResponseHandler = std::function<HttpResponse(const StringRequest&)>;

// Writes its own response straight to the socket (partial bodies, stalls, dropped connections).
// Returns whether the connection should be kept open.
using RawHandler = std::function<net::awaitable<bool>(const StringRequest&, beast::tcp_stream&)>;

// Headers and body of a request the server has seen
struct RecordedRequest {
    http::verb method;
    std::string target;
    std::map<std::string, std::string> headers; // Lowercase names
    std::string body;

    std::string header(const std::string& name) const {
        auto it = headers.find(name);
        return it == headers.end() ? std::string() : it->second;
    }
};

// Plain HTTP/1.1 server on an ephemeral loopback port, run by the test's own io_context
class TestHttpServer {
public:
    explicit TestHttpServer(net::io_context& io_context);
    ~TestHttpServer();

    TestHttpServer(const TestHttpServer&) = delete;
    TestHttpServer& operator=(const TestHttpServer&) = delete;

    void AddRoute(const std::string& path, http::verb method, ResponseHandler handler);
    void AddRawRoute(const std::string& path, http::verb method, RawHandler handler);

    void Start();
    void Stop();

    unsigned short port() const { return port_; }

    // http://127.0.0.1:<port><path>
    std::string Url(const std::string& path) const;

    const std::vector<RecordedRequest>& requests() const { return requests_; }
    std::size_t accepted_connections() const { return accepted_connections_; }

    // Connections are closed after each response instead of kept alive
    void set_close_after_response(bool close) { close_after_response_ = close; }

    static HttpResponse Ok(const StringRequest& req,
                           std::string body,
                           std::string_view content_type = "application/octet-stream");
    static HttpResponse Status(const StringRequest& req,
                               http::status status,
                               std::string body = {});
    static HttpResponse Redirect(const StringRequest& req,
                                 http::status status,
                                 const std::string& location);

private:
    struct Route {
        http::verb method;
        ResponseHandler handler;
        RawHandler raw_handler;
    };

    net::awaitable<void> acceptConnections();

    net::awaitable<void> handleConnection(beast::tcp_stream stream);

    void record(const StringRequest& req);

    net::io_context& io_context_;
    net::ip::tcp::acceptor acceptor_;
    unsigned short port_ = 0;
    bool running_ = false;
    bool close_after_response_ = false;
    std::map<std::string, Route> routes_;
    std::vector<RecordedRequest> requests_;
    std::size_t accepted_connections_ = 0;
};

} // namespace streamfetch::test
