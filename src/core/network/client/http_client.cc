#include <core/model/transfer_error.h>
#include <core/network/client/http_client.h>
#include <core/security/open_ssl_provider.h>
#include <spdlog/spdlog.h>

namespace streamfetch::core {

HttpClient::HttpClient(bool pooled, bool verify_peer)
    : ssl_ctx_(OpenSSLProvider::BuildClientContext(verify_peer)) {
    if (pooled) {
        pool_ = std::make_unique<ConnectionPool>();
    }
}

net::awaitable<std::unique_ptr<HttpConnection>> HttpClient::Open(const Url& url,
                                                                 Clock::time_point deadline) {
    if (pool_) {
        if (auto conn = pool_->Acquire(url.origin())) {
            conn->ExpiresAt(deadline);
            co_return conn;
        }
    }
    co_return co_await OpenFresh(url, deadline);
}

net::awaitable<std::unique_ptr<HttpConnection>> HttpClient::OpenFresh(const Url& url,
                                                                      Clock::time_point deadline) {
    spdlog::debug("Connecting to {}", url.origin());
    boost::system::error_code ec;
    try {
        co_return co_await HttpConnection::Connect(url, ssl_ctx_, deadline);
    } catch (const boost::system::system_error& e) {
        ec = e.code();
    }
    spdlog::error("Connection error: {}: {}", url.origin(), ec.message());
    throw TransferError::FromNetwork(ec, "Failed to connect to " + url.origin());
}

void HttpClient::Release(std::unique_ptr<HttpConnection> conn, bool keep_alive) {
    if (!conn) {
        return;
    }
    if (pool_ && keep_alive) {
        conn->ExpiresNever();
        pool_->Release(std::move(conn));
        return;
    }
    conn->Close();
}

} // namespace streamfetch::core
