#pragma once

#include "http_connection.h"
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace streamfetch::core {

/*
  Idle keep-alive connections, keyed by origin (scheme://host:port).
  Purely for connection reuse: a connection is owned exclusively by one transfer between
  Acquire() and Release(). Connections must all belong to the same io_context.
*/
class ConnectionPool {
public:
    explicit ConnectionPool(std::size_t max_idle_per_origin = 4);
    ~ConnectionPool() = default;

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // nullptr when no usable idle connection exists for origin
    std::unique_ptr<HttpConnection> Acquire(const std::string& origin);

    void Release(std::unique_ptr<HttpConnection> conn);

    std::size_t idle_count() const;

    void Clear();

private:
    static bool isUsable(HttpConnection& conn, HttpConnection::Clock::time_point now);

    std::size_t max_idle_per_origin_;
    std::unordered_map<std::string, std::vector<std::unique_ptr<HttpConnection>>> idle_;
    mutable std::mutex mutex_;
};

} // namespace streamfetch::core
