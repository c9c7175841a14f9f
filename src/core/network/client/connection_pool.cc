#include <core/constant/transfer.h>
#include <core/network/client/connection_pool.h>
#include <spdlog/spdlog.h>

namespace streamfetch::core {

ConnectionPool::ConnectionPool(std::size_t max_idle_per_origin)
    : max_idle_per_origin_(max_idle_per_origin) {}

bool ConnectionPool::isUsable(HttpConnection& conn, HttpConnection::Clock::time_point now) {
    return conn.IsOpen() && now - conn.idle_since() <= transfer::kPooledConnectionMaxIdle;
}

std::unique_ptr<HttpConnection> ConnectionPool::Acquire(const std::string& origin) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = idle_.find(origin);
    if (it == idle_.end()) {
        return nullptr;
    }

    auto now = HttpConnection::Clock::now();
    auto& connections = it->second;
    // Newest first, stale ones are dropped on the way
    while (!connections.empty()) {
        std::unique_ptr<HttpConnection> conn = std::move(connections.back());
        connections.pop_back();
        if (isUsable(*conn, now)) {
            conn->set_reused(true);
            spdlog::debug("Reusing pooled connection to {}", origin);
            return conn;
        }
        conn->Close();
    }
    idle_.erase(it);
    return nullptr;
}

void ConnectionPool::Release(std::unique_ptr<HttpConnection> conn) {
    if (!conn) {
        return;
    }
    if (!conn->IsOpen()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& connections = idle_[conn->origin()];
    if (connections.size() >= max_idle_per_origin_) {
        conn->Close();
        return;
    }
    conn->set_idle_since(HttpConnection::Clock::now());
    connections.push_back(std::move(conn));
}

std::size_t ConnectionPool::idle_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& [_, connections] : idle_) {
        count += connections.size();
    }
    return count;
}

void ConnectionPool::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [_, connections] : idle_) {
        for (auto& conn : connections) {
            conn->Close();
        }
    }
    idle_.clear();
}

} // namespace streamfetch::core
