#pragma once

#include <chrono>
#include <cstddef>

namespace streamfetch::core {

namespace transfer {

constexpr size_t kDefaultBufferSize = 64 * 1024;     // 64 KB
constexpr size_t kMaxBufferSize = 32 * 1024 * 1024; // 32 MB

constexpr std::chrono::minutes kDefaultTimeout{30};
constexpr int kDefaultMaxRedirects = 10;
constexpr const char* kDefaultUserAgent = "StreamFetch/1.0";

// Rate estimation
constexpr size_t kRateWindowCapacity = 20;
constexpr double kRateEpsilon = 1e-6;

// Keep-alive connections idle for longer than this are not reused
constexpr std::chrono::seconds kPooledConnectionMaxIdle{30};

} // namespace transfer

} // namespace streamfetch::core
