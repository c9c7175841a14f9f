#pragma once

#include <chrono>
#include <core/constant/transfer.h>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace streamfetch::core {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// Shared read-only by every transfer that is started with it.
struct TransferOptions {
    std::string user_agent = transfer::kDefaultUserAgent;
    std::size_t buffer_size = transfer::kDefaultBufferSize;
    bool resume = true;
    bool overwrite = true; // Only consulted when resume is disabled
    std::chrono::milliseconds timeout = transfer::kDefaultTimeout;
    int max_redirects = transfer::kDefaultMaxRedirects;
    HeaderList headers; // Sent verbatim with every request, e.g. opaque credentials

    // Throws std::invalid_argument
    void Validate() const;
};

} // namespace streamfetch::core
