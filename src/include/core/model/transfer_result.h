#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace streamfetch::core {

struct DownloadResult {
    std::uint64_t bytes_written = 0; // Final size of the destination file
    std::uint64_t resumed_from = 0;  // Offset the server honored, 0 for a fresh transfer
    std::optional<std::uint64_t> total_bytes;
    unsigned int status_code = 0;
    std::string final_url;
};

struct UploadResult {
    unsigned int status_code = 0;
    std::string body;
};

} // namespace streamfetch::core
