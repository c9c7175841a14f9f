#include <core/model/transfer_error.h>
#include <core/util/file_system.h>
#include <spdlog/spdlog.h>
#include <system_error>

namespace fs = std::filesystem;

namespace streamfetch::core {

std::optional<std::uint64_t> RegularFileSize(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            throw TransferError(TransferErrc::kIo,
                                "Failed to stat " + path.string() + ": " + ec.message());
        }
        return std::nullopt;
    }
    if (!fs::is_regular_file(path, ec)) {
        throw TransferError(TransferErrc::kIo, path.string() + " is not a regular file");
    }
    auto size = fs::file_size(path, ec);
    if (ec) {
        throw TransferError(TransferErrc::kIo,
                            "Failed to get size of " + path.string() + ": " + ec.message());
    }
    return size;
}

void RemoveFile(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        spdlog::error("Failed to remove {}: {}", path.string(), ec.message());
        throw TransferError(TransferErrc::kIo,
                            "Failed to remove " + path.string() + ": " + ec.message());
    }
}

void EnsureParentDirectory(const fs::path& path) {
    fs::path parent = fs::absolute(path).parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    if (!fs::exists(parent, ec)) {
        spdlog::debug("Creating directory {}", parent.string());
        fs::create_directories(parent, ec);
        if (ec) {
            throw TransferError(TransferErrc::kIo,
                                "Failed to create directory " + parent.string() + ": "
                                    + ec.message());
        }
    }
}

} // namespace streamfetch::core
