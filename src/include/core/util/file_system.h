#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

namespace streamfetch::core {

// Failures below throw TransferError with TransferErrc::kIo.

// Size of path, std::nullopt when nothing exists there; a directory or other non-regular file
// is an error
std::optional<std::uint64_t> RegularFileSize(const std::filesystem::path& path);

void RemoveFile(const std::filesystem::path& path);

void EnsureParentDirectory(const std::filesystem::path& path);

} // namespace streamfetch::core
