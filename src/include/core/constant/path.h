#pragma once

#include <cstdlib>
#include <filesystem>

namespace streamfetch::core {
namespace path {

inline const std::filesystem::path kLogDir = std::filesystem::temp_directory_path() / "StreamFetch"
                                             / "logs";

inline const std::filesystem::path kConfigDir =
#if defined(_WIN32) || defined(_WIN64)
    std::filesystem::path(std::getenv("APPDATA")) / "StreamFetch";
#else
    std::filesystem::path(std::getenv("HOME") ? std::getenv("HOME") : ".") / ".config"
    / "StreamFetch";
#endif

} // namespace path
} // namespace streamfetch::core
