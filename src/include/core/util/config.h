/*
    config.h
    Job file and transfer settings for the streamfetch executable, read from TOML.

    Example file:

        [log]
        level = "debug"            # trace, debug, info, warn, error, critical, off
        dir = "/var/log/streamfetch"

        [transfer]
        user-agent = "StreamFetch/1.0"
        buffer-size = 65536
        resume = true
        overwrite = true
        timeout-seconds = 1800
        max-redirects = 10
        headers = { Authorization = "Bearer ..." }

        [progress]
        format = "log"             # or "json"

        [[download]]
        url = "https://example.com/big.iso"
        path = "downloads/big.iso"

        [[upload]]
        url = "https://example.com/upload"
        path = "report.pdf"
        field = "file"
        fields = { kind = "report" }

    Usage:
    - Load a file (an empty path means config.toml in the config directory, created if missing):
        streamfetch::core::InitConfig(path);
    - Read the typed view:
        streamfetch::core::settings.transfer.buffer_size
    - Raw values not covered by Settings:
        streamfetch::core::config["key"].value_or(default_value);
*/

#pragma once

#include <core/model/transfer_options.h>
#include <core/util/logger.h>
#include <filesystem>
#include <string>
#include <toml++/toml.h>
#include <utility>
#include <vector>

namespace streamfetch::core {

inline toml::table config;

enum class ProgressFormat {
    kLog,
    kJson,
};

struct DownloadJob {
    std::string url;
    std::filesystem::path path;
};

struct UploadJob {
    std::string url;
    std::filesystem::path path;
    std::string field = "file";
    std::vector<std::pair<std::string, std::string>> fields;
};

struct Settings {
    Logger::Level log_level = Logger::Level::info;
    std::filesystem::path log_dir; // Empty: path::kLogDir
    ProgressFormat progress_format = ProgressFormat::kLog;
    TransferOptions transfer;
    std::vector<DownloadJob> downloads;
    std::vector<UploadJob> uploads;
};

inline Settings settings;

// Builds Settings from a parsed table. Throws std::invalid_argument for bad values.
Settings LoadSettings(const toml::table& table);

// Parses path into config and settings. Throws std::runtime_error when the file cannot be
// parsed, std::invalid_argument for bad values.
void InitConfig(const std::filesystem::path& path = {});

} // namespace streamfetch::core
