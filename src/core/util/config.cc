#include <core/constant/path.h>
#include <core/util/config.h>
#include <fstream>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace streamfetch::core {

static TransferOptions LoadTransferOptions(const toml::table* transfer) {
    TransferOptions options;
    if (transfer == nullptr) {
        return options;
    }
    const auto& table = *transfer;

    options.user_agent = table["user-agent"].value_or(options.user_agent);
    if (auto buffer_size = table["buffer-size"].value<std::int64_t>()) {
        options.buffer_size = *buffer_size > 0 ? static_cast<std::size_t>(*buffer_size) : 0;
    }
    options.resume = table["resume"].value_or(options.resume);
    options.overwrite = table["overwrite"].value_or(options.overwrite);
    if (auto seconds = table["timeout-seconds"].value<double>()) {
        options.timeout = std::chrono::milliseconds(static_cast<std::int64_t>(*seconds * 1000));
    }
    if (auto redirects = table["max-redirects"].value<std::int64_t>()) {
        options.max_redirects = static_cast<int>(*redirects);
    }
    if (const auto* headers = table["headers"].as_table()) {
        for (const auto& [name, value] : *headers) {
            auto text = value.value<std::string>();
            if (!text) {
                throw std::invalid_argument("transfer.headers." + std::string(name.str())
                                            + " must be a string");
            }
            options.headers.emplace_back(std::string(name.str()), *text);
        }
    }

    options.Validate();
    return options;
}

static std::string RequireString(const toml::table& table,
                                 std::string_view key,
                                 std::string_view section) {
    auto value = table[key].value<std::string>();
    if (!value || value->empty()) {
        throw std::invalid_argument("[[" + std::string(section) + "]] requires a string \""
                                    + std::string(key) + "\"");
    }
    return *value;
}

Settings LoadSettings(const toml::table& table) {
    Settings result;

    if (const auto* log = table["log"].as_table()) {
        if (auto level = (*log)["level"].value<std::string>()) {
            result.log_level = Logger::ParseLevel(*level);
        }
        result.log_dir = (*log)["dir"].value_or(std::string());
    }

    if (const auto* progress = table["progress"].as_table()) {
        std::string format = (*progress)["format"].value_or(std::string("log"));
        if (format == "log") {
            result.progress_format = ProgressFormat::kLog;
        } else if (format == "json") {
            result.progress_format = ProgressFormat::kJson;
        } else {
            throw std::invalid_argument("progress.format must be \"log\" or \"json\", got \""
                                        + format + "\"");
        }
    }

    result.transfer = LoadTransferOptions(table["transfer"].as_table());

    if (const auto* downloads = table["download"].as_array()) {
        for (const auto& node : *downloads) {
            const auto* job = node.as_table();
            if (job == nullptr) {
                throw std::invalid_argument("[[download]] entries must be tables");
            }
            result.downloads.push_back(DownloadJob{
                RequireString(*job, "url", "download"),
                RequireString(*job, "path", "download"),
            });
        }
    }

    if (const auto* uploads = table["upload"].as_array()) {
        for (const auto& node : *uploads) {
            const auto* job = node.as_table();
            if (job == nullptr) {
                throw std::invalid_argument("[[upload]] entries must be tables");
            }
            UploadJob upload;
            upload.url = RequireString(*job, "url", "upload");
            upload.path = RequireString(*job, "path", "upload");
            upload.field = (*job)["field"].value_or(upload.field);
            if (const auto* fields = (*job)["fields"].as_table()) {
                for (const auto& [name, value] : *fields) {
                    upload.fields.emplace_back(std::string(name.str()),
                                               value.value_or(std::string()));
                }
            }
            result.uploads.push_back(std::move(upload));
        }
    }

    return result;
}

void InitConfig(const std::filesystem::path& path) {
    auto file = path;
    if (file.empty()) {
        if (!std::filesystem::exists(path::kConfigDir)) {
            spdlog::info("Config directory does not exist, creating...");
            std::filesystem::create_directories(path::kConfigDir);
        }
        file = path::kConfigDir / "config.toml";
        if (!std::filesystem::exists(file)) {
            std::ofstream ofs(file);
            spdlog::info("Config file does not exist, creating...");
        }
    }

    try {
        config = toml::parse_file(file.string());
    } catch (const toml::parse_error& err) {
        spdlog::error("\"{}\" could not be parsed: {} (line {}, column {})",
                      file.string(),
                      err.description(),
                      err.source().begin.line,
                      err.source().begin.column);
        throw std::runtime_error("Failed to parse " + file.string());
    }

    try {
        settings = LoadSettings(config);
    } catch (const std::invalid_argument& err) {
        spdlog::error("Invalid configuration in \"{}\": {}", file.string(), err.what());
        throw;
    }
    spdlog::debug("Loaded {} download(s) and {} upload(s) from {}",
                  settings.downloads.size(),
                  settings.uploads.size(),
                  file.string());
}

} // namespace streamfetch::core
