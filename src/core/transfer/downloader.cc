#include <charconv>
#include <core/model/transfer_error.h>
#include <core/transfer/downloader.h>
#include <core/transfer/progress_reporter.h>
#include <core/util/file_system.h>
#include <fmt/format.h>
#include <fstream>
#include <limits>
#include <spdlog/spdlog.h>
#include <vector>

namespace fs = std::filesystem;

namespace streamfetch::core {

namespace {

bool isRedirect(unsigned int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

// First byte position of a "bytes <first>-<last>/<length>" Content-Range value
std::optional<std::uint64_t> contentRangeStart(std::string_view value) {
    constexpr std::string_view prefix = "bytes ";
    if (value.substr(0, prefix.size()) != prefix) {
        return std::nullopt;
    }
    value.remove_prefix(prefix.size());
    std::uint64_t start = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), start);
    if (ec != std::errc{} || ptr == value.data()) {
        return std::nullopt;
    }
    return start;
}

} // namespace

Downloader::Downloader(HttpClient& client)
    : client_(client) {}

std::uint64_t Downloader::prepareDestination(const fs::path& destination,
                                             const TransferOptions& options) {
    std::optional<std::uint64_t> existing = RegularFileSize(destination);
    if (!existing) {
        return 0;
    }

    if (options.resume) {
        spdlog::debug("Found {} bytes at {}, requesting resume", *existing, destination.string());
        return *existing;
    }
    if (options.overwrite) {
        spdlog::info("Overwriting existing file {}", destination.string());
        RemoveFile(destination);
        return 0;
    }
    throw TransferError(TransferErrc::kAlreadyExists,
                        "File exists and overwrite is disabled: " + destination.string());
}

net::awaitable<std::unique_ptr<HttpConnection>> Downloader::sendOnce(
    const Url& url,
    std::uint64_t offset,
    const TransferOptions& options,
    HttpConnection::Clock::time_point deadline,
    std::optional<ResponseParser>& parser) {
    auto req = HttpClient::CreateRequest<http::empty_body>(http::verb::get, url, options);
    if (offset > 0) {
        req.set(http::field::range, "bytes=" + std::to_string(offset) + "-");
    }
    spdlog::debug("GET {}{}", url.ToString(), offset > 0 ? fmt::format(" from byte {}", offset) : "");

    auto conn = co_await client_.Open(url, deadline);

    for (int attempt = 0;; ++attempt) {
        parser.emplace();
        parser->body_limit((std::numeric_limits<std::uint64_t>::max)());

        boost::system::error_code ec;
        try {
            co_await conn->WriteRequest(req);
            co_await conn->ReadHeader(*parser);
            co_return conn;
        } catch (const boost::system::system_error& e) {
            ec = e.code();
        }

        conn->Close();
        if (attempt == 0 && conn->reused() && IsStaleConnectionError(ec)) {
            spdlog::debug("Pooled connection to {} was closed by the server, reconnecting",
                          url.origin());
            conn = co_await client_.OpenFresh(url, deadline);
            continue;
        }
        throw TransferError::FromNetwork(ec, "Request to " + url.ToString() + " failed");
    }
}

net::awaitable<std::unique_ptr<HttpConnection>> Downloader::sendRequest(
    Url& url,
    std::uint64_t offset,
    const TransferOptions& options,
    HttpConnection::Clock::time_point deadline,
    std::optional<ResponseParser>& parser) {
    for (int redirects = 0;; ++redirects) {
        auto conn = co_await sendOnce(url, offset, options, deadline, parser);

        auto& response = parser->get();
        unsigned int status = response.result_int();
        if (!isRedirect(status)) {
            co_return conn;
        }

        // The redirect body is never read, so the connection cannot be reused
        conn->Close();
        auto location = response[http::field::location];
        if (location.empty()) {
            throw TransferError(status,
                                "",
                                fmt::format("HTTP {} without Location from {}",
                                            status,
                                            url.ToString()));
        }
        if (redirects >= options.max_redirects) {
            throw TransferError(TransferErrc::kNetwork,
                                fmt::format("Too many redirects ({}) starting from {}",
                                            options.max_redirects,
                                            url.ToString()));
        }

        Url next;
        try {
            next = ResolveLocation(url, std::string_view(location.data(), location.size()));
        } catch (const std::invalid_argument& e) {
            throw TransferError(TransferErrc::kNetwork,
                                "Invalid redirect from " + url.ToString() + ": " + e.what());
        }
        spdlog::info("Redirected ({}) from {} to {}", status, url.ToString(), next.ToString());
        url = std::move(next);
    }
}

net::awaitable<DownloadResult> Downloader::Download(std::string_view url_string,
                                                    const fs::path& destination,
                                                    const TransferOptions& options,
                                                    ProgressSink* sink,
                                                    CancellationToken cancel) {
    if (url_string.empty()) {
        throw std::invalid_argument("url must not be empty");
    }
    if (destination.empty()) {
        throw std::invalid_argument("destination must not be empty");
    }
    options.Validate();
    Url url = ParseUrl(url_string);

    spdlog::info("Downloading {} to {}", url.ToString(), destination.string());

    // Negotiating
    std::uint64_t existing = 0;
    std::optional<ResponseParser> parser;
    std::unique_ptr<HttpConnection> conn;
    try {
        existing = prepareDestination(destination, options);
        auto deadline = HttpConnection::Clock::now() + options.timeout;
        conn = co_await sendRequest(url, existing, options, deadline, parser);
    } catch (const TransferError& e) {
        spdlog::error("Download of {} failed: {}", url_string, e.what());
        throw;
    }

    auto& response = parser->get();
    unsigned int status = response.result_int();
    bool resumed = false;

    try {
        if (status == 206 && existing > 0) {
            auto content_range = response[http::field::content_range];
            auto start = contentRangeStart(std::string_view(content_range.data(),
                                                            content_range.size()));
            if (!content_range.empty() && start != existing) {
                throw TransferError(TransferErrc::kNetwork,
                                    fmt::format("Server resumed at an unexpected offset: {}",
                                                std::string_view(content_range.data(),
                                                                 content_range.size())));
            }
            resumed = true;
            spdlog::info("Resuming {} from byte {}", destination.string(), existing);
        } else if (status == 200 || status == 206) {
            if (existing > 0) {
                // Old and new bytes must never mix: the partial file goes before anything
                // of the new body is written
                spdlog::warn("Server ignored the range request for {}, discarding {} bytes of {}",
                             url.ToString(),
                             existing,
                             destination.string());
                RemoveFile(destination);
                existing = 0;
            }
        } else {
            throw TransferError(status,
                                "",
                                fmt::format("HTTP {} {} for {}",
                                            status,
                                            std::string_view(response.reason().data(),
                                                             response.reason().size()),
                                            url.ToString()));
        }
    } catch (const TransferError& e) {
        conn->Close();
        spdlog::error("Download of {} failed: {}", url.ToString(), e.what());
        throw;
    }

    std::optional<std::uint64_t> total;
    if (auto length = parser->content_length()) {
        total = existing + *length;
    }

    ProgressReporter reporter(sink);
    std::uint64_t received = existing;

    try {
        EnsureParentDirectory(destination);
        std::ofstream file(destination,
                           std::ios::binary | (resumed ? std::ios::app : std::ios::trunc));
        if (!file) {
            throw TransferError(TransferErrc::kIo,
                                "Failed to open " + destination.string() + " for writing");
        }

        // Transferring
        reporter.Begin(existing, total);

        std::vector<char> buffer(options.buffer_size);
        while (!parser->is_done()) {
            if (cancel.IsCancelled()) {
                conn->Close();
                file.close();
                reporter.Finish(TransferState::kCancelled);
                spdlog::warn("Download of {} cancelled after {} bytes", url.ToString(), received);
                throw TransferError(TransferErrc::kCancelled, "Download cancelled");
            }

            std::size_t read = 0;
            try {
                read = co_await conn->ReadSome(*parser, buffer.data(), buffer.size());
            } catch (const boost::system::system_error& e) {
                throw TransferError::FromNetwork(e.code(), "Failed to read response body");
            }
            if (read == 0) {
                continue;
            }

            file.write(buffer.data(), static_cast<std::streamsize>(read));
            if (!file) {
                throw TransferError(TransferErrc::kIo, "Failed to write " + destination.string());
            }
            received += read;
            reporter.Update(received);
        }

        file.close();
        if (file.fail()) {
            throw TransferError(TransferErrc::kIo, "Failed to close " + destination.string());
        }
    } catch (const TransferError& e) {
        if (e.code() != TransferErrc::kCancelled) {
            reporter.Finish(TransferState::kFailed);
            spdlog::error("Download of {} failed after {} bytes: {}",
                          url.ToString(),
                          received,
                          e.what());
        }
        conn->Close();
        throw;
    }

    bool keep_alive = parser->get().keep_alive();
    client_.Release(std::move(conn), keep_alive);

    reporter.Finish(TransferState::kCompleted);
    spdlog::info("Downloaded {} ({} bytes)", destination.string(), received);

    DownloadResult result;
    result.bytes_written = received;
    result.resumed_from = resumed ? existing : 0;
    result.total_bytes = total;
    result.status_code = status;
    result.final_url = url.ToString();
    co_return result;
}

} // namespace streamfetch::core
