#pragma once

#include "cancellation.h"
#include "progress_sink.h"
#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/beast/http.hpp>
#include <core/model/transfer_options.h>
#include <core/model/transfer_result.h>
#include <core/network/client/http_client.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

namespace streamfetch::core {

/**
 * @brief Single-stream HTTP download with byte-range resume
 *
 * An existing destination is resumed from its current length when options.resume is set.
 * A server that answers a range request with the full content causes the partial file to be
 * discarded before any new byte is written. Partial files are kept on failure and on
 * cancellation so a later call can resume them.
 */
class Downloader {
public:
    explicit Downloader(HttpClient& client);
    ~Downloader() = default;

    Downloader(const Downloader&) = delete;
    Downloader& operator=(const Downloader&) = delete;

    /**
     * @brief Download url into destination
     *
     * @throws TransferError kAlreadyExists, kNetwork, kTimeout, kHttpStatus, kCancelled, kIo
     * @throws std::invalid_argument for an empty url/destination, a malformed url or options
     */
    boost::asio::awaitable<DownloadResult> Download(std::string_view url,
                                                    const std::filesystem::path& destination,
                                                    const TransferOptions& options,
                                                    ProgressSink* sink = nullptr,
                                                    CancellationToken cancel = {});

private:
    using ResponseParser = http::response_parser<http::buffer_body>;

    // Resume offset to request, after applying the resume/overwrite policy
    static std::uint64_t prepareDestination(const std::filesystem::path& destination,
                                            const TransferOptions& options);

    // Sends the GET and reads the response header, following redirects
    boost::asio::awaitable<std::unique_ptr<HttpConnection>> sendRequest(
        Url& url,
        std::uint64_t offset,
        const TransferOptions& options,
        HttpConnection::Clock::time_point deadline,
        std::optional<ResponseParser>& parser);

    boost::asio::awaitable<std::unique_ptr<HttpConnection>> sendOnce(
        const Url& url,
        std::uint64_t offset,
        const TransferOptions& options,
        HttpConnection::Clock::time_point deadline,
        std::optional<ResponseParser>& parser);

    HttpClient& client_;
};

} // namespace streamfetch::core
