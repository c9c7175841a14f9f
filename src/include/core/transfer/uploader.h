#pragma once

#include "cancellation.h"
#include "multipart_form_data.h"
#include "progress_sink.h"
#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <core/model/transfer_options.h>
#include <core/model/transfer_result.h>
#include <core/network/client/http_client.h>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace streamfetch::core {

using FormFields = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Streams one local file as a multipart/form-data POST
 *
 * The file part is read in options.buffer_size chunks and written straight to the socket, so
 * memory use does not depend on the file size.
 */
class Uploader {
public:
    explicit Uploader(HttpClient& client);
    ~Uploader() = default;

    Uploader(const Uploader&) = delete;
    Uploader& operator=(const Uploader&) = delete;

    /**
     * @brief Upload file_path under field_name, preceded by fields as text parts
     *
     * @throws TransferError kNotFound, kNetwork, kTimeout, kHttpStatus (with the response body),
     *         kCancelled, kIo
     * @throws std::invalid_argument for an empty url/path/field name, a malformed url or options
     */
    boost::asio::awaitable<UploadResult> Upload(std::string_view url,
                                                const std::filesystem::path& file_path,
                                                std::string_view field_name,
                                                const FormFields& fields,
                                                const TransferOptions& options,
                                                ProgressSink* sink = nullptr,
                                                CancellationToken cancel = {});

private:
    // Writes the request header and the multipart preamble
    boost::asio::awaitable<std::unique_ptr<HttpConnection>> sendHead(
        const Url& url,
        http::request<http::empty_body>& req,
        const std::string& preamble,
        HttpConnection::Clock::time_point deadline);

    HttpClient& client_;
};

} // namespace streamfetch::core
