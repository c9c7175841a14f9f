#include <algorithm>
#include <core/model/transfer_error.h>
#include <core/transfer/progress_reporter.h>
#include <core/transfer/uploader.h>
#include <fmt/format.h>
#include <fstream>
#include <limits>
#include <spdlog/spdlog.h>
#include <vector>

namespace fs = std::filesystem;

namespace streamfetch::core {

Uploader::Uploader(HttpClient& client)
    : client_(client) {}

net::awaitable<std::unique_ptr<HttpConnection>> Uploader::sendHead(
    const Url& url,
    http::request<http::empty_body>& req,
    const std::string& preamble,
    HttpConnection::Clock::time_point deadline) {
    auto conn = co_await client_.Open(url, deadline);

    for (int attempt = 0;; ++attempt) {
        boost::system::error_code ec;
        try {
            http::request_serializer<http::empty_body> sr{req};
            co_await conn->WriteRequestHeader(sr);
            co_await conn->WriteBody(net::buffer(preamble));
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

net::awaitable<UploadResult> Uploader::Upload(std::string_view url_string,
                                              const fs::path& file_path,
                                              std::string_view field_name,
                                              const FormFields& fields,
                                              const TransferOptions& options,
                                              ProgressSink* sink,
                                              CancellationToken cancel) {
    if (url_string.empty()) {
        throw std::invalid_argument("url must not be empty");
    }
    if (file_path.empty()) {
        throw std::invalid_argument("file path must not be empty");
    }
    if (field_name.empty()) {
        throw std::invalid_argument("field name must not be empty");
    }
    options.Validate();
    Url url = ParseUrl(url_string);

    // Negotiating
    std::error_code fs_ec;
    if (!fs::is_regular_file(file_path, fs_ec)) {
        spdlog::error("Upload source not found: {}", file_path.string());
        throw TransferError(TransferErrc::kNotFound, "File not found: " + file_path.string());
    }
    std::uint64_t file_size = fs::file_size(file_path, fs_ec);
    if (fs_ec) {
        spdlog::error("Failed to stat {}: {}", file_path.string(), fs_ec.message());
        throw TransferError(TransferErrc::kIo,
                            "Failed to stat " + file_path.string() + ": " + fs_ec.message());
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        spdlog::error("Failed to open {} for reading", file_path.string());
        throw TransferError(TransferErrc::kIo, "Failed to open " + file_path.string());
    }

    MultipartFormData form;
    for (const auto& [name, value] : fields) {
        form.AddField(name, value);
    }
    form.SetFile(field_name, file_path.filename().string(), file_size);

    auto req = HttpClient::CreateRequest<http::empty_body>(http::verb::post, url, options);
    req.set(http::field::content_type, form.content_type());
    req.content_length(form.content_length());

    spdlog::info("Uploading {} ({} bytes) to {}", file_path.string(), file_size, url.ToString());

    auto deadline = HttpConnection::Clock::now() + options.timeout;
    std::unique_ptr<HttpConnection> conn;
    try {
        conn = co_await sendHead(url, req, form.Preamble(), deadline);
    } catch (const TransferError& e) {
        spdlog::error("Upload of {} failed: {}", file_path.string(), e.what());
        throw;
    }

    ProgressReporter reporter(sink);
    std::uint64_t sent = 0;
    UploadResult result;
    bool keep_alive = false;

    try {
        // Transferring
        reporter.Begin(0, file_size);

        std::vector<char> buffer(options.buffer_size);
        while (sent < file_size) {
            if (cancel.IsCancelled()) {
                conn->Close();
                reporter.Finish(TransferState::kCancelled);
                spdlog::warn("Upload of {} cancelled after {} bytes", file_path.string(), sent);
                throw TransferError(TransferErrc::kCancelled, "Upload cancelled");
            }

            auto want = static_cast<std::size_t>(
                std::min<std::uint64_t>(buffer.size(), file_size - sent));
            file.read(buffer.data(), static_cast<std::streamsize>(want));
            auto got = static_cast<std::size_t>(file.gcount());
            if (got < want) {
                throw TransferError(TransferErrc::kIo,
                                    fmt::format("{} shrank while uploading ({} of {} bytes read)",
                                                file_path.string(),
                                                sent + got,
                                                file_size));
            }

            try {
                co_await conn->WriteBody(net::buffer(buffer.data(), got));
            } catch (const boost::system::system_error& e) {
                throw TransferError::FromNetwork(e.code(), "Failed to send file content");
            }
            sent += got;
            reporter.Update(sent);
        }

        http::response_parser<http::string_body> parser;
        parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
        try {
            auto epilogue = form.Epilogue();
            co_await conn->WriteBody(net::buffer(epilogue));
            co_await conn->ReadResponse(parser);
        } catch (const boost::system::system_error& e) {
            throw TransferError::FromNetwork(e.code(), "Failed to read upload response");
        }

        auto response = parser.release();
        result.status_code = response.result_int();
        result.body = std::move(response.body());
        keep_alive = response.keep_alive();

        if (result.status_code < 200 || result.status_code >= 300) {
            throw TransferError(result.status_code,
                                result.body,
                                fmt::format("HTTP {} {} for {}",
                                            result.status_code,
                                            std::string_view(response.reason().data(),
                                                             response.reason().size()),
                                            url.ToString()));
        }
    } catch (const TransferError& e) {
        if (e.code() != TransferErrc::kCancelled) {
            reporter.Finish(TransferState::kFailed);
            spdlog::error("Upload of {} failed after {} bytes: {}",
                          file_path.string(),
                          sent,
                          e.what());
        }
        conn->Close();
        throw;
    }

    client_.Release(std::move(conn), keep_alive);

    reporter.Finish(TransferState::kCompleted);
    spdlog::info("Uploaded {} ({} bytes), server answered {}",
                 file_path.string(),
                 sent,
                 result.status_code);
    co_return result;
}

} // namespace streamfetch::core
