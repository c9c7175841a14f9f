#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/constant/path.h>
#include <core/model/transfer_error.h>
#include <core/network/client/http_client.h>
#include <core/security/open_ssl_provider.h>
#include <core/transfer/downloader.h>
#include <core/transfer/json_progress_sink.h>
#include <core/transfer/uploader.h>
#include <core/util/config.h>
#include <core/util/logger.h>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>

using namespace streamfetch;
using namespace streamfetch::core;
namespace net = boost::asio;

namespace {

std::unique_ptr<ProgressSink> makeSink(const std::string& label) {
    if (settings.progress_format == ProgressFormat::kJson) {
        return std::make_unique<JsonProgressSink>(std::cout);
    }
    return std::make_unique<LoggingProgressSink>(label);
}

// Runs every job in file order, returns the number of failed jobs
net::awaitable<int> runJobs(HttpClient& client, CancellationToken cancel) {
    Downloader downloader(client);
    Uploader uploader(client);
    int failed = 0;

    for (const auto& job : settings.downloads) {
        if (cancel.IsCancelled()) {
            ++failed;
            continue;
        }
        auto sink = makeSink(job.path.filename().string());
        try {
            auto result = co_await downloader.Download(job.url,
                                                       job.path,
                                                       settings.transfer,
                                                       sink.get(),
                                                       cancel);
            spdlog::info("{} -> {}: {} bytes (HTTP {})",
                         result.final_url,
                         job.path.string(),
                         result.bytes_written,
                         result.status_code);
        } catch (const std::exception& e) {
            spdlog::error("Download job {} failed: {}", job.url, e.what());
            ++failed;
        }
    }

    for (const auto& job : settings.uploads) {
        if (cancel.IsCancelled()) {
            ++failed;
            continue;
        }
        auto sink = makeSink(job.path.filename().string());
        try {
            auto result = co_await uploader.Upload(job.url,
                                                   job.path,
                                                   job.field,
                                                   job.fields,
                                                   settings.transfer,
                                                   sink.get(),
                                                   cancel);
            spdlog::info("{} -> {}: HTTP {}", job.path.string(), job.url, result.status_code);
            spdlog::debug("Response body: {}", result.body);
        } catch (const TransferError& e) {
            spdlog::error("Upload job {} failed: {}", job.path.string(), e.what());
            if (e.code() == TransferErrc::kHttpStatus && !e.body().empty()) {
                spdlog::error("Response body: {}", e.body());
            }
            ++failed;
        } catch (const std::exception& e) {
            spdlog::error("Upload job {} failed: {}", job.path.string(), e.what());
            ++failed;
        }
    }

    co_return failed;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc > 2) {
        std::cerr << "usage: " << argv[0] << " [jobs.toml]" << std::endl;
        return 2;
    }

    try {
        InitConfig(argc == 2 ? std::filesystem::path(argv[1]) : std::filesystem::path());
    } catch (const std::exception& e) {
        std::cerr << "Failed to load configuration: " << e.what() << std::endl;
        return 2;
    }

    auto log_dir = settings.log_dir.empty() ? path::kLogDir : settings.log_dir;
#ifdef STREAMFETCH_DEBUG
    Logger logger(Logger::Level::debug, log_dir);
#else
    Logger logger(settings.log_level, log_dir);
#endif

    OpenSSLProvider::InitOpenSSL();

    net::io_context ioc;
    HttpClient client;

    CancellationSource cancel_source;
    net::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&cancel_source](const boost::system::error_code& ec, int signal) {
        if (!ec) {
            spdlog::warn("Received signal {}, cancelling", signal);
            cancel_source.Cancel();
        }
    });

    spdlog::info("streamfetch started with {} download(s) and {} upload(s)",
                 settings.downloads.size(),
                 settings.uploads.size());

    int failed = 0;
    net::co_spawn(ioc,
                  runJobs(client, cancel_source.token()),
                  [&](std::exception_ptr e, int result) {
                      signals.cancel();
                      if (e) {
                          try {
                              std::rethrow_exception(e);
                          } catch (const std::exception& ex) {
                              spdlog::error("Unexpected error: {}", ex.what());
                          }
                          failed = 1;
                          return;
                      }
                      failed = result;
                  });

    ioc.run();
    if (auto* pool = client.pool()) {
        pool->Clear();
    }

    if (failed > 0) {
        spdlog::error("{} job(s) failed", failed);
        return 1;
    }
    spdlog::info("All jobs completed");
    return 0;
}
