#include <core/transfer/progress_sink.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace streamfetch::core {

namespace {

std::string formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.2f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.2f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.2f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

std::string formatDuration(std::chrono::nanoseconds duration) {
    auto total = std::chrono::duration_cast<std::chrono::seconds>(duration).count();
    return fmt::format("{:02}:{:02}:{:02}", total / 3600, (total / 60) % 60, total % 60);
}

} // namespace

LoggingProgressSink::LoggingProgressSink(std::string label,
                                         double percent_step,
                                         std::chrono::milliseconds interval)
    : label_(std::move(label))
    , percent_step_(percent_step)
    , interval_(interval) {}

void LoggingProgressSink::Receive(const ProgressSnapshot& snapshot) {
    bool first = !started_;
    bool terminal = IsTerminal(snapshot.state);
    started_ = true;

    if (!first && !terminal) {
        bool percent_moved = snapshot.percent
                             && *snapshot.percent - last_percent_ >= percent_step_;
        bool interval_passed = snapshot.elapsed - last_elapsed_ >= interval_;
        if (!percent_moved && !interval_passed) {
            return;
        }
    }
    last_percent_ = snapshot.percent.value_or(last_percent_);
    last_elapsed_ = snapshot.elapsed;

    std::string total = snapshot.total_bytes ? formatSize(*snapshot.total_bytes) : "?";
    std::string percent = snapshot.percent ? fmt::format("{:.1f}%", *snapshot.percent * 100.0)
                                           : "--";
    std::string eta = snapshot.eta ? " ETA " + formatDuration(*snapshot.eta) : "";

    auto level = snapshot.state == TransferState::kFailed ? spdlog::level::warn
                                                          : spdlog::level::info;
    spdlog::log(level,
                "{} [{}] {} {}/{} {}/s elapsed {}{}",
                label_,
                TransferStateToString(snapshot.state),
                percent,
                formatSize(snapshot.bytes_transferred),
                total,
                formatSize(static_cast<std::uint64_t>(snapshot.smoothed_rate)),
                formatDuration(snapshot.elapsed),
                eta);
}

} // namespace streamfetch::core
