#pragma once

#include <chrono>
#include <core/model/progress_snapshot.h>
#include <functional>
#include <string>

namespace streamfetch::core {

// Invoked on the transfer's own executor; marshaling to a UI thread is the sink's business.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    virtual void Receive(const ProgressSnapshot& snapshot) = 0;
};

using ProgressCallback = std::function<void(const ProgressSnapshot&)>;

class CallbackProgressSink : public ProgressSink {
public:
    explicit CallbackProgressSink(ProgressCallback callback)
        : callback_(std::move(callback)) {}

    void Receive(const ProgressSnapshot& snapshot) override {
        if (callback_) {
            callback_(snapshot);
        }
    }

private:
    ProgressCallback callback_;
};

/**
 * @brief Writes progress to the default spdlog logger
 *
 * Chunk-level snapshots are throttled: a line is logged when progress moved by at least
 * percent_step or interval elapsed since the last line. Initial and terminal snapshots are
 * always logged.
 */
class LoggingProgressSink : public ProgressSink {
public:
    explicit LoggingProgressSink(std::string label,
                                 double percent_step = 0.1,
                                 std::chrono::milliseconds interval = std::chrono::seconds(5));

    void Receive(const ProgressSnapshot& snapshot) override;

private:
    std::string label_;
    double percent_step_;
    std::chrono::nanoseconds interval_;
    double last_percent_ = -1.0;
    std::chrono::nanoseconds last_elapsed_{0};
    bool started_ = false;
};

} // namespace streamfetch::core
