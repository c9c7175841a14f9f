#pragma once

#include "progress_sink.h"
#include "rate_estimator.h"
#include <chrono>
#include <core/model/progress_snapshot.h>
#include <cstdint>
#include <optional>

namespace streamfetch::core {

/**
 * @brief Per-transfer bridge between the transfer loop and a ProgressSink
 *
 * Owns the transfer clock and the rate window. Guarantees the sink sees non-decreasing byte
 * counts and nothing after a terminal snapshot.
 */
class ProgressReporter {
public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressReporter(ProgressSink* sink);

    // Starts the clock and delivers the initial snapshot.
    void Begin(std::uint64_t initial_bytes, std::optional<std::uint64_t> total_bytes);

    // Delivers a chunk-level snapshot.
    void Update(std::uint64_t cumulative_bytes);

    // Delivers the terminal snapshot. Ignored when Begin() was never called.
    void Finish(TransferState state);

    bool started() const { return started_; }
    bool finished() const { return finished_; }
    std::uint64_t bytes_transferred() const { return bytes_; }
    const std::optional<std::uint64_t>& total_bytes() const { return total_; }

private:
    ProgressSnapshot makeSnapshot(TransferState state);
    void deliver(const ProgressSnapshot& snapshot);

    ProgressSink* sink_;
    RateEstimator estimator_;
    Clock::time_point start_;
    std::uint64_t bytes_ = 0;
    std::optional<std::uint64_t> total_;
    bool started_ = false;
    bool finished_ = false;
};

} // namespace streamfetch::core
