#include <algorithm>
#include <core/transfer/progress_reporter.h>

namespace streamfetch::core {

ProgressReporter::ProgressReporter(ProgressSink* sink)
    : sink_(sink) {}

void ProgressReporter::Begin(std::uint64_t initial_bytes,
                             std::optional<std::uint64_t> total_bytes) {
    if (started_) {
        return;
    }
    started_ = true;
    start_ = Clock::now();
    bytes_ = initial_bytes;
    total_ = total_bytes;
    deliver(makeSnapshot(TransferState::kTransferring));
}

void ProgressReporter::Update(std::uint64_t cumulative_bytes) {
    if (!started_ || finished_) {
        return;
    }
    bytes_ = std::max(bytes_, cumulative_bytes);
    deliver(makeSnapshot(TransferState::kTransferring));
}

void ProgressReporter::Finish(TransferState state) {
    if (!started_ || finished_) {
        return;
    }
    finished_ = true;
    deliver(makeSnapshot(state));
}

ProgressSnapshot ProgressReporter::makeSnapshot(TransferState state) {
    auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start_);
    double seconds = std::chrono::duration<double>(elapsed).count();
    RateSample rates = estimator_.Sample(seconds, bytes_);

    ProgressSnapshot snapshot;
    snapshot.state = state;
    snapshot.bytes_transferred = bytes_;
    snapshot.total_bytes = total_;
    snapshot.instantaneous_rate = rates.instantaneous;
    snapshot.smoothed_rate = rates.smoothed;
    snapshot.elapsed = elapsed;
    snapshot.eta = RateEstimator::EstimateEta(total_, bytes_, rates.smoothed);
    if (total_ && *total_ > 0) {
        snapshot.percent = std::min(1.0,
                                    static_cast<double>(bytes_) / static_cast<double>(*total_));
    }
    return snapshot;
}

void ProgressReporter::deliver(const ProgressSnapshot& snapshot) {
    if (sink_) {
        sink_->Receive(snapshot);
    }
}

} // namespace streamfetch::core
