#include <algorithm>
#include <core/transfer/rate_estimator.h>

namespace streamfetch::core {

RateEstimator::RateEstimator(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

RateSample RateEstimator::Sample(double seconds, std::uint64_t cumulative_bytes) {
    RateSample sample;
    sample.instantaneous = instantaneousRate(seconds, cumulative_bytes);

    if (window_.size() == capacity_) {
        window_.pop_front();
    }
    window_.push_back(Entry{seconds, cumulative_bytes});

    sample.smoothed = smoothedRate(sample.instantaneous);
    return sample;
}

double RateEstimator::instantaneousRate(double seconds, std::uint64_t cumulative_bytes) const {
    if (window_.empty()) {
        return static_cast<double>(cumulative_bytes) / std::max(seconds, transfer::kRateEpsilon);
    }

    const Entry& last = window_.back();
    double dt = seconds - last.seconds;
    if (dt <= transfer::kRateEpsilon) {
        return 0.0;
    }
    double db = static_cast<double>(cumulative_bytes) - static_cast<double>(last.bytes);
    return db / dt;
}

double RateEstimator::smoothedRate(double fallback) const {
    if (window_.size() < 2) {
        return fallback;
    }

    double sum = 0.0;
    std::size_t count = 0;
    for (std::size_t i = 1; i < window_.size(); ++i) {
        double dt = window_[i].seconds - window_[i - 1].seconds;
        if (dt <= transfer::kRateEpsilon) {
            continue;
        }
        double db = static_cast<double>(window_[i].bytes) - static_cast<double>(window_[i - 1].bytes);
        sum += db / dt;
        ++count;
    }
    return count > 0 ? sum / static_cast<double>(count) : fallback;
}

std::optional<std::chrono::nanoseconds> RateEstimator::EstimateEta(
    std::optional<std::uint64_t> total, std::uint64_t transferred, double smoothed_rate) {
    if (!total || smoothed_rate <= transfer::kRateEpsilon) {
        return std::nullopt;
    }

    std::uint64_t remaining = *total > transferred ? *total - transferred : 0;
    std::chrono::duration<double> seconds(static_cast<double>(remaining) / smoothed_rate);
    return std::chrono::duration_cast<std::chrono::nanoseconds>(seconds);
}

} // namespace streamfetch::core
