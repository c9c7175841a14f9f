#pragma once

#include <chrono>
#include <core/constant/transfer.h>
#include <cstdint>
#include <deque>
#include <optional>

namespace streamfetch::core {

struct RateSample {
    double instantaneous = 0.0; // bytes per second
    double smoothed = 0.0;      // bytes per second
};

/**
 * @brief Throughput estimation over a bounded window of (time, cumulative bytes) samples
 *
 * The instantaneous rate compares a sample against the newest retained one, the smoothed
 * rate is the mean of the per-interval rates of every consecutive pair still in the window.
 */
class RateEstimator {
public:
    explicit RateEstimator(std::size_t capacity = transfer::kRateWindowCapacity);

    /**
     * @brief Record a sample and compute the rates it yields
     *
     * @param seconds Time since the transfer started
     * @param cumulative_bytes Total bytes transferred so far
     */
    RateSample Sample(double seconds, std::uint64_t cumulative_bytes);

    // Absent unless total is known and smoothed_rate exceeds epsilon
    static std::optional<std::chrono::nanoseconds> EstimateEta(std::optional<std::uint64_t> total,
                                                               std::uint64_t transferred,
                                                               double smoothed_rate);

    std::size_t size() const { return window_.size(); }
    std::size_t capacity() const { return capacity_; }

    void Reset() { window_.clear(); }

private:
    struct Entry {
        double seconds;
        std::uint64_t bytes;
    };

    double instantaneousRate(double seconds, std::uint64_t cumulative_bytes) const;
    double smoothedRate(double fallback) const;

    std::size_t capacity_;
    std::deque<Entry> window_;
};

} // namespace streamfetch::core
