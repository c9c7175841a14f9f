#pragma once

#include "transfer_state.h"
#include <chrono>
#include <cstdint>
#include <optional>

namespace streamfetch::core {

struct ProgressSnapshot {
    TransferState state = TransferState::kIdle;
    std::uint64_t bytes_transferred = 0;
    std::optional<std::uint64_t> total_bytes;
    double instantaneous_rate = 0.0; // bytes per second
    double smoothed_rate = 0.0;      // bytes per second, moving average
    std::chrono::nanoseconds elapsed{0};
    std::optional<std::chrono::nanoseconds> eta;
    std::optional<double> percent; // [0, 1]
};

} // namespace streamfetch::core
