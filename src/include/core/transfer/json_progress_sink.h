#pragma once

#include "progress_sink.h"
#include <core/model/progress_snapshot.h>
#include <nlohmann/json.hpp>
#include <ostream>

namespace streamfetch::core {

// {state, bytes_transferred, total_bytes, instantaneous_rate, smoothed_rate, elapsed_ms,
//  eta_ms, percent}, unknown values are null
void to_json(nlohmann::json& j, const ProgressSnapshot& snapshot);

// Writes every snapshot as one JSON object per line
class JsonProgressSink : public ProgressSink {
public:
    explicit JsonProgressSink(std::ostream& out)
        : out_(out) {}

    void Receive(const ProgressSnapshot& snapshot) override;

private:
    std::ostream& out_;
};

} // namespace streamfetch::core
