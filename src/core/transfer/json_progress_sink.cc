#include <core/transfer/json_progress_sink.h>

namespace streamfetch::core {

using std::chrono::duration_cast;
using std::chrono::milliseconds;

void to_json(nlohmann::json& j, const ProgressSnapshot& snapshot) {
    j = nlohmann::json{
        {"state", std::string(TransferStateToString(snapshot.state))},
        {"bytes_transferred", snapshot.bytes_transferred},
        {"total_bytes", nullptr},
        {"instantaneous_rate", snapshot.instantaneous_rate},
        {"smoothed_rate", snapshot.smoothed_rate},
        {"elapsed_ms", duration_cast<milliseconds>(snapshot.elapsed).count()},
        {"eta_ms", nullptr},
        {"percent", nullptr},
    };
    if (snapshot.total_bytes) {
        j["total_bytes"] = *snapshot.total_bytes;
    }
    if (snapshot.eta) {
        j["eta_ms"] = duration_cast<milliseconds>(*snapshot.eta).count();
    }
    if (snapshot.percent) {
        j["percent"] = *snapshot.percent;
    }
}

void JsonProgressSink::Receive(const ProgressSnapshot& snapshot) {
    out_ << nlohmann::json(snapshot).dump() << '\n';
    out_.flush();
}

} // namespace streamfetch::core
