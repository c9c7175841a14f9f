#pragma once

#include <string_view>

namespace streamfetch::core {

enum class TransferState {
    kIdle,         // 未开始
    kNegotiating,  // 探测续传偏移 / 构造请求
    kTransferring, // 传输中
    kCompleted,    // 传输完成
    kCancelled,    // 调用方取消
    kFailed,       // 传输失败
};

constexpr bool IsTerminal(TransferState state) {
    return state == TransferState::kCompleted || state == TransferState::kCancelled
           || state == TransferState::kFailed;
}

constexpr std::string_view TransferStateToString(TransferState state) {
    switch (state) {
    case TransferState::kIdle:
        return "idle";
    case TransferState::kNegotiating:
        return "negotiating";
    case TransferState::kTransferring:
        return "transferring";
    case TransferState::kCompleted:
        return "completed";
    case TransferState::kCancelled:
        return "cancelled";
    case TransferState::kFailed:
        return "failed";
    }
    return "unknown";
}

} // namespace streamfetch::core
