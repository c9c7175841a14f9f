#pragma once

#include <atomic>
#include <memory>

namespace streamfetch::core {

// Polled by transfers between chunks, never preemptive.
class CancellationToken {
public:
    CancellationToken() = default;

    bool IsCancelled() const { return flag_ && flag_->load(std::memory_order_acquire); }

    bool CanBeCancelled() const { return flag_ != nullptr; }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag)
        : flag_(std::move(flag)) {}

    std::shared_ptr<std::atomic<bool>> flag_;
};

class CancellationSource {
public:
    CancellationSource()
        : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void Cancel() { flag_->store(true, std::memory_order_release); }

    bool IsCancelled() const { return flag_->load(std::memory_order_acquire); }

    CancellationToken token() const { return CancellationToken(flag_); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace streamfetch::core
