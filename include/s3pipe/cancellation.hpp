#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace s3pipe {

/// Shared stop flag for a running upload. Fatal errors in one worker cancel
/// it; retry waits in the other workers wake up immediately.
class CancellationToken {
public:
    void cancel() {
        {
            std::lock_guard lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    bool cancelled() const {
        std::lock_guard lock(mutex_);
        return cancelled_;
    }

    /// Sleep for up to `duration`. Returns false if cancelled before or during the wait.
    bool wait_for(std::chrono::milliseconds duration) const {
        std::unique_lock lock(mutex_);
        return !cv_.wait_for(lock, duration, [this] { return cancelled_; });
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
};

} // namespace s3pipe
