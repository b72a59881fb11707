#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace voicegate {

/**
 * @brief Cooperative cancellation flag shared by a session and its in-flight provider call
 *
 * Cancelling wakes every wait_for() and makes the HTTP transfer abort at its next
 * progress callback.
 */
class CancelToken {
public:
    CancelToken() = default;

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    bool is_cancelled() const {
        return cancelled_.load();
    }

    /**
     * @brief Sleep up to timeout_ms
     * @return true if cancelled before or during the wait
     */
    bool wait_for(int64_t timeout_ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                            [this] { return cancelled_.load(); });
    }

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace voicegate
