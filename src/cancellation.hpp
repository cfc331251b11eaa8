/*
 * cancellation.hpp - Cooperative cancellation token
 *
 * Background tasks receive a token and poll it between blocking steps.
 * Sleeps go through sleep_for() so a cancel() wakes the task immediately
 * instead of letting it finish a debounce or settle delay.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

class CancellationToken {
public:
    CancellationToken() = default;

    // Non-copyable
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel();
    bool is_cancelled() const { return cancelled_.load(); }

    // Waits for the given duration. Returns false if the token was
    // cancelled before or during the wait.
    bool sleep_for(std::chrono::milliseconds duration);

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;
