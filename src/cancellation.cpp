/*
 * cancellation.cpp - Cooperative cancellation token implementation
 */

#include "cancellation.hpp"

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true);
    }
    cv_.notify_all();
}

bool CancellationToken::sleep_for(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (duration.count() > 0) {
        cv_.wait_for(lock, duration, [this]() { return cancelled_.load(); });
    }
    return !cancelled_.load();
}
