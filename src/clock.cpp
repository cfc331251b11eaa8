/*
 * clock.cpp - Time source implementations
 */

#include "clock.hpp"

Clock::time_point SteadyClock::now() const {
    return std::chrono::steady_clock::now();
}

ManualClock::ManualClock() : now_(std::chrono::steady_clock::now()) {}

Clock::time_point ManualClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

void ManualClock::advance(duration d) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ += d;
}

void ManualClock::set(time_point t) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ = t;
}
