/*
 * clock.hpp - Time source abstraction
 *
 * Everything that measures elapsed time (notification expiry, cache TTL,
 * input spacing, auto-refresh) reads it through a Clock so tests can drive
 * time by hand with ManualClock instead of sleeping.
 */

#pragma once

#include <chrono>
#include <mutex>

class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;
    virtual time_point now() const = 0;
};

class SteadyClock : public Clock {
public:
    time_point now() const override;
};

// Clock that only moves when told to
class ManualClock : public Clock {
public:
    ManualClock();

    time_point now() const override;
    void advance(duration d);
    void set(time_point t);

private:
    mutable std::mutex mutex_;
    time_point now_;
};
