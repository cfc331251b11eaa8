/*
 * notification.hpp - Transient status messages
 *
 * Notifications are shown in the status area and expire on their own
 * unless created persistent. The queue is bounded: pushing past capacity
 * evicts the oldest entry. The main loop sweeps expired entries every
 * 500ms.
 */

#pragma once

#include <chrono>
#include <deque>
#include <optional>
#include <string>
#include <vector>

enum class NotificationType { SUCCESS, ERROR, WARNING, INFO };

struct Notification {
    using time_point = std::chrono::steady_clock::time_point;

    static constexpr std::chrono::milliseconds DEFAULT_DISMISS{5000};

    std::string message;
    NotificationType type = NotificationType::INFO;
    time_point created;
    // std::nullopt means the notification stays until dismissed
    std::optional<std::chrono::milliseconds> auto_dismiss_after = DEFAULT_DISMISS;

    // True once more than auto_dismiss_after has elapsed since created
    bool should_dismiss(time_point now) const;

    static Notification make(NotificationType type, std::string message, time_point created,
                             std::optional<std::chrono::milliseconds> dismiss_after = DEFAULT_DISMISS);
};

class NotificationQueue {
public:
    static constexpr size_t DEFAULT_CAPACITY = 10;

    explicit NotificationQueue(size_t capacity = DEFAULT_CAPACITY);

    void push(Notification notification);

    // Removes expired entries, returns how many were removed
    size_t dismiss_expired(Notification::time_point now);
    void dismiss(size_t index);
    void dismiss_all();

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    size_t capacity() const { return capacity_; }
    void set_capacity(size_t capacity);

    const std::deque<Notification>& entries() const { return entries_; }

private:
    size_t capacity_;
    std::deque<Notification> entries_;

    void trim();
};
