/*
 * notification.cpp - Transient status messages implementation
 */

#include "notification.hpp"
#include <algorithm>

bool Notification::should_dismiss(time_point now) const {
    if (!auto_dismiss_after) {
        return false;
    }
    return now - created > *auto_dismiss_after;
}

Notification Notification::make(NotificationType type, std::string message, time_point created,
                                std::optional<std::chrono::milliseconds> dismiss_after) {
    Notification n;
    n.type = type;
    n.message = std::move(message);
    n.created = created;
    n.auto_dismiss_after = dismiss_after;
    return n;
}

NotificationQueue::NotificationQueue(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void NotificationQueue::push(Notification notification) {
    entries_.push_back(std::move(notification));
    trim();
}

size_t NotificationQueue::dismiss_expired(Notification::time_point now) {
    size_t before = entries_.size();
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [now](const Notification& n) { return n.should_dismiss(now); }),
                   entries_.end());
    return before - entries_.size();
}

void NotificationQueue::dismiss(size_t index) {
    if (index < entries_.size()) {
        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(index));
    }
}

void NotificationQueue::dismiss_all() {
    entries_.clear();
}

void NotificationQueue::set_capacity(size_t capacity) {
    capacity_ = capacity == 0 ? 1 : capacity;
    trim();
}

void NotificationQueue::trim() {
    while (entries_.size() > capacity_) {
        entries_.pop_front();
    }
}
