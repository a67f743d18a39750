#include <toolmux/orchestrator/notification_queue.hpp>

namespace toolmux {

NotificationQueue::NotificationQueue(size_t capacity) : capacity_(capacity) {}

bool NotificationQueue::TryPush(QueuedNotification item) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || items_.size() >= capacity_) {
        ++dropped_;
        return false;
    }
    items_.push_back(std::move(item));
    return true;
}

std::optional<QueuedNotification> NotificationQueue::TryPop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.empty()) {
        return std::nullopt;
    }
    auto item = std::move(items_.front());
    items_.pop_front();
    return item;
}

std::vector<QueuedNotification> NotificationQueue::Drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<QueuedNotification> drained(std::make_move_iterator(items_.begin()),
                                            std::make_move_iterator(items_.end()));
    items_.clear();
    return drained;
}

void NotificationQueue::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

size_t NotificationQueue::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

size_t NotificationQueue::Dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

} // namespace toolmux
