#pragma once

#include <toolmux/mcp/mcp_types.hpp>

#include <cstddef>
#include <deque>
#include <iterator>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolmux {

struct QueuedNotification {
    std::string endpoint;
    Notification notification;
};

// ---------------------------------------------------------------------------
// NotificationQueue — bounded hand-off from transport threads to the caller.
//
// TryPush never blocks: when the queue is full or closed the item is
// dropped and counted. Consumers drain on their own thread.
// ---------------------------------------------------------------------------
class NotificationQueue {
public:
    explicit NotificationQueue(size_t capacity);

    NotificationQueue(const NotificationQueue&) = delete;
    NotificationQueue& operator=(const NotificationQueue&) = delete;

    bool TryPush(QueuedNotification item);
    std::optional<QueuedNotification> TryPop();
    std::vector<QueuedNotification> Drain();

    /// Later pushes are rejected; queued items can still be drained.
    void Close();

    [[nodiscard]] size_t Size() const;
    [[nodiscard]] size_t Capacity() const noexcept { return capacity_; }
    [[nodiscard]] size_t Dropped() const;

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<QueuedNotification> items_;
    size_t dropped_ = 0;
    bool closed_ = false;
};

} // namespace toolmux
