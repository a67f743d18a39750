#include <toolmux/core/deadline.hpp>

#include <algorithm>

namespace toolmux {

Deadline::Deadline(Clock::time_point expires_at)
    : expires_at_(expires_at),
      cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

Deadline Deadline::After(std::chrono::milliseconds budget) {
    return Deadline(Clock::now() + budget);
}

bool Deadline::Expired() const {
    return IsCancelled() || Clock::now() >= expires_at_;
}

bool Deadline::IsCancelled() const {
    return cancelled_->load();
}

std::chrono::milliseconds Deadline::Remaining() const {
    if (IsCancelled()) return std::chrono::milliseconds{0};
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        expires_at_ - Clock::now());
    return std::max(left, std::chrono::milliseconds{0});
}

std::chrono::milliseconds Deadline::NextSlice() const {
    return std::min(Remaining(), kPollSlice);
}

void Deadline::Cancel() const {
    cancelled_->store(true);
}

} // namespace toolmux
