#pragma once

#include <atomic>
#include <chrono>
#include <memory>

namespace toolmux {

// ---------------------------------------------------------------------------
// Deadline — an absolute expiry shared by every operation of one invocation.
//
// Copies share one cancellation flag: cancelling any copy cancels them all.
// Blocking waits poll in slices of at most kPollSlice so a cancel is seen
// promptly even while a transport waits on I/O.
// ---------------------------------------------------------------------------
class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::chrono::milliseconds kPollSlice{50};

    static Deadline After(std::chrono::milliseconds budget);
    static Deadline AfterSeconds(int seconds) {
        return After(std::chrono::seconds(seconds));
    }

    [[nodiscard]] Clock::time_point ExpiresAt() const noexcept { return expires_at_; }

    /// True once the expiry has passed or the deadline was cancelled.
    [[nodiscard]] bool Expired() const;
    [[nodiscard]] bool IsCancelled() const;

    /// Time left, zero when expired or cancelled.
    [[nodiscard]] std::chrono::milliseconds Remaining() const;

    /// The next wait slice: min(Remaining(), kPollSlice).
    [[nodiscard]] std::chrono::milliseconds NextSlice() const;

    void Cancel() const;

private:
    explicit Deadline(Clock::time_point expires_at);

    Clock::time_point expires_at_;
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

} // namespace toolmux
