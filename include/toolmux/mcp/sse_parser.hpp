#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace toolmux {

struct SseEvent {
    std::string event = "message";
    std::string data;
    std::string id;
};

// ---------------------------------------------------------------------------
// SseParser — incremental text/event-stream decoder.
//
// Feed() accepts arbitrary chunks as they arrive from the socket; complete
// events are handed to the callback when their terminating blank line is
// seen. Handles LF, CRLF and CR line endings, comment lines, multi-line data
// and the "field" / "field:value" / "field: value" forms.
// ---------------------------------------------------------------------------
class SseParser {
public:
    using EventCallback = std::function<void(const SseEvent&)>;

    explicit SseParser(EventCallback on_event);

    void Feed(std::string_view chunk);

    /// Last "retry:" value in milliseconds, 0 if none was sent.
    [[nodiscard]] int RetryMs() const noexcept { return retry_ms_; }

private:
    void ProcessLine(std::string_view line);
    void DispatchEvent();

    EventCallback on_event_;
    std::string buffer_;
    bool skip_leading_lf_ = false;
    std::string event_;
    std::string data_;
    std::string last_id_;
    bool has_data_ = false;
    int retry_ms_ = 0;
};

} // namespace toolmux
