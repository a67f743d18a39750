#pragma once

#include <toolmux/core/deadline.hpp>
#include <toolmux/mcp/channel_session.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace toolmux {

// ---------------------------------------------------------------------------
// SseSessionOptions — HTTP tuning for the event-streaming transport.
// ---------------------------------------------------------------------------
struct SseSessionOptions {
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds post_timeout{60};
    std::chrono::seconds stream_idle_timeout{3600};
    bool disable_tls_verify = false;
};

// ---------------------------------------------------------------------------
// SseSession — IMcpSession over HTTP + Server-Sent Events using cpp-httplib.
//
// Uses pimpl to avoid leaking httplib into the public header.
//
//   - Start opens `GET <url>` (Accept: text/event-stream) on a dedicated
//     stream thread and waits for the `endpoint` event naming the POST URL
//   - `message` events carry JSON-RPC responses and notifications
//   - requests are POSTed as application/json, each bounded by the
//     caller's deadline; a JSON reply body is dispatched like a `message`
//     event
//   - Close stops the stream and fails any request still waiting
// ---------------------------------------------------------------------------
class SseSession : public ChannelSession {
public:
    /// Fails with a Construction error when `url` is not an http(s) URL.
    static Result<std::unique_ptr<SseSession>, Error> Create(
        const std::string& name,
        const std::string& url,
        const SseSessionOptions& options = {});

    ~SseSession() override;

    [[nodiscard]] Result<void, Error> Start(const Deadline& deadline) override;
    [[nodiscard]] Result<void, Error> Close() override;

    /// POST target announced by the endpoint, empty before Start succeeds.
    [[nodiscard]] std::string PostUrl() const;

protected:
    [[nodiscard]] Result<void, Error> SendMessage(const std::string& message,
                                                  const Deadline& deadline) override;

private:
    struct Impl;
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    // Construct through Create().
    SseSession(PrivateTag, const std::string& name, std::unique_ptr<Impl> impl);

private:
    void RunStream();
    void StopStream();

    std::unique_ptr<Impl> impl_;
};

} // namespace toolmux
