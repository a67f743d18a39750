#include <toolmux/mcp/sse_session.hpp>

#include <toolmux/core/log.hpp>
#include <toolmux/core/url.hpp>
#include <toolmux/mcp/sse_parser.hpp>

#include <httplib.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

namespace toolmux {

namespace {

Error MakeSseError(const std::string& operation,
                   const std::string& endpoint,
                   const std::string& message,
                   ErrorCategory category = ErrorCategory::Transport) {
    return Error{operation, endpoint, std::nullopt, message, category};
}

std::unique_ptr<httplib::Client> MakeClient(const HttpUrl& url,
                                            const SseSessionOptions& options,
                                            std::chrono::milliseconds connect_timeout,
                                            std::chrono::milliseconds read_timeout) {
    auto client = std::make_unique<httplib::Client>(url.Origin());
    client->set_connection_timeout(connect_timeout);
    client->set_read_timeout(read_timeout);
    client->set_write_timeout(read_timeout);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    if (url.IsHttps() && options.disable_tls_verify) {
        client->enable_server_certificate_verification(false);
    }
#endif
    return client;
}

Error DeadlineError(const std::string& operation,
                    const std::string& endpoint,
                    const Deadline& deadline) {
    return MakeSseError(operation, endpoint,
                        deadline.IsCancelled() ? "cancelled while posting"
                                               : "timed out while posting",
                        ErrorCategory::Timeout);
}

bool LooksLikeJson(const std::string& body) {
    for (char c : body) {
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') continue;
        return c == '{' || c == '[';
    }
    return false;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl — pimpl body holding the httplib clients and stream state.
// ---------------------------------------------------------------------------
struct SseSession::Impl {
    HttpUrl url;
    SseSessionOptions options;

    std::unique_ptr<httplib::Client> stream_client;
    std::thread stream_thread;
    std::atomic<bool> stopping{false};

    // Guarded by mutex: filled in by the stream thread.
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::optional<HttpUrl> post_url;
    std::optional<Error> stream_error;

    Impl(HttpUrl u, const SseSessionOptions& opts)
        : url(std::move(u)), options(opts) {
        stream_client = MakeClient(url, options, options.connect_timeout,
                                   options.stream_idle_timeout);
        stream_client->set_keep_alive(true);
    }
};

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------
Result<std::unique_ptr<SseSession>, Error> SseSession::Create(
    const std::string& name,
    const std::string& url,
    const SseSessionOptions& options) {
    auto parsed = HttpUrl::Parse(url);
    if (parsed.IsErr()) {
        return Result<std::unique_ptr<SseSession>, Error>::Err(MakeSseError(
            "Connect", name, "Invalid SSE URL '" + url + "': " + parsed.Error(),
            ErrorCategory::Construction));
    }
    auto impl = std::make_unique<Impl>(std::move(parsed).Value(), options);
    if (!impl->stream_client->is_valid()) {
        return Result<std::unique_ptr<SseSession>, Error>::Err(MakeSseError(
            "Connect", name,
            "Cannot create HTTP client for '" + url + "' (https needs OpenSSL support)",
            ErrorCategory::Construction));
    }
    return Result<std::unique_ptr<SseSession>, Error>::Ok(
        std::make_unique<SseSession>(PrivateTag{}, name, std::move(impl)));
}

SseSession::SseSession(PrivateTag, const std::string& name, std::unique_ptr<Impl> impl)
    : ChannelSession(name), impl_(std::move(impl)) {}

SseSession::~SseSession() {
    StopStream();
}

std::string SseSession::PostUrl() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->post_url.has_value()) return {};
    return impl_->post_url->Origin() + impl_->post_url->Path();
}

// ---------------------------------------------------------------------------
// Stream thread
// ---------------------------------------------------------------------------
void SseSession::RunStream() {
    SseParser parser([this](const SseEvent& ev) {
        if (ev.event == "endpoint") {
            auto resolved = impl_->url.Resolve(ev.data);
            std::lock_guard<std::mutex> lock(impl_->mutex);
            if (resolved.IsErr()) {
                impl_->stream_error = MakeSseError(
                    "Connect", Name(), "Bad endpoint event '" + ev.data + "': " +
                                           resolved.Error(),
                    ErrorCategory::Start);
            } else if (!impl_->post_url.has_value()) {
                impl_->post_url = std::move(resolved).Value();
            }
            impl_->cv.notify_all();
            return;
        }
        if (ev.event == "message") {
            channel().Dispatch(ev.data);
            return;
        }
        LogDebug("sse", Name() + ": ignoring event '" + ev.event + "'");
    });

    httplib::Headers headers{
        {"Accept", "text/event-stream"},
        {"Cache-Control", "no-cache"},
    };
    int status = 0;
    auto res = impl_->stream_client->Get(
        impl_->url.Path(), headers,
        [&](const httplib::Response& response) {
            status = response.status;
            return response.status == 200;
        },
        [&](const char* data, size_t length) {
            parser.Feed(std::string_view(data, length));
            return !impl_->stopping.load();
        });

    if (impl_->stopping.load()) {
        return;
    }

    Error error;
    if (status != 0 && status != 200) {
        error = Error::FromHttpStatus("Connect", Name(), status);
    } else if (!res) {
        error = MakeSseError("Stream", Name(),
                             "Event stream failed: " + httplib::to_string(res.error()));
    } else {
        error = MakeSseError("Stream", Name(), "Event stream closed by endpoint");
    }
    LogWarn("sse", error.ToString());
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (!impl_->stream_error.has_value()) {
            impl_->stream_error = error;
        }
        impl_->cv.notify_all();
    }
    channel().FailPending(error);
}

void SseSession::StopStream() {
    impl_->stopping.store(true);
    impl_->stream_client->stop();
    if (impl_->stream_thread.joinable()) {
        impl_->stream_thread.join();
    }
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------
Result<void, Error> SseSession::Start(const Deadline& deadline) {
    if (CurrentState() != State::Created) {
        return Result<void, Error>::Err(LifecycleError("Start", "newly created"));
    }

    LogDebug("sse", Name() + ": opening " + impl_->url.Origin() + impl_->url.Path());
    impl_->stream_thread = std::thread([this] { RunStream(); });

    std::unique_lock<std::mutex> lock(impl_->mutex);
    while (!impl_->post_url.has_value() && !impl_->stream_error.has_value()) {
        if (deadline.Expired()) {
            lock.unlock();
            StopStream();
            SetState(State::Closed);
            return Result<void, Error>::Err(MakeSseError(
                "Start", Name(), "No endpoint event before the deadline",
                ErrorCategory::Timeout));
        }
        impl_->cv.wait_for(lock, deadline.NextSlice());
    }

    if (impl_->stream_error.has_value()) {
        auto error = *impl_->stream_error;
        lock.unlock();
        StopStream();
        SetState(State::Closed);
        if (error.category == ErrorCategory::Transport) {
            error.category = ErrorCategory::Start;
        }
        return Result<void, Error>::Err(std::move(error));
    }

    auto post_url = *impl_->post_url;
    lock.unlock();

    SetState(State::Started);
    LogInfo("sse", Name() + ": connected, posting to " + post_url.Origin() + post_url.Path());
    return Result<void, Error>::Ok();
}

Result<void, Error> SseSession::Close() {
    if (CurrentState() == State::Closed) {
        return Result<void, Error>::Ok();
    }
    SetState(State::Closed);
    StopStream();
    channel().FailPending(MakeSseError("Close", Name(), "session closed"));
    LogDebug("sse", Name() + ": closed");
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Outgoing messages
// ---------------------------------------------------------------------------
Result<void, Error> SseSession::SendMessage(const std::string& message,
                                           const Deadline& deadline) {
    std::optional<HttpUrl> target;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        target = impl_->post_url;
    }
    if (!target.has_value() || CurrentState() == State::Created) {
        return Result<void, Error>::Err(
            MakeSseError("Post", Name(), "session is not started"));
    }
    if (deadline.Expired()) {
        return Result<void, Error>::Err(DeadlineError("Post", Name(), deadline));
    }

    // One client per POST, so stop() aborts only this request. The +1ms puts
    // a deadline-bound timeout past the expiry rather than just before it.
    auto budget = std::min<std::chrono::milliseconds>(
        impl_->options.post_timeout, deadline.Remaining() + std::chrono::milliseconds{1});
    auto connect = std::min<std::chrono::milliseconds>(impl_->options.connect_timeout, budget);
    auto client = MakeClient(*target, impl_->options, connect, budget);

    std::mutex watch_mutex;
    std::condition_variable watch_cv;
    bool done = false;
    std::thread watcher([&] {
        std::unique_lock<std::mutex> lock(watch_mutex);
        while (!done) {
            if (deadline.Expired()) {
                client->stop();
            }
            watch_cv.wait_for(lock, Deadline::kPollSlice);
        }
    });

    auto res = client->Post(target->Path(), message, "application/json");

    {
        std::lock_guard<std::mutex> lock(watch_mutex);
        done = true;
    }
    watch_cv.notify_all();
    watcher.join();

    if (!res) {
        if (deadline.Expired()) {
            return Result<void, Error>::Err(DeadlineError("Post", Name(), deadline));
        }
        return Result<void, Error>::Err(MakeSseError(
            "Post", Name(), "HTTP request failed: " + httplib::to_string(res.error())));
    }
    if (res->status < 200 || res->status >= 300) {
        return Result<void, Error>::Err(
            Error::FromHttpStatus("Post", Name(), res->status, res->body));
    }

    // Some servers answer inline instead of over the stream.
    if (LooksLikeJson(res->body)) {
        channel().Dispatch(res->body);
    }
    return Result<void, Error>::Ok();
}

} // namespace toolmux
