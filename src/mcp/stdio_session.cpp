#include <toolmux/mcp/stdio_session.hpp>

#include "subprocess.hpp"

#include <toolmux/core/log.hpp>

#include <atomic>
#include <mutex>
#include <thread>

namespace toolmux {

namespace {

constexpr std::chrono::milliseconds kReadSlice{50};

Error MakeStdioError(const std::string& operation,
                     const std::string& endpoint,
                     const std::string& message,
                     ErrorCategory category = ErrorCategory::Transport) {
    return Error{operation, endpoint, std::nullopt, message, category};
}

std::string DescribeCommand(const StdioTransport& transport) {
    auto text = transport.command;
    for (const auto& arg : transport.args) {
        text += " " + arg;
    }
    return text;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct StdioSession::Impl {
    StdioTransport transport;
    StdioSessionOptions options;

    // Guards process writes, stdin close and teardown.
    mutable std::mutex mutex;
    std::unique_ptr<Subprocess> process;

    std::thread reader;
    std::atomic<bool> stopping{false};

    Impl(const StdioTransport& t, const StdioSessionOptions& opts)
        : transport(t), options(opts) {}
};

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------
Result<std::unique_ptr<StdioSession>, Error> StdioSession::Create(
    const std::string& name,
    const StdioTransport& transport,
    const StdioSessionOptions& options) {
    if (transport.command.empty()) {
        return Result<std::unique_ptr<StdioSession>, Error>::Err(MakeStdioError(
            "Connect", name, "Subprocess command must not be empty",
            ErrorCategory::Construction));
    }
    return Result<std::unique_ptr<StdioSession>, Error>::Ok(std::make_unique<StdioSession>(
        PrivateTag{}, name, std::make_unique<Impl>(transport, options)));
}

StdioSession::StdioSession(PrivateTag, const std::string& name, std::unique_ptr<Impl> impl)
    : ChannelSession(name), impl_(std::move(impl)) {}

StdioSession::~StdioSession() {
    StopProcess();
}

bool StdioSession::HasProcess() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->process != nullptr;
}

std::optional<int> StdioSession::ExitStatus() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->process) return std::nullopt;
    return impl_->process->ExitStatus();
}

// ---------------------------------------------------------------------------
// Reader thread
// ---------------------------------------------------------------------------
void StdioSession::RunReader() {
    std::string buffer;
    for (;;) {
        auto status = impl_->process->ReadSome(buffer, kReadSlice);

        std::string::size_type newline;
        while ((newline = buffer.find('\n')) != std::string::npos) {
            auto line = buffer.substr(0, newline);
            buffer.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (!line.empty()) {
                channel().Dispatch(line);
            }
        }

        if (status == Subprocess::ReadStatus::Eof ||
            status == Subprocess::ReadStatus::Error) {
            break;
        }
        if (impl_->stopping.load()) {
            return;
        }
    }

    if (impl_->stopping.load()) {
        return;
    }
    auto error = MakeStdioError("Read", Name(), "process closed its stdout");
    LogWarn("stdio", error.ToString());
    channel().FailPending(error);
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------
Result<void, Error> StdioSession::Start(const Deadline& deadline) {
    if (CurrentState() != State::Created) {
        return Result<void, Error>::Err(LifecycleError("Start", "newly created"));
    }
    if (deadline.Expired()) {
        return Result<void, Error>::Err(MakeStdioError(
            "Start", Name(), "deadline passed before spawning", ErrorCategory::Timeout));
    }

    LogDebug("stdio", Name() + ": spawning " + DescribeCommand(impl_->transport));
    auto spawned = Subprocess::Spawn(impl_->transport.command, impl_->transport.args,
                                     impl_->transport.env);
    if (spawned.IsErr()) {
        SetState(State::Closed);
        return Result<void, Error>::Err(
            MakeStdioError("Start", Name(), spawned.Error(), ErrorCategory::Start));
    }

    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->process = std::move(spawned).Value();
    }
    impl_->reader = std::thread([this] { RunReader(); });
    SetState(State::Started);
    LogInfo("stdio", Name() + ": started pid " + std::to_string(impl_->process->Pid()));
    return Result<void, Error>::Ok();
}

std::optional<int> StdioSession::StopProcess() {
    // The reader may be blocked in SendMessage answering a ping, so it is
    // joined only after the mutex is released.
    impl_->stopping.store(true);
    std::optional<int> status;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (!impl_->process) {
            return std::nullopt;
        }
        auto& process = *impl_->process;
        status = process.ExitStatus();
        if (!status.has_value()) {
            process.CloseStdin();
            status = process.WaitFor(impl_->options.close_grace);
        }
        if (!status.has_value()) {
            LogDebug("stdio", Name() + ": no exit after stdin close, sending SIGTERM");
            process.Terminate();
            status = process.WaitFor(impl_->options.close_grace);
        }
        if (!status.has_value()) {
            LogWarn("stdio", Name() + ": no exit after SIGTERM, sending SIGKILL");
            process.Kill();
            status = process.WaitFor(impl_->options.close_grace);
        }
    }

    if (impl_->reader.joinable()) {
        impl_->reader.join();
    }
    return status;
}

Result<void, Error> StdioSession::Close() {
    if (CurrentState() == State::Closed) {
        return Result<void, Error>::Ok();
    }
    SetState(State::Closed);

    auto status = StopProcess();
    channel().FailPending(MakeStdioError("Close", Name(), "session closed"));

    if (status.has_value() && *status != 0) {
        return Result<void, Error>::Err(MakeStdioError(
            "Close", Name(), "process exited with status " + std::to_string(*status)));
    }
    if (!status.has_value() && HasProcess()) {
        return Result<void, Error>::Err(
            MakeStdioError("Close", Name(), "process did not exit"));
    }
    LogDebug("stdio", Name() + ": closed");
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Outgoing messages
// ---------------------------------------------------------------------------
Result<void, Error> StdioSession::SendMessage(const std::string& message,
                                             const Deadline& deadline) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->process) {
        return Result<void, Error>::Err(
            MakeStdioError("Write", Name(), "session is not started"));
    }
    auto written = impl_->process->Write(message + "\n", deadline);
    if (written.IsErr()) {
        return Result<void, Error>::Err(MakeStdioError(
            "Write", Name(), written.Error(),
            deadline.Expired() ? ErrorCategory::Timeout : ErrorCategory::Transport));
    }
    return Result<void, Error>::Ok();
}

} // namespace toolmux
