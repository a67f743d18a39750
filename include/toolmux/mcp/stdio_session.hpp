#pragma once

#include <toolmux/config/app_config.hpp>
#include <toolmux/mcp/channel_session.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace toolmux {

struct StdioSessionOptions {
    // How long Close waits after closing stdin, and again after SIGTERM.
    std::chrono::milliseconds close_grace{2000};
};

// ---------------------------------------------------------------------------
// StdioSession — IMcpSession over a locally spawned process.
//
// Messages are newline-delimited JSON on the child's stdin/stdout; the
// child's stderr goes to ours. A reader thread feeds stdout into the
// channel. Writes wait for pipe space only until the caller's deadline. Close closes stdin, waits, then escalates to SIGTERM and
// SIGKILL; a non-zero exit status is reported as a close failure.
// ---------------------------------------------------------------------------
class StdioSession : public ChannelSession {
public:
    /// Fails with a Construction error when the command is empty.
    static Result<std::unique_ptr<StdioSession>, Error> Create(
        const std::string& name,
        const StdioTransport& transport,
        const StdioSessionOptions& options = {});

    ~StdioSession() override;

    [[nodiscard]] Result<void, Error> Start(const Deadline& deadline) override;
    [[nodiscard]] Result<void, Error> Close() override;

    /// Exit status once the child has been reaped.
    [[nodiscard]] std::optional<int> ExitStatus() const;

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
    StdioSession(PrivateTag, const std::string& name, std::unique_ptr<Impl> impl);

private:

    bool HasProcess() const;
    void RunReader();
    std::optional<int> StopProcess();

    std::unique_ptr<Impl> impl_;
};

} // namespace toolmux
