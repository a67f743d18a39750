#pragma once

#include <toolmux/core/deadline.hpp>
#include <toolmux/core/result.hpp>

#include <sys/types.h>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolmux {

// ---------------------------------------------------------------------------
// Subprocess — a child process with pipes on stdin and stdout (POSIX).
//
// stderr is inherited. The child sees the parent's environment with `env`
// overlaid. Our end of stdin is non-blocking so writes can honour a
// deadline. Spawn reports exec failures (e.g. command not found) instead of
// leaving a child that exits with 127.
// ---------------------------------------------------------------------------
class Subprocess {
public:
    enum class ReadStatus {
        Data,
        Timeout,
        Eof,
        Error,
    };

    static Result<std::unique_ptr<Subprocess>, std::string> Spawn(
        const std::string& command,
        const std::vector<std::string>& args,
        const std::map<std::string, std::string>& env);

    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    [[nodiscard]] pid_t Pid() const noexcept { return pid_; }

    /// Write all of `data` to the child's stdin, waiting for pipe space
    /// until `deadline` expires. A timed-out write may leave a partial line.
    [[nodiscard]] Result<void, std::string> Write(std::string_view data,
                                                  const Deadline& deadline);

    /// Append whatever stdout has within `timeout` to `out`.
    ReadStatus ReadSome(std::string& out, std::chrono::milliseconds timeout);

    void CloseStdin();

    /// Reap the child if it exits within `timeout`. Returns its status:
    /// the exit code, or 128 + signal number when killed by a signal.
    std::optional<int> WaitFor(std::chrono::milliseconds timeout);

    void Terminate();
    void Kill();

    [[nodiscard]] std::optional<int> ExitStatus() const noexcept { return exit_status_; }

private:
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    // Construct through Spawn().
    Subprocess(PrivateTag, pid_t pid, int stdin_fd, int stdout_fd)
        : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd) {}

private:

    bool TryReap();

    pid_t pid_;
    int stdin_fd_;
    int stdout_fd_;
    std::optional<int> exit_status_;
};

} // namespace toolmux
