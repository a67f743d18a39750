#include "subprocess.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace toolmux {

namespace {

std::string ErrnoMessage(const std::string& what, int err) {
    return what + ": " + std::strerror(err);
}

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// A child that exits while we write would otherwise kill us with SIGPIPE.
void IgnoreSigpipeOnce() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

// Parent environment with `overlay` applied, as "KEY=VALUE" strings.
std::vector<std::string> BuildEnvironment(const std::map<std::string, std::string>& overlay) {
    std::vector<std::string> result;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string_view kv(*entry);
        auto eq = kv.find('=');
        auto key = std::string(kv.substr(0, eq));
        if (overlay.count(key) == 0) {
            result.emplace_back(kv);
        }
    }
    for (const auto& [key, value] : overlay) {
        result.push_back(key + "=" + value);
    }
    return result;
}

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Spawn
// ---------------------------------------------------------------------------
Result<std::unique_ptr<Subprocess>, std::string> Subprocess::Spawn(
    const std::string& command,
    const std::vector<std::string>& args,
    const std::map<std::string, std::string>& env) {
    using SpawnResult = Result<std::unique_ptr<Subprocess>, std::string>;

    IgnoreSigpipeOnce();

    // Everything the child needs is prepared before fork: after fork only
    // async-signal-safe calls are allowed.
    auto env_strings = BuildEnvironment(env);
    std::vector<char*> envp;
    for (auto& kv : env_strings) envp.push_back(kv.data());
    envp.push_back(nullptr);

    std::vector<std::string> argv_strings;
    argv_strings.push_back(command);
    argv_strings.insert(argv_strings.end(), args.begin(), args.end());
    std::vector<char*> argv;
    for (auto& arg : argv_strings) argv.push_back(arg.data());
    argv.push_back(nullptr);

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int error_pipe[2] = {-1, -1};
    auto close_all = [&] {
        for (int* fds : {stdin_pipe, stdout_pipe, error_pipe}) {
            CloseFd(fds[0]);
            CloseFd(fds[1]);
        }
    };

    if (::pipe2(stdin_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(error_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close_all();
        return SpawnResult::Err(ErrnoMessage("pipe", err));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        close_all();
        return SpawnResult::Err(ErrnoMessage("fork", err));
    }

    if (pid == 0) {
        // Child. dup2 clears FD_CLOEXEC on the duplicated descriptors.
        if (::dup2(stdin_pipe[0], STDIN_FILENO) < 0 ||
            ::dup2(stdout_pipe[1], STDOUT_FILENO) < 0) {
            int err = errno;
            ssize_t ignored = ::write(error_pipe[1], &err, sizeof(err));
            (void)ignored;
            ::_exit(127);
        }
        ::execvpe(argv[0], argv.data(), envp.data());
        int err = errno;
        ssize_t ignored = ::write(error_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Parent.
    CloseFd(stdin_pipe[0]);
    CloseFd(stdout_pipe[1]);
    CloseFd(error_pipe[1]);

    // The error pipe closes on successful exec; otherwise it carries errno.
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(error_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    CloseFd(error_pipe[0]);

    if (n > 0) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        CloseFd(stdin_pipe[1]);
        CloseFd(stdout_pipe[0]);
        return SpawnResult::Err(ErrnoMessage("cannot execute '" + command + "'", child_errno));
    }

    int flags = ::fcntl(stdin_pipe[1], F_GETFL);
    if (flags < 0 || ::fcntl(stdin_pipe[1], F_SETFL, flags | O_NONBLOCK) < 0) {
        int err = errno;
        ::kill(pid, SIGKILL);
        int status = 0;
        ::waitpid(pid, &status, 0);
        CloseFd(stdin_pipe[1]);
        CloseFd(stdout_pipe[0]);
        return SpawnResult::Err(ErrnoMessage("fcntl", err));
    }

    return SpawnResult::Ok(
        std::make_unique<Subprocess>(PrivateTag{}, pid, stdin_pipe[1], stdout_pipe[0]));
}

Subprocess::~Subprocess() {
    CloseFd(stdin_fd_);
    CloseFd(stdout_fd_);
    if (!exit_status_.has_value()) {
        Kill();
        int status = 0;
        if (::waitpid(pid_, &status, 0) == pid_) {
            exit_status_ = DecodeWaitStatus(status);
        }
    }
}

// ---------------------------------------------------------------------------
// I/O
// ---------------------------------------------------------------------------
Result<void, std::string> Subprocess::Write(std::string_view data,
                                           const Deadline& deadline) {
    if (stdin_fd_ < 0) {
        return Result<void, std::string>::Err("stdin is closed");
    }
    while (!data.empty()) {
        ssize_t written = ::write(stdin_fd_, data.data(), data.size());
        if (written < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                if (deadline.Expired()) {
                    return Result<void, std::string>::Err(
                        deadline.IsCancelled() ? "write cancelled"
                                               : "write timed out, process is not reading");
                }
                pollfd pfd{stdin_fd_, POLLOUT, 0};
                ::poll(&pfd, 1, static_cast<int>(deadline.NextSlice().count()));
                continue;
            }
            if (errno == EPIPE) {
                return Result<void, std::string>::Err("process closed its stdin");
            }
            return Result<void, std::string>::Err(ErrnoMessage("write", errno));
        }
        data.remove_prefix(static_cast<size_t>(written));
    }
    return Result<void, std::string>::Ok();
}

Subprocess::ReadStatus Subprocess::ReadSome(std::string& out,
                                            std::chrono::milliseconds timeout) {
    if (stdout_fd_ < 0) {
        return ReadStatus::Eof;
    }
    pollfd pfd{stdout_fd_, POLLIN, 0};
    int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready < 0) {
        return errno == EINTR ? ReadStatus::Timeout : ReadStatus::Error;
    }
    if (ready == 0) {
        return ReadStatus::Timeout;
    }

    char buffer[4096];
    ssize_t n = ::read(stdout_fd_, buffer, sizeof(buffer));
    if (n < 0) {
        return errno == EINTR || errno == EAGAIN ? ReadStatus::Timeout : ReadStatus::Error;
    }
    if (n == 0) {
        return ReadStatus::Eof;
    }
    out.append(buffer, static_cast<size_t>(n));
    return ReadStatus::Data;
}

void Subprocess::CloseStdin() {
    CloseFd(stdin_fd_);
}

// ---------------------------------------------------------------------------
// Process control
// ---------------------------------------------------------------------------
bool Subprocess::TryReap() {
    if (exit_status_.has_value()) return true;
    int status = 0;
    pid_t result = ::waitpid(pid_, &status, WNOHANG);
    if (result == pid_) {
        exit_status_ = DecodeWaitStatus(status);
        return true;
    }
    return false;
}

std::optional<int> Subprocess::WaitFor(std::chrono::milliseconds timeout) {
    const auto until = std::chrono::steady_clock::now() + timeout;
    while (!TryReap()) {
        if (std::chrono::steady_clock::now() >= until) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return exit_status_;
}

void Subprocess::Terminate() {
    if (!exit_status_.has_value()) {
        ::kill(pid_, SIGTERM);
    }
}

void Subprocess::Kill() {
    if (!exit_status_.has_value()) {
        ::kill(pid_, SIGKILL);
    }
}

} // namespace toolmux
