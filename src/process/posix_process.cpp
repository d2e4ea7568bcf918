#include "gesu/process/posix_process.hpp"
#include "gesu/process/executable.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace gesu::process {
namespace {

constexpr auto kReapPollInterval = std::chrono::milliseconds{10};
constexpr int kReadPollTimeoutMs = 250;

std::string errno_text(int err) {
    return std::strerror(err);
}

// posix_spawn attribute/action objects released on every return path
struct SpawnAttributes {
    posix_spawnattr_t attr{};
    posix_spawn_file_actions_t actions{};

    SpawnAttributes() {
        ::posix_spawnattr_init(&attr);
        ::posix_spawn_file_actions_init(&actions);
    }
    ~SpawnAttributes() {
        ::posix_spawn_file_actions_destroy(&actions);
        ::posix_spawnattr_destroy(&attr);
    }
    SpawnAttributes(const SpawnAttributes&) = delete;
    SpawnAttributes& operator=(const SpawnAttributes&) = delete;
};

} // namespace

PosixProcess::PosixProcess(pid_t pid, int output_fd)
    : pid_(pid), output_fd_(output_fd) {}

PosixProcess::~PosixProcess() {
    if (output_fd_ >= 0) {
        ::close(output_fd_);
    }
    std::lock_guard lock(mutex_);
    if (poll_locked()) {
        spdlog::debug("Releasing handle of running process pid={}", pid_);
    }
}

bool PosixProcess::poll_locked() {
    if (exited_) {
        return false;
    }

    int status = 0;
    const pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == 0) {
        return true;
    }
    if (r == pid_) {
        exited_ = true;
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = 128 + WTERMSIG(status);
        }
        return false;
    }
    if (errno == EINTR) {
        return true;
    }

    spdlog::warn("waitpid({}) failed: {}", pid_, errno_text(errno));
    exited_ = true;
    return false;
}

void PosixProcess::signal_group(int signo) {
    if (::kill(-pid_, signo) == 0) {
        return;
    }
    if (::kill(pid_, signo) != 0 && errno != ESRCH) {
        spdlog::warn("kill({}, {}) failed: {}", pid_, signo, errno_text(errno));
    }
}

bool PosixProcess::is_alive() {
    std::lock_guard lock(mutex_);
    return poll_locked();
}

std::optional<int> PosixProcess::exit_code() const {
    std::lock_guard lock(mutex_);
    if (!exited_) {
        return std::nullopt;
    }
    return exit_code_;
}

void PosixProcess::interrupt() {
    std::lock_guard lock(mutex_);
    if (poll_locked()) {
        signal_group(SIGINT);
    }
}

void PosixProcess::terminate(std::chrono::milliseconds grace) {
    {
        std::lock_guard lock(mutex_);
        if (!poll_locked()) {
            return;
        }
        signal_group(SIGTERM);
    }

    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard lock(mutex_);
            if (!poll_locked()) {
                return;
            }
        }
        std::this_thread::sleep_for(kReapPollInterval);
    }

    {
        std::lock_guard lock(mutex_);
        if (!poll_locked()) {
            return;
        }
        spdlog::warn("pid={} still running {}ms after SIGTERM, sending SIGKILL", pid_, grace.count());
        signal_group(SIGKILL);
    }
    wait_exit();
}

int PosixProcess::wait_exit() {
    while (true) {
        {
            std::lock_guard lock(mutex_);
            if (!poll_locked()) {
                return exit_code_;
            }
        }
        std::this_thread::sleep_for(kReapPollInterval);
    }
}

std::optional<std::string> PosixProcess::read_line() {
    if (output_fd_ < 0) {
        return std::nullopt;
    }

    while (true) {
        const auto pos = pending_.find_first_of("\r\n");
        if (pos != std::string::npos) {
            std::string line = pending_.substr(0, pos);
            pending_.erase(0, pos + 1);
            if (line.empty()) {
                continue;
            }
            return line;
        }

        if (eof_) {
            if (pending_.empty()) {
                return std::nullopt;
            }
            std::string line = std::move(pending_);
            pending_.clear();
            return line;
        }

        pollfd pfd{output_fd_, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, kReadPollTimeoutMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            eof_ = true;
            continue;
        }
        if (ready == 0) {
            // A daemon forked by the tool can inherit the pipe and keep it
            // open; once our child is gone, treat silence as end of stream.
            if (!is_alive()) {
                eof_ = true;
            }
            continue;
        }

        char buffer[4096];
        const ssize_t n = ::read(output_fd_, buffer, sizeof(buffer));
        if (n > 0) {
            pending_.append(buffer, static_cast<std::size_t>(n));
        } else if (n == 0) {
            eof_ = true;
        } else if (errno != EINTR && errno != EAGAIN) {
            eof_ = true;
        }
    }
}

Result<std::unique_ptr<Process>> PosixProcessRunner::spawn(const CommandLine& command) {
    auto resolved = resolve_executable(command.executable);
    if (resolved.is_error()) {
        return Err<std::unique_ptr<Process>>(resolved.error());
    }
    const std::string program = resolved.value().string();

    std::vector<std::string> argv_storage;
    argv_storage.reserve(command.args.size() + 1);
    argv_storage.push_back(command.executable);
    argv_storage.insert(argv_storage.end(), command.args.begin(), command.args.end());

    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    int pipe_fds[2] = {-1, -1};
    if (command.capture_output && ::pipe2(pipe_fds, O_CLOEXEC) != 0) {
        return Err<std::unique_ptr<Process>>(ErrorKind::Spawn,
                                             "Failed to create output pipe: " + errno_text(errno));
    }

    SpawnAttributes spawn_attrs;
    ::posix_spawn_file_actions_addopen(&spawn_attrs.actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    if (command.capture_output) {
        ::posix_spawn_file_actions_adddup2(&spawn_attrs.actions, pipe_fds[1], STDOUT_FILENO);
        ::posix_spawn_file_actions_adddup2(&spawn_attrs.actions, pipe_fds[1], STDERR_FILENO);
    } else {
        ::posix_spawn_file_actions_addopen(&spawn_attrs.actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    }

    sigset_t no_signals;
    sigemptyset(&no_signals);
    sigset_t default_signals;
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGINT);
    sigaddset(&default_signals, SIGTERM);
    sigaddset(&default_signals, SIGPIPE);

    ::posix_spawnattr_setflags(&spawn_attrs.attr,
                               POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);
    ::posix_spawnattr_setpgroup(&spawn_attrs.attr, 0);
    ::posix_spawnattr_setsigmask(&spawn_attrs.attr, &no_signals);
    ::posix_spawnattr_setsigdefault(&spawn_attrs.attr, &default_signals);

    pid_t pid = -1;
    const int rc = ::posix_spawn(&pid, program.c_str(), &spawn_attrs.actions, &spawn_attrs.attr,
                                 argv.data(), environ);

    if (pipe_fds[1] >= 0) {
        ::close(pipe_fds[1]);
    }
    if (rc != 0) {
        if (pipe_fds[0] >= 0) {
            ::close(pipe_fds[0]);
        }
        return Err<std::unique_ptr<Process>>(ErrorKind::Spawn,
                                             "Failed to start " + program + ": " + errno_text(rc));
    }

    spdlog::debug("Spawned pid={}: {}", pid, render(command));
    std::unique_ptr<Process> handle = std::make_unique<PosixProcess>(pid, pipe_fds[0]);
    return Ok(std::move(handle));
}

} // namespace gesu::process
