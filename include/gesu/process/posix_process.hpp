#pragma once

#include "gesu/process/process.hpp"

#include <mutex>
#include <string>

#include <sys/types.h>

namespace gesu::process {

/**
 * @brief Process handle backed by posix_spawn
 *
 * The child is placed in its own process group so signals reach the
 * helpers it starts (scrcpy launches its own adb server connection).
 * stdin is /dev/null. Without output capture, stdout is /dev/null and
 * stderr is inherited.
 */
class PosixProcess final : public Process {
public:
    PosixProcess(pid_t pid, int output_fd);
    ~PosixProcess() override;

    [[nodiscard]] int pid() const noexcept override { return static_cast<int>(pid_); }

    bool is_alive() override;
    [[nodiscard]] std::optional<int> exit_code() const override;
    void interrupt() override;
    void terminate(std::chrono::milliseconds grace) override;
    int wait_exit() override;
    std::optional<std::string> read_line() override;

private:
    bool poll_locked();
    void signal_group(int signo);

    const pid_t pid_;
    int output_fd_;

    mutable std::mutex mutex_;
    bool exited_ = false;
    int exit_code_ = -1;

    // Reader-thread state, not guarded
    std::string pending_;
    bool eof_ = false;
};

class PosixProcessRunner final : public ProcessRunner {
public:
    Result<std::unique_ptr<Process>> spawn(const CommandLine& command) override;
};

} // namespace gesu::process
