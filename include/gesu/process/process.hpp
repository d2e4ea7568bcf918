#pragma once

#include "gesu/core/result.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gesu::process {

/**
 * @brief Structured description of one external invocation
 *
 * The core never builds shell strings: the executable and every argument
 * are passed to the OS as separate entries.
 */
struct CommandLine {
    std::string executable;
    std::vector<std::string> args;
    bool capture_output = false; ///< Merge stdout+stderr into read_line()
};

/// Human readable rendering for logs only; never executed
std::string render(const CommandLine& command);

/**
 * @brief Process Handle - sole owner of one spawned OS process
 *
 * THREAD SAFETY:
 * - is_alive(), interrupt(), terminate() and wait_exit() may be called
 *   concurrently from different threads
 * - read_line() must only be called from a single reader thread
 *
 * Destroying a handle does not kill the process; callers terminate()
 * explicitly when they want the process gone.
 */
class Process {
public:
    virtual ~Process() = default;

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    [[nodiscard]] virtual int pid() const noexcept = 0;

    /// Non-blocking liveness probe; reaps the process once it has exited
    virtual bool is_alive() = 0;

    /// Exit code once known: the exit status, or 128 + signal number
    [[nodiscard]] virtual std::optional<int> exit_code() const = 0;

    /// Ask the process to stop (SIGINT); returns immediately
    virtual void interrupt() = 0;

    /**
     * @brief Graceful stop with escalation
     *
     * Sends SIGTERM, waits up to @p grace, then SIGKILL. Returns once the
     * process has been reaped. A no-op on an exited process.
     */
    virtual void terminate(std::chrono::milliseconds grace) = 0;

    /// Blocks the calling thread until exit; returns the exit code
    virtual int wait_exit() = 0;

    /// Next output line, or nullopt at end of stream / when not capturing
    virtual std::optional<std::string> read_line() = 0;

protected:
    Process() = default;
};

/**
 * @brief Pluggable collaborator performing the actual process creation
 *
 * Production code uses PosixProcessRunner; tests substitute a fake that
 * records invocations.
 */
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    /// Fails with ErrorKind::Spawn when the executable cannot be resolved
    /// or the OS refuses to create the process
    virtual Result<std::unique_ptr<Process>> spawn(const CommandLine& command) = 0;
};

} // namespace gesu::process
