#include "gesu/process/executable.hpp"
#include "gesu/process/posix_process.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using gesu::ErrorKind;
using gesu::process::CommandLine;
using gesu::process::PosixProcessRunner;
using gesu::process::resolve_executable;

TEST(ResolveExecutableTest, FindsToolsOnPath) {
    auto sh = resolve_executable("sh");
    ASSERT_TRUE(sh.is_ok());
    EXPECT_TRUE(sh.value().is_absolute());

    auto explicit_path = resolve_executable("/bin/sh");
    ASSERT_TRUE(explicit_path.is_ok());
    EXPECT_EQ(explicit_path.value().string(), "/bin/sh");
}

TEST(ResolveExecutableTest, ReportsMissingTools) {
    auto missing = resolve_executable("gesu-definitely-not-installed");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, ErrorKind::Spawn);

    auto bad_path = resolve_executable("/nonexistent/dir/scrcpy");
    ASSERT_TRUE(bad_path.is_error());

    auto empty = resolve_executable("");
    ASSERT_TRUE(empty.is_error());
    EXPECT_NE(empty.error().message.find("not configured"), std::string::npos);
}

TEST(PosixProcessTest, CapturesMergedOutputAndExitCode) {
    PosixProcessRunner runner;
    auto spawned = runner.spawn(CommandLine{"/bin/sh", {"-c", "echo out; echo err 1>&2; exit 3"}, true});
    ASSERT_TRUE(spawned.is_ok());
    auto& process = spawned.value();

    std::vector<std::string> lines;
    while (auto line = process->read_line()) {
        lines.push_back(*line);
    }

    EXPECT_EQ(process->wait_exit(), 3);
    EXPECT_EQ(lines, (std::vector<std::string>{"out", "err"}));
    EXPECT_FALSE(process->is_alive());
    EXPECT_EQ(process->exit_code(), std::optional<int>(3));
}

TEST(PosixProcessTest, CarriageReturnSeparatesProgressLines) {
    PosixProcessRunner runner;
    auto spawned = runner.spawn(CommandLine{"/bin/sh", {"-c", "printf '[ 10%%] a\\r[ 90%%] a\\rdone\\n'"}, true});
    ASSERT_TRUE(spawned.is_ok());

    std::vector<std::string> lines;
    while (auto line = spawned.value()->read_line()) {
        lines.push_back(*line);
    }
    EXPECT_EQ(lines, (std::vector<std::string>{"[ 10%] a", "[ 90%] a", "done"}));
    EXPECT_EQ(spawned.value()->wait_exit(), 0);
}

TEST(PosixProcessTest, ExitStatusOfPathTools) {
    PosixProcessRunner runner;

    auto ok = runner.spawn(CommandLine{"true", {}, false});
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value()->wait_exit(), 0);
    EXPECT_FALSE(ok.value()->read_line().has_value());

    auto fail = runner.spawn(CommandLine{"false", {}, false});
    ASSERT_TRUE(fail.is_ok());
    EXPECT_EQ(fail.value()->wait_exit(), 1);
}

TEST(PosixProcessTest, MissingExecutableIsSpawnError) {
    PosixProcessRunner runner;
    auto spawned = runner.spawn(CommandLine{"gesu-missing-scrcpy", {"-s", "DEV1"}, false});
    ASSERT_TRUE(spawned.is_error());
    EXPECT_EQ(spawned.error().kind, ErrorKind::Spawn);
}

TEST(PosixProcessTest, TerminateStopsRunningProcess) {
    PosixProcessRunner runner;
    auto spawned = runner.spawn(CommandLine{"sleep", {"30"}, false});
    ASSERT_TRUE(spawned.is_ok());
    auto& process = spawned.value();
    EXPECT_TRUE(process->is_alive());
    EXPECT_GT(process->pid(), 0);

    process->terminate(2000ms);
    EXPECT_FALSE(process->is_alive());
    EXPECT_EQ(process->exit_code(), std::optional<int>(128 + 15));

    // Second call is a no-op
    process->terminate(2000ms);
    EXPECT_EQ(process->exit_code(), std::optional<int>(128 + 15));
}

TEST(PosixProcessTest, InterruptSendsSigint) {
    PosixProcessRunner runner;
    auto spawned = runner.spawn(CommandLine{"sleep", {"30"}, false});
    ASSERT_TRUE(spawned.is_ok());

    spawned.value()->interrupt();
    EXPECT_EQ(spawned.value()->wait_exit(), 128 + 2);
}

TEST(PosixProcessTest, TerminateEscalatesToKill) {
    PosixProcessRunner runner;
    auto spawned = runner.spawn(CommandLine{
        "/bin/sh", {"-c", "trap '' TERM; while true; do sleep 0.05; done"}, false});
    ASSERT_TRUE(spawned.is_ok());
    std::this_thread::sleep_for(100ms);

    const auto start = std::chrono::steady_clock::now();
    spawned.value()->terminate(200ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(spawned.value()->is_alive());
    EXPECT_EQ(spawned.value()->exit_code(), std::optional<int>(128 + 9));
    EXPECT_GE(elapsed, 150ms);
}
