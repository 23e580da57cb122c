//! # Child Process Tests
//!
//! Tests for spawning children, reading their output line by line and
//! collecting exit status and standard error. These rely on `/bin/sh`.

#include "exec/subprocess.hpp"
#include "exec/which.hpp"

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <optional>
#include <thread>

#ifndef _WIN32
#include <signal.h>
#endif

using namespace basis;
using namespace basis::exec;

#ifndef _WIN32

namespace {

std::string shell() {
    auto found = which("sh");
    return is_ok(found) ? unwrap(found).string() : std::string("/bin/sh");
}

ChildProcess spawn_shell(const std::string& script) {
    auto spawned = ChildProcess::spawn({shell(), "-c", script});
    if (is_err(spawned)) {
        ADD_FAILURE() << unwrap_err(spawned).message;
    }
    return std::move(unwrap(spawned));
}

std::vector<std::string> read_all(ChildProcess& child) {
    std::vector<std::string> lines;
    while (true) {
        auto line = child.read_line();
        EXPECT_TRUE(is_ok(line));
        if (is_err(line) || !unwrap(line))
            break;
        lines.push_back(*unwrap(line));
    }
    return lines;
}

int wait_ok(ChildProcess& child) {
    auto status = child.wait();
    EXPECT_TRUE(is_ok(status)) << (is_err(status) ? unwrap_err(status).message : "");
    return is_ok(status) ? unwrap(status) : -1;
}

} // namespace

// ============================================================================
// Spawning
// ============================================================================

TEST(ChildProcessTest, EmptyArgumentListIsRejected) {
    auto spawned = ChildProcess::spawn({});
    ASSERT_TRUE(is_err(spawned));
}

TEST(ChildProcessTest, MissingProgramFailsToSpawn) {
    auto spawned = ChildProcess::spawn({"/nonexistent/basis-no-such-tool"});
    ASSERT_TRUE(is_err(spawned));
    EXPECT_FALSE(unwrap_err(spawned).message.empty());
}

TEST(ChildProcessTest, ReportsPid) {
    auto child = spawn_shell("exit 0");
    EXPECT_GT(child.pid(), 0);
    EXPECT_EQ(wait_ok(child), 0);
}

// ============================================================================
// Output
// ============================================================================

TEST(ChildProcessTest, ReadsLinesWithTerminators) {
    auto child = spawn_shell("echo one; echo two");

    auto lines = read_all(child);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "one\n");
    EXPECT_EQ(lines[1], "two\n");
    EXPECT_EQ(wait_ok(child), 0);
}

TEST(ChildProcessTest, LastLineWithoutTerminator) {
    auto child = spawn_shell("printf 'a\\nb'");

    auto lines = read_all(child);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "a\n");
    EXPECT_EQ(lines[1], "b");
    EXPECT_EQ(wait_ok(child), 0);
}

TEST(ChildProcessTest, NoOutput) {
    auto child = spawn_shell("true");

    EXPECT_TRUE(read_all(child).empty());
    EXPECT_EQ(wait_ok(child), 0);
}

TEST(ChildProcessTest, StandardErrorIsCollectedSeparately) {
    auto child = spawn_shell("echo out; echo err 1>&2");

    auto lines = read_all(child);
    EXPECT_EQ(wait_ok(child), 0);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "out\n");
    EXPECT_EQ(child.stderr_output(), "err\n");
}

TEST(ChildProcessTest, LargeStandardErrorDoesNotBlock) {
    // Far more than a pipe buffer on stderr before any stdout
    auto child = spawn_shell("i=0; while [ $i -lt 4000 ]; do "
                             "echo 'xxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxx' 1>&2; "
                             "i=$((i+1)); done; echo done");

    auto lines = read_all(child);
    EXPECT_EQ(wait_ok(child), 0);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "done\n");
    EXPECT_EQ(child.stderr_output().size(), 4000u * 56u);
}

// ============================================================================
// Exit Status
// ============================================================================

TEST(ChildProcessTest, ExitStatusIsReported) {
    auto child = spawn_shell("exit 3");
    read_all(child);
    EXPECT_EQ(wait_ok(child), 3);
}

TEST(ChildProcessTest, SignalledChildReports128PlusSignal) {
    auto child = spawn_shell("kill -9 $$");
    read_all(child);
    EXPECT_EQ(wait_ok(child), 128 + 9);
}

TEST(ChildProcessTest, DestructorReapsUnwaitedChild) {
    // Must neither hang nor leak a zombie
    auto child = spawn_shell("echo ignored");
}

TEST(ChildProcessTest, MovedHandleKeepsChild) {
    auto child = spawn_shell("echo moved");
    ChildProcess other = std::move(child);

    auto lines = read_all(other);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "moved\n");
    EXPECT_EQ(wait_ok(other), 0);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST(ChildProcessTest, ConcurrentSpawnsDoNotShareOutputPipes) {
    // A long-lived child spawned while the others start must not hold their
    // pipes open, or their output would only end when it exits
    constexpr int THREADS = 4;
    constexpr int SPAWNS_PER_THREAD = 25;
    std::atomic<int> mismatches{0};
    std::optional<ChildProcess> long_lived;
    auto start = std::chrono::steady_clock::now();

    std::vector<std::thread> workers;
    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([t, &mismatches]() {
            for (int i = 0; i < SPAWNS_PER_THREAD; ++i) {
                std::string expected = std::to_string(t) + "-" + std::to_string(i);
                auto child = spawn_shell("echo " + expected);
                auto lines = read_all(child);
                if (wait_ok(child) != 0 || lines.size() != 1 || lines[0] != expected + "\n")
                    ++mismatches;
            }
        });
    }
    std::thread spawner([&long_lived]() { long_lived.emplace(spawn_shell("exec sleep 5")); });

    spawner.join();
    for (auto& worker : workers)
        worker.join();

    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_EQ(mismatches.load(), 0);
    EXPECT_LT(elapsed, std::chrono::seconds(4));

    ASSERT_TRUE(long_lived.has_value());
    ASSERT_EQ(::kill(static_cast<pid_t>(long_lived->pid()), SIGKILL), 0);
    EXPECT_EQ(wait_ok(*long_lived), 128 + 9);
}

#endif
