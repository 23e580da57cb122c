//! # Process Runner Tests
//!
//! Tests for `execute()`: invocation forms, echo and capture of standard
//! output, forwarding of standard error, simulation and error reporting.
//! These rely on `sh`, `echo`, `true` and `false` being on the PATH.

#include "exec/executor.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>

using namespace basis;
using namespace basis::exec;
namespace fs = std::filesystem;

// ============================================================================
// Argument Helpers and Sinks
// ============================================================================

TEST(MakeArgsTest, StringifiesStreamableValues) {
    auto args = make_args("cmake", std::string("--build"), fs::path("out").string(), "-j", 4);
    EXPECT_EQ(args, (std::vector<std::string>{"cmake", "--build", "out", "-j", "4"}));
}

TEST(LineSinkTest, EchoStripsTrailingWhitespace) {
    std::ostringstream out;
    EchoSink echo(out);
    echo.write_line("value  \t\r\n");
    echo.write_line("last");

    EXPECT_EQ(out.str(), "value\nlast\n");
}

TEST(LineSinkTest, CaptureKeepsLinesVerbatim) {
    CaptureSink capture;
    capture.write_line("a  \n");
    capture.write_line("b");

    EXPECT_EQ(capture.text(), "a  \nb");
}

TEST(SubprocessErrorTest, KindNames) {
    EXPECT_EQ(error_kind_name(SubprocessErrorKind::CommandNotFound), "command not found");
    EXPECT_EQ(error_kind_name(SubprocessErrorKind::NonZeroExit), "non-zero exit");
}

// ============================================================================
// execute
// ============================================================================

class ExecuteTest : public ::testing::Test {
protected:
    std::ostringstream out;
    std::ostringstream err;
    ExecuteOptions options;

    void SetUp() override {
        options.out = &out;
        options.err = &err;
    }

    ExecutionOutcome run_ok(const Invocation& invocation) {
        auto result = execute(invocation, options);
        EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).message : "");
        return is_ok(result) ? unwrap(result) : ExecutionOutcome{-1, std::nullopt};
    }

    SubprocessError run_err(const Invocation& invocation) {
        auto result = execute(invocation, options);
        EXPECT_TRUE(is_err(result));
        return is_err(result) ? unwrap_err(result)
                              : SubprocessError{SubprocessErrorKind::InvalidInvocation, "", 0};
    }
};

TEST_F(ExecuteTest, UnsetInvocationIsInvalid) {
    auto error = run_err(Invocation{});
    EXPECT_EQ(error.kind, SubprocessErrorKind::InvalidInvocation);
}

TEST_F(ExecuteTest, EmptyArgumentListIsInvalid) {
    EXPECT_EQ(run_err(std::vector<std::string>{}).kind, SubprocessErrorKind::InvalidInvocation);
    EXPECT_EQ(run_err(std::string("   ")).kind, SubprocessErrorKind::InvalidInvocation);
}

TEST_F(ExecuteTest, UnbalancedQuotingIsInvalid) {
    auto error = run_err(std::string("echo 'abc"));
    EXPECT_EQ(error.kind, SubprocessErrorKind::InvalidInvocation);
    EXPECT_NE(error.message.find("No closing quotation"), std::string::npos);
}

TEST_F(ExecuteTest, UnknownCommandFailsEvenWhenFailureIsAllowed) {
    options.allow_fail = true;
    auto error = run_err(make_args("basis-no-such-tool", "--flag"));

    EXPECT_EQ(error.kind, SubprocessErrorKind::CommandNotFound);
    EXPECT_EQ(error.message, "basis-no-such-tool: Command not found");
}

#ifndef _WIN32

TEST_F(ExecuteTest, SimulateNeverSpawns) {
    options.simulate = true;
    options.capture_stdout = true;
    auto outcome = run_ok(make_args("sh", "-c", "echo ran > /nonexistent/basis-marker"));

    EXPECT_EQ(outcome.exit_code, 0);
    ASSERT_TRUE(outcome.output.has_value());
    EXPECT_EQ(*outcome.output, "");

    std::string printed = out.str();
    EXPECT_TRUE(printed.starts_with("$ /")) << printed;
    EXPECT_TRUE(printed.ends_with(" -c \"echo ran > /nonexistent/basis-marker\" (simulated)\n"))
        << printed;
    EXPECT_TRUE(err.str().empty());
}

TEST_F(ExecuteTest, CaptureEcho) {
    options.capture_stdout = true;
    auto outcome = run_ok(make_args("echo", "hello"));

    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(outcome.output, "hello\n");
    EXPECT_EQ(out.str(), "hello\n");
}

TEST_F(ExecuteTest, QuietSuppressesEcho) {
    options.capture_stdout = true;
    options.quiet = true;
    auto outcome = run_ok(make_args("echo", "hello"));

    EXPECT_EQ(outcome.output, "hello\n");
    EXPECT_TRUE(out.str().empty());
}

TEST_F(ExecuteTest, OutputNotCapturedByDefault) {
    auto outcome = run_ok(make_args("echo", "hello"));

    EXPECT_FALSE(outcome.output.has_value());
    EXPECT_EQ(out.str(), "hello\n");
}

TEST_F(ExecuteTest, EchoStripsTrailingWhitespaceButCaptureDoesNot) {
    options.capture_stdout = true;
    auto outcome = run_ok(make_args("sh", "-c", "printf 'a  \\nb'"));

    EXPECT_EQ(outcome.output, "a  \nb");
    EXPECT_EQ(out.str(), "a\nb\n");
}

TEST_F(ExecuteTest, VerbosePrintsCommandFirst) {
    options.verbose = 1;
    run_ok(make_args("echo", "a b"));

    std::string printed = out.str();
    EXPECT_TRUE(printed.starts_with("$ /")) << printed;
    EXPECT_NE(printed.find("echo \"a b\"\na b\n"), std::string::npos) << printed;
}

TEST_F(ExecuteTest, QuotedCommandLine) {
    options.capture_stdout = true;
    auto outcome = run_ok(std::string("echo 'a  b' c"));

    EXPECT_EQ(outcome.output, "a  b c\n");
}

TEST_F(ExecuteTest, StandardErrorIsForwarded) {
    options.capture_stdout = true;
    auto outcome = run_ok(make_args("sh", "-c", "echo out; echo problem 1>&2"));

    EXPECT_EQ(outcome.output, "out\n");
    EXPECT_EQ(err.str(), "problem\n");
}

TEST_F(ExecuteTest, AllowedFailureReturnsStatus) {
    options.allow_fail = true;
    auto outcome = run_ok(make_args("false"));

    EXPECT_NE(outcome.exit_code, 0);
}

TEST_F(ExecuteTest, StatusIsPassedThrough) {
    options.allow_fail = true;
    auto outcome = run_ok(make_args("sh", "-c", "exit 7"));

    EXPECT_EQ(outcome.exit_code, 7);
}

TEST_F(ExecuteTest, FailureIsAnErrorByDefault) {
    auto error = run_err(make_args("sh", "-c", "exit 4"));

    EXPECT_EQ(error.kind, SubprocessErrorKind::NonZeroExit);
    EXPECT_EQ(error.exit_code, 4);
    EXPECT_TRUE(error.message.starts_with("** Failed: /")) << error.message;
    EXPECT_TRUE(error.message.ends_with(" -c \"exit 4\"")) << error.message;
}

TEST_F(ExecuteTest, SuccessIsNotAnError) {
    auto outcome = run_ok(make_args("true"));
    EXPECT_EQ(outcome.exit_code, 0);
}

// ============================================================================
// Build Targets
// ============================================================================

class ExecuteTargetTest : public ExecuteTest {
protected:
    fs::path base;
    target::TargetRegistry targets;

    void SetUp() override {
        ExecuteTest::SetUp();
        base = fs::temp_directory_path() / "basis_executor_test";
        fs::remove_all(base);
        fs::create_directories(base / "bin");

        fs::path script = base / "bin" / "greet";
        {
            std::ofstream file(script);
            file << "#!/bin/sh\necho \"greetings $1\"\n";
        }
        fs::permissions(script, fs::perms::owner_all, fs::perm_options::replace);

        targets.set_base_dir(base);
        targets.add("proj.greet", "bin/greet");
        targets.add("proj.missing", "bin/missing");
        options.targets = &targets;
        options.prefix = "proj";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(base, ec);
    }
};

TEST_F(ExecuteTargetTest, TargetNameResolvesThroughRegistry) {
    options.capture_stdout = true;
    auto outcome = run_ok(make_args("greet", "world"));

    EXPECT_EQ(outcome.output, "greetings world\n");
}

TEST_F(ExecuteTargetTest, SimulatedTargetShowsResolvedPath) {
    options.simulate = true;
    run_ok(make_args("greet"));

    EXPECT_EQ(out.str(), "$ " + (base / "bin" / "greet").lexically_normal().string() +
                             " (simulated)\n");
}

TEST_F(ExecuteTargetTest, MissingTargetBinaryFailsToSpawn) {
    auto error = run_err(make_args("missing"));

    EXPECT_EQ(error.kind, SubprocessErrorKind::SpawnFailed);
    EXPECT_TRUE(error.message.starts_with((base / "bin" / "missing").lexically_normal().string() +
                                          ": "))
        << error.message;
}

#endif
