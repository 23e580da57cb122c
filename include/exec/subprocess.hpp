//! # Child Processes
//!
//! Spawns a program with its standard output and standard error redirected
//! to pipes owned by the parent.
//!
//! ## Platform Support
//!
//! - **Unix**: posix_spawn with pipe-based output capture
//! - **Windows**: CreateProcess with redirected stdout/stderr pipes
//!
//! ## Lifetime
//!
//! Standard output is read by the caller, line by line. Standard error is
//! drained by a reader thread from the moment the child starts, so a child
//! that fills its stderr pipe never blocks the stdout loop. The text is
//! available once `wait()` has returned.
//!
//! Destroying a `ChildProcess` closes its pipes, joins the reader thread and
//! reaps the child if `wait()` was never called.

#ifndef BASIS_EXEC_SUBPROCESS_HPP
#define BASIS_EXEC_SUBPROCESS_HPP

#include "common.hpp"

#include <optional>
#include <string>
#include <vector>

namespace basis::exec {

/// The child process could not be created.
struct SpawnError {
    std::string message;
};

/// Reading from or waiting for a running child failed.
struct StreamError {
    std::string message;
};

class ChildProcess {
public:
    /// Starts `argv[0]` (an absolute path) with arguments `argv[1..]`.
    static Result<ChildProcess, SpawnError> spawn(const std::vector<std::string>& argv);

    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ~ChildProcess();

    /// Next line of the child's standard output, including its line
    /// terminator (the last line may lack one). std::nullopt at end of stream.
    Result<std::optional<std::string>, StreamError> read_line();

    /// Waits for the child to terminate and returns its exit status.
    /// A child killed by signal N reports 128 + N.
    Result<int, StreamError> wait();

    /// Everything the child wrote to standard error. Complete after wait().
    const std::string& stderr_output() const;

    /// Process id of the child.
    long pid() const;

private:
    struct Impl;

    explicit ChildProcess(Box<Impl> impl);

    Box<Impl> impl_;
};

} // namespace basis::exec

#endif // BASIS_EXEC_SUBPROCESS_HPP
