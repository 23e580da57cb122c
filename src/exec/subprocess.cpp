//! # Child Process Implementation
//!
//! - **Unix**: posix_spawn + pipes, waitpid for the exit status
//! - **Windows**: CreateProcessA + anonymous pipes, GetExitCodeProcess

#include "exec/subprocess.hpp"

#include "log/log.hpp"

#include <cstring>
#include <thread>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#else
#include <cerrno>
#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;
#endif

namespace basis::exec {

namespace {

constexpr size_t READ_CHUNK = 4096;

#ifdef _WIN32

std::string last_error_message() {
    DWORD code = GetLastError();
    char* buffer = nullptr;
    DWORD length = FormatMessageA(FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM |
                                      FORMAT_MESSAGE_IGNORE_INSERTS,
                                  nullptr, code, 0, reinterpret_cast<LPSTR>(&buffer), 0, nullptr);
    std::string message = length ? std::string(buffer, length) : "error " + std::to_string(code);
    if (buffer)
        LocalFree(buffer);
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r'))
        message.pop_back();
    return message;
}

void close_handle(HANDLE& handle) {
    if (handle != nullptr && handle != INVALID_HANDLE_VALUE) {
        CloseHandle(handle);
    }
    handle = nullptr;
}

/// Quotes one argument for CreateProcess, following the MSVC runtime's
/// command line parsing rules.
std::string quote_windows_argument(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\n\v\"") == std::string::npos)
        return arg;

    std::string quoted = "\"";
    size_t backslashes = 0;
    for (char ch : arg) {
        if (ch == '\\') {
            ++backslashes;
            continue;
        }
        if (ch == '"') {
            quoted.append(backslashes * 2 + 1, '\\');
        } else {
            quoted.append(backslashes, '\\');
        }
        backslashes = 0;
        quoted.push_back(ch);
    }
    quoted.append(backslashes * 2, '\\');
    quoted.push_back('"');
    return quoted;
}

/// Anonymous pipe whose read end stays in the parent.
struct AnonymousPipe {
    HANDLE read = nullptr;
    HANDLE write = nullptr;

    AnonymousPipe() = default;
    AnonymousPipe(const AnonymousPipe&) = delete;
    AnonymousPipe& operator=(const AnonymousPipe&) = delete;
    ~AnonymousPipe() {
        close_handle(read);
        close_handle(write);
    }

    bool create() {
        SECURITY_ATTRIBUTES attrs;
        attrs.nLength = sizeof(SECURITY_ATTRIBUTES);
        attrs.bInheritHandle = TRUE;
        attrs.lpSecurityDescriptor = nullptr;
        if (!CreatePipe(&read, &write, &attrs, 0))
            return false;
        return SetHandleInformation(read, HANDLE_FLAG_INHERIT, 0) != 0;
    }
};

#else

std::string errno_message(int code) {
    return std::strerror(code);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
    }
    fd = -1;
}

/// Anonymous pipe; both ends are close-on-exec so only the dup2'd copies
/// reach the child.
struct AnonymousPipe {
    int fds[2] = {-1, -1};

    AnonymousPipe() = default;
    AnonymousPipe(const AnonymousPipe&) = delete;
    AnonymousPipe& operator=(const AnonymousPipe&) = delete;
    ~AnonymousPipe() {
        close_fd(fds[0]);
        close_fd(fds[1]);
    }

    int create() {
#ifdef __APPLE__
        // No pipe2; a spawn on another thread may inherit these until fcntl runs.
        if (::pipe(fds) != 0)
            return errno;
        for (int fd : fds) {
            if (::fcntl(fd, F_SETFD, FD_CLOEXEC) != 0)
                return errno;
        }
#else
        if (::pipe2(fds, O_CLOEXEC) != 0)
            return errno;
#endif
        return 0;
    }

    /// Hands the read end over to the caller.
    int release_read() {
        int fd = fds[0];
        fds[0] = -1;
        return fd;
    }
};

/// RAII wrapper for posix_spawn_file_actions_t.
struct SpawnFileActions {
    posix_spawn_file_actions_t actions;
    bool initialized = false;

    SpawnFileActions() {
        initialized = posix_spawn_file_actions_init(&actions) == 0;
    }
    SpawnFileActions(const SpawnFileActions&) = delete;
    SpawnFileActions& operator=(const SpawnFileActions&) = delete;
    ~SpawnFileActions() {
        if (initialized)
            posix_spawn_file_actions_destroy(&actions);
    }
};

#endif

} // namespace

// ============================================================================
// Platform State
// ============================================================================

struct ChildProcess::Impl {
#ifdef _WIN32
    HANDLE process = nullptr;
    HANDLE stdout_read = nullptr;
    HANDLE stderr_read = nullptr;
    DWORD process_id = 0;
#else
    pid_t pid = -1;
    int stdout_read = -1;
    int stderr_read = -1;
#endif
    long child_id = -1;
    std::string stdout_buffer;
    bool stdout_eof = false;
    std::string stderr_text;
    std::thread stderr_reader;
    bool waited = false;

    Impl() = default;
    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    ~Impl() {
        close_stdout();
        if (!waited && child_id >= 0) {
            auto status = reap();
            if (is_err(status)) {
                BASIS_LOG_WARN("exec", unwrap_err(status).message);
            }
        }
        join_stderr();
    }

    void start_stderr_reader() {
        stderr_reader = std::thread([this]() {
            char buffer[READ_CHUNK];
            while (true) {
#ifdef _WIN32
                DWORD n = 0;
                if (!ReadFile(stderr_read, buffer, sizeof(buffer), &n, nullptr) || n == 0)
                    break;
#else
                ssize_t n = ::read(stderr_read, buffer, sizeof(buffer));
                if (n < 0 && errno == EINTR)
                    continue;
                if (n <= 0)
                    break;
#endif
                stderr_text.append(buffer, static_cast<size_t>(n));
            }
        });
    }

    void join_stderr() {
        if (stderr_reader.joinable()) {
            stderr_reader.join();
        }
#ifdef _WIN32
        close_handle(stderr_read);
#else
        close_fd(stderr_read);
#endif
    }

    void close_stdout() {
#ifdef _WIN32
        close_handle(stdout_read);
#else
        close_fd(stdout_read);
#endif
    }

    /// Reads one chunk of stdout into the buffer. Returns false at end of stream.
    Result<bool, StreamError> fill() {
        char buffer[READ_CHUNK];
#ifdef _WIN32
        DWORD n = 0;
        if (!ReadFile(stdout_read, buffer, sizeof(buffer), &n, nullptr)) {
            if (GetLastError() == ERROR_BROKEN_PIPE)
                return false;
            return StreamError{"cannot read standard output: " + last_error_message()};
        }
#else
        ssize_t n;
        do {
            n = ::read(stdout_read, buffer, sizeof(buffer));
        } while (n < 0 && errno == EINTR);
        if (n < 0)
            return StreamError{"cannot read standard output: " + errno_message(errno)};
#endif
        if (n == 0)
            return false;
        stdout_buffer.append(buffer, static_cast<size_t>(n));
        return true;
    }

    /// Waits for termination. Used by wait() and, as a fallback, the destructor.
    Result<int, StreamError> reap() {
        waited = true;
#ifdef _WIN32
        if (process == nullptr)
            return StreamError{"no child process"};
        if (WaitForSingleObject(process, INFINITE) == WAIT_FAILED)
            return StreamError{"cannot wait for child: " + last_error_message()};
        DWORD exit_code = 0;
        if (!GetExitCodeProcess(process, &exit_code))
            return StreamError{"cannot get exit code: " + last_error_message()};
        close_handle(process);
        return static_cast<int>(exit_code);
#else
        if (pid < 0)
            return StreamError{"no child process"};
        int status = 0;
        pid_t result;
        do {
            result = ::waitpid(pid, &status, 0);
        } while (result == -1 && errno == EINTR);
        if (result != pid)
            return StreamError{"cannot wait for child: " + errno_message(errno)};
        pid = -1;

        if (WIFEXITED(status))
            return WEXITSTATUS(status);
        if (WIFSIGNALED(status))
            return 128 + WTERMSIG(status);
        return status;
#endif
    }
};

// ============================================================================
// ChildProcess
// ============================================================================

ChildProcess::ChildProcess(Box<Impl> impl) : impl_(std::move(impl)) {}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept = default;

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept = default;

ChildProcess::~ChildProcess() = default;

Result<ChildProcess, SpawnError> ChildProcess::spawn(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return SpawnError{"empty argument list"};
    }

    auto impl = make_box<Impl>();
    AnonymousPipe out_pipe;
    AnonymousPipe err_pipe;

#ifdef _WIN32
    if (!out_pipe.create() || !err_pipe.create()) {
        return SpawnError{"cannot create pipes: " + last_error_message()};
    }

    std::string command_line;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0)
            command_line += ' ';
        command_line += quote_windows_argument(argv[i]);
    }

    STARTUPINFOA startup_info = {};
    startup_info.cb = sizeof(STARTUPINFOA);
    startup_info.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
    startup_info.hStdOutput = out_pipe.write;
    startup_info.hStdError = err_pipe.write;
    startup_info.dwFlags |= STARTF_USESTDHANDLES;

    PROCESS_INFORMATION proc_info = {};
    if (!CreateProcessA(argv[0].c_str(), command_line.data(), nullptr, nullptr, TRUE, 0, nullptr,
                        nullptr, &startup_info, &proc_info)) {
        return SpawnError{last_error_message()};
    }
    CloseHandle(proc_info.hThread);

    impl->process = proc_info.hProcess;
    impl->process_id = proc_info.dwProcessId;
    impl->child_id = static_cast<long>(proc_info.dwProcessId);
    impl->stdout_read = out_pipe.read;
    impl->stderr_read = err_pipe.read;
    out_pipe.read = nullptr;
    err_pipe.read = nullptr;
#else
    if (int error = out_pipe.create()) {
        return SpawnError{"cannot create pipe: " + errno_message(error)};
    }
    if (int error = err_pipe.create()) {
        return SpawnError{"cannot create pipe: " + errno_message(error)};
    }

    SpawnFileActions file_actions;
    if (!file_actions.initialized) {
        return SpawnError{"cannot initialize spawn file actions"};
    }
    if (int error = posix_spawn_file_actions_adddup2(&file_actions.actions, out_pipe.fds[1],
                                                     STDOUT_FILENO)) {
        return SpawnError{"cannot redirect standard output: " + errno_message(error)};
    }
    if (int error = posix_spawn_file_actions_adddup2(&file_actions.actions, err_pipe.fds[1],
                                                     STDERR_FILENO)) {
        return SpawnError{"cannot redirect standard error: " + errno_message(error)};
    }

    std::vector<char*> c_args;
    c_args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_args.push_back(const_cast<char*>(arg.c_str()));
    }
    c_args.push_back(nullptr);

    pid_t pid = -1;
    int error = posix_spawn(&pid, argv[0].c_str(), &file_actions.actions, nullptr, c_args.data(),
                            environ);
    if (error != 0) {
        return SpawnError{errno_message(error)};
    }

    impl->pid = pid;
    impl->child_id = static_cast<long>(pid);
    impl->stdout_read = out_pipe.release_read();
    impl->stderr_read = err_pipe.release_read();
#endif

    // The write ends close with the pipe objects; the child holds its own copies.
    impl->start_stderr_reader();
    BASIS_LOG_TRACE("exec", "spawned " << argv[0] << " (pid " << impl->child_id << ")");
    return ChildProcess(std::move(impl));
}

Result<std::optional<std::string>, StreamError> ChildProcess::read_line() {
    while (true) {
        size_t newline = impl_->stdout_buffer.find('\n');
        if (newline != std::string::npos) {
            std::string line = impl_->stdout_buffer.substr(0, newline + 1);
            impl_->stdout_buffer.erase(0, newline + 1);
            return std::optional<std::string>(std::move(line));
        }

        if (impl_->stdout_eof) {
            if (impl_->stdout_buffer.empty())
                return std::optional<std::string>();
            std::string rest = std::move(impl_->stdout_buffer);
            impl_->stdout_buffer.clear();
            return std::optional<std::string>(std::move(rest));
        }

        auto filled = impl_->fill();
        if (is_err(filled))
            return unwrap_err(filled);
        if (!unwrap(filled))
            impl_->stdout_eof = true;
    }
}

Result<int, StreamError> ChildProcess::wait() {
    impl_->close_stdout();
    auto status = impl_->reap();
    impl_->join_stderr();
    return status;
}

const std::string& ChildProcess::stderr_output() const {
    return impl_->stderr_text;
}

long ChildProcess::pid() const {
    return impl_->child_id;
}

} // namespace basis::exec
