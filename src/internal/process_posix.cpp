// POSIX implementation of subprocess management

#include "process.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <pthread.h>
#include <sys/wait.h>
#include <thread>
#include <time.h>
#include <unistd.h>

extern "C" char** environ;

namespace mcpbridge::process
{

// =============================================================================
// Platform-specific handle structures
// =============================================================================

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    int exit_code = -1;
};

// =============================================================================
// Helper functions
// =============================================================================

namespace
{

std::string errno_message(int err)
{
    return std::strerror(err);
}

void close_fd(int& fd)
{
    if (fd >= 0)
    {
        ::close(fd);
        fd = -1;
    }
}

/// Both ends close-on-exec so sibling children never inherit each other's pipes
struct FdPair
{
    int fds[2] = {-1, -1};

    ~FdPair()
    {
        close_fd(fds[0]);
        close_fd(fds[1]);
    }

    void open(const char* what)
    {
        if (::pipe2(fds, O_CLOEXEC) != 0)
            throw ProcessError(std::string("Failed to create ") + what +
                               " pipe: " + errno_message(errno));
    }

    int release(int index)
    {
        int fd = fds[index];
        fds[index] = -1;
        return fd;
    }
};

int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

/// Environment block for the child, built before fork (setenv is not fork-safe)
std::vector<std::string> build_environment(const ProcessOptions& options)
{
    std::map<std::string, std::string> merged;
    if (options.inherit_environment && environ)
    {
        for (char** entry = environ; *entry; ++entry)
        {
            std::string kv(*entry);
            auto eq = kv.find('=');
            if (eq == std::string::npos)
                continue;
            merged[kv.substr(0, eq)] = kv.substr(eq + 1);
        }
    }
    for (const auto& [key, value] : options.environment)
        merged[key] = value;

    std::vector<std::string> block;
    block.reserve(merged.size());
    for (const auto& [key, value] : merged)
        block.push_back(key + "=" + value);
    return block;
}

[[noreturn]] void child_fail(int error_fd)
{
    int err = errno;
    (void)::write(error_fd, &err, sizeof(err));
    _exit(127);
}

} // namespace

// =============================================================================
// ReadPipe implementation
// =============================================================================

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

ReadPipe::ReadPipe(ReadPipe&&) noexcept = default;
ReadPipe& ReadPipe::operator=(ReadPipe&&) noexcept = default;

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    while (true)
    {
        ssize_t bytes_read = ::read(handle_->fd, buffer, size);
        if (bytes_read >= 0)
            return static_cast<size_t>(bytes_read);
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return 0;
        throw ProcessError("Read failed: " + errno_message(errno));
    }
}

bool ReadPipe::has_data(int timeout_ms)
{
    if (!is_open())
        return false;

    // poll() has no FD_SETSIZE ceiling, so hosts with many open descriptors are fine
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    int wait_ms = timeout_ms;
    while (true)
    {
        struct pollfd pfd;
        pfd.fd = handle_->fd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int result = ::poll(&pfd, 1, wait_ms < 0 ? -1 : wait_ms);
        if (result < 0)
        {
            if (errno == EINTR)
            {
                if (timeout_ms >= 0)
                {
                    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                        deadline - std::chrono::steady_clock::now());
                    wait_ms = static_cast<int>(std::max<long long>(remaining.count(), 0));
                }
                continue;
            }
            throw ProcessError("poll failed: " + errno_message(errno));
        }
        return result > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0;
    }
}

void ReadPipe::close()
{
    if (handle_)
        close_fd(handle_->fd);
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// =============================================================================
// WritePipe implementation
// =============================================================================

WritePipe::WritePipe() : handle_(std::make_unique<PipeHandle>()) {}

WritePipe::~WritePipe()
{
    close();
}

WritePipe::WritePipe(WritePipe&&) noexcept = default;
WritePipe& WritePipe::operator=(WritePipe&&) noexcept = default;

size_t WritePipe::write(const char* data, size_t size)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    // Keep SIGPIPE from terminating the host: block it on this thread for the write and
    // consume the pending signal if the write raised one.
    sigset_t pipe_mask;
    sigemptyset(&pipe_mask);
    sigaddset(&pipe_mask, SIGPIPE);
    sigset_t old_mask;
    pthread_sigmask(SIG_BLOCK, &pipe_mask, &old_mask);

    sigset_t pending;
    sigemptyset(&pending);
    sigpending(&pending);
    const bool already_pending = sigismember(&pending, SIGPIPE) == 1;

    size_t total_written = 0;
    int write_errno = 0;
    while (total_written < size)
    {
        ssize_t bytes_written = ::write(handle_->fd, data + total_written, size - total_written);
        if (bytes_written < 0)
        {
            if (errno == EINTR)
                continue;
            write_errno = errno;
            break;
        }
        total_written += static_cast<size_t>(bytes_written);
    }

    if (write_errno == EPIPE && !already_pending)
    {
        struct timespec no_wait = {0, 0};
        while (sigtimedwait(&pipe_mask, nullptr, &no_wait) < 0 && errno == EINTR)
        {
        }
    }
    pthread_sigmask(SIG_SETMASK, &old_mask, nullptr);

    if (write_errno == EPIPE)
        throw ProcessError("Broken pipe (process closed stdin)");
    if (write_errno != 0)
        throw ProcessError("Write failed: " + errno_message(write_errno));
    return total_written;
}

size_t WritePipe::write(const std::string& data)
{
    return write(data.data(), data.size());
}

void WritePipe::close()
{
    if (handle_)
        close_fd(handle_->fd);
}

bool WritePipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// =============================================================================
// Process implementation
// =============================================================================

Process::Process()
    : handle_(std::make_unique<ProcessHandle>()), stdin_(std::make_unique<WritePipe>()),
      stdout_(std::make_unique<ReadPipe>())
{
}

Process::~Process()
{
    close_pipes();

    if (is_running())
    {
        kill();
        try
        {
            wait();
        }
        catch (const ProcessError&)
        {
            // Already reaped elsewhere; nothing left to release
        }
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    if (handle_->running)
        throw ProcessError("Process already spawned");

    auto resolved = find_executable(executable);
    if (!resolved)
        throw ProcessError("Failed to execute '" + executable + "': command not found");

    // Everything the child touches is prepared before fork
    std::vector<std::string> env_block = build_environment(options);
    std::vector<char*> envp;
    envp.reserve(env_block.size() + 1);
    for (auto& entry : env_block)
        envp.push_back(entry.data());
    envp.push_back(nullptr);

    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    FdPair stdin_pipe;
    FdPair stdout_pipe;
    FdPair error_pipe;
    stdin_pipe.open("stdin");
    stdout_pipe.open("stdout");
    error_pipe.open("error");

    pid_t pid = fork();
    if (pid < 0)
        throw ProcessError("Failed to fork process: " + errno_message(errno));

    if (pid == 0)
    {
        // Child process: only async-signal-safe calls from here on
        int error_fd = error_pipe.fds[1];
        if (dup2(stdin_pipe.fds[0], STDIN_FILENO) < 0)
            child_fail(error_fd);
        if (dup2(stdout_pipe.fds[1], STDOUT_FILENO) < 0)
            child_fail(error_fd);

        if (!options.working_directory.empty() && chdir(options.working_directory.c_str()) != 0)
            child_fail(error_fd);

        execve(resolved->c_str(), argv.data(), envp.data());
        child_fail(error_fd);
    }

    // Parent process
    close_fd(error_pipe.fds[1]);
    int child_errno = 0;
    ssize_t error_bytes;
    do
    {
        error_bytes = ::read(error_pipe.fds[0], &child_errno, sizeof(child_errno));
    } while (error_bytes < 0 && errno == EINTR);

    if (error_bytes > 0)
    {
        waitpid(pid, nullptr, 0);
        throw ProcessError("Failed to execute '" + executable + "': " +
                           errno_message(child_errno));
    }

    stdin_->handle_->fd = stdin_pipe.release(1);
    stdout_->handle_->fd = stdout_pipe.release(0);

    handle_->pid = pid;
    handle_->running = true;
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_ || !stdin_->is_open())
        throw ProcessError("stdin pipe not available");
    return *stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_ || !stdout_->is_open())
        throw ProcessError("stdout pipe not available");
    return *stdout_;
}

void Process::close_pipes()
{
    if (stdin_)
        stdin_->close();
    if (stdout_)
        stdout_->close();
}

bool Process::is_running() const
{
    if (!handle_ || handle_->pid == 0 || !handle_->running)
        return false;

    if (::kill(handle_->pid, 0) == 0)
        return true;
    return errno != ESRCH;
}

std::optional<int> Process::try_wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }
    if (result == 0)
        return std::nullopt;
    throw ProcessError("waitpid failed: " + errno_message(errno));
}

std::optional<int> Process::wait_for(std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true)
    {
        if (auto code = try_wait())
            return code;
        if (std::chrono::steady_clock::now() >= deadline)
            return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

int Process::wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }

    throw ProcessError("waitpid failed: " + errno_message(errno));
}

void Process::terminate()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGTERM);
}

void Process::kill()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGKILL);
}

int Process::pid() const
{
    return handle_ ? static_cast<int>(handle_->pid) : 0;
}

// =============================================================================
// Utility functions
// =============================================================================

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;

    auto is_executable = [](const fs::path& p)
    {
        std::error_code ec;
        return fs::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
    };

    if (name.empty())
        return std::nullopt;

    if (name.find('/') != std::string::npos)
    {
        if (is_executable(name))
            return fs::absolute(name).string();
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::string path_str = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

    size_t start = 0;
    while (start <= path_str.size())
    {
        size_t end = path_str.find(':', start);
        if (end == std::string::npos)
            end = path_str.size();
        std::string dir = path_str.substr(start, end - start);
        if (!dir.empty())
        {
            fs::path candidate = fs::path(dir) / name;
            if (is_executable(candidate))
                return candidate.string();
        }
        start = end + 1;
    }

    return std::nullopt;
}

} // namespace mcpbridge::process
