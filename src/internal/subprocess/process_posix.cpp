// POSIX child process management for Linux and macOS

#include "process.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <signal.h>
#include <stdexcept>
#include <sys/select.h>
#include <sys/wait.h>
#include <unistd.h>

namespace steer
{
namespace subprocess
{

namespace
{

std::string errno_message(const char* what)
{
    return std::string(what) + ": " + std::strerror(errno);
}

void close_pair(int fds[2])
{
    for (int i = 0; i < 2; ++i)
    {
        if (fds[i] >= 0)
        {
            ::close(fds[i]);
            fds[i] = -1;
        }
    }
}

bool is_executable(const std::filesystem::path& path)
{
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

} // namespace

// ============================================================================
// OutputPipe
// ============================================================================

OutputPipe::OutputPipe(int fd) : fd_(fd) {}

OutputPipe::~OutputPipe()
{
    close();
}

OutputPipe::OutputPipe(OutputPipe&& other) noexcept : fd_(other.fd_)
{
    other.fd_ = -1;
}

OutputPipe& OutputPipe::operator=(OutputPipe&& other) noexcept
{
    if (this != &other)
    {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

std::size_t OutputPipe::read(char* buffer, std::size_t size)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    for (;;)
    {
        ssize_t n = ::read(fd_, buffer, size);
        if (n >= 0)
            return static_cast<std::size_t>(n);
        if (errno != EINTR)
            throw std::runtime_error(errno_message("read failed"));
    }
}

void OutputPipe::close()
{
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
}

// ============================================================================
// Process
// ============================================================================

Process::~Process()
{
    if (!running_)
        return;

    ::kill(pid_, SIGTERM);
    int status = 0;
    while (waitpid(pid_, &status, 0) < 0 && errno == EINTR)
    {
    }
}

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const SpawnOptions& options)
{
    if (running_)
        throw std::runtime_error("Process already running");

    int out_pipe[2] = {-1, -1};
    if (options.capture_stdout && pipe(out_pipe) != 0)
        throw std::runtime_error(errno_message("Failed to create stdout pipe"));

    // Built before fork so the child only calls async-signal-safe functions
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0)
    {
        close_pair(out_pipe);
        throw std::runtime_error(errno_message("Failed to fork process"));
    }

    if (pid == 0)
    {
        if (options.capture_stdout)
        {
            ::close(out_pipe[0]);
            if (dup2(out_pipe[1], STDOUT_FILENO) < 0)
                _exit(127);
            ::close(out_pipe[1]);
        }

        if (options.close_stdin)
        {
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0)
            {
                dup2(devnull, STDIN_FILENO);
                ::close(devnull);
            }
        }

        if (!options.working_directory.empty() && chdir(options.working_directory.c_str()) != 0)
            _exit(127);

        for (const auto& [key, value] : options.environment)
            setenv(key.c_str(), value.c_str(), 1);

        execvp(executable.c_str(), argv.data());
        _exit(127);
    }

    if (options.capture_stdout)
    {
        ::close(out_pipe[1]);
        stdout_ = OutputPipe(out_pipe[0]);
    }

    pid_ = pid;
    running_ = true;
    exit_code_ = -1;
}

OutputPipe& Process::stdout_pipe()
{
    if (!stdout_.is_open())
        throw std::runtime_error("stdout not captured");
    return stdout_;
}

bool Process::is_running()
{
    return running_ && !try_wait().has_value();
}

std::optional<int> Process::try_wait()
{
    if (!running_)
        return pid_ == 0 ? std::nullopt : std::optional<int>(exit_code_);

    int status = 0;
    pid_t result = waitpid(pid_, &status, WNOHANG);
    if (result == 0)
        return std::nullopt;
    if (result < 0)
        throw std::runtime_error(errno_message("waitpid failed"));

    record_status(status);
    return exit_code_;
}

int Process::wait()
{
    if (!running_)
        return exit_code_;

    int status = 0;
    pid_t result;
    do
    {
        result = waitpid(pid_, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result < 0)
        throw std::runtime_error(errno_message("waitpid failed"));

    record_status(status);
    return exit_code_;
}

void Process::interrupt()
{
    if (running_)
        ::kill(pid_, SIGINT);
}

void Process::terminate()
{
    if (running_)
        ::kill(pid_, SIGTERM);
}

void Process::kill()
{
    if (running_)
        ::kill(pid_, SIGKILL);
}

void Process::record_status(int status)
{
    if (WIFEXITED(status))
        exit_code_ = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        exit_code_ = 128 + WTERMSIG(status);
    else
        exit_code_ = -1;
    running_ = false;
}

// ============================================================================
// Helpers
// ============================================================================

std::vector<int> readable_fds(const std::vector<int>& fds, std::chrono::milliseconds timeout)
{
    std::vector<int> ready;
    if (fds.empty())
        return ready;

    fd_set read_fds;
    FD_ZERO(&read_fds);
    int max_fd = -1;
    for (int fd : fds)
    {
        FD_SET(fd, &read_fds);
        if (fd > max_fd)
            max_fd = fd;
    }

    struct timeval tv;
    tv.tv_sec = static_cast<long>(timeout.count() / 1000);
    tv.tv_usec = static_cast<long>((timeout.count() % 1000) * 1000);

    int result = select(max_fd + 1, &read_fds, nullptr, nullptr, &tv);
    if (result < 0)
    {
        if (errno == EINTR)
            return ready;
        throw std::runtime_error(errno_message("select failed"));
    }

    for (int fd : fds)
    {
        if (FD_ISSET(fd, &read_fds))
            ready.push_back(fd);
    }
    return ready;
}

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;

    if (name.empty())
        return std::nullopt;

    if (name.find('/') != std::string::npos)
    {
        if (is_executable(name))
            return fs::absolute(name).string();
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr)
        return std::nullopt;

    std::string path_str(path_env);
    std::size_t start = 0;
    while (start <= path_str.size())
    {
        std::size_t end = path_str.find(':', start);
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

} // namespace subprocess
} // namespace steer
