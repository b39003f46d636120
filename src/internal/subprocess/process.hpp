#ifndef STEER_SUBPROCESS_PROCESS_HPP
#define STEER_SUBPROCESS_PROCESS_HPP

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace steer
{
namespace subprocess
{

// Read end of the child's stdout.
class OutputPipe
{
  public:
    OutputPipe() = default;
    explicit OutputPipe(int fd);
    ~OutputPipe();

    OutputPipe(const OutputPipe&) = delete;
    OutputPipe& operator=(const OutputPipe&) = delete;
    OutputPipe(OutputPipe&& other) noexcept;
    OutputPipe& operator=(OutputPipe&& other) noexcept;

    // Blocks until at least one byte or EOF. Returns 0 on EOF.
    std::size_t read(char* buffer, std::size_t size);

    void close();
    bool is_open() const
    {
        return fd_ >= 0;
    }
    int fd() const
    {
        return fd_;
    }

  private:
    int fd_ = -1;
};

struct SpawnOptions
{
    std::string working_directory;
    std::map<std::string, std::string> environment; // Added to the inherited environment
    bool capture_stdout = true;
    bool close_stdin = true; // Child reads EOF from stdin
};

class Process
{
  public:
    Process() = default;
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    // Throws std::runtime_error if the pipes or the fork cannot be created.
    // An exec failure surfaces as exit code 127.
    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const SpawnOptions& options = {});

    OutputPipe& stdout_pipe();

    bool is_running();
    std::optional<int> try_wait();
    int wait();

    void interrupt(); // SIGINT
    void terminate(); // SIGTERM
    void kill();      // SIGKILL

    int pid() const
    {
        return pid_;
    }

  private:
    void record_status(int status);

    int pid_ = 0;
    bool running_ = false;
    int exit_code_ = -1;
    OutputPipe stdout_;
};

// Waits up to timeout for any of fds to become readable (data or EOF) and
// returns the ready ones.
std::vector<int> readable_fds(const std::vector<int>& fds, std::chrono::milliseconds timeout);

// Resolves name against PATH (or checks it directly if it contains a '/').
std::optional<std::string> find_executable(const std::string& name);

} // namespace subprocess
} // namespace steer

#endif // STEER_SUBPROCESS_PROCESS_HPP
