#ifndef STEER_SUBPROCESS_CHANNEL_HPP
#define STEER_SUBPROCESS_CHANNEL_HPP

#include <steer/channel.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <string>

namespace steer
{

struct SubprocessChannelOptions
{
    // Empty: STEER_CLI_PATH, then PATH lookup of "claude"
    std::string cli_path;
    // Added to the inherited environment of every CLI process
    std::map<std::string, std::string> environment;
    std::size_t max_line_size = 8 * 1024 * 1024;
    std::size_t read_chunk_size = 64 * 1024;
};

// Runs each query as its own CLI process and publishes its stream-json output.
// Events are only published from poll(), on the calling thread.
class SubprocessQueryChannel : public QueryChannel
{
  public:
    explicit SubprocessQueryChannel(SubprocessChannelOptions options = SubprocessChannelOptions{});
    ~SubprocessQueryChannel() override;

    SubprocessQueryChannel(const SubprocessQueryChannel&) = delete;
    SubprocessQueryChannel& operator=(const SubprocessQueryChannel&) = delete;

    std::string start(const PromptPayload& payload) override;

    // Sends SIGINT. The query still drains and ends with "complete"; its exit
    // status is not reported as an error.
    void abort(const std::string& query_id) override;

    // Waits up to timeout for output, then publishes every complete line read
    // and the error/complete events of processes that exited. Returns the number
    // of events published. Must not be called from inside a listener.
    std::size_t poll(std::chrono::milliseconds timeout);

    std::size_t active_queries() const;
    bool is_active(const std::string& query_id) const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace steer

#endif // STEER_SUBPROCESS_CHANNEL_HPP
