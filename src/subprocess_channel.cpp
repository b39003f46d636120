#include "internal/ids.hpp"
#include "internal/message_parser.hpp"
#include "internal/subprocess/process.hpp"
#include "internal/transport/cli_command.hpp"

#include <filesystem>
#include <steer/errors.hpp>
#include <steer/log.hpp>
#include <steer/subprocess_channel.hpp>
#include <vector>

namespace steer
{

namespace
{

struct ActiveQuery
{
    explicit ActiveQuery(std::size_t max_line_size) : lines(max_line_size) {}

    subprocess::Process process;
    protocol::LineBuffer lines;
    bool aborted = false;
};

// Decoded object, or the raw line as a JSON string so the consumer reports it
json decode_line(const std::string& line)
{
    try
    {
        return json::parse(line);
    }
    catch (const json::exception& e)
    {
        log::logger()->debug("undecodable CLI output line: {}", e.what());
        return json(line);
    }
}

} // namespace

class SubprocessQueryChannel::Impl
{
  public:
    explicit Impl(SubprocessChannelOptions options) : options_(std::move(options)) {}

    SubprocessChannelOptions options_;
    std::map<std::string, std::unique_ptr<ActiveQuery>> active_;
};

SubprocessQueryChannel::SubprocessQueryChannel(SubprocessChannelOptions options)
    : impl_(std::make_unique<Impl>(std::move(options)))
{
}

SubprocessQueryChannel::~SubprocessQueryChannel() = default;

std::string SubprocessQueryChannel::start(const PromptPayload& payload)
{
    const std::string cli = transport::find_cli(impl_->options_.cli_path);

    if (!payload.working_directory.empty())
    {
        std::error_code ec;
        if (!std::filesystem::is_directory(payload.working_directory, ec))
            throw ChannelError("Working directory does not exist: " + payload.working_directory);
    }

    subprocess::SpawnOptions spawn;
    spawn.working_directory = payload.working_directory;
    spawn.environment = impl_->options_.environment;

    auto query = std::make_unique<ActiveQuery>(impl_->options_.max_line_size);
    try
    {
        query->process.spawn(cli, transport::build_cli_arguments(payload), spawn);
    }
    catch (const std::runtime_error& e)
    {
        throw ChannelError(std::string("Failed to start CLI: ") + e.what());
    }

    std::string query_id = internal::generate_id("query");
    log::logger()->debug("[{}] query {} running as pid {}", payload.agent_id, query_id,
                         query->process.pid());
    impl_->active_.emplace(query_id, std::move(query));
    return query_id;
}

void SubprocessQueryChannel::abort(const std::string& query_id)
{
    auto it = impl_->active_.find(query_id);
    if (it == impl_->active_.end())
    {
        log::logger()->debug("abort of finished query {} ignored", query_id);
        return;
    }

    it->second->aborted = true;
    it->second->process.interrupt();
}

std::size_t SubprocessQueryChannel::poll(std::chrono::milliseconds timeout)
{
    std::map<int, std::string> by_fd;
    std::vector<int> fds;
    for (const auto& [id, query] : impl_->active_)
    {
        int fd = query->process.stdout_pipe().fd();
        by_fd.emplace(fd, id);
        fds.push_back(fd);
    }

    std::size_t published = 0;
    std::vector<char> chunk(impl_->options_.read_chunk_size);

    for (int fd : subprocess::readable_fds(fds, timeout))
    {
        const std::string& query_id = by_fd[fd];
        auto it = impl_->active_.find(query_id);
        if (it == impl_->active_.end())
            continue;
        ActiveQuery& query = *it->second;

        std::size_t n = query.process.stdout_pipe().read(chunk.data(), chunk.size());
        if (n > 0)
        {
            std::vector<std::string> lines;
            try
            {
                lines = query.lines.add_data(std::string(chunk.data(), n));
            }
            catch (const ProtocolError& e)
            {
                log::logger()->warn("query {}: {}", query_id, e.what());
                dispatcher_.publish(channels::message(query_id), json(e.what()));
                ++published;
            }
            for (const auto& line : lines)
            {
                dispatcher_.publish(channels::message(query_id), decode_line(line));
                ++published;
            }
            continue;
        }

        // EOF: the process is done writing
        std::unique_ptr<ActiveQuery> finished = std::move(it->second);
        impl_->active_.erase(it);

        std::string rest = finished->lines.take_remainder();
        if (!rest.empty())
        {
            dispatcher_.publish(channels::message(query_id), decode_line(rest));
            ++published;
        }

        int exit_code = finished->process.wait();
        if (exit_code != 0 && !finished->aborted)
        {
            std::string message = "CLI exited with code " + std::to_string(exit_code);
            if (exit_code == 127)
                message += " (could not execute)";
            log::logger()->error("query {}: {}", query_id, message);
            dispatcher_.publish(channels::error(query_id), json{{"error", message}});
            ++published;
        }

        dispatcher_.publish(channels::complete(query_id),
                            json{{"exit_code", exit_code}, {"aborted", finished->aborted}});
        ++published;
    }

    return published;
}

std::size_t SubprocessQueryChannel::active_queries() const
{
    return impl_->active_.size();
}

bool SubprocessQueryChannel::is_active(const std::string& query_id) const
{
    return impl_->active_.count(query_id) > 0;
}

} // namespace steer
