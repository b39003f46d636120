#include <steer/channel.hpp>
#include <steer/log.hpp>

#include <exception>

namespace steer
{

json PromptPayload::to_json() const
{
    json j = {{"agent_id", agent_id},
              {"prompt", prompt},
              {"working_directory", working_directory},
              {"system_prompt", system_prompt},
              {"allowed_tools", allowed_tools}};
    if (resume)
        j["resume"] = *resume;
    if (permission_mode)
        j["permission_mode"] = *permission_mode;
    if (model)
        j["model"] = *model;
    if (max_turns)
        j["max_turns"] = *max_turns;
    return j;
}

namespace channels
{

std::string message(const std::string& query_id)
{
    return "message:" + query_id;
}

std::string complete(const std::string& query_id)
{
    return "complete:" + query_id;
}

std::string error(const std::string& query_id)
{
    return "error:" + query_id;
}

} // namespace channels

ChannelDispatcher::ListenerId ChannelDispatcher::subscribe(const std::string& channel,
                                                           Listener listener)
{
    std::lock_guard<std::mutex> lock(mutex_);
    ListenerId id = next_id_++;
    channels_[channel].push_back(std::make_shared<Entry>(Entry{id, std::move(listener), true}));
    index_.emplace(id, channel);
    ++stats_.subscribed;
    return id;
}

bool ChannelDispatcher::unsubscribe(ListenerId id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto idx = index_.find(id);
    if (idx == index_.end())
    {
        ++stats_.rejected_unsubscribes;
        return false;
    }

    auto ch = channels_.find(idx->second);
    if (ch != channels_.end())
    {
        auto& entries = ch->second;
        for (auto it = entries.begin(); it != entries.end(); ++it)
        {
            if ((*it)->id == id)
            {
                (*it)->active = false;
                entries.erase(it);
                break;
            }
        }
        if (entries.empty())
            channels_.erase(ch);
    }
    index_.erase(idx);
    ++stats_.unsubscribed;
    return true;
}

std::size_t ChannelDispatcher::publish(const std::string& channel, const json& payload)
{
    // Copy the entries out under the lock, call them without it held.
    std::vector<std::shared_ptr<Entry>> to_call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.published;
        auto it = channels_.find(channel);
        if (it == channels_.end())
        {
            log::logger()->trace("no listeners on {}", channel);
            return 0;
        }
        to_call = it->second;
    }

    std::size_t invoked = 0;
    for (const auto& entry : to_call)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!entry->active)
                continue;
        }
        ++invoked;
        try
        {
            entry->listener(payload);
        }
        catch (const std::exception& e)
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++stats_.listener_failures;
            }
            log::logger()->warn("listener {} on {} threw: {}", entry->id, channel, e.what());
        }
        catch (...)
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++stats_.listener_failures;
            }
            log::logger()->warn("listener {} on {} threw a non-standard exception", entry->id,
                                channel);
        }
    }
    return invoked;
}

std::size_t ChannelDispatcher::listener_count(const std::string& channel) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(channel);
    if (it == channels_.end())
        return 0;
    return it->second.size();
}

std::size_t ChannelDispatcher::total_listeners() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.size();
}

ChannelDispatcher::Stats ChannelDispatcher::stats() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void ChannelDispatcher::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [name, entries] : channels_)
    {
        for (auto& entry : entries)
            entry->active = false;
    }
    channels_.clear();
    index_.clear();
}

} // namespace steer
