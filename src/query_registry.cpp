#include <steer/log.hpp>
#include <steer/query_registry.hpp>

namespace steer
{

void QueryHandle::resolve()
{
    if (resolved_)
        return;
    resolved_ = true;
    completion.set_value(text);
}

void QueryHandle::fail(std::exception_ptr error)
{
    if (resolved_)
        return;
    resolved_ = true;
    completion.set_exception(error);
}

AgentQueryRegistry::AgentQueryRegistry(ChannelDispatcher& dispatcher) : dispatcher_(dispatcher) {}

std::shared_ptr<QueryHandle> AgentQueryRegistry::start_query(std::shared_ptr<QueryHandle> handle)
{
    auto previous = detach(handle->agent_id);
    if (previous)
        log::logger()->debug("[{}] query {} superseded by {}", handle->agent_id, previous->id,
                             handle->id);

    handle->live = true;
    handle->detached = false;
    live_[handle->agent_id] = handle;
    return previous;
}

std::shared_ptr<QueryHandle> AgentQueryRegistry::detach(const std::string& agent_id)
{
    auto it = live_.find(agent_id);
    if (it == live_.end())
        return nullptr;

    auto handle = it->second;
    live_.erase(it);
    handle->live = false;
    release(*handle);
    return handle;
}

std::shared_ptr<QueryHandle> AgentQueryRegistry::cancel_query(const std::string& agent_id)
{
    auto it = live_.find(agent_id);
    if (it == live_.end())
        return nullptr;

    auto& handle = it->second;
    if (handle->token.is_cancelled())
        return nullptr;

    handle->token.cancel();
    return handle;
}

std::shared_ptr<QueryHandle> AgentQueryRegistry::on_terminal(const std::string& agent_id,
                                                             const std::string& query_id)
{
    auto it = live_.find(agent_id);
    if (it == live_.end() || it->second->id != query_id)
        return nullptr;

    auto handle = it->second;
    live_.erase(it);
    handle->live = false;
    return handle;
}

void AgentQueryRegistry::release(QueryHandle& handle)
{
    handle.detached = true;
    for (auto id : handle.subscriptions)
    {
        if (!dispatcher_.unsubscribe(id))
            log::logger()->warn("[{}] listener {} of query {} was already gone", handle.agent_id,
                                id, handle.id);
    }
    handle.subscriptions.clear();
}

std::vector<std::shared_ptr<QueryHandle>> AgentQueryRegistry::detach_all()
{
    std::vector<std::shared_ptr<QueryHandle>> detached;
    detached.reserve(live_.size());
    for (auto& [agent_id, handle] : live_)
    {
        handle->live = false;
        release(*handle);
        detached.push_back(handle);
    }
    live_.clear();
    return detached;
}

std::shared_ptr<QueryHandle> AgentQueryRegistry::current(const std::string& agent_id) const
{
    auto it = live_.find(agent_id);
    return it == live_.end() ? nullptr : it->second;
}

bool AgentQueryRegistry::has_live_query(const std::string& agent_id) const
{
    return live_.count(agent_id) > 0;
}

} // namespace steer
