#include <steer/session_directory.hpp>

namespace steer
{

void SessionDirectory::add(AgentSession session)
{
    std::string id = session.id;
    sessions_[id] = std::move(session);
}

bool SessionDirectory::remove(const std::string& agent_id)
{
    return sessions_.erase(agent_id) > 0;
}

bool SessionDirectory::contains(const std::string& agent_id) const
{
    return sessions_.count(agent_id) > 0;
}

std::optional<AgentSession> SessionDirectory::find(const std::string& agent_id) const
{
    auto it = sessions_.find(agent_id);
    if (it == sessions_.end())
        return std::nullopt;
    return it->second;
}

bool SessionDirectory::bind_backend_session(const std::string& agent_id,
                                            const std::string& backend_session_id,
                                            const json& mcp_servers)
{
    auto it = sessions_.find(agent_id);
    if (it == sessions_.end())
        return false;

    it->second.backend_session_id = backend_session_id;
    if (mcp_servers.is_array())
        it->second.mcp_servers = mcp_servers;
    return true;
}

std::vector<std::string> SessionDirectory::agent_ids() const
{
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_)
        ids.push_back(id);
    return ids;
}

} // namespace steer
