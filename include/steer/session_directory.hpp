#ifndef STEER_SESSION_DIRECTORY_HPP
#define STEER_SESSION_DIRECTORY_HPP

#include <steer/types.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace steer
{

// AgentSessions known to one orchestrator, keyed by agent id.
class SessionDirectory
{
  public:
    // Adds or replaces the session with the same id.
    void add(AgentSession session);
    bool remove(const std::string& agent_id);

    bool contains(const std::string& agent_id) const;
    std::optional<AgentSession> find(const std::string& agent_id) const;

    // Records what system/init reported. Returns false for an unknown agent.
    bool bind_backend_session(const std::string& agent_id, const std::string& backend_session_id,
                              const json& mcp_servers);

    std::vector<std::string> agent_ids() const;
    std::size_t size() const
    {
        return sessions_.size();
    }

  private:
    std::map<std::string, AgentSession> sessions_;
};

} // namespace steer

#endif // STEER_SESSION_DIRECTORY_HPP
