#include <steer/transcript_store.hpp>

#include <algorithm>

namespace steer
{

void InMemoryTranscriptStore::append_or_update_message(const std::string& agent_id,
                                                       const TranscriptMessage& message)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto& messages = transcripts_[agent_id];
    auto it = std::find_if(messages.begin(), messages.end(),
                           [&](const TranscriptMessage& m) { return m.id == message.id; });
    if (it != messages.end())
        *it = message;
    else
        messages.push_back(message);
}

std::vector<TranscriptMessage>
InMemoryTranscriptStore::get_messages(const std::string& agent_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transcripts_.find(agent_id);
    if (it == transcripts_.end())
        return {};
    return it->second;
}

std::optional<TranscriptMessage> InMemoryTranscriptStore::find(const std::string& agent_id,
                                                               const std::string& message_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transcripts_.find(agent_id);
    if (it == transcripts_.end())
        return std::nullopt;
    for (const auto& message : it->second)
    {
        if (message.id == message_id)
            return message;
    }
    return std::nullopt;
}

std::size_t InMemoryTranscriptStore::size(const std::string& agent_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transcripts_.find(agent_id);
    return it == transcripts_.end() ? 0 : it->second.size();
}

void InMemoryTranscriptStore::clear(const std::string& agent_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    transcripts_.erase(agent_id);
}

} // namespace steer
