#ifndef STEER_TRANSCRIPT_STORE_HPP
#define STEER_TRANSCRIPT_STORE_HPP

#include <steer/types.hpp>

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace steer
{

// Per-agent transcript sink. A message whose id is already present replaces the
// stored copy in place; otherwise it is appended.
class TranscriptStore
{
  public:
    virtual ~TranscriptStore() = default;

    virtual void append_or_update_message(const std::string& agent_id,
                                          const TranscriptMessage& message) = 0;
    virtual std::vector<TranscriptMessage> get_messages(const std::string& agent_id) const = 0;
};

class InMemoryTranscriptStore : public TranscriptStore
{
  public:
    void append_or_update_message(const std::string& agent_id,
                                  const TranscriptMessage& message) override;
    std::vector<TranscriptMessage> get_messages(const std::string& agent_id) const override;

    std::optional<TranscriptMessage> find(const std::string& agent_id,
                                          const std::string& message_id) const;
    std::size_t size(const std::string& agent_id) const;
    void clear(const std::string& agent_id);

  private:
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<TranscriptMessage>> transcripts_;
};

} // namespace steer

#endif // STEER_TRANSCRIPT_STORE_HPP
