#ifndef STEER_CHANNEL_HPP
#define STEER_CHANNEL_HPP

#include <steer/types.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace steer
{

// Everything a backend needs to run one query.
struct PromptPayload
{
    std::string agent_id;
    std::string prompt;
    std::optional<std::string> resume; // Backend session id to continue
    std::string working_directory;
    std::optional<std::string> permission_mode;
    std::optional<std::string> model;
    std::optional<int> max_turns;
    std::string system_prompt;
    std::vector<std::string> allowed_tools;

    json to_json() const;
};

namespace channels
{

std::string message(const std::string& query_id);
std::string complete(const std::string& query_id);
std::string error(const std::string& query_id);

} // namespace channels

// Channel-name -> listener table. Each query publishes on its own three
// channels; listeners are removed by id, exactly once.
class ChannelDispatcher
{
  public:
    using Listener = std::function<void(const json& payload)>;
    using ListenerId = std::uint64_t;

    struct Stats
    {
        std::uint64_t subscribed = 0;
        std::uint64_t unsubscribed = 0;
        std::uint64_t rejected_unsubscribes = 0; // ids that were unknown or already removed
        std::uint64_t published = 0;
        std::uint64_t listener_failures = 0;
    };

    ListenerId subscribe(const std::string& channel, Listener listener);

    // Returns false if the id is unknown or was already removed.
    bool unsubscribe(ListenerId id);

    // Delivers payload to the listeners registered at the time of the call, in
    // registration order. A listener removed during delivery is skipped. Returns
    // the number of listeners invoked.
    std::size_t publish(const std::string& channel, const json& payload);

    std::size_t listener_count(const std::string& channel) const;
    std::size_t total_listeners() const;
    Stats stats() const;
    void clear();

  private:
    struct Entry
    {
        ListenerId id;
        Listener listener;
        bool active = true;
    };

    mutable std::mutex mutex_;
    std::map<std::string, std::vector<std::shared_ptr<Entry>>> channels_;
    std::map<ListenerId, std::string> index_;
    ListenerId next_id_ = 1;
    Stats stats_;
};

// Backend abstraction. Implementations publish, per query id and in order:
// any number of "message" events carrying one protocol JSON object, at most one
// "error" event ({"error": "..."}), then exactly one "complete" event.
// Events must not be published from inside start().
class QueryChannel
{
  public:
    virtual ~QueryChannel() = default;

    // Returns the new query id. Throws ChannelError if the backend cannot start.
    virtual std::string start(const PromptPayload& payload) = 0;

    // Asks the backend to stop the query. The query still ends with "complete".
    virtual void abort(const std::string& query_id) = 0;

    ChannelDispatcher& dispatcher()
    {
        return dispatcher_;
    }

  protected:
    ChannelDispatcher dispatcher_;
};

} // namespace steer

#endif // STEER_CHANNEL_HPP
