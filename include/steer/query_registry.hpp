#ifndef STEER_QUERY_REGISTRY_HPP
#define STEER_QUERY_REGISTRY_HPP

#include <steer/channel.hpp>
#include <steer/clock.hpp>
#include <steer/types.hpp>

#include <atomic>
#include <cstddef>
#include <exception>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace steer
{

// Shared flag; copies observe the same cancellation.
class CancellationToken
{
  public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel()
    {
        flag_->store(true);
    }

    bool is_cancelled() const
    {
        return flag_->load();
    }

  private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// State of one query invocation, from send until its complete event.
struct QueryHandle
{
    std::string id;
    std::string agent_id;
    CancellationToken token;
    Clock::time_point started_at{};
    std::vector<ChannelDispatcher::ListenerId> subscriptions;

    // Cleared by the result (or error) event; the handle stays subscribed
    // until complete so that the stream can drain.
    bool live = true;
    // Superseded or released; any further event for this id is discarded.
    bool detached = false;
    // At most one error is surfaced per query
    bool error_surfaced = false;

    std::string text; // Accumulated assistant text
    // The one assistant transcript entry of this query, created on first use
    std::optional<TranscriptMessage> entry;
    bool entry_published = false;

    std::promise<std::string> completion;

    // Fulfils the completion future with the text accumulated so far. Later
    // calls do nothing.
    void resolve();
    void fail(std::exception_ptr error);
    bool is_resolved() const
    {
        return resolved_;
    }

  private:
    bool resolved_ = false;
};

// agent id -> the one live query for that agent.
class AgentQueryRegistry
{
  public:
    explicit AgentQueryRegistry(ChannelDispatcher& dispatcher);

    AgentQueryRegistry(const AgentQueryRegistry&) = delete;
    AgentQueryRegistry& operator=(const AgentQueryRegistry&) = delete;

    // Makes handle the live query for its agent. A live predecessor is
    // detached first and returned so the caller can settle it.
    std::shared_ptr<QueryHandle> start_query(std::shared_ptr<QueryHandle> handle);

    // Unsubscribes the live query's listeners and clears its slot without any
    // interruption side effect. Returns the detached handle, or nullptr.
    std::shared_ptr<QueryHandle> detach(const std::string& agent_id);

    // Signals the live query's token. Returns the handle if this call cancelled
    // it; nullptr if there is no live query or it was already cancelled. The
    // slot stays occupied until the query's own terminal event.
    std::shared_ptr<QueryHandle> cancel_query(const std::string& agent_id);

    // Clears the slot if query_id is still the live query for agent_id.
    // Returns the handle that was cleared, nullptr if it had been superseded.
    std::shared_ptr<QueryHandle> on_terminal(const std::string& agent_id,
                                             const std::string& query_id);

    // Removes every listener the handle registered. Safe to call repeatedly;
    // each listener is unsubscribed exactly once.
    void release(QueryHandle& handle);

    // Detaches every live query, e.g. on shutdown.
    std::vector<std::shared_ptr<QueryHandle>> detach_all();

    std::shared_ptr<QueryHandle> current(const std::string& agent_id) const;
    bool has_live_query(const std::string& agent_id) const;
    std::size_t live_count() const
    {
        return live_.size();
    }

  private:
    ChannelDispatcher& dispatcher_;
    std::map<std::string, std::shared_ptr<QueryHandle>> live_;
};

} // namespace steer

#endif // STEER_QUERY_REGISTRY_HPP
