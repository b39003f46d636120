#ifndef STEER_ORCHESTRATOR_HPP
#define STEER_ORCHESTRATOR_HPP

#include <steer/channel.hpp>
#include <steer/clock.hpp>
#include <steer/interruption_tracker.hpp>
#include <steer/normalizer.hpp>
#include <steer/notifier.hpp>
#include <steer/prompt.hpp>
#include <steer/session_directory.hpp>
#include <steer/settings.hpp>
#include <steer/transcript_store.hpp>
#include <steer/types.hpp>
#include <steer/usage.hpp>

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace steer
{

struct OrchestratorOptions
{
    // How long after a cancel the backend's interruption echo and
    // execution-error result are recognised as stale
    std::chrono::milliseconds interruption_window{15000};
    // Period of the background sweep of expired interruption records; zero disables it
    std::chrono::milliseconds sweep_interval{60000};
    // Defaults to SystemClock
    std::shared_ptr<Clock> clock;

    // Applies STEER_INTERRUPTION_WINDOW_MS and STEER_SWEEP_INTERVAL_MS on top of
    // base. Values that are not non-negative integers are ignored.
    static OrchestratorOptions from_environment(OrchestratorOptions base);
    static OrchestratorOptions from_environment() { return from_environment(OrchestratorOptions{}); }
};

// Per-call overrides of the session and settings defaults.
struct SendOptions
{
    std::optional<std::string> permission_mode;
    std::optional<std::string> model;
    std::optional<int> max_turns;
    std::optional<std::string> system_prompt;
    std::vector<std::string> allowed_tools; // Empty: use the settings list
};

struct StopOptions
{
    // Skip the "[Request interrupted by user]" transcript line
    bool silent_cancel = false;
};

// ============================================================================
// Observer events
// ============================================================================

struct ContentDeltaEvent
{
    std::string agent_id;
    std::string query_id;
    std::string message_id; // Transcript entry being grown
    std::string text;       // This chunk
    std::string content;    // Entry content so far
    bool is_new_message = false;
};

struct ToolEvent
{
    std::string agent_id;
    std::string query_id;
    ToolUsage tool;
};

struct SessionBoundEvent
{
    std::string agent_id;
    std::string backend_session_id;
    std::string model;
    json mcp_servers;
};

struct TurnResultEvent
{
    std::string agent_id;
    std::string query_id;
    TurnSummary summary;
};

struct QueryErrorEvent
{
    std::string agent_id;
    std::string query_id; // Empty if the query never started
    QueryError error;
};

enum class NoticeKind
{
    Protocol,
    Validation
};

// A message was skipped; the query goes on.
struct NoticeEvent
{
    std::string agent_id;
    std::string query_id;
    NoticeKind kind = NoticeKind::Protocol;
    std::string message;
    json payload;
};

struct UsageEvent
{
    std::string agent_id;
    UsageSnapshot usage;
};

struct QueryEvents
{
    Notifier<ContentDeltaEvent> content_delta;
    Notifier<ToolEvent> tool_invocation;
    Notifier<ToolEvent> tool_completion;
    Notifier<SessionBoundEvent> session_bound;
    Notifier<TurnResultEvent> turn_result;
    Notifier<QueryErrorEvent> error;
    Notifier<NoticeEvent> notice;
    Notifier<UsageEvent> usage;
};

// Runs at most one query per agent session over a QueryChannel and folds the
// backend's stream into the transcript store.
//
// Not thread-safe: call it and pump the channel from one thread. The channel,
// transcript store and settings provider must outlive the orchestrator.
class StreamingQueryOrchestrator
{
  public:
    StreamingQueryOrchestrator(QueryChannel& channel, TranscriptStore& transcript,
                               const SettingsProvider& settings,
                               OrchestratorOptions options = OrchestratorOptions{});
    ~StreamingQueryOrchestrator();

    StreamingQueryOrchestrator(const StreamingQueryOrchestrator&) = delete;
    StreamingQueryOrchestrator& operator=(const StreamingQueryOrchestrator&) = delete;

    SessionDirectory& sessions();
    const SessionDirectory& sessions() const;
    QueryEvents& events();
    void set_attachment_resolver(std::shared_ptr<AttachmentResolver> resolver);

    // Starts a query, replacing any live query of the same agent. The future
    // resolves with the assistant text once the query completes, is cancelled
    // or is superseded; it holds ChannelError if the backend could not start.
    // Throws ConfigurationError for an unknown agent.
    std::future<std::string> send(const std::string& agent_id, const std::string& text,
                                  const std::vector<std::string>& attachment_refs = {},
                                  const SendOptions& options = SendOptions{});

    // Silently cancels the live query, then sends.
    std::future<std::string> cancel_and_send(const std::string& agent_id,
                                             const std::string& text,
                                             const std::vector<std::string>& attachment_refs = {},
                                             const SendOptions& options = SendOptions{});

    // Cancels the live query. No-op for an unknown agent, an idle agent or an
    // already cancelled query.
    void stop(const std::string& agent_id, const StopOptions& options = StopOptions{});

    // True from send until the query's result (or error) arrives.
    bool is_querying(const std::string& agent_id) const;
    // True from send until the query's complete event.
    bool is_streaming(const std::string& agent_id) const;
    bool has_live_query(const std::string& agent_id) const;

    UsageSnapshot usage(const std::string& agent_id) const;

    const InterruptionTracker& interruptions() const;
    // Runs one sweep of expired interruption records now.
    std::size_t sweep_interruptions();

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace steer

#endif // STEER_ORCHESTRATOR_HPP
