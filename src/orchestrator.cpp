#include "internal/ids.hpp"
#include "internal/message_parser.hpp"

#include <steer/errors.hpp>
#include <steer/log.hpp>
#include <steer/orchestrator.hpp>
#include <steer/query_registry.hpp>

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iterator>
#include <map>

namespace steer
{

namespace
{

std::optional<std::chrono::milliseconds> duration_from_env(const char* name)
{
    const char* env = std::getenv(name);
    if (env == nullptr || env[0] == '\0')
        return std::nullopt;

    try
    {
        std::size_t pos = 0;
        long long parsed = std::stoll(env, &pos);
        if (pos != std::strlen(env))
        {
            log::logger()->warn("ignoring {}={}: not a number", name, env);
            return std::nullopt;
        }
        if (parsed >= 0)
            return std::chrono::milliseconds(parsed);
    }
    catch (const std::exception& e)
    {
        log::logger()->warn("ignoring {}={}: {}", name, env, e.what());
        return std::nullopt;
    }
    log::logger()->warn("ignoring negative {}={}", name, env);
    return std::nullopt;
}

template <typename T>
std::optional<T> first_of(const std::optional<T>& a, const std::optional<T>& b,
                          const std::optional<T>& c)
{
    if (a)
        return a;
    if (b)
        return b;
    return c;
}

} // namespace

OrchestratorOptions OrchestratorOptions::from_environment(OrchestratorOptions base)
{
    if (auto window = duration_from_env("STEER_INTERRUPTION_WINDOW_MS"))
        base.interruption_window = *window;
    if (auto interval = duration_from_env("STEER_SWEEP_INTERVAL_MS"))
        base.sweep_interval = *interval;
    return base;
}

// ============================================================================
// Impl
// ============================================================================

class StreamingQueryOrchestrator::Impl
{
  public:
    Impl(QueryChannel& channel, TranscriptStore& transcript, const SettingsProvider& settings,
         OrchestratorOptions options)
        : channel_(channel), transcript_(transcript), settings_(settings),
          clock_(options.clock ? options.clock : std::make_shared<SystemClock>()),
          registry_(channel.dispatcher()), tracker_(options.interruption_window)
    {
        if (options.sweep_interval.count() > 0)
        {
            sweeper_ = std::make_unique<PeriodicSweeper>(options.sweep_interval,
                                                         [this] { sweep(); });
        }
    }

    ~Impl()
    {
        if (sweeper_)
            sweeper_->stop();

        // Nothing may call back into this object once it is gone
        for (auto& handle : registry_.detach_all())
            handle->resolve();
        for (auto& [query_id, handle] : draining_)
        {
            registry_.release(*handle);
            handle->resolve();
        }
        draining_.clear();
    }

    std::future<std::string> send(const std::string& agent_id, const std::string& text,
                                  const std::vector<std::string>& attachment_refs,
                                  const SendOptions& options)
    {
        auto session = sessions_.find(agent_id);
        if (!session)
            throw ConfigurationError("No agent session with id '" + agent_id + "'");

        PromptPayload payload = build_payload(*session, text, attachment_refs, options);

        const auto now = clock_->now();
        append_line(agent_id, Role::User, text, false);

        auto handle = std::make_shared<QueryHandle>();
        handle->agent_id = agent_id;
        handle->started_at = now;
        auto future = handle->completion.get_future();

        // The predecessor must be gone before the backend starts the new query
        if (auto previous = registry_.detach(agent_id))
            settle_superseded(*previous);

        try
        {
            handle->id = channel_.start(payload);
        }
        catch (const ChannelError& e)
        {
            log::logger()->error("[{}] failed to start query: {}", agent_id, e.what());
            events_.error.notify(
                QueryErrorEvent{agent_id, "", QueryError{"channel_error", e.what()}});
            handle->fail(std::current_exception());
            return future;
        }

        subscribe(handle);
        registry_.start_query(handle);
        streaming_[agent_id] = handle->id;

        auto& usage = usage_[agent_id];
        usage.begin_turn();
        events_.usage.notify(UsageEvent{agent_id, usage.snapshot()});

        log::logger()->debug("[{}] query {} started", agent_id, handle->id);
        return future;
    }

    void cancel(const std::string& agent_id, bool silent)
    {
        auto handle = registry_.current(agent_id);
        if (!handle)
        {
            log::logger()->debug("[{}] stop ignored, no live query", agent_id);
            return;
        }
        if (handle->token.is_cancelled())
        {
            log::logger()->debug("[{}] query {} already cancelled", agent_id, handle->id);
            return;
        }

        tracker_.record(agent_id, clock_->now());
        registry_.cancel_query(agent_id);
        channel_.abort(handle->id);

        if (!silent)
            append_line(agent_id, Role::User, INTERRUPTION_MARKER, true);

        log::logger()->debug("[{}] query {} cancelled{}", agent_id, handle->id,
                             silent ? " silently" : "");
    }

    bool is_streaming(const std::string& agent_id) const
    {
        return streaming_.count(agent_id) > 0;
    }

    UsageSnapshot usage(const std::string& agent_id) const
    {
        auto it = usage_.find(agent_id);
        return it == usage_.end() ? UsageSnapshot{} : it->second.snapshot();
    }

    std::size_t sweep()
    {
        std::size_t removed = tracker_.sweep(clock_->now());
        if (removed > 0)
            log::logger()->debug("swept {} interruption record(s)", removed);
        return removed;
    }

    QueryChannel& channel_;
    TranscriptStore& transcript_;
    const SettingsProvider& settings_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<AttachmentResolver> attachments_;

    SessionDirectory sessions_;
    QueryEvents events_;
    AgentQueryRegistry registry_;
    InterruptionTracker tracker_;
    std::map<std::string, UsageAccumulator> usage_;
    // agent id -> query whose complete event is still outstanding
    std::map<std::string, std::string> streaming_;
    // Queries past their result but not yet complete, by query id
    std::map<std::string, std::shared_ptr<QueryHandle>> draining_;

    // Last, so the sweep thread stops before anything it touches is destroyed
    std::unique_ptr<PeriodicSweeper> sweeper_;

  private:
    PromptPayload build_payload(const AgentSession& session, const std::string& text,
                                const std::vector<std::string>& attachment_refs,
                                const SendOptions& options)
    {
        const Settings settings = settings_.current();

        std::vector<std::string> paths;
        for (const auto& ref : attachment_refs)
        {
            if (!attachments_)
            {
                log::logger()->warn("[{}] no attachment resolver, dropping '{}'", session.id, ref);
                continue;
            }
            if (auto path = attachments_->resolve(ref))
                paths.push_back(*path);
            else
                log::logger()->warn("[{}] unresolved attachment '{}'", session.id, ref);
        }

        PromptPayload payload;
        payload.agent_id = session.id;
        payload.prompt = rewrite_slash_command(append_attachments(text, paths));
        payload.resume = session.backend_session_id;
        payload.working_directory = session.working_directory.empty()
                                        ? settings.working_directory
                                        : session.working_directory;

        std::optional<std::string> default_mode;
        if (!settings.permission_mode.empty())
            default_mode = settings.permission_mode;
        payload.permission_mode =
            first_of(options.permission_mode, session.permission_mode, default_mode);
        payload.model = first_of(options.model, session.model, settings.model);
        payload.max_turns = first_of(options.max_turns, session.max_turns, settings.max_turns);
        payload.system_prompt = options.system_prompt.value_or(settings.system_prompt);

        payload.allowed_tools =
            options.allowed_tools.empty() ? settings.allowed_tools : options.allowed_tools;
        if (!paths.empty() && std::find(payload.allowed_tools.begin(), payload.allowed_tools.end(),
                                        "Read") == payload.allowed_tools.end())
            payload.allowed_tools.push_back("Read");

        return payload;
    }

    void subscribe(const std::shared_ptr<QueryHandle>& handle)
    {
        auto& dispatcher = channel_.dispatcher();
        handle->subscriptions.push_back(dispatcher.subscribe(
            channels::message(handle->id),
            [this, handle](const json& payload) { on_message(handle, payload); }));
        handle->subscriptions.push_back(dispatcher.subscribe(
            channels::error(handle->id),
            [this, handle](const json& payload) { on_error(handle, payload); }));
        handle->subscriptions.push_back(dispatcher.subscribe(
            channels::complete(handle->id), [this, handle](const json&) { on_complete(handle); }));
    }

    // A replaced query: the backend is told to stop, the caller gets its partial text.
    void settle_superseded(QueryHandle& previous)
    {
        if (!previous.token.is_cancelled())
        {
            previous.token.cancel();
            channel_.abort(previous.id);
        }

        auto it = streaming_.find(previous.agent_id);
        if (it != streaming_.end() && it->second == previous.id)
            streaming_.erase(it);

        previous.resolve();
    }

    // ------------------------------------------------------------------------
    // Channel handlers
    // ------------------------------------------------------------------------

    void on_message(const std::shared_ptr<QueryHandle>& handle, const json& payload)
    {
        if (handle->detached)
        {
            log::logger()->trace("[{}] dropping message for detached query {}", handle->agent_id,
                                 handle->id);
            return;
        }

        ProtocolMessage message;
        try
        {
            message = protocol::MessageParser::parse(payload);
        }
        catch (const ValidationError& e)
        {
            report_notice(*handle, NoticeKind::Validation, e.what(), payload);
            return;
        }
        catch (const ProtocolError& e)
        {
            report_notice(*handle, NoticeKind::Protocol, e.what(), payload);
            return;
        }

        log::logger()->trace("[{}] {} on query {}", handle->agent_id, message_kind(message),
                             handle->id);

        const auto now = clock_->now();
        NormalizerContext context;
        context.elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(now - handle->started_at);
        context.interruption_active =
            handle->token.is_cancelled() &&
            tracker_.suppresses(handle->agent_id, now, handle->started_at);

        for (const auto& event : normalize(message, context))
            std::visit([&](const auto& e) { apply(*handle, e); }, event);
    }

    void on_error(const std::shared_ptr<QueryHandle>& handle, const json& payload)
    {
        if (handle->detached)
            return;

        std::string message;
        if (payload.is_object() && payload.contains("error") && payload["error"].is_string())
            message = payload["error"].get<std::string>();
        else
            message = payload.dump();

        if (handle->token.is_cancelled())
            log::logger()->debug("[{}] error after cancel on query {}: {}", handle->agent_id,
                                 handle->id, message);
        else
            surface_error(*handle, QueryError{classify_error(message), message});

        end_turn(handle);
        publish_entry(*handle, handle->entry.has_value());
    }

    void on_complete(const std::shared_ptr<QueryHandle>& handle)
    {
        if (handle->detached)
            return;

        const std::string agent_id = handle->agent_id;
        const std::string query_id = handle->id;

        end_turn(handle);
        registry_.release(*handle);
        draining_.erase(query_id);

        auto it = streaming_.find(agent_id);
        if (it != streaming_.end() && it->second == query_id)
            streaming_.erase(it);

        handle->resolve();
        log::logger()->debug("[{}] query {} complete", agent_id, query_id);
    }

    // The query is no longer live; it keeps its listeners until complete.
    void end_turn(const std::shared_ptr<QueryHandle>& handle)
    {
        if (registry_.on_terminal(handle->agent_id, handle->id))
            draining_[handle->id] = handle;
    }

    // ------------------------------------------------------------------------
    // Normalized events
    // ------------------------------------------------------------------------

    void apply(QueryHandle& handle, const normalized::ContentDelta& delta)
    {
        handle.text += delta.text;
        auto& entry = assistant_entry(handle);
        entry.content += delta.text;
        publish_entry(handle, false);

        auto& usage = usage_[handle.agent_id];
        usage.on_content_delta(delta.is_new_message);

        events_.content_delta.notify(ContentDeltaEvent{handle.agent_id, handle.id, entry.id,
                                                       delta.text, entry.content,
                                                       delta.is_new_message});
        if (delta.is_new_message)
            events_.usage.notify(UsageEvent{handle.agent_id, usage.snapshot()});
    }

    void apply(QueryHandle& handle, const normalized::UsageReported& reported)
    {
        auto& usage = usage_[handle.agent_id];
        usage.on_usage(reported.usage);

        auto& entry = assistant_entry(handle);
        entry.token_usage += reported.usage;
        publish_entry(handle, false);

        events_.usage.notify(UsageEvent{handle.agent_id, usage.snapshot()});
    }

    void apply(QueryHandle& handle, const normalized::ToolInvocation& invocation)
    {
        ToolUsage tool;
        tool.tool_id = invocation.tool_id;
        tool.name = invocation.name;
        tool.input = invocation.input;
        tool.parent_tool_id = invocation.parent_tool_id;

        auto& entry = assistant_entry(handle);
        entry.tool_usages.push_back(tool);
        publish_entry(handle, false);

        events_.tool_invocation.notify(ToolEvent{handle.agent_id, handle.id, tool});
    }

    void apply(QueryHandle& handle, const normalized::ToolCompletion& completion)
    {
        auto& entry = assistant_entry(handle);
        auto it = std::find_if(entry.tool_usages.begin(), entry.tool_usages.end(),
                               [&](const ToolUsage& t) { return t.tool_id == completion.tool_id; });
        if (it == entry.tool_usages.end())
        {
            log::logger()->debug("[{}] result for unknown tool {}", handle.agent_id,
                                 completion.tool_id);
            ToolUsage orphan;
            orphan.tool_id = completion.tool_id;
            orphan.parent_tool_id = completion.parent_tool_id;
            entry.tool_usages.push_back(orphan);
            it = std::prev(entry.tool_usages.end());
        }

        it->result = completion.content;
        it->is_error = completion.is_error;
        it->completed = true;
        ToolUsage tool = *it;
        publish_entry(handle, false);

        events_.tool_completion.notify(ToolEvent{handle.agent_id, handle.id, tool});
    }

    void apply(QueryHandle& handle, const normalized::SessionBinding& binding)
    {
        sessions_.bind_backend_session(handle.agent_id, binding.backend_session_id,
                                       binding.mcp_servers);
        log::logger()->debug("[{}] bound to backend session {}", handle.agent_id,
                             binding.backend_session_id);
        events_.session_bound.notify(SessionBoundEvent{handle.agent_id, binding.backend_session_id,
                                                       binding.model, binding.mcp_servers});
    }

    void apply(QueryHandle& handle, const normalized::CompactionBoundary& compaction)
    {
        auto& usage = usage_[handle.agent_id];
        usage.reset_context();
        append_line(handle.agent_id, Role::Assistant, compaction.text, false);
        events_.usage.notify(UsageEvent{handle.agent_id, usage.snapshot()});
    }

    void apply(QueryHandle& handle, const normalized::UserLine& line)
    {
        append_line(handle.agent_id, Role::User, line.text, line.is_interruption_marker);
    }

    void apply(QueryHandle& handle, const normalized::TurnFinalized& finalized)
    {
        const TurnSummary& summary = finalized.summary;

        // Listeners stay until complete; only liveness ends here
        if (auto live = registry_.on_terminal(handle.agent_id, handle.id))
            draining_[handle.id] = live;

        auto& usage = usage_[handle.agent_id];
        usage.finalize_turn(summary.usage, summary.total_cost_usd);

        auto& entry = assistant_entry(handle);
        if (!summary.usage.is_empty())
            entry.token_usage = summary.usage;
        entry.stop_reason = summary.stop_reason;

        if (summary.error)
            surface_error(handle, *summary.error);
        else if (summary.error_suppressed)
            log::logger()->debug("[{}] execution error after interruption suppressed",
                                 handle.agent_id);

        publish_entry(handle, !entry.tool_usages.empty() || entry.error.has_value());

        events_.turn_result.notify(TurnResultEvent{handle.agent_id, handle.id, summary});
        events_.usage.notify(UsageEvent{handle.agent_id, usage.snapshot()});
        log::logger()->debug("[{}] query {} finished: {} in {} ms", handle.agent_id, handle.id,
                             summary.subtype, summary.duration_ms);
    }

    // ------------------------------------------------------------------------
    // Helpers
    // ------------------------------------------------------------------------

    TranscriptMessage& assistant_entry(QueryHandle& handle)
    {
        if (!handle.entry)
        {
            TranscriptMessage entry;
            entry.id = internal::generate_id("msg");
            entry.role = Role::Assistant;
            entry.timestamp = clock_->now();
            handle.entry = entry;
        }
        return *handle.entry;
    }

    // Writes the assistant entry once it has text (or force is set); an entry
    // already in the store is always refreshed.
    void publish_entry(QueryHandle& handle, bool force)
    {
        if (!handle.entry)
            return;
        if (!handle.entry_published && !force && handle.entry->content.empty())
            return;
        transcript_.append_or_update_message(handle.agent_id, *handle.entry);
        handle.entry_published = true;
    }

    void append_line(const std::string& agent_id, Role role, const std::string& text,
                     bool is_interruption_marker)
    {
        TranscriptMessage line;
        line.id = internal::generate_id("msg");
        line.role = role;
        line.content = text;
        line.is_interruption_marker = is_interruption_marker;
        line.timestamp = clock_->now();
        transcript_.append_or_update_message(agent_id, line);
    }

    // First error of a query wins; returns false if one was already surfaced.
    bool surface_error(QueryHandle& handle, const QueryError& error)
    {
        if (handle.error_surfaced)
        {
            log::logger()->debug("[{}] second error on query {} dropped: {}", handle.agent_id,
                                 handle.id, error.message);
            return false;
        }
        handle.error_surfaced = true;

        assistant_entry(handle).error = error.message;
        log::logger()->warn("[{}] query {} failed ({}): {}", handle.agent_id, handle.id,
                            error.type, error.message);
        events_.error.notify(QueryErrorEvent{handle.agent_id, handle.id, error});
        return true;
    }

    void report_notice(const QueryHandle& handle, NoticeKind kind, const std::string& message,
                       const json& payload)
    {
        log::logger()->warn("[{}] skipped message on query {}: {}", handle.agent_id, handle.id,
                            message);
        events_.notice.notify(NoticeEvent{handle.agent_id, handle.id, kind, message, payload});
    }
};

// ============================================================================
// StreamingQueryOrchestrator
// ============================================================================

StreamingQueryOrchestrator::StreamingQueryOrchestrator(QueryChannel& channel,
                                                       TranscriptStore& transcript,
                                                       const SettingsProvider& settings,
                                                       OrchestratorOptions options)
    : impl_(std::make_unique<Impl>(channel, transcript, settings, std::move(options)))
{
}

StreamingQueryOrchestrator::~StreamingQueryOrchestrator() = default;

SessionDirectory& StreamingQueryOrchestrator::sessions()
{
    return impl_->sessions_;
}

const SessionDirectory& StreamingQueryOrchestrator::sessions() const
{
    return impl_->sessions_;
}

QueryEvents& StreamingQueryOrchestrator::events()
{
    return impl_->events_;
}

void StreamingQueryOrchestrator::set_attachment_resolver(
    std::shared_ptr<AttachmentResolver> resolver)
{
    impl_->attachments_ = std::move(resolver);
}

std::future<std::string> StreamingQueryOrchestrator::send(
    const std::string& agent_id, const std::string& text,
    const std::vector<std::string>& attachment_refs, const SendOptions& options)
{
    return impl_->send(agent_id, text, attachment_refs, options);
}

std::future<std::string> StreamingQueryOrchestrator::cancel_and_send(
    const std::string& agent_id, const std::string& text,
    const std::vector<std::string>& attachment_refs, const SendOptions& options)
{
    impl_->cancel(agent_id, true);
    return impl_->send(agent_id, text, attachment_refs, options);
}

void StreamingQueryOrchestrator::stop(const std::string& agent_id, const StopOptions& options)
{
    impl_->cancel(agent_id, options.silent_cancel);
}

bool StreamingQueryOrchestrator::is_querying(const std::string& agent_id) const
{
    return impl_->registry_.has_live_query(agent_id);
}

bool StreamingQueryOrchestrator::is_streaming(const std::string& agent_id) const
{
    return impl_->is_streaming(agent_id);
}

bool StreamingQueryOrchestrator::has_live_query(const std::string& agent_id) const
{
    return impl_->registry_.has_live_query(agent_id);
}

UsageSnapshot StreamingQueryOrchestrator::usage(const std::string& agent_id) const
{
    return impl_->usage(agent_id);
}

const InterruptionTracker& StreamingQueryOrchestrator::interruptions() const
{
    return impl_->tracker_;
}

std::size_t StreamingQueryOrchestrator::sweep_interruptions()
{
    return impl_->sweep();
}

} // namespace steer
