#include <steer/log.hpp>
#include <steer/normalizer.hpp>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace steer
{

namespace
{

std::string to_lower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool contains(const std::string& haystack, const char* needle)
{
    return haystack.find(needle) != std::string::npos;
}

void normalize_assistant(const AssistantMessage& msg, std::vector<NormalizedEvent>& out)
{
    bool first_text = true;
    for (const auto& block : msg.content)
    {
        if (auto* text = std::get_if<TextBlock>(&block))
        {
            if (text->text.empty())
                continue;
            out.push_back(normalized::ContentDelta{text->text, first_text});
            first_text = false;
        }
        else if (auto* tool = std::get_if<ToolUseBlock>(&block))
        {
            out.push_back(normalized::ToolInvocation{tool->id, tool->name, tool->input,
                                                     msg.parent_tool_use_id});
        }
    }

    if (msg.usage && !msg.usage->is_empty())
        out.push_back(normalized::UsageReported{*msg.usage});
}

void normalize_user(const UserMessage& msg, const NormalizerContext& context,
                    std::vector<NormalizedEvent>& out)
{
    const std::string text = get_text_content(msg.content);
    const bool echo = is_interruption_echo(text);

    if (echo && context.interruption_active)
    {
        log::logger()->debug("suppressing interruption echo");
        return;
    }

    for (const auto& block : msg.content)
    {
        if (auto* result = std::get_if<ToolResultBlock>(&block))
        {
            out.push_back(normalized::ToolCompletion{result->tool_use_id, result->content,
                                                     result->is_error, msg.parent_tool_use_id});
        }
    }

    if (!text.empty())
        out.push_back(normalized::UserLine{text, echo});
}

TurnSummary summarize(const ResultMessage& msg, const NormalizerContext& context)
{
    TurnSummary summary;
    summary.subtype = msg.subtype;
    if (msg.duration_ms)
    {
        summary.duration_ms = *msg.duration_ms;
        summary.duration_reported_by_backend = true;
    }
    else
    {
        summary.duration_ms = context.elapsed.count();
    }
    summary.total_cost_usd = msg.total_cost_usd;
    summary.usage = msg.usage;
    summary.stop_reason = msg.stop_reason;
    summary.num_turns = msg.num_turns;
    summary.session_id = msg.session_id;

    const bool errored = msg.is_error || msg.subtype.rfind("error", 0) == 0;
    if (!errored)
        return summary;

    if (context.interruption_active && msg.is_execution_error())
    {
        summary.error_suppressed = true;
        return summary;
    }

    QueryError error;
    error.message = msg.result.empty() ? msg.subtype : msg.result;
    error.type = msg.result.empty() ? std::string("api_error") : classify_error(msg.result);
    summary.error = error;
    return summary;
}

} // namespace

std::vector<NormalizedEvent> normalize(const ProtocolMessage& message,
                                       const NormalizerContext& context)
{
    std::vector<NormalizedEvent> out;

    if (auto* init = std::get_if<SystemInitMessage>(&message))
    {
        if (!init->session_id.empty())
            out.push_back(
                normalized::SessionBinding{init->session_id, init->model, init->mcp_servers});
    }
    else if (auto* compact = std::get_if<CompactBoundaryMessage>(&message))
    {
        out.push_back(normalized::CompactionBoundary{
            compact->pre_tokens, compact->trigger,
            compaction_text(compact->pre_tokens, compact->trigger)});
    }
    else if (auto* assistant = std::get_if<AssistantMessage>(&message))
    {
        normalize_assistant(*assistant, out);
    }
    else if (auto* user = std::get_if<UserMessage>(&message))
    {
        normalize_user(*user, context, out);
    }
    else if (auto* tool_use = std::get_if<ToolUseMessage>(&message))
    {
        out.push_back(normalized::ToolInvocation{tool_use->id, tool_use->name, tool_use->input,
                                                 tool_use->parent_tool_use_id});
    }
    else if (auto* tool_result = std::get_if<ToolResultMessage>(&message))
    {
        out.push_back(normalized::ToolCompletion{tool_result->tool_use_id, tool_result->content,
                                                 tool_result->is_error,
                                                 tool_result->parent_tool_use_id});
    }
    else if (auto* result = std::get_if<ResultMessage>(&message))
    {
        out.push_back(normalized::TurnFinalized{summarize(*result, context)});
    }
    else
    {
        log::logger()->debug("ignoring {} message", message_kind(message));
    }

    return out;
}

bool is_interruption_echo(const std::string& text)
{
    return text == INTERRUPTION_MARKER;
}

std::string classify_error(const std::string& text)
{
    const std::string lower = to_lower(text);

    if (contains(lower, "invalid api key") || contains(lower, "please run /login"))
        return "authentication_error";
    if (contains(lower, "rate limit"))
        return "rate_limit_error";
    if (contains(lower, "overloaded"))
        return "overloaded_error";
    if (contains(lower, "permission"))
        return "permission_error";
    if (contains(lower, "not found"))
        return "not_found_error";
    if (contains(lower, "too large"))
        return "request_too_large";
    if (contains(lower, "invalid request"))
        return "invalid_request_error";
    return "api_error";
}

std::string compaction_text(std::uint64_t pre_tokens, const std::string& trigger)
{
    std::ostringstream oss;
    oss << "Compaction completed\n\nPre-compaction tokens: " << pre_tokens
        << "\n\nTrigger: " << trigger;
    return oss.str();
}

} // namespace steer
