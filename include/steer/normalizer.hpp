#ifndef STEER_NORMALIZER_HPP
#define STEER_NORMALIZER_HPP

#include <steer/types.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace steer
{

struct QueryError
{
    std::string type; // authentication_error, rate_limit_error, ..., api_error
    std::string message;
};

// Final accounting for one turn
struct TurnSummary
{
    std::string subtype;
    std::int64_t duration_ms = 0;
    bool duration_reported_by_backend = false;
    double total_cost_usd = 0.0;
    TokenCounts usage;
    std::string stop_reason;
    int num_turns = 0;
    std::string session_id;
    std::optional<QueryError> error;
    // The turn errored only because the user interrupted it
    bool error_suppressed = false;
};

// Per-message state the normalizer needs from its caller.
struct NormalizerContext
{
    std::chrono::milliseconds elapsed{0}; // Since the query started
    // An interruption record younger than the window applies to this query
    bool interruption_active = false;
};

namespace normalized
{

struct ContentDelta
{
    std::string text;
    bool is_new_message = false;
};

struct UsageReported
{
    TokenCounts usage;
};

struct ToolInvocation
{
    std::string tool_id;
    std::string name;
    json input;
    std::optional<std::string> parent_tool_id;
};

struct ToolCompletion
{
    std::string tool_id;
    json content;
    bool is_error = false;
    std::optional<std::string> parent_tool_id;
};

struct SessionBinding
{
    std::string backend_session_id;
    std::string model;
    json mcp_servers = json::array();
};

struct CompactionBoundary
{
    std::uint64_t pre_tokens = 0;
    std::string trigger;
    std::string text;
};

struct UserLine
{
    std::string text;
    bool is_interruption_marker = false;
};

struct TurnFinalized
{
    TurnSummary summary;
};

} // namespace normalized

using NormalizedEvent =
    std::variant<normalized::ContentDelta, normalized::UsageReported, normalized::ToolInvocation,
                 normalized::ToolCompletion, normalized::SessionBinding,
                 normalized::CompactionBoundary, normalized::UserLine, normalized::TurnFinalized>;

// Turns one protocol message into the events it implies, in order. Pure: the
// caller owns every side effect. Unknown messages and suppressed interruption
// echoes produce nothing.
std::vector<NormalizedEvent> normalize(const ProtocolMessage& message,
                                       const NormalizerContext& context);

bool is_interruption_echo(const std::string& text);

// Maps backend error text onto an error type name.
std::string classify_error(const std::string& text);

std::string compaction_text(std::uint64_t pre_tokens, const std::string& trigger);

} // namespace steer

#endif // STEER_NORMALIZER_HPP
