#ifndef STEER_TYPES_HPP
#define STEER_TYPES_HPP

#include <steer/clock.hpp>
#include <steer/usage.hpp>

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace steer
{

using json = nlohmann::json;

// Text the backend echoes, and the client writes, when a user interrupts a turn.
constexpr const char* INTERRUPTION_MARKER = "[Request interrupted by user]";

// ============================================================================
// Protocol messages (one JSON line of the backend's stream-json output)
// ============================================================================

// Content block types
struct TextBlock
{
    std::string type = "text";
    std::string text;
};

struct ThinkingBlock
{
    std::string type = "thinking";
    std::string thinking;
};

struct ToolUseBlock
{
    std::string type = "tool_use";
    std::string id;
    std::string name;
    json input;
};

struct ToolResultBlock
{
    std::string type = "tool_result";
    std::string tool_use_id;
    json content; // String, array of content blocks, or null
    bool is_error = false;
};

using ContentBlock = std::variant<TextBlock, ThinkingBlock, ToolUseBlock, ToolResultBlock>;

// system/init
struct SystemInitMessage
{
    std::string type = "system";
    std::string subtype = "init";
    std::string session_id;
    std::string model;
    std::string cwd;
    json mcp_servers = json::array();
    std::vector<std::string> tools;
    json raw_json;
};

// system/compact_boundary
struct CompactBoundaryMessage
{
    std::string type = "system";
    std::string subtype = "compact_boundary";
    std::string session_id;
    std::uint64_t pre_tokens = 0;
    std::string trigger;
    json raw_json;
};

struct AssistantMessage
{
    std::string type = "assistant";
    std::string id; // Backend message id, empty if absent
    std::vector<ContentBlock> content;
    std::string model;
    std::optional<std::string> parent_tool_use_id;
    std::optional<TokenCounts> usage;
    json raw_json;
};

struct UserMessage
{
    std::string type = "user";
    std::vector<ContentBlock> content;
    std::optional<std::string> parent_tool_use_id;
    json raw_json;
};

// Tool invocation delivered as its own line rather than inside an assistant message
struct ToolUseMessage
{
    std::string type = "tool_use";
    std::string id;
    std::string name;
    json input;
    std::optional<std::string> parent_tool_use_id;
    json raw_json;
};

struct ToolResultMessage
{
    std::string type = "tool_result";
    std::string tool_use_id;
    json content;
    bool is_error = false;
    std::optional<std::string> parent_tool_use_id;
    json raw_json;
};

struct ResultMessage
{
    std::string type = "result";
    std::string subtype; // "success", "error_during_execution", "error_max_turns", ...
    bool is_error = false;
    std::optional<std::int64_t> duration_ms;
    double total_cost_usd = 0.0;
    TokenCounts usage;
    std::string result; // Final text, or the error description when is_error
    std::string stop_reason;
    int num_turns = 0;
    std::string session_id;
    json raw_json;

    bool is_execution_error() const
    {
        return subtype == "error_during_execution";
    }
};

// Any tag outside the closed set above; kept so callers can log it
struct UnknownMessage
{
    std::string type;
    std::string subtype;
    json raw_json;
};

using ProtocolMessage =
    std::variant<SystemInitMessage, CompactBoundaryMessage, AssistantMessage, UserMessage,
                 ToolUseMessage, ToolResultMessage, ResultMessage, UnknownMessage>;

inline bool is_result_message(const ProtocolMessage& msg)
{
    return std::holds_alternative<ResultMessage>(msg);
}

inline bool is_unknown_message(const ProtocolMessage& msg)
{
    return std::holds_alternative<UnknownMessage>(msg);
}

// Concatenated text of all text blocks, no separator
std::string get_text_content(const std::vector<ContentBlock>& content);

// Short tag for logging, e.g. "system/init" or "assistant"
std::string message_kind(const ProtocolMessage& msg);

// ============================================================================
// Client-side model
// ============================================================================

enum class Role
{
    User,
    Assistant
};

std::string to_string(Role role);

struct ToolUsage
{
    std::string tool_id;
    std::string name;
    json input;
    std::optional<std::string> parent_tool_id;
    json result; // null until completed
    bool is_error = false;
    bool completed = false;
};

struct TranscriptMessage
{
    std::string id;
    Role role = Role::Assistant;
    std::string content;
    TokenCounts token_usage;
    std::vector<ToolUsage> tool_usages;
    std::string stop_reason;
    std::optional<std::string> error;
    bool is_interruption_marker = false;
    Clock::time_point timestamp{};
};

struct AgentSession
{
    std::string id;
    std::optional<std::string> backend_session_id; // Set by system/init, sent as resume
    std::string working_directory;
    std::optional<std::string> permission_mode;
    std::optional<std::string> model;
    std::optional<int> max_turns;
    json mcp_servers = json::array();
};

} // namespace steer

#endif // STEER_TYPES_HPP
