#include "message_parser.hpp"

#include "message_validator.hpp"

#include <steer/errors.hpp>
#include <steer/log.hpp>

namespace steer
{
namespace protocol
{

ProtocolMessage MessageParser::parse(const json& j)
{
    validate_message(j);

    const std::string type = j["type"].get<std::string>();

    if (type == "assistant")
        return parse_assistant_message(j);
    else if (type == "user")
        return parse_user_message(j);
    else if (type == "result")
        return parse_result_message(j);
    else if (type == "system")
        return parse_system_message(j);
    else if (type == "tool_use")
        return parse_tool_use_message(j);
    else if (type == "tool_result")
        return parse_tool_result_message(j);

    UnknownMessage unknown;
    unknown.type = type;
    if (j.contains("subtype") && j["subtype"].is_string())
        unknown.subtype = j["subtype"].get<std::string>();
    unknown.raw_json = j;
    return unknown;
}

ProtocolMessage MessageParser::parse_line(const std::string& line)
{
    json j;
    try
    {
        j = json::parse(line);
    }
    catch (const json::exception& e)
    {
        throw ProtocolError(std::string("JSON parse error: ") + e.what(), json(line));
    }
    return parse(j);
}

ContentBlock MessageParser::parse_content_block(const json& j)
{
    const std::string type = j.at("type").get<std::string>();

    if (type == "text")
    {
        TextBlock block;
        block.text = j.at("text").get<std::string>();
        return block;
    }
    else if (type == "thinking")
    {
        ThinkingBlock block;
        block.thinking = j.value("thinking", "");
        return block;
    }
    else if (type == "tool_use")
    {
        ToolUseBlock block;
        block.id = j.at("id").get<std::string>();
        block.name = j.at("name").get<std::string>();
        block.input = j.contains("input") ? j["input"] : json::object();
        return block;
    }

    ToolResultBlock block;
    block.tool_use_id = j.at("tool_use_id").get<std::string>();
    block.is_error = j.value("is_error", false);
    block.content = j.contains("content") ? j["content"] : json(nullptr);
    return block;
}

std::vector<ContentBlock> MessageParser::parse_content(const json& content)
{
    std::vector<ContentBlock> blocks;

    if (content.is_string())
    {
        blocks.push_back(TextBlock{"text", content.get<std::string>()});
        return blocks;
    }

    for (const auto& item : content)
    {
        const std::string type = item.at("type").get<std::string>();
        if (type != "text" && type != "thinking" && type != "tool_use" && type != "tool_result")
        {
            // Images, documents and the like carry nothing this layer tracks
            log::logger()->trace("skipping content block of type {}", type);
            continue;
        }
        blocks.push_back(parse_content_block(item));
    }
    return blocks;
}

std::optional<std::string> MessageParser::parse_parent_tool_use_id(const json& j)
{
    if (j.contains("parent_tool_use_id") && j["parent_tool_use_id"].is_string())
        return j["parent_tool_use_id"].get<std::string>();
    return std::nullopt;
}

ProtocolMessage MessageParser::parse_system_message(const json& j)
{
    const std::string subtype = j["subtype"].get<std::string>();

    if (subtype == "init")
    {
        SystemInitMessage msg;
        msg.raw_json = j;
        msg.session_id = j.value("session_id", "");
        msg.model = j.value("model", "");
        msg.cwd = j.value("cwd", "");
        if (j.contains("mcp_servers") && j["mcp_servers"].is_array())
            msg.mcp_servers = j["mcp_servers"];
        if (j.contains("tools") && j["tools"].is_array())
        {
            for (const auto& tool : j["tools"])
            {
                if (tool.is_string())
                    msg.tools.push_back(tool.get<std::string>());
            }
        }
        return msg;
    }

    if (subtype == "compact_boundary")
    {
        CompactBoundaryMessage msg;
        msg.raw_json = j;
        msg.session_id = j.value("session_id", "");
        if (j.contains("compact_metadata") && j["compact_metadata"].is_object())
        {
            const auto& meta = j["compact_metadata"];
            if (meta.contains("pre_tokens") && meta["pre_tokens"].is_number())
            {
                double pre = meta["pre_tokens"].get<double>();
                msg.pre_tokens = pre > 0 ? static_cast<std::uint64_t>(pre) : 0;
            }
            msg.trigger = meta.value("trigger", "");
        }
        return msg;
    }

    UnknownMessage unknown;
    unknown.type = "system";
    unknown.subtype = subtype;
    unknown.raw_json = j;
    return unknown;
}

AssistantMessage MessageParser::parse_assistant_message(const json& j)
{
    AssistantMessage msg;
    msg.raw_json = j;
    msg.parent_tool_use_id = parse_parent_tool_use_id(j);

    // The CLI wraps the API message in a "message" field
    const auto& message = j["message"];
    msg.content = parse_content(message["content"]);
    msg.id = message.value("id", "");
    msg.model = message.value("model", "");
    if (message.contains("usage") && message["usage"].is_object())
        msg.usage = TokenCounts::from_json(message["usage"]);

    return msg;
}

UserMessage MessageParser::parse_user_message(const json& j)
{
    UserMessage msg;
    msg.raw_json = j;
    msg.parent_tool_use_id = parse_parent_tool_use_id(j);
    msg.content = parse_content(j["message"]["content"]);
    return msg;
}

ToolUseMessage MessageParser::parse_tool_use_message(const json& j)
{
    ToolUseMessage msg;
    msg.raw_json = j;
    msg.id = j["id"].get<std::string>();
    msg.name = j["name"].get<std::string>();
    msg.input = j.contains("input") ? j["input"] : json::object();
    msg.parent_tool_use_id = parse_parent_tool_use_id(j);
    return msg;
}

ToolResultMessage MessageParser::parse_tool_result_message(const json& j)
{
    ToolResultMessage msg;
    msg.raw_json = j;
    msg.tool_use_id = j["tool_use_id"].get<std::string>();
    msg.content = j.contains("content") ? j["content"] : json(nullptr);
    msg.is_error = j.value("is_error", false);
    msg.parent_tool_use_id = parse_parent_tool_use_id(j);
    return msg;
}

ResultMessage MessageParser::parse_result_message(const json& j)
{
    ResultMessage msg;
    msg.raw_json = j;
    msg.subtype = j["subtype"].get<std::string>();
    msg.is_error = j.value("is_error", false);
    if (j.contains("duration_ms") && j["duration_ms"].is_number())
        msg.duration_ms = static_cast<std::int64_t>(j["duration_ms"].get<double>());
    if (j.contains("total_cost_usd") && j["total_cost_usd"].is_number())
        msg.total_cost_usd = j["total_cost_usd"].get<double>();
    if (j.contains("usage") && j["usage"].is_object())
        msg.usage = TokenCounts::from_json(j["usage"]);
    if (j.contains("result") && j["result"].is_string())
        msg.result = j["result"].get<std::string>();
    if (j.contains("stop_reason") && j["stop_reason"].is_string())
        msg.stop_reason = j["stop_reason"].get<std::string>();
    if (j.contains("num_turns") && j["num_turns"].is_number())
        msg.num_turns = static_cast<int>(j["num_turns"].get<double>());
    msg.session_id = j.value("session_id", "");
    return msg;
}

// ============================================================================
// LineBuffer
// ============================================================================

LineBuffer::LineBuffer(std::size_t max_buffer_size) : max_buffer_size_(max_buffer_size) {}

std::vector<std::string> LineBuffer::add_data(const std::string& data)
{
    buffer_ += data;

    std::vector<std::string> lines;
    while (auto line = extract_line())
    {
        if (!line->empty() && line->back() == '\r')
            line->pop_back();
        if (!line->empty())
            lines.push_back(std::move(*line));
    }

    // Complete lines are always handed back; only a partial line can overflow
    if (lines.empty() && buffer_.size() > max_buffer_size_)
    {
        std::size_t size = buffer_.size();
        buffer_.clear();
        throw ProtocolError("Line exceeded maximum size of " + std::to_string(max_buffer_size_) +
                            " bytes (was " + std::to_string(size) + ")");
    }

    return lines;
}

std::string LineBuffer::take_remainder()
{
    std::string rest;
    rest.swap(buffer_);
    return rest;
}

std::optional<std::string> LineBuffer::extract_line()
{
    std::size_t pos = buffer_.find('\n');
    if (pos == std::string::npos)
        return std::nullopt;

    std::string line = buffer_.substr(0, pos);
    buffer_.erase(0, pos + 1);
    return line;
}

} // namespace protocol
} // namespace steer
