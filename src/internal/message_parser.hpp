#ifndef STEER_INTERNAL_MESSAGE_PARSER_HPP
#define STEER_INTERNAL_MESSAGE_PARSER_HPP

#include <steer/types.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace steer
{
namespace protocol
{

class MessageParser
{
  public:
    // Validates and converts one decoded JSON object.
    // Throws ProtocolError (bad shape) or ValidationError (bad fields).
    static ProtocolMessage parse(const json& j);

    // Decodes one line first; undecodable text raises ProtocolError.
    static ProtocolMessage parse_line(const std::string& line);

  private:
    static ContentBlock parse_content_block(const json& j);
    static std::vector<ContentBlock> parse_content(const json& content);
    static std::optional<std::string> parse_parent_tool_use_id(const json& j);

    static ProtocolMessage parse_system_message(const json& j);
    static AssistantMessage parse_assistant_message(const json& j);
    static UserMessage parse_user_message(const json& j);
    static ToolUseMessage parse_tool_use_message(const json& j);
    static ToolResultMessage parse_tool_result_message(const json& j);
    static ResultMessage parse_result_message(const json& j);
};

// Splits a byte stream into newline-terminated lines.
class LineBuffer
{
  public:
    explicit LineBuffer(std::size_t max_buffer_size = 1024 * 1024);

    // Appends data and returns every complete, non-empty line. Throws
    // ProtocolError if a single line outgrows the limit.
    std::vector<std::string> add_data(const std::string& data);

    // Returns whatever is left without a trailing newline and clears it.
    std::string take_remainder();

    bool has_buffered_data() const
    {
        return !buffer_.empty();
    }

  private:
    std::optional<std::string> extract_line();

    std::string buffer_;
    std::size_t max_buffer_size_;
};

} // namespace protocol
} // namespace steer

#endif // STEER_INTERNAL_MESSAGE_PARSER_HPP
