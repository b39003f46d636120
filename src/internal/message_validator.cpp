#include "message_validator.hpp"

#include <steer/errors.hpp>

#include <sstream>
#include <string>
#include <vector>

namespace steer
{
namespace protocol
{

namespace
{

class FieldChecker
{
  public:
    void require_string(const json& obj, const char* key, const std::string& path)
    {
        if (!obj.contains(key) || !obj[key].is_string())
            fail(path + key);
    }

    void optional_string(const json& obj, const char* key, const std::string& path)
    {
        if (obj.contains(key) && !obj[key].is_string() && !obj[key].is_null())
            fail(path + key);
    }

    void optional_number(const json& obj, const char* key, const std::string& path)
    {
        if (obj.contains(key) && !obj[key].is_number() && !obj[key].is_null())
            fail(path + key);
    }

    void optional_bool(const json& obj, const char* key, const std::string& path)
    {
        if (obj.contains(key) && !obj[key].is_boolean())
            fail(path + key);
    }

    void optional_object(const json& obj, const char* key, const std::string& path)
    {
        if (obj.contains(key) && !obj[key].is_object() && !obj[key].is_null())
            fail(path + key);
    }

    void content_blocks(const json& content, const std::string& path)
    {
        for (std::size_t i = 0; i < content.size(); ++i)
        {
            const auto& block = content[i];
            std::string at = path + "[" + std::to_string(i) + "].";
            if (!block.is_object() || !block.contains("type") || !block["type"].is_string())
            {
                fail(at + "type");
                continue;
            }

            const auto type = block["type"].get<std::string>();
            if (type == "text")
            {
                require_string(block, "text", at);
            }
            else if (type == "tool_use")
            {
                require_string(block, "id", at);
                require_string(block, "name", at);
            }
            else if (type == "tool_result")
            {
                require_string(block, "tool_use_id", at);
                optional_bool(block, "is_error", at);
            }
        }
    }

    void fail(const std::string& field)
    {
        fields_.push_back(field);
    }

    void finish(const std::string& kind) const
    {
        if (fields_.empty())
            return;

        std::ostringstream oss;
        oss << "Invalid " << kind << " message: ";
        for (std::size_t i = 0; i < fields_.size(); ++i)
        {
            if (i > 0)
                oss << ", ";
            oss << fields_[i];
        }
        throw ValidationError(oss.str(), fields_);
    }

  private:
    std::vector<std::string> fields_;
};

void check_conversation_message(FieldChecker& check, const json& j, bool allow_string_content)
{
    check.optional_string(j, "parent_tool_use_id", "");
    if (!j.contains("message") || !j["message"].is_object())
    {
        check.fail("message");
        return;
    }

    const auto& message = j["message"];
    if (!message.contains("content"))
    {
        check.fail("message.content");
        return;
    }

    const auto& content = message["content"];
    if (content.is_array())
        check.content_blocks(content, "message.content");
    else if (!(allow_string_content && content.is_string()))
        check.fail("message.content");

    check.optional_object(message, "usage", "message.");
}

} // namespace

void require_envelope(const json& j)
{
    if (!j.is_object())
        throw ProtocolError("Message is not a JSON object", j);
    if (!j.contains("type") || !j["type"].is_string())
        throw ProtocolError("Message has no string \"type\" field", j);
}

void validate_message(const json& j)
{
    require_envelope(j);

    FieldChecker check;
    const auto type = j["type"].get<std::string>();

    if (type == "assistant")
    {
        check_conversation_message(check, j, false);
    }
    else if (type == "user")
    {
        check_conversation_message(check, j, true);
    }
    else if (type == "system")
    {
        check.require_string(j, "subtype", "");
        check.optional_string(j, "session_id", "");
        if (j.contains("subtype") && j["subtype"] == "compact_boundary")
        {
            check.optional_object(j, "compact_metadata", "");
            if (j.contains("compact_metadata") && j["compact_metadata"].is_object())
            {
                check.optional_number(j["compact_metadata"], "pre_tokens", "compact_metadata.");
                check.optional_string(j["compact_metadata"], "trigger", "compact_metadata.");
            }
        }
    }
    else if (type == "result")
    {
        check.require_string(j, "subtype", "");
        check.optional_bool(j, "is_error", "");
        check.optional_number(j, "duration_ms", "");
        check.optional_number(j, "total_cost_usd", "");
        check.optional_number(j, "num_turns", "");
        check.optional_string(j, "stop_reason", "");
        check.optional_object(j, "usage", "");
    }
    else if (type == "tool_use")
    {
        check.require_string(j, "id", "");
        check.require_string(j, "name", "");
    }
    else if (type == "tool_result")
    {
        check.require_string(j, "tool_use_id", "");
        check.optional_bool(j, "is_error", "");
    }

    check.finish(type);
}

} // namespace protocol
} // namespace steer
